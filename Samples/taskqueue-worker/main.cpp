#include "Configurations.h"
#include "LeaseSweeper.h"
#include "ObservabilityLog.h"
#include "QueueStore.h"
#include "TaskExecutor.h"
#include "WorkerRuntime.h"

#include "ArgumentParser.h"
#include "Logger.h"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <thread>

using namespace Utilities;
using json = nlohmann::json;

namespace
{
	std::atomic<bool> stop_signal(false);

	auto handle_signal(int) -> void { stop_signal.store(true); }

	auto parse_parameters(const Task& task) -> json
	{
		try
		{
			return json::parse(task.parameters_json);
		}
		catch (const json::exception& e)
		{
			Logger::handle().write(LogTypes::Error, fmt::format("task {} parameters unreadable: {}", task.id, e.what()));
			return json::object();
		}
	}

	auto register_demo_executors(ExecutorRegistry& registry) -> void
	{
		// Echoes the parameters back as the result.
		registry.register_handler("echo", [](const Task& task, ExecutionContext&) {
			json result;
			result["echo"] = parse_parameters(task);
			result["task_id"] = task.id;
			return ExecutionResult::succeeded(result.dump());
		});

		// {"duration_ms": n} sleeps in 100 ms slices and stops early when cancelled.
		registry.register_handler("sleep", [](const Task& task, ExecutionContext& context) {
			auto parameters = parse_parameters(task);
			auto duration_ms = parameters.value("duration_ms", static_cast<int64_t>(1000));

			int64_t elapsed = 0;
			while (elapsed < duration_ms)
			{
				if (!context.checkpoint())
				{
					return ExecutionResult::failed("interrupted", false);
				}

				auto slice = std::min<int64_t>(100, duration_ms - elapsed);
				std::this_thread::sleep_for(std::chrono::milliseconds(slice));
				elapsed += slice;

				if (elapsed % 1000 == 0)
				{
					auto [reported, error] = context.report_progress(fmt::format("slept {} of {} ms", elapsed, duration_ms));
					if (!reported)
					{
						Logger::handle().write(LogTypes::Debug, fmt::format("progress not recorded: {}", error->message));
					}
				}
			}

			json result;
			result["slept_ms"] = elapsed;
			return ExecutionResult::succeeded(result.dump());
		});

		// {"message": "...", "retryable": bool} always fails.
		registry.register_handler("fail", [](const Task& task, ExecutionContext&) {
			auto parameters = parse_parameters(task);
			return ExecutionResult::failed(parameters.value("message", std::string("requested failure")), parameters.value("retryable", true));
		});
	}
}

auto print_usage() -> void
{
	std::cout << "Task queue worker\n";
	std::cout << "\nUsage:\n";
	std::cout << "  taskqueue-worker [--config <path>] [--db-path <path>] [--worker-id <id>] [--strategy <name>]\n";
	std::cout << "                   [--lease-seconds <n>] [--heartbeat-interval-ms <n>]\n";
	std::cout << "                   [--write-console-log <level>] [--write-file-log <level>] [--log-root <path>]\n";
	std::cout << "\nStrategies: FIFO, LIFO (default), PRIORITY, WEIGHTED_RANDOM\n";
	std::cout << "Demo task types: echo, sleep, fail\n";
}

auto main(int argc, char* argv[]) -> int
{
	ArgumentParser args(argc, argv);
	if (args.contains("--help") || args.contains("-h"))
	{
		print_usage();
		return 0;
	}

	Configurations config(std::move(args));

	Logger::handle().file_mode(config.write_file());
	Logger::handle().console_mode(config.write_console());
	Logger::handle().log_root(config.log_root());
	Logger::handle().start("taskqueue-worker");

	QueueStore store;
	auto [opened, open_error] = store.open(config.store_config());
	if (!opened)
	{
		Logger::handle().write(LogTypes::Error, fmt::format("Failed to open queue store: {}", open_error->message));
		Logger::handle().stop();
		return 1;
	}

	auto worker_config = config.worker_config();

	ObservabilityLog observability(store);
	auto [stats, stats_error] = observability.statistics(config.sweeper_config().stale_worker_threshold_ms);
	if (!stats_error.has_value() && stats.active_workers + 1 > config.max_concurrent_claimers())
	{
		Logger::handle().write(LogTypes::Error,
			fmt::format("warning: {} workers already active on {}; more than {} concurrent claimers mostly wait on the write lock",
				stats.active_workers, config.store_config().db_path, config.max_concurrent_claimers()));
	}

	ExecutorRegistry registry;
	register_demo_executors(registry);

	std::unique_ptr<LeaseSweeper> sweeper;
	if (config.run_sweeper())
	{
		sweeper = std::make_unique<LeaseSweeper>(store, config.sweeper_config());
		auto [started, start_error] = sweeper->start();
		if (!started)
		{
			Logger::handle().write(LogTypes::Error, fmt::format("Lease sweeper not started: {}", start_error.value_or("unknown")));
		}
	}

	std::signal(SIGINT, handle_signal);
	std::signal(SIGTERM, handle_signal);

	WorkerRuntime runtime(store, worker_config, registry);

	std::tuple<bool, std::optional<QueueError>> outcome = { true, std::nullopt };
	std::atomic<bool> finished(false);
	std::thread worker_thread([&]() {
		outcome = runtime.run();
		finished.store(true);
	});

	while (!finished.load())
	{
		if (stop_signal.load())
		{
			Logger::handle().write(LogTypes::Information, "Stop requested, finishing the current task");
			runtime.stop();
			break;
		}

		std::this_thread::sleep_for(std::chrono::milliseconds(200));
	}

	worker_thread.join();

	if (sweeper != nullptr)
	{
		sweeper->stop();
	}

	store.close();

	auto [ran, run_error] = outcome;
	if (!ran)
	{
		Logger::handle().write(LogTypes::Error, fmt::format("Worker failed: {}", run_error->message));
	}

	Logger::handle().stop();
	return ran ? 0 : 1;
}
