#include "ClaimStrategy/ClaimStrategy.h"
#include "Configurations.h"
#include "LeaseSweeper.h"
#include "ObservabilityLog.h"
#include "QueueStore.h"

#include "ArgumentParser.h"
#include "Logger.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <iostream>
#include <tuple>

using namespace Utilities;

auto print_usage() -> void
{
	std::cout << "Task queue CLI\n";
	std::cout << "\nUsage:\n";
	std::cout << "  taskqueue-cli enqueue --type <task_type> [--params <json>] [--priority <1-10>] [--delay-ms <n>]\n";
	std::cout << "                        [--max-retries <n>] [--idempotency-key <key>]\n";
	std::cout << "  taskqueue-cli get --id <task_id>\n";
	std::cout << "  taskqueue-cli list [--status <status>] [--type <task_type>] [--worker <id>] [--limit <n>] [--newest]\n";
	std::cout << "  taskqueue-cli cancel --id <task_id> [--reason <text>]\n";
	std::cout << "  taskqueue-cli logs (--id <task_id> | --worker <id>) [--limit <n>]\n";
	std::cout << "  taskqueue-cli stats [--window-ms <n>]\n";
	std::cout << "  taskqueue-cli workers\n";
	std::cout << "  taskqueue-cli active [--limit <n>]\n";
	std::cout << "  taskqueue-cli view --name <v_active_tasks|v_worker_status|v_task_stats>\n";
	std::cout << "  taskqueue-cli sweep\n";
	std::cout << "  taskqueue-cli checkpoint\n";
	std::cout << "  taskqueue-cli vacuum\n";
	std::cout << "  taskqueue-cli pragmas\n";
	std::cout << "  taskqueue-cli strategies\n";
	std::cout << "\nOptions:\n";
	std::cout << "  --config <path>       configuration file (default: taskqueue_configuration.json beside the executable)\n";
	std::cout << "  --db-path <path>      SQLite database path\n";
}

auto print_error(const std::string& action, const QueueError& error) -> void
{
	std::cerr << "Failed to " << action << ": [" << error_type_to_string(error.type) << "] " << error.message << "\n";
}

auto print_task(const Task& task) -> void
{
	std::cout << "Task " << task.id << "\n";
	std::cout << "  Type: " << task.task_type << "\n";
	std::cout << "  Status: " << status_to_string(task.status) << "\n";
	std::cout << "  Priority: " << task.priority << "\n";
	std::cout << "  Retries: " << task.retry_count << "/" << task.max_retries << "\n";
	std::cout << "  Parameters: " << task.parameters_json << "\n";
	std::cout << "  Run After: " << task.run_after_ms << "\n";
	std::cout << "  Created: " << task.created_at_ms << "\n";
	if (task.claimed_by.has_value())
	{
		std::cout << "  Claimed By: " << task.claimed_by.value() << "\n";
		std::cout << "  Lease Until: " << task.lease_until_ms.value_or(0) << "\n";
	}
	if (task.idempotency_key.has_value())
	{
		std::cout << "  Idempotency Key: " << task.idempotency_key.value() << "\n";
	}
	if (task.result_data.has_value())
	{
		std::cout << "  Result: " << task.result_data.value() << "\n";
	}
	if (task.error_message.has_value())
	{
		std::cout << "  Error: " << task.error_message.value() << "\n";
	}
	if (task.completed_at_ms.has_value())
	{
		std::cout << "  Completed: " << task.completed_at_ms.value() << "\n";
	}
}

auto cmd_enqueue(QueueStore& store, ArgumentParser& args) -> int
{
	auto task_type = args.to_string("--type");
	if (!task_type.has_value())
	{
		std::cerr << "Error: --type is required\n";
		return 1;
	}

	EnqueueRequest request;
	request.task_type = task_type.value();
	request.parameters_json = args.to_string("--params").value_or("{}");
	request.priority = args.to_int("--priority");
	request.max_retries = args.to_int("--max-retries");
	request.idempotency_key = args.to_string("--idempotency-key");

	auto delay_ms = args.to_llong("--delay-ms");
	if (delay_ms.has_value())
	{
		request.run_after_ms = store.now_ms() + delay_ms.value();
	}

	auto [task_id, error] = store.enqueue(request);
	if (error.has_value())
	{
		print_error("enqueue task", error.value());
		return 1;
	}

	std::cout << "Task enqueued: " << task_id << "\n";
	return 0;
}

auto cmd_get(QueueStore& store, ArgumentParser& args) -> int
{
	auto task_id = args.to_llong("--id");
	if (!task_id.has_value())
	{
		std::cerr << "Error: --id is required\n";
		return 1;
	}

	auto [task, error] = store.get(task_id.value());
	if (error.has_value())
	{
		print_error("read task", error.value());
		return 1;
	}

	print_task(task.value());
	return 0;
}

auto cmd_list(QueueStore& store, ArgumentParser& args) -> int
{
	TaskFilter filter;
	filter.limit = args.to_int("--limit").value_or(100);
	filter.newest_first = args.contains("--newest");
	filter.task_type = args.to_string("--type");
	filter.claimed_by = args.to_string("--worker");

	auto status = args.to_string("--status");
	if (status.has_value())
	{
		filter.status = string_to_status(status.value());
		if (!filter.status.has_value())
		{
			std::cerr << "Error: unknown status '" << status.value() << "'\n";
			return 1;
		}
	}

	auto [tasks, error] = store.query(filter);
	if (error.has_value())
	{
		print_error("list tasks", error.value());
		return 1;
	}

	std::cout << fmt::format("{:>8}  {:<20} {:<10} {:>3} {:>7}  {}\n", "ID", "TYPE", "STATUS", "PRI", "RETRIES", "WORKER");
	for (const auto& task : tasks)
	{
		std::cout << fmt::format("{:>8}  {:<20} {:<10} {:>3} {:>3}/{:<3}  {}\n", task.id, task.task_type, status_to_string(task.status),
			task.priority, task.retry_count, task.max_retries, task.claimed_by.value_or("-"));
	}
	std::cout << tasks.size() << " task(s)\n";

	return 0;
}

auto cmd_cancel(QueueStore& store, ArgumentParser& args) -> int
{
	auto task_id = args.to_llong("--id");
	if (!task_id.has_value())
	{
		std::cerr << "Error: --id is required\n";
		return 1;
	}

	auto [cancelled, error] = store.cancel(task_id.value(), args.to_string("--reason").value_or("cancelled by operator"));
	if (!cancelled)
	{
		print_error("cancel task", error.value());
		return 1;
	}

	std::cout << "Task cancelled: " << task_id.value() << "\n";
	return 0;
}

auto cmd_logs(ObservabilityLog& observability, ArgumentParser& args) -> int
{
	auto task_id = args.to_llong("--id");
	auto worker_id = args.to_string("--worker");
	auto limit = args.to_int("--limit").value_or(100);

	std::vector<TaskLogEntry> entries;
	std::optional<QueueError> error;
	if (task_id.has_value())
	{
		std::tie(entries, error) = observability.logs_for_task(task_id.value(), limit);
	}
	else if (worker_id.has_value())
	{
		std::tie(entries, error) = observability.logs_for_worker(worker_id.value(), limit);
	}
	else
	{
		std::cerr << "Error: --id or --worker is required\n";
		return 1;
	}

	if (error.has_value())
	{
		print_error("read logs", error.value());
		return 1;
	}

	for (const auto& entry : entries)
	{
		std::cout << fmt::format("{} task={} worker={} {:<10} {} {}\n", entry.timestamp_ms, entry.task_id, entry.worker_id.value_or("-"),
			event_to_string(entry.event), entry.message, entry.details_json);
	}

	return 0;
}

auto cmd_stats(ObservabilityLog& observability, ArgumentParser& args) -> int
{
	auto [statistics, error] = observability.statistics(args.to_llong("--window-ms").value_or(60000));
	if (error.has_value())
	{
		print_error("read statistics", error.value());
		return 1;
	}

	std::cout << "Queue Statistics\n";
	for (const auto& [status, count] : statistics.status_counts)
	{
		std::cout << "  " << status << ": " << count << "\n";
	}
	std::cout << "  Active Workers: " << statistics.active_workers << "\n";
	std::cout << "  Database Size: " << statistics.db_size_bytes << " bytes\n";

	auto [stats, stats_error] = observability.task_stats();
	if (stats_error.has_value())
	{
		print_error("read task stats", stats_error.value());
		return 1;
	}

	if (!stats.empty())
	{
		std::cout << "\nBy Task Type\n";
		for (const auto& row : stats)
		{
			std::cout << fmt::format("  {:<20} {:<10} {:>6}  avg retries {:.2f}\n", row.task_type, status_to_string(row.status), row.count,
				row.average_retries);
		}
	}

	return 0;
}

auto cmd_workers(ObservabilityLog& observability) -> int
{
	auto [workers, error] = observability.worker_status();
	if (error.has_value())
	{
		print_error("read workers", error.value());
		return 1;
	}

	for (const auto& worker : workers)
	{
		std::cout << fmt::format("{:<24} {:<8} {:<16} processed={} failed={} current={} last={}s ago\n", worker.heartbeat.worker_id,
			worker_state_to_string(worker.heartbeat.state), worker.heartbeat.strategy, worker.heartbeat.tasks_processed,
			worker.heartbeat.tasks_failed,
			worker.heartbeat.current_task_id.has_value() ? std::to_string(worker.heartbeat.current_task_id.value()) : std::string("-"),
			worker.seconds_since_heartbeat);
	}

	return 0;
}

auto cmd_active(ObservabilityLog& observability, ArgumentParser& args) -> int
{
	auto [tasks, error] = observability.active_tasks(args.to_int("--limit").value_or(100));
	if (error.has_value())
	{
		print_error("read active tasks", error.value());
		return 1;
	}

	for (const auto& task : tasks)
	{
		std::cout << fmt::format("{:>8}  {:<20} {:<10} pri={} retries={} worker={} age={}ms\n", task.id, task.task_type,
			status_to_string(task.status), task.priority, task.retry_count, task.claimed_by.value_or("-"), task.age_ms);
	}

	return 0;
}

auto cmd_view(ObservabilityLog& observability, ArgumentParser& args) -> int
{
	auto name = args.to_string("--name");
	if (!name.has_value())
	{
		std::cerr << "Error: --name is required\n";
		return 1;
	}

	auto [rows, error] = observability.view(name.value());
	if (error.has_value())
	{
		print_error("read view", error.value());
		return 1;
	}

	std::cout << fmt::format("{}\n", fmt::join(rows.columns, " | "));
	for (const auto& row : rows.rows)
	{
		std::cout << fmt::format("{}\n", fmt::join(row, " | "));
	}

	return 0;
}

auto cmd_sweep(QueueStore& store, Configurations& config) -> int
{
	LeaseSweeper sweeper(store, config.sweeper_config());

	auto [report, error] = sweeper.sweep_once();
	if (error.has_value())
	{
		print_error("sweep", error.value());
		return 1;
	}

	std::cout << "Requeued: " << report.reclaimed.requeued << "\n";
	std::cout << "Dead-lettered: " << report.reclaimed.dead_lettered << "\n";
	std::cout << "Stale workers: " << report.stale_workers << "\n";
	return 0;
}

auto cmd_maintenance(ObservabilityLog& observability, const std::string& command) -> int
{
	auto [done, error] = command == "vacuum" ? observability.vacuum() : observability.checkpoint();
	if (!done)
	{
		print_error(command, error.value());
		return 1;
	}

	std::cout << command << " completed\n";
	return 0;
}

auto cmd_pragmas(ObservabilityLog& observability) -> int
{
	auto [info, error] = observability.pragma_info();
	if (error.has_value())
	{
		print_error("read pragmas", error.value());
		return 1;
	}

	for (const auto& [name, value] : info)
	{
		std::cout << "  " << name << " = " << value << "\n";
	}

	return 0;
}

auto main(int argc, char* argv[]) -> int
{
	ArgumentParser args(argc, argv);

	auto positional = args.positional();
	if (positional.empty() || args.contains("--help") || args.contains("-h"))
	{
		print_usage();
		return positional.empty() ? 1 : 0;
	}

	std::string command = positional.front();
	if (command == "strategies")
	{
		std::cout << fmt::format("{}\n", fmt::join(available_strategies(), "\n"));
		return 0;
	}

	ArgumentParser config_args(argc, argv);
	Configurations config(std::move(config_args));

	Logger::handle().file_mode(config.write_file());
	Logger::handle().console_mode(config.write_console());
	Logger::handle().log_root(config.log_root());
	Logger::handle().start("taskqueue-cli");

	QueueStore store;
	auto [opened, open_error] = store.open(config.store_config());
	if (!opened)
	{
		print_error("open queue store", open_error.value());
		Logger::handle().stop();
		return 1;
	}

	ObservabilityLog observability(store);

	int result = 0;

	if (command == "enqueue")
	{
		result = cmd_enqueue(store, args);
	}
	else if (command == "get")
	{
		result = cmd_get(store, args);
	}
	else if (command == "list")
	{
		result = cmd_list(store, args);
	}
	else if (command == "cancel")
	{
		result = cmd_cancel(store, args);
	}
	else if (command == "logs")
	{
		result = cmd_logs(observability, args);
	}
	else if (command == "stats")
	{
		result = cmd_stats(observability, args);
	}
	else if (command == "workers")
	{
		result = cmd_workers(observability);
	}
	else if (command == "active")
	{
		result = cmd_active(observability, args);
	}
	else if (command == "view")
	{
		result = cmd_view(observability, args);
	}
	else if (command == "sweep")
	{
		result = cmd_sweep(store, config);
	}
	else if (command == "checkpoint" || command == "vacuum")
	{
		result = cmd_maintenance(observability, command);
	}
	else if (command == "pragmas")
	{
		result = cmd_pragmas(observability);
	}
	else
	{
		std::cerr << "Unknown command: " << command << "\n\n";
		print_usage();
		result = 1;
	}

	store.close();
	Logger::handle().stop();
	return result;
}
