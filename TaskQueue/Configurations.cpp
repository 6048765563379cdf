#include "Configurations.h"

#include "Generator.h"

#include <nlohmann/json.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

Configurations::Configurations(ArgumentParser&& arguments)
	: write_file_(LogTypes::None)
	, write_console_(LogTypes::Information)
	, log_root_("./logs")
	, root_path_("")
	, config_path_("")
	, run_sweeper_(true)
	, max_concurrent_claimers_(6)
{
	store_config_.db_path = "./data/task_queue.db";

	root_path_ = arguments.program_folder();
	config_path_ = root_path_ + "taskqueue_configuration.json";

	auto config_target = arguments.to_string("--config");
	if (config_target != std::nullopt && !config_target.value().empty())
	{
		config_path_ = config_target.value();
	}

	load();
	parse(arguments);
	validate();
}

Configurations::~Configurations(void) {}

auto Configurations::write_file() -> LogTypes { return write_file_; }
auto Configurations::write_console() -> LogTypes { return write_console_; }
auto Configurations::log_root() -> std::string { return log_root_; }

auto Configurations::root_path() -> std::string { return root_path_; }
auto Configurations::config_path() -> std::string { return config_path_; }

auto Configurations::store_config() -> StoreConfig { return store_config_; }
auto Configurations::worker_config() -> WorkerConfig { return worker_config_; }
auto Configurations::sweeper_config() -> SweeperConfig { return sweeper_config_; }
auto Configurations::run_sweeper() -> bool { return run_sweeper_; }
auto Configurations::max_concurrent_claimers() -> int32_t { return max_concurrent_claimers_; }

auto Configurations::load() -> void
{
	std::filesystem::path path = config_path_;
	if (!std::filesystem::exists(path))
	{
		Logger::handle().write(LogTypes::Error, fmt::format("Configuration file does not exist: {}", path.string()));
		return;
	}

	std::ifstream source(path, std::ios::in | std::ios::binary);
	if (!source.is_open())
	{
		Logger::handle().write(LogTypes::Error, fmt::format("Failed to open configuration file: {}", path.string()));
		return;
	}

	std::stringstream buffer;
	buffer << source.rdbuf();
	source.close();

	try
	{
		json config = json::parse(buffer.str());

		// Store
		if (config.contains("store") && config["store"].is_object())
		{
			auto& store = config["store"];
			if (store.contains("dbPath") && store["dbPath"].is_string())
			{
				store_config_.db_path = store["dbPath"].get<std::string>();
			}
			if (store.contains("busyTimeoutMs") && store["busyTimeoutMs"].is_number())
			{
				store_config_.busy_timeout_ms = store["busyTimeoutMs"].get<int32_t>();
			}
			if (store.contains("journalMode") && store["journalMode"].is_string())
			{
				store_config_.journal_mode = store["journalMode"].get<std::string>();
			}
			if (store.contains("synchronous") && store["synchronous"].is_string())
			{
				store_config_.synchronous = store["synchronous"].get<std::string>();
			}
			if (store.contains("tempStore") && store["tempStore"].is_string())
			{
				store_config_.temp_store = store["tempStore"].get<std::string>();
			}
			if (store.contains("cacheSizeKb") && store["cacheSizeKb"].is_number())
			{
				store_config_.cache_size_kb = store["cacheSizeKb"].get<int32_t>();
			}
			if (store.contains("walAutocheckpoint") && store["walAutocheckpoint"].is_number())
			{
				store_config_.wal_autocheckpoint = store["walAutocheckpoint"].get<int32_t>();
			}
			if (store.contains("writeRetryAttempts") && store["writeRetryAttempts"].is_number())
			{
				store_config_.write_retry_attempts = store["writeRetryAttempts"].get<int32_t>();
			}
			if (store.contains("writeRetryBaseDelayMs") && store["writeRetryBaseDelayMs"].is_number())
			{
				store_config_.write_retry_base_delay_ms = store["writeRetryBaseDelayMs"].get<int32_t>();
			}
			if (store.contains("writeRetryMaxDelayMs") && store["writeRetryMaxDelayMs"].is_number())
			{
				store_config_.write_retry_max_delay_ms = store["writeRetryMaxDelayMs"].get<int32_t>();
			}
			if (store.contains("minPriority") && store["minPriority"].is_number())
			{
				store_config_.min_priority = store["minPriority"].get<int32_t>();
			}
			if (store.contains("maxPriority") && store["maxPriority"].is_number())
			{
				store_config_.max_priority = store["maxPriority"].get<int32_t>();
			}
			if (store.contains("defaultPriority") && store["defaultPriority"].is_number())
			{
				store_config_.default_priority = store["defaultPriority"].get<int32_t>();
			}
			if (store.contains("defaultMaxRetries") && store["defaultMaxRetries"].is_number())
			{
				store_config_.default_max_retries = store["defaultMaxRetries"].get<int32_t>();
			}
			if (store.contains("retryDelayMs") && store["retryDelayMs"].is_number())
			{
				store_config_.retry_delay_ms = store["retryDelayMs"].get<int64_t>();
			}
		}

		// Worker
		if (config.contains("worker") && config["worker"].is_object())
		{
			auto& worker = config["worker"];
			if (worker.contains("workerId") && worker["workerId"].is_string())
			{
				worker_config_.worker_id = worker["workerId"].get<std::string>();
			}
			if (worker.contains("strategy") && worker["strategy"].is_string())
			{
				auto name = worker["strategy"].get<std::string>();
				auto strategy = string_to_strategy(name);
				if (strategy.has_value())
				{
					worker_config_.strategy = strategy.value();
				}
				else
				{
					Logger::handle().write(LogTypes::Error, fmt::format("Unknown worker.strategy '{}', keeping LIFO", name));
				}
			}
			if (worker.contains("leaseSeconds") && worker["leaseSeconds"].is_number())
			{
				worker_config_.lease_seconds = worker["leaseSeconds"].get<int32_t>();
			}
			if (worker.contains("heartbeatIntervalMs") && worker["heartbeatIntervalMs"].is_number())
			{
				worker_config_.heartbeat_interval_ms = worker["heartbeatIntervalMs"].get<int32_t>();
			}
			if (worker.contains("maxIterations") && worker["maxIterations"].is_number())
			{
				worker_config_.max_iterations = worker["maxIterations"].get<int64_t>();
			}
			if (worker.contains("maxConcurrentClaimers") && worker["maxConcurrentClaimers"].is_number())
			{
				max_concurrent_claimers_ = worker["maxConcurrentClaimers"].get<int32_t>();
			}
		}

		// Backoff
		if (config.contains("backoff") && config["backoff"].is_object())
		{
			auto& backoff = config["backoff"];
			if (backoff.contains("baseSeconds") && backoff["baseSeconds"].is_number())
			{
				worker_config_.backoff.base_seconds = backoff["baseSeconds"].get<double>();
			}
			if (backoff.contains("multiplier") && backoff["multiplier"].is_number())
			{
				worker_config_.backoff.multiplier = backoff["multiplier"].get<double>();
			}
			if (backoff.contains("maxSeconds") && backoff["maxSeconds"].is_number())
			{
				worker_config_.backoff.max_seconds = backoff["maxSeconds"].get<double>();
			}
		}

		// Sweeper
		if (config.contains("sweeper") && config["sweeper"].is_object())
		{
			auto& sweeper = config["sweeper"];
			if (sweeper.contains("enabled") && sweeper["enabled"].is_boolean())
			{
				run_sweeper_ = sweeper["enabled"].get<bool>();
			}
			if (sweeper.contains("intervalMs") && sweeper["intervalMs"].is_number())
			{
				sweeper_config_.interval_ms = sweeper["intervalMs"].get<int32_t>();
			}
			if (sweeper.contains("staleWorkerThresholdMs") && sweeper["staleWorkerThresholdMs"].is_number())
			{
				sweeper_config_.stale_worker_threshold_ms = sweeper["staleWorkerThresholdMs"].get<int64_t>();
			}
		}

		// Logging
		if (config.contains("logging") && config["logging"].is_object())
		{
			auto& logging = config["logging"];
			if (logging.contains("logRoot") && logging["logRoot"].is_string())
			{
				log_root_ = logging["logRoot"].get<std::string>();
			}
			if (logging.contains("writeConsole") && logging["writeConsole"].is_number())
			{
				write_console_ = static_cast<LogTypes>(logging["writeConsole"].get<int32_t>());
			}
			if (logging.contains("writeFile") && logging["writeFile"].is_number())
			{
				write_file_ = static_cast<LogTypes>(logging["writeFile"].get<int32_t>());
			}
		}
	}
	catch (const json::exception& e)
	{
		Logger::handle().write(LogTypes::Error, fmt::format("JSON parse error: {}", e.what()));
	}
}

auto Configurations::parse(ArgumentParser& arguments) -> void
{
	auto string_target = arguments.to_string("--db-path");
	if (string_target != std::nullopt)
	{
		store_config_.db_path = string_target.value();
	}

	string_target = arguments.to_string("--worker-id");
	if (string_target != std::nullopt)
	{
		worker_config_.worker_id = string_target.value();
	}

	string_target = arguments.to_string("--strategy");
	if (string_target != std::nullopt)
	{
		auto strategy = string_to_strategy(string_target.value());
		if (strategy.has_value())
		{
			worker_config_.strategy = strategy.value();
		}
		else
		{
			Logger::handle().write(LogTypes::Error,
				fmt::format("Unknown --strategy '{}', keeping {}", string_target.value(), strategy_to_string(worker_config_.strategy)));
		}
	}

	string_target = arguments.to_string("--log-root");
	if (string_target != std::nullopt)
	{
		log_root_ = string_target.value();
	}

	auto int_target = arguments.to_int("--lease-seconds");
	if (int_target != std::nullopt)
	{
		worker_config_.lease_seconds = int_target.value();
	}

	int_target = arguments.to_int("--heartbeat-interval-ms");
	if (int_target != std::nullopt)
	{
		worker_config_.heartbeat_interval_ms = int_target.value();
	}

	int_target = arguments.to_int("--write-console-log");
	if (int_target != std::nullopt)
	{
		write_console_ = static_cast<LogTypes>(int_target.value());
	}

	int_target = arguments.to_int("--write-file-log");
	if (int_target != std::nullopt)
	{
		write_file_ = static_cast<LogTypes>(int_target.value());
	}
}

auto Configurations::validate() -> void
{
	// Store
	if (store_config_.db_path.empty())
	{
		Logger::handle().write(LogTypes::Information, "Empty store.dbPath, using default ./data/task_queue.db");
		store_config_.db_path = "./data/task_queue.db";
	}

	if (store_config_.busy_timeout_ms < 0)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid store.busyTimeoutMs ({}), using default 5000", store_config_.busy_timeout_ms));
		store_config_.busy_timeout_ms = 5000;
	}

	if (store_config_.write_retry_attempts < 1)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid store.writeRetryAttempts ({}), using default 5", store_config_.write_retry_attempts));
		store_config_.write_retry_attempts = 5;
	}

	if (store_config_.write_retry_base_delay_ms <= 0 || store_config_.write_retry_max_delay_ms < store_config_.write_retry_base_delay_ms)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid write retry delays ({} / {} ms), using defaults 25 / 1000", store_config_.write_retry_base_delay_ms,
				store_config_.write_retry_max_delay_ms));
		store_config_.write_retry_base_delay_ms = 25;
		store_config_.write_retry_max_delay_ms = 1000;
	}

	if (store_config_.min_priority < 1 || store_config_.max_priority > 10 || store_config_.min_priority > store_config_.max_priority)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid priority range [{}, {}], using [1, 10]", store_config_.min_priority, store_config_.max_priority));
		store_config_.min_priority = 1;
		store_config_.max_priority = 10;
	}

	if (store_config_.default_priority < store_config_.min_priority || store_config_.default_priority > store_config_.max_priority)
	{
		auto repaired = std::clamp(store_config_.default_priority, store_config_.min_priority, store_config_.max_priority);
		Logger::handle().write(LogTypes::Information,
			fmt::format("store.defaultPriority ({}) outside range, using {}", store_config_.default_priority, repaired));
		store_config_.default_priority = repaired;
	}

	if (store_config_.default_max_retries < 0)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid store.defaultMaxRetries ({}), using default 3", store_config_.default_max_retries));
		store_config_.default_max_retries = 3;
	}

	if (store_config_.retry_delay_ms < 0)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid store.retryDelayMs ({}), using 0", store_config_.retry_delay_ms));
		store_config_.retry_delay_ms = 0;
	}

	// Worker
	if (worker_config_.worker_id.empty())
	{
		worker_config_.worker_id = fmt::format("worker-{}", Generator::guid().substr(0, 8));
	}

	if (worker_config_.lease_seconds <= 0)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid worker.leaseSeconds ({}), using default 300", worker_config_.lease_seconds));
		worker_config_.lease_seconds = 300;
	}

	if (worker_config_.heartbeat_interval_ms <= 0)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid worker.heartbeatIntervalMs ({}), using default 30000", worker_config_.heartbeat_interval_ms));
		worker_config_.heartbeat_interval_ms = 30000;
	}

	// A lease must survive at least a couple of missed heartbeats.
	auto lease_ms = static_cast<int64_t>(worker_config_.lease_seconds) * 1000;
	if (worker_config_.heartbeat_interval_ms * 2 > lease_ms)
	{
		auto repaired = static_cast<int32_t>(std::max<int64_t>(1, lease_ms / 3));
		Logger::handle().write(LogTypes::Information,
			fmt::format("worker.heartbeatIntervalMs ({}) too long for a {} s lease, using {}", worker_config_.heartbeat_interval_ms,
				worker_config_.lease_seconds, repaired));
		worker_config_.heartbeat_interval_ms = repaired;
	}

	if (worker_config_.max_iterations < 0)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid worker.maxIterations ({}), running until stopped", worker_config_.max_iterations));
		worker_config_.max_iterations = 0;
	}

	if (max_concurrent_claimers_ < 1)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid worker.maxConcurrentClaimers ({}), using default 6", max_concurrent_claimers_));
		max_concurrent_claimers_ = 6;
	}

	// Backoff
	if (worker_config_.backoff.base_seconds <= 0.0)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid backoff.baseSeconds ({}), using default 5", worker_config_.backoff.base_seconds));
		worker_config_.backoff.base_seconds = 5.0;
	}

	if (worker_config_.backoff.multiplier < 1.0)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid backoff.multiplier ({}), using default 1.5", worker_config_.backoff.multiplier));
		worker_config_.backoff.multiplier = 1.5;
	}

	if (worker_config_.backoff.max_seconds < worker_config_.backoff.base_seconds)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("backoff.maxSeconds ({}) below baseSeconds, using {}", worker_config_.backoff.max_seconds,
				worker_config_.backoff.base_seconds));
		worker_config_.backoff.max_seconds = worker_config_.backoff.base_seconds;
	}

	// Sweeper
	if (sweeper_config_.interval_ms <= 0)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid sweeper.intervalMs ({}), using default 10000", sweeper_config_.interval_ms));
		sweeper_config_.interval_ms = 10000;
	}

	if (sweeper_config_.stale_worker_threshold_ms < 0)
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("Invalid sweeper.staleWorkerThresholdMs ({}), using default 120000", sweeper_config_.stale_worker_threshold_ms));
		sweeper_config_.stale_worker_threshold_ms = 120000;
	}
}
