#include "TestHelpers.h"
#include "Configurations.h"
#include <gtest/gtest.h>
#include <fstream>
#include <filesystem>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace fs = std::filesystem;

// Writes a configuration file into a temp directory and builds Configurations
// from a synthetic command line pointing --config at it.
class ConfigFileGuard
{
public:
	explicit ConfigFileGuard(const std::string& content) : temp_dir_("taskqueue_config_test_")
	{
		config_path_ = temp_dir_.path() + "/taskqueue_configuration.json";

		std::ofstream ofs(config_path_);
		ofs << content;
		ofs.close();
	}

	explicit ConfigFileGuard(const json& config_json) : ConfigFileGuard(config_json.dump(2)) {}

	auto make_configurations(const std::vector<std::string>& extra_args = {}) -> std::unique_ptr<Configurations>
	{
		std::vector<std::string> args = { temp_dir_.path() + "/fake_exe", "--config", config_path_ };
		args.insert(args.end(), extra_args.begin(), extra_args.end());

		std::vector<std::vector<char>> buffers;
		std::vector<char*> argv;
		for (const auto& arg : args)
		{
			buffers.emplace_back(arg.begin(), arg.end());
			buffers.back().push_back('\0');
		}
		for (auto& buffer : buffers)
		{
			argv.push_back(buffer.data());
		}

		Utilities::ArgumentParser arguments(static_cast<int>(argv.size()), argv.data());
		return std::make_unique<Configurations>(std::move(arguments));
	}

	auto config_path() const -> std::string { return config_path_; }

private:
	TempDir temp_dir_;
	std::string config_path_;
};

class ConfigurationsTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		init_test_logger();
	}
};

// =============================================================================
// DefaultValues
// =============================================================================

TEST_F(ConfigurationsTest, DefaultValues)
{
	ConfigFileGuard guard(json::object());
	auto cfg = guard.make_configurations();

	EXPECT_EQ(cfg->config_path(), guard.config_path());

	// Logging defaults
	EXPECT_EQ(cfg->write_console(), LogTypes::Information);
	EXPECT_EQ(cfg->write_file(), LogTypes::None);
	EXPECT_EQ(cfg->log_root(), "./logs");

	// Store defaults
	auto store = cfg->store_config();
	EXPECT_EQ(store.db_path, "./data/task_queue.db");
	EXPECT_EQ(store.busy_timeout_ms, 5000);
	EXPECT_EQ(store.journal_mode, "WAL");
	EXPECT_EQ(store.synchronous, "NORMAL");
	EXPECT_EQ(store.min_priority, 1);
	EXPECT_EQ(store.max_priority, 10);
	EXPECT_EQ(store.default_priority, 5);
	EXPECT_EQ(store.default_max_retries, 3);

	// Worker defaults
	auto worker = cfg->worker_config();
	EXPECT_EQ(worker.strategy, StrategyType::Lifo);
	EXPECT_EQ(worker.lease_seconds, 300);
	EXPECT_EQ(worker.heartbeat_interval_ms, 30000);
	EXPECT_EQ(worker.max_iterations, 0);
	EXPECT_DOUBLE_EQ(worker.backoff.base_seconds, 5.0);
	EXPECT_DOUBLE_EQ(worker.backoff.multiplier, 1.5);
	EXPECT_DOUBLE_EQ(worker.backoff.max_seconds, 60.0);
	EXPECT_EQ(cfg->max_concurrent_claimers(), 6);

	// Generated worker id
	EXPECT_EQ(worker.worker_id.rfind("worker-", 0), 0u);
	EXPECT_EQ(worker.worker_id.size(), 15u);

	// Sweeper defaults
	EXPECT_TRUE(cfg->run_sweeper());
	EXPECT_EQ(cfg->sweeper_config().interval_ms, 10000);
	EXPECT_EQ(cfg->sweeper_config().stale_worker_threshold_ms, 120000);
}

TEST_F(ConfigurationsTest, MissingFileKeepsDefaults)
{
	TempDir temp_dir("taskqueue_config_missing_");
	std::string fake_exe = temp_dir.path() + "/fake_exe";
	std::string missing = temp_dir.path() + "/absent.json";

	std::vector<char> exe_buf(fake_exe.begin(), fake_exe.end());
	exe_buf.push_back('\0');
	std::vector<char> flag_buf = { '-', '-', 'c', 'o', 'n', 'f', 'i', 'g', '\0' };
	std::vector<char> path_buf(missing.begin(), missing.end());
	path_buf.push_back('\0');

	char* argv[] = { exe_buf.data(), flag_buf.data(), path_buf.data() };
	Utilities::ArgumentParser arguments(3, argv);
	Configurations cfg(std::move(arguments));

	EXPECT_EQ(cfg.store_config().db_path, "./data/task_queue.db");
	EXPECT_EQ(cfg.worker_config().lease_seconds, 300);
}

TEST_F(ConfigurationsTest, MalformedJsonKeepsDefaults)
{
	ConfigFileGuard guard(std::string("{ \"store\": { \"dbPath\": "));
	auto cfg = guard.make_configurations();

	EXPECT_EQ(cfg->store_config().db_path, "./data/task_queue.db");
	EXPECT_EQ(cfg->worker_config().strategy, StrategyType::Lifo);
}

// =============================================================================
// Section parsing
// =============================================================================

TEST_F(ConfigurationsTest, StoreSectionParsing)
{
	json config = {
		{ "store",
			{ { "dbPath", "/var/lib/queue/tasks.db" }, { "busyTimeoutMs", 2500 }, { "synchronous", "FULL" },
				{ "writeRetryAttempts", 8 }, { "defaultPriority", 3 }, { "defaultMaxRetries", 7 }, { "retryDelayMs", 1500 } } }
	};
	ConfigFileGuard guard(config);
	auto cfg = guard.make_configurations();

	auto store = cfg->store_config();
	EXPECT_EQ(store.db_path, "/var/lib/queue/tasks.db");
	EXPECT_EQ(store.busy_timeout_ms, 2500);
	EXPECT_EQ(store.synchronous, "FULL");
	EXPECT_EQ(store.write_retry_attempts, 8);
	EXPECT_EQ(store.default_priority, 3);
	EXPECT_EQ(store.default_max_retries, 7);
	EXPECT_EQ(store.retry_delay_ms, 1500);
}

TEST_F(ConfigurationsTest, WorkerAndBackoffSectionParsing)
{
	json config = {
		{ "worker",
			{ { "workerId", "edge-worker-1" }, { "strategy", "weighted_random" }, { "leaseSeconds", 120 },
				{ "heartbeatIntervalMs", 15000 }, { "maxIterations", 50 }, { "maxConcurrentClaimers", 4 } } },
		{ "backoff", { { "baseSeconds", 2.0 }, { "multiplier", 2.0 }, { "maxSeconds", 30.0 } } }
	};
	ConfigFileGuard guard(config);
	auto cfg = guard.make_configurations();

	auto worker = cfg->worker_config();
	EXPECT_EQ(worker.worker_id, "edge-worker-1");
	EXPECT_EQ(worker.strategy, StrategyType::WeightedRandom);
	EXPECT_EQ(worker.lease_seconds, 120);
	EXPECT_EQ(worker.heartbeat_interval_ms, 15000);
	EXPECT_EQ(worker.max_iterations, 50);
	EXPECT_EQ(cfg->max_concurrent_claimers(), 4);
	EXPECT_DOUBLE_EQ(worker.backoff.base_seconds, 2.0);
	EXPECT_DOUBLE_EQ(worker.backoff.multiplier, 2.0);
	EXPECT_DOUBLE_EQ(worker.backoff.max_seconds, 30.0);
}

TEST_F(ConfigurationsTest, SweeperAndLoggingSectionParsing)
{
	json config = {
		{ "sweeper", { { "enabled", false }, { "intervalMs", 2000 }, { "staleWorkerThresholdMs", 45000 } } },
		{ "logging", { { "logRoot", "/tmp/taskqueue-logs" }, { "writeConsole", 4 }, { "writeFile", 2 } } }
	};
	ConfigFileGuard guard(config);
	auto cfg = guard.make_configurations();

	EXPECT_FALSE(cfg->run_sweeper());
	EXPECT_EQ(cfg->sweeper_config().interval_ms, 2000);
	EXPECT_EQ(cfg->sweeper_config().stale_worker_threshold_ms, 45000);
	EXPECT_EQ(cfg->log_root(), "/tmp/taskqueue-logs");
	EXPECT_EQ(cfg->write_console(), LogTypes::Debug);
	EXPECT_EQ(cfg->write_file(), LogTypes::Error);
}

TEST_F(ConfigurationsTest, UnknownStrategyKeepsDefault)
{
	ConfigFileGuard guard(json({ { "worker", { { "strategy", "round_robin" } } } }));
	auto cfg = guard.make_configurations();
	EXPECT_EQ(cfg->worker_config().strategy, StrategyType::Lifo);

	auto overridden = guard.make_configurations({ "--strategy", "shortest_first" });
	EXPECT_EQ(overridden->worker_config().strategy, StrategyType::Lifo);
}

TEST_F(ConfigurationsTest, WrongJsonTypesAreIgnored)
{
	json config = { { "store", { { "busyTimeoutMs", "fast" } } }, { "worker", { { "leaseSeconds", "long" } } } };
	ConfigFileGuard guard(config);
	auto cfg = guard.make_configurations();

	EXPECT_EQ(cfg->store_config().busy_timeout_ms, 5000);
	EXPECT_EQ(cfg->worker_config().lease_seconds, 300);
}

// =============================================================================
// Command-line overrides
// =============================================================================

TEST_F(ConfigurationsTest, CommandLineOverridesFile)
{
	json config = {
		{ "store", { { "dbPath", "/from/file.db" } } },
		{ "worker", { { "workerId", "file-worker" }, { "strategy", "FIFO" }, { "leaseSeconds", 60 } } }
	};
	ConfigFileGuard guard(config);
	auto cfg = guard.make_configurations({ "--db-path", "/from/cli.db", "--worker-id", "cli-worker", "--strategy", "priority",
		"--lease-seconds", "90", "--heartbeat-interval-ms", "10000", "--log-root", "/tmp/cli-logs", "--write-console-log", "0" });

	EXPECT_EQ(cfg->store_config().db_path, "/from/cli.db");
	EXPECT_EQ(cfg->worker_config().worker_id, "cli-worker");
	EXPECT_EQ(cfg->worker_config().strategy, StrategyType::Priority);
	EXPECT_EQ(cfg->worker_config().lease_seconds, 90);
	EXPECT_EQ(cfg->worker_config().heartbeat_interval_ms, 10000);
	EXPECT_EQ(cfg->log_root(), "/tmp/cli-logs");
	EXPECT_EQ(cfg->write_console(), LogTypes::None);
}

// =============================================================================
// Validation repairs
// =============================================================================

TEST_F(ConfigurationsTest, HeartbeatIntervalIsShortenedForShortLeases)
{
	json config = { { "worker", { { "leaseSeconds", 30 }, { "heartbeatIntervalMs", 20000 } } } };
	ConfigFileGuard guard(config);
	auto cfg = guard.make_configurations();

	EXPECT_EQ(cfg->worker_config().lease_seconds, 30);
	EXPECT_EQ(cfg->worker_config().heartbeat_interval_ms, 10000);
}

TEST_F(ConfigurationsTest, InvalidBackoffIsRepaired)
{
	json config = { { "backoff", { { "baseSeconds", -1.0 }, { "multiplier", 0.5 }, { "maxSeconds", 1.0 } } } };
	ConfigFileGuard guard(config);
	auto cfg = guard.make_configurations();

	auto backoff = cfg->worker_config().backoff;
	EXPECT_DOUBLE_EQ(backoff.base_seconds, 5.0);
	EXPECT_DOUBLE_EQ(backoff.multiplier, 1.5);
	EXPECT_DOUBLE_EQ(backoff.max_seconds, 5.0);
}

TEST_F(ConfigurationsTest, InvalidPriorityRangeIsReset)
{
	json config = { { "store", { { "minPriority", 0 }, { "maxPriority", 20 }, { "defaultPriority", 15 } } } };
	ConfigFileGuard guard(config);
	auto cfg = guard.make_configurations();

	auto store = cfg->store_config();
	EXPECT_EQ(store.min_priority, 1);
	EXPECT_EQ(store.max_priority, 10);
	EXPECT_EQ(store.default_priority, 10);
}

TEST_F(ConfigurationsTest, DefaultPriorityIsClampedIntoNarrowRange)
{
	json config = { { "store", { { "minPriority", 2 }, { "maxPriority", 8 }, { "defaultPriority", 1 } } } };
	ConfigFileGuard guard(config);
	auto cfg = guard.make_configurations();

	auto store = cfg->store_config();
	EXPECT_EQ(store.min_priority, 2);
	EXPECT_EQ(store.max_priority, 8);
	EXPECT_EQ(store.default_priority, 2);
}

TEST_F(ConfigurationsTest, NegativeValuesAreRepaired)
{
	json config = {
		{ "store", { { "busyTimeoutMs", -1 }, { "defaultMaxRetries", -3 }, { "retryDelayMs", -10 }, { "writeRetryAttempts", 0 } } },
		{ "worker", { { "leaseSeconds", 0 }, { "maxIterations", -5 }, { "maxConcurrentClaimers", 0 } } },
		{ "sweeper", { { "intervalMs", 0 }, { "staleWorkerThresholdMs", -1 } } }
	};
	ConfigFileGuard guard(config);
	auto cfg = guard.make_configurations();

	auto store = cfg->store_config();
	EXPECT_EQ(store.busy_timeout_ms, 5000);
	EXPECT_EQ(store.default_max_retries, 3);
	EXPECT_EQ(store.retry_delay_ms, 0);
	EXPECT_EQ(store.write_retry_attempts, 5);

	auto worker = cfg->worker_config();
	EXPECT_EQ(worker.lease_seconds, 300);
	EXPECT_EQ(worker.max_iterations, 0);
	EXPECT_EQ(cfg->max_concurrent_claimers(), 6);

	EXPECT_EQ(cfg->sweeper_config().interval_ms, 10000);
	EXPECT_EQ(cfg->sweeper_config().stale_worker_threshold_ms, 120000);
}
