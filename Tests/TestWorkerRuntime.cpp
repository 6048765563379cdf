#include "TestHelpers.h"
#include "OrderedClaimStrategy.h"
#include "TaskExecutor.h"
#include "WorkerRuntime.h"
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <chrono>
#include <stdexcept>
#include <thread>

class WorkerRuntimeTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		init_test_logger();

		temp_dir_ = std::make_unique<TempDir>("worker_runtime_test_");
		clock_ = std::make_shared<ManualClock>();
		store_ = std::make_unique<QueueStore>(clock_);

		auto [ok, err] = store_->open(make_store_config(temp_dir_->path()));
		ASSERT_TRUE(ok) << "Failed to open QueueStore: " << describe(err);

		config_.worker_id = "worker-test";
		config_.strategy = StrategyType::Fifo;
		config_.lease_seconds = 30;
		config_.heartbeat_interval_ms = 60000;
	}

	void TearDown() override
	{
		runtime_.reset();
		if (store_)
		{
			store_->close();
			store_.reset();
		}
		temp_dir_.reset();
	}

	auto make_runtime() -> WorkerRuntime&
	{
		runtime_ = std::make_unique<WorkerRuntime>(*store_, config_, registry_);
		runtime_->set_sleep_function([this](const std::chrono::milliseconds& duration) { sleeps_.push_back(duration.count()); });
		return *runtime_;
	}

	auto enqueue(const std::string& task_type, const std::optional<int32_t>& max_retries = std::nullopt) -> int64_t
	{
		auto request = make_request(task_type);
		request.max_retries = max_retries;
		auto [id, err] = store_->enqueue(request);
		EXPECT_FALSE(err.has_value()) << describe(err);
		return id;
	}

	auto load(const int64_t& task_id) -> Task
	{
		auto [task, err] = store_->get(task_id);
		EXPECT_TRUE(task.has_value()) << describe(err);
		return task.value_or(Task{});
	}

	std::unique_ptr<TempDir> temp_dir_;
	std::shared_ptr<ManualClock> clock_;
	std::unique_ptr<QueueStore> store_;
	ExecutorRegistry registry_;
	WorkerConfig config_;
	std::unique_ptr<WorkerRuntime> runtime_;
	std::vector<int64_t> sleeps_;
};

// ---------------------------------------------------------------------------
// Backoff tests
// ---------------------------------------------------------------------------

TEST(BackoffPolicyTest, GrowsByMultiplierUntilCap)
{
	BackoffPolicy policy;

	std::vector<double> expected = { 7.5, 11.25, 16.875, 25.3125, 37.96875, 56.953125, 60.0, 60.0 };

	double current = policy.base_seconds;
	for (const auto& value : expected)
	{
		current = next_backoff(policy, current);
		EXPECT_DOUBLE_EQ(current, value);
	}
}

TEST_F(WorkerRuntimeTest, EmptyQueueSleepsWithExponentialBackoff)
{
	config_.max_iterations = 9;
	auto& runtime = make_runtime();

	auto [ok, err] = runtime.run();
	ASSERT_TRUE(ok) << describe(err);

	std::vector<int64_t> expected = { 5000, 7500, 11250, 16875, 25312, 37968, 56953, 60000, 60000 };
	EXPECT_EQ(sleeps_, expected);

	auto stats = runtime.statistics();
	EXPECT_EQ(stats.polls_total, 9);
	EXPECT_EQ(stats.polls_empty, 9);
	EXPECT_EQ(stats.polls_successful, 0);
	EXPECT_EQ(runtime.phase(), WorkerPhase::Stopped);
}

TEST_F(WorkerRuntimeTest, SuccessfulClaimResetsBackoff)
{
	registry_.register_handler("echo", [](const Task& task, ExecutionContext&) { return ExecutionResult::succeeded(task.parameters_json); });
	auto& runtime = make_runtime();

	EXPECT_FALSE(runtime.run_once());
	EXPECT_FALSE(runtime.run_once());
	EXPECT_DOUBLE_EQ(runtime.current_backoff_seconds(), 11.25);

	enqueue("echo");
	EXPECT_TRUE(runtime.run_once());
	EXPECT_DOUBLE_EQ(runtime.current_backoff_seconds(), 5.0);

	EXPECT_FALSE(runtime.run_once());
	EXPECT_EQ(sleeps_.back(), 5000);
}

// ---------------------------------------------------------------------------
// Execution outcome tests
// ---------------------------------------------------------------------------

TEST_F(WorkerRuntimeTest, CompletesTaskWithExecutorResult)
{
	registry_.register_handler("echo", [](const Task& task, ExecutionContext& context) {
		EXPECT_TRUE(context.checkpoint());
		EXPECT_EQ(context.task_id(), task.id);
		EXPECT_EQ(context.worker_id(), "worker-test");
		return ExecutionResult::succeeded(task.parameters_json);
	});
	auto& runtime = make_runtime();

	auto id = enqueue("echo");
	ASSERT_TRUE(runtime.run_once());

	auto task = load(id);
	EXPECT_EQ(task.status, TaskStatus::Completed);
	EXPECT_EQ(task.result_data.value_or(""), R"({"data":"test"})");

	auto stats = runtime.statistics();
	EXPECT_EQ(stats.tasks_processed, 1);
	EXPECT_EQ(stats.polls_successful, 1);
	EXPECT_TRUE(sleeps_.empty());
}

TEST_F(WorkerRuntimeTest, UnknownTaskTypeFailsPermanently)
{
	auto& runtime = make_runtime();

	auto id = enqueue("mystery", 5);
	ASSERT_TRUE(runtime.run_once());

	auto task = load(id);
	EXPECT_EQ(task.status, TaskStatus::Failed);
	EXPECT_EQ(task.retry_count, 0);
	EXPECT_NE(task.error_message.value_or("").find("mystery"), std::string::npos);
	EXPECT_EQ(runtime.statistics().tasks_failed, 1);
}

TEST_F(WorkerRuntimeTest, ThrowingExecutorIsRetriedThenDeadLettered)
{
	registry_.register_handler("flaky", [](const Task&, ExecutionContext&) -> ExecutionResult { throw std::runtime_error("boom"); });
	auto& runtime = make_runtime();

	auto id = enqueue("flaky", 1);

	ASSERT_TRUE(runtime.run_once());
	auto retried = load(id);
	EXPECT_EQ(retried.status, TaskStatus::Queued);
	EXPECT_EQ(retried.retry_count, 1);
	EXPECT_NE(retried.error_message.value_or("").find("boom"), std::string::npos);

	ASSERT_TRUE(runtime.run_once());
	EXPECT_EQ(load(id).status, TaskStatus::Failed);

	auto stats = runtime.statistics();
	EXPECT_EQ(stats.tasks_retried, 1);
	EXPECT_EQ(stats.tasks_failed, 1);
}

TEST_F(WorkerRuntimeTest, NonStandardExceptionIsRetried)
{
	registry_.register_handler("raw_throw", [](const Task&, ExecutionContext&) -> ExecutionResult { throw 42; });
	config_.heartbeat_interval_ms = 10;
	auto& runtime = make_runtime();

	auto id = enqueue("raw_throw", 2);

	ASSERT_TRUE(runtime.run_once());
	auto retried = load(id);
	EXPECT_EQ(retried.status, TaskStatus::Queued);
	EXPECT_EQ(retried.retry_count, 1);
	EXPECT_EQ(retried.error_message.value_or(""), "executor threw a non-standard exception");
	EXPECT_FALSE(retried.claimed_by.has_value());

	auto stats = runtime.statistics();
	EXPECT_EQ(stats.tasks_retried, 1);
	EXPECT_EQ(stats.storage_errors, 0);
	EXPECT_EQ(runtime.phase(), WorkerPhase::Idle);

	// The runtime stays usable after the throw.
	ASSERT_TRUE(runtime.run_once());
	EXPECT_EQ(load(id).retry_count, 2);
}

TEST_F(WorkerRuntimeTest, NonRetryableResultSkipsRetries)
{
	registry_.register_handler("strict", [](const Task&, ExecutionContext&) { return ExecutionResult::failed("invalid input", false); });
	auto& runtime = make_runtime();

	auto id = enqueue("strict", 3);
	ASSERT_TRUE(runtime.run_once());

	auto task = load(id);
	EXPECT_EQ(task.status, TaskStatus::Failed);
	EXPECT_EQ(task.retry_count, 0);
	EXPECT_EQ(task.error_message.value_or(""), "invalid input");
}

// ---------------------------------------------------------------------------
// Cancellation / lease loss tests
// ---------------------------------------------------------------------------

TEST_F(WorkerRuntimeTest, CancellationIsObservedAtCheckpoint)
{
	bool continued = true;
	registry_.register_handler("long", [&](const Task& task, ExecutionContext& context) {
		auto [cancelled, err] = store_->cancel(task.id, "operator abort");
		EXPECT_TRUE(cancelled) << describe(err);

		continued = context.checkpoint();
		EXPECT_TRUE(context.is_cancelled());
		return ExecutionResult::failed("aborted");
	});
	auto& runtime = make_runtime();

	auto id = enqueue("long");
	ASSERT_TRUE(runtime.run_once());

	EXPECT_FALSE(continued);
	EXPECT_EQ(load(id).status, TaskStatus::Cancelled);

	auto stats = runtime.statistics();
	EXPECT_EQ(stats.tasks_cancelled, 1);
	EXPECT_EQ(stats.tasks_failed, 0);
	EXPECT_EQ(stats.leases_lost, 0);
}

TEST_F(WorkerRuntimeTest, CancellationAfterLastCheckpointIsStillAcknowledged)
{
	registry_.register_handler("quick", [&](const Task& task, ExecutionContext&) {
		store_->cancel(task.id, "too late");
		return ExecutionResult::succeeded();
	});
	auto& runtime = make_runtime();

	auto id = enqueue("quick");
	ASSERT_TRUE(runtime.run_once());

	auto task = load(id);
	EXPECT_EQ(task.status, TaskStatus::Cancelled);
	EXPECT_FALSE(task.result_data.has_value());

	auto stats = runtime.statistics();
	EXPECT_EQ(stats.tasks_cancelled, 1);
	EXPECT_EQ(stats.tasks_processed, 0);
}

TEST_F(WorkerRuntimeTest, LostLeaseDiscardsResult)
{
	registry_.register_handler("slow", [&](const Task&, ExecutionContext& context) {
		clock_->advance(31000);
		auto [report, err] = store_->reclaim_expired_leases();
		EXPECT_EQ(report.requeued, 1) << describe(err);

		EXPECT_FALSE(context.checkpoint());
		EXPECT_TRUE(context.is_lease_lost());
		return ExecutionResult::succeeded(R"({"late":true})");
	});
	auto& runtime = make_runtime();

	auto id = enqueue("slow");
	ASSERT_TRUE(runtime.run_once());

	auto task = load(id);
	EXPECT_EQ(task.status, TaskStatus::Queued);
	EXPECT_EQ(task.retry_count, 1);
	EXPECT_FALSE(task.result_data.has_value());

	auto stats = runtime.statistics();
	EXPECT_EQ(stats.leases_lost, 1);
	EXPECT_EQ(stats.tasks_processed, 0);
}

TEST_F(WorkerRuntimeTest, HeartbeatPumpExtendsLeaseDuringExecution)
{
	config_.heartbeat_interval_ms = 20;

	int64_t initial_lease_until = 0;
	int64_t extended_lease_until = 0;
	bool still_owned = false;
	registry_.register_handler("steady", [&](const Task& task, ExecutionContext& context) {
		auto [before, before_err] = store_->get(task.id);
		initial_lease_until = before.has_value() ? before->lease_until_ms.value_or(0) : 0;

		// 25 s of the 30 s lease pass; only the pump keeps it alive.
		clock_->advance(25000);
		std::this_thread::sleep_for(std::chrono::milliseconds(300));

		auto [after, after_err] = store_->get(task.id);
		extended_lease_until = after.has_value() ? after->lease_until_ms.value_or(0) : 0;

		clock_->advance(10000);
		still_owned = context.checkpoint();
		return ExecutionResult::succeeded();
	});
	auto& runtime = make_runtime();

	auto id = enqueue("steady");
	auto claimed_at = clock_->now_ms();
	ASSERT_TRUE(runtime.run_once());

	EXPECT_EQ(initial_lease_until, claimed_at + 30000);
	EXPECT_EQ(extended_lease_until, claimed_at + 25000 + 30000);
	EXPECT_TRUE(still_owned);
	EXPECT_EQ(load(id).status, TaskStatus::Completed);
}

TEST_F(WorkerRuntimeTest, ProgressReportsAreRecorded)
{
	registry_.register_handler("chatty", [](const Task&, ExecutionContext& context) {
		auto [ok, err] = context.report_progress("halfway", R"({"percent":50})");
		EXPECT_TRUE(ok) << describe(err);
		return ExecutionResult::succeeded();
	});
	auto& runtime = make_runtime();

	auto id = enqueue("chatty");
	ASSERT_TRUE(runtime.run_once());

	auto [count, err] = store_->read<int64_t>([&](DataBase::SQLite& db) -> std::tuple<int64_t, std::optional<QueueError>> {
		auto [stmt, prepare_err] = db.prepare("SELECT COUNT(*) FROM task_logs WHERE task_id = ? AND event_type = 'progress';");
		if (!stmt)
		{
			return { 0, make_storage_error(db, "count progress") };
		}
		stmt->bind_int64(1, id);
		stmt->step();
		return { stmt->column_int64(0), std::nullopt };
	});
	EXPECT_EQ(count, 1) << describe(err);
}

// ---------------------------------------------------------------------------
// Lifecycle tests
// ---------------------------------------------------------------------------

TEST_F(WorkerRuntimeTest, StopInterruptsRunLoop)
{
	config_.backoff.base_seconds = 30.0;
	runtime_ = std::make_unique<WorkerRuntime>(*store_, config_, registry_);

	std::tuple<bool, std::optional<QueueError>> outcome;
	std::thread worker([&]() { outcome = runtime_->run(); });

	std::this_thread::sleep_for(std::chrono::milliseconds(200));
	runtime_->stop();
	worker.join();

	EXPECT_TRUE(std::get<0>(outcome)) << describe(std::get<1>(outcome));
	EXPECT_EQ(runtime_->phase(), WorkerPhase::Stopped);

	auto [state, err] = store_->read<std::string>([](DataBase::SQLite& db) -> std::tuple<std::string, std::optional<QueueError>> {
		auto [stmt, prepare_err] = db.prepare("SELECT state FROM worker_heartbeats WHERE worker_id = 'worker-test';");
		if (!stmt || stmt->step() != SQLITE_ROW)
		{
			return { "", make_storage_error(db, "read worker state") };
		}
		return { stmt->column_text(0), std::nullopt };
	});
	EXPECT_EQ(state, "stopped") << describe(err);
}

TEST_F(WorkerRuntimeTest, StopBeforeRunIsHonored)
{
	registry_.register_handler("echo", [](const Task&, ExecutionContext&) { return ExecutionResult::succeeded(); });
	auto& runtime = make_runtime();
	auto id = enqueue("echo");

	runtime.stop();
	auto [ok, err] = runtime.run();

	EXPECT_TRUE(ok) << describe(err);
	EXPECT_EQ(runtime.phase(), WorkerPhase::Stopped);
	EXPECT_EQ(runtime.statistics().polls_total, 0);
	EXPECT_EQ(load(id).status, TaskStatus::Queued);
}

TEST_F(WorkerRuntimeTest, SetStrategyReplacesClaimOrder)
{
	registry_.register_handler("echo", [](const Task&, ExecutionContext&) { return ExecutionResult::succeeded(); });
	auto& runtime = make_runtime();
	runtime.set_strategy(std::make_unique<LifoStrategy>());
	EXPECT_EQ(runtime.config().strategy, StrategyType::Lifo);

	auto first = enqueue("echo");
	auto second = enqueue("echo");

	ASSERT_TRUE(runtime.run_once());
	EXPECT_EQ(load(second).status, TaskStatus::Completed);
	EXPECT_EQ(load(first).status, TaskStatus::Queued);
}

TEST(ExecutorRegistryTest, FindsRegisteredExecutors)
{
	init_test_logger();

	ExecutorRegistry registry;
	registry.register_handler("b", [](const Task&, ExecutionContext&) { return ExecutionResult::succeeded(); });
	registry.register_handler("a", [](const Task&, ExecutionContext&) { return ExecutionResult::succeeded(); });

	EXPECT_NE(registry.find("a"), nullptr);
	EXPECT_EQ(registry.find("c"), nullptr);
	EXPECT_EQ(registry.task_types(), (std::vector<std::string>{ "a", "b" }));
}

TEST(WorkerPhaseTest, PhaseNames)
{
	EXPECT_EQ(phase_to_string(WorkerPhase::Idle), "idle");
	EXPECT_EQ(phase_to_string(WorkerPhase::Backoff), "backoff");
	EXPECT_EQ(phase_to_string(WorkerPhase::Stopped), "stopped");
}
