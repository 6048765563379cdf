#include "TestHelpers.h"
#include "LeaseSweeper.h"
#include "OrderedClaimStrategy.h"
#include <gtest/gtest.h>
#include <chrono>
#include <thread>

class LeaseSweeperTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		init_test_logger();

		temp_dir_ = std::make_unique<TempDir>("lease_sweeper_test_");
		clock_ = std::make_shared<ManualClock>();
		store_ = std::make_unique<QueueStore>(clock_);

		auto [ok, err] = store_->open(make_store_config(temp_dir_->path()));
		ASSERT_TRUE(ok) << "Failed to open QueueStore: " << describe(err);
	}

	void TearDown() override
	{
		if (store_)
		{
			store_->close();
			store_.reset();
		}
		temp_dir_.reset();
	}

	auto enqueue_and_claim(const std::string& worker_id, const int32_t& max_retries, const int32_t& lease_seconds) -> int64_t
	{
		auto request = make_request("sweep_task");
		request.max_retries = max_retries;

		auto [id, err] = store_->enqueue(request);
		EXPECT_FALSE(err.has_value()) << describe(err);

		// Every other task in the queue is already claimed, so FIFO takes this one.
		auto result = strategy_.claim(*store_, worker_id, lease_seconds);
		EXPECT_TRUE(result.claimed) << describe(result.error);
		return id;
	}

	auto status_of(const int64_t& task_id) -> TaskStatus
	{
		auto [task, err] = store_->get(task_id);
		EXPECT_TRUE(task.has_value()) << describe(err);
		return task.has_value() ? task->status : TaskStatus::Queued;
	}

	std::unique_ptr<TempDir> temp_dir_;
	std::shared_ptr<ManualClock> clock_;
	std::unique_ptr<QueueStore> store_;
	FifoStrategy strategy_;
};

// ---------------------------------------------------------------------------
// Sweep tests
// ---------------------------------------------------------------------------

TEST_F(LeaseSweeperTest, SweepOnceRequeuesAndDeadLetters)
{
	auto retryable = enqueue_and_claim("worker-a", 3, 30);
	auto exhausted = enqueue_and_claim("worker-b", 0, 30);
	auto healthy = enqueue_and_claim("worker-c", 3, 600);

	clock_->advance(60000);

	LeaseSweeper sweeper(*store_, SweeperConfig{});
	auto [report, err] = sweeper.sweep_once();
	ASSERT_FALSE(err.has_value()) << describe(err);

	EXPECT_EQ(report.reclaimed.requeued, 1);
	EXPECT_EQ(report.reclaimed.dead_lettered, 1);
	EXPECT_EQ(report.reclaimed.task_ids, (std::vector<int64_t>{ retryable, exhausted }));
	EXPECT_EQ(sweeper.sweeps(), 1);

	EXPECT_EQ(status_of(retryable), TaskStatus::Queued);
	EXPECT_EQ(status_of(exhausted), TaskStatus::Failed);
	EXPECT_EQ(status_of(healthy), TaskStatus::Leased);
}

TEST_F(LeaseSweeperTest, SweepOnNothingExpiredIsQuiet)
{
	enqueue_and_claim("worker-a", 3, 30);

	LeaseSweeper sweeper(*store_, SweeperConfig{});
	auto [report, err] = sweeper.sweep_once();
	ASSERT_FALSE(err.has_value()) << describe(err);
	EXPECT_TRUE(report.reclaimed.task_ids.empty());
	EXPECT_EQ(report.stale_workers, 0);
}

TEST_F(LeaseSweeperTest, SweepMarksSilentWorkersStale)
{
	store_->register_worker("quiet", "LIFO");
	store_->register_worker("busy", "FIFO");

	clock_->advance(90000);
	store_->heartbeat(std::string("busy"));
	clock_->advance(60000);

	SweeperConfig config;
	config.stale_worker_threshold_ms = 120000;

	LeaseSweeper sweeper(*store_, config);
	auto [report, err] = sweeper.sweep_once();
	ASSERT_FALSE(err.has_value()) << describe(err);
	EXPECT_EQ(report.stale_workers, 1);

	// Already stale workers are not counted twice.
	auto [again, again_err] = sweeper.sweep_once();
	EXPECT_EQ(again.stale_workers, 0);
}

TEST_F(LeaseSweeperTest, ZeroThresholdSkipsStaleDetection)
{
	store_->register_worker("quiet", "LIFO");
	clock_->advance(3600000);

	SweeperConfig config;
	config.stale_worker_threshold_ms = 0;

	LeaseSweeper sweeper(*store_, config);
	auto [report, err] = sweeper.sweep_once();
	ASSERT_FALSE(err.has_value()) << describe(err);
	EXPECT_EQ(report.stale_workers, 0);
}

// ---------------------------------------------------------------------------
// Background thread tests
// ---------------------------------------------------------------------------

TEST_F(LeaseSweeperTest, BackgroundLoopReclaimsExpiredLeases)
{
	auto id = enqueue_and_claim("worker-a", 3, 30);
	clock_->advance(31000);

	SweeperConfig config;
	config.interval_ms = 20;

	LeaseSweeper sweeper(*store_, config);
	auto [started, start_err] = sweeper.start();
	ASSERT_TRUE(started) << start_err.value_or("unknown");
	EXPECT_TRUE(sweeper.is_running());

	auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
	while (status_of(id) != TaskStatus::Queued && std::chrono::steady_clock::now() < deadline)
	{
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
	}

	sweeper.stop();
	EXPECT_FALSE(sweeper.is_running());
	EXPECT_EQ(status_of(id), TaskStatus::Queued);
	EXPECT_GE(sweeper.sweeps(), 1);
}

TEST_F(LeaseSweeperTest, StartTwiceFails)
{
	SweeperConfig config;
	config.interval_ms = 1000;

	LeaseSweeper sweeper(*store_, config);
	auto [first, first_err] = sweeper.start();
	ASSERT_TRUE(first) << first_err.value_or("unknown");

	auto [second, second_err] = sweeper.start();
	EXPECT_FALSE(second);
	EXPECT_TRUE(second_err.has_value());

	sweeper.stop();
}

TEST_F(LeaseSweeperTest, StartRejectsNonPositiveInterval)
{
	SweeperConfig config;
	config.interval_ms = 0;

	LeaseSweeper sweeper(*store_, config);
	auto [ok, err] = sweeper.start();
	EXPECT_FALSE(ok);
	EXPECT_TRUE(err.has_value());
	EXPECT_FALSE(sweeper.is_running());
}
