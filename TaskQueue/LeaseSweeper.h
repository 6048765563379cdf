#pragma once

#include "QueueStore.h"
#include "TaskTypes.h"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <thread>
#include <tuple>

struct SweeperConfig
{
	int32_t interval_ms = 10000;
	int64_t stale_worker_threshold_ms = 120000;
};

struct SweepReport
{
	ReclaimReport reclaimed;
	int32_t stale_workers = 0;
};

// Periodically returns expired leases to the queue (or dead-letters them) and
// marks silent workers stale.
class LeaseSweeper
{
public:
	LeaseSweeper(QueueStore& store, const SweeperConfig& config);
	~LeaseSweeper(void);

	LeaseSweeper(const LeaseSweeper&) = delete;
	LeaseSweeper& operator=(const LeaseSweeper&) = delete;

	auto start(void) -> std::tuple<bool, std::optional<std::string>>;
	auto stop(void) -> void;
	auto is_running(void) const -> bool;

	auto sweep_once(void) -> std::tuple<SweepReport, std::optional<QueueError>>;

	auto sweeps(void) const -> int64_t;

private:
	auto sweep_loop(void) -> void;

private:
	QueueStore& store_;
	SweeperConfig config_;

	std::atomic<bool> running_;
	std::atomic<int64_t> sweeps_;
	std::thread thread_;
	std::mutex wake_mutex_;
	std::condition_variable wake_condition_;
};
