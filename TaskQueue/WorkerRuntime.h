#pragma once

#include "ClaimStrategy/ClaimStrategy.h"
#include "QueueStore.h"
#include "TaskExecutor.h"
#include "TaskTypes.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

struct BackoffPolicy
{
	double base_seconds = 5.0;
	double multiplier = 1.5;
	double max_seconds = 60.0;
};

// min(current * multiplier, max); the caller resets to base after a successful claim.
auto next_backoff(const BackoffPolicy& policy, const double& current_seconds) -> double;

struct WorkerConfig
{
	std::string worker_id;
	StrategyType strategy = StrategyType::Lifo;
	int32_t lease_seconds = 300;
	int32_t heartbeat_interval_ms = 30000;
	BackoffPolicy backoff;
	int64_t max_iterations = 0;   // 0 = until stop()
};

enum class WorkerPhase
{
	Idle,
	Claiming,
	Executing,
	Reporting,
	Backoff,
	Stopped
};

struct WorkerStatistics
{
	int64_t polls_total = 0;
	int64_t polls_successful = 0;
	int64_t polls_empty = 0;
	int64_t tasks_processed = 0;
	int64_t tasks_failed = 0;
	int64_t tasks_retried = 0;
	int64_t tasks_cancelled = 0;
	int64_t leases_lost = 0;
	int64_t storage_errors = 0;
};

auto phase_to_string(const WorkerPhase& phase) -> std::string;

class WorkerRuntime
{
public:
	using SleepFunction = std::function<void(const std::chrono::milliseconds&)>;

	WorkerRuntime(QueueStore& store, const WorkerConfig& config, ExecutorRegistry& registry);
	~WorkerRuntime(void);

	WorkerRuntime(const WorkerRuntime&) = delete;
	WorkerRuntime& operator=(const WorkerRuntime&) = delete;

	// Replaces the interruptible default sleep; tests use it to record backoff without waiting.
	auto set_sleep_function(SleepFunction sleep) -> void;
	auto set_strategy(std::unique_ptr<ClaimStrategy> strategy) -> void;

	// Registers the worker, polls until stop() or max_iterations, then unregisters.
	// A stop() issued before run() is kept, so run() then returns without polling.
	auto run(void) -> std::tuple<bool, std::optional<QueueError>>;
	// One claim attempt and, on success, one full execution. Returns true when a task was claimed.
	auto run_once(void) -> bool;
	auto stop(void) -> void;

	auto phase(void) const -> WorkerPhase;
	auto current_backoff_seconds(void) const -> double;
	auto statistics(void) const -> WorkerStatistics;
	auto config(void) const -> const WorkerConfig&;

private:
	auto process(const Task& task, const LeaseToken& lease) -> void;
	auto execute(const Task& task, TaskExecutor& executor, ExecutionContext& context) -> ExecutionResult;
	auto report(const Task& task, const LeaseToken& lease, const ExecutionResult& result, ExecutionContext& context) -> void;
	auto handle_lease_lost(const LeaseToken& lease, const std::string& operation) -> void;
	auto heartbeat_pump(LeaseToken lease, ExecutionContext& context) -> void;

	auto idle_heartbeat(void) -> void;
	auto sleep_for(const std::chrono::milliseconds& duration) -> void;
	auto set_phase(const WorkerPhase& phase) -> void;

private:
	QueueStore& store_;
	WorkerConfig config_;
	ExecutorRegistry& registry_;
	std::unique_ptr<ClaimStrategy> strategy_;
	SleepFunction sleep_;

	std::atomic<bool> stop_requested_;
	std::atomic<WorkerPhase> phase_;
	std::atomic<double> current_backoff_;
	int64_t last_worker_heartbeat_ms_;

	WorkerStatistics statistics_;
	mutable std::mutex statistics_mutex_;

	std::mutex wake_mutex_;
	std::condition_variable wake_condition_;

	std::mutex pump_mutex_;
	std::condition_variable pump_condition_;
	bool pump_done_;
};
