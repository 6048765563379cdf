#include "WorkerRuntime.h"

#include "Logger.h"

#include <fmt/format.h>

#include <algorithm>
#include <thread>
#include <utility>

using namespace Utilities;

namespace
{
	// Signals the heartbeat pump and joins it on every path out of the execution scope.
	class PumpGuard
	{
	public:
		PumpGuard(std::mutex& mutex, std::condition_variable& condition, bool& done)
			: mutex_(mutex), condition_(condition), done_(done)
		{
		}

		~PumpGuard(void) { finish(); }

		PumpGuard(const PumpGuard&) = delete;
		PumpGuard& operator=(const PumpGuard&) = delete;

		template <typename... Args> auto start(Args&&... args) -> void
		{
			{
				std::lock_guard<std::mutex> lock(mutex_);
				done_ = false;
			}
			thread_ = std::thread(std::forward<Args>(args)...);
		}

		auto finish(void) -> void
		{
			if (!thread_.joinable())
			{
				return;
			}

			{
				std::lock_guard<std::mutex> lock(mutex_);
				done_ = true;
			}
			condition_.notify_all();
			thread_.join();
		}

	private:
		std::mutex& mutex_;
		std::condition_variable& condition_;
		bool& done_;
		std::thread thread_;
	};
} // namespace

auto next_backoff(const BackoffPolicy& policy, const double& current_seconds) -> double
{
	return std::min(current_seconds * policy.multiplier, policy.max_seconds);
}

auto phase_to_string(const WorkerPhase& phase) -> std::string
{
	switch (phase)
	{
	case WorkerPhase::Idle: return "idle";
	case WorkerPhase::Claiming: return "claiming";
	case WorkerPhase::Executing: return "executing";
	case WorkerPhase::Reporting: return "reporting";
	case WorkerPhase::Backoff: return "backoff";
	case WorkerPhase::Stopped: return "stopped";
	default: return "unknown";
	}
}

WorkerRuntime::WorkerRuntime(QueueStore& store, const WorkerConfig& config, ExecutorRegistry& registry)
	: store_(store)
	, config_(config)
	, registry_(registry)
	, strategy_(make_claim_strategy(config.strategy))
	, sleep_(nullptr)
	, stop_requested_(false)
	, phase_(WorkerPhase::Idle)
	, current_backoff_(config.backoff.base_seconds)
	, last_worker_heartbeat_ms_(0)
	, pump_done_(false)
{
}

WorkerRuntime::~WorkerRuntime(void) { stop(); }

auto WorkerRuntime::set_sleep_function(SleepFunction sleep) -> void { sleep_ = std::move(sleep); }

auto WorkerRuntime::set_strategy(std::unique_ptr<ClaimStrategy> strategy) -> void
{
	if (strategy == nullptr)
	{
		return;
	}

	strategy_ = std::move(strategy);
	config_.strategy = strategy_->type();
}

auto WorkerRuntime::run(void) -> std::tuple<bool, std::optional<QueueError>>
{
	auto [registered, register_error] = store_.register_worker(config_.worker_id, strategy_->name());
	if (!registered)
	{
		Logger::handle().write(LogTypes::Error,
			fmt::format("worker {} failed to register: {}", config_.worker_id, register_error->message));
		return { false, register_error };
	}
	last_worker_heartbeat_ms_ = store_.now_ms();

	Logger::handle().write(LogTypes::Information,
		fmt::format("worker {} started with {} strategy (lease {} s, heartbeat {} ms)", config_.worker_id, strategy_->name(),
			config_.lease_seconds, config_.heartbeat_interval_ms));

	int64_t iterations = 0;
	while (!stop_requested_.load())
	{
		if (config_.max_iterations > 0 && iterations >= config_.max_iterations)
		{
			break;
		}

		run_once();
		iterations++;
	}

	set_phase(WorkerPhase::Stopped);

	auto [unregistered, unregister_error] = store_.unregister_worker(config_.worker_id);
	if (!unregistered)
	{
		Logger::handle().write(LogTypes::Error,
			fmt::format("worker {} failed to unregister: {}", config_.worker_id, unregister_error->message));
	}

	auto stats = statistics();
	Logger::handle().write(LogTypes::Information,
		fmt::format("worker {} stopped after {} polls: {} completed, {} failed, {} retried, {} cancelled, {} leases lost",
			config_.worker_id, stats.polls_total, stats.tasks_processed, stats.tasks_failed, stats.tasks_retried,
			stats.tasks_cancelled, stats.leases_lost));

	return { true, std::nullopt };
}

auto WorkerRuntime::run_once(void) -> bool
{
	set_phase(WorkerPhase::Claiming);

	auto result = strategy_->claim(store_, config_.worker_id, config_.lease_seconds);

	{
		std::lock_guard<std::mutex> lock(statistics_mutex_);
		statistics_.polls_total++;
		if (result.claimed)
		{
			statistics_.polls_successful++;
		}
		else
		{
			statistics_.polls_empty++;
		}
		if (result.error.has_value())
		{
			statistics_.storage_errors++;
		}
	}

	if (result.error.has_value())
	{
		Logger::handle().write(LogTypes::Error,
			fmt::format("worker {} claim failed: [{}] {}", config_.worker_id, error_type_to_string(result.error->type),
				result.error->message));
	}

	if (result.claimed && result.task.has_value() && result.lease.has_value())
	{
		current_backoff_.store(config_.backoff.base_seconds);

		process(result.task.value(), result.lease.value());

		set_phase(WorkerPhase::Idle);
		return true;
	}

	idle_heartbeat();

	set_phase(WorkerPhase::Backoff);

	auto delay = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::duration<double>(current_backoff_.load()));
	Logger::handle().write(LogTypes::Sequence,
		fmt::format("worker {} found no task, backing off {} ms", config_.worker_id, delay.count()));

	sleep_for(delay);
	current_backoff_.store(next_backoff(config_.backoff, current_backoff_.load()));

	set_phase(WorkerPhase::Idle);
	return false;
}

auto WorkerRuntime::stop(void) -> void
{
	stop_requested_.store(true);

	std::lock_guard<std::mutex> lock(wake_mutex_);
	wake_condition_.notify_all();
}

auto WorkerRuntime::phase(void) const -> WorkerPhase { return phase_.load(); }

auto WorkerRuntime::current_backoff_seconds(void) const -> double { return current_backoff_.load(); }

auto WorkerRuntime::statistics(void) const -> WorkerStatistics
{
	std::lock_guard<std::mutex> lock(statistics_mutex_);

	return statistics_;
}

auto WorkerRuntime::config(void) const -> const WorkerConfig& { return config_; }

auto WorkerRuntime::process(const Task& task, const LeaseToken& lease) -> void
{
	set_phase(WorkerPhase::Executing);

	Logger::handle().write(LogTypes::Information,
		fmt::format("worker {} claimed task {} ({}, priority {}, retry {}/{})", config_.worker_id, task.id, task.task_type,
			task.priority, task.retry_count, task.max_retries));

	auto executor = registry_.find(task.task_type);
	if (executor == nullptr)
	{
		set_phase(WorkerPhase::Reporting);

		auto [status, error] = store_.fail(lease, fmt::format("no executor registered for task type '{}'", task.task_type), false);
		if (error.has_value())
		{
			if (error->type == QueueErrorType::LeaseLost)
			{
				handle_lease_lost(lease, "fail");
				return;
			}

			Logger::handle().write(LogTypes::Error, fmt::format("task {} could not be failed: {}", task.id, error->message));
			return;
		}

		std::lock_guard<std::mutex> lock(statistics_mutex_);
		statistics_.tasks_failed++;
		return;
	}

	auto [started, start_error] = store_.start(lease);
	if (!started)
	{
		if (start_error->type == QueueErrorType::LeaseLost)
		{
			handle_lease_lost(lease, "start");
			return;
		}

		Logger::handle().write(LogTypes::Error, fmt::format("task {} could not be started: {}", task.id, start_error->message));
		return;
	}

	ExecutionContext context(store_, lease);

	PumpGuard pump(pump_mutex_, pump_condition_, pump_done_);
	pump.start(&WorkerRuntime::heartbeat_pump, this, lease, std::ref(context));

	auto result = execute(task, *executor, context);

	pump.finish();

	report(task, lease, result, context);
}

auto WorkerRuntime::execute(const Task& task, TaskExecutor& executor, ExecutionContext& context) -> ExecutionResult
{
	try
	{
		return executor.execute(task, context);
	}
	catch (const std::exception& e)
	{
		Logger::handle().write(LogTypes::Exception, fmt::format("executor for task {} threw: {}", task.id, e.what()));
		return ExecutionResult::failed(fmt::format("executor threw: {}", e.what()), true);
	}
	catch (...)
	{
		Logger::handle().write(LogTypes::Exception, fmt::format("executor for task {} threw a non-standard exception", task.id));
		return ExecutionResult::failed("executor threw a non-standard exception", true);
	}
}

auto WorkerRuntime::report(const Task& task, const LeaseToken& lease, const ExecutionResult& result, ExecutionContext& context)
	-> void
{
	set_phase(WorkerPhase::Reporting);

	if (context.is_lease_lost())
	{
		handle_lease_lost(lease, "report");
		return;
	}

	if (context.is_cancelled())
	{
		auto [acknowledged, ack_error] = store_.acknowledge_cancel(lease);
		if (!acknowledged)
		{
			Logger::handle().write(LogTypes::Error,
				fmt::format("task {} cancellation could not be acknowledged: {}", task.id, ack_error->message));
		}

		Logger::handle().write(LogTypes::Information, fmt::format("worker {} aborted cancelled task {}", config_.worker_id, task.id));

		std::lock_guard<std::mutex> lock(statistics_mutex_);
		statistics_.tasks_cancelled++;
		return;
	}

	std::optional<QueueError> error;
	std::optional<TaskStatus> outcome;
	if (result.success)
	{
		auto [completed, complete_error] = store_.complete(lease, result.result_json);
		error = complete_error;
		if (completed)
		{
			outcome = TaskStatus::Completed;
		}
	}
	else
	{
		auto [status, fail_error] = store_.fail(lease, result.error_message, result.retryable);
		error = fail_error;
		outcome = status;
	}

	if (error.has_value())
	{
		if (error->type != QueueErrorType::LeaseLost)
		{
			Logger::handle().write(LogTypes::Error,
				fmt::format("task {} result could not be stored: [{}] {}", task.id, error_type_to_string(error->type), error->message));
			return;
		}

		// A cancellation that landed after the last checkpoint also surfaces as a lost lease.
		if (!context.checkpoint() && context.is_cancelled())
		{
			auto [acknowledged, ack_error] = store_.acknowledge_cancel(lease);
			if (!acknowledged)
			{
				Logger::handle().write(LogTypes::Error,
					fmt::format("task {} cancellation could not be acknowledged: {}", task.id, ack_error->message));
			}

			std::lock_guard<std::mutex> lock(statistics_mutex_);
			statistics_.tasks_cancelled++;
			return;
		}

		handle_lease_lost(lease, result.success ? "complete" : "fail");
		return;
	}

	std::lock_guard<std::mutex> lock(statistics_mutex_);
	switch (outcome.value_or(TaskStatus::Failed))
	{
	case TaskStatus::Completed:
		statistics_.tasks_processed++;
		Logger::handle().write(LogTypes::Information, fmt::format("worker {} completed task {}", config_.worker_id, task.id));
		break;
	case TaskStatus::Queued:
		statistics_.tasks_retried++;
		Logger::handle().write(LogTypes::Information,
			fmt::format("worker {} failed task {}, requeued: {}", config_.worker_id, task.id, result.error_message));
		break;
	default:
		statistics_.tasks_failed++;
		Logger::handle().write(LogTypes::Error,
			fmt::format("worker {} failed task {} permanently: {}", config_.worker_id, task.id, result.error_message));
		break;
	}
}

auto WorkerRuntime::handle_lease_lost(const LeaseToken& lease, const std::string& operation) -> void
{
	Logger::handle().write(LogTypes::Error,
		fmt::format("worker {} lost the lease on task {} ({}), result discarded", lease.worker_id, lease.task_id, operation));

	std::lock_guard<std::mutex> lock(statistics_mutex_);
	statistics_.leases_lost++;
}

auto WorkerRuntime::heartbeat_pump(LeaseToken lease, ExecutionContext& context) -> void
{
	auto interval = std::chrono::milliseconds(std::max(1, config_.heartbeat_interval_ms));

	std::unique_lock<std::mutex> lock(pump_mutex_);
	while (!pump_done_)
	{
		if (pump_condition_.wait_for(lock, interval, [this]() { return pump_done_; }))
		{
			break;
		}

		lock.unlock();

		auto [extended, error] = store_.heartbeat(lease, config_.lease_seconds);
		if (!extended)
		{
			if (error->type == QueueErrorType::LeaseLost)
			{
				// Distinguishes operator cancellation from a lease taken over by the sweeper.
				if (context.checkpoint())
				{
					context.mark_lease_lost();
				}

				lock.lock();
				break;
			}

			Logger::handle().write(LogTypes::Error,
				fmt::format("heartbeat for task {} failed: {}", lease.task_id, error->message));
		}
		else
		{
			Logger::handle().write(LogTypes::Sequence,
				fmt::format("lease on task {} extended until {}", lease.task_id, lease.lease_until_ms));
		}

		lock.lock();
	}
}

auto WorkerRuntime::idle_heartbeat(void) -> void
{
	auto now = store_.now_ms();
	if (now - last_worker_heartbeat_ms_ < config_.heartbeat_interval_ms)
	{
		return;
	}

	auto [refreshed, error] = store_.heartbeat(config_.worker_id);
	if (!refreshed)
	{
		Logger::handle().write(LogTypes::Debug, fmt::format("worker {} heartbeat skipped: {}", config_.worker_id, error->message));
		return;
	}

	last_worker_heartbeat_ms_ = now;
}

auto WorkerRuntime::sleep_for(const std::chrono::milliseconds& duration) -> void
{
	if (sleep_)
	{
		sleep_(duration);
		return;
	}

	std::unique_lock<std::mutex> lock(wake_mutex_);
	wake_condition_.wait_for(lock, duration, [this]() { return stop_requested_.load(); });
}

auto WorkerRuntime::set_phase(const WorkerPhase& phase) -> void { phase_.store(phase); }
