#include "LeaseSweeper.h"

#include "Logger.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

using namespace Utilities;

LeaseSweeper::LeaseSweeper(QueueStore& store, const SweeperConfig& config)
	: store_(store), config_(config), running_(false), sweeps_(0)
{
}

LeaseSweeper::~LeaseSweeper(void) { stop(); }

auto LeaseSweeper::start(void) -> std::tuple<bool, std::optional<std::string>>
{
	if (running_.exchange(true))
	{
		return { false, "lease sweeper is already running" };
	}

	if (config_.interval_ms <= 0)
	{
		running_.store(false);
		return { false, fmt::format("sweep interval {} ms is not positive", config_.interval_ms) };
	}

	thread_ = std::thread(&LeaseSweeper::sweep_loop, this);

	Logger::handle().write(LogTypes::Information,
		fmt::format("lease sweeper started (interval {} ms, stale after {} ms)", config_.interval_ms, config_.stale_worker_threshold_ms));

	return { true, std::nullopt };
}

auto LeaseSweeper::stop(void) -> void
{
	if (!running_.exchange(false))
	{
		return;
	}

	{
		std::lock_guard<std::mutex> lock(wake_mutex_);
		wake_condition_.notify_all();
	}

	if (thread_.joinable())
	{
		thread_.join();
	}

	Logger::handle().write(LogTypes::Information, "lease sweeper stopped");
}

auto LeaseSweeper::is_running(void) const -> bool { return running_.load(); }

auto LeaseSweeper::sweeps(void) const -> int64_t { return sweeps_.load(); }

auto LeaseSweeper::sweep_once(void) -> std::tuple<SweepReport, std::optional<QueueError>>
{
	SweepReport report;

	auto [reclaimed, reclaim_error] = store_.reclaim_expired_leases();
	if (reclaim_error.has_value())
	{
		return { report, reclaim_error };
	}
	report.reclaimed = reclaimed;

	if (config_.stale_worker_threshold_ms > 0)
	{
		auto [stale, stale_error] = store_.mark_stale_workers(config_.stale_worker_threshold_ms);
		if (stale_error.has_value())
		{
			return { report, stale_error };
		}
		report.stale_workers = stale;
	}

	sweeps_++;

	if (!report.reclaimed.task_ids.empty())
	{
		Logger::handle().write(LogTypes::Information,
			fmt::format("reclaimed expired leases: {} requeued, {} dead-lettered (tasks {})", report.reclaimed.requeued,
				report.reclaimed.dead_lettered, fmt::join(report.reclaimed.task_ids, ", ")));
	}
	if (report.stale_workers > 0)
	{
		Logger::handle().write(LogTypes::Information, fmt::format("marked {} workers stale", report.stale_workers));
	}

	return { report, std::nullopt };
}

auto LeaseSweeper::sweep_loop(void) -> void
{
	while (running_.load())
	{
		auto [report, error] = sweep_once();
		if (error.has_value())
		{
			Logger::handle().write(LogTypes::Error,
				fmt::format("lease sweep failed: [{}] {}", error_type_to_string(error->type), error->message));
		}

		std::unique_lock<std::mutex> lock(wake_mutex_);
		wake_condition_.wait_for(lock, std::chrono::milliseconds(config_.interval_ms), [this]() { return !running_.load(); });
	}
}
