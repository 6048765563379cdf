#pragma once

#include "Clock.h"
#include "TaskTypes.h"

#include "Logger.h"
#include "SQLite.h"

#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <tuple>
#include <vector>

// Picks the id of one eligible queued task inside the claim transaction, or nothing.
using CandidateSelector = std::function<
	std::tuple<std::optional<int64_t>, std::optional<QueueError>>(DataBase::SQLite& db, const int64_t& now_ms)>;

// Maps the last failure on the connection to Busy (SQLITE_BUSY / SQLITE_LOCKED) or Storage.
auto make_storage_error(const DataBase::SQLite& db, const std::string& context) -> QueueError;

class QueueStore
{
public:
	QueueStore(std::shared_ptr<Clock> clock = std::make_shared<SystemClock>());
	~QueueStore(void);

	QueueStore(const QueueStore&) = delete;
	QueueStore& operator=(const QueueStore&) = delete;

	auto open(const StoreConfig& config) -> std::tuple<bool, std::optional<QueueError>>;
	auto close(void) -> void;
	auto is_open(void) const -> bool;

	auto config(void) const -> const StoreConfig&;
	auto now_ms(void) const -> int64_t;
	auto schema_version(void) -> std::tuple<int32_t, std::optional<QueueError>>;

	auto enqueue(const EnqueueRequest& request) -> std::tuple<int64_t, std::optional<QueueError>>;
	auto get(const int64_t& task_id) -> std::tuple<std::optional<Task>, std::optional<QueueError>>;
	// Compare-and-swap to queued or a terminal status; leased and running come only from claim() and start().
	auto update_status(const int64_t& task_id, const StatusUpdate& update) -> std::tuple<bool, std::optional<QueueError>>;
	auto query(const TaskFilter& filter) -> std::tuple<std::vector<Task>, std::optional<QueueError>>;

	// Atomic select-then-update shared by every claim strategy. The UPDATE is guarded by
	// status = 'queued', so a candidate taken by another connection yields no claim.
	auto claim(const std::string& worker_id, const int32_t& lease_seconds, const std::string& strategy_name,
		const CandidateSelector& selector) -> ClaimResult;

	auto start(const LeaseToken& lease) -> std::tuple<bool, std::optional<QueueError>>;
	// Extends the lease in place; fails with LeaseLost once the lease expired or moved.
	auto heartbeat(LeaseToken& lease, const int32_t& lease_seconds) -> std::tuple<bool, std::optional<QueueError>>;
	auto heartbeat(const std::string& worker_id) -> std::tuple<bool, std::optional<QueueError>>;

	auto complete(const LeaseToken& lease, const std::string& result_json) -> std::tuple<bool, std::optional<QueueError>>;
	// Returns the resulting status: Queued when the task was scheduled for retry, Failed when dead-lettered.
	auto fail(const LeaseToken& lease, const std::string& error_message, const bool& retryable)
		-> std::tuple<std::optional<TaskStatus>, std::optional<QueueError>>;

	auto cancel(const int64_t& task_id, const std::string& reason) -> std::tuple<bool, std::optional<QueueError>>;
	auto acknowledge_cancel(const LeaseToken& lease) -> std::tuple<bool, std::optional<QueueError>>;

	auto reclaim_expired_leases(void) -> std::tuple<ReclaimReport, std::optional<QueueError>>;

	auto register_worker(const std::string& worker_id, const std::string& strategy) -> std::tuple<bool, std::optional<QueueError>>;
	auto unregister_worker(const std::string& worker_id) -> std::tuple<bool, std::optional<QueueError>>;
	auto mark_stale_workers(const int64_t& threshold_ms) -> std::tuple<int32_t, std::optional<QueueError>>;

	auto append_log(const TaskLogEntry& entry) -> std::tuple<int64_t, std::optional<QueueError>>;

	template <typename T, typename Fn>
	auto read(Fn&& fn) -> std::tuple<T, std::optional<QueueError>>;

	// Runs fn inside BEGIN IMMEDIATE. Busy failures roll back and retry with exponential delay.
	template <typename T, typename Fn>
	auto write_transaction(const std::string& context, Fn&& fn) -> std::tuple<T, std::optional<QueueError>>;

private:
	auto apply_pragmas(void) -> std::tuple<bool, std::optional<QueueError>>;
	auto migrate(void) -> std::tuple<bool, std::optional<QueueError>>;

private:
	bool is_open_;
	StoreConfig config_;
	std::shared_ptr<Clock> clock_;
	DataBase::SQLite db_;
	mutable std::mutex db_mutex_;
};

template <typename T, typename Fn>
auto QueueStore::read(Fn&& fn) -> std::tuple<T, std::optional<QueueError>>
{
	std::lock_guard<std::mutex> lock(db_mutex_);

	if (!db_.is_open())
	{
		return { T{}, QueueError{ QueueErrorType::Closed, "database is not open" } };
	}

	return fn(db_);
}

template <typename T, typename Fn>
auto QueueStore::write_transaction(const std::string& context, Fn&& fn) -> std::tuple<T, std::optional<QueueError>>
{
	int32_t attempts = std::max(1, config_.write_retry_attempts);
	int64_t delay_ms = std::max(1, config_.write_retry_base_delay_ms);
	int64_t max_delay_ms = std::max<int64_t>(delay_ms, config_.write_retry_max_delay_ms);

	for (int32_t attempt = 0; attempt < attempts; ++attempt)
	{
		if (attempt > 0)
		{
			Utilities::Logger::handle().write(Utilities::LogTypes::Debug,
				fmt::format("{}: database busy, retry {}/{} in {} ms", context, attempt, attempts - 1, delay_ms));

			std::this_thread::sleep_for(std::chrono::milliseconds(delay_ms));
			delay_ms = std::min(delay_ms * 2, max_delay_ms);
		}

		std::lock_guard<std::mutex> lock(db_mutex_);

		if (!db_.is_open())
		{
			return { T{}, QueueError{ QueueErrorType::Closed, "database is not open" } };
		}

		// Rolls back on every early return below.
		DataBase::Transaction transaction(db_, DataBase::TransactionMode::Immediate);

		auto [tx_ok, tx_error] = transaction.begin();
		if (!tx_ok)
		{
			auto error = make_storage_error(db_, fmt::format("{}: begin", context));
			if (error.type == QueueErrorType::Busy)
			{
				continue;
			}

			return { T{}, error };
		}

		auto [value, error] = fn(db_);
		if (error.has_value())
		{
			if (error->type == QueueErrorType::Busy)
			{
				continue;
			}

			return { T{}, error };
		}

		auto [commit_ok, commit_error] = transaction.commit();
		if (!commit_ok)
		{
			auto commit_failure = make_storage_error(db_, fmt::format("{}: commit", context));
			if (commit_failure.type == QueueErrorType::Busy)
			{
				continue;
			}

			return { T{}, commit_failure };
		}

		return { value, std::nullopt };
	}

	Utilities::Logger::handle().write(Utilities::LogTypes::Error,
		fmt::format("{}: database still busy after {} attempts", context, attempts));

	return { T{}, QueueError{ QueueErrorType::Busy, fmt::format("{}: database busy after {} attempts", context, attempts) } };
}
