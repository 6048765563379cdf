#include "ObservabilityLog.h"

#include "Logger.h"

#include <fmt/format.h>
#include <sqlite3.h>

#include <set>

namespace
{
	const std::string log_columns = "id, task_id, worker_id, event_type, message, details, timestamp";

	const std::string heartbeat_columns =
		"worker_id, last_heartbeat, tasks_processed, tasks_failed, current_task_id, strategy, state, started_at, updated_at";

	auto read_log_entry(const DataBase::Statement& statement) -> TaskLogEntry
	{
		TaskLogEntry entry;
		entry.id = statement.column_int64(0);
		entry.task_id = statement.column_int64(1);
		entry.worker_id = statement.column_optional_text(2);
		entry.event = string_to_event(statement.column_text(3)).value_or(TaskEvent::Progress);
		entry.message = statement.column_text(4);
		entry.details_json = statement.column_optional_text(5).value_or("{}");
		entry.timestamp_ms = statement.column_int64(6);

		return entry;
	}

	// Expects heartbeat_columns starting at first_column.
	auto read_heartbeat(const DataBase::Statement& statement, const int& first_column) -> WorkerHeartbeat
	{
		WorkerHeartbeat heartbeat;
		heartbeat.worker_id = statement.column_text(first_column);
		heartbeat.last_heartbeat_ms = statement.column_int64(first_column + 1);
		heartbeat.tasks_processed = statement.column_int64(first_column + 2);
		heartbeat.tasks_failed = statement.column_int64(first_column + 3);
		heartbeat.current_task_id = statement.column_optional_int64(first_column + 4);
		heartbeat.strategy = statement.column_text(first_column + 5);
		heartbeat.state = string_to_worker_state(statement.column_text(first_column + 6));
		heartbeat.started_at_ms = statement.column_int64(first_column + 7);
		heartbeat.updated_at_ms = statement.column_int64(first_column + 8);

		return heartbeat;
	}

	auto collect_logs(DataBase::SQLite& db, DataBase::Statement& statement, const std::string& context)
		-> std::tuple<std::vector<TaskLogEntry>, std::optional<QueueError>>
	{
		std::vector<TaskLogEntry> entries;

		int result;
		while ((result = statement.step()) == SQLITE_ROW)
		{
			entries.push_back(read_log_entry(statement));
		}
		if (result != SQLITE_DONE)
		{
			return { std::vector<TaskLogEntry>{}, make_storage_error(db, context) };
		}

		return { entries, std::nullopt };
	}
} // namespace

ObservabilityLog::ObservabilityLog(QueueStore& store) : store_(store) {}

ObservabilityLog::~ObservabilityLog(void) {}

auto ObservabilityLog::logs_for_task(const int64_t& task_id, const int32_t& limit)
	-> std::tuple<std::vector<TaskLogEntry>, std::optional<QueueError>>
{
	return store_.read<std::vector<TaskLogEntry>>(
		[&](DataBase::SQLite& db) -> std::tuple<std::vector<TaskLogEntry>, std::optional<QueueError>> {
			auto sql = fmt::format("SELECT {} FROM task_logs WHERE task_id = ? ORDER BY id ASC", log_columns);
			if (limit > 0)
			{
				sql += fmt::format(" LIMIT {}", limit);
			}

			auto [stmt, error] = db.prepare(sql + ";");
			if (!stmt)
			{
				return { std::vector<TaskLogEntry>{}, make_storage_error(db, "prepare task log read") };
			}

			stmt->bind_int64(1, task_id);

			return collect_logs(db, *stmt, fmt::format("read logs of task {}", task_id));
		});
}

auto ObservabilityLog::logs_for_worker(const std::string& worker_id, const int32_t& limit)
	-> std::tuple<std::vector<TaskLogEntry>, std::optional<QueueError>>
{
	// Most recent entries, returned oldest first.
	return store_.read<std::vector<TaskLogEntry>>(
		[&](DataBase::SQLite& db) -> std::tuple<std::vector<TaskLogEntry>, std::optional<QueueError>> {
			auto sql = fmt::format("SELECT {} FROM task_logs WHERE worker_id = ? ORDER BY id DESC", log_columns);
			if (limit > 0)
			{
				sql += fmt::format(" LIMIT {}", limit);
			}

			auto [stmt, error] = db.prepare(fmt::format("SELECT * FROM ({}) ORDER BY id ASC;", sql));
			if (!stmt)
			{
				return { std::vector<TaskLogEntry>{}, make_storage_error(db, "prepare worker log read") };
			}

			stmt->bind_text(1, worker_id);

			return collect_logs(db, *stmt, fmt::format("read logs of worker {}", worker_id));
		});
}

auto ObservabilityLog::record_progress(const int64_t& task_id, const std::optional<std::string>& worker_id,
	const std::string& message, const std::string& details_json) -> std::tuple<int64_t, std::optional<QueueError>>
{
	TaskLogEntry entry;
	entry.task_id = task_id;
	entry.worker_id = worker_id;
	entry.event = TaskEvent::Progress;
	entry.message = message;
	entry.details_json = details_json;

	return store_.append_log(entry);
}

auto ObservabilityLog::heartbeats(void) -> std::tuple<std::vector<WorkerHeartbeat>, std::optional<QueueError>>
{
	return store_.read<std::vector<WorkerHeartbeat>>(
		[&](DataBase::SQLite& db) -> std::tuple<std::vector<WorkerHeartbeat>, std::optional<QueueError>> {
			auto [stmt, error] = db.prepare(fmt::format("SELECT {} FROM worker_heartbeats ORDER BY worker_id;", heartbeat_columns));
			if (!stmt)
			{
				return { std::vector<WorkerHeartbeat>{}, make_storage_error(db, "prepare heartbeat read") };
			}

			std::vector<WorkerHeartbeat> heartbeats;
			int result;
			while ((result = stmt->step()) == SQLITE_ROW)
			{
				heartbeats.push_back(read_heartbeat(*stmt, 0));
			}
			if (result != SQLITE_DONE)
			{
				return { std::vector<WorkerHeartbeat>{}, make_storage_error(db, "read heartbeats") };
			}

			return { heartbeats, std::nullopt };
		});
}

auto ObservabilityLog::heartbeat(const std::string& worker_id) -> std::tuple<std::optional<WorkerHeartbeat>, std::optional<QueueError>>
{
	return store_.read<std::optional<WorkerHeartbeat>>(
		[&](DataBase::SQLite& db) -> std::tuple<std::optional<WorkerHeartbeat>, std::optional<QueueError>> {
			auto [stmt, error] = db.prepare(fmt::format("SELECT {} FROM worker_heartbeats WHERE worker_id = ?;", heartbeat_columns));
			if (!stmt)
			{
				return { std::nullopt, make_storage_error(db, "prepare heartbeat lookup") };
			}

			stmt->bind_text(1, worker_id);

			auto result = stmt->step();
			if (result == SQLITE_DONE)
			{
				return { std::nullopt, QueueError{ QueueErrorType::NotFound, fmt::format("worker {} not found", worker_id) } };
			}
			if (result != SQLITE_ROW)
			{
				return { std::nullopt, make_storage_error(db, fmt::format("read heartbeat of {}", worker_id)) };
			}

			return { read_heartbeat(*stmt, 0), std::nullopt };
		});
}

auto ObservabilityLog::active_tasks(const int32_t& limit) -> std::tuple<std::vector<ActiveTaskView>, std::optional<QueueError>>
{
	return store_.read<std::vector<ActiveTaskView>>(
		[&](DataBase::SQLite& db) -> std::tuple<std::vector<ActiveTaskView>, std::optional<QueueError>> {
			auto sql = std::string(
				"SELECT id, task_type, priority, status, claimed_by, retry_count, created_at, age_ms FROM v_active_tasks");
			if (limit > 0)
			{
				sql += fmt::format(" LIMIT {}", limit);
			}

			auto [stmt, error] = db.prepare(sql + ";");
			if (!stmt)
			{
				return { std::vector<ActiveTaskView>{}, make_storage_error(db, "prepare v_active_tasks") };
			}

			std::vector<ActiveTaskView> tasks;
			int result;
			while ((result = stmt->step()) == SQLITE_ROW)
			{
				ActiveTaskView task;
				task.id = stmt->column_int64(0);
				task.task_type = stmt->column_text(1);
				task.priority = stmt->column_int(2);
				task.status = string_to_status(stmt->column_text(3)).value_or(TaskStatus::Queued);
				task.claimed_by = stmt->column_optional_text(4);
				task.retry_count = stmt->column_int(5);
				task.created_at_ms = stmt->column_int64(6);
				task.age_ms = stmt->column_int64(7);
				tasks.push_back(task);
			}
			if (result != SQLITE_DONE)
			{
				return { std::vector<ActiveTaskView>{}, make_storage_error(db, "read v_active_tasks") };
			}

			return { tasks, std::nullopt };
		});
}

auto ObservabilityLog::worker_status(void) -> std::tuple<std::vector<WorkerStatusView>, std::optional<QueueError>>
{
	return store_.read<std::vector<WorkerStatusView>>(
		[&](DataBase::SQLite& db) -> std::tuple<std::vector<WorkerStatusView>, std::optional<QueueError>> {
			auto [stmt, error] = db.prepare(fmt::format(
				"SELECT {}, current_task_type, current_task_status, seconds_since_heartbeat FROM v_worker_status ORDER BY worker_id;",
				heartbeat_columns));
			if (!stmt)
			{
				return { std::vector<WorkerStatusView>{}, make_storage_error(db, "prepare v_worker_status") };
			}

			std::vector<WorkerStatusView> workers;
			int result;
			while ((result = stmt->step()) == SQLITE_ROW)
			{
				WorkerStatusView worker;
				worker.heartbeat = read_heartbeat(*stmt, 0);
				worker.current_task_type = stmt->column_optional_text(9);
				auto status = stmt->column_optional_text(10);
				if (status.has_value())
				{
					worker.current_task_status = string_to_status(status.value());
				}
				worker.seconds_since_heartbeat = stmt->column_int64(11);
				workers.push_back(worker);
			}
			if (result != SQLITE_DONE)
			{
				return { std::vector<WorkerStatusView>{}, make_storage_error(db, "read v_worker_status") };
			}

			return { workers, std::nullopt };
		});
}

auto ObservabilityLog::task_stats(void) -> std::tuple<std::vector<TaskStatsView>, std::optional<QueueError>>
{
	return store_.read<std::vector<TaskStatsView>>(
		[&](DataBase::SQLite& db) -> std::tuple<std::vector<TaskStatsView>, std::optional<QueueError>> {
			auto [stmt, error] = db.prepare(
				"SELECT task_type, status, count, avg_retries, oldest, newest FROM v_task_stats ORDER BY task_type, status;");
			if (!stmt)
			{
				return { std::vector<TaskStatsView>{}, make_storage_error(db, "prepare v_task_stats") };
			}

			std::vector<TaskStatsView> stats;
			int result;
			while ((result = stmt->step()) == SQLITE_ROW)
			{
				TaskStatsView row;
				row.task_type = stmt->column_text(0);
				row.status = string_to_status(stmt->column_text(1)).value_or(TaskStatus::Queued);
				row.count = stmt->column_int64(2);
				row.average_retries = stmt->column_double(3);
				row.oldest_ms = stmt->column_int64(4);
				row.newest_ms = stmt->column_int64(5);
				stats.push_back(row);
			}
			if (result != SQLITE_DONE)
			{
				return { std::vector<TaskStatsView>{}, make_storage_error(db, "read v_task_stats") };
			}

			return { stats, std::nullopt };
		});
}

auto ObservabilityLog::view(const std::string& view_name) -> std::tuple<DataBase::QueryResult, std::optional<QueueError>>
{
	static const std::set<std::string> views = { "v_active_tasks", "v_worker_status", "v_task_stats" };
	if (views.find(view_name) == views.end())
	{
		return { DataBase::QueryResult{}, QueueError{ QueueErrorType::Validation, fmt::format("unknown view '{}'", view_name) } };
	}

	return store_.read<DataBase::QueryResult>(
		[&](DataBase::SQLite& db) -> std::tuple<DataBase::QueryResult, std::optional<QueueError>> {
			auto [rows, error] = db.query(fmt::format("SELECT * FROM {};", view_name));
			if (!rows.has_value())
			{
				return { DataBase::QueryResult{}, make_storage_error(db, fmt::format("read {}", view_name)) };
			}

			return { rows.value(), std::nullopt };
		});
}

auto ObservabilityLog::statistics(const int64_t& active_window_ms) -> std::tuple<QueueStatistics, std::optional<QueueError>>
{
	auto now = store_.now_ms();

	return store_.read<QueueStatistics>([&](DataBase::SQLite& db) -> std::tuple<QueueStatistics, std::optional<QueueError>> {
		QueueStatistics statistics;
		for (const auto& status : { TaskStatus::Queued, TaskStatus::Leased, TaskStatus::Running, TaskStatus::Completed,
				 TaskStatus::Failed, TaskStatus::Cancelled })
		{
			statistics.status_counts[status_to_string(status)] = 0;
		}

		auto [counts, counts_error] = db.prepare("SELECT status, COUNT(*) FROM task_queue GROUP BY status;");
		if (!counts)
		{
			return { QueueStatistics{}, make_storage_error(db, "prepare status counts") };
		}

		int result;
		while ((result = counts->step()) == SQLITE_ROW)
		{
			statistics.status_counts[counts->column_text(0)] = counts->column_int64(1);
		}
		if (result != SQLITE_DONE)
		{
			return { QueueStatistics{}, make_storage_error(db, "read status counts") };
		}

		auto [workers, workers_error] = db.prepare(
			"SELECT COUNT(*) FROM worker_heartbeats WHERE state = 'active' AND last_heartbeat >= ?;");
		if (!workers)
		{
			return { QueueStatistics{}, make_storage_error(db, "prepare active worker count") };
		}

		workers->bind_int64(1, now - active_window_ms);
		if (workers->step() != SQLITE_ROW)
		{
			return { QueueStatistics{}, make_storage_error(db, "count active workers") };
		}
		statistics.active_workers = workers->column_int64(0);

		auto [page_count, page_count_error] = db.pragma("page_count");
		auto [page_size, page_size_error] = db.pragma("page_size");
		if (!page_count.has_value() || !page_size.has_value())
		{
			return { QueueStatistics{}, make_storage_error(db, "read database size") };
		}
		statistics.db_size_bytes = std::stoll(page_count.value()) * std::stoll(page_size.value());

		return { statistics, std::nullopt };
	});
}

auto ObservabilityLog::pragma_info(void) -> std::tuple<std::map<std::string, std::string>, std::optional<QueueError>>
{
	static const std::vector<std::string> names = { "journal_mode", "synchronous", "busy_timeout", "cache_size", "temp_store",
		"foreign_keys", "wal_autocheckpoint", "page_size", "page_count", "user_version" };

	return store_.read<std::map<std::string, std::string>>(
		[&](DataBase::SQLite& db) -> std::tuple<std::map<std::string, std::string>, std::optional<QueueError>> {
			std::map<std::string, std::string> info;
			for (const auto& name : names)
			{
				auto [value, error] = db.pragma(name);
				if (!value.has_value())
				{
					return { std::map<std::string, std::string>{}, make_storage_error(db, fmt::format("read pragma {}", name)) };
				}

				info[name] = value.value();
			}

			return { info, std::nullopt };
		});
}

auto ObservabilityLog::checkpoint(void) -> std::tuple<bool, std::optional<QueueError>>
{
	return store_.read<bool>([&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
		auto [stmt, error] = db.prepare("PRAGMA wal_checkpoint(TRUNCATE);");
		if (!stmt)
		{
			return { false, make_storage_error(db, "prepare wal checkpoint") };
		}

		if (stmt->step() != SQLITE_ROW)
		{
			return { false, make_storage_error(db, "wal checkpoint") };
		}

		// Columns: busy flag, WAL frames, frames checkpointed.
		if (stmt->column_int(0) != 0)
		{
			return { false, QueueError{ QueueErrorType::Busy, "wal checkpoint blocked by active readers or writers" } };
		}

		Utilities::Logger::handle().write(Utilities::LogTypes::Information,
			fmt::format("wal checkpoint truncated {} frames", stmt->column_int(2)));

		return { true, std::nullopt };
	});
}

auto ObservabilityLog::vacuum(void) -> std::tuple<bool, std::optional<QueueError>>
{
	return store_.read<bool>([&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
		auto [vacuumed, error] = db.execute("VACUUM;");
		if (!vacuumed)
		{
			return { false, make_storage_error(db, "vacuum") };
		}

		Utilities::Logger::handle().write(Utilities::LogTypes::Information, "database vacuumed");

		return { true, std::nullopt };
	});
}
