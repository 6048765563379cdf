#include "QueueStore.h"

#include "QueueSchema.h"

#include "Generator.h"

#include <nlohmann/json.hpp>
#include <sqlite3.h>

#include <cctype>
#include <filesystem>

using json = nlohmann::json;

namespace
{
	const std::string task_columns =
		"id, task_type, parameters, priority, run_after, status, claimed_by, claimed_at, lease_until, lease_token, "
		"retry_count, max_retries, result_data, error_message, idempotency_key, created_at, updated_at, completed_at";

	// Lease guard shared by start/heartbeat/complete/fail: bind id, token, worker, now.
	const std::string lease_guard =
		"id = ? AND lease_token = ? AND claimed_by = ? AND status IN ('claimed', 'running') AND lease_until >= ?";

	auto read_task(const DataBase::Statement& statement) -> Task
	{
		Task task;
		task.id = statement.column_int64(0);
		task.task_type = statement.column_text(1);
		task.parameters_json = statement.column_text(2);
		task.priority = statement.column_int(3);
		task.run_after_ms = statement.column_int64(4);
		task.status = string_to_status(statement.column_text(5)).value_or(TaskStatus::Queued);
		task.claimed_by = statement.column_optional_text(6);
		task.claimed_at_ms = statement.column_optional_int64(7);
		task.lease_until_ms = statement.column_optional_int64(8);
		task.lease_token = statement.column_optional_text(9);
		task.retry_count = statement.column_int(10);
		task.max_retries = statement.column_int(11);
		task.result_data = statement.column_optional_text(12);
		task.error_message = statement.column_optional_text(13);
		task.idempotency_key = statement.column_optional_text(14);
		task.created_at_ms = statement.column_int64(15);
		task.updated_at_ms = statement.column_int64(16);
		task.completed_at_ms = statement.column_optional_int64(17);

		return task;
	}

	auto load_task(DataBase::SQLite& db, const int64_t& task_id) -> std::tuple<std::optional<Task>, std::optional<QueueError>>
	{
		auto [stmt, error] = db.prepare(fmt::format("SELECT {} FROM task_queue WHERE id = ?;", task_columns));
		if (!stmt)
		{
			return { std::nullopt, make_storage_error(db, "prepare task lookup") };
		}

		stmt->bind_int64(1, task_id);

		auto result = stmt->step();
		if (result == SQLITE_DONE)
		{
			return { std::nullopt, std::nullopt };
		}
		if (result != SQLITE_ROW)
		{
			return { std::nullopt, make_storage_error(db, "read task") };
		}

		return { read_task(*stmt), std::nullopt };
	}

	auto insert_log(DataBase::SQLite& db, const int64_t& task_id, const std::optional<std::string>& worker_id,
		const TaskEvent& event, const std::string& message, const json& details, const int64_t& now)
		-> std::optional<QueueError>
	{
		auto [stmt, error] = db.prepare(
			"INSERT INTO task_logs (task_id, worker_id, event_type, message, details, timestamp) VALUES (?, ?, ?, ?, ?, ?);");
		if (!stmt)
		{
			return make_storage_error(db, "prepare task log");
		}

		stmt->bind_int64(1, task_id);
		stmt->bind_optional_text(2, worker_id);
		stmt->bind_text(3, event_to_string(event));
		stmt->bind_text(4, message);
		stmt->bind_text(5, details.is_null() ? "{}" : details.dump());
		stmt->bind_int64(6, now);

		if (stmt->step() != SQLITE_DONE)
		{
			return make_storage_error(db, fmt::format("append {} log for task {}", event_to_string(event), task_id));
		}

		return std::nullopt;
	}

	// task_logs.worker_id references worker_heartbeats, so a worker row must exist before it is logged.
	auto ensure_worker(DataBase::SQLite& db, const std::string& worker_id, const int64_t& now) -> std::optional<QueueError>
	{
		auto [stmt, error] = db.prepare(
			"INSERT OR IGNORE INTO worker_heartbeats (worker_id, last_heartbeat, strategy, state, started_at, updated_at) "
			"VALUES (?, ?, 'LIFO', 'active', ?, ?);");
		if (!stmt)
		{
			return make_storage_error(db, "prepare worker insert");
		}

		stmt->bind_text(1, worker_id);
		stmt->bind_int64(2, now);
		stmt->bind_int64(3, now);
		stmt->bind_int64(4, now);

		if (stmt->step() != SQLITE_DONE)
		{
			return make_storage_error(db, fmt::format("insert worker {}", worker_id));
		}

		return std::nullopt;
	}

	// Clears the worker's current task and bumps one of its counters.
	auto release_worker(DataBase::SQLite& db, const LeaseToken& lease, const std::string& counter, const int64_t& now)
		-> std::optional<QueueError>
	{
		std::string sql;
		if (counter.empty())
		{
			sql = "UPDATE worker_heartbeats SET current_task_id = NULL, last_heartbeat = ?, updated_at = ? "
				  "WHERE worker_id = ? AND (current_task_id IS NULL OR current_task_id = ?);";
		}
		else
		{
			sql = fmt::format(
				"UPDATE worker_heartbeats SET {0} = {0} + 1, current_task_id = NULL, last_heartbeat = ?, updated_at = ? "
				"WHERE worker_id = ? AND (current_task_id IS NULL OR current_task_id = ?);",
				counter);
		}

		auto [stmt, error] = db.prepare(sql);
		if (!stmt)
		{
			return make_storage_error(db, "prepare worker release");
		}

		stmt->bind_int64(1, now);
		stmt->bind_int64(2, now);
		stmt->bind_text(3, lease.worker_id);
		stmt->bind_int64(4, lease.task_id);

		if (stmt->step() != SQLITE_DONE)
		{
			return make_storage_error(db, fmt::format("release worker {}", lease.worker_id));
		}

		return std::nullopt;
	}

	auto bind_lease_guard(DataBase::Statement& statement, const int& first_index, const LeaseToken& lease, const int64_t& now)
		-> void
	{
		statement.bind_int64(first_index, lease.task_id);
		statement.bind_text(first_index + 1, lease.token);
		statement.bind_text(first_index + 2, lease.worker_id);
		statement.bind_int64(first_index + 3, now);
	}

	auto lease_lost(const LeaseToken& lease, const std::string& operation) -> QueueError
	{
		return { QueueErrorType::LeaseLost,
			fmt::format("{} rejected: worker {} no longer holds the lease on task {}", operation, lease.worker_id, lease.task_id) };
	}

	auto event_for_transition(const TaskStatus& next) -> TaskEvent
	{
		switch (next)
		{
		case TaskStatus::Queued: return TaskEvent::Retry;
		case TaskStatus::Leased: return TaskEvent::Claimed;
		case TaskStatus::Running: return TaskEvent::Started;
		case TaskStatus::Completed: return TaskEvent::Completed;
		case TaskStatus::Failed: return TaskEvent::Failed;
		case TaskStatus::Cancelled:
		default: return TaskEvent::Cancelled;
		}
	}
} // namespace

auto make_storage_error(const DataBase::SQLite& db, const std::string& context) -> QueueError
{
	QueueError error;
	error.type = db.is_busy() ? QueueErrorType::Busy : QueueErrorType::Storage;
	error.message = fmt::format("{}: {}", context, db.last_error_message());

	return error;
}

QueueStore::QueueStore(std::shared_ptr<Clock> clock)
	: is_open_(false), clock_(clock ? clock : std::make_shared<SystemClock>())
{
}

QueueStore::~QueueStore(void) { close(); }

auto QueueStore::open(const StoreConfig& config) -> std::tuple<bool, std::optional<QueueError>>
{
	std::lock_guard<std::mutex> lock(db_mutex_);

	if (config.db_path.empty())
	{
		return { false, QueueError{ QueueErrorType::Validation, "database path is empty" } };
	}

	if (config.min_priority < 1 || config.max_priority > 10 || config.min_priority > config.max_priority)
	{
		return { false, QueueError{ QueueErrorType::Validation,
			fmt::format("priority range [{}, {}] must lie inside [1, 10]", config.min_priority, config.max_priority) } };
	}

	config_ = config;

	std::filesystem::path db_path(config_.db_path);
	if (!db_path.parent_path().empty())
	{
		std::error_code error_code;
		std::filesystem::create_directories(db_path.parent_path(), error_code);
		if (error_code)
		{
			return { false, QueueError{ QueueErrorType::Storage, error_code.message() } };
		}
	}

	auto [opened, open_message] = db_.open(config_.db_path);
	if (!opened)
	{
		return { false, QueueError{ QueueErrorType::Storage, open_message.value_or("cannot open database") } };
	}

	if (config_.busy_timeout_ms > 0)
	{
		auto [timeout_ok, timeout_message] = db_.set_busy_timeout(config_.busy_timeout_ms);
		if (!timeout_ok)
		{
			db_.close();
			return { false, QueueError{ QueueErrorType::Storage, timeout_message.value_or("cannot set busy timeout") } };
		}
	}

	auto [pragma_ok, pragma_error] = apply_pragmas();
	if (!pragma_ok)
	{
		db_.close();
		return { false, pragma_error };
	}

	auto [migrate_ok, migrate_error] = migrate();
	if (!migrate_ok)
	{
		db_.close();
		return { false, migrate_error };
	}

	is_open_ = true;

	Utilities::Logger::handle().write(Utilities::LogTypes::Information,
		fmt::format("queue store opened: {} (schema v{})", config_.db_path, queue_schema_migrations.size()));

	return { true, std::nullopt };
}

auto QueueStore::close(void) -> void
{
	std::lock_guard<std::mutex> lock(db_mutex_);

	is_open_ = false;
	db_.close();
}

auto QueueStore::is_open(void) const -> bool
{
	std::lock_guard<std::mutex> lock(db_mutex_);

	return is_open_ && db_.is_open();
}

auto QueueStore::config(void) const -> const StoreConfig& { return config_; }

auto QueueStore::now_ms(void) const -> int64_t { return clock_->now_ms(); }

auto QueueStore::schema_version(void) -> std::tuple<int32_t, std::optional<QueueError>>
{
	return read<int32_t>([](DataBase::SQLite& db) -> std::tuple<int32_t, std::optional<QueueError>> {
		auto [value, error] = db.pragma("user_version");
		if (!value.has_value())
		{
			return { 0, make_storage_error(db, "read user_version") };
		}

		return { std::stoi(value.value()), std::nullopt };
	});
}

auto QueueStore::apply_pragmas(void) -> std::tuple<bool, std::optional<QueueError>>
{
	std::vector<std::string> pragmas = {
		"PRAGMA foreign_keys = ON;",
		fmt::format("PRAGMA journal_mode = {};", config_.journal_mode),
		fmt::format("PRAGMA synchronous = {};", config_.synchronous),
		fmt::format("PRAGMA temp_store = {};", config_.temp_store),
		fmt::format("PRAGMA cache_size = -{};", config_.cache_size_kb),
		fmt::format("PRAGMA wal_autocheckpoint = {};", config_.wal_autocheckpoint),
	};

	for (const auto& pragma : pragmas)
	{
		auto [ok, error] = db_.execute(pragma);
		if (!ok)
		{
			return { false, make_storage_error(db_, fmt::format("apply '{}'", pragma)) };
		}
	}

	auto lower = [](std::string value) {
		std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
		return value;
	};

	// In-memory databases silently keep journal_mode = memory.
	auto [journal_mode, journal_error] = db_.pragma("journal_mode");
	if (journal_mode.has_value() && lower(journal_mode.value()) != lower(config_.journal_mode))
	{
		Utilities::Logger::handle().write(Utilities::LogTypes::Error,
			fmt::format("journal_mode requested {} but database reports {}", config_.journal_mode, journal_mode.value()));
	}

	return { true, std::nullopt };
}

auto QueueStore::migrate(void) -> std::tuple<bool, std::optional<QueueError>>
{
	auto [version_text, version_error] = db_.pragma("user_version");
	if (!version_text.has_value())
	{
		return { false, make_storage_error(db_, "read user_version") };
	}

	size_t version = static_cast<size_t>(std::stoi(version_text.value()));
	if (version > queue_schema_migrations.size())
	{
		return { false, QueueError{ QueueErrorType::Storage,
			fmt::format("database schema v{} is newer than supported v{}", version, queue_schema_migrations.size()) } };
	}

	for (; version < queue_schema_migrations.size(); ++version)
	{
		DataBase::Transaction transaction(db_, DataBase::TransactionMode::Exclusive);

		auto [tx_ok, tx_error] = transaction.begin();
		if (!tx_ok)
		{
			return { false, make_storage_error(db_, "begin migration") };
		}

		auto [apply_ok, apply_error] = db_.execute(queue_schema_migrations[version]);
		if (!apply_ok)
		{
			return { false, make_storage_error(db_, fmt::format("apply schema v{}", version + 1)) };
		}

		auto [bump_ok, bump_error] = db_.execute(fmt::format("PRAGMA user_version = {};", version + 1));
		if (!bump_ok)
		{
			return { false, make_storage_error(db_, "update user_version") };
		}

		auto [commit_ok, commit_error] = transaction.commit();
		if (!commit_ok)
		{
			return { false, make_storage_error(db_, "commit migration") };
		}

		Utilities::Logger::handle().write(Utilities::LogTypes::Debug, fmt::format("applied schema migration v{}", version + 1));
	}

	return { true, std::nullopt };
}

auto QueueStore::enqueue(const EnqueueRequest& request) -> std::tuple<int64_t, std::optional<QueueError>>
{
	if (request.task_type.empty())
	{
		return { 0, QueueError{ QueueErrorType::Validation, "task_type is empty" } };
	}

	auto priority = request.priority.value_or(config_.default_priority);
	if (priority < config_.min_priority || priority > config_.max_priority)
	{
		return { 0, QueueError{ QueueErrorType::Validation,
			fmt::format("priority {} outside [{}, {}]", priority, config_.min_priority, config_.max_priority) } };
	}

	auto max_retries = request.max_retries.value_or(config_.default_max_retries);
	if (max_retries < 0)
	{
		return { 0, QueueError{ QueueErrorType::Validation, fmt::format("max_retries {} is negative", max_retries) } };
	}

	auto parameters = request.parameters_json.empty() ? std::string("{}") : request.parameters_json;
	if (!json::accept(parameters))
	{
		return { 0, QueueError{ QueueErrorType::Validation, "parameters are not valid JSON" } };
	}

	if (request.idempotency_key.has_value() && request.idempotency_key.value().empty())
	{
		return { 0, QueueError{ QueueErrorType::Validation, "idempotency_key is empty" } };
	}

	auto now = clock_->now_ms();
	auto run_after = request.run_after_ms.value_or(now);

	return write_transaction<int64_t>("enqueue", [&](DataBase::SQLite& db) -> std::tuple<int64_t, std::optional<QueueError>> {
		if (request.idempotency_key.has_value())
		{
			auto [lookup, lookup_error] = db.prepare("SELECT id FROM task_queue WHERE idempotency_key = ?;");
			if (!lookup)
			{
				return { 0, make_storage_error(db, "prepare idempotency lookup") };
			}

			lookup->bind_text(1, request.idempotency_key.value());

			auto result = lookup->step();
			if (result == SQLITE_ROW)
			{
				auto existing = lookup->column_int64(0);
				Utilities::Logger::handle().write(Utilities::LogTypes::Debug,
					fmt::format("enqueue: idempotency key {} already maps to task {}", request.idempotency_key.value(), existing));
				return { existing, std::nullopt };
			}
			if (result != SQLITE_DONE)
			{
				return { 0, make_storage_error(db, "idempotency lookup") };
			}
		}

		auto [stmt, error] = db.prepare(
			"INSERT INTO task_queue (task_type, parameters, priority, run_after, status, retry_count, max_retries, "
			"idempotency_key, created_at, updated_at) VALUES (?, ?, ?, ?, 'queued', 0, ?, ?, ?, ?);");
		if (!stmt)
		{
			return { 0, make_storage_error(db, "prepare enqueue") };
		}

		stmt->bind_text(1, request.task_type);
		stmt->bind_text(2, parameters);
		stmt->bind_int(3, priority);
		stmt->bind_int64(4, run_after);
		stmt->bind_int(5, max_retries);
		stmt->bind_optional_text(6, request.idempotency_key);
		stmt->bind_int64(7, now);
		stmt->bind_int64(8, now);

		if (stmt->step() != SQLITE_DONE)
		{
			return { 0, make_storage_error(db, "insert task") };
		}

		auto task_id = db.last_insert_rowid();

		json details;
		details["task_type"] = request.task_type;
		details["priority"] = priority;
		details["run_after"] = run_after;
		details["max_retries"] = max_retries;

		auto log_error = insert_log(db, task_id, std::nullopt, TaskEvent::Created, "task enqueued", details, now);
		if (log_error.has_value())
		{
			return { 0, log_error };
		}

		return { task_id, std::nullopt };
	});
}

auto QueueStore::get(const int64_t& task_id) -> std::tuple<std::optional<Task>, std::optional<QueueError>>
{
	return read<std::optional<Task>>([&](DataBase::SQLite& db) -> std::tuple<std::optional<Task>, std::optional<QueueError>> {
		auto [task, error] = load_task(db, task_id);
		if (error.has_value())
		{
			return { std::nullopt, error };
		}
		if (!task.has_value())
		{
			return { std::nullopt, QueueError{ QueueErrorType::NotFound, fmt::format("task {} not found", task_id) } };
		}

		return { task, std::nullopt };
	});
}

auto QueueStore::update_status(const int64_t& task_id, const StatusUpdate& update) -> std::tuple<bool, std::optional<QueueError>>
{
	if (is_terminal(update.expected))
	{
		return { false, QueueError{ QueueErrorType::Validation,
			fmt::format("task {} cannot leave terminal status {}", task_id, status_to_string(update.expected)) } };
	}

	// Ownership carries a lease token and expiry, which only claim() and start() hand out.
	if (update.next == TaskStatus::Leased || update.next == TaskStatus::Running)
	{
		return { false, QueueError{ QueueErrorType::Validation,
			fmt::format("status {} is only reachable through a claim", status_to_string(update.next)) } };
	}

	auto now = clock_->now_ms();

	return write_transaction<bool>("update_status", [&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
		if (update.worker_id.has_value() && !update.worker_id.value().empty())
		{
			auto worker_error = ensure_worker(db, update.worker_id.value(), now);
			if (worker_error.has_value())
			{
				return { false, worker_error };
			}
		}

		std::string sql;
		if (update.next == TaskStatus::Queued)
		{
			sql = "UPDATE task_queue SET status = ?, claimed_by = NULL, claimed_at = NULL, lease_until = NULL, lease_token = NULL, "
				  "run_after = COALESCE(?, run_after), error_message = COALESCE(?, error_message), "
				  "result_data = COALESCE(?, result_data), updated_at = ? WHERE id = ? AND status = ?;";
		}
		else
		{
			sql = "UPDATE task_queue SET status = ?, claimed_by = NULL, claimed_at = NULL, lease_until = NULL, completed_at = ?, "
				  "error_message = COALESCE(?, error_message), result_data = COALESCE(?, result_data), updated_at = ? "
				  "WHERE id = ? AND status = ?;";
		}

		auto [stmt, error] = db.prepare(sql);
		if (!stmt)
		{
			return { false, make_storage_error(db, "prepare status update") };
		}

		stmt->bind_text(1, status_to_string(update.next));
		if (update.next == TaskStatus::Queued)
		{
			stmt->bind_optional_int64(2, update.run_after_ms);
		}
		else
		{
			stmt->bind_int64(2, now);
		}
		stmt->bind_optional_text(3, update.error_message);
		stmt->bind_optional_text(4, update.result_data);
		stmt->bind_int64(5, now);
		stmt->bind_int64(6, task_id);
		stmt->bind_text(7, status_to_string(update.expected));

		if (stmt->step() != SQLITE_DONE)
		{
			return { false, make_storage_error(db, fmt::format("update status of task {}", task_id)) };
		}

		if (db.changes() == 0)
		{
			auto [current, load_error] = load_task(db, task_id);
			if (load_error.has_value())
			{
				return { false, load_error };
			}
			if (!current.has_value())
			{
				return { false, QueueError{ QueueErrorType::NotFound, fmt::format("task {} not found", task_id) } };
			}

			return { false, QueueError{ QueueErrorType::Conflict,
				fmt::format("task {} is {}, expected {}", task_id, status_to_string(current->status), status_to_string(update.expected)) } };
		}

		auto [release, release_error] = db.prepare(
			"UPDATE worker_heartbeats SET current_task_id = NULL, updated_at = ? WHERE current_task_id = ?;");
		if (!release)
		{
			return { false, make_storage_error(db, "prepare worker release") };
		}

		release->bind_int64(1, now);
		release->bind_int64(2, task_id);
		if (release->step() != SQLITE_DONE)
		{
			return { false, make_storage_error(db, fmt::format("release task {} from its worker", task_id)) };
		}

		json details;
		details["from"] = status_to_string(update.expected);
		details["to"] = status_to_string(update.next);

		auto log_error = insert_log(db, task_id, update.worker_id, event_for_transition(update.next),
			fmt::format("status changed from {} to {}", status_to_string(update.expected), status_to_string(update.next)), details, now);
		if (log_error.has_value())
		{
			return { false, log_error };
		}

		return { true, std::nullopt };
	});
}

auto QueueStore::query(const TaskFilter& filter) -> std::tuple<std::vector<Task>, std::optional<QueueError>>
{
	std::string sql = fmt::format("SELECT {} FROM task_queue WHERE 1 = 1", task_columns);
	if (filter.status.has_value())
	{
		sql += " AND status = ?";
	}
	if (filter.task_type.has_value())
	{
		sql += " AND task_type = ?";
	}
	if (filter.claimed_by.has_value())
	{
		sql += " AND claimed_by = ?";
	}
	sql += filter.newest_first ? " ORDER BY created_at DESC, id DESC" : " ORDER BY created_at ASC, id ASC";
	if (filter.limit > 0)
	{
		sql += fmt::format(" LIMIT {}", filter.limit);
	}
	sql += ";";

	return read<std::vector<Task>>([&](DataBase::SQLite& db) -> std::tuple<std::vector<Task>, std::optional<QueueError>> {
		auto [stmt, error] = db.prepare(sql);
		if (!stmt)
		{
			return { std::vector<Task>{}, make_storage_error(db, "prepare task query") };
		}

		int index = 1;
		if (filter.status.has_value())
		{
			stmt->bind_text(index++, status_to_string(filter.status.value()));
		}
		if (filter.task_type.has_value())
		{
			stmt->bind_text(index++, filter.task_type.value());
		}
		if (filter.claimed_by.has_value())
		{
			stmt->bind_text(index++, filter.claimed_by.value());
		}

		std::vector<Task> tasks;
		int result;
		while ((result = stmt->step()) == SQLITE_ROW)
		{
			tasks.push_back(read_task(*stmt));
		}
		if (result != SQLITE_DONE)
		{
			return { std::vector<Task>{}, make_storage_error(db, "query tasks") };
		}

		return { tasks, std::nullopt };
	});
}

auto QueueStore::claim(const std::string& worker_id, const int32_t& lease_seconds, const std::string& strategy_name,
	const CandidateSelector& selector) -> ClaimResult
{
	ClaimResult result;

	if (worker_id.empty())
	{
		result.error = QueueError{ QueueErrorType::Validation, "worker id is empty" };
		return result;
	}
	if (lease_seconds <= 0)
	{
		result.error = QueueError{ QueueErrorType::Validation, fmt::format("lease of {} seconds is not positive", lease_seconds) };
		return result;
	}

	std::string token;
	int64_t lease_until = 0;

	auto [task, error] = write_transaction<std::optional<Task>>("claim",
		[&](DataBase::SQLite& db) -> std::tuple<std::optional<Task>, std::optional<QueueError>> {
			auto now = clock_->now_ms();
			lease_until = now + static_cast<int64_t>(lease_seconds) * 1000;

			auto [candidate, select_error] = selector(db, now);
			if (select_error.has_value())
			{
				return { std::nullopt, select_error };
			}
			if (!candidate.has_value())
			{
				return { std::nullopt, std::nullopt };
			}

			token = Utilities::Generator::guid();

			auto [update, update_error] = db.prepare(
				"UPDATE task_queue SET status = 'claimed', claimed_by = ?, claimed_at = ?, lease_until = ?, lease_token = ?, "
				"updated_at = ? WHERE id = ? AND status = 'queued' AND run_after <= ?;");
			if (!update)
			{
				return { std::nullopt, make_storage_error(db, "prepare claim") };
			}

			update->bind_text(1, worker_id);
			update->bind_int64(2, now);
			update->bind_int64(3, lease_until);
			update->bind_text(4, token);
			update->bind_int64(5, now);
			update->bind_int64(6, candidate.value());
			update->bind_int64(7, now);

			if (update->step() != SQLITE_DONE)
			{
				return { std::nullopt, make_storage_error(db, fmt::format("claim task {}", candidate.value())) };
			}

			if (db.changes() != 1)
			{
				return { std::nullopt, std::nullopt };
			}

			auto [upsert, upsert_error] = db.prepare(
				"INSERT INTO worker_heartbeats (worker_id, last_heartbeat, current_task_id, strategy, state, started_at, updated_at) "
				"VALUES (?, ?, ?, ?, 'active', ?, ?) "
				"ON CONFLICT(worker_id) DO UPDATE SET last_heartbeat = excluded.last_heartbeat, "
				"current_task_id = excluded.current_task_id, strategy = excluded.strategy, state = 'active', "
				"updated_at = excluded.updated_at;");
			if (!upsert)
			{
				return { std::nullopt, make_storage_error(db, "prepare worker upsert") };
			}

			upsert->bind_text(1, worker_id);
			upsert->bind_int64(2, now);
			upsert->bind_int64(3, candidate.value());
			upsert->bind_text(4, strategy_name);
			upsert->bind_int64(5, now);
			upsert->bind_int64(6, now);

			if (upsert->step() != SQLITE_DONE)
			{
				return { std::nullopt, make_storage_error(db, fmt::format("upsert worker {}", worker_id)) };
			}

			json details;
			details["strategy"] = strategy_name;
			details["lease_until"] = lease_until;

			auto log_error = insert_log(db, candidate.value(), worker_id, TaskEvent::Claimed,
				fmt::format("claimed by {} using {}", worker_id, strategy_name), details, now);
			if (log_error.has_value())
			{
				return { std::nullopt, log_error };
			}

			auto [claimed, load_error] = load_task(db, candidate.value());
			if (load_error.has_value())
			{
				return { std::nullopt, load_error };
			}

			return { claimed, std::nullopt };
		});

	if (error.has_value())
	{
		result.error = error;
		return result;
	}

	if (!task.has_value())
	{
		return result;
	}

	LeaseToken lease;
	lease.task_id = task->id;
	lease.worker_id = worker_id;
	lease.token = token;
	lease.lease_until_ms = lease_until;

	result.claimed = true;
	result.task = task;
	result.lease = lease;

	return result;
}

auto QueueStore::start(const LeaseToken& lease) -> std::tuple<bool, std::optional<QueueError>>
{
	return write_transaction<bool>("start", [&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
		auto now = clock_->now_ms();

		auto [stmt, error] = db.prepare(fmt::format(
			"UPDATE task_queue SET status = 'running', updated_at = ? WHERE {} AND status = 'claimed';", lease_guard));
		if (!stmt)
		{
			return { false, make_storage_error(db, "prepare start") };
		}

		stmt->bind_int64(1, now);
		bind_lease_guard(*stmt, 2, lease, now);

		if (stmt->step() != SQLITE_DONE)
		{
			return { false, make_storage_error(db, fmt::format("start task {}", lease.task_id)) };
		}

		if (db.changes() == 0)
		{
			return { false, lease_lost(lease, "start") };
		}

		auto log_error = insert_log(db, lease.task_id, lease.worker_id, TaskEvent::Started,
			fmt::format("started by {}", lease.worker_id), json::object(), now);
		if (log_error.has_value())
		{
			return { false, log_error };
		}

		return { true, std::nullopt };
	});
}

auto QueueStore::heartbeat(LeaseToken& lease, const int32_t& lease_seconds) -> std::tuple<bool, std::optional<QueueError>>
{
	if (lease_seconds <= 0)
	{
		return { false, QueueError{ QueueErrorType::Validation, fmt::format("lease of {} seconds is not positive", lease_seconds) } };
	}

	int64_t lease_until = 0;

	auto [extended, error] = write_transaction<bool>("heartbeat",
		[&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
			auto now = clock_->now_ms();
			lease_until = now + static_cast<int64_t>(lease_seconds) * 1000;

			auto [stmt, prepare_error] = db.prepare(fmt::format(
				"UPDATE task_queue SET lease_until = ?, updated_at = ? WHERE {};", lease_guard));
			if (!stmt)
			{
				return { false, make_storage_error(db, "prepare lease extension") };
			}

			stmt->bind_int64(1, lease_until);
			stmt->bind_int64(2, now);
			bind_lease_guard(*stmt, 3, lease, now);

			if (stmt->step() != SQLITE_DONE)
			{
				return { false, make_storage_error(db, fmt::format("extend lease on task {}", lease.task_id)) };
			}

			if (db.changes() == 0)
			{
				return { false, lease_lost(lease, "heartbeat") };
			}

			auto [worker, worker_error] = db.prepare(
				"UPDATE worker_heartbeats SET last_heartbeat = ?, current_task_id = ?, state = 'active', updated_at = ? "
				"WHERE worker_id = ?;");
			if (!worker)
			{
				return { false, make_storage_error(db, "prepare worker heartbeat") };
			}

			worker->bind_int64(1, now);
			worker->bind_int64(2, lease.task_id);
			worker->bind_int64(3, now);
			worker->bind_text(4, lease.worker_id);

			if (worker->step() != SQLITE_DONE)
			{
				return { false, make_storage_error(db, fmt::format("heartbeat worker {}", lease.worker_id)) };
			}

			return { true, std::nullopt };
		});

	if (extended)
	{
		lease.lease_until_ms = lease_until;
	}

	return { extended, error };
}

auto QueueStore::heartbeat(const std::string& worker_id) -> std::tuple<bool, std::optional<QueueError>>
{
	return write_transaction<bool>("worker heartbeat", [&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
		auto now = clock_->now_ms();

		auto [stmt, error] = db.prepare(
			"UPDATE worker_heartbeats SET last_heartbeat = ?, state = 'active', updated_at = ? WHERE worker_id = ?;");
		if (!stmt)
		{
			return { false, make_storage_error(db, "prepare worker heartbeat") };
		}

		stmt->bind_int64(1, now);
		stmt->bind_int64(2, now);
		stmt->bind_text(3, worker_id);

		if (stmt->step() != SQLITE_DONE)
		{
			return { false, make_storage_error(db, fmt::format("heartbeat worker {}", worker_id)) };
		}

		if (db.changes() == 0)
		{
			return { false, QueueError{ QueueErrorType::NotFound, fmt::format("worker {} is not registered", worker_id) } };
		}

		return { true, std::nullopt };
	});
}

auto QueueStore::complete(const LeaseToken& lease, const std::string& result_json) -> std::tuple<bool, std::optional<QueueError>>
{
	return write_transaction<bool>("complete", [&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
		auto now = clock_->now_ms();

		auto [stmt, error] = db.prepare(fmt::format(
			"UPDATE task_queue SET status = 'completed', result_data = ?, claimed_by = NULL, claimed_at = NULL, "
			"lease_until = NULL, completed_at = ?, updated_at = ? WHERE {};",
			lease_guard));
		if (!stmt)
		{
			return { false, make_storage_error(db, "prepare complete") };
		}

		stmt->bind_text(1, result_json);
		stmt->bind_int64(2, now);
		stmt->bind_int64(3, now);
		bind_lease_guard(*stmt, 4, lease, now);

		if (stmt->step() != SQLITE_DONE)
		{
			return { false, make_storage_error(db, fmt::format("complete task {}", lease.task_id)) };
		}

		if (db.changes() == 0)
		{
			return { false, lease_lost(lease, "complete") };
		}

		auto worker_error = release_worker(db, lease, "tasks_processed", now);
		if (worker_error.has_value())
		{
			return { false, worker_error };
		}

		auto log_error = insert_log(db, lease.task_id, lease.worker_id, TaskEvent::Completed,
			fmt::format("completed by {}", lease.worker_id), json::object(), now);
		if (log_error.has_value())
		{
			return { false, log_error };
		}

		return { true, std::nullopt };
	});
}

auto QueueStore::fail(const LeaseToken& lease, const std::string& error_message, const bool& retryable)
	-> std::tuple<std::optional<TaskStatus>, std::optional<QueueError>>
{
	return write_transaction<std::optional<TaskStatus>>("fail",
		[&](DataBase::SQLite& db) -> std::tuple<std::optional<TaskStatus>, std::optional<QueueError>> {
			auto now = clock_->now_ms();

			auto [select, select_error] = db.prepare(
				fmt::format("SELECT retry_count, max_retries FROM task_queue WHERE {};", lease_guard));
			if (!select)
			{
				return { std::nullopt, make_storage_error(db, "prepare failure lookup") };
			}

			bind_lease_guard(*select, 1, lease, now);

			auto step = select->step();
			if (step == SQLITE_DONE)
			{
				return { std::nullopt, lease_lost(lease, "fail") };
			}
			if (step != SQLITE_ROW)
			{
				return { std::nullopt, make_storage_error(db, fmt::format("read task {}", lease.task_id)) };
			}

			auto retry_count = select->column_int(0);
			auto max_retries = select->column_int(1);
			select->finalize();

			bool requeue = retryable && retry_count < max_retries;

			std::shared_ptr<DataBase::Statement> update;
			std::optional<std::string> prepare_error;
			if (requeue)
			{
				std::tie(update, prepare_error) = db.prepare(
					"UPDATE task_queue SET status = 'queued', retry_count = retry_count + 1, run_after = ?, "
					"claimed_by = NULL, claimed_at = NULL, lease_until = NULL, lease_token = NULL, error_message = ?, "
					"updated_at = ? WHERE id = ?;");
				if (!update)
				{
					return { std::nullopt, make_storage_error(db, "prepare retry") };
				}

				update->bind_int64(1, now + config_.retry_delay_ms);
				update->bind_text(2, error_message);
				update->bind_int64(3, now);
				update->bind_int64(4, lease.task_id);
			}
			else
			{
				std::tie(update, prepare_error) = db.prepare(
					"UPDATE task_queue SET status = 'failed', claimed_by = NULL, claimed_at = NULL, lease_until = NULL, "
					"error_message = ?, completed_at = ?, updated_at = ? WHERE id = ?;");
				if (!update)
				{
					return { std::nullopt, make_storage_error(db, "prepare dead-letter") };
				}

				update->bind_text(1, error_message);
				update->bind_int64(2, now);
				update->bind_int64(3, now);
				update->bind_int64(4, lease.task_id);
			}

			if (update->step() != SQLITE_DONE)
			{
				return { std::nullopt, make_storage_error(db, fmt::format("record failure of task {}", lease.task_id)) };
			}

			auto worker_error = release_worker(db, lease, "tasks_failed", now);
			if (worker_error.has_value())
			{
				return { std::nullopt, worker_error };
			}

			json details;
			details["error"] = error_message;
			details["retryable"] = retryable;
			details["retry_count"] = requeue ? retry_count + 1 : retry_count;
			details["max_retries"] = max_retries;

			auto log_error = insert_log(db, lease.task_id, lease.worker_id, requeue ? TaskEvent::Retry : TaskEvent::Failed,
				requeue ? fmt::format("retry {}/{} scheduled", retry_count + 1, max_retries)
						: fmt::format("failed permanently: {}", error_message),
				details, now);
			if (log_error.has_value())
			{
				return { std::nullopt, log_error };
			}

			return { requeue ? TaskStatus::Queued : TaskStatus::Failed, std::nullopt };
		});
}

auto QueueStore::cancel(const int64_t& task_id, const std::string& reason) -> std::tuple<bool, std::optional<QueueError>>
{
	return write_transaction<bool>("cancel", [&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
		auto now = clock_->now_ms();

		auto [current, load_error] = load_task(db, task_id);
		if (load_error.has_value())
		{
			return { false, load_error };
		}
		if (!current.has_value())
		{
			return { false, QueueError{ QueueErrorType::NotFound, fmt::format("task {} not found", task_id) } };
		}
		if (is_terminal(current->status))
		{
			return { false, QueueError{ QueueErrorType::Conflict,
				fmt::format("task {} is already {}", task_id, status_to_string(current->status)) } };
		}

		// lease_token stays on the row so the worker holding it can acknowledge.
		auto [stmt, error] = db.prepare(
			"UPDATE task_queue SET status = 'cancelled', claimed_by = NULL, claimed_at = NULL, lease_until = NULL, "
			"error_message = ?, completed_at = ?, updated_at = ? WHERE id = ? AND status = ?;");
		if (!stmt)
		{
			return { false, make_storage_error(db, "prepare cancel") };
		}

		stmt->bind_text(1, reason.empty() ? std::string("cancelled") : reason);
		stmt->bind_int64(2, now);
		stmt->bind_int64(3, now);
		stmt->bind_int64(4, task_id);
		stmt->bind_text(5, status_to_string(current->status));

		if (stmt->step() != SQLITE_DONE)
		{
			return { false, make_storage_error(db, fmt::format("cancel task {}", task_id)) };
		}

		if (db.changes() == 0)
		{
			return { false, QueueError{ QueueErrorType::Conflict, fmt::format("task {} changed during cancellation", task_id) } };
		}

		json details;
		details["previous_status"] = status_to_string(current->status);
		details["reason"] = reason;
		if (current->claimed_by.has_value())
		{
			details["claimed_by"] = current->claimed_by.value();
		}

		auto log_error = insert_log(db, task_id, std::nullopt, TaskEvent::Cancelled,
			reason.empty() ? std::string("cancelled") : fmt::format("cancelled: {}", reason), details, now);
		if (log_error.has_value())
		{
			return { false, log_error };
		}

		return { true, std::nullopt };
	});
}

auto QueueStore::acknowledge_cancel(const LeaseToken& lease) -> std::tuple<bool, std::optional<QueueError>>
{
	return write_transaction<bool>("acknowledge_cancel", [&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
		auto now = clock_->now_ms();

		auto [current, load_error] = load_task(db, lease.task_id);
		if (load_error.has_value())
		{
			return { false, load_error };
		}
		if (!current.has_value())
		{
			return { false, QueueError{ QueueErrorType::NotFound, fmt::format("task {} not found", lease.task_id) } };
		}
		if (current->status != TaskStatus::Cancelled)
		{
			return { false, QueueError{ QueueErrorType::Conflict,
				fmt::format("task {} is {}, not cancelled", lease.task_id, status_to_string(current->status)) } };
		}
		if (current->lease_token != lease.token)
		{
			return { false, lease_lost(lease, "acknowledge_cancel") };
		}

		auto worker_error = release_worker(db, lease, "", now);
		if (worker_error.has_value())
		{
			return { false, worker_error };
		}

		auto log_error = insert_log(db, lease.task_id, lease.worker_id, TaskEvent::Cancelled,
			fmt::format("cancellation acknowledged by {}", lease.worker_id), json::object(), now);
		if (log_error.has_value())
		{
			return { false, log_error };
		}

		return { true, std::nullopt };
	});
}

auto QueueStore::reclaim_expired_leases(void) -> std::tuple<ReclaimReport, std::optional<QueueError>>
{
	return write_transaction<ReclaimReport>("reclaim", [&](DataBase::SQLite& db) -> std::tuple<ReclaimReport, std::optional<QueueError>> {
		auto now = clock_->now_ms();

		struct Expired
		{
			int64_t id;
			int32_t retry_count;
			int32_t max_retries;
			std::string worker_id;
			int64_t lease_until;
		};

		auto [select, select_error] = db.prepare(
			"SELECT id, retry_count, max_retries, claimed_by, lease_until FROM task_queue "
			"WHERE status IN ('claimed', 'running') AND lease_until < ? ORDER BY id;");
		if (!select)
		{
			return { ReclaimReport{}, make_storage_error(db, "prepare expired lease scan") };
		}

		select->bind_int64(1, now);

		std::vector<Expired> expired;
		int step;
		while ((step = select->step()) == SQLITE_ROW)
		{
			expired.push_back({ select->column_int64(0), select->column_int(1), select->column_int(2), select->column_text(3),
				select->column_int64(4) });
		}
		if (step != SQLITE_DONE)
		{
			return { ReclaimReport{}, make_storage_error(db, "scan expired leases") };
		}
		select->finalize();

		ReclaimReport report;
		for (const auto& task : expired)
		{
			bool requeue = task.retry_count < task.max_retries;

			std::shared_ptr<DataBase::Statement> update;
			std::optional<std::string> prepare_error;
			if (requeue)
			{
				std::tie(update, prepare_error) = db.prepare(
					"UPDATE task_queue SET status = 'queued', retry_count = retry_count + 1, run_after = ?, claimed_by = NULL, "
					"claimed_at = NULL, lease_until = NULL, lease_token = NULL, error_message = ?, updated_at = ? WHERE id = ?;");
				if (!update)
				{
					return { ReclaimReport{}, make_storage_error(db, "prepare lease requeue") };
				}

				update->bind_int64(1, now);
				update->bind_text(2, fmt::format("lease held by {} expired", task.worker_id));
				update->bind_int64(3, now);
				update->bind_int64(4, task.id);
			}
			else
			{
				std::tie(update, prepare_error) = db.prepare(
					"UPDATE task_queue SET status = 'failed', claimed_by = NULL, claimed_at = NULL, lease_until = NULL, "
					"error_message = ?, completed_at = ?, updated_at = ? WHERE id = ?;");
				if (!update)
				{
					return { ReclaimReport{}, make_storage_error(db, "prepare lease dead-letter") };
				}

				update->bind_text(1, fmt::format("lease expired after {} retries", task.retry_count));
				update->bind_int64(2, now);
				update->bind_int64(3, now);
				update->bind_int64(4, task.id);
			}

			if (update->step() != SQLITE_DONE)
			{
				return { ReclaimReport{}, make_storage_error(db, fmt::format("reclaim task {}", task.id)) };
			}

			auto [worker, worker_error] = db.prepare(
				"UPDATE worker_heartbeats SET current_task_id = NULL, updated_at = ? WHERE worker_id = ? AND current_task_id = ?;");
			if (!worker)
			{
				return { ReclaimReport{}, make_storage_error(db, "prepare worker detach") };
			}

			worker->bind_int64(1, now);
			worker->bind_text(2, task.worker_id);
			worker->bind_int64(3, task.id);

			if (worker->step() != SQLITE_DONE)
			{
				return { ReclaimReport{}, make_storage_error(db, fmt::format("detach worker {}", task.worker_id)) };
			}

			json details;
			details["expired_worker"] = task.worker_id;
			details["lease_until"] = task.lease_until;
			details["retry_count"] = requeue ? task.retry_count + 1 : task.retry_count;

			auto log_error = insert_log(db, task.id, task.worker_id, requeue ? TaskEvent::Retry : TaskEvent::Failed,
				requeue ? fmt::format("lease of {} expired, requeued", task.worker_id)
						: fmt::format("lease of {} expired, retries exhausted", task.worker_id),
				details, now);
			if (log_error.has_value())
			{
				return { ReclaimReport{}, log_error };
			}

			if (requeue)
			{
				report.requeued++;
			}
			else
			{
				report.dead_lettered++;
			}
			report.task_ids.push_back(task.id);
		}

		return { report, std::nullopt };
	});
}

auto QueueStore::register_worker(const std::string& worker_id, const std::string& strategy) -> std::tuple<bool, std::optional<QueueError>>
{
	if (worker_id.empty())
	{
		return { false, QueueError{ QueueErrorType::Validation, "worker id is empty" } };
	}

	return write_transaction<bool>("register_worker", [&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
		auto now = clock_->now_ms();

		auto [stmt, error] = db.prepare(
			"INSERT INTO worker_heartbeats (worker_id, last_heartbeat, current_task_id, strategy, state, started_at, updated_at) "
			"VALUES (?, ?, NULL, ?, 'active', ?, ?) "
			"ON CONFLICT(worker_id) DO UPDATE SET last_heartbeat = excluded.last_heartbeat, current_task_id = NULL, "
			"strategy = excluded.strategy, state = 'active', started_at = excluded.started_at, updated_at = excluded.updated_at;");
		if (!stmt)
		{
			return { false, make_storage_error(db, "prepare worker registration") };
		}

		stmt->bind_text(1, worker_id);
		stmt->bind_int64(2, now);
		stmt->bind_text(3, strategy);
		stmt->bind_int64(4, now);
		stmt->bind_int64(5, now);

		if (stmt->step() != SQLITE_DONE)
		{
			return { false, make_storage_error(db, fmt::format("register worker {}", worker_id)) };
		}

		return { true, std::nullopt };
	});
}

auto QueueStore::unregister_worker(const std::string& worker_id) -> std::tuple<bool, std::optional<QueueError>>
{
	return write_transaction<bool>("unregister_worker", [&](DataBase::SQLite& db) -> std::tuple<bool, std::optional<QueueError>> {
		auto now = clock_->now_ms();

		auto [stmt, error] = db.prepare(
			"UPDATE worker_heartbeats SET state = 'stopped', current_task_id = NULL, last_heartbeat = ?, updated_at = ? "
			"WHERE worker_id = ?;");
		if (!stmt)
		{
			return { false, make_storage_error(db, "prepare worker shutdown") };
		}

		stmt->bind_int64(1, now);
		stmt->bind_int64(2, now);
		stmt->bind_text(3, worker_id);

		if (stmt->step() != SQLITE_DONE)
		{
			return { false, make_storage_error(db, fmt::format("unregister worker {}", worker_id)) };
		}

		if (db.changes() == 0)
		{
			return { false, QueueError{ QueueErrorType::NotFound, fmt::format("worker {} is not registered", worker_id) } };
		}

		return { true, std::nullopt };
	});
}

auto QueueStore::mark_stale_workers(const int64_t& threshold_ms) -> std::tuple<int32_t, std::optional<QueueError>>
{
	return write_transaction<int32_t>("mark_stale_workers", [&](DataBase::SQLite& db) -> std::tuple<int32_t, std::optional<QueueError>> {
		auto now = clock_->now_ms();

		auto [stmt, error] = db.prepare(
			"UPDATE worker_heartbeats SET state = 'stale', updated_at = ? WHERE state = 'active' AND last_heartbeat < ?;");
		if (!stmt)
		{
			return { 0, make_storage_error(db, "prepare stale worker scan") };
		}

		stmt->bind_int64(1, now);
		stmt->bind_int64(2, now - threshold_ms);

		if (stmt->step() != SQLITE_DONE)
		{
			return { 0, make_storage_error(db, "mark stale workers") };
		}

		return { db.changes(), std::nullopt };
	});
}

auto QueueStore::append_log(const TaskLogEntry& entry) -> std::tuple<int64_t, std::optional<QueueError>>
{
	if (!entry.details_json.empty() && !json::accept(entry.details_json))
	{
		return { 0, QueueError{ QueueErrorType::Validation, "log details are not valid JSON" } };
	}

	return write_transaction<int64_t>("append_log", [&](DataBase::SQLite& db) -> std::tuple<int64_t, std::optional<QueueError>> {
		auto now = entry.timestamp_ms > 0 ? entry.timestamp_ms : clock_->now_ms();

		auto [task, load_error] = load_task(db, entry.task_id);
		if (load_error.has_value())
		{
			return { 0, load_error };
		}
		if (!task.has_value())
		{
			return { 0, QueueError{ QueueErrorType::NotFound, fmt::format("task {} not found", entry.task_id) } };
		}

		if (entry.worker_id.has_value() && !entry.worker_id.value().empty())
		{
			auto worker_error = ensure_worker(db, entry.worker_id.value(), now);
			if (worker_error.has_value())
			{
				return { 0, worker_error };
			}
		}

		auto details = entry.details_json.empty() ? json::object() : json::parse(entry.details_json);

		auto log_error = insert_log(db, entry.task_id, entry.worker_id, entry.event, entry.message, details, now);
		if (log_error.has_value())
		{
			return { 0, log_error };
		}

		return { db.last_insert_rowid(), std::nullopt };
	});
}
