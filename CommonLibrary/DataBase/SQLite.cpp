#include "SQLite.h"

#include <fmt/format.h>
#include <sqlite3.h>

#include <utility>

namespace DataBase
{
	namespace
	{
		const std::string not_open = "database is not open";

		auto describe(sqlite3* connection, const std::string& context) -> std::string
		{
			if (connection == nullptr)
			{
				return context;
			}

			return fmt::format("{}: {} ({})", context, sqlite3_errmsg(connection), sqlite3_extended_errcode(connection));
		}

		auto begin_statement(const TransactionMode& mode) -> const char*
		{
			switch (mode)
			{
			case TransactionMode::Deferred: return "BEGIN DEFERRED;";
			case TransactionMode::Exclusive: return "BEGIN EXCLUSIVE;";
			default: return "BEGIN IMMEDIATE;";
			}
		}
	} // namespace

	Statement::Statement(sqlite3* connection, sqlite3_stmt* statement) : connection_(connection), statement_(statement) {}

	Statement::~Statement(void) { finalize(); }

	auto Statement::step(void) -> int
	{
		return statement_ != nullptr ? sqlite3_step(statement_) : SQLITE_MISUSE;
	}

	auto Statement::reset(void) -> std::tuple<bool, std::optional<std::string>>
	{
		if (statement_ == nullptr)
		{
			return { false, "statement is finalized" };
		}

		sqlite3_clear_bindings(statement_);
		if (sqlite3_reset(statement_) != SQLITE_OK)
		{
			return { false, describe(connection_, "reset statement") };
		}

		return { true, std::nullopt };
	}

	auto Statement::finalize(void) -> void
	{
		sqlite3_finalize(statement_);
		statement_ = nullptr;
	}

	auto Statement::bind_int(const int& index, const int& value) -> std::tuple<bool, std::optional<std::string>>
	{
		return bind_result(sqlite3_bind_int(statement_, index, value), index);
	}

	auto Statement::bind_int64(const int& index, const int64_t& value) -> std::tuple<bool, std::optional<std::string>>
	{
		return bind_result(sqlite3_bind_int64(statement_, index, value), index);
	}

	auto Statement::bind_text(const int& index, const std::string& value) -> std::tuple<bool, std::optional<std::string>>
	{
		return bind_result(
			sqlite3_bind_text(statement_, index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT), index);
	}

	auto Statement::bind_optional_text(const int& index, const std::optional<std::string>& value)
		-> std::tuple<bool, std::optional<std::string>>
	{
		return value.has_value() ? bind_text(index, value.value()) : bind_null(index);
	}

	auto Statement::bind_optional_int64(const int& index, const std::optional<int64_t>& value)
		-> std::tuple<bool, std::optional<std::string>>
	{
		return value.has_value() ? bind_int64(index, value.value()) : bind_null(index);
	}

	auto Statement::bind_null(const int& index) -> std::tuple<bool, std::optional<std::string>>
	{
		return bind_result(sqlite3_bind_null(statement_, index), index);
	}

	auto Statement::bind_result(const int& code, const int& index) const -> std::tuple<bool, std::optional<std::string>>
	{
		if (code == SQLITE_OK)
		{
			return { true, std::nullopt };
		}

		return { false, describe(connection_, fmt::format("bind parameter {}", index)) };
	}

	auto Statement::column_count(void) const -> int { return sqlite3_column_count(statement_); }

	auto Statement::column_name(const int& index) const -> std::string
	{
		const char* name = sqlite3_column_name(statement_, index);
		return name != nullptr ? name : std::string();
	}

	auto Statement::column_is_null(const int& index) const -> bool
	{
		return sqlite3_column_type(statement_, index) == SQLITE_NULL;
	}

	auto Statement::column_int(const int& index) const -> int { return sqlite3_column_int(statement_, index); }

	auto Statement::column_int64(const int& index) const -> int64_t { return sqlite3_column_int64(statement_, index); }

	auto Statement::column_double(const int& index) const -> double { return sqlite3_column_double(statement_, index); }

	auto Statement::column_text(const int& index) const -> std::string
	{
		auto text = sqlite3_column_text(statement_, index);
		if (text == nullptr)
		{
			return std::string();
		}

		return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(sqlite3_column_bytes(statement_, index)));
	}

	auto Statement::column_optional_text(const int& index) const -> std::optional<std::string>
	{
		if (column_is_null(index))
		{
			return std::nullopt;
		}

		return column_text(index);
	}

	auto Statement::column_optional_int64(const int& index) const -> std::optional<int64_t>
	{
		if (column_is_null(index))
		{
			return std::nullopt;
		}

		return column_int64(index);
	}

	SQLite::SQLite(void) : connection_(nullptr) {}

	SQLite::~SQLite(void) { close(); }

	auto SQLite::open(const std::string& path) -> std::tuple<bool, std::optional<std::string>>
	{
		close();

		if (path.empty())
		{
			return { false, "db path is empty" };
		}

		// Callers serialize access to a connection themselves.
		sqlite3* connection = nullptr;
		auto result = sqlite3_open_v2(path.c_str(), &connection, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_NOMUTEX, nullptr);
		if (result != SQLITE_OK)
		{
			auto message = connection != nullptr ? describe(connection, fmt::format("open {}", path))
												 : fmt::format("open {}: {}", path, sqlite3_errstr(result));
			sqlite3_close_v2(connection);

			return { false, message };
		}

		sqlite3_extended_result_codes(connection, 1);
		connection_ = connection;

		return { true, std::nullopt };
	}

	auto SQLite::close(void) -> void
	{
		if (connection_ == nullptr)
		{
			return;
		}

		sqlite3_close_v2(connection_);
		connection_ = nullptr;
	}

	auto SQLite::is_open(void) const -> bool { return connection_ != nullptr; }

	auto SQLite::set_busy_timeout(const int& timeout_ms) -> std::tuple<bool, std::optional<std::string>>
	{
		if (connection_ == nullptr)
		{
			return { false, not_open };
		}

		if (sqlite3_busy_timeout(connection_, timeout_ms) != SQLITE_OK)
		{
			return { false, describe(connection_, "set busy timeout") };
		}

		return { true, std::nullopt };
	}

	auto SQLite::execute(const std::string& sql) -> std::tuple<bool, std::optional<std::string>>
	{
		if (connection_ == nullptr)
		{
			return { false, not_open };
		}

		char* message = nullptr;
		if (sqlite3_exec(connection_, sql.c_str(), nullptr, nullptr, &message) == SQLITE_OK)
		{
			return { true, std::nullopt };
		}

		std::string error = message != nullptr ? message : describe(connection_, "execute");
		sqlite3_free(message);

		return { false, error };
	}

	auto SQLite::query(const std::string& sql) -> std::tuple<std::optional<QueryResult>, std::optional<std::string>>
	{
		auto [statement, prepare_error] = prepare(sql);
		if (!statement)
		{
			return { std::nullopt, prepare_error };
		}

		QueryResult result;
		auto count = statement->column_count();
		for (int column = 0; column < count; ++column)
		{
			result.columns.push_back(statement->column_name(column));
		}

		int code = SQLITE_ROW;
		while ((code = statement->step()) == SQLITE_ROW)
		{
			std::vector<std::string> row;
			row.reserve(count);
			for (int column = 0; column < count; ++column)
			{
				row.push_back(statement->column_text(column));
			}
			result.rows.push_back(std::move(row));
		}

		if (code != SQLITE_DONE)
		{
			return { std::nullopt, describe(connection_, "query") };
		}

		return { result, std::nullopt };
	}

	auto SQLite::prepare(const std::string& sql) -> std::tuple<std::shared_ptr<Statement>, std::optional<std::string>>
	{
		if (connection_ == nullptr)
		{
			return { nullptr, not_open };
		}

		sqlite3_stmt* statement = nullptr;
		if (sqlite3_prepare_v2(connection_, sql.c_str(), static_cast<int>(sql.size()), &statement, nullptr) != SQLITE_OK)
		{
			sqlite3_finalize(statement);
			return { nullptr, describe(connection_, "prepare") };
		}

		if (statement == nullptr)
		{
			return { nullptr, "prepare: empty statement" };
		}

		return { std::make_shared<Statement>(connection_, statement), std::nullopt };
	}

	auto SQLite::pragma(const std::string& name) -> std::tuple<std::optional<std::string>, std::optional<std::string>>
	{
		auto [statement, prepare_error] = prepare(fmt::format("PRAGMA {};", name));
		if (!statement)
		{
			return { std::nullopt, prepare_error };
		}

		switch (statement->step())
		{
		case SQLITE_ROW: return { statement->column_text(0), std::nullopt };
		case SQLITE_DONE: return { std::string(), std::nullopt };
		default: return { std::nullopt, describe(connection_, fmt::format("pragma {}", name)) };
		}
	}

	auto SQLite::begin_transaction(const TransactionMode& mode) -> std::tuple<bool, std::optional<std::string>>
	{
		return execute(begin_statement(mode));
	}

	auto SQLite::commit(void) -> std::tuple<bool, std::optional<std::string>>
	{
		return execute("COMMIT;");
	}

	auto SQLite::rollback(void) -> std::tuple<bool, std::optional<std::string>>
	{
		if (!in_transaction())
		{
			return { true, std::nullopt };
		}

		return execute("ROLLBACK;");
	}

	auto SQLite::in_transaction(void) const -> bool
	{
		return connection_ != nullptr && sqlite3_get_autocommit(connection_) == 0;
	}

	auto SQLite::changes(void) const -> int { return connection_ != nullptr ? sqlite3_changes(connection_) : 0; }

	auto SQLite::last_insert_rowid(void) const -> int64_t
	{
		return connection_ != nullptr ? sqlite3_last_insert_rowid(connection_) : 0;
	}

	auto SQLite::last_error_code(void) const -> int
	{
		if (connection_ == nullptr)
		{
			return SQLITE_MISUSE;
		}

		return sqlite3_extended_errcode(connection_) & 0xff;
	}

	auto SQLite::last_error_message(void) const -> std::string
	{
		return connection_ != nullptr ? std::string(sqlite3_errmsg(connection_)) : not_open;
	}

	auto SQLite::is_busy(void) const -> bool
	{
		switch (last_error_code())
		{
		case SQLITE_BUSY:
		case SQLITE_LOCKED: return true;
		default: return false;
		}
	}

	Transaction::Transaction(SQLite& db, const TransactionMode& mode) : db_(db), mode_(mode), active_(false) {}

	Transaction::~Transaction(void)
	{
		if (active_)
		{
			// A destructor has nobody to report to; close() releases whatever survives.
			auto [rolled_back, rollback_error] = db_.rollback();
			(void)rolled_back;
			(void)rollback_error;
		}
	}

	auto Transaction::begin(void) -> std::tuple<bool, std::optional<std::string>>
	{
		if (active_)
		{
			return { false, "transaction already active" };
		}

		auto [began, error] = db_.begin_transaction(mode_);
		active_ = began;

		return { began, error };
	}

	auto Transaction::commit(void) -> std::tuple<bool, std::optional<std::string>>
	{
		if (!active_)
		{
			return { false, "no active transaction" };
		}

		auto [committed, error] = db_.commit();
		if (committed)
		{
			active_ = false;
		}

		return { committed, error };
	}

	auto Transaction::is_active(void) const -> bool { return active_; }
}
