#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

struct sqlite3;
struct sqlite3_stmt;

namespace DataBase
{
	enum class TransactionMode
	{
		Deferred,
		Immediate,
		Exclusive
	};

	struct QueryResult
	{
		std::vector<std::string> columns;
		std::vector<std::vector<std::string>> rows;
	};

	// Owns one prepared statement. Only SQLite::prepare creates these, so the handle is never null.
	class Statement
	{
	public:
		Statement(sqlite3* connection, sqlite3_stmt* statement);
		~Statement(void);

		Statement(const Statement&) = delete;
		Statement& operator=(const Statement&) = delete;

		// SQLITE_ROW, SQLITE_DONE or an error code.
		auto step(void) -> int;
		// Rewinds the statement and clears every binding.
		auto reset(void) -> std::tuple<bool, std::optional<std::string>>;
		// Releases the read cursor early; later calls on this statement fail with SQLITE_MISUSE.
		auto finalize(void) -> void;

		auto bind_int(const int& index, const int& value) -> std::tuple<bool, std::optional<std::string>>;
		auto bind_int64(const int& index, const int64_t& value) -> std::tuple<bool, std::optional<std::string>>;
		auto bind_text(const int& index, const std::string& value) -> std::tuple<bool, std::optional<std::string>>;
		auto bind_optional_text(const int& index, const std::optional<std::string>& value)
			-> std::tuple<bool, std::optional<std::string>>;
		auto bind_optional_int64(const int& index, const std::optional<int64_t>& value)
			-> std::tuple<bool, std::optional<std::string>>;

		auto column_count(void) const -> int;
		auto column_name(const int& index) const -> std::string;
		auto column_is_null(const int& index) const -> bool;

		auto column_int(const int& index) const -> int;
		auto column_int64(const int& index) const -> int64_t;
		auto column_double(const int& index) const -> double;
		auto column_text(const int& index) const -> std::string;
		auto column_optional_text(const int& index) const -> std::optional<std::string>;
		auto column_optional_int64(const int& index) const -> std::optional<int64_t>;

	private:
		auto bind_null(const int& index) -> std::tuple<bool, std::optional<std::string>>;
		auto bind_result(const int& code, const int& index) const -> std::tuple<bool, std::optional<std::string>>;

	private:
		sqlite3* connection_;
		sqlite3_stmt* statement_;
	};

	class SQLite
	{
	public:
		SQLite(void);
		~SQLite(void);

		SQLite(const SQLite&) = delete;
		SQLite& operator=(const SQLite&) = delete;

		// Opens read-write, creating the file; extended result codes are enabled.
		auto open(const std::string& path) -> std::tuple<bool, std::optional<std::string>>;
		auto close(void) -> void;
		auto is_open(void) const -> bool;

		auto set_busy_timeout(const int& timeout_ms) -> std::tuple<bool, std::optional<std::string>>;
		// Runs one or more statements that return no rows.
		auto execute(const std::string& sql) -> std::tuple<bool, std::optional<std::string>>;
		// Runs a single statement and returns every row as text; NULL comes back as "".
		auto query(const std::string& sql) -> std::tuple<std::optional<QueryResult>, std::optional<std::string>>;
		auto prepare(const std::string& sql) -> std::tuple<std::shared_ptr<Statement>, std::optional<std::string>>;

		// Runs a single-value PRAGMA read such as "journal_mode" and returns its text.
		auto pragma(const std::string& name) -> std::tuple<std::optional<std::string>, std::optional<std::string>>;

		auto begin_transaction(const TransactionMode& mode = TransactionMode::Immediate) -> std::tuple<bool, std::optional<std::string>>;
		auto commit(void) -> std::tuple<bool, std::optional<std::string>>;
		// No-op outside a transaction.
		auto rollback(void) -> std::tuple<bool, std::optional<std::string>>;
		auto in_transaction(void) const -> bool;

		auto changes(void) const -> int;
		auto last_insert_rowid(void) const -> int64_t;

		// Primary result code of the most recent failed call on this connection.
		auto last_error_code(void) const -> int;
		auto last_error_message(void) const -> std::string;
		// SQLITE_BUSY or SQLITE_LOCKED: another connection holds the lock.
		auto is_busy(void) const -> bool;

	private:
		sqlite3* connection_;
	};

	// Scoped transaction: whatever is still open when it goes out of scope is rolled back.
	class Transaction
	{
	public:
		Transaction(SQLite& db, const TransactionMode& mode = TransactionMode::Immediate);
		~Transaction(void);

		Transaction(const Transaction&) = delete;
		Transaction& operator=(const Transaction&) = delete;

		auto begin(void) -> std::tuple<bool, std::optional<std::string>>;
		auto commit(void) -> std::tuple<bool, std::optional<std::string>>;
		auto is_active(void) const -> bool;

	private:
		SQLite& db_;
		TransactionMode mode_;
		bool active_;
	};
}
