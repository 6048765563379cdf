#include "TestHelpers.h"
#include "SQLite.h"
#include <gtest/gtest.h>
#include <sqlite3.h>
#include <filesystem>

namespace fs = std::filesystem;

class SQLiteTest : public ::testing::Test
{
protected:
	void SetUp() override
	{
		init_test_logger();

		temp_dir_ = std::make_unique<TempDir>("sqlite_wrapper_test_");
		db_path_ = temp_dir_->path() + "/wrapper.db";

		auto [ok, err] = db_.open(db_path_);
		ASSERT_TRUE(ok) << "Failed to open database: " << err.value_or("unknown");

		auto [created, create_err] = db_.execute("CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT, score INTEGER);");
		ASSERT_TRUE(created) << create_err.value_or("unknown");
	}

	void TearDown() override
	{
		db_.close();
		temp_dir_.reset();
	}

	std::unique_ptr<TempDir> temp_dir_;
	std::string db_path_;
	DataBase::SQLite db_;
};

// ---------------------------------------------------------------------------
// Connection tests
// ---------------------------------------------------------------------------

TEST_F(SQLiteTest, OpenCreatesFile)
{
	EXPECT_TRUE(db_.is_open());
	EXPECT_TRUE(fs::exists(db_path_));
}

TEST_F(SQLiteTest, OpenWithEmptyPathFails)
{
	DataBase::SQLite other;
	auto [ok, err] = other.open("");
	EXPECT_FALSE(ok);
	EXPECT_TRUE(err.has_value());
	EXPECT_FALSE(other.is_open());
}

TEST_F(SQLiteTest, ExecuteOnClosedConnectionFails)
{
	DataBase::SQLite closed;
	auto [ok, err] = closed.execute("SELECT 1;");
	EXPECT_FALSE(ok);
	EXPECT_EQ(err.value_or(""), "database is not open");
}

// ---------------------------------------------------------------------------
// Statement tests
// ---------------------------------------------------------------------------

TEST_F(SQLiteTest, PrepareBindAndStep)
{
	auto [insert, insert_err] = db_.prepare("INSERT INTO items (name, score) VALUES (?, ?);");
	ASSERT_TRUE(insert) << insert_err.value_or("unknown");

	insert->bind_text(1, "alpha");
	insert->bind_int(2, 42);
	EXPECT_EQ(insert->step(), SQLITE_DONE);
	EXPECT_EQ(db_.changes(), 1);
	EXPECT_EQ(db_.last_insert_rowid(), 1);

	auto [select, select_err] = db_.prepare("SELECT name, score FROM items WHERE id = ?;");
	ASSERT_TRUE(select) << select_err.value_or("unknown");

	select->bind_int64(1, 1);
	ASSERT_EQ(select->step(), SQLITE_ROW);
	EXPECT_EQ(select->column_text(0), "alpha");
	EXPECT_EQ(select->column_int(1), 42);
	EXPECT_EQ(select->column_name(0), "name");
	EXPECT_EQ(select->column_count(), 2);
	EXPECT_EQ(select->step(), SQLITE_DONE);
}

TEST_F(SQLiteTest, OptionalBindingsStoreNull)
{
	auto [insert, insert_err] = db_.prepare("INSERT INTO items (name, score) VALUES (?, ?);");
	ASSERT_TRUE(insert);

	insert->bind_optional_text(1, std::nullopt);
	insert->bind_optional_int64(2, std::nullopt);
	ASSERT_EQ(insert->step(), SQLITE_DONE);

	auto [select, select_err] = db_.prepare("SELECT name, score FROM items;");
	ASSERT_TRUE(select);
	ASSERT_EQ(select->step(), SQLITE_ROW);

	EXPECT_TRUE(select->column_is_null(0));
	EXPECT_FALSE(select->column_optional_text(0).has_value());
	EXPECT_FALSE(select->column_optional_int64(1).has_value());
}

TEST_F(SQLiteTest, PrepareInvalidSqlFails)
{
	auto [stmt, err] = db_.prepare("SELECT * FROM missing_table;");
	EXPECT_FALSE(stmt);
	EXPECT_TRUE(err.has_value());
}

TEST_F(SQLiteTest, QueryReturnsColumnsAndRows)
{
	db_.execute("INSERT INTO items (name, score) VALUES ('a', 1), ('b', 2);");

	auto [result, err] = db_.query("SELECT name, score FROM items ORDER BY id;");
	ASSERT_TRUE(result.has_value()) << err.value_or("unknown");

	ASSERT_EQ(result->columns.size(), 2u);
	EXPECT_EQ(result->columns[0], "name");
	ASSERT_EQ(result->rows.size(), 2u);
	EXPECT_EQ(result->rows[1][0], "b");
	EXPECT_EQ(result->rows[1][1], "2");
}

TEST_F(SQLiteTest, PragmaReadsSingleValue)
{
	db_.execute("PRAGMA user_version = 7;");

	auto [value, err] = db_.pragma("user_version");
	ASSERT_TRUE(value.has_value()) << err.value_or("unknown");
	EXPECT_EQ(value.value(), "7");
}

// ---------------------------------------------------------------------------
// Transaction tests
// ---------------------------------------------------------------------------

TEST_F(SQLiteTest, RollbackDiscardsChanges)
{
	auto [began, begin_err] = db_.begin_transaction(DataBase::TransactionMode::Immediate);
	ASSERT_TRUE(began) << begin_err.value_or("unknown");
	EXPECT_TRUE(db_.in_transaction());

	db_.execute("INSERT INTO items (name, score) VALUES ('gone', 0);");

	auto [rolled_back, rollback_err] = db_.rollback();
	EXPECT_TRUE(rolled_back) << rollback_err.value_or("unknown");
	EXPECT_FALSE(db_.in_transaction());

	auto [result, err] = db_.query("SELECT COUNT(*) FROM items;");
	ASSERT_TRUE(result.has_value());
	EXPECT_EQ(result->rows[0][0], "0");
}

TEST_F(SQLiteTest, CommitKeepsChanges)
{
	db_.begin_transaction(DataBase::TransactionMode::Deferred);
	db_.execute("INSERT INTO items (name, score) VALUES ('kept', 1);");

	auto [committed, commit_err] = db_.commit();
	ASSERT_TRUE(committed) << commit_err.value_or("unknown");

	auto [result, err] = db_.query("SELECT name FROM items;");
	ASSERT_TRUE(result.has_value());
	ASSERT_EQ(result->rows.size(), 1u);
	EXPECT_EQ(result->rows[0][0], "kept");
}

TEST_F(SQLiteTest, RollbackOutsideTransactionIsNoop)
{
	auto [ok, err] = db_.rollback();
	EXPECT_TRUE(ok);
	EXPECT_FALSE(err.has_value());
}

TEST_F(SQLiteTest, ScopedTransactionRollsBackUnlessCommitted)
{
	{
		DataBase::Transaction transaction(db_);
		auto [began, begin_err] = transaction.begin();
		ASSERT_TRUE(began) << begin_err.value_or("unknown");
		EXPECT_TRUE(transaction.is_active());

		db_.execute("INSERT INTO items (name, score) VALUES ('dropped', 0);");
	}
	EXPECT_FALSE(db_.in_transaction());

	{
		DataBase::Transaction transaction(db_, DataBase::TransactionMode::Deferred);
		transaction.begin();
		db_.execute("INSERT INTO items (name, score) VALUES ('kept', 1);");

		auto [committed, commit_err] = transaction.commit();
		ASSERT_TRUE(committed) << commit_err.value_or("unknown");
		EXPECT_FALSE(transaction.is_active());

		auto [again, again_err] = transaction.commit();
		EXPECT_FALSE(again);
	}

	auto [result, err] = db_.query("SELECT name FROM items;");
	ASSERT_TRUE(result.has_value()) << err.value_or("unknown");
	ASSERT_EQ(result->rows.size(), 1u);
	EXPECT_EQ(result->rows[0][0], "kept");
}

TEST_F(SQLiteTest, QueryOnEmptyTableStillReportsColumns)
{
	auto [result, err] = db_.query("SELECT id, name FROM items;");
	ASSERT_TRUE(result.has_value()) << err.value_or("unknown");
	EXPECT_EQ(result->columns, (std::vector<std::string>{ "id", "name" }));
	EXPECT_TRUE(result->rows.empty());
}

TEST_F(SQLiteTest, SecondWriterReportsBusy)
{
	DataBase::SQLite other;
	auto [opened, open_err] = other.open(db_path_);
	ASSERT_TRUE(opened) << open_err.value_or("unknown");
	other.set_busy_timeout(0);

	auto [began, begin_err] = db_.begin_transaction(DataBase::TransactionMode::Immediate);
	ASSERT_TRUE(began) << begin_err.value_or("unknown");

	auto [other_began, other_err] = other.begin_transaction(DataBase::TransactionMode::Immediate);
	EXPECT_FALSE(other_began);
	EXPECT_TRUE(other.is_busy()) << "error code " << other.last_error_code();

	db_.rollback();
	other.close();
}
