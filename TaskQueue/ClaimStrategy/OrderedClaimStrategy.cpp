#include "OrderedClaimStrategy.h"

#include <fmt/format.h>
#include <sqlite3.h>

auto OrderedClaimStrategy::select_candidate(DataBase::SQLite& db, const int64_t& now_ms)
	-> std::tuple<std::optional<int64_t>, std::optional<QueueError>>
{
	auto [stmt, error] = db.prepare(fmt::format(
		"SELECT id FROM task_queue WHERE status = 'queued' AND run_after <= ? ORDER BY {} LIMIT 1;", order_by_clause()));
	if (!stmt)
	{
		return { std::nullopt, make_storage_error(db, fmt::format("prepare {} selection", name())) };
	}

	stmt->bind_int64(1, now_ms);

	auto result = stmt->step();
	if (result == SQLITE_DONE)
	{
		return { std::nullopt, std::nullopt };
	}
	if (result != SQLITE_ROW)
	{
		return { std::nullopt, make_storage_error(db, fmt::format("{} selection", name())) };
	}

	return { stmt->column_int64(0), std::nullopt };
}
