#include "WeightedRandomStrategy.h"

#include <fmt/format.h>
#include <sqlite3.h>

#include <vector>

WeightedRandomStrategy::WeightedRandomStrategy(void) : engine_(std::random_device{}()) {}

WeightedRandomStrategy::WeightedRandomStrategy(const uint64_t& seed) : engine_(seed) {}

auto WeightedRandomStrategy::select_candidate(DataBase::SQLite& db, const int64_t& now_ms)
	-> std::tuple<std::optional<int64_t>, std::optional<QueueError>>
{
	auto [buckets_stmt, buckets_error] = db.prepare(
		"SELECT priority, COUNT(*) FROM task_queue WHERE status = 'queued' AND run_after <= ? GROUP BY priority ORDER BY priority;");
	if (!buckets_stmt)
	{
		return { std::nullopt, make_storage_error(db, "prepare weighted bucket scan") };
	}

	buckets_stmt->bind_int64(1, now_ms);

	std::vector<int32_t> priorities;
	std::vector<int64_t> counts;
	std::vector<double> weights;

	int result;
	while ((result = buckets_stmt->step()) == SQLITE_ROW)
	{
		auto priority = buckets_stmt->column_int(0);
		auto count = buckets_stmt->column_int64(1);

		priorities.push_back(priority);
		counts.push_back(count);
		weights.push_back(static_cast<double>(count) / static_cast<double>(priority + 1));
	}
	if (result != SQLITE_DONE)
	{
		return { std::nullopt, make_storage_error(db, "weighted bucket scan") };
	}
	buckets_stmt->finalize();

	if (priorities.empty())
	{
		return { std::nullopt, std::nullopt };
	}

	size_t bucket = 0;
	int64_t offset = 0;
	{
		std::lock_guard<std::mutex> lock(engine_mutex_);

		std::discrete_distribution<size_t> pick_bucket(weights.begin(), weights.end());
		bucket = pick_bucket(engine_);

		std::uniform_int_distribution<int64_t> pick_offset(0, counts[bucket] - 1);
		offset = pick_offset(engine_);
	}

	auto [stmt, error] = db.prepare(
		"SELECT id FROM task_queue WHERE status = 'queued' AND run_after <= ? AND priority = ? ORDER BY id LIMIT 1 OFFSET ?;");
	if (!stmt)
	{
		return { std::nullopt, make_storage_error(db, "prepare weighted selection") };
	}

	stmt->bind_int64(1, now_ms);
	stmt->bind_int(2, priorities[bucket]);
	stmt->bind_int64(3, offset);

	result = stmt->step();
	if (result == SQLITE_DONE)
	{
		return { std::nullopt, std::nullopt };
	}
	if (result != SQLITE_ROW)
	{
		return { std::nullopt, make_storage_error(db, fmt::format("weighted selection at priority {}", priorities[bucket])) };
	}

	return { stmt->column_int64(0), std::nullopt };
}
