#pragma once

#include "ClaimStrategy.h"

#include <mutex>
#include <random>

// Draws a task with probability proportional to 1 / (priority + 1): a priority level
// is chosen by count / (priority + 1), then a task uniformly within that level.
class WeightedRandomStrategy : public ClaimStrategy
{
public:
	WeightedRandomStrategy(void);
	WeightedRandomStrategy(const uint64_t& seed);

	auto type(void) const -> StrategyType override { return StrategyType::WeightedRandom; }

	auto select_candidate(DataBase::SQLite& db, const int64_t& now_ms)
		-> std::tuple<std::optional<int64_t>, std::optional<QueueError>> override;

private:
	std::mt19937_64 engine_;
	std::mutex engine_mutex_;
};
