#pragma once

#include "QueueStore.h"
#include "TaskTypes.h"

#include "SQLite.h"

#include <memory>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

enum class StrategyType
{
	Fifo,
	Lifo,
	Priority,
	WeightedRandom
};

// A claim policy. Subclasses only decide which eligible task to take; the
// transaction, the guarded UPDATE and the audit entry live in QueueStore::claim.
class ClaimStrategy
{
public:
	virtual ~ClaimStrategy(void) = default;

	auto claim(QueueStore& store, const std::string& worker_id, const int32_t& lease_seconds) -> ClaimResult;

	virtual auto type(void) const -> StrategyType = 0;
	auto name(void) const -> std::string;

	// Runs inside the claim transaction; eligible means status = 'queued' and run_after <= now_ms.
	virtual auto select_candidate(DataBase::SQLite& db, const int64_t& now_ms)
		-> std::tuple<std::optional<int64_t>, std::optional<QueueError>> = 0;
};

auto strategy_to_string(const StrategyType& type) -> std::string;
auto string_to_strategy(const std::string& name) -> std::optional<StrategyType>;
auto available_strategies(void) -> std::vector<std::string>;

auto make_claim_strategy(const StrategyType& type) -> std::unique_ptr<ClaimStrategy>;
auto make_claim_strategy(const std::string& name) -> std::tuple<std::unique_ptr<ClaimStrategy>, std::optional<QueueError>>;
