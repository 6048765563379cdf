#pragma once

#include "ClaimStrategy.h"

// Takes the first eligible row of a fixed ORDER BY.
class OrderedClaimStrategy : public ClaimStrategy
{
public:
	auto select_candidate(DataBase::SQLite& db, const int64_t& now_ms)
		-> std::tuple<std::optional<int64_t>, std::optional<QueueError>> override;

protected:
	virtual auto order_by_clause(void) const -> std::string = 0;
};

// Oldest first.
class FifoStrategy : public OrderedClaimStrategy
{
public:
	auto type(void) const -> StrategyType override { return StrategyType::Fifo; }

protected:
	auto order_by_clause(void) const -> std::string override { return "created_at ASC, id ASC"; }
};

// Newest first; the default for workers.
class LifoStrategy : public OrderedClaimStrategy
{
public:
	auto type(void) const -> StrategyType override { return StrategyType::Lifo; }

protected:
	auto order_by_clause(void) const -> std::string override { return "created_at DESC, id DESC"; }
};

// Lowest priority number first, oldest first within a level.
class PriorityStrategy : public OrderedClaimStrategy
{
public:
	auto type(void) const -> StrategyType override { return StrategyType::Priority; }

protected:
	auto order_by_clause(void) const -> std::string override { return "priority ASC, created_at ASC, id ASC"; }
};
