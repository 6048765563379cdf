#include "ClaimStrategy.h"

#include "OrderedClaimStrategy.h"
#include "WeightedRandomStrategy.h"

#include <fmt/format.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cctype>

auto ClaimStrategy::claim(QueueStore& store, const std::string& worker_id, const int32_t& lease_seconds) -> ClaimResult
{
	return store.claim(worker_id, lease_seconds, name(),
		[this](DataBase::SQLite& db, const int64_t& now_ms) { return select_candidate(db, now_ms); });
}

auto ClaimStrategy::name(void) const -> std::string { return strategy_to_string(type()); }

auto strategy_to_string(const StrategyType& type) -> std::string
{
	switch (type)
	{
	case StrategyType::Fifo: return "FIFO";
	case StrategyType::Lifo: return "LIFO";
	case StrategyType::Priority: return "PRIORITY";
	case StrategyType::WeightedRandom: return "WEIGHTED_RANDOM";
	default: return "UNKNOWN";
	}
}

auto string_to_strategy(const std::string& name) -> std::optional<StrategyType>
{
	std::string upper = name;
	std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

	if (upper == "FIFO") return StrategyType::Fifo;
	if (upper == "LIFO") return StrategyType::Lifo;
	if (upper == "PRIORITY") return StrategyType::Priority;
	if (upper == "WEIGHTED_RANDOM") return StrategyType::WeightedRandom;
	return std::nullopt;
}

auto available_strategies(void) -> std::vector<std::string>
{
	return { "FIFO", "LIFO", "PRIORITY", "WEIGHTED_RANDOM" };
}

auto make_claim_strategy(const StrategyType& type) -> std::unique_ptr<ClaimStrategy>
{
	switch (type)
	{
	case StrategyType::Fifo: return std::make_unique<FifoStrategy>();
	case StrategyType::Priority: return std::make_unique<PriorityStrategy>();
	case StrategyType::WeightedRandom: return std::make_unique<WeightedRandomStrategy>();
	case StrategyType::Lifo:
	default: return std::make_unique<LifoStrategy>();
	}
}

auto make_claim_strategy(const std::string& name) -> std::tuple<std::unique_ptr<ClaimStrategy>, std::optional<QueueError>>
{
	auto type = string_to_strategy(name);
	if (!type.has_value())
	{
		return { nullptr, QueueError{ QueueErrorType::Validation,
			fmt::format("unknown strategy '{}', expected one of {}", name, fmt::join(available_strategies(), ", ")) } };
	}

	return { make_claim_strategy(type.value()), std::nullopt };
}
