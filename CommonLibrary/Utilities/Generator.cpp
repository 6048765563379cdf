#include "Generator.h"

#include <fmt/format.h>

#include <cstdint>
#include <random>

namespace Utilities
{
	auto Generator::guid(void) -> std::string
	{
		thread_local std::mt19937_64 engine(std::random_device {}());
		std::uniform_int_distribution<uint64_t> distribution;

		auto high = distribution(engine);
		auto low = distribution(engine);

		high = (high & 0xffffffffffff0fffULL) | 0x0000000000004000ULL;
		low = (low & 0x3fffffffffffffffULL) | 0x8000000000000000ULL;

		return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
			static_cast<uint32_t>(high >> 32),
			static_cast<uint16_t>((high >> 16) & 0xffff),
			static_cast<uint16_t>(high & 0xffff),
			static_cast<uint16_t>(low >> 48),
			low & 0x0000ffffffffffffULL);
	}
}
