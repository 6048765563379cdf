#pragma once

#include <cstdint>

class Clock
{
public:
	virtual ~Clock(void) = default;

	// Milliseconds since the Unix epoch.
	virtual auto now_ms(void) const -> int64_t = 0;
};

class SystemClock : public Clock
{
public:
	auto now_ms(void) const -> int64_t override;
};
