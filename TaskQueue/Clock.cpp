#include "Clock.h"

#include <chrono>

auto SystemClock::now_ms(void) const -> int64_t
{
	return std::chrono::duration_cast<std::chrono::milliseconds>(
		std::chrono::system_clock::now().time_since_epoch()
	).count();
}
