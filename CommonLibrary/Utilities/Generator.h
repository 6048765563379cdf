#pragma once

#include <string>

namespace Utilities
{
	class Generator
	{
	public:
		// Random RFC 4122 version 4 identifier, lower-case hex.
		static auto guid(void) -> std::string;
	};
}
