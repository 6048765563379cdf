#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Utilities
{
	// Parses "--key value" pairs and bare "--flag" switches; anything else is positional.
	class ArgumentParser
	{
	public:
		ArgumentParser(int argc, char* argv[]);
		~ArgumentParser(void);

		auto program_name(void) const -> std::string;
		auto program_folder(void) const -> std::string;

		auto positional(void) const -> std::vector<std::string>;
		auto contains(const std::string& key) const -> bool;

		auto to_string(const std::string& key) const -> std::optional<std::string>;
		auto to_int(const std::string& key) const -> std::optional<int>;
		auto to_llong(const std::string& key) const -> std::optional<long long>;
		auto to_double(const std::string& key) const -> std::optional<double>;
		auto to_bool(const std::string& key) const -> std::optional<bool>;

	private:
		auto parse(int argc, char* argv[]) -> void;

	private:
		std::string program_name_;
		std::string program_folder_;
		std::map<std::string, std::string> named_;
		std::vector<std::string> positional_;
	};
}
