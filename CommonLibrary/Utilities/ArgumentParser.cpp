#include "ArgumentParser.h"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <stdexcept>

namespace Utilities
{
	ArgumentParser::ArgumentParser(int argc, char* argv[]) : program_name_(""), program_folder_("")
	{
		parse(argc, argv);
	}

	ArgumentParser::~ArgumentParser(void) {}

	auto ArgumentParser::program_name(void) const -> std::string { return program_name_; }

	auto ArgumentParser::program_folder(void) const -> std::string { return program_folder_; }

	auto ArgumentParser::positional(void) const -> std::vector<std::string> { return positional_; }

	auto ArgumentParser::contains(const std::string& key) const -> bool { return named_.find(key) != named_.end(); }

	auto ArgumentParser::to_string(const std::string& key) const -> std::optional<std::string>
	{
		auto iter = named_.find(key);
		if (iter == named_.end() || iter->second.empty())
		{
			return std::nullopt;
		}

		return iter->second;
	}

	auto ArgumentParser::to_int(const std::string& key) const -> std::optional<int>
	{
		auto value = to_string(key);
		if (!value.has_value())
		{
			return std::nullopt;
		}

		try
		{
			return std::stoi(value.value());
		}
		catch (const std::logic_error&)
		{
			return std::nullopt;
		}
	}

	auto ArgumentParser::to_llong(const std::string& key) const -> std::optional<long long>
	{
		auto value = to_string(key);
		if (!value.has_value())
		{
			return std::nullopt;
		}

		try
		{
			return std::stoll(value.value());
		}
		catch (const std::logic_error&)
		{
			return std::nullopt;
		}
	}

	auto ArgumentParser::to_double(const std::string& key) const -> std::optional<double>
	{
		auto value = to_string(key);
		if (!value.has_value())
		{
			return std::nullopt;
		}

		try
		{
			return std::stod(value.value());
		}
		catch (const std::logic_error&)
		{
			return std::nullopt;
		}
	}

	auto ArgumentParser::to_bool(const std::string& key) const -> std::optional<bool>
	{
		auto iter = named_.find(key);
		if (iter == named_.end())
		{
			return std::nullopt;
		}

		// A bare switch counts as true.
		if (iter->second.empty())
		{
			return true;
		}

		auto value = iter->second;
		std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

		if (value == "true" || value == "1" || value == "yes" || value == "on")
		{
			return true;
		}

		if (value == "false" || value == "0" || value == "no" || value == "off")
		{
			return false;
		}

		return std::nullopt;
	}

	auto ArgumentParser::parse(int argc, char* argv[]) -> void
	{
		if (argc <= 0 || argv == nullptr || argv[0] == nullptr)
		{
			return;
		}

		std::filesystem::path program(argv[0]);
		program_name_ = program.filename().string();

		std::error_code error_code;
		auto absolute = std::filesystem::absolute(program, error_code);
		if (!error_code && absolute.has_parent_path())
		{
			program_folder_ = absolute.parent_path().string() + "/";
		}

		for (int index = 1; index < argc; ++index)
		{
			std::string token = argv[index] ? argv[index] : "";
			if (token.size() <= 2 || token.rfind("--", 0) != 0)
			{
				positional_.push_back(token);
				continue;
			}

			auto separator = token.find('=');
			if (separator != std::string::npos)
			{
				named_[token.substr(0, separator)] = token.substr(separator + 1);
				continue;
			}

			if (index + 1 < argc && argv[index + 1] != nullptr && std::string(argv[index + 1]).rfind("--", 0) != 0)
			{
				named_[token] = argv[index + 1];
				++index;
				continue;
			}

			named_[token] = "";
		}
	}
}
