#pragma once

#include <chrono>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>

namespace Utilities
{
	enum class LogTypes
	{
		None = 0,
		Exception = 1,
		Error = 2,
		Information = 3,
		Debug = 4,
		Sequence = 5,
		Parameter = 6
	};

	class Logger
	{
	public:
		Logger(void);
		~Logger(void);

		Logger(const Logger&) = delete;
		Logger& operator=(const Logger&) = delete;

		auto file_mode(const LogTypes& type) -> void;
		auto console_mode(const LogTypes& type) -> void;
		auto log_root(const std::string& root) -> void;

		auto start(const std::string& title) -> std::tuple<bool, std::optional<std::string>>;
		auto stop(void) -> void;

		auto write(const LogTypes& type, const std::string& message) -> void;

	private:
		auto open_file(void) -> std::tuple<bool, std::optional<std::string>>;
		auto type_label(const LogTypes& type) const -> std::string;
		auto timestamp(const std::chrono::system_clock::time_point& time) const -> std::string;
		auto datestamp(const std::chrono::system_clock::time_point& time) const -> std::string;

	private:
		LogTypes file_mode_;
		LogTypes console_mode_;
		std::string log_root_;
		std::string title_;
		std::string file_date_;
		std::ofstream file_;
		std::mutex mutex_;

	public:
		static auto handle(void) -> Logger&;
	};
}
