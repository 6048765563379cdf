#include "Logger.h"

#include <fmt/format.h>

#include <ctime>
#include <filesystem>
#include <iostream>

namespace Utilities
{
	Logger::Logger(void)
		: file_mode_(LogTypes::None)
		, console_mode_(LogTypes::Information)
		, log_root_("./logs")
		, title_("taskqueue")
		, file_date_("")
	{
	}

	Logger::~Logger(void) { stop(); }

	auto Logger::handle(void) -> Logger&
	{
		static Logger instance;
		return instance;
	}

	auto Logger::file_mode(const LogTypes& type) -> void
	{
		std::lock_guard<std::mutex> lock(mutex_);
		file_mode_ = type;
	}

	auto Logger::console_mode(const LogTypes& type) -> void
	{
		std::lock_guard<std::mutex> lock(mutex_);
		console_mode_ = type;
	}

	auto Logger::log_root(const std::string& root) -> void
	{
		std::lock_guard<std::mutex> lock(mutex_);
		log_root_ = root;
	}

	auto Logger::start(const std::string& title) -> std::tuple<bool, std::optional<std::string>>
	{
		std::lock_guard<std::mutex> lock(mutex_);

		title_ = title;
		if (file_mode_ == LogTypes::None)
		{
			return { true, std::nullopt };
		}

		return open_file();
	}

	auto Logger::stop(void) -> void
	{
		std::lock_guard<std::mutex> lock(mutex_);

		if (file_.is_open())
		{
			file_.flush();
			file_.close();
		}
	}

	auto Logger::write(const LogTypes& type, const std::string& message) -> void
	{
		if (type == LogTypes::None)
		{
			return;
		}

		std::lock_guard<std::mutex> lock(mutex_);

		auto write_console = console_mode_ != LogTypes::None && type <= console_mode_;
		auto write_file = file_mode_ != LogTypes::None && type <= file_mode_;
		if (!write_console && !write_file)
		{
			return;
		}

		auto now = std::chrono::system_clock::now();
		auto line = fmt::format("[{}][{}] {}", timestamp(now), type_label(type), message);

		if (write_console)
		{
			if (type <= LogTypes::Error)
			{
				std::cerr << line << std::endl;
			}
			else
			{
				std::cout << line << std::endl;
			}
		}

		if (!write_file)
		{
			return;
		}

		// Roll over to a new file at midnight.
		if (!file_.is_open() || file_date_ != datestamp(now))
		{
			auto [opened, open_error] = open_file();
			if (!opened)
			{
				std::cerr << fmt::format("cannot open log file: {}", open_error.value_or("unknown")) << std::endl;
				return;
			}
		}

		file_ << line << '\n';
		if (type <= LogTypes::Error)
		{
			file_.flush();
		}
	}

	auto Logger::open_file(void) -> std::tuple<bool, std::optional<std::string>>
	{
		if (file_.is_open())
		{
			file_.close();
		}

		std::error_code error_code;
		std::filesystem::create_directories(log_root_, error_code);
		if (error_code)
		{
			return { false, error_code.message() };
		}

		file_date_ = datestamp(std::chrono::system_clock::now());
		auto path = std::filesystem::path(log_root_) / fmt::format("{}_{}.log", title_, file_date_);

		file_.open(path, std::ios::out | std::ios::app);
		if (!file_.is_open())
		{
			return { false, fmt::format("cannot open {}", path.string()) };
		}

		return { true, std::nullopt };
	}

	auto Logger::type_label(const LogTypes& type) const -> std::string
	{
		switch (type)
		{
		case LogTypes::Exception: return "EXCEPTION";
		case LogTypes::Error: return "ERROR";
		case LogTypes::Information: return "INFORMATION";
		case LogTypes::Debug: return "DEBUG";
		case LogTypes::Sequence: return "SEQUENCE";
		case LogTypes::Parameter: return "PARAMETER";
		default: return "NONE";
		}
	}

	auto Logger::timestamp(const std::chrono::system_clock::time_point& time) const -> std::string
	{
		auto seconds = std::chrono::system_clock::to_time_t(time);
		auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count() % 1000;

		std::tm local_time {};
		localtime_r(&seconds, &local_time);

		return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}.{:03}",
			local_time.tm_year + 1900, local_time.tm_mon + 1, local_time.tm_mday,
			local_time.tm_hour, local_time.tm_min, local_time.tm_sec, milliseconds);
	}

	auto Logger::datestamp(const std::chrono::system_clock::time_point& time) const -> std::string
	{
		auto seconds = std::chrono::system_clock::to_time_t(time);

		std::tm local_time {};
		localtime_r(&seconds, &local_time);

		return fmt::format("{:04}-{:02}-{:02}", local_time.tm_year + 1900, local_time.tm_mon + 1, local_time.tm_mday);
	}
}
