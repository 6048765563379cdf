#pragma once

#include "Clock.h"
#include "Generator.h"
#include "Logger.h"
#include "QueueStore.h"
#include "TaskTypes.h"

#include <fmt/format.h>

#include <atomic>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

// Unique directory under the system temp path, removed with everything in it.
class TempDir
{
public:
	TempDir(const std::string& prefix = "taskqueue_test_")
	{
		path_ = std::filesystem::temp_directory_path() / (prefix + Utilities::Generator::guid());
		std::filesystem::create_directories(path_);
	}

	~TempDir()
	{
		std::error_code ec;
		std::filesystem::remove_all(path_, ec);
	}

	TempDir(const TempDir&) = delete;
	TempDir& operator=(const TempDir&) = delete;

	auto path() const -> std::string { return path_.string(); }

private:
	std::filesystem::path path_;
};

// Clock that only moves when told to, so lease expiry can be tested without sleeping
class ManualClock : public Clock
{
public:
	ManualClock(const int64_t& start_ms = 1700000000000) : now_(start_ms) {}

	auto now_ms(void) const -> int64_t override { return now_.load(); }

	auto advance(const int64_t& delta_ms) -> void { now_.fetch_add(delta_ms); }
	auto set(const int64_t& now_ms) -> void { now_.store(now_ms); }

private:
	std::atomic<int64_t> now_;
};

// Helper: store config pointing to a temp directory
inline auto make_store_config(const std::string& temp_dir, const std::string& file_name = "queue.db") -> StoreConfig
{
	StoreConfig config;
	config.db_path = temp_dir + "/" + file_name;
	config.busy_timeout_ms = 5000;
	config.journal_mode = "WAL";
	config.synchronous = "NORMAL";
	config.write_retry_attempts = 10;
	config.write_retry_base_delay_ms = 5;
	config.write_retry_max_delay_ms = 200;
	return config;
}

// Helper: enqueue request with the given type and priority
inline auto make_request(const std::string& task_type = "test_task", const std::optional<int32_t>& priority = std::nullopt,
	const std::string& parameters_json = R"({"data":"test"})") -> EnqueueRequest
{
	EnqueueRequest request;
	request.task_type = task_type;
	request.parameters_json = parameters_json;
	request.priority = priority;
	return request;
}

// Helper: printable form of an optional queue error
inline auto describe(const std::optional<QueueError>& error) -> std::string
{
	if (!error.has_value())
	{
		return "no error";
	}

	return fmt::format("[{}] {}", error_type_to_string(error->type), error->message);
}

// Helper: initialize logger for tests (silent mode)
inline auto init_test_logger() -> void
{
	static bool initialized = false;
	if (!initialized)
	{
		Utilities::Logger::handle().console_mode(Utilities::LogTypes::None);
		Utilities::Logger::handle().file_mode(Utilities::LogTypes::None);
		initialized = true;
	}
}
