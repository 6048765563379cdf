#pragma once

#include "QueueStore.h"
#include "TaskTypes.h"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

struct ExecutionResult
{
	bool success = false;
	std::string result_json = "{}";
	std::string error_message;
	bool retryable = true;

	static auto succeeded(const std::string& result_json = "{}") -> ExecutionResult;
	static auto failed(const std::string& error_message, const bool& retryable = true) -> ExecutionResult;
};

// Handed to an executor for the duration of one task. checkpoint() is the
// cooperative stop point: it returns false once the task was cancelled or the
// lease moved to someone else.
class ExecutionContext
{
public:
	ExecutionContext(QueueStore& store, const LeaseToken& lease);

	auto task_id(void) const -> int64_t;
	auto worker_id(void) const -> std::string;

	auto checkpoint(void) -> bool;
	auto report_progress(const std::string& message, const std::string& details_json = "{}")
		-> std::tuple<bool, std::optional<QueueError>>;

	auto is_cancelled(void) const -> bool;
	auto is_lease_lost(void) const -> bool;
	auto mark_cancelled(void) -> void;
	auto mark_lease_lost(void) -> void;

private:
	QueueStore& store_;
	LeaseToken lease_;
	std::atomic<bool> cancelled_;
	std::atomic<bool> lease_lost_;
};

class TaskExecutor
{
public:
	virtual ~TaskExecutor(void) = default;

	virtual auto execute(const Task& task, ExecutionContext& context) -> ExecutionResult = 0;
};

class FunctionExecutor : public TaskExecutor
{
public:
	using Handler = std::function<ExecutionResult(const Task&, ExecutionContext&)>;

	FunctionExecutor(Handler handler);

	auto execute(const Task& task, ExecutionContext& context) -> ExecutionResult override;

private:
	Handler handler_;
};

class ExecutorRegistry
{
public:
	auto register_executor(const std::string& task_type, std::shared_ptr<TaskExecutor> executor) -> void;
	auto register_handler(const std::string& task_type, FunctionExecutor::Handler handler) -> void;

	auto find(const std::string& task_type) const -> std::shared_ptr<TaskExecutor>;
	auto task_types(void) const -> std::vector<std::string>;

private:
	std::map<std::string, std::shared_ptr<TaskExecutor>> executors_;
	mutable std::mutex mutex_;
};
