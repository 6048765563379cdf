#include "TaskExecutor.h"

#include "Logger.h"

#include <fmt/format.h>

auto ExecutionResult::succeeded(const std::string& result_json) -> ExecutionResult
{
	ExecutionResult result;
	result.success = true;
	result.result_json = result_json;

	return result;
}

auto ExecutionResult::failed(const std::string& error_message, const bool& retryable) -> ExecutionResult
{
	ExecutionResult result;
	result.success = false;
	result.error_message = error_message;
	result.retryable = retryable;

	return result;
}

ExecutionContext::ExecutionContext(QueueStore& store, const LeaseToken& lease)
	: store_(store), lease_(lease), cancelled_(false), lease_lost_(false)
{
}

auto ExecutionContext::task_id(void) const -> int64_t { return lease_.task_id; }

auto ExecutionContext::worker_id(void) const -> std::string { return lease_.worker_id; }

auto ExecutionContext::checkpoint(void) -> bool
{
	if (cancelled_.load() || lease_lost_.load())
	{
		return false;
	}

	auto [task, error] = store_.get(lease_.task_id);
	if (error.has_value())
	{
		if (error->type == QueueErrorType::NotFound)
		{
			lease_lost_.store(true);
			return false;
		}

		// Transient storage trouble; the commit itself is lease-guarded.
		Utilities::Logger::handle().write(Utilities::LogTypes::Debug,
			fmt::format("checkpoint for task {} could not read status: {}", lease_.task_id, error->message));
		return true;
	}

	if (task->status == TaskStatus::Cancelled && task->lease_token == lease_.token)
	{
		cancelled_.store(true);
		return false;
	}

	bool owned = (task->status == TaskStatus::Leased || task->status == TaskStatus::Running)
		&& task->lease_token == lease_.token && task->claimed_by == lease_.worker_id;
	if (!owned || task->lease_until_ms.value_or(0) < store_.now_ms())
	{
		lease_lost_.store(true);
		return false;
	}

	return true;
}

auto ExecutionContext::report_progress(const std::string& message, const std::string& details_json)
	-> std::tuple<bool, std::optional<QueueError>>
{
	TaskLogEntry entry;
	entry.task_id = lease_.task_id;
	entry.worker_id = lease_.worker_id;
	entry.event = TaskEvent::Progress;
	entry.message = message;
	entry.details_json = details_json;

	auto [log_id, error] = store_.append_log(entry);
	if (error.has_value())
	{
		return { false, error };
	}

	return { true, std::nullopt };
}

auto ExecutionContext::is_cancelled(void) const -> bool { return cancelled_.load(); }

auto ExecutionContext::is_lease_lost(void) const -> bool { return lease_lost_.load(); }

auto ExecutionContext::mark_cancelled(void) -> void { cancelled_.store(true); }

auto ExecutionContext::mark_lease_lost(void) -> void { lease_lost_.store(true); }

FunctionExecutor::FunctionExecutor(Handler handler) : handler_(std::move(handler)) {}

auto FunctionExecutor::execute(const Task& task, ExecutionContext& context) -> ExecutionResult
{
	if (!handler_)
	{
		return ExecutionResult::failed("executor has no handler", false);
	}

	return handler_(task, context);
}

auto ExecutorRegistry::register_executor(const std::string& task_type, std::shared_ptr<TaskExecutor> executor) -> void
{
	std::lock_guard<std::mutex> lock(mutex_);

	if (executors_.find(task_type) != executors_.end())
	{
		Utilities::Logger::handle().write(Utilities::LogTypes::Information,
			fmt::format("executor for task type '{}' replaced", task_type));
	}

	executors_[task_type] = executor;
}

auto ExecutorRegistry::register_handler(const std::string& task_type, FunctionExecutor::Handler handler) -> void
{
	register_executor(task_type, std::make_shared<FunctionExecutor>(std::move(handler)));
}

auto ExecutorRegistry::find(const std::string& task_type) const -> std::shared_ptr<TaskExecutor>
{
	std::lock_guard<std::mutex> lock(mutex_);

	auto iter = executors_.find(task_type);
	if (iter == executors_.end())
	{
		return nullptr;
	}

	return iter->second;
}

auto ExecutorRegistry::task_types(void) const -> std::vector<std::string>
{
	std::lock_guard<std::mutex> lock(mutex_);

	std::vector<std::string> types;
	for (const auto& [task_type, executor] : executors_)
	{
		types.push_back(task_type);
	}

	return types;
}
