#include "TaskTypes.h"

auto status_to_string(const TaskStatus& status) -> std::string
{
	switch (status)
	{
	case TaskStatus::Queued: return "queued";
	case TaskStatus::Leased: return "claimed";
	case TaskStatus::Running: return "running";
	case TaskStatus::Completed: return "completed";
	case TaskStatus::Failed: return "failed";
	case TaskStatus::Cancelled: return "cancelled";
	default: return "unknown";
	}
}

auto string_to_status(const std::string& status) -> std::optional<TaskStatus>
{
	if (status == "queued") return TaskStatus::Queued;
	if (status == "claimed" || status == "leased") return TaskStatus::Leased;
	if (status == "running") return TaskStatus::Running;
	if (status == "completed") return TaskStatus::Completed;
	if (status == "failed") return TaskStatus::Failed;
	if (status == "cancelled") return TaskStatus::Cancelled;
	return std::nullopt;
}

auto is_terminal(const TaskStatus& status) -> bool
{
	return status == TaskStatus::Completed || status == TaskStatus::Failed || status == TaskStatus::Cancelled;
}

auto event_to_string(const TaskEvent& event) -> std::string
{
	switch (event)
	{
	case TaskEvent::Created: return "created";
	case TaskEvent::Claimed: return "claimed";
	case TaskEvent::Started: return "started";
	case TaskEvent::Progress: return "progress";
	case TaskEvent::Completed: return "completed";
	case TaskEvent::Failed: return "failed";
	case TaskEvent::Retry: return "retry";
	case TaskEvent::Cancelled: return "cancelled";
	default: return "unknown";
	}
}

auto string_to_event(const std::string& event) -> std::optional<TaskEvent>
{
	if (event == "created") return TaskEvent::Created;
	if (event == "claimed") return TaskEvent::Claimed;
	if (event == "started") return TaskEvent::Started;
	if (event == "progress") return TaskEvent::Progress;
	if (event == "completed") return TaskEvent::Completed;
	if (event == "failed") return TaskEvent::Failed;
	if (event == "retry") return TaskEvent::Retry;
	if (event == "cancelled") return TaskEvent::Cancelled;
	return std::nullopt;
}

auto worker_state_to_string(const WorkerState& state) -> std::string
{
	switch (state)
	{
	case WorkerState::Active: return "active";
	case WorkerState::Stale: return "stale";
	case WorkerState::Stopped: return "stopped";
	default: return "unknown";
	}
}

auto string_to_worker_state(const std::string& state) -> WorkerState
{
	if (state == "stale") return WorkerState::Stale;
	if (state == "stopped") return WorkerState::Stopped;
	return WorkerState::Active;
}

auto error_type_to_string(const QueueErrorType& type) -> std::string
{
	switch (type)
	{
	case QueueErrorType::Validation: return "validation";
	case QueueErrorType::NotFound: return "not_found";
	case QueueErrorType::Conflict: return "conflict";
	case QueueErrorType::LeaseLost: return "lease_lost";
	case QueueErrorType::Busy: return "busy";
	case QueueErrorType::Storage: return "storage";
	case QueueErrorType::Closed: return "closed";
	default: return "unknown";
	}
}
