#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

enum class TaskStatus
{
	Queued,
	Leased,
	Running,
	Completed,
	Failed,
	Cancelled
};

enum class TaskEvent
{
	Created,
	Claimed,
	Started,
	Progress,
	Completed,
	Failed,
	Retry,
	Cancelled
};

enum class WorkerState
{
	Active,
	Stale,
	Stopped
};

enum class QueueErrorType
{
	Validation,
	NotFound,
	Conflict,
	LeaseLost,
	Busy,
	Storage,
	Closed
};

struct QueueError
{
	QueueErrorType type = QueueErrorType::Storage;
	std::string message;
};

struct StoreConfig
{
	std::string db_path;
	int32_t busy_timeout_ms = 5000;
	std::string journal_mode = "WAL";
	std::string synchronous = "NORMAL";
	std::string temp_store = "MEMORY";
	int32_t cache_size_kb = 10000;
	int32_t wal_autocheckpoint = 1000;

	int32_t write_retry_attempts = 5;
	int32_t write_retry_base_delay_ms = 25;
	int32_t write_retry_max_delay_ms = 1000;

	int32_t min_priority = 1;
	int32_t max_priority = 10;
	int32_t default_priority = 5;
	int32_t default_max_retries = 3;
	int64_t retry_delay_ms = 0;
};

struct Task
{
	int64_t id = 0;
	std::string task_type;
	std::string parameters_json = "{}";
	int32_t priority = 5;
	int64_t run_after_ms = 0;
	TaskStatus status = TaskStatus::Queued;
	std::optional<std::string> claimed_by;
	std::optional<int64_t> claimed_at_ms;
	std::optional<int64_t> lease_until_ms;
	std::optional<std::string> lease_token;
	int32_t retry_count = 0;
	int32_t max_retries = 3;
	std::optional<std::string> result_data;
	std::optional<std::string> error_message;
	std::optional<std::string> idempotency_key;
	int64_t created_at_ms = 0;
	int64_t updated_at_ms = 0;
	std::optional<int64_t> completed_at_ms;
};

struct EnqueueRequest
{
	std::string task_type;
	std::string parameters_json = "{}";
	std::optional<int32_t> priority;
	std::optional<int64_t> run_after_ms;   // empty = eligible immediately
	std::optional<int32_t> max_retries;    // empty = store default
	std::optional<std::string> idempotency_key;
};

// Proof of ownership handed out by a successful claim.
struct LeaseToken
{
	int64_t task_id = 0;
	std::string worker_id;
	std::string token;
	int64_t lease_until_ms = 0;
};

struct ClaimResult
{
	bool claimed = false;
	std::optional<Task> task;
	std::optional<LeaseToken> lease;
	std::optional<QueueError> error;
};

struct StatusUpdate
{
	TaskStatus expected = TaskStatus::Queued;
	TaskStatus next = TaskStatus::Queued;
	std::optional<std::string> worker_id;   // recorded on the audit entry
	std::optional<std::string> result_data;
	std::optional<std::string> error_message;
	std::optional<int64_t> run_after_ms;
};

struct TaskFilter
{
	std::optional<TaskStatus> status;
	std::optional<std::string> task_type;
	std::optional<std::string> claimed_by;
	int32_t limit = 100;
	bool newest_first = false;
};

struct WorkerHeartbeat
{
	std::string worker_id;
	int64_t last_heartbeat_ms = 0;
	int64_t tasks_processed = 0;
	int64_t tasks_failed = 0;
	std::optional<int64_t> current_task_id;
	std::string strategy;
	WorkerState state = WorkerState::Active;
	int64_t started_at_ms = 0;
	int64_t updated_at_ms = 0;
};

struct TaskLogEntry
{
	int64_t id = 0;
	int64_t task_id = 0;
	std::optional<std::string> worker_id;
	TaskEvent event = TaskEvent::Created;
	std::string message;
	std::string details_json;
	int64_t timestamp_ms = 0;
};

struct ReclaimReport
{
	int32_t requeued = 0;
	int32_t dead_lettered = 0;
	std::vector<int64_t> task_ids;
};

struct ActiveTaskView
{
	int64_t id = 0;
	std::string task_type;
	int32_t priority = 0;
	TaskStatus status = TaskStatus::Queued;
	std::optional<std::string> claimed_by;
	int32_t retry_count = 0;
	int64_t created_at_ms = 0;
	int64_t age_ms = 0;
};

struct WorkerStatusView
{
	WorkerHeartbeat heartbeat;
	std::optional<std::string> current_task_type;
	std::optional<TaskStatus> current_task_status;
	int64_t seconds_since_heartbeat = 0;
};

struct TaskStatsView
{
	std::string task_type;
	TaskStatus status = TaskStatus::Queued;
	int64_t count = 0;
	double average_retries = 0.0;
	int64_t oldest_ms = 0;
	int64_t newest_ms = 0;
};

struct QueueStatistics
{
	std::map<std::string, int64_t> status_counts;
	int64_t active_workers = 0;
	int64_t db_size_bytes = 0;
};

auto status_to_string(const TaskStatus& status) -> std::string;
auto string_to_status(const std::string& status) -> std::optional<TaskStatus>;
auto is_terminal(const TaskStatus& status) -> bool;

auto event_to_string(const TaskEvent& event) -> std::string;
auto string_to_event(const std::string& event) -> std::optional<TaskEvent>;

auto worker_state_to_string(const WorkerState& state) -> std::string;
auto string_to_worker_state(const std::string& state) -> WorkerState;

auto error_type_to_string(const QueueErrorType& type) -> std::string;
