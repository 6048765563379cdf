#pragma once

#include "QueueStore.h"
#include "TaskTypes.h"

#include "SQLite.h"

#include <map>
#include <optional>
#include <string>
#include <tuple>
#include <vector>

// Read side of the audit trail and heartbeat table, plus the monitoring views
// and database maintenance. Writes go through the store's transactions.
class ObservabilityLog
{
public:
	ObservabilityLog(QueueStore& store);
	~ObservabilityLog(void);

	auto logs_for_task(const int64_t& task_id, const int32_t& limit = 0)
		-> std::tuple<std::vector<TaskLogEntry>, std::optional<QueueError>>;
	auto logs_for_worker(const std::string& worker_id, const int32_t& limit = 100)
		-> std::tuple<std::vector<TaskLogEntry>, std::optional<QueueError>>;
	auto record_progress(const int64_t& task_id, const std::optional<std::string>& worker_id, const std::string& message,
		const std::string& details_json = "{}") -> std::tuple<int64_t, std::optional<QueueError>>;

	auto heartbeats(void) -> std::tuple<std::vector<WorkerHeartbeat>, std::optional<QueueError>>;
	auto heartbeat(const std::string& worker_id) -> std::tuple<std::optional<WorkerHeartbeat>, std::optional<QueueError>>;

	auto active_tasks(const int32_t& limit = 100) -> std::tuple<std::vector<ActiveTaskView>, std::optional<QueueError>>;
	auto worker_status(void) -> std::tuple<std::vector<WorkerStatusView>, std::optional<QueueError>>;
	auto task_stats(void) -> std::tuple<std::vector<TaskStatsView>, std::optional<QueueError>>;

	// Raw rows of one monitoring view, for tools that print whatever columns it has.
	auto view(const std::string& view_name) -> std::tuple<DataBase::QueryResult, std::optional<QueueError>>;

	// Workers count as active when their state is active and they beat within active_window_ms.
	auto statistics(const int64_t& active_window_ms = 60000) -> std::tuple<QueueStatistics, std::optional<QueueError>>;
	auto pragma_info(void) -> std::tuple<std::map<std::string, std::string>, std::optional<QueueError>>;

	auto checkpoint(void) -> std::tuple<bool, std::optional<QueueError>>;
	auto vacuum(void) -> std::tuple<bool, std::optional<QueueError>>;

private:
	QueueStore& store_;
};
