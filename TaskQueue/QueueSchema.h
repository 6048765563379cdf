#pragma once

#include <string>
#include <vector>

// Ordered schema migrations; entry N brings PRAGMA user_version from N to N + 1.
inline const std::vector<std::string> queue_schema_migrations = {
	R"SQL(
CREATE TABLE IF NOT EXISTS task_queue (
	id INTEGER PRIMARY KEY AUTOINCREMENT,
	task_type TEXT NOT NULL,
	parameters TEXT NOT NULL DEFAULT '{}',
	priority INTEGER NOT NULL DEFAULT 5,
	run_after INTEGER NOT NULL,
	status TEXT NOT NULL DEFAULT 'queued',
	claimed_by TEXT,
	claimed_at INTEGER,
	lease_until INTEGER,
	lease_token TEXT,
	retry_count INTEGER NOT NULL DEFAULT 0,
	max_retries INTEGER NOT NULL DEFAULT 3,
	result_data TEXT,
	error_message TEXT,
	created_at INTEGER NOT NULL,
	updated_at INTEGER NOT NULL,
	completed_at INTEGER,
	CHECK (priority BETWEEN 1 AND 10),
	CHECK (retry_count >= 0 AND retry_count <= max_retries),
	CHECK (status IN ('queued', 'claimed', 'running', 'completed', 'failed', 'cancelled')),
	CHECK ((claimed_by IS NOT NULL) = (status IN ('claimed', 'running')))
);

CREATE INDEX IF NOT EXISTS idx_task_queue_claiming
	ON task_queue(status, priority, created_at)
	WHERE status = 'queued';

CREATE INDEX IF NOT EXISTS idx_task_queue_leases
	ON task_queue(status, lease_until)
	WHERE status IN ('claimed', 'running');

CREATE INDEX IF NOT EXISTS idx_task_queue_type_status
	ON task_queue(task_type, status);

CREATE TABLE IF NOT EXISTS worker_heartbeats (
	worker_id TEXT PRIMARY KEY,
	last_heartbeat INTEGER NOT NULL,
	tasks_processed INTEGER NOT NULL DEFAULT 0,
	tasks_failed INTEGER NOT NULL DEFAULT 0,
	current_task_id INTEGER,
	strategy TEXT NOT NULL DEFAULT 'LIFO',
	state TEXT NOT NULL DEFAULT 'active',
	started_at INTEGER NOT NULL,
	updated_at INTEGER NOT NULL,
	CHECK (state IN ('active', 'stale', 'stopped')),
	FOREIGN KEY (current_task_id) REFERENCES task_queue(id)
);

CREATE TABLE IF NOT EXISTS task_logs (
	id INTEGER PRIMARY KEY AUTOINCREMENT,
	task_id INTEGER NOT NULL,
	worker_id TEXT,
	event_type TEXT NOT NULL,
	message TEXT,
	details TEXT,
	timestamp INTEGER NOT NULL,
	CHECK (event_type IN ('created', 'claimed', 'started', 'progress', 'completed', 'failed', 'retry', 'cancelled')),
	FOREIGN KEY (task_id) REFERENCES task_queue(id),
	FOREIGN KEY (worker_id) REFERENCES worker_heartbeats(worker_id)
);

CREATE INDEX IF NOT EXISTS idx_task_logs_task ON task_logs(task_id, id);
CREATE INDEX IF NOT EXISTS idx_task_logs_worker ON task_logs(worker_id, id);

CREATE VIEW IF NOT EXISTS v_active_tasks AS
SELECT
	id,
	task_type,
	priority,
	status,
	claimed_by,
	retry_count,
	created_at,
	CAST((julianday('now') - 2440587.5) * 86400000.0 AS INTEGER) - created_at AS age_ms
FROM task_queue
WHERE status IN ('queued', 'claimed', 'running')
ORDER BY priority ASC, created_at ASC;

CREATE VIEW IF NOT EXISTS v_worker_status AS
SELECT
	w.worker_id,
	w.last_heartbeat,
	w.tasks_processed,
	w.tasks_failed,
	w.current_task_id,
	w.strategy,
	w.state,
	w.started_at,
	w.updated_at,
	t.task_type AS current_task_type,
	t.status AS current_task_status,
	(CAST((julianday('now') - 2440587.5) * 86400000.0 AS INTEGER) - w.last_heartbeat) / 1000 AS seconds_since_heartbeat
FROM worker_heartbeats w
LEFT JOIN task_queue t ON t.id = w.current_task_id;

CREATE VIEW IF NOT EXISTS v_task_stats AS
SELECT
	task_type,
	status,
	COUNT(*) AS count,
	AVG(retry_count) AS avg_retries,
	MIN(created_at) AS oldest,
	MAX(created_at) AS newest
FROM task_queue
GROUP BY task_type, status;
)SQL",

	R"SQL(
ALTER TABLE task_queue ADD COLUMN idempotency_key TEXT;

CREATE UNIQUE INDEX IF NOT EXISTS idx_task_queue_idempotency
	ON task_queue(idempotency_key)
	WHERE idempotency_key IS NOT NULL;
)SQL"
};
