#pragma once

#include <string>
#include <vector>

namespace dispatcher::db::sql {

/*
  Bootstrap DDL, applied idempotently at start-up.

  Versioned migrations are owned by the external migration tool; this
  only guarantees the table exists so an empty database is usable.
  The (source_id, created_at) index backs list-by-source and the
  scheduler's latest-per-source lookup. SQLite has no ADD COLUMN IF NOT
  EXISTS; a table predating supervisor_id fails the start-up check and
  must be upgraded by the migration tool.
*/

inline const std::vector<std::string>& SqliteSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS dispatcher_processes ("
      " uuid TEXT NOT NULL PRIMARY KEY CHECK (length(uuid) = 36),"
      " source_id INTEGER NOT NULL CHECK (source_id BETWEEN 0 AND 4294967295),"
      " state TEXT NOT NULL CHECK (length(state) BETWEEN 1 AND 15),"
      " type INTEGER NOT NULL CHECK (type BETWEEN 0 AND 255),"
      " created_at INTEGER NOT NULL DEFAULT (CAST((julianday('now') - 2440587.5) * 86400000.0 AS INTEGER)),"
      " supervisor_id TEXT NULL CHECK (supervisor_id IS NULL OR length(supervisor_id) = 36));",
      "CREATE INDEX IF NOT EXISTS idx_dispatcher_processes_source_created"
      " ON dispatcher_processes(source_id, created_at);",
      "CREATE INDEX IF NOT EXISTS idx_dispatcher_processes_state_created"
      " ON dispatcher_processes(state, created_at);"};
  return kSchema;
}

inline const std::vector<std::string>& PostgresSchema() {
  static const std::vector<std::string> kSchema = {
      "CREATE TABLE IF NOT EXISTS dispatcher_processes ("
      " uuid CHAR(36) NOT NULL PRIMARY KEY,"
      " source_id BIGINT NOT NULL CHECK (source_id BETWEEN 0 AND 4294967295),"
      " state VARCHAR(15) NOT NULL CHECK (length(state) >= 1),"
      " type SMALLINT NOT NULL CHECK (type BETWEEN 0 AND 255),"
      " created_at TIMESTAMPTZ(3) NOT NULL DEFAULT CURRENT_TIMESTAMP(3),"
      " supervisor_id CHAR(36) NULL);",
      "ALTER TABLE dispatcher_processes ADD COLUMN IF NOT EXISTS supervisor_id CHAR(36) NULL;",
      "CREATE INDEX IF NOT EXISTS idx_dispatcher_processes_source_created"
      " ON dispatcher_processes(source_id, created_at);",
      "CREATE INDEX IF NOT EXISTS idx_dispatcher_processes_state_created"
      " ON dispatcher_processes(state, created_at);"};
  return kSchema;
}

} // namespace dispatcher::db::sql
