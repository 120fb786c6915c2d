#pragma once

namespace dispatcher::db::sql {

/*
  Canonical SQL for the dispatcher_processes table.

  IMPORTANT:
  Written with `?` placeholders (SQLite). The Postgres backend prepares
  the same statements with $n placeholders in PgPool.
*/

static constexpr const char* INSERT_PROCESS =
    "INSERT INTO dispatcher_processes(uuid,source_id,state,type,created_at,supervisor_id)"
    " VALUES(?,?,?,?,?,?);";

static constexpr const char* SELECT_PROCESS =
    "SELECT uuid,source_id,state,type,created_at,supervisor_id"
    " FROM dispatcher_processes WHERE uuid=?;";

// Compare-and-swap on the current state.
static constexpr const char* UPDATE_PROCESS_STATE =
    "UPDATE dispatcher_processes SET state=?"
    " WHERE uuid=? AND state=?;";

// Claim: state CAS plus "nobody owns it yet".
static constexpr const char* ASSIGN_PROCESS =
    "UPDATE dispatcher_processes SET state=?, supervisor_id=?"
    " WHERE uuid=? AND state=? AND supervisor_id IS NULL;";

static constexpr const char* DELETE_PROCESS =
    "DELETE FROM dispatcher_processes WHERE uuid=?;";

static constexpr const char* LIST_PROCESSES_BY_SOURCE =
    "SELECT uuid,source_id,state,type,created_at,supervisor_id"
    " FROM dispatcher_processes WHERE source_id=?"
    " ORDER BY created_at ASC, uuid ASC;";

static constexpr const char* LATEST_PROCESS_FOR_SOURCE =
    "SELECT uuid,source_id,state,type,created_at,supervisor_id"
    " FROM dispatcher_processes WHERE source_id=?"
    " ORDER BY created_at DESC, uuid DESC LIMIT 1;";

static constexpr const char* LIST_PROCESSES_IN_STATE =
    "SELECT uuid,source_id,state,type,created_at,supervisor_id"
    " FROM dispatcher_processes WHERE state=?"
    " ORDER BY created_at ASC, uuid ASC LIMIT ?;";

static constexpr const char* COUNT_PROCESSES_BY_STATE =
    "SELECT state,COUNT(*) FROM dispatcher_processes"
    " GROUP BY state ORDER BY state;";

} // namespace dispatcher::db::sql
