#include "pg_pool.hpp"

namespace dispatcher::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections, bool prepare_statements)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections),
      prepare_statements_(prepare_statements) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [this] { return !idle_.empty() || live_connections_ < max_connections_; });

  if (!idle_.empty()) {
    auto conn = std::move(idle_.back());
    idle_.pop_back();
    return Wrap(conn.release());
  }

  ++live_connections_;
  lock.unlock();

  try {
    auto conn = std::make_unique<pqxx::connection>(conninfo_);
    if (prepare_statements_) {
      PrepareStatements(*conn);
    }
    return Wrap(conn.release());
  } catch (...) {
    {
      std::lock_guard rollback_lock(mutex_);
      --live_connections_;
    }
    cv_.notify_one();
    throw;
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  static constexpr const char* kColumns =
      "uuid, source_id, state, type, (EXTRACT(EPOCH FROM created_at) * 1000)::BIGINT, supervisor_id";
  const std::string select = std::string("SELECT ") + kColumns + " FROM dispatcher_processes ";

  conn.prepare("insert_process",
               "INSERT INTO dispatcher_processes(uuid,source_id,state,type,created_at,supervisor_id) "
               "VALUES($1,$2,$3,$4,TIMESTAMPTZ 'epoch' + $5 * INTERVAL '1 millisecond',$6)");

  conn.prepare("get_process", select + "WHERE uuid=$1");

  conn.prepare("update_process_state", "UPDATE dispatcher_processes SET state=$3 WHERE uuid=$1 AND state=$2");

  conn.prepare("assign_process",
               "UPDATE dispatcher_processes SET state=$3, supervisor_id=$4 "
               "WHERE uuid=$1 AND state=$2 AND supervisor_id IS NULL");

  conn.prepare("delete_process", "DELETE FROM dispatcher_processes WHERE uuid=$1");

  conn.prepare("list_processes_by_source", select + "WHERE source_id=$1 ORDER BY created_at ASC, uuid ASC");

  conn.prepare("latest_process_for_source", select + "WHERE source_id=$1 ORDER BY created_at DESC, uuid DESC LIMIT 1");

  conn.prepare("list_processes_in_state", select + "WHERE state=$1 ORDER BY created_at ASC, uuid ASC LIMIT $2");

  conn.prepare("count_processes_by_state", "SELECT state, COUNT(*) FROM dispatcher_processes GROUP BY state ORDER BY state");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    if (conn->is_open()) {
      idle_.emplace_back(conn);
    } else {
      // broken connections are dropped; a fresh one replaces them on demand
      delete conn;
      --live_connections_;
    }
  }
  cv_.notify_one();
}

} // namespace dispatcher::db::postgres
