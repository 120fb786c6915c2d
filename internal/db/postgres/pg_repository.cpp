#include "pg_repository.hpp"

namespace dispatcher::db::postgres {

namespace {

model::ProcessRow ReadRow(const pqxx::row& row) {
  model::ProcessRow r;
  r.uuid          = row[0].c_str();
  r.source_id     = row[1].as<int64_t>();
  r.state         = row[2].c_str();
  r.type          = row[3].as<int64_t>();
  r.created_at_ms = row[4].as<int64_t>();
  if (!row[5].is_null()) {
    r.supervisor_id = row[5].c_str();
  }
  return r;
}

std::vector<model::ProcessRow> ReadRows(const pqxx::result& res) {
  std::vector<model::ProcessRow> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRow(row));
  }
  return out;
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  if (dynamic_cast<const pqxx::deadlock_detected*>(&e)) {
    return Result::Err(ErrorCode::Busy, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertProcess(Transaction& t, const model::ProcessRow& r) {
  try {
    TX(t).Work().exec_prepared("insert_process", r.uuid, r.source_id, r.state, r.type, r.created_at_ms,
                                    r.supervisor_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::ProcessRow> PgRepository::GetProcess(Transaction& t, const std::string& uuid) {
  try {
    auto res = TX(t).Work().exec_prepared("get_process", uuid);
    if (res.empty()) return std::nullopt;
    return ReadRow(res[0]);
  } catch (const std::exception& e) {
    throw DbError(Translate(e));
  }
}

Result PgRepository::CompareAndSetState(Transaction& t, const std::string& uuid, const std::string& expected, const std::string& next) {
  try {
    auto res = TX(t).Work().exec_prepared("update_process_state", uuid, expected, next);
    if (res.affected_rows() == 1) return Result::Ok();

    if (TX(t).Work().exec_prepared("get_process", uuid).empty()) return Result::Err(ErrorCode::NotFound);
    return Result::Err(ErrorCode::Conflict, "state of " + uuid + " is no longer " + expected);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::CompareAndAssign(Transaction& t, const std::string& uuid, const std::string& expected, const std::string& next,
                                      const std::string& supervisor_id) {
  try {
    auto res = TX(t).Work().exec_prepared("assign_process", uuid, expected, next, supervisor_id);
    if (res.affected_rows() == 1) return Result::Ok();

    auto current = TX(t).Work().exec_prepared("get_process", uuid);
    if (current.empty()) return Result::Err(ErrorCode::NotFound);
    if (!current[0][5].is_null()) {
      return Result::Err(ErrorCode::Conflict, uuid + " already assigned to " + current[0][5].c_str());
    }
    return Result::Err(ErrorCode::Conflict, "state of " + uuid + " is no longer " + expected);
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DeleteProcess(Transaction& t, const std::string& uuid) {
  try {
    auto res = TX(t).Work().exec_prepared("delete_process", uuid);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ProcessRow> PgRepository::ListProcessesBySource(Transaction& t, uint32_t source_id) {
  try {
    return ReadRows(TX(t).Work().exec_prepared("list_processes_by_source", static_cast<int64_t>(source_id)));
  } catch (const std::exception& e) {
    throw DbError(Translate(e));
  }
}

std::optional<model::ProcessRow> PgRepository::LatestProcessForSource(Transaction& t, uint32_t source_id) {
  try {
    auto res = TX(t).Work().exec_prepared("latest_process_for_source", static_cast<int64_t>(source_id));
    if (res.empty()) return std::nullopt;
    return ReadRow(res[0]);
  } catch (const std::exception& e) {
    throw DbError(Translate(e));
  }
}

std::vector<model::ProcessRow> PgRepository::ListProcessesInState(Transaction& t, const std::string& state, std::size_t limit) {
  try {
    return ReadRows(TX(t).Work().exec_prepared("list_processes_in_state", state, static_cast<int64_t>(limit)));
  } catch (const std::exception& e) {
    throw DbError(Translate(e));
  }
}

std::vector<std::pair<std::string, uint64_t>> PgRepository::CountProcessesByState(Transaction& t) {
  try {
    auto res = TX(t).Work().exec_prepared("count_processes_by_state");

    std::vector<std::pair<std::string, uint64_t>> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.emplace_back(row[0].c_str(), row[1].as<uint64_t>());
    }
    return out;
  } catch (const std::exception& e) {
    throw DbError(Translate(e));
  }
}

} // namespace dispatcher::db::postgres
