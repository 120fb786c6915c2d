#include "memory_repository.hpp"

#include <map>
#include <mutex>

#include "memory_tx.hpp"

namespace dispatcher::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

std::optional<model::ProcessRow> MemoryRepository::Committed(const std::string& uuid) const {
  std::shared_lock lock(mutex_);
  auto             it = committed_.find(uuid);
  if (it == committed_.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::InsertProcess(Transaction& t, const model::ProcessRow& r) {
  auto& tx = TX(t);
  if (tx.Read(r.uuid).has_value()) return Result::Err(ErrorCode::AlreadyExists, "duplicate uuid " + r.uuid);
  tx.Stage(r.uuid, r);
  return Result::Ok();
}

std::optional<model::ProcessRow> MemoryRepository::GetProcess(Transaction& t, const std::string& uuid) {
  return TX(t).Read(uuid);
}

Result MemoryRepository::CompareAndSetState(Transaction& t, const std::string& uuid, const std::string& expected,
                                            const std::string& next) {
  auto& tx      = TX(t);
  auto  current = tx.Read(uuid);
  if (!current) return Result::Err(ErrorCode::NotFound);
  if (current->state != expected) return Result::Err(ErrorCode::Conflict, "state is " + current->state + ", expected " + expected);

  current->state = next;
  tx.Stage(uuid, std::move(current));
  return Result::Ok();
}

Result MemoryRepository::CompareAndAssign(Transaction& t, const std::string& uuid, const std::string& expected,
                                          const std::string& next, const std::string& supervisor_id) {
  auto& tx      = TX(t);
  auto  current = tx.Read(uuid);
  if (!current) return Result::Err(ErrorCode::NotFound);
  if (current->state != expected) return Result::Err(ErrorCode::Conflict, "state is " + current->state + ", expected " + expected);
  if (current->supervisor_id) return Result::Err(ErrorCode::Conflict, uuid + " already assigned to " + *current->supervisor_id);

  current->state         = next;
  current->supervisor_id = supervisor_id;
  tx.Stage(uuid, std::move(current));
  return Result::Ok();
}

Result MemoryRepository::DeleteProcess(Transaction& t, const std::string& uuid) {
  auto& tx = TX(t);
  if (!tx.Read(uuid)) return Result::Err(ErrorCode::NotFound);
  tx.Stage(uuid, std::nullopt);
  return Result::Ok();
}

std::vector<model::ProcessRow> MemoryRepository::ListProcessesBySource(Transaction& t, uint32_t source_id) {
  return TX(t).Visible([source_id](const model::ProcessRow& r) { return r.source_id == static_cast<int64_t>(source_id); });
}

std::optional<model::ProcessRow> MemoryRepository::LatestProcessForSource(Transaction& t, uint32_t source_id) {
  auto rows = ListProcessesBySource(t, source_id);
  if (rows.empty()) return std::nullopt;
  return rows.back();
}

std::vector<model::ProcessRow> MemoryRepository::ListProcessesInState(Transaction& t, const std::string& state, std::size_t limit) {
  auto rows = TX(t).Visible([&state](const model::ProcessRow& r) { return r.state == state; });
  if (rows.size() > limit) rows.resize(limit);
  return rows;
}

std::vector<std::pair<std::string, uint64_t>> MemoryRepository::CountProcessesByState(Transaction& t) {
  std::map<std::string, uint64_t> counts;
  for (const auto& row : TX(t).Visible([](const model::ProcessRow&) { return true; })) {
    ++counts[row.state];
  }
  return {counts.begin(), counts.end()};
}

} // namespace dispatcher::db::memory
