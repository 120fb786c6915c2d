#include "memory_tx.hpp"

#include <algorithm>
#include <mutex>

namespace dispatcher::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!finished_) Rollback();
}

MemoryTransaction::Entry& MemoryTransaction::Touch(const std::string& uuid) {
  auto it = entries_.find(uuid);
  if (it != entries_.end()) return it->second;

  Entry entry;
  entry.before = repo_.Committed(uuid);
  entry.after  = entry.before;
  return entries_.emplace(uuid, std::move(entry)).first->second;
}

std::optional<model::ProcessRow> MemoryTransaction::Read(const std::string& uuid) {
  return Touch(uuid).after;
}

void MemoryTransaction::Stage(const std::string& uuid, std::optional<model::ProcessRow> row) {
  auto& entry = Touch(uuid);
  entry.after = std::move(row);
  entry.dirty = true;
}

std::vector<model::ProcessRow> MemoryTransaction::Visible(const std::function<bool(const model::ProcessRow&)>& pred) const {
  std::vector<model::ProcessRow> out;
  {
    std::shared_lock lock(repo_.mutex_);
    for (const auto& [uuid, row] : repo_.committed_) {
      if (entries_.contains(uuid)) continue;
      if (pred(row)) out.push_back(row);
    }
  }

  for (const auto& [uuid, entry] : entries_) {
    if (entry.after && pred(*entry.after)) out.push_back(*entry.after);
  }

  std::sort(out.begin(), out.end(), [](const model::ProcessRow& a, const model::ProcessRow& b) {
    if (a.created_at_ms != b.created_at_ms) return a.created_at_ms < b.created_at_ms;
    return a.uuid < b.uuid;
  });
  return out;
}

Result MemoryTransaction::Commit() {
  std::unique_lock lock(repo_.mutex_);

  for (const auto& [uuid, entry] : entries_) {
    if (!entry.dirty) continue;

    auto                             it = repo_.committed_.find(uuid);
    std::optional<model::ProcessRow> current;
    if (it != repo_.committed_.end()) current = it->second;

    if (current != entry.before) {
      finished_ = true;
      return Result::Err(ErrorCode::Conflict, "row " + uuid + " was modified by a concurrent transaction");
    }
  }

  for (auto& [uuid, entry] : entries_) {
    if (!entry.dirty) continue;

    if (entry.after) {
      repo_.committed_[uuid] = std::move(*entry.after);
    } else {
      repo_.committed_.erase(uuid);
    }
  }

  entries_.clear();
  finished_ = true;
  return Result::Ok();
}

void MemoryTransaction::Rollback() {
  entries_.clear();
  finished_ = true;
}

} // namespace dispatcher::db::memory
