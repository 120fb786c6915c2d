#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace dispatcher::db::memory {

/*
  Transaction = write set over the shared committed map.

  The first touch of a row records the committed value it was read
  from. Commit re-checks, per written row, that the committed value is
  still that one; any mismatch fails the whole commit with Conflict.
  Rows this transaction never wrote are not checked, so transactions on
  different rows never conflict.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  Result Commit() override;
  void   Rollback() override;
  bool   IsFinished() const override {
    return finished_;
  }

  std::optional<model::ProcessRow> Read(const std::string& uuid);
  void                             Stage(const std::string& uuid, std::optional<model::ProcessRow> row);

  // Committed rows overlaid with this transaction's writes, filtered,
  // ordered by created_at.
  std::vector<model::ProcessRow> Visible(const std::function<bool(const model::ProcessRow&)>& pred) const;

 private:
  struct Entry {
    std::optional<model::ProcessRow> before;
    std::optional<model::ProcessRow> after;
    bool                             dirty = false;
  };

  Entry& Touch(const std::string& uuid);

  MemoryRepository&                      repo_;
  std::unordered_map<std::string, Entry> entries_;
  bool                                   finished_ = false;
};

} // namespace dispatcher::db::memory
