#pragma once

#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace dispatcher::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertProcess(Transaction&, const model::ProcessRow&) override;
  std::optional<model::ProcessRow> GetProcess(Transaction&, const std::string&) override;
  Result CompareAndSetState(Transaction&, const std::string& uuid, const std::string& expected,
                            const std::string& next) override;
  Result CompareAndAssign(Transaction&, const std::string& uuid, const std::string& expected,
                          const std::string& next, const std::string& supervisor_id) override;
  Result DeleteProcess(Transaction&, const std::string&) override;

  std::vector<model::ProcessRow> ListProcessesBySource(Transaction&, uint32_t source_id) override;
  std::optional<model::ProcessRow> LatestProcessForSource(Transaction&, uint32_t source_id) override;
  std::vector<model::ProcessRow> ListProcessesInState(Transaction&, const std::string& state,
                                                      std::size_t limit) override;
  std::vector<std::pair<std::string, uint64_t>> CountProcessesByState(Transaction&) override;

private:
  friend class MemoryTransaction;

  std::optional<model::ProcessRow> Committed(const std::string& uuid) const;

  mutable std::shared_mutex                               mutex_;
  std::unordered_map<std::string, model::ProcessRow>      committed_;
};

} // namespace dispatcher::db::memory
