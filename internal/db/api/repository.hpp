#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/process_row.hpp"

namespace dispatcher::db {

/*
  Repository abstraction over the dispatcher_processes table.

  CRITICAL GUARANTEES:

  - All reads and writes happen inside a Transaction
  - Reads inside a transaction see its writes
  - InsertProcess reports AlreadyExists on a primary key collision
  - CompareAndSetState only writes when the stored state still equals
    `expected`; otherwise Conflict (or NotFound when the row is gone)
  - CompareAndAssign additionally requires supervisor_id to be NULL and
    sets it together with the new state
  - Row lists are ordered by created_at ascending

  Rows are handed out raw; validation belongs to the codec.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Process lifecycle
  // ---------------------------------------------------------------------

  virtual Result InsertProcess(Transaction&, const model::ProcessRow&) = 0;

  virtual std::optional<model::ProcessRow> GetProcess(Transaction&, const std::string& uuid) = 0;

  virtual Result CompareAndSetState(Transaction&, const std::string& uuid, const std::string& expected,
                                    const std::string& next) = 0;

  virtual Result CompareAndAssign(Transaction&, const std::string& uuid, const std::string& expected,
                                  const std::string& next, const std::string& supervisor_id) = 0;

  virtual Result DeleteProcess(Transaction&, const std::string& uuid) = 0;

  // ---------------------------------------------------------------------
  // Queries
  // ---------------------------------------------------------------------

  virtual std::vector<model::ProcessRow> ListProcessesBySource(Transaction&, uint32_t source_id) = 0;

  virtual std::optional<model::ProcessRow> LatestProcessForSource(Transaction&, uint32_t source_id) = 0;

  virtual std::vector<model::ProcessRow> ListProcessesInState(Transaction&, const std::string& state, std::size_t limit) = 0;

  // (state, count) pairs for every state present in the table.
  virtual std::vector<std::pair<std::string, uint64_t>> CountProcessesByState(Transaction&) = 0;
};

} // namespace dispatcher::db
