#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace dispatcher::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace dispatcher::db::sqlite
