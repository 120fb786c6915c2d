#include "sqlite_tx.hpp"

namespace dispatcher::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_) {
    // the result code is irrelevant here: on failure sqlite has already
    // rolled the transaction back
    (void)db_->TryExec("ROLLBACK;");
  }
}

Result SqliteTransaction::Commit() {
  const int rc = db_->TryExec("COMMIT;");
  if (rc == SQLITE_OK) {
    finished_ = true;
    return Result::Ok();
  }

  Result err = Result::Err((rc & 0xff) == SQLITE_BUSY ? ErrorCode::Busy : ErrorCode::InternalError, sqlite3_errmsg(db_->Handle()));
  Rollback();
  return err;
}

void SqliteTransaction::Rollback() {
  if (sqlite3_get_autocommit(db_->Handle()) == 0) {
    (void)db_->TryExec("ROLLBACK;");
  }
  finished_ = true;
}

} // namespace dispatcher::db::sqlite
