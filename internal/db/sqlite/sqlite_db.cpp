#include "sqlite_db.hpp"

#include <stdexcept>

namespace dispatcher::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

static int OpenFlags(SqliteDB::OpenMode mode) {
  if (mode == SqliteDB::OpenMode::kReadOnly) {
    return SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX;
  }
  return SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
}

SqliteDB::SqliteDB(std::string path, OpenMode mode) : path_(std::move(path)), mode_(mode) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, OpenFlags(mode_), nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw std::runtime_error("sqlite open " + path_ + ": " + msg);
  }

  try {
    Configure();
  } catch (...) {
    sqlite3_close(db_);
    db_ = nullptr;
    throw;
  }
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw std::runtime_error(msg);
  }
}

int SqliteDB::TryExec(const std::string& sql) {
  return sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, nullptr);
}

std::vector<std::int64_t> SqliteDB::SelectInt64Column(const std::string& sql, const std::string& param) {
  std::lock_guard lock(tx_mutex_);

  sqlite3_stmt* raw = nullptr;
  ThrowIf(sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr), db_, "sqlite prepare");
  std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)> stmt(raw, sqlite3_finalize);

  ThrowIf(sqlite3_bind_text(stmt.get(), 1, param.c_str(), static_cast<int>(param.size()), SQLITE_TRANSIENT), db_,
          "sqlite bind");

  std::vector<std::int64_t> out;
  int                       rc;
  while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
    if (sqlite3_column_type(stmt.get(), 0) != SQLITE_INTEGER) {
      throw std::runtime_error("sqlite select: row " + std::to_string(out.size()) + " is not an integer");
    }
    out.push_back(static_cast<std::int64_t>(sqlite3_column_int64(stmt.get(), 0)));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite step: ") + sqlite3_errmsg(db_));
  }
  return out;
}

void SqliteDB::Configure() {
  // primary key vs check violations are told apart by extended codes
  ThrowIf(sqlite3_extended_result_codes(db_, 1), db_, "extended_result_codes");

  // wait for locks held by other processes instead of failing immediately
  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  if (ReadOnly()) {
    return;
  }

  // IMPORTANT: WAL enables concurrent readers while writer holds lock
  // (in-memory databases silently stay in "memory" mode)
  Exec("PRAGMA journal_mode=WAL;");

  Exec("PRAGMA synchronous=NORMAL;");

  Exec("PRAGMA temp_store=MEMORY;");
}

} // namespace dispatcher::db::sqlite
