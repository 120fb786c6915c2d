#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace dispatcher::db::sqlite {

/*
  Thin RAII wrapper around a single sqlite3* connection.

  The connection is shared by every transaction; TxMutex() serializes
  them (SQLite has one writer anyway, and a connection cannot nest
  BEGIN).

  A read-only connection never creates the file and leaves the journal
  mode to whoever owns the database.
*/
class SqliteDB {
 public:
  enum class OpenMode { kReadWrite, kReadOnly };

  explicit SqliteDB(std::string path, OpenMode mode = OpenMode::kReadWrite);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  bool ReadOnly() const {
    return mode_ == OpenMode::kReadOnly;
  }

  // Execute a SQL string (used for pragmas/bootstrap). Throws on error.
  void Exec(const std::string& sql);

  // Execute and return the sqlite result code instead of throwing.
  int TryExec(const std::string& sql);

  /*
    Runs a single-parameter query outside any transaction and returns
    its first column. Every value must be an INTEGER; NULL or text
    throws, as does any sqlite error.
  */
  std::vector<std::int64_t> SelectInt64Column(const std::string& sql, const std::string& param);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
  OpenMode    mode_;
  std::mutex  tx_mutex_;
};

} // namespace dispatcher::db::sqlite
