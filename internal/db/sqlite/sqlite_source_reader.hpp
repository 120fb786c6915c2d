#pragma once

#include <memory>
#include <string>

#include "internal/db/api/source_reader.hpp"
#include "sqlite_db.hpp"

namespace dispatcher::db::sqlite {

// Reads the sources table through its own connection.
class SqliteSourceReader final : public db::SourceReader {
public:
  SqliteSourceReader(std::shared_ptr<SqliteDB> db, db::SourceQuery query);

  std::vector<std::int64_t> ReadActiveSourceIds() override;

private:
  std::shared_ptr<SqliteDB> db_;
  db::SourceQuery           query_;
  std::string               sql_;
};

} // namespace dispatcher::db::sqlite
