#include "sqlite_source_reader.hpp"

#include <stdexcept>
#include <utility>

#include "internal/db/api/result.hpp"

namespace dispatcher::db::sqlite {

SqliteSourceReader::SqliteSourceReader(std::shared_ptr<SqliteDB> db, db::SourceQuery query)
    : db_(std::move(db)), query_(std::move(query)), sql_(db::ActiveSourcesSql(query_, "?")) {
  if (!db_) {
    throw std::invalid_argument("SqliteSourceReader: db is null");
  }
}

std::vector<std::int64_t> SqliteSourceReader::ReadActiveSourceIds() {
  try {
    return db_->SelectInt64Column(sql_, query_.active_status);
  } catch (const std::runtime_error& e) {
    throw DbError(ErrorCode::IOError, std::string("read sources: ") + e.what());
  }
}

} // namespace dispatcher::db::sqlite
