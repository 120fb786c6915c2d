#include "pg_source_reader.hpp"

#include <stdexcept>
#include <utility>

#include "pg_repository.hpp"

namespace dispatcher::db::postgres {

PgSourceReader::PgSourceReader(std::shared_ptr<PgPool> pool, db::SourceQuery query)
    : pool_(std::move(pool)), query_(std::move(query)), sql_(db::ActiveSourcesSql(query_, "$1")) {
  if (!pool_) {
    throw std::invalid_argument("PgSourceReader: pool is null");
  }
}

std::vector<std::int64_t> PgSourceReader::ReadActiveSourceIds() {
  try {
    auto                  conn = pool_->Acquire();
    pqxx::read_transaction tx(*conn);

    auto res = tx.exec_params(sql_, query_.active_status);

    std::vector<std::int64_t> out;
    out.reserve(res.size());
    for (const auto& row : res) {
      out.push_back(row[0].as<std::int64_t>());
    }
    tx.commit();
    return out;
  } catch (const pqxx::failure& e) {
    throw DbError(PgRepository::Translate(e));
  } catch (const pqxx::conversion_error& e) {
    throw DbError(ErrorCode::Corruption, std::string("read sources: ") + e.what());
  }
}

} // namespace dispatcher::db::postgres
