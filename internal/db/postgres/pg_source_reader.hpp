#pragma once

#include <memory>
#include <string>

#include "internal/db/api/source_reader.hpp"
#include "pg_pool.hpp"

namespace dispatcher::db::postgres {

/*
  Reads the sources table in a short read-only transaction per call.

  The pool should be built without the dispatcher statements; the
  sources database need not carry dispatcher_processes.
*/
class PgSourceReader final : public db::SourceReader {
 public:
  PgSourceReader(std::shared_ptr<PgPool> pool, db::SourceQuery query);

  std::vector<std::int64_t> ReadActiveSourceIds() override;

 private:
  std::shared_ptr<PgPool> pool_;
  db::SourceQuery         query_;
  std::string             sql_;
};

} // namespace dispatcher::db::postgres
