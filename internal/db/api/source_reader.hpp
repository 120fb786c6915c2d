#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace dispatcher::db {

/*
  Location of the sources table owned by the external sources
  subsystem. The dispatcher only ever reads it.

  Table and column names are spliced into the SQL text, so they must be
  plain identifiers; the status value is always bound as a parameter.
*/
struct SourceQuery {
  std::string table         = "sources";
  std::string id_column     = "id";
  std::string status_column = "status";
  std::string active_status = "run";
};

// [A-Za-z_][A-Za-z0-9_]*
bool IsSqlIdentifier(std::string_view name);

// SELECT <id> FROM <table> WHERE <status> = <placeholder> ORDER BY <id>
// Throws std::invalid_argument when a name is not an identifier.
std::string ActiveSourcesSql(const SourceQuery& query, std::string_view placeholder);

/*
  Reads the ids of sources whose status equals active_status.

  Ids come back as stored; range checks belong to the caller. Backend
  failures surface as DbError.
*/
class SourceReader {
 public:
  virtual ~SourceReader() = default;

  virtual std::vector<std::int64_t> ReadActiveSourceIds() = 0;
};

} // namespace dispatcher::db
