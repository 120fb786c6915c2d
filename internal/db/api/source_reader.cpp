#include "source_reader.hpp"

#include <stdexcept>

namespace dispatcher::db {

namespace {

bool IsIdentStart(char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool IsIdentChar(char c) {
  return IsIdentStart(c) || (c >= '0' && c <= '9');
}

void RequireIdentifier(const char* what, const std::string& name) {
  if (!IsSqlIdentifier(name)) {
    throw std::invalid_argument(std::string("source query ") + what + " is not an identifier: '" + name + "'");
  }
}

} // namespace

bool IsSqlIdentifier(std::string_view name) {
  if (name.empty() || !IsIdentStart(name.front())) {
    return false;
  }
  for (char c : name) {
    if (!IsIdentChar(c)) return false;
  }
  return true;
}

std::string ActiveSourcesSql(const SourceQuery& query, std::string_view placeholder) {
  RequireIdentifier("table", query.table);
  RequireIdentifier("id column", query.id_column);
  RequireIdentifier("status column", query.status_column);

  std::string sql = "SELECT " + query.id_column + " FROM " + query.table + " WHERE " + query.status_column + " = ";
  sql.append(placeholder);
  sql += " ORDER BY " + query.id_column;
  return sql;
}

} // namespace dispatcher::db
