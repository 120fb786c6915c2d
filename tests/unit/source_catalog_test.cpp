#include <cassert>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/source_reader.hpp"
#include "internal/source/source_catalog.hpp"

namespace {

using dispatcher::db::ActiveSourcesSql;
using dispatcher::db::DbError;
using dispatcher::db::ErrorCode;
using dispatcher::db::IsSqlIdentifier;
using dispatcher::db::SourceQuery;
using dispatcher::db::SourceReader;
using dispatcher::source::DatabaseSourceCatalog;
using dispatcher::source::StaticSourceCatalog;

// Hands out whatever the test stored, counting reads.
class FakeSourceReader final : public SourceReader {
 public:
  std::vector<std::int64_t> ReadActiveSourceIds() override {
    ++reads;
    if (fail) {
      throw DbError(ErrorCode::IOError, "sources database unavailable");
    }
    return rows;
  }

  std::vector<std::int64_t> rows;
  bool                      fail  = false;
  int                       reads = 0;
};

void TestStaticCatalogNormalizes() {
  StaticSourceCatalog catalog({9, 3, 3, 1});
  assert((catalog.ActiveSourceIds() == std::vector<std::uint32_t>{1, 3, 9}));

  catalog.Replace({});
  assert(catalog.ActiveSourceIds().empty());
}

void TestDatabaseCatalogRereadsEveryCall() {
  auto reader = std::make_shared<FakeSourceReader>();
  reader->rows = {4, 2};
  DatabaseSourceCatalog catalog(reader);

  assert((catalog.ActiveSourceIds() == std::vector<std::uint32_t>{2, 4}));

  // a source switched away from the active status drops out next time
  reader->rows = {4};
  assert((catalog.ActiveSourceIds() == std::vector<std::uint32_t>{4}));
  assert(reader->reads == 2);
}

void TestDatabaseCatalogSkipsIdsOutsideSourceRange() {
  auto reader  = std::make_shared<FakeSourceReader>();
  reader->rows = {-1, 0, 7, 7, 4'294'967'295LL, 4'294'967'296LL, std::numeric_limits<std::int64_t>::min()};
  DatabaseSourceCatalog catalog(reader);

  assert((catalog.ActiveSourceIds() == std::vector<std::uint32_t>{0, 7, 4'294'967'295u}));
}

void TestDatabaseCatalogPropagatesReaderFailure() {
  auto reader  = std::make_shared<FakeSourceReader>();
  reader->fail = true;
  DatabaseSourceCatalog catalog(reader);

  bool thrown = false;
  try {
    catalog.ActiveSourceIds();
  } catch (const DbError& e) {
    thrown = e.code() == ErrorCode::IOError;
  }
  assert(thrown);
}

void TestDatabaseCatalogRequiresReader() {
  bool thrown = false;
  try {
    DatabaseSourceCatalog catalog(nullptr);
  } catch (const std::invalid_argument&) {
    thrown = true;
  }
  assert(thrown);
}

void TestActiveSourcesSql() {
  SourceQuery query;
  assert(ActiveSourcesSql(query, "?") == "SELECT id FROM sources WHERE status = ? ORDER BY id");

  query.table         = "feeds";
  query.id_column     = "feed_id";
  query.status_column = "lifecycle";
  assert(ActiveSourcesSql(query, "$1") == "SELECT feed_id FROM feeds WHERE lifecycle = $1 ORDER BY feed_id");

  query.table = "feeds f";
  bool thrown = false;
  try {
    ActiveSourcesSql(query, "?");
  } catch (const std::invalid_argument& e) {
    thrown = std::string(e.what()).find("feeds f") != std::string::npos;
  }
  assert(thrown);
}

void TestIdentifierRules() {
  assert(IsSqlIdentifier("sources"));
  assert(IsSqlIdentifier("_private_2"));
  assert(IsSqlIdentifier("Sources"));
  assert(!IsSqlIdentifier(""));
  assert(!IsSqlIdentifier("2sources"));
  assert(!IsSqlIdentifier("public.sources"));
  assert(!IsSqlIdentifier("id;"));
  assert(!IsSqlIdentifier("\"id\""));
}

} // namespace

int main() {
  TestStaticCatalogNormalizes();
  TestDatabaseCatalogRereadsEveryCall();
  TestDatabaseCatalogSkipsIdsOutsideSourceRange();
  TestDatabaseCatalogPropagatesReaderFailure();
  TestDatabaseCatalogRequiresReader();
  TestActiveSourcesSql();
  TestIdentifierRules();

  std::cout << "process_dispatcher_unit_source_catalog: pass\n";
  return 0;
}
