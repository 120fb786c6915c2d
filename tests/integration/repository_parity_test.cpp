#include <cassert>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/api/source_reader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/process_row.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/source/source_catalog.hpp"
#include "internal/util/uuid.hpp"

#if DISPATCHER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_source_reader.hpp"
#endif

#if DISPATCHER_DB_POSTGRES
#include <pqxx/pqxx>

#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#include "internal/db/postgres/pg_source_reader.hpp"
#endif

namespace {

using dispatcher::db::ErrorCode;
using dispatcher::db::Repository;
using dispatcher::db::SourceQuery;
using dispatcher::db::SourceReader;
using dispatcher::db::memory::MemoryRepository;
using dispatcher::db::model::ProcessRow;

int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;

  // Unset for backends that cannot hold a sources table.
  std::function<void(const std::string&)>                          exec_sql;
  std::function<std::shared_ptr<SourceReader>(const SourceQuery&)> make_source_reader;
};

// Each suite run uses its own source id range so leftovers from a
// previous run against a persistent database do not interfere.
uint32_t BaseSource() {
  return static_cast<uint32_t>(NowMs() % 1'000'000) * 100;
}

ProcessRow MakeRow(uint32_t source_id, const std::string& state, int64_t created_at_ms) {
  ProcessRow row;
  row.uuid          = dispatcher::util::ToString(dispatcher::util::GenerateUUID());
  row.source_id     = source_id;
  row.state         = state;
  row.type          = 1;
  row.created_at_ms = created_at_ms;
  return row;
}

void VerifyInsertGetCompareAndSetDelete(Repository& repo, uint32_t source_id) {
  auto row = MakeRow(source_id, "pending", NowMs());

  {
    auto tx = repo.Begin();
    assert(repo.InsertProcess(*tx, row));

    // read-your-writes
    auto read = repo.GetProcess(*tx, row.uuid);
    assert(read.has_value());
    assert(*read == row);

    assert(tx->Commit());
  }

  {
    auto tx = repo.Begin();
    auto read = repo.GetProcess(*tx, row.uuid);
    assert(read.has_value());
    assert(*read == row);

    auto duplicate = repo.InsertProcess(*tx, row);
    assert(duplicate.code == ErrorCode::AlreadyExists);
    tx->Rollback();
  }

  {
    auto tx = repo.Begin();
    assert(repo.CompareAndSetState(*tx, row.uuid, "pending", "running"));
    assert(repo.GetProcess(*tx, row.uuid)->state == "running");

    auto stale = repo.CompareAndSetState(*tx, row.uuid, "pending", "cancelled");
    assert(stale.code == ErrorCode::Conflict);

    auto missing = repo.CompareAndSetState(*tx, dispatcher::util::ToString(dispatcher::util::GenerateUUID()), "pending", "running");
    assert(missing.code == ErrorCode::NotFound);
    assert(tx->Commit());
  }

  {
    auto tx = repo.Begin();
    assert(repo.DeleteProcess(*tx, row.uuid));
    assert(!repo.GetProcess(*tx, row.uuid).has_value());
    assert(repo.DeleteProcess(*tx, row.uuid).code == ErrorCode::NotFound);
    assert(tx->Commit());
  }

  auto tx = repo.Begin();
  assert(!repo.GetProcess(*tx, row.uuid).has_value());
  assert(tx->Commit());
}

void VerifyCompareAndAssign(Repository& repo, uint32_t source_id) {
  auto       row        = MakeRow(source_id, "pending", NowMs());
  const auto supervisor = dispatcher::util::ToString(dispatcher::util::GenerateUUID());
  const auto rival      = dispatcher::util::ToString(dispatcher::util::GenerateUUID());

  {
    auto tx = repo.Begin();
    assert(repo.InsertProcess(*tx, row));
    assert(!repo.GetProcess(*tx, row.uuid)->supervisor_id.has_value());
    assert(tx->Commit());
  }

  {
    auto tx = repo.Begin();
    assert(repo.CompareAndAssign(*tx, row.uuid, "pending", "running", supervisor));
    auto read = repo.GetProcess(*tx, row.uuid);
    assert(read->state == "running");
    assert(read->supervisor_id == supervisor);

    auto stale = repo.CompareAndAssign(*tx, row.uuid, "pending", "running", rival);
    assert(stale.code == ErrorCode::Conflict);
    assert(tx->Commit());
  }

  {
    auto tx = repo.Begin();
    assert(repo.CompareAndSetState(*tx, row.uuid, "running", "suspended"));

    // an owned row is never handed to another supervisor
    auto owned = repo.CompareAndAssign(*tx, row.uuid, "suspended", "running", rival);
    assert(owned.code == ErrorCode::Conflict);

    assert(repo.CompareAndSetState(*tx, row.uuid, "suspended", "running"));
    assert(repo.GetProcess(*tx, row.uuid)->supervisor_id == supervisor);

    auto missing =
        repo.CompareAndAssign(*tx, dispatcher::util::ToString(dispatcher::util::GenerateUUID()), "pending", "running", rival);
    assert(missing.code == ErrorCode::NotFound);
    assert(tx->Commit());
  }

  // rolled back claims leave the row unowned
  auto other = MakeRow(source_id, "pending", NowMs());
  {
    auto tx = repo.Begin();
    assert(repo.InsertProcess(*tx, other));
    assert(tx->Commit());
  }
  {
    auto tx = repo.Begin();
    assert(repo.CompareAndAssign(*tx, other.uuid, "pending", "running", rival));
    tx->Rollback();
  }
  {
    auto tx   = repo.Begin();
    auto read = repo.GetProcess(*tx, other.uuid);
    assert(read->state == "pending");
    assert(!read->supervisor_id.has_value());
    assert(tx->Commit());
  }

  auto tx   = repo.Begin();
  auto read = repo.GetProcess(*tx, row.uuid);
  assert(read->state == "running");
  assert(read->supervisor_id == supervisor);
  assert(tx->Commit());
}

void VerifySourcesTable(BackendFactory& backend) {
  if (!backend.exec_sql) {
    return;
  }

  SourceQuery query;
  query.table         = "dispatcher_parity_sources_" + std::to_string(NowMs());
  query.id_column     = "source_ref";
  query.status_column = "lifecycle";
  query.active_status = "run";

  backend.exec_sql("CREATE TABLE " + query.table + " (source_ref BIGINT PRIMARY KEY, lifecycle VARCHAR(16) NOT NULL)");
  backend.exec_sql("INSERT INTO " + query.table +
                   " (source_ref, lifecycle) VALUES (3, 'run'), (1, 'run'), (2, 'stopped'), (5, 'RUN'),"
                   " (4, 'run'), (4294967296, 'run')");

  auto reader = backend.make_source_reader(query);

  // status matches exactly; ids come back ordered and unfiltered
  assert((reader->ReadActiveSourceIds() == std::vector<std::int64_t>{1, 3, 4, 4'294'967'296LL}));

  dispatcher::source::DatabaseSourceCatalog catalog(reader);
  assert((catalog.ActiveSourceIds() == std::vector<std::uint32_t>{1, 3, 4}));

  backend.exec_sql("UPDATE " + query.table + " SET lifecycle = 'run' WHERE source_ref = 2");
  backend.exec_sql("UPDATE " + query.table + " SET lifecycle = 'stopped' WHERE source_ref = 3");
  assert((catalog.ActiveSourceIds() == std::vector<std::uint32_t>{1, 2, 4}));

  auto other_status          = query;
  other_status.active_status = "stopped";
  assert((backend.make_source_reader(other_status)->ReadActiveSourceIds() == std::vector<std::int64_t>{3}));

  backend.exec_sql("DROP TABLE " + query.table);

  bool thrown = false;
  try {
    reader->ReadActiveSourceIds();
  } catch (const dispatcher::db::DbError&) {
    thrown = true;
  }
  assert(thrown);
}

void VerifyRollbackBehavior(Repository& repo, uint32_t source_id) {
  auto row = MakeRow(source_id, "pending", NowMs());

  {
    auto tx = repo.Begin();
    assert(repo.InsertProcess(*tx, row));
    tx->Rollback();
  }
  {
    auto tx = repo.Begin();
    assert(!repo.GetProcess(*tx, row.uuid).has_value());
    assert(repo.InsertProcess(*tx, row));
    assert(tx->Commit());
  }
  {
    // abandoned without commit or rollback
    auto tx = repo.Begin();
    assert(repo.CompareAndSetState(*tx, row.uuid, "pending", "running"));
  }

  auto tx = repo.Begin();
  assert(repo.GetProcess(*tx, row.uuid)->state == "pending");
  assert(tx->Commit());
}

void VerifyOrderingQueries(Repository& repo, uint32_t source_id) {
  const int64_t base = NowMs();

  std::vector<ProcessRow> rows = {
      MakeRow(source_id, "completed", base + 10),
      MakeRow(source_id, "pending", base + 30),
      MakeRow(source_id, "running", base + 20),
      MakeRow(source_id + 1, "pending", base + 5),
  };

  {
    auto tx = repo.Begin();
    for (const auto& row : rows) assert(repo.InsertProcess(*tx, row));
    assert(tx->Commit());
  }

  auto tx = repo.Begin();

  auto listed = repo.ListProcessesBySource(*tx, source_id);
  assert(listed.size() == 3);
  assert(listed[0].uuid == rows[0].uuid);
  assert(listed[1].uuid == rows[2].uuid);
  assert(listed[2].uuid == rows[1].uuid);
  assert(listed[1].created_at_ms == base + 20);

  auto latest = repo.LatestProcessForSource(*tx, source_id);
  assert(latest.has_value());
  assert(latest->uuid == rows[1].uuid);
  assert(!repo.LatestProcessForSource(*tx, source_id + 50).has_value());

  auto pending = repo.ListProcessesInState(*tx, "pending", 1000);
  std::size_t ours = 0;
  int64_t     prev = 0;
  for (const auto& row : pending) {
    assert(row.state == "pending");
    assert(row.created_at_ms >= prev);
    prev = row.created_at_ms;
    if (row.uuid == rows[1].uuid || row.uuid == rows[3].uuid) ++ours;
  }
  // a long-lived database may hold more pending rows than the limit
  assert(ours == 2 || pending.size() == 1000);
  assert(repo.ListProcessesInState(*tx, "pending", 1).size() == 1);

  bool saw_completed = false;
  for (const auto& [state, count] : repo.CountProcessesByState(*tx)) {
    if (state == "completed") saw_completed = count >= 1;
  }
  assert(saw_completed);

  assert(tx->Commit());
}

void VerifyBoundaryValues(Repository& repo) {
  auto row      = MakeRow(4'294'967'295u, "suspended", NowMs());
  row.type      = 255;

  {
    auto tx = repo.Begin();
    assert(repo.InsertProcess(*tx, row));
    assert(tx->Commit());
  }

  auto tx   = repo.Begin();
  auto read = repo.GetProcess(*tx, row.uuid);
  assert(read.has_value());
  assert(read->source_id == 4'294'967'295LL);
  assert(read->type == 255);
  assert(read->state == "suspended");
  assert(read->created_at_ms == row.created_at_ms);
  assert(repo.DeleteProcess(*tx, row.uuid));
  assert(tx->Commit());
}

void VerifyConcurrentCompareAndSet(Repository& repo, uint32_t source_id, bool supports_parallel_transactions) {
  auto row = MakeRow(source_id, "running", NowMs());
  {
    auto tx = repo.Begin();
    assert(repo.InsertProcess(*tx, row));
    assert(tx->Commit());
  }

  if (supports_parallel_transactions) {
    // both read running, both write; only one commit may land
    auto tx1 = repo.Begin();
    auto tx2 = repo.Begin();
    assert(repo.GetProcess(*tx1, row.uuid)->state == "running");
    assert(repo.GetProcess(*tx2, row.uuid)->state == "running");

    auto first = repo.CompareAndSetState(*tx1, row.uuid, "running", "completed");
    assert(first);
    auto first_commit = tx1->Commit();
    assert(first_commit);

    auto second = repo.CompareAndSetState(*tx2, row.uuid, "running", "failed");
    dispatcher::db::Result second_commit;
    if (second) {
      second_commit = tx2->Commit();
    } else {
      tx2->Rollback();
    }
    assert(!second || !second_commit);
  } else {
    std::vector<std::thread> threads;
    std::atomic<int>         applied{0};
    for (const char* target : {"completed", "failed", "cancelled"}) {
      threads.emplace_back([&, target] {
        auto tx = repo.Begin();
        if (repo.CompareAndSetState(*tx, row.uuid, "running", target) && tx->Commit()) ++applied;
      });
    }
    for (auto& t : threads) t.join();
    assert(applied == 1);
  }

  auto tx    = repo.Begin();
  auto final = repo.GetProcess(*tx, row.uuid);
  assert(final.has_value());
  assert(final->state != "running");
  assert(tx->Commit());
}

void VerifyRestartDurability(BackendFactory& backend, uint32_t source_id) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo         = backend.make_repository();
  auto row          = MakeRow(source_id, "running", NowMs());
  row.supervisor_id = dispatcher::util::ToString(dispatcher::util::GenerateUUID());
  {
    auto tx = repo->Begin();
    assert(repo->InsertProcess(*tx, row));
    assert(tx->Commit());
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto p  = repo->GetProcess(*tx, row.uuid);
  assert(p.has_value());
  assert(*p == row);
  assert(tx->Commit());
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if DISPATCHER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path =
      (std::filesystem::temp_directory_path() / ("process_dispatcher_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<dispatcher::db::sqlite::SqliteDB>(db_path);
    for (const auto& sql : dispatcher::db::sql::SqliteSchema()) {
      db->Exec(sql);
    }
    return std::make_shared<dispatcher::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
      .exec_sql                       = [db_path](const std::string& sql) {
        dispatcher::db::sqlite::SqliteDB writer(db_path);
        writer.Exec(sql);
      },
      .make_source_reader             = [db_path](const SourceQuery& query) -> std::shared_ptr<SourceReader> {
        auto db = std::make_shared<dispatcher::db::sqlite::SqliteDB>(db_path,
                                                                     dispatcher::db::sqlite::SqliteDB::OpenMode::kReadOnly);
        return std::make_shared<dispatcher::db::sqlite::SqliteSourceReader>(std::move(db), query);
      },
  };
}
#endif

#if DISPATCHER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("DISPATCHER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("DISPATCHER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto       pool = std::make_shared<dispatcher::db::postgres::PgPool>(conninfo);
    {
      auto       conn = pool->Acquire();
      pqxx::work tx(*conn);
      for (const auto& sql : dispatcher::db::sql::PostgresSchema()) {
        tx.exec(sql);
      }
      tx.commit();
    }
    return std::make_shared<dispatcher::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
      .exec_sql                       = [conninfo](const std::string& sql) {
        pqxx::connection conn(conninfo);
        pqxx::work       tx(conn);
        tx.exec(sql);
        tx.commit();
      },
      .make_source_reader             = [conninfo](const SourceQuery& query) -> std::shared_ptr<SourceReader> {
        // sources-only pool: no dispatcher statements
        auto pool = std::make_shared<dispatcher::db::postgres::PgPool>(conninfo, 1, false);
        return std::make_shared<dispatcher::db::postgres::PgSourceReader>(std::move(pool), query);
      },
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto       repo = backend.make_repository();
  const auto base = BaseSource();

  VerifyInsertGetCompareAndSetDelete(*repo, base + 1);
  VerifyCompareAndAssign(*repo, base + 3);
  VerifyRollbackBehavior(*repo, base + 2);
  VerifyOrderingQueries(*repo, base + 10);
  VerifyBoundaryValues(*repo);
  VerifyConcurrentCompareAndSet(*repo, base + 20, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend, base + 30);
  VerifySourcesTable(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if DISPATCHER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if DISPATCHER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "process_dispatcher_integration_repository_parity: pass\n";
  return 0;
}
