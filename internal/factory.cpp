#include "factory.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/source_reader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sql/schema.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/dispatch/schedule_worker.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/registry_store.hpp"
#include "internal/service/dispatch_service.hpp"
#include "internal/service/registry_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/source/source_binding.hpp"
#include "internal/source/source_catalog.hpp"
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

namespace dispatcher::factory {

using dispatcher::runtime::config::RuntimeConfig;

namespace {

#if DISPATCHER_DB_SQLITE
void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  for (const auto& sql : db::sql::SqliteSchema()) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT uuid,source_id,state,type,created_at,supervisor_id FROM dispatcher_processes LIMIT 1;");
}
#endif

#if DISPATCHER_DB_POSTGRES
void BootstrapPostgresSchema(const std::shared_ptr<db::postgres::PgPool>& pool) {
  auto       conn = pool->Acquire();
  pqxx::work tx(*conn);

  for (const auto& sql : db::sql::PostgresSchema()) {
    tx.exec(sql);
  }

  tx.exec("SELECT uuid,source_id,state,type,created_at,supervisor_id FROM dispatcher_processes LIMIT 1;");
  tx.commit();
}
#endif

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if DISPATCHER_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    BootstrapSqliteSchema(sqlite_db);
    DISPATCHER_LOG_INFO("using sqlite backend", {observability::StringField("path", database.sqlite().path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw std::runtime_error("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if DISPATCHER_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(),
                                                       database.postgres().max_connections());
    BootstrapPostgresSchema(pool);
    DISPATCHER_LOG_INFO("using postgres backend",
                        {observability::IntField("max_connections", database.postgres().max_connections())});
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw std::runtime_error("postgres backend requested but not enabled at build time");
#endif
  }

  DISPATCHER_LOG_WARN("using in-memory backend, records are lost on exit");
  return std::make_shared<db::memory::MemoryRepository>();
}

std::shared_ptr<source::SourceCatalog> BuildSourceCatalog(const RuntimeConfig& config) {
  const auto& scheduler = config.scheduler();
  if (!scheduler.has_sources_table()) {
    DISPATCHER_LOG_INFO("using configured source list",
                        {observability::IntField("sources", scheduler.active_source_ids_size())});
    return std::make_shared<source::StaticSourceCatalog>(
        std::vector<std::uint32_t>(scheduler.active_source_ids().begin(), scheduler.active_source_ids().end()));
  }

  const auto&     table = scheduler.sources_table();
  db::SourceQuery query;
  query.table         = table.table();
  query.id_column     = table.id_column();
  query.status_column = table.status_column();
  query.active_status = table.active_status();

  if (table.has_sqlite()) {
#if DISPATCHER_DB_SQLITE
    auto sqlite_db =
        std::make_shared<db::sqlite::SqliteDB>(table.sqlite().path(), db::sqlite::SqliteDB::OpenMode::kReadOnly);
    DISPATCHER_LOG_INFO("reading sources from sqlite", {observability::StringField("path", table.sqlite().path()),
                                                        observability::StringField("table", query.table)});
    return std::make_shared<source::DatabaseSourceCatalog>(
        std::make_shared<db::sqlite::SqliteSourceReader>(std::move(sqlite_db), std::move(query)));
#else
    throw std::runtime_error("sqlite sources table requested but sqlite is not enabled at build time");
#endif
  }

  if (table.has_postgres()) {
#if DISPATCHER_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(table.postgres().connection_uri(),
                                                       table.postgres().max_connections(), false);
    DISPATCHER_LOG_INFO("reading sources from postgres", {observability::StringField("table", query.table)});
    return std::make_shared<source::DatabaseSourceCatalog>(
        std::make_shared<db::postgres::PgSourceReader>(std::move(pool), std::move(query)));
#else
    throw std::runtime_error("postgres sources table requested but postgres is not enabled at build time");
#endif
  }

  throw std::runtime_error("scheduler.sources_table has no backend");
}

/*
    Build full application dependency graph
*/
Application Build(const RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Persistence
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  registry::RegistryOptions registry_options;
  registry_options.id_generation_attempts = config.registry().id_generation_attempts();
  registry_options.update_attempts        = config.registry().update_attempts();
  app.store = std::make_shared<registry::RegistryStore>(app.repository, registry_options);

  // ------------------------------------------------------------------
  // Sources and dispatch
  // ------------------------------------------------------------------
  const auto& scheduler = config.scheduler();
  app.catalog = BuildSourceCatalog(config);
  app.sources = std::make_shared<source::SourceBinding>(app.store);

  dispatch::DispatcherOptions dispatcher_options;
  dispatcher_options.process_type       = static_cast<std::uint8_t>(scheduler.process_type());
  dispatcher_options.day_offset_minutes = scheduler.day_offset_minutes();
  dispatcher_options.assign_batch_size  = scheduler.assign_batch_size();
  app.dispatcher = std::make_shared<dispatch::Dispatcher>(app.store, app.catalog, dispatcher_options);

  if (scheduler.enabled()) {
    app.schedule_worker =
        std::make_shared<dispatch::ScheduleWorker>(app.dispatcher, std::chrono::milliseconds(scheduler.interval_ms()));
  }

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.store      = app.store;
  ctx.sources    = app.sources;
  ctx.dispatcher = app.dispatcher;

  app.registry_service = std::make_shared<service::RegistryService>(ctx);
  app.dispatch_service = std::make_shared<service::DispatchService>(ctx);

  return app;
}

} // namespace dispatcher::factory
