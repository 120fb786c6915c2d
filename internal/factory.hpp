#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace dispatcher::registry {
class RegistryStore;
}
namespace dispatcher::source {
class SourceBinding;
class SourceCatalog;
}
namespace dispatcher::dispatch {
class Dispatcher;
class ScheduleWorker;
}
namespace dispatcher::service {
class RegistryService;
class DispatchService;
}

namespace dispatcher::factory {

/*
  Application

  Owns all long-lived objects used by the server. Everything here lives
  for the lifetime of the process. The schedule worker is only built
  when the scheduler is enabled, and is not started by Build().
*/
struct Application {
  std::shared_ptr<db::Repository> repository;

  std::shared_ptr<registry::RegistryStore>     store;
  std::shared_ptr<source::SourceCatalog>       catalog;
  std::shared_ptr<source::SourceBinding>       sources;
  std::shared_ptr<dispatch::Dispatcher>        dispatcher;

  std::shared_ptr<service::RegistryService> registry_service;
  std::shared_ptr<service::DispatchService> dispatch_service;

  std::shared_ptr<dispatch::ScheduleWorker> schedule_worker;
};

/*
  Selects and bootstraps the configured backend. Backends compiled out
  of this build are rejected with std::runtime_error.
*/
std::shared_ptr<db::Repository> BuildRepository(const dispatcher::runtime::config::RuntimeConfig& config);

/*
  Configured source list, or a catalog that re-reads the sources table
  each cycle when scheduler.sources_table is set.
*/
std::shared_ptr<source::SourceCatalog> BuildSourceCatalog(const dispatcher::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root of the application. It is the ONLY place allowed to
  know concrete DB types.
*/
Application Build(const dispatcher::runtime::config::RuntimeConfig& config);

} // namespace dispatcher::factory
