#pragma once

#include <memory>

namespace dispatcher::registry {
class RegistryStore;
}
namespace dispatcher::source {
class SourceBinding;
}
namespace dispatcher::dispatch {
class Dispatcher;
}

namespace dispatcher::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<dispatcher::registry::RegistryStore> store;
  std::shared_ptr<dispatcher::source::SourceBinding>   sources;
  std::shared_ptr<dispatcher::dispatch::Dispatcher>    dispatcher;
};

} // namespace dispatcher::service
