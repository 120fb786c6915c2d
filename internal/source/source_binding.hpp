#pragma once

#include <cstdint>
#include <memory>

#include "internal/registry/process_sequence.hpp"
#include "internal/registry/registry_store.hpp"

namespace dispatcher::source {

/*
  Source-centric view of the registry.

  source_id is a weak reference: nothing checks that the source exists,
  and removing a source leaves its records in place.
*/
class SourceBinding {
 public:
  explicit SourceBinding(std::shared_ptr<registry::RegistryStore> store);

  // Oldest first; same semantics as RegistryStore::ListBySource.
  registry::ProcessSequence RecordsForSource(std::uint32_t source_id);

 private:
  std::shared_ptr<registry::RegistryStore> store_;
};

} // namespace dispatcher::source
