#include "source_binding.hpp"

#include <stdexcept>
#include <utility>

namespace dispatcher::source {

SourceBinding::SourceBinding(std::shared_ptr<registry::RegistryStore> store) : store_(std::move(store)) {
  if (!store_) {
    throw std::invalid_argument("SourceBinding: store is null");
  }
}

registry::ProcessSequence SourceBinding::RecordsForSource(std::uint32_t source_id) {
  return store_->ListBySource(source_id);
}

} // namespace dispatcher::source
