#include "source_catalog.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace dispatcher::source {

namespace {

std::vector<std::uint32_t> Normalize(std::vector<std::uint32_t> ids) {
  std::sort(ids.begin(), ids.end());
  ids.erase(std::unique(ids.begin(), ids.end()), ids.end());
  return ids;
}

} // namespace

StaticSourceCatalog::StaticSourceCatalog(std::vector<std::uint32_t> source_ids)
    : source_ids_(Normalize(std::move(source_ids))) {
}

std::vector<std::uint32_t> StaticSourceCatalog::ActiveSourceIds() const {
  std::lock_guard lock(mutex_);
  return source_ids_;
}

void StaticSourceCatalog::Replace(std::vector<std::uint32_t> source_ids) {
  auto normalized = Normalize(std::move(source_ids));
  std::lock_guard lock(mutex_);
  source_ids_ = std::move(normalized);
}

DatabaseSourceCatalog::DatabaseSourceCatalog(std::shared_ptr<db::SourceReader> reader) : reader_(std::move(reader)) {
  if (!reader_) {
    throw std::invalid_argument("DatabaseSourceCatalog: reader is null");
  }
}

std::vector<std::uint32_t> DatabaseSourceCatalog::ActiveSourceIds() const {
  const auto raw = reader_->ReadActiveSourceIds();

  std::vector<std::uint32_t> ids;
  ids.reserve(raw.size());
  for (auto id : raw) {
    if (id < 0 || id > std::numeric_limits<std::uint32_t>::max()) {
      DISPATCHER_LOG_WARN("skipping source id out of range", {observability::IntField("source_id", id)});
      continue;
    }
    ids.push_back(static_cast<std::uint32_t>(id));
  }

  ids = Normalize(std::move(ids));
  DISPATCHER_LOG_DEBUG("active sources read", {observability::SizeField("rows", raw.size()),
                                               observability::SizeField("active", ids.size())});
  return ids;
}

} // namespace dispatcher::source
