#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

#include "internal/db/api/source_reader.hpp"

namespace dispatcher::source {

/*
  Seam to the external sources subsystem.

  Only the set of currently active source ids is needed here; source
  ownership and metadata stay with that subsystem.
*/
class SourceCatalog {
 public:
  virtual ~SourceCatalog() = default;

  // Ascending, without duplicates.
  virtual std::vector<std::uint32_t> ActiveSourceIds() const = 0;
};

// Fixed list, fed from configuration. Replaceable at runtime.
class StaticSourceCatalog final : public SourceCatalog {
 public:
  StaticSourceCatalog() = default;
  explicit StaticSourceCatalog(std::vector<std::uint32_t> source_ids);

  std::vector<std::uint32_t> ActiveSourceIds() const override;

  void Replace(std::vector<std::uint32_t> source_ids);

 private:
  mutable std::mutex         mutex_;
  std::vector<std::uint32_t> source_ids_;
};

/*
  Re-reads the sources table on every call, so a source switched to or
  from the active status is picked up by the next schedule cycle.

  Ids outside 0..4294967295 cannot name a source and are skipped with a
  warning. Reader failures propagate as DbError.
*/
class DatabaseSourceCatalog final : public SourceCatalog {
 public:
  explicit DatabaseSourceCatalog(std::shared_ptr<db::SourceReader> reader);

  std::vector<std::uint32_t> ActiveSourceIds() const override;

 private:
  std::shared_ptr<db::SourceReader> reader_;
};

} // namespace dispatcher::source
