#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "internal/db/model/process_row.hpp"
#include "internal/model/process.hpp"

namespace dispatcher::registry {

/*
  Single-pass cursor over the rows a listing query returned.

  Rows are decoded one at a time as Next() is called. A row that fails to
  decode raises util::DecodeError from that Next() call; the rows before
  it have already been handed out and the cursor stays positioned after
  the bad row.
*/
class ProcessSequence {
 public:
  ProcessSequence() = default;
  explicit ProcessSequence(std::vector<db::model::ProcessRow> rows);

  // std::nullopt once exhausted.
  std::optional<model::ProcessRecord> Next();

  std::size_t Remaining() const {
    return rows_.size() - next_;
  }

 private:
  std::vector<db::model::ProcessRow> rows_;
  std::size_t                        next_ = 0;
};

} // namespace dispatcher::registry
