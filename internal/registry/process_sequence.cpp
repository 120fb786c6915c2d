#include "process_sequence.hpp"

#include <utility>

#include "internal/codec/record_codec.hpp"

namespace dispatcher::registry {

ProcessSequence::ProcessSequence(std::vector<db::model::ProcessRow> rows) : rows_(std::move(rows)) {
}

std::optional<model::ProcessRecord> ProcessSequence::Next() {
  if (next_ >= rows_.size()) {
    return std::nullopt;
  }
  // advance first so a decode failure does not pin the cursor
  const auto& row = rows_[next_++];
  return codec::RecordCodec::Decode(row);
}

} // namespace dispatcher::registry
