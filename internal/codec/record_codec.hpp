#pragma once

#include <cstdint>
#include <string>

#include "internal/db/model/process_row.hpp"
#include "internal/model/process.hpp"

namespace dispatcher::codec {

/*
  Converts between the in-memory ProcessRecord and its persisted row.

  Pure functions. Decode never coerces: a row that violates a field
  constraint raises util::DecodeError naming the violated constraint.
*/
class RecordCodec {
 public:
  static db::model::ProcessRow Encode(const model::ProcessRecord& record);

  static model::ProcessRecord Decode(const db::model::ProcessRow& row);

  // Validates raw creation inputs (as received from the wire) before a
  // record exists. Throws DecodeError(kFieldOverflow).
  static void ValidateNew(int64_t source_id, int64_t type);

  static model::ProcessId DecodeId(const std::string& text);
  static model::ProcessState DecodeState(const std::string& text);
};

} // namespace dispatcher::codec
