#include "record_codec.hpp"

#include <chrono>
#include <limits>

#include "internal/util/errors.hpp"

namespace dispatcher::codec {

using util::DecodeError;
using util::DecodeErrorCode;

namespace {

constexpr int64_t kMaxSourceId = std::numeric_limits<uint32_t>::max();
constexpr int64_t kMaxType     = std::numeric_limits<uint8_t>::max();

void CheckRange(const char* field, int64_t value, int64_t max) {
  if (value < 0 || value > max) {
    throw DecodeError(DecodeErrorCode::kFieldOverflow,
                      std::string(field) + " out of range: " + std::to_string(value) + " not in [0, " + std::to_string(max) + "]");
  }
}

// Milliseconds representable by util::TimePoint without overflow.
constexpr int64_t kMinCreatedAtMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(util::TimePoint::min().time_since_epoch()).count();
constexpr int64_t kMaxCreatedAtMs =
    std::chrono::duration_cast<std::chrono::milliseconds>(util::TimePoint::max().time_since_epoch()).count();

void CheckTimestamp(int64_t ms) {
  if (ms < kMinCreatedAtMs || ms > kMaxCreatedAtMs) {
    throw DecodeError(DecodeErrorCode::kFieldOverflow, "created_at out of range: " + std::to_string(ms) + " ms");
  }
}

model::ProcessId ParseIdField(const std::string& field, const std::string& text) {
  auto id = util::ParseCanonical(text);
  if (!id) {
    throw DecodeError(DecodeErrorCode::kMalformedIdentifier, "malformed " + field + ": '" + text + "'");
  }
  return *id;
}

} // namespace

db::model::ProcessRow RecordCodec::Encode(const model::ProcessRecord& record) {
  db::model::ProcessRow row;
  row.uuid          = util::ToString(record.id);
  row.source_id     = record.source_id;
  row.state         = model::ToString(record.state);
  row.type          = record.type;
  row.created_at_ms = util::ToUnixMillis(record.created_at);
  if (record.supervisor_id) {
    row.supervisor_id = util::ToString(*record.supervisor_id);
  }
  return row;
}

model::ProcessRecord RecordCodec::Decode(const db::model::ProcessRow& row) {
  CheckRange("source_id", row.source_id, kMaxSourceId);
  CheckRange("type", row.type, kMaxType);
  CheckTimestamp(row.created_at_ms);

  model::ProcessRecord record;
  record.id         = DecodeId(row.uuid);
  record.source_id  = static_cast<uint32_t>(row.source_id);
  record.state      = DecodeState(row.state);
  record.type       = static_cast<uint8_t>(row.type);
  record.created_at = util::FromUnixMillis(row.created_at_ms);
  if (row.supervisor_id) {
    record.supervisor_id = ParseIdField("supervisor id", *row.supervisor_id);
  }
  return record;
}

void RecordCodec::ValidateNew(int64_t source_id, int64_t type) {
  CheckRange("source_id", source_id, kMaxSourceId);
  CheckRange("type", type, kMaxType);
}

model::ProcessId RecordCodec::DecodeId(const std::string& text) {
  auto id = util::ParseCanonical(text);
  if (!id) {
    throw DecodeError(DecodeErrorCode::kMalformedIdentifier, "malformed process id: '" + text + "'");
  }
  return *id;
}

model::ProcessState RecordCodec::DecodeState(const std::string& text) {
  if (text.size() > model::kMaxStateNameLength) {
    throw DecodeError(DecodeErrorCode::kFieldOverflow, "state name longer than " + std::to_string(model::kMaxStateNameLength) + " characters");
  }

  auto state = model::ParseProcessState(text);
  if (!state) {
    throw DecodeError(DecodeErrorCode::kUnknownState, "unknown process state: '" + text + "'");
  }
  return *state;
}

} // namespace dispatcher::codec
