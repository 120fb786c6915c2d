#pragma once

#include <cstdint>
#include <optional>

#include "internal/model/process_state.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace dispatcher::model {

using ProcessId    = util::UUID;
using SupervisorId = util::UUID;

// Process kinds the dispatcher itself creates. Any 0..255 value is storable.
inline constexpr std::uint8_t kProcessTypeRegular = 1;
inline constexpr std::uint8_t kProcessTypeSandbox = 2;

/*
  One dispatcher-managed process.

  id, source_id, type and created_at never change after insert;
  state only moves along state machine edges. supervisor_id is set
  once, when a supervisor claims the pending process.
*/
struct ProcessRecord {
  ProcessId id{};

  // Weak reference into the external sources subsystem.
  std::uint32_t source_id = 0;

  ProcessState state = ProcessState::kPending;

  std::uint8_t type = 0;

  // Millisecond precision.
  util::TimePoint created_at{};

  std::optional<SupervisorId> supervisor_id;

  bool operator==(const ProcessRecord&) const = default;
};

} // namespace dispatcher::model
