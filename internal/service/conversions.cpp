#include "conversions.hpp"

#include <string>

#include "internal/util/errors.hpp"

namespace dispatcher::service {

using dispatcher::v1::ProcessState;

dispatcher::v1::ProcessRecord ToProto(const model::ProcessRecord& record) {
  dispatcher::v1::ProcessRecord out;
  out.set_id(util::ToString(record.id));
  out.set_source_id(record.source_id);
  out.set_state(ToProto(record.state));
  out.set_type(record.type);
  out.set_created_at_ms(util::ToUnixMillis(record.created_at));
  if (record.supervisor_id) {
    out.set_supervisor_id(util::ToString(*record.supervisor_id));
  }
  return out;
}

ProcessState ToProto(model::ProcessState state) {
  switch (state) {
    case model::ProcessState::kPending:
      return dispatcher::v1::PROCESS_STATE_PENDING;
    case model::ProcessState::kRunning:
      return dispatcher::v1::PROCESS_STATE_RUNNING;
    case model::ProcessState::kSuspended:
      return dispatcher::v1::PROCESS_STATE_SUSPENDED;
    case model::ProcessState::kCompleted:
      return dispatcher::v1::PROCESS_STATE_COMPLETED;
    case model::ProcessState::kFailed:
      return dispatcher::v1::PROCESS_STATE_FAILED;
    case model::ProcessState::kCancelled:
      return dispatcher::v1::PROCESS_STATE_CANCELLED;
  }
  return dispatcher::v1::PROCESS_STATE_UNSPECIFIED;
}

model::ProcessState FromProto(ProcessState state) {
  switch (state) {
    case dispatcher::v1::PROCESS_STATE_PENDING:
      return model::ProcessState::kPending;
    case dispatcher::v1::PROCESS_STATE_RUNNING:
      return model::ProcessState::kRunning;
    case dispatcher::v1::PROCESS_STATE_SUSPENDED:
      return model::ProcessState::kSuspended;
    case dispatcher::v1::PROCESS_STATE_COMPLETED:
      return model::ProcessState::kCompleted;
    case dispatcher::v1::PROCESS_STATE_FAILED:
      return model::ProcessState::kFailed;
    case dispatcher::v1::PROCESS_STATE_CANCELLED:
      return model::ProcessState::kCancelled;
    default:
      break;
  }
  throw util::DecodeError(util::DecodeErrorCode::kUnknownState,
                          "unknown process state value " + std::to_string(static_cast<int>(state)));
}

} // namespace dispatcher::service
