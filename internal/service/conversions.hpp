#pragma once

#include "api/dispatcher/v1.hpp"
#include "internal/model/process.hpp"

namespace dispatcher::service {

dispatcher::v1::ProcessRecord ToProto(const model::ProcessRecord& record);

dispatcher::v1::ProcessState ToProto(model::ProcessState state);

// PROCESS_STATE_UNSPECIFIED and unknown values throw util::DecodeError(kUnknownState).
model::ProcessState FromProto(dispatcher::v1::ProcessState state);

} // namespace dispatcher::service
