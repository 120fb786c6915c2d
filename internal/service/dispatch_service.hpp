#pragma once

#include "api/dispatcher/v1.hpp"
#include "internal/util/cancellation.hpp"
#include "service_context.hpp"

namespace dispatcher::service {

class DispatchService {
 public:
  explicit DispatchService(ServiceContext ctx);

  dispatcher::v1::AssignProcessResponse AssignProcess(const dispatcher::v1::AssignProcessRequest& req);

  // Runs a full cycle on the caller's thread.
  dispatcher::v1::RunScheduleCycleResponse RunScheduleCycle(const dispatcher::v1::RunScheduleCycleRequest& req,
                                                            const util::CancellationToken& cancel);

  dispatcher::v1::StatsResponse Stats(const dispatcher::v1::StatsRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatcher::service
