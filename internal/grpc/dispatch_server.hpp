#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatcher/v1/dispatch_service.grpc.pb.h"
#include "internal/service/dispatch_service.hpp"

namespace dispatcher::grpc {

class DispatchServer final : public dispatcher::v1::DispatchService::Service {
 public:
  explicit DispatchServer(std::shared_ptr<dispatcher::service::DispatchService> svc);

  ::grpc::Status AssignProcess(::grpc::ServerContext*, const dispatcher::v1::AssignProcessRequest*,
                               dispatcher::v1::AssignProcessResponse*) override;

  ::grpc::Status RunScheduleCycle(::grpc::ServerContext*, const dispatcher::v1::RunScheduleCycleRequest*,
                                  dispatcher::v1::RunScheduleCycleResponse*) override;

  ::grpc::Status Stats(::grpc::ServerContext*, const dispatcher::v1::StatsRequest*, dispatcher::v1::StatsResponse*) override;

 private:
  std::shared_ptr<dispatcher::service::DispatchService> service_;
};

} // namespace dispatcher::grpc
