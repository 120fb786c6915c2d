#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "dispatcher/v1/registry_service.grpc.pb.h"
#include "internal/service/registry_service.hpp"

namespace dispatcher::grpc {

class RegistryServer final : public dispatcher::v1::ProcessRegistryService::Service {
 public:
  explicit RegistryServer(std::shared_ptr<dispatcher::service::RegistryService> svc);

  ::grpc::Status CreateProcess(::grpc::ServerContext*, const dispatcher::v1::CreateProcessRequest*,
                               dispatcher::v1::CreateProcessResponse*) override;

  ::grpc::Status GetProcess(::grpc::ServerContext*, const dispatcher::v1::GetProcessRequest*,
                            dispatcher::v1::GetProcessResponse*) override;

  ::grpc::Status UpdateProcessState(::grpc::ServerContext*, const dispatcher::v1::UpdateProcessStateRequest*,
                                    dispatcher::v1::UpdateProcessStateResponse*) override;

  ::grpc::Status ListProcessesBySource(::grpc::ServerContext*, const dispatcher::v1::ListProcessesBySourceRequest*,
                                       ::grpc::ServerWriter<dispatcher::v1::ProcessRecord>*) override;

  ::grpc::Status DeleteProcess(::grpc::ServerContext*, const dispatcher::v1::DeleteProcessRequest*,
                               dispatcher::v1::DeleteProcessResponse*) override;

 private:
  std::shared_ptr<dispatcher::service::RegistryService> service_;
};

} // namespace dispatcher::grpc
