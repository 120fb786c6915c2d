#include "registry_server.hpp"

#include "grpc_error.hpp"

namespace dispatcher::grpc {

RegistryServer::RegistryServer(std::shared_ptr<dispatcher::service::RegistryService> svc) : service_(std::move(svc)) {
}

::grpc::Status RegistryServer::CreateProcess(::grpc::ServerContext*, const dispatcher::v1::CreateProcessRequest* req,
                                             dispatcher::v1::CreateProcessResponse* resp) {
  try {
    *resp = service_->CreateProcess(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::GetProcess(::grpc::ServerContext*, const dispatcher::v1::GetProcessRequest* req,
                                          dispatcher::v1::GetProcessResponse* resp) {
  try {
    *resp = service_->GetProcess(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::UpdateProcessState(::grpc::ServerContext*, const dispatcher::v1::UpdateProcessStateRequest* req,
                                                  dispatcher::v1::UpdateProcessStateResponse* resp) {
  try {
    *resp = service_->UpdateProcessState(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::ListProcessesBySource(::grpc::ServerContext* context,
                                                     const dispatcher::v1::ListProcessesBySourceRequest* req,
                                                     ::grpc::ServerWriter<dispatcher::v1::ProcessRecord>* writer) {
  try {
    service_->ListProcessesBySource(*req, [&](const dispatcher::v1::ProcessRecord& record) {
      if (context->IsCancelled()) {
        return false;
      }
      return writer->Write(record);
    });
    if (context->IsCancelled()) {
      return {::grpc::StatusCode::CANCELLED, "client cancelled the stream"};
    }
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RegistryServer::DeleteProcess(::grpc::ServerContext*, const dispatcher::v1::DeleteProcessRequest* req,
                                             dispatcher::v1::DeleteProcessResponse* resp) {
  try {
    *resp = service_->DeleteProcess(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatcher::grpc
