#include "dispatch_server.hpp"

#include "grpc_error.hpp"

namespace dispatcher::grpc {

DispatchServer::DispatchServer(std::shared_ptr<dispatcher::service::DispatchService> svc) : service_(std::move(svc)) {
}

::grpc::Status DispatchServer::AssignProcess(::grpc::ServerContext*, const dispatcher::v1::AssignProcessRequest* req,
                                             dispatcher::v1::AssignProcessResponse* resp) {
  try {
    *resp = service_->AssignProcess(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

// The cycle is not tied to the call's cancellation; a started cycle finishes.
::grpc::Status DispatchServer::RunScheduleCycle(::grpc::ServerContext*, const dispatcher::v1::RunScheduleCycleRequest* req,
                                                dispatcher::v1::RunScheduleCycleResponse* resp) {
  try {
    util::CancellationToken never_cancelled;
    *resp = service_->RunScheduleCycle(*req, never_cancelled);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status DispatchServer::Stats(::grpc::ServerContext*, const dispatcher::v1::StatsRequest* req,
                                     dispatcher::v1::StatsResponse* resp) {
  try {
    *resp = service_->Stats(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace dispatcher::grpc
