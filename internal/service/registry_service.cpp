#include "registry_service.hpp"

#include <stdexcept>
#include <utility>

#include "conversions.hpp"
#include "internal/codec/record_codec.hpp"
#include "internal/registry/registry_store.hpp"
#include "internal/source/source_binding.hpp"
#include "rpc_guard.hpp"

namespace dispatcher::service {

using namespace dispatcher::v1;

RegistryService::RegistryService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.sources) {
    throw std::invalid_argument("RegistryService: store and source binding are required");
  }
}

CreateProcessResponse RegistryService::CreateProcess(const CreateProcessRequest& req) {
  return GuardRpc("ProcessRegistryService.CreateProcess", [&] {
    codec::RecordCodec::ValidateNew(req.source_id(), req.type());

    CreateProcessResponse resp;
    *resp.mutable_process() = ToProto(ctx_.store->Create(req.source_id(), static_cast<uint8_t>(req.type())));
    return resp;
  });
}

GetProcessResponse RegistryService::GetProcess(const GetProcessRequest& req) {
  return GuardRpc("ProcessRegistryService.GetProcess", [&] {
    GetProcessResponse resp;
    *resp.mutable_process() = ToProto(ctx_.store->Get(codec::RecordCodec::DecodeId(req.id())));
    return resp;
  });
}

UpdateProcessStateResponse RegistryService::UpdateProcessState(const UpdateProcessStateRequest& req) {
  return GuardRpc("ProcessRegistryService.UpdateProcessState", [&] {
    const auto id        = codec::RecordCodec::DecodeId(req.id());
    const auto requested = FromProto(req.state());

    UpdateProcessStateResponse resp;
    *resp.mutable_process() = ToProto(ctx_.store->UpdateState(id, requested));
    return resp;
  });
}

std::size_t RegistryService::ListProcessesBySource(const ListProcessesBySourceRequest& req, const ProcessSink& sink) {
  return GuardRpc("ProcessRegistryService.ListProcessesBySource", [&] {
    auto        sequence = ctx_.sources->RecordsForSource(req.source_id());
    std::size_t sent     = 0;
    while (auto record = sequence.Next()) {
      if (!sink(ToProto(*record))) {
        break;
      }
      ++sent;
    }
    return sent;
  });
}

DeleteProcessResponse RegistryService::DeleteProcess(const DeleteProcessRequest& req) {
  return GuardRpc("ProcessRegistryService.DeleteProcess", [&] {
    ctx_.store->Delete(codec::RecordCodec::DecodeId(req.id()));
    return DeleteProcessResponse{};
  });
}

} // namespace dispatcher::service
