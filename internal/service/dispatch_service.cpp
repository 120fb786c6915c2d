#include "dispatch_service.hpp"

#include <stdexcept>
#include <utility>

#include "conversions.hpp"
#include "internal/codec/record_codec.hpp"
#include "internal/dispatch/dispatcher.hpp"
#include "internal/registry/registry_store.hpp"
#include "rpc_guard.hpp"

namespace dispatcher::service {

using namespace dispatcher::v1;

DispatchService::DispatchService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.store || !ctx_.dispatcher) {
    throw std::invalid_argument("DispatchService: store and dispatcher are required");
  }
}

AssignProcessResponse DispatchService::AssignProcess(const AssignProcessRequest& req) {
  return GuardRpc("DispatchService.AssignProcess", [&] {
    const auto supervisor_id = codec::RecordCodec::DecodeId(req.supervisor_id());

    AssignProcessResponse resp;
    if (auto claimed = ctx_.dispatcher->AssignNext(supervisor_id)) {
      resp.set_assigned(true);
      *resp.mutable_process() = ToProto(*claimed);
    }
    return resp;
  });
}

RunScheduleCycleResponse DispatchService::RunScheduleCycle(const RunScheduleCycleRequest&, const util::CancellationToken& cancel) {
  return GuardRpc("DispatchService.RunScheduleCycle", [&] {
    const auto report = ctx_.dispatcher->RunScheduleCycle(cancel);

    RunScheduleCycleResponse resp;
    resp.set_examined(report.examined);
    resp.set_created(report.created);
    resp.set_skipped(report.skipped);
    resp.set_failed(report.failed);
    resp.set_cancelled(report.cancelled);
    return resp;
  });
}

StatsResponse DispatchService::Stats(const StatsRequest&) {
  return GuardRpc("DispatchService.Stats", [&] {
    StatsResponse resp;
    uint64_t      total = 0;
    for (const auto& [state, count] : ctx_.store->CountByState()) {
      auto* entry = resp.add_counts();
      entry->set_state(ToProto(state));
      entry->set_count(count);
      total += count;
    }
    resp.set_total(total);
    return resp;
  });
}

} // namespace dispatcher::service
