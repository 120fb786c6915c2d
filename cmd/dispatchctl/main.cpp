#include <grpcpp/grpcpp.h>

#include <cstdint>
#include <iostream>
#include <optional>
#include <string>

#include "api/dispatcher/v1.hpp"
#include "dispatcher/v1/dispatch_service.grpc.pb.h"
#include "dispatcher/v1/registry_service.grpc.pb.h"

using namespace dispatcher::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  dispatchctl <addr> create <source_id> [type]\n"
            << "  dispatchctl <addr> get <uuid>\n"
            << "  dispatchctl <addr> set-state <uuid> <pending|running|suspended|completed|failed|cancelled>\n"
            << "  dispatchctl <addr> list <source_id>\n"
            << "  dispatchctl <addr> delete <uuid>\n"
            << "  dispatchctl <addr> assign <supervisor_uuid>\n"
            << "  dispatchctl <addr> schedule\n"
            << "  dispatchctl <addr> stats\n";
}

static std::optional<ProcessState> ParseState(const std::string& value) {
  if (value == "pending") return PROCESS_STATE_PENDING;
  if (value == "running") return PROCESS_STATE_RUNNING;
  if (value == "suspended") return PROCESS_STATE_SUSPENDED;
  if (value == "completed") return PROCESS_STATE_COMPLETED;
  if (value == "failed") return PROCESS_STATE_FAILED;
  if (value == "cancelled") return PROCESS_STATE_CANCELLED;
  return std::nullopt;
}

static const char* StateName(ProcessState state) {
  switch (state) {
    case PROCESS_STATE_PENDING:
      return "pending";
    case PROCESS_STATE_RUNNING:
      return "running";
    case PROCESS_STATE_SUSPENDED:
      return "suspended";
    case PROCESS_STATE_COMPLETED:
      return "completed";
    case PROCESS_STATE_FAILED:
      return "failed";
    case PROCESS_STATE_CANCELLED:
      return "cancelled";
    default:
      return "unspecified";
  }
}

static std::optional<uint32_t> ParseU32(const char* text) {
  try {
    std::size_t consumed = 0;
    const auto  value    = std::stoull(text, &consumed);
    if (text[consumed] != '\0' || value > UINT32_MAX) return std::nullopt;
    return static_cast<uint32_t>(value);
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

static void Print(const ProcessRecord& p) {
  std::cout << "id=" << p.id() << " source_id=" << p.source_id() << " state=" << StateName(p.state()) << " type=" << p.type()
            << " created_at_ms=" << p.created_at_ms();
  if (!p.supervisor_id().empty()) std::cout << " supervisor_id=" << p.supervisor_id();
  std::cout << "\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << "error(" << status.error_code() << "): " << status.error_message() << "\n";
  return 2;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto registry_stub = ProcessRegistryService::NewStub(channel);
  auto dispatch_stub = DispatchService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "create") {
    if (argc < 4) return 1;

    auto source_id = ParseU32(argv[3]);
    auto type      = argc >= 5 ? ParseU32(argv[4]) : std::optional<uint32_t>(1);
    if (!source_id || !type) {
      std::cerr << "source_id and type must be unsigned integers\n";
      return 1;
    }

    CreateProcessRequest req;
    req.set_source_id(*source_id);
    req.set_type(*type);

    CreateProcessResponse resp;
    auto                  status = registry_stub->CreateProcess(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.process());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 4) return 1;

    GetProcessRequest req;
    req.set_id(argv[3]);

    GetProcessResponse resp;
    auto               status = registry_stub->GetProcess(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.process());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "set-state") {
    if (argc < 5) return 1;

    auto state = ParseState(argv[4]);
    if (!state) {
      std::cerr << "unknown state: " << argv[4] << "\n";
      return 1;
    }

    UpdateProcessStateRequest req;
    req.set_id(argv[3]);
    req.set_state(*state);

    UpdateProcessStateResponse resp;
    auto                       status = registry_stub->UpdateProcessState(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.process());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "list") {
    if (argc < 4) return 1;

    auto source_id = ParseU32(argv[3]);
    if (!source_id) {
      std::cerr << "source_id must be an unsigned integer\n";
      return 1;
    }

    ListProcessesBySourceRequest req;
    req.set_source_id(*source_id);

    auto          reader = registry_stub->ListProcessesBySource(&ctx, req);
    ProcessRecord record;
    std::size_t   count = 0;
    while (reader->Read(&record)) {
      Print(record);
      ++count;
    }
    auto status = reader->Finish();
    if (!status.ok()) return Fail(status);

    std::cout << "count=" << count << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "delete") {
    if (argc < 4) return 1;

    DeleteProcessRequest req;
    req.set_id(argv[3]);

    DeleteProcessResponse resp;
    auto                  status = registry_stub->DeleteProcess(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "deleted\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "assign") {
    if (argc < 4) return 1;

    AssignProcessRequest  req;
    AssignProcessResponse resp;
    req.set_supervisor_id(argv[3]);
    auto                  status = dispatch_stub->AssignProcess(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    if (!resp.assigned()) {
      std::cout << "nothing pending\n";
      return 0;
    }
    Print(resp.process());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "schedule") {
    RunScheduleCycleRequest  req;
    RunScheduleCycleResponse resp;
    auto                     status = dispatch_stub->RunScheduleCycle(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << "examined=" << resp.examined() << " created=" << resp.created() << " skipped=" << resp.skipped()
              << " failed=" << resp.failed() << " cancelled=" << (resp.cancelled() ? "true" : "false") << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    StatsRequest  req;
    StatsResponse resp;
    auto          status = dispatch_stub->Stats(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    for (const auto& entry : resp.counts()) {
      std::cout << StateName(entry.state()) << "=" << entry.count() << "\n";
    }
    std::cout << "total=" << resp.total() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
