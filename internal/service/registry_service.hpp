#pragma once

#include <cstddef>
#include <functional>

#include "api/dispatcher/v1.hpp"
#include "service_context.hpp"

namespace dispatcher::service {

// Called once per streamed record; returning false stops the stream.
using ProcessSink = std::function<bool(const dispatcher::v1::ProcessRecord&)>;

class RegistryService {
 public:
  explicit RegistryService(ServiceContext ctx);

  dispatcher::v1::CreateProcessResponse CreateProcess(const dispatcher::v1::CreateProcessRequest& req);

  dispatcher::v1::GetProcessResponse GetProcess(const dispatcher::v1::GetProcessRequest& req);

  dispatcher::v1::UpdateProcessStateResponse UpdateProcessState(const dispatcher::v1::UpdateProcessStateRequest& req);

  // Returns the number of records handed to the sink.
  std::size_t ListProcessesBySource(const dispatcher::v1::ListProcessesBySourceRequest& req, const ProcessSink& sink);

  dispatcher::v1::DeleteProcessResponse DeleteProcess(const dispatcher::v1::DeleteProcessRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace dispatcher::service
