#pragma once

#include <chrono>
#include <exception>
#include <utility>

#include "internal/observability/logging.hpp"

namespace dispatcher::service {

/*
  Runs one request body, logging failures with the route name before
  rethrowing them to the transport adapter.
*/
template <typename Fn>
auto GuardRpc(const char* route, Fn&& fn) -> decltype(fn()) {
  const auto started_at = std::chrono::steady_clock::now();
  try {
    return fn();
  } catch (const std::exception& ex) {
    const auto elapsed_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();
    DISPATCHER_LOG_WARN("RPC failed", {dispatcher::observability::StringField("route", route),
                                       dispatcher::observability::ErrorField(ex),
                                       dispatcher::observability::IntField("elapsed_ms", elapsed_ms)});
    throw;
  }
}

} // namespace dispatcher::service
