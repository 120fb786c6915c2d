#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

#include "internal/util/cancellation.hpp"

namespace dispatcher::dispatch {

class Dispatcher;

/*
  Background worker that runs schedule cycles every `interval`.

  Stop() cancels the cycle in flight and joins the thread.
*/
class ScheduleWorker {
 public:
  ScheduleWorker(std::shared_ptr<Dispatcher> dispatcher, std::chrono::milliseconds interval);
  ~ScheduleWorker();

  void Start();
  void Stop();

  std::uint64_t CyclesCompleted() const {
    return cycles_.load();
  }

 private:
  void Run();

  std::shared_ptr<Dispatcher> dispatcher_;
  std::chrono::milliseconds   interval_;

  util::CancellationToken    cancel_;
  std::thread                thread_;
  std::atomic<bool>          running_{false};
  std::atomic<std::uint64_t> cycles_{0};
};

} // namespace dispatcher::dispatch
