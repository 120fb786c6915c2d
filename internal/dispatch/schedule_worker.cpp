#include "schedule_worker.hpp"

#include <stdexcept>
#include <utility>

#include "internal/dispatch/dispatcher.hpp"
#include "internal/observability/logging.hpp"

namespace dispatcher::dispatch {

ScheduleWorker::ScheduleWorker(std::shared_ptr<Dispatcher> dispatcher, std::chrono::milliseconds interval)
    : dispatcher_(std::move(dispatcher)), interval_(interval) {
  if (!dispatcher_) {
    throw std::invalid_argument("ScheduleWorker: dispatcher is null");
  }
  if (interval_.count() <= 0) {
    throw std::invalid_argument("ScheduleWorker: interval must be positive");
  }
}

ScheduleWorker::~ScheduleWorker() {
  Stop();
}

void ScheduleWorker::Start() {
  if (running_.exchange(true)) {
    return;
  }
  cancel_.Reset();
  thread_ = std::thread(&ScheduleWorker::Run, this);
  DISPATCHER_LOG_INFO("schedule worker started", {observability::IntField("interval_ms", interval_.count())});
}

void ScheduleWorker::Stop() {
  cancel_.Cancel();
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
    DISPATCHER_LOG_INFO("schedule worker stopped");
  }
}

void ScheduleWorker::Run() {
  while (running_) {
    try {
      dispatcher_->RunScheduleCycle(cancel_);
    } catch (const std::exception& e) {
      DISPATCHER_LOG_ERROR("schedule cycle failed", {observability::ErrorField(e)});
    }
    ++cycles_;

    if (cancel_.WaitFor(interval_)) {
      break;
    }
  }
}

} // namespace dispatcher::dispatch
