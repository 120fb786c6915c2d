#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace dispatcher::util {

/*
  One-shot cancellation flag that long-running loops poll and sleepers
  can wait on. Reset() re-arms it.
*/
class CancellationToken {
 public:
  void Cancel();

  bool IsCancelled() const;

  // Sleeps up to `timeout`; returns true as soon as the token is cancelled.
  bool WaitFor(std::chrono::milliseconds timeout) const;

  void Reset();

 private:
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
  bool                            cancelled_ = false;
};

} // namespace dispatcher::util
