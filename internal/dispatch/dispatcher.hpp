#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "internal/model/process.hpp"
#include "internal/registry/registry_store.hpp"
#include "internal/source/source_catalog.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/keyed_mutex.hpp"
#include "internal/util/time.hpp"

namespace dispatcher::dispatch {

struct DispatcherOptions {
  // Type given to processes opened by the schedule cycle.
  std::uint8_t process_type = model::kProcessTypeRegular;

  // Offset from UTC, in minutes, of the calendar used for "created today".
  std::int32_t day_offset_minutes = 0;

  // Pending candidates fetched per AssignNext call.
  std::size_t assign_batch_size = 16;
};

struct CycleReport {
  std::size_t examined = 0;
  std::size_t created  = 0;
  std::size_t skipped  = 0;
  std::size_t failed   = 0;
  bool        cancelled = false;
};

using NowFn = std::function<util::TimePoint()>;

/*
  Opens and hands out processes.

  Schedule cycle, per active source (under that source's lock):
    latest record not terminal             -> skip, work is open
    latest record terminal, created today  -> skip, already done today
    otherwise                              -> create a pending process

  Assignment claims the oldest pending process for a supervisor by
  moving it to running and recording the supervisor on it. Losing a
  claim race to another caller is not an error; the next candidate is
  tried. When a whole batch is lost the pending set is fetched again,
  at most kAssignPasses times, so nullopt means nothing was claimable
  on the last fetch.
*/
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<registry::RegistryStore> store, std::shared_ptr<source::SourceCatalog> catalog,
             DispatcherOptions options = {}, NowFn now = util::Now);

  CycleReport RunScheduleCycle(const util::CancellationToken& cancel);

  static constexpr int kAssignPasses = 2;

  std::optional<model::ProcessRecord> AssignNext(const model::SupervisorId& supervisor_id);

  const DispatcherOptions& options() const {
    return options_;
  }

  // Per-source lock entries currently tracked.
  std::size_t TrackedLocks() const {
    return locks_.Size();
  }

 private:
  enum class Decision { kCreate, kSkipOpen, kSkipDoneToday };

  Decision Decide(const std::optional<model::ProcessRecord>& latest) const;

  std::shared_ptr<registry::RegistryStore> store_;
  std::shared_ptr<source::SourceCatalog>   catalog_;
  DispatcherOptions                        options_;
  NowFn                                    now_;

  util::KeyedMutex<std::uint32_t> locks_;
};

} // namespace dispatcher::dispatch
