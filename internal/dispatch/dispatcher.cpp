#include "dispatcher.hpp"

#include <algorithm>
#include <mutex>
#include <stdexcept>
#include <utility>

#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dispatcher::dispatch {

using observability::ErrorField;
using observability::IntField;
using observability::SizeField;
using observability::StringField;

Dispatcher::Dispatcher(std::shared_ptr<registry::RegistryStore> store, std::shared_ptr<source::SourceCatalog> catalog,
                       DispatcherOptions options, NowFn now)
    : store_(std::move(store)), catalog_(std::move(catalog)), options_(options), now_(std::move(now)) {
  if (!store_ || !catalog_) {
    throw std::invalid_argument("Dispatcher: store and catalog are required");
  }
  if (!now_) {
    throw std::invalid_argument("Dispatcher: clock is null");
  }
  options_.assign_batch_size = std::max<std::size_t>(options_.assign_batch_size, 1);
}

Dispatcher::Decision Dispatcher::Decide(const std::optional<model::ProcessRecord>& latest) const {
  if (!latest) {
    return Decision::kCreate;
  }
  if (!model::IsTerminal(latest->state)) {
    return Decision::kSkipOpen;
  }

  const auto today   = util::CalendarDay(now_(), options_.day_offset_minutes);
  const auto created = util::CalendarDay(latest->created_at, options_.day_offset_minutes);
  return created == today ? Decision::kSkipDoneToday : Decision::kCreate;
}

CycleReport Dispatcher::RunScheduleCycle(const util::CancellationToken& cancel) {
  CycleReport report;

  for (auto source_id : catalog_->ActiveSourceIds()) {
    if (cancel.IsCancelled()) {
      report.cancelled = true;
      break;
    }
    ++report.examined;

    auto            handle = locks_.Get(source_id);
    std::lock_guard guard(*handle);

    try {
      switch (Decide(store_->LatestForSource(source_id))) {
        case Decision::kSkipOpen:
          ++report.skipped;
          DISPATCHER_LOG_DEBUG("source has open work", {IntField("source_id", source_id)});
          break;
        case Decision::kSkipDoneToday:
          ++report.skipped;
          DISPATCHER_LOG_DEBUG("source already processed today", {IntField("source_id", source_id)});
          break;
        case Decision::kCreate: {
          auto record = store_->Create(source_id, options_.process_type);
          ++report.created;
          DISPATCHER_LOG_INFO("scheduled process", {IntField("source_id", source_id),
                                                    StringField("id", util::ToString(record.id))});
          break;
        }
      }
    } catch (const std::exception& e) {
      ++report.failed;
      DISPATCHER_LOG_ERROR("schedule failed for source", {IntField("source_id", source_id), ErrorField(e)});
    }
  }

  const auto removed = locks_.Cleanup();

  DISPATCHER_LOG_INFO("schedule cycle finished", {SizeField("examined", report.examined),
                                                  SizeField("created", report.created),
                                                  SizeField("skipped", report.skipped),
                                                  SizeField("failed", report.failed),
                                                  observability::BoolField("cancelled", report.cancelled),
                                                  SizeField("locks_released", removed)});
  return report;
}

std::optional<model::ProcessRecord> Dispatcher::AssignNext(const model::SupervisorId& supervisor_id) {
  for (int pass = 0; pass < kAssignPasses; ++pass) {
    auto candidates = store_->OldestInState(model::ProcessState::kPending, options_.assign_batch_size);
    if (candidates.empty()) {
      return std::nullopt;
    }

    for (const auto& candidate : candidates) {
      auto            handle = locks_.Get(candidate.source_id);
      std::lock_guard guard(*handle);

      try {
        auto claimed = store_->Assign(candidate.id, supervisor_id);
        DISPATCHER_LOG_INFO("process assigned to supervisor", {StringField("id", util::ToString(claimed.id)),
                                                               IntField("source_id", claimed.source_id),
                                                               StringField("supervisor_id", util::ToString(supervisor_id))});
        return claimed;
      } catch (const util::TransitionError&) {
        // another caller claimed or cancelled it first
        continue;
      } catch (const util::StoreError& e) {
        if (e.code() != util::StoreErrorCode::kNotFound && e.code() != util::StoreErrorCode::kConflict) {
          throw;
        }
      }
    }

    DISPATCHER_LOG_DEBUG("every assignment candidate was taken, refetching",
                         {SizeField("batch", candidates.size()), IntField("pass", pass + 1)});
  }

  return std::nullopt;
}

} // namespace dispatcher::dispatch
