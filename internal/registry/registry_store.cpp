#include "registry_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/codec/record_codec.hpp"
#include "internal/model/state_machine.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace dispatcher::registry {

using util::StoreError;
using util::StoreErrorCode;

namespace {

[[noreturn]] void ThrowStorageFailure(const char* operation, const db::Result& result) {
  throw StoreError(StoreErrorCode::kStorageFailure,
                   std::string(operation) + " failed: " + db::ToString(result.code) + " " + result.message);
}

void CommitOrThrow(db::Transaction& tx, const char* operation) {
  auto result = tx.Commit();
  if (!result) {
    ThrowStorageFailure(operation, result);
  }
}

} // namespace

RegistryStore::RegistryStore(std::shared_ptr<db::Repository> repository, RegistryOptions options, IdGenerator id_generator)
    : repository_(std::move(repository)), options_(options), id_generator_(std::move(id_generator)) {
  if (!repository_) {
    throw std::invalid_argument("RegistryStore: repository is null");
  }
  if (!id_generator_) {
    throw std::invalid_argument("RegistryStore: id generator is null");
  }
  options_.id_generation_attempts = std::max<std::size_t>(options_.id_generation_attempts, 1);
  options_.update_attempts        = std::max<std::size_t>(options_.update_attempts, 1);
}

/*
  Domain errors pass through untouched; anything else escaping the
  repository (DbError from read paths, driver exceptions from Begin) is a
  storage failure.
*/
template <typename Fn>
auto RegistryStore::WithStorage(const char* operation, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::DecodeError&) {
    throw;
  } catch (const util::TransitionError&) {
    throw;
  } catch (const StoreError&) {
    throw;
  } catch (const std::exception& e) {
    DISPATCHER_LOG_ERROR("registry storage failure", {observability::StringField("operation", operation),
                                                      observability::ErrorField(e)});
    throw StoreError(StoreErrorCode::kStorageFailure, std::string(operation) + " failed: " + e.what());
  }
}

util::TimePoint RegistryStore::NextCreatedAt() {
  const auto   now  = util::ToUnixMillis(util::Now());
  std::int64_t last = last_created_ms_.load();
  std::int64_t next = 0;
  do {
    next = std::max(now, last + 1);
  } while (!last_created_ms_.compare_exchange_weak(last, next));
  return util::FromUnixMillis(next);
}

model::ProcessRecord RegistryStore::Create(std::uint32_t source_id, std::uint8_t type) {
  return WithStorage("create", [&] {
    for (std::size_t attempt = 1; attempt <= options_.id_generation_attempts; ++attempt) {
      model::ProcessRecord record;
      record.id         = id_generator_();
      record.source_id  = source_id;
      record.state      = model::kInitialState;
      record.type       = type;
      record.created_at = NextCreatedAt();

      const auto row = codec::RecordCodec::Encode(record);

      auto tx     = repository_->Begin();
      auto insert = repository_->InsertProcess(*tx, row);
      if (insert.code == db::ErrorCode::AlreadyExists) {
        DISPATCHER_LOG_WARN("process id collision", {observability::StringField("id", row.uuid),
                                                     observability::SizeField("attempt", attempt)});
        continue;
      }
      if (!insert) {
        ThrowStorageFailure("create", insert);
      }

      // A concurrent insert of the same id surfaces at commit on optimistic
      // backends. Busy and other faults are not collisions.
      auto commit = tx->Commit();
      if (commit.code == db::ErrorCode::AlreadyExists || commit.code == db::ErrorCode::Conflict) {
        DISPATCHER_LOG_WARN("process insert lost commit race", {observability::StringField("id", row.uuid),
                                                                observability::StringField("code", db::ToString(commit.code))});
        continue;
      }
      if (!commit) {
        ThrowStorageFailure("create", commit);
      }

      DISPATCHER_LOG_INFO("process created", {observability::StringField("id", row.uuid),
                                              observability::IntField("source_id", source_id),
                                              observability::IntField("type", type),
                                              observability::StringField("created_at", util::FormatTimestamp(record.created_at))});
      return record;
    }

    throw StoreError(StoreErrorCode::kIdGenerationExhausted,
                     "no unused process id after " + std::to_string(options_.id_generation_attempts) + " attempts");
  });
}

model::ProcessRecord RegistryStore::Get(const model::ProcessId& id) {
  const auto uuid = util::ToString(id);
  return WithStorage("get", [&] {
    auto tx  = repository_->Begin();
    auto row = repository_->GetProcess(*tx, uuid);
    CommitOrThrow(*tx, "get");

    if (!row) {
      throw StoreError(StoreErrorCode::kNotFound, "process not found: " + uuid);
    }
    return codec::RecordCodec::Decode(*row);
  });
}

model::ProcessRecord RegistryStore::UpdateState(const model::ProcessId& id, model::ProcessState requested) {
  return ApplyTransition("update_state", id, requested, std::nullopt);
}

model::ProcessRecord RegistryStore::Assign(const model::ProcessId& id, const model::SupervisorId& supervisor_id) {
  return ApplyTransition("assign", id, model::ProcessState::kRunning, supervisor_id);
}

model::ProcessRecord RegistryStore::ApplyTransition(const char* operation, const model::ProcessId& id, model::ProcessState requested,
                                                    const std::optional<model::SupervisorId>& supervisor_id) {
  const auto uuid = util::ToString(id);
  return WithStorage(operation, [&] {
    for (std::size_t attempt = 1; attempt <= options_.update_attempts; ++attempt) {
      auto tx  = repository_->Begin();
      auto row = repository_->GetProcess(*tx, uuid);
      if (!row) {
        throw StoreError(StoreErrorCode::kNotFound, "process not found: " + uuid);
      }

      auto record = codec::RecordCodec::Decode(*row);
      auto next   = model::Transition(record.state, requested);

      const std::string next_name(model::ToString(next));
      db::Result        cas;
      if (supervisor_id) {
        if (record.supervisor_id) {
          throw StoreError(StoreErrorCode::kConflict,
                           "process " + uuid + " already assigned to " + util::ToString(*record.supervisor_id));
        }
        cas = repository_->CompareAndAssign(*tx, uuid, row->state, next_name, util::ToString(*supervisor_id));
      } else {
        cas = repository_->CompareAndSetState(*tx, uuid, row->state, next_name);
      }
      if (cas.code == db::ErrorCode::NotFound) {
        throw StoreError(StoreErrorCode::kNotFound, "process not found: " + uuid);
      }
      if (db::IsRetryable(cas.code)) {
        DISPATCHER_LOG_DEBUG("state update raced, retrying", {observability::StringField("id", uuid),
                                                              observability::SizeField("attempt", attempt)});
        continue;
      }
      if (!cas) {
        ThrowStorageFailure(operation, cas);
      }

      auto commit = tx->Commit();
      if (db::IsRetryable(commit.code)) {
        DISPATCHER_LOG_DEBUG("state update commit raced, retrying", {observability::StringField("id", uuid),
                                                                     observability::SizeField("attempt", attempt)});
        continue;
      }
      if (!commit) {
        ThrowStorageFailure(operation, commit);
      }

      if (supervisor_id) {
        record.supervisor_id = supervisor_id;
        DISPATCHER_LOG_INFO("process assigned", {observability::StringField("id", uuid),
                                                 observability::StringField("from", model::ToString(record.state)),
                                                 observability::StringField("supervisor_id", util::ToString(*supervisor_id))});
      } else {
        DISPATCHER_LOG_INFO("process state changed", {observability::StringField("id", uuid),
                                                      observability::StringField("from", model::ToString(record.state)),
                                                      observability::StringField("to", next_name)});
      }
      record.state = next;
      return record;
    }

    DISPATCHER_LOG_WARN("state update gave up", {observability::StringField("id", uuid),
                                                 observability::StringField("requested", model::ToString(requested))});
    throw StoreError(StoreErrorCode::kConflict,
                     "state of " + uuid + " kept changing across " + std::to_string(options_.update_attempts) + " attempts");
  });
}

ProcessSequence RegistryStore::ListBySource(std::uint32_t source_id) {
  return WithStorage("list_by_source", [&] {
    auto tx   = repository_->Begin();
    auto rows = repository_->ListProcessesBySource(*tx, source_id);
    CommitOrThrow(*tx, "list_by_source");
    return ProcessSequence(std::move(rows));
  });
}

void RegistryStore::Delete(const model::ProcessId& id) {
  const auto uuid = util::ToString(id);
  WithStorage("delete", [&] {
    for (std::size_t attempt = 1; attempt <= options_.update_attempts; ++attempt) {
      auto tx     = repository_->Begin();
      auto result = repository_->DeleteProcess(*tx, uuid);
      if (result.code == db::ErrorCode::NotFound) {
        throw StoreError(StoreErrorCode::kNotFound, "process not found: " + uuid);
      }
      if (db::IsRetryable(result.code)) {
        continue;
      }
      if (!result) {
        ThrowStorageFailure("delete", result);
      }

      auto commit = tx->Commit();
      if (db::IsRetryable(commit.code)) {
        continue;
      }
      if (!commit) {
        ThrowStorageFailure("delete", commit);
      }

      DISPATCHER_LOG_INFO("process deleted", {observability::StringField("id", uuid)});
      return;
    }

    throw StoreError(StoreErrorCode::kConflict,
                     "delete of " + uuid + " kept conflicting across " + std::to_string(options_.update_attempts) + " attempts");
  });
}

std::optional<model::ProcessRecord> RegistryStore::LatestForSource(std::uint32_t source_id) {
  return WithStorage("latest_for_source", [&]() -> std::optional<model::ProcessRecord> {
    auto tx  = repository_->Begin();
    auto row = repository_->LatestProcessForSource(*tx, source_id);
    CommitOrThrow(*tx, "latest_for_source");

    if (!row) {
      return std::nullopt;
    }
    return codec::RecordCodec::Decode(*row);
  });
}

std::vector<model::ProcessRecord> RegistryStore::OldestInState(model::ProcessState state, std::size_t limit) {
  return WithStorage("oldest_in_state", [&] {
    std::vector<model::ProcessRecord> out;
    if (limit == 0) {
      return out;
    }

    auto tx   = repository_->Begin();
    auto rows = repository_->ListProcessesInState(*tx, std::string(model::ToString(state)), limit);
    CommitOrThrow(*tx, "oldest_in_state");

    out.reserve(rows.size());
    for (const auto& row : rows) {
      out.push_back(codec::RecordCodec::Decode(row));
    }
    return out;
  });
}

std::map<model::ProcessState, std::uint64_t> RegistryStore::CountByState() {
  return WithStorage("count_by_state", [&] {
    auto tx     = repository_->Begin();
    auto counts = repository_->CountProcessesByState(*tx);
    CommitOrThrow(*tx, "count_by_state");

    std::map<model::ProcessState, std::uint64_t> out;
    for (auto state : model::kAllProcessStates) {
      out[state] = 0;
    }
    for (const auto& [name, count] : counts) {
      out[codec::RecordCodec::DecodeState(name)] += count;
    }
    return out;
  });
}

} // namespace dispatcher::registry
