#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/process.hpp"
#include "internal/registry/process_sequence.hpp"

namespace dispatcher::registry {

struct RegistryOptions {
  // Fresh ids tried by Create before giving up with kIdGenerationExhausted.
  std::size_t id_generation_attempts = 8;

  // Read-validate-write rounds tried by UpdateState / Delete before kConflict.
  std::size_t update_attempts = 8;
};

using IdGenerator = std::function<model::ProcessId()>;

/*
  Durable keyed collection of ProcessRecords.

  Every operation runs in its own repository transaction. State changes
  are validated against the state machine and written with a
  compare-and-set on the stored state, so two concurrent updates of the
  same id can never both apply from the same observed state.

  Errors:
    util::DecodeError      stored row is corrupt
    util::TransitionError  requested edge does not exist
    util::StoreError       not found / conflict / id exhaustion / backend
*/
class RegistryStore {
 public:
  explicit RegistryStore(std::shared_ptr<db::Repository> repository, RegistryOptions options = {},
                         IdGenerator id_generator = util::GenerateUUID);

  model::ProcessRecord Create(std::uint32_t source_id, std::uint8_t type);

  model::ProcessRecord Get(const model::ProcessId& id);

  // Returns the record as stored after the transition.
  model::ProcessRecord UpdateState(const model::ProcessId& id, model::ProcessState requested);

  // Moves a pending, unowned process to running and records its supervisor.
  // kConflict when another supervisor already owns it.
  model::ProcessRecord Assign(const model::ProcessId& id, const model::SupervisorId& supervisor_id);

  ProcessSequence ListBySource(std::uint32_t source_id);

  void Delete(const model::ProcessId& id);

  std::optional<model::ProcessRecord> LatestForSource(std::uint32_t source_id);

  // Oldest first, at most `limit` records.
  std::vector<model::ProcessRecord> OldestInState(model::ProcessState state, std::size_t limit);

  // Every state is present, zero when no record holds it.
  std::map<model::ProcessState, std::uint64_t> CountByState();

  const RegistryOptions& options() const {
    return options_;
  }

 private:
  util::TimePoint NextCreatedAt();

  model::ProcessRecord ApplyTransition(const char* operation, const model::ProcessId& id, model::ProcessState requested,
                                       const std::optional<model::SupervisorId>& supervisor_id);

  template <typename Fn>
  auto WithStorage(const char* operation, Fn&& fn) -> decltype(fn());

  std::shared_ptr<db::Repository> repository_;
  RegistryOptions                 options_;
  IdGenerator                     id_generator_;

  std::atomic<std::int64_t> last_created_ms_{0};
};

} // namespace dispatcher::registry
