#pragma once

#include <array>
#include <cstdint>
#include <vector>

#include "internal/model/process_state.hpp"

namespace dispatcher::model {

/*
  Process lifecycle.

    pending   -> running | cancelled
    running   -> suspended | completed | failed | cancelled
    suspended -> running | cancelled

  completed / failed / cancelled are terminal. There are no self-loops:
  re-applying the current state is an illegal transition.
*/

using TransitionRow   = std::array<bool, kProcessStateCount>;
using TransitionTable = std::array<TransitionRow, kProcessStateCount>;

namespace detail {

constexpr TransitionTable BuildTransitionTable() {
  TransitionTable t{};

  auto allow = [&t](ProcessState from, ProcessState to) { t[Index(from)][Index(to)] = true; };

  allow(ProcessState::kPending, ProcessState::kRunning);
  allow(ProcessState::kPending, ProcessState::kCancelled);

  allow(ProcessState::kRunning, ProcessState::kSuspended);
  allow(ProcessState::kRunning, ProcessState::kCompleted);
  allow(ProcessState::kRunning, ProcessState::kFailed);
  allow(ProcessState::kRunning, ProcessState::kCancelled);

  allow(ProcessState::kSuspended, ProcessState::kRunning);
  allow(ProcessState::kSuspended, ProcessState::kCancelled);

  return t;
}

} // namespace detail

inline constexpr TransitionTable kTransitionTable = detail::BuildTransitionTable();

inline constexpr ProcessState kInitialState = ProcessState::kPending;

constexpr bool CanTransition(ProcessState from, ProcessState to) {
  return kTransitionTable[Index(from)][Index(to)];
}

constexpr bool IsTerminal(ProcessState state) {
  for (bool allowed : kTransitionTable[Index(state)]) {
    if (allowed) return false;
  }
  return true;
}

std::vector<ProcessState> AllowedTargets(ProcessState from);

// Returns `requested` when the edge exists, otherwise throws util::TransitionError.
ProcessState Transition(ProcessState current, ProcessState requested);

} // namespace dispatcher::model
