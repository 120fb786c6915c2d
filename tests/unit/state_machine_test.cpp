#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/state_machine.hpp"
#include "internal/util/errors.hpp"

namespace {

using dispatcher::model::AllowedTargets;
using dispatcher::model::CanTransition;
using dispatcher::model::IsTerminal;
using dispatcher::model::kAllProcessStates;
using dispatcher::model::ParseProcessState;
using dispatcher::model::ProcessState;
using dispatcher::model::Transition;
using dispatcher::util::TransitionError;

bool Throws(ProcessState from, ProcessState to) {
  try {
    Transition(from, to);
  } catch (const TransitionError& e) {
    assert(e.from() == from);
    assert(e.to() == to);
    return true;
  }
  return false;
}

void TestAllowedEdges() {
  assert(Transition(ProcessState::kPending, ProcessState::kRunning) == ProcessState::kRunning);
  assert(Transition(ProcessState::kPending, ProcessState::kCancelled) == ProcessState::kCancelled);
  assert(Transition(ProcessState::kRunning, ProcessState::kSuspended) == ProcessState::kSuspended);
  assert(Transition(ProcessState::kRunning, ProcessState::kCompleted) == ProcessState::kCompleted);
  assert(Transition(ProcessState::kRunning, ProcessState::kFailed) == ProcessState::kFailed);
  assert(Transition(ProcessState::kRunning, ProcessState::kCancelled) == ProcessState::kCancelled);
  assert(Transition(ProcessState::kSuspended, ProcessState::kRunning) == ProcessState::kRunning);
  assert(Transition(ProcessState::kSuspended, ProcessState::kCancelled) == ProcessState::kCancelled);
}

void TestEdgeCountMatchesTable() {
  int edges = 0;
  for (auto from : kAllProcessStates) {
    for (auto to : kAllProcessStates) {
      if (CanTransition(from, to)) ++edges;
    }
  }
  assert(edges == 8);
}

void TestNoSelfLoops() {
  for (auto state : kAllProcessStates) {
    assert(!CanTransition(state, state));
    assert(Throws(state, state));
  }
}

void TestTerminalStatesRejectEverything() {
  for (auto terminal : {ProcessState::kCompleted, ProcessState::kFailed, ProcessState::kCancelled}) {
    assert(IsTerminal(terminal));
    assert(AllowedTargets(terminal).empty());
    for (auto to : kAllProcessStates) {
      assert(Throws(terminal, to));
    }
  }
  assert(!IsTerminal(ProcessState::kPending));
  assert(!IsTerminal(ProcessState::kRunning));
  assert(!IsTerminal(ProcessState::kSuspended));
}

void TestBackwardsEdgesAreIllegal() {
  assert(Throws(ProcessState::kRunning, ProcessState::kPending));
  assert(Throws(ProcessState::kSuspended, ProcessState::kPending));
  assert(Throws(ProcessState::kPending, ProcessState::kCompleted));
  assert(Throws(ProcessState::kSuspended, ProcessState::kCompleted));
}

void TestAllowedTargetsOrder() {
  auto targets = AllowedTargets(ProcessState::kRunning);
  assert(targets.size() == 4);
  assert(targets[0] == ProcessState::kSuspended);
  assert(targets[3] == ProcessState::kCancelled);
}

void TestStateNames() {
  for (auto state : kAllProcessStates) {
    auto parsed = ParseProcessState(ToString(state));
    assert(parsed.has_value());
    assert(*parsed == state);
  }
  assert(!ParseProcessState("Running").has_value());
  assert(!ParseProcessState("").has_value());

  // compile-time table
  static_assert(CanTransition(ProcessState::kPending, ProcessState::kRunning));
  static_assert(!CanTransition(ProcessState::kCompleted, ProcessState::kRunning));
  static_assert(IsTerminal(ProcessState::kFailed));
}

void TestErrorMessageNamesBothStates() {
  try {
    Transition(ProcessState::kRunning, ProcessState::kPending);
    assert(false);
  } catch (const TransitionError& e) {
    const std::string msg = e.what();
    assert(msg.find("running") != std::string::npos);
    assert(msg.find("pending") != std::string::npos);
  }
}

} // namespace

int main() {
  TestAllowedEdges();
  TestEdgeCountMatchesTable();
  TestNoSelfLoops();
  TestTerminalStatesRejectEverything();
  TestBackwardsEdgesAreIllegal();
  TestAllowedTargetsOrder();
  TestStateNames();
  TestErrorMessageNamesBothStates();

  std::cout << "process_dispatcher_unit_state_machine: pass\n";
  return 0;
}
