#include "state_machine.hpp"

#include "internal/util/errors.hpp"

namespace dispatcher::model {

std::vector<ProcessState> AllowedTargets(ProcessState from) {
  std::vector<ProcessState> out;
  for (auto to : kAllProcessStates) {
    if (CanTransition(from, to)) out.push_back(to);
  }
  return out;
}

ProcessState Transition(ProcessState current, ProcessState requested) {
  if (!CanTransition(current, requested)) {
    throw util::TransitionError(current, requested);
  }
  return requested;
}

} // namespace dispatcher::model
