#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace dispatcher::model {

enum class ProcessState : std::uint8_t {
  kPending   = 0,
  kRunning   = 1,
  kSuspended = 2,
  kCompleted = 3,
  kFailed    = 4,
  kCancelled = 5,
};

inline constexpr std::size_t kProcessStateCount = 6;

// Longest persisted state name (VARCHAR(15) column).
inline constexpr std::size_t kMaxStateNameLength = 15;

inline constexpr std::array<ProcessState, kProcessStateCount> kAllProcessStates = {
    ProcessState::kPending,   ProcessState::kRunning, ProcessState::kSuspended,
    ProcessState::kCompleted, ProcessState::kFailed,  ProcessState::kCancelled,
};

constexpr const char* ToString(ProcessState state) {
  switch (state) {
    case ProcessState::kPending:
      return "pending";
    case ProcessState::kRunning:
      return "running";
    case ProcessState::kSuspended:
      return "suspended";
    case ProcessState::kCompleted:
      return "completed";
    case ProcessState::kFailed:
      return "failed";
    case ProcessState::kCancelled:
      return "cancelled";
  }
  return "";
}

constexpr std::optional<ProcessState> ParseProcessState(std::string_view name) {
  for (auto state : kAllProcessStates) {
    if (name == ToString(state)) return state;
  }
  return std::nullopt;
}

constexpr std::size_t Index(ProcessState state) {
  return static_cast<std::size_t>(state);
}

} // namespace dispatcher::model
