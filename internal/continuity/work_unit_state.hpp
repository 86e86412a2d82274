#pragma once

#include <cstdint>
#include <string_view>

namespace callscribe::continuity {

enum class WorkUnitState : std::uint8_t {
  kStarting          = 0,
  kStreaming         = 1,
  kTimeBudgetReached = 2,
  kSourceClosed      = 3,
  kError             = 4,
  kFinalizing        = 5,
  kDone              = 6,
};

constexpr bool IsTerminal(WorkUnitState state) {
  return state == WorkUnitState::kDone;
}

/*
  STARTING -> STREAMING -> (TIME_BUDGET_REACHED | SOURCE_CLOSED | ERROR) -> FINALIZING -> DONE

  STARTING may also fail straight into ERROR, or end in DONE without
  streaming (policy exit, runaway cap).
*/
constexpr bool CanTransition(WorkUnitState from, WorkUnitState to) {
  if (IsTerminal(from)) {
    return false;
  }
  switch (from) {
    case WorkUnitState::kStarting:
      return to == WorkUnitState::kStreaming || to == WorkUnitState::kError || to == WorkUnitState::kDone;
    case WorkUnitState::kStreaming:
      return to == WorkUnitState::kTimeBudgetReached || to == WorkUnitState::kSourceClosed || to == WorkUnitState::kError;
    case WorkUnitState::kTimeBudgetReached:
    case WorkUnitState::kSourceClosed:
      return to == WorkUnitState::kFinalizing || to == WorkUnitState::kError;
    case WorkUnitState::kError:
      return to == WorkUnitState::kFinalizing;
    case WorkUnitState::kFinalizing:
      return to == WorkUnitState::kDone;
    case WorkUnitState::kDone:
      return false;
  }
  return false;
}

constexpr std::string_view ToString(WorkUnitState state) {
  switch (state) {
    case WorkUnitState::kStarting:
      return "STARTING";
    case WorkUnitState::kStreaming:
      return "STREAMING";
    case WorkUnitState::kTimeBudgetReached:
      return "TIME_BUDGET_REACHED";
    case WorkUnitState::kSourceClosed:
      return "SOURCE_CLOSED";
    case WorkUnitState::kError:
      return "ERROR";
    case WorkUnitState::kFinalizing:
      return "FINALIZING";
    case WorkUnitState::kDone:
      return "DONE";
  }
  return "UNKNOWN";
}

} // namespace callscribe::continuity
