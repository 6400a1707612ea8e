// Repository: Intermission
// Component: Scheduler Types
// Copyright (c) 2026 Intermission

#include "intermission/runtime/SchedulerTypes.hpp"

namespace intermission::runtime {

namespace {

struct TransitionRow {
  Phase from;
  SchedulerEvent event;
  Phase to;
};

// The only place a phase change is defined. Opened/Closed may arrive through
// a path that never requested the display (a platform-initiated event), so
// they are accepted from kIdle and kCountingDown as well.
constexpr TransitionRow kTransitionTable[] = {
    {Phase::kIdle,         SchedulerEvent::kCountdownStarted,   Phase::kCountingDown},
    {Phase::kCountingDown, SchedulerEvent::kCountdownCancelled, Phase::kIdle},
    {Phase::kCountingDown, SchedulerEvent::kShowRequested,      Phase::kAwaitingOpen},
    {Phase::kIdle,         SchedulerEvent::kShowRequested,      Phase::kAwaitingOpen},
    {Phase::kCountingDown, SchedulerEvent::kShowFailed,         Phase::kIdle},
    {Phase::kIdle,         SchedulerEvent::kShowFailed,         Phase::kIdle},
    {Phase::kAwaitingOpen, SchedulerEvent::kShowFailed,         Phase::kIdle},
    {Phase::kAwaitingOpen, SchedulerEvent::kOpened,             Phase::kShowing},
    {Phase::kIdle,         SchedulerEvent::kOpened,             Phase::kShowing},
    {Phase::kCountingDown, SchedulerEvent::kOpened,             Phase::kShowing},
    {Phase::kShowing,      SchedulerEvent::kClosed,             Phase::kIdle},
    {Phase::kAwaitingOpen, SchedulerEvent::kClosed,             Phase::kIdle},
};

}  // namespace

std::optional<Phase> NextPhase(Phase from, SchedulerEvent event) {
  for (const auto& row : kTransitionTable) {
    if (row.from == from && row.event == event) {
      return row.to;
    }
  }
  return std::nullopt;
}

const char* ToString(Phase phase) {
  switch (phase) {
    case Phase::kIdle:         return "IDLE";
    case Phase::kCountingDown: return "COUNTING_DOWN";
    case Phase::kAwaitingOpen: return "AWAITING_OPEN";
    case Phase::kShowing:      return "SHOWING";
  }
  return "UNKNOWN";
}

const char* ToString(SchedulerEvent event) {
  switch (event) {
    case SchedulerEvent::kCountdownStarted:   return "COUNTDOWN_STARTED";
    case SchedulerEvent::kCountdownCancelled: return "COUNTDOWN_CANCELLED";
    case SchedulerEvent::kShowRequested:      return "SHOW_REQUESTED";
    case SchedulerEvent::kShowFailed:         return "SHOW_FAILED";
    case SchedulerEvent::kOpened:             return "OPENED";
    case SchedulerEvent::kClosed:             return "CLOSED";
  }
  return "UNKNOWN";
}

const char* ToString(ManualTriggerMode mode) {
  switch (mode) {
    case ManualTriggerMode::kImmediate:     return "immediate";
    case ManualTriggerMode::kWithCountdown: return "with_countdown";
  }
  return "unknown";
}

const char* ToString(ManualTriggerResult result) {
  switch (result) {
    case ManualTriggerResult::kShown:               return "SHOWN";
    case ManualTriggerResult::kCountdownStarted:    return "COUNTDOWN_STARTED";
    case ManualTriggerResult::kRejectedShowing:     return "REJECTED_SHOWING";
    case ManualTriggerResult::kRejectedBlocked:     return "REJECTED_BLOCKED";
    case ManualTriggerResult::kRejectedBusy:        return "REJECTED_BUSY";
    case ManualTriggerResult::kPlatformUnavailable: return "PLATFORM_UNAVAILABLE";
    case ManualTriggerResult::kDisabled:            return "DISABLED";
    case ManualTriggerResult::kSkippedByFrequency:  return "SKIPPED_BY_FREQUENCY";
  }
  return "UNKNOWN";
}

}  // namespace intermission::runtime
