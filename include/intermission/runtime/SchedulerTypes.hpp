// Repository: Intermission
// Component: Scheduler Types
// Purpose: Phase state machine vocabulary and result enums shared by the
//          Admission Scheduler, its metrics and its callers.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_RUNTIME_SCHEDULER_TYPES_HPP_
#define INTERMISSION_RUNTIME_SCHEDULER_TYPES_HPP_

#include <optional>

#include "intermission/admission/GateVerdict.hpp"

namespace intermission::runtime {

using admission::GateVerdict;

// isWaiting == (phase == kCountingDown), isEventShowing == (phase == kShowing).
enum class Phase {
  kIdle = 0,
  kCountingDown = 1,
  kAwaitingOpen = 2,  // Display requested, platform has not opened it yet
  kShowing = 3,
};

enum class SchedulerEvent {
  kCountdownStarted = 0,
  kCountdownCancelled = 1,
  kShowRequested = 2,
  kShowFailed = 3,     // Request rejected or never opened
  kOpened = 4,
  kClosed = 5,
};

// Result of a transition-table lookup. nullopt = no row (illegal).
std::optional<Phase> NextPhase(Phase from, SchedulerEvent event);

// Whether a manual trigger goes straight to display or through the warning
// countdown like the natural path.
enum class ManualTriggerMode {
  kImmediate = 0,
  kWithCountdown = 1,
};

enum class ManualTriggerResult {
  kShown = 0,              // Display requested
  kCountdownStarted = 1,   // kWithCountdown: warning started
  kRejectedShowing = 2,    // Event showing or awaiting open
  kRejectedBlocked = 3,
  kRejectedBusy = 4,       // kWithCountdown: countdown already running
  kPlatformUnavailable = 5,
  kDisabled = 6,           // frequency <= 0
  kSkippedByFrequency = 7,
};

inline constexpr int kManualTriggerResultCount = 8;

const char* ToString(Phase phase);
const char* ToString(SchedulerEvent event);
const char* ToString(ManualTriggerMode mode);
const char* ToString(ManualTriggerResult result);

}  // namespace intermission::runtime

#endif  // INTERMISSION_RUNTIME_SCHEDULER_TYPES_HPP_
