// Repository: Intermission
// Component: Admission Gate Verdict
// Purpose: Reason a natural admission poll was accepted or rejected.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_ADMISSION_GATE_VERDICT_HPP_
#define INTERMISSION_ADMISSION_GATE_VERDICT_HPP_

namespace intermission::admission {

// Listed in evaluation order. The first failing gate wins.
enum class GateVerdict {
  kPollingStopped = 0,
  kBusy = 1,                 // Countdown running, display requested or showing
  kZoneDisallowed = 2,
  kBlocked = 3,
  kCooldown = 4,
  kPlatformUnavailable = 5,  // No adapter, or adapter disabled
  kTimerNotReady = 6,
  kTimerStale = 7,           // Ready flag left over from the previous event
  kAdmitted = 8,
};

inline constexpr int kGateVerdictCount = 9;

const char* ToString(GateVerdict verdict);

}  // namespace intermission::admission

#endif  // INTERMISSION_ADMISSION_GATE_VERDICT_HPP_
