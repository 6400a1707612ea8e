// Repository: Intermission
// Component: Admission Gate Verdict
// Copyright (c) 2026 Intermission

#include "intermission/admission/GateVerdict.hpp"

namespace intermission::admission {

const char* ToString(GateVerdict verdict) {
  switch (verdict) {
    case GateVerdict::kPollingStopped:      return "POLLING_STOPPED";
    case GateVerdict::kBusy:                return "BUSY";
    case GateVerdict::kZoneDisallowed:      return "ZONE_DISALLOWED";
    case GateVerdict::kBlocked:             return "BLOCKED";
    case GateVerdict::kCooldown:            return "COOLDOWN";
    case GateVerdict::kPlatformUnavailable: return "PLATFORM_UNAVAILABLE";
    case GateVerdict::kTimerNotReady:       return "TIMER_NOT_READY";
    case GateVerdict::kTimerStale:          return "TIMER_STALE";
    case GateVerdict::kAdmitted:            return "ADMITTED";
  }
  return "UNKNOWN";
}

}  // namespace intermission::admission
