// Repository: Intermission
// Component: Platform Shim
// Copyright (c) 2026 Intermission

#include "intermission/platform/PlatformShim.hpp"

#include <sstream>
#include <utility>

#include "intermission/util/Logger.hpp"

namespace intermission::platform {

using admission::GateVerdict;
using util::Logger;

const char* ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kInterstitial: return "INTERSTITIAL";
    case EventKind::kRewarded:     return "REWARDED";
  }
  return "UNKNOWN";
}

const char* ToString(PlatformSignal::Type type) {
  switch (type) {
    case PlatformSignal::Type::kOpened:        return "OPENED";
    case PlatformSignal::Type::kClosed:        return "CLOSED";
    case PlatformSignal::Type::kRewardGranted: return "REWARD_GRANTED";
    case PlatformSignal::Type::kPauseChanged:  return "PAUSE_CHANGED";
  }
  return "UNKNOWN";
}

PlatformShim::PlatformShim(IPlatformAdapter* adapter, StaleTimerGuard stale_guard)
    : adapter_(adapter), stale_guard_(stale_guard) {
  if (adapter_ == nullptr) {
    Logger::Warn("[PlatformShim] NO_ADAPTER natural admission disabled");
    return;
  }
  adapter_->SetListener(this);
}

PlatformShim::~PlatformShim() {
  if (adapter_ != nullptr) {
    adapter_->SetListener(nullptr);
  }
}

void PlatformShim::SetSignalHandler(SignalHandler handler) {
  handler_ = std::move(handler);
}

bool PlatformShim::IsAvailable() const {
  return adapter_ != nullptr && adapter_->IsAvailable();
}

GateVerdict PlatformShim::CheckNaturalTimer(
    int64_t now_ms, std::optional<int64_t> last_close_ms) const {
  if (!IsAvailable()) {
    return GateVerdict::kPlatformUnavailable;
  }
  if (!adapter_->IsNaturalTimerReady()) {
    return GateVerdict::kTimerNotReady;
  }

  // The platform can report ready with ~0s left right after a close, before
  // it has rearmed its own timer.
  if (last_close_ms.has_value()) {
    const int64_t since_close_ms = now_ms - *last_close_ms;
    const double seconds_left = adapter_->SecondsUntilNaturalTimer();
    if (since_close_ms >= 0 && since_close_ms < stale_guard_.window_ms &&
        seconds_left <= stale_guard_.threshold_s) {
      std::ostringstream oss;
      oss << "[PlatformShim] TIMER_STALE since_close_ms=" << since_close_ms
          << " seconds_left=" << seconds_left;
      Logger::Debug(oss.str());
      return GateVerdict::kTimerStale;
    }
  }
  return GateVerdict::kAdmitted;
}

double PlatformShim::SecondsUntilNaturalTimer() const {
  if (!IsAvailable()) {
    return -1.0;
  }
  return adapter_->SecondsUntilNaturalTimer();
}

bool PlatformShim::RequestShow(EventKind kind, const std::string& reward_id) {
  if (!IsAvailable()) {
    std::ostringstream oss;
    oss << "[PlatformShim] SHOW_DROPPED kind=" << ToString(kind)
        << " reason=platform_unavailable";
    Logger::Warn(oss.str());
    return false;
  }
  if (kind == EventKind::kRewarded) {
    adapter_->ShowRewarded(reward_id);
  } else {
    adapter_->Show();
  }
  return true;
}

bool PlatformShim::ForceReady() {
  if (!IsAvailable()) {
    return false;
  }
  if (adapter_->IsNaturalTimerReady()) {
    return false;
  }
  adapter_->ForceNaturalTimerReady();
  Logger::Debug("[PlatformShim] TIMER_FORCED_READY");
  return true;
}

bool PlatformShim::ResetToFullInterval() {
  if (!IsAvailable()) {
    return false;
  }
  adapter_->ResetNaturalTimerToFullInterval();
  std::ostringstream oss;
  oss << "[PlatformShim] TIMER_RESET seconds_left="
      << adapter_->SecondsUntilNaturalTimer();
  Logger::Debug(oss.str());
  return true;
}

void PlatformShim::OnOpened(EventKind kind) {
  PlatformSignal signal;
  signal.type = PlatformSignal::Type::kOpened;
  signal.kind = kind;
  Deliver(signal);
}

void PlatformShim::OnClosed(EventKind kind) {
  PlatformSignal signal;
  signal.type = PlatformSignal::Type::kClosed;
  signal.kind = kind;
  Deliver(signal);
}

void PlatformShim::OnRewardGranted(const std::string& reward_id) {
  PlatformSignal signal;
  signal.type = PlatformSignal::Type::kRewardGranted;
  signal.kind = EventKind::kRewarded;
  signal.reward_id = reward_id;
  Deliver(signal);
}

void PlatformShim::OnPauseChanged(bool paused) {
  PlatformSignal signal;
  signal.type = PlatformSignal::Type::kPauseChanged;
  signal.paused = paused;
  Deliver(signal);
}

void PlatformShim::Deliver(const PlatformSignal& signal) {
  if (!handler_) {
    ++signals_dropped_;
    std::ostringstream oss;
    oss << "[PlatformShim] SIGNAL_DROPPED type=" << ToString(signal.type)
        << " reason=no_handler";
    Logger::Warn(oss.str());
    return;
  }
  ++signals_delivered_;
  handler_(signal);
}

}  // namespace intermission::platform
