// Repository: Intermission
// Component: Platform Shim
// Purpose: Translates the external platform's timer and notifications into
//          the scheduler's vocabulary (GateVerdict, PlatformSignal).
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_PLATFORM_PLATFORM_SHIM_HPP_
#define INTERMISSION_PLATFORM_PLATFORM_SHIM_HPP_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include "intermission/admission/GateVerdict.hpp"
#include "intermission/platform/IPlatformAdapter.hpp"

namespace intermission::platform {

struct PlatformSignal {
  enum class Type {
    kOpened = 0,
    kClosed = 1,
    kRewardGranted = 2,
    kPauseChanged = 3,
  };

  Type type = Type::kOpened;
  EventKind kind = EventKind::kInterstitial;
  std::string reward_id;  // kRewardGranted only
  bool paused = false;    // kPauseChanged only
};

const char* ToString(PlatformSignal::Type type);

// Wraps a possibly-null adapter. Subscribes to it on construction and
// unsubscribes on destruction; notifications are forwarded as
// PlatformSignal to the handler installed with SetSignalHandler().
class PlatformShim : public IPlatformListener {
 public:
  using SignalHandler = std::function<void(const PlatformSignal&)>;

  struct StaleTimerGuard {
    // A ready timer reporting at most this many seconds remaining...
    double threshold_s = 0.1;
    // ...within this long of the last close is a leftover ready flag.
    int64_t window_ms = 4000;
  };

  PlatformShim(IPlatformAdapter* adapter, StaleTimerGuard stale_guard);
  ~PlatformShim() override;

  PlatformShim(const PlatformShim&) = delete;
  PlatformShim& operator=(const PlatformShim&) = delete;

  void SetSignalHandler(SignalHandler handler);

  bool HasAdapter() const { return adapter_ != nullptr; }
  bool IsAvailable() const;

  // kPlatformUnavailable, kTimerNotReady, kTimerStale or kAdmitted.
  admission::GateVerdict CheckNaturalTimer(
      int64_t now_ms, std::optional<int64_t> last_close_ms) const;

  // -1 when no platform is available.
  double SecondsUntilNaturalTimer() const;

  // Return false when the request could not be passed on.
  bool RequestShow(EventKind kind, const std::string& reward_id = std::string());
  bool ForceReady();
  bool ResetToFullInterval();

  uint64_t signals_delivered() const { return signals_delivered_; }
  uint64_t signals_dropped() const { return signals_dropped_; }

  // IPlatformListener
  void OnOpened(EventKind kind) override;
  void OnClosed(EventKind kind) override;
  void OnRewardGranted(const std::string& reward_id) override;
  void OnPauseChanged(bool paused) override;

 private:
  void Deliver(const PlatformSignal& signal);

  IPlatformAdapter* adapter_;
  StaleTimerGuard stale_guard_;
  SignalHandler handler_;
  uint64_t signals_delivered_ = 0;
  uint64_t signals_dropped_ = 0;
};

}  // namespace intermission::platform

#endif  // INTERMISSION_PLATFORM_PLATFORM_SHIM_HPP_
