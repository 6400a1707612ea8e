// Repository: Intermission
// Component: Platform Adapter Interface
// Purpose: Boundary to the external service that owns the natural timer and
//          actually displays the interruption.
// Copyright (c) 2026 Intermission
//
// All calls are fire-and-forget and return immediately. Results arrive later
// through IPlatformListener on the same cooperative thread that drives the
// scheduler.

#ifndef INTERMISSION_PLATFORM_IPLATFORM_ADAPTER_HPP_
#define INTERMISSION_PLATFORM_IPLATFORM_ADAPTER_HPP_

#include <string>

namespace intermission::platform {

enum class EventKind {
  kInterstitial = 0,
  kRewarded = 1,
};

const char* ToString(EventKind kind);

class IPlatformListener {
 public:
  virtual ~IPlatformListener() = default;

  virtual void OnOpened(EventKind kind) = 0;
  virtual void OnClosed(EventKind kind) = 0;
  virtual void OnRewardGranted(const std::string& reward_id) = 0;

  // paused=true while the platform holds the host suspended (audio, time
  // scale, input) around an event.
  virtual void OnPauseChanged(bool paused) = 0;
};

class IPlatformAdapter {
 public:
  virtual ~IPlatformAdapter() = default;

  // False when the platform SDK is disabled or failed to initialise.
  virtual bool IsAvailable() const = 0;

  virtual bool IsNaturalTimerReady() const = 0;

  // Diagnostic/display only.
  virtual double SecondsUntilNaturalTimer() const = 0;

  virtual void Show() = 0;
  virtual void ShowRewarded(const std::string& reward_id) = 0;

  // Privileged timer adjustments. Used by the manual-trigger path and the
  // zone-return path only.
  virtual void ForceNaturalTimerReady() = 0;
  virtual void ResetNaturalTimerToFullInterval() = 0;

  // At most one listener. nullptr unsubscribes.
  virtual void SetListener(IPlatformListener* listener) = 0;
};

}  // namespace intermission::platform

#endif  // INTERMISSION_PLATFORM_IPLATFORM_ADAPTER_HPP_
