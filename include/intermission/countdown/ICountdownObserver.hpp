// Repository: Intermission
// Component: Countdown Observer
// Purpose: Hook for the external countdown display ("starts in 3-2-1").
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_COUNTDOWN_ICOUNTDOWN_OBSERVER_HPP_
#define INTERMISSION_COUNTDOWN_ICOUNTDOWN_OBSERVER_HPP_

namespace intermission::countdown {

class ICountdownObserver {
 public:
  virtual ~ICountdownObserver() = default;

  // Hosts that pause during the warning do it here; the countdown itself
  // only suspends controllers.
  virtual void OnCountdownStarted() = 0;

  // Emitted for the starting value and for every later value above zero.
  virtual void OnCountdownTick(int remaining_s) = 0;

  // Emitted once per countdown, on completion or cancellation. A host that
  // paused in OnCountdownStarted resumes here unless an event is showing.
  virtual void OnCountdownEnded() = 0;
};

}  // namespace intermission::countdown

#endif  // INTERMISSION_COUNTDOWN_ICOUNTDOWN_OBSERVER_HPP_
