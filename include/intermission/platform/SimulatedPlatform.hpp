// Repository: Intermission
// Component: Simulated Platform
// Purpose: In-process IPlatformAdapter with its own natural timer. Backs the
//          simulator executable and the scenario tests.
// Copyright (c) 2026 Intermission
//
// Behaviour modelled on the hosted ad platforms:
//   - The natural timer becomes ready timer_interval_ms after start and after
//     every close.
//   - Show() is ignored while the timer is not ready or an event is in
//     flight. ShowRewarded() ignores the timer.
//   - Accepted requests produce, on later Pump() calls:
//       open_delay_ms later:   OnPauseChanged(true), OnOpened(kind)
//       event_length_ms later: OnRewardGranted(id) (rewarded only),
//                              OnClosed(kind), OnPauseChanged(false)

#ifndef INTERMISSION_PLATFORM_SIMULATED_PLATFORM_HPP_
#define INTERMISSION_PLATFORM_SIMULATED_PLATFORM_HPP_

#include <cstdint>
#include <deque>
#include <string>

#include "intermission/platform/IPlatformAdapter.hpp"

namespace intermission::timing {
class ITimeSource;
}

namespace intermission::platform {

class SimulatedPlatform : public IPlatformAdapter {
 public:
  struct Options {
    int64_t timer_interval_ms = 60000;
    int64_t open_delay_ms = 0;
    int64_t event_length_ms = 5000;
    bool available = true;
    bool pause_host = true;
  };

  // clock must outlive this instance.
  SimulatedPlatform(const timing::ITimeSource* clock, Options options);

  SimulatedPlatform(const SimulatedPlatform&) = delete;
  SimulatedPlatform& operator=(const SimulatedPlatform&) = delete;

  // IPlatformAdapter
  bool IsAvailable() const override { return available_; }
  bool IsNaturalTimerReady() const override;
  double SecondsUntilNaturalTimer() const override;
  void Show() override;
  void ShowRewarded(const std::string& reward_id) override;
  void ForceNaturalTimerReady() override;
  void ResetNaturalTimerToFullInterval() override;
  void SetListener(IPlatformListener* listener) override { listener_ = listener; }

  // Delivers every notification due at or before now. Returns the number
  // delivered.
  size_t Pump();

  void SetAvailable(bool available) { available_ = available; }

  bool IsEventInFlight() const { return showing_ || !pending_.empty(); }
  bool IsShowing() const { return showing_; }

  uint64_t shows_accepted() const { return shows_accepted_; }
  uint64_t shows_ignored() const { return shows_ignored_; }
  const Options& options() const { return options_; }

 private:
  enum class Step {
    kPauseOn,
    kOpen,
    kReward,
    kClose,
    kPauseOff,
  };

  struct Pending {
    int64_t due_ms = 0;
    Step step = Step::kOpen;
    EventKind kind = EventKind::kInterstitial;
    std::string reward_id;
  };

  void Schedule(EventKind kind, const std::string& reward_id);
  void Dispatch(const Pending& pending);

  const timing::ITimeSource* clock_;
  Options options_;
  IPlatformListener* listener_ = nullptr;
  bool available_;
  bool showing_ = false;
  int64_t next_ready_ms_;
  std::deque<Pending> pending_;
  uint64_t shows_accepted_ = 0;
  uint64_t shows_ignored_ = 0;
};

}  // namespace intermission::platform

#endif  // INTERMISSION_PLATFORM_SIMULATED_PLATFORM_HPP_
