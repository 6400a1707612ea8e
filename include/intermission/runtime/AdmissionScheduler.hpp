// Repository: Intermission
// Component: Admission Scheduler
// Purpose: Decides when the full-screen interruption may fire. Combines the
//          admission gates, drives the warning countdown, and reconciles
//          platform open/close notifications with controller restoration.
// Copyright (c) 2026 Intermission
//
// Execution model: single-threaded and cooperative. Tick() is driven once per
// second (TickLoop in production); every other entry point (Block, manual
// trigger, zone and platform notifications) must be called on the same
// thread. No locks are taken.
//
// Phase changes go through one transition table (SchedulerTypes.cpp):
//
//   kIdle --CountdownStarted--> kCountingDown --ShowRequested--> kAwaitingOpen
//   kCountingDown --CountdownCancelled--> kIdle
//   kAwaitingOpen --Opened--> kShowing --Closed--> kIdle
//
// plus the direct edges used by manual/rewarded requests, failed requests
// and platform-initiated events.
//
// Countdown instances are owned here, one per cycle. A completed cycle keeps
// its controllers suspended until the matching close; instances are only
// destroyed at the top of Tick() (or on shutdown), never from inside one of
// their own callbacks.

#ifndef INTERMISSION_RUNTIME_ADMISSION_SCHEDULER_HPP_
#define INTERMISSION_RUNTIME_ADMISSION_SCHEDULER_HPP_

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "intermission/admission/BlockCounter.hpp"
#include "intermission/admission/CooldownGuard.hpp"
#include "intermission/admission/ManualTriggerPolicy.hpp"
#include "intermission/admission/ZoneGate.hpp"
#include "intermission/countdown/CountdownController.hpp"
#include "intermission/countdown/SuspensionLedger.hpp"
#include "intermission/platform/PlatformShim.hpp"
#include "intermission/runtime/SchedulerConfig.hpp"
#include "intermission/runtime/SchedulerMetrics.hpp"
#include "intermission/runtime/SchedulerTypes.hpp"

namespace intermission::countdown {
class IControllable;
class ICountdownObserver;
}
namespace intermission::persistence {
class IKeyValueStore;
}
namespace intermission::timing {
class ITimeSource;
}

namespace intermission::runtime {

class AdmissionScheduler {
 public:
  using CycleId = countdown::SuspensionLedger::CycleId;

  // Non-owning. Each must outlive the scheduler. Any may be null; a null
  // clock falls back to an owned SystemTimeSource.
  struct Collaborators {
    platform::IPlatformAdapter* platform = nullptr;
    persistence::IKeyValueStore* store = nullptr;
    const timing::ITimeSource* clock = nullptr;
    countdown::ICountdownObserver* countdown_observer = nullptr;
  };

  struct Callbacks {
    // A warning countdown was started for this cycle.
    std::function<void(CycleId cycle_id)> on_countdown_started;

    // Display was requested from the platform.
    std::function<void(platform::EventKind kind)> on_event_requested;

    // The platform reported the event closed (duplicates filtered).
    std::function<void(platform::EventKind kind)> on_event_closed;
  };

  // Throws std::invalid_argument if config.Validate() reports problems.
  AdmissionScheduler(SchedulerConfig config,
                     Collaborators collaborators,
                     Callbacks callbacks = Callbacks());
  ~AdmissionScheduler();

  AdmissionScheduler(const AdmissionScheduler&) = delete;
  AdmissionScheduler& operator=(const AdmissionScheduler&) = delete;

  // ---- Controllers suspended by the countdown ----
  void RegisterController(const std::shared_ptr<countdown::IControllable>& controller);
  void UnregisterController(const countdown::IControllable* controller);
  size_t controller_count() const;

  // ---- Lifecycle ----
  // Releases the startup hold (block_until_initialized). Idempotent.
  void OnHostInitialized();

  // Zone collaborator became available; current_zone if it already knows it.
  void AttachZoneSource(std::optional<admission::ZoneId> current_zone);
  void DetachZoneSource();

  // One-second cadence: retire finished cycles, abandon an overdue
  // awaiting-open display, advance the countdown, then poll.
  GateVerdict Tick();

  // ---- Block counter ----
  void Block();
  void Unblock();
  void ForceReset();

  // ---- Manual and rewarded triggers ----
  ManualTriggerResult RequestManualTrigger();

  // Whether RequestManualTrigger() would request a display right now.
  // Does not touch the persisted counter.
  [[nodiscard]] bool WouldManualTriggerFire() const;

  // Rejected (false) while an event is showing or awaiting open, or when no
  // platform is available. on_reward runs at most once, on a matching
  // OnRewardGranted().
  bool RequestRewarded(const std::string& reward_id, std::function<void()> on_reward);

  // ---- Notifications ----
  void OnZoneChanged(const admission::ZoneId& zone);
  void OnOpened(platform::EventKind kind = platform::EventKind::kInterstitial);
  void OnClosed(platform::EventKind kind = platform::EventKind::kInterstitial);
  void OnRewardGranted(const std::string& reward_id);
  void OnPlatformPauseChanged(bool paused);

  // ---- Diagnostics ----
  [[nodiscard]] Phase phase() const { return phase_; }
  [[nodiscard]] bool is_waiting() const { return phase_ == Phase::kCountingDown; }
  [[nodiscard]] bool is_event_showing() const { return phase_ == Phase::kShowing; }
  [[nodiscard]] bool is_polling() const { return polling_; }
  [[nodiscard]] bool is_initialized() const { return initialized_; }
  [[nodiscard]] int block_count() const { return blocks_.count(); }
  [[nodiscard]] std::optional<int64_t> last_event_close_ms() const {
    return cooldown_.last_close_ms();
  }
  [[nodiscard]] bool IsAdmissionBlocked() const { return blocks_.IsBlocked(); }
  [[nodiscard]] double SecondsUntilNaturalTimer() const;
  [[nodiscard]] int64_t NextManualAdmitCounter() const { return policy_.NextAdmitCounter(); }
  [[nodiscard]] int64_t manual_trigger_counter() const { return policy_.counter(); }
  [[nodiscard]] const countdown::CountdownController* active_countdown() const {
    return active_countdown_.get();
  }
  [[nodiscard]] const std::optional<admission::ZoneId>& current_zone() const {
    return zone_.current_zone();
  }
  [[nodiscard]] const SchedulerConfig& config() const { return config_; }
  [[nodiscard]] SchedulerMetrics Snapshot() const;

 private:
  static constexpr const char* kPauseHold = "platform-pause";

  int64_t NowMs() const;

  // Applies event through the transition table. Returns false (and counts
  // an illegal transition) when the table has no row.
  bool Dispatch(SchedulerEvent event);

  GateVerdict Evaluate(int64_t now_ms) const;
  GateVerdict Poll(int64_t now_ms);
  ManualTriggerResult EvaluateManualTrigger();

  void StartCountdown();
  void OnCountdownCompleted(CycleId cycle_id);
  bool CancelCountdown(const char* reason);
  bool RequestDisplay(platform::EventKind kind, const std::string& reward_id);
  void RestoreAwaitingCycles();
  void CheckAwaitingOpenTimeout(int64_t now_ms);
  void ForfeitPendingRewards();

  void StartPolling(const char* reason);
  void StopPolling(const char* reason);

  void HandleSignal(const platform::PlatformSignal& signal);
  std::vector<std::weak_ptr<countdown::IControllable>> LiveControllers();

  SchedulerConfig config_;
  Callbacks callbacks_;
  std::unique_ptr<timing::ITimeSource> owned_clock_;
  const timing::ITimeSource* clock_;
  countdown::ICountdownObserver* countdown_observer_;

  admission::BlockCounter blocks_;
  admission::CooldownGuard cooldown_;
  admission::ManualTriggerPolicy policy_;
  admission::ZoneGate zone_;
  platform::PlatformShim shim_;

  // Declared before the countdown containers: instances release into it
  // when destroyed.
  countdown::SuspensionLedger ledger_;
  std::vector<std::weak_ptr<countdown::IControllable>> controllers_;
  std::unique_ptr<countdown::CountdownController> active_countdown_;
  std::vector<std::unique_ptr<countdown::CountdownController>> awaiting_restore_;
  std::vector<std::unique_ptr<countdown::CountdownController>> retired_;
  CycleId next_cycle_id_ = 1;

  Phase phase_ = Phase::kIdle;
  bool polling_ = false;
  bool initialized_ = false;
  std::optional<int64_t> awaiting_open_since_ms_;
  std::optional<GateVerdict> last_poll_verdict_;
  std::map<std::string, std::function<void()>> pending_rewards_;

  SchedulerMetrics metrics_;
};

}  // namespace intermission::runtime

#endif  // INTERMISSION_RUNTIME_ADMISSION_SCHEDULER_HPP_
