// Repository: Intermission
// Component: Countdown Controller
// Purpose: Pre-event warning state machine for one admission cycle.
//          Suspends registered controllers on Start() and guarantees their
//          restoration through an idempotent EnsureRestored().
// Copyright (c) 2026 Intermission
//
// Lifecycle (one instance per cycle):
//
//   kIdle --Start()--> kCounting --Tick() x N--> kCompleted
//                          |
//                          +--Cancel()--> kCancelled
//
// On kCompleted controllers stay suspended (the interruption needs them
// disabled too) and on_complete fires exactly once. On kCancelled they are
// restored immediately and on_complete never fires.
//
// Restoration goes through the scheduler-wide SuspensionLedger so that a late
// EnsureRestored() for this cycle never re-enables a controller that a newer
// cycle has suspended in the meantime.

#ifndef INTERMISSION_COUNTDOWN_COUNTDOWN_CONTROLLER_HPP_
#define INTERMISSION_COUNTDOWN_COUNTDOWN_CONTROLLER_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "intermission/countdown/SuspensionLedger.hpp"

namespace intermission::countdown {

class IControllable;
class ICountdownObserver;

class CountdownController {
 public:
  using CycleId = SuspensionLedger::CycleId;

  enum class State {
    kIdle = 0,
    kCounting = 1,
    kCompleted = 2,
    kCancelled = 3,
  };

  // ledger must outlive this instance; when null the instance keeps a
  // private one. observer may be null.
  CountdownController(CycleId cycle_id,
                      SuspensionLedger* ledger,
                      std::vector<std::weak_ptr<IControllable>> controllers,
                      ICountdownObserver* observer);
  ~CountdownController();

  CountdownController(const CountdownController&) = delete;
  CountdownController& operator=(const CountdownController&) = delete;

  // kIdle -> kCounting. remaining = ceil(duration_s); NaN and negative
  // durations count as zero. A zero countdown completes before Start()
  // returns. Returns false if not kIdle.
  bool Start(double duration_s, std::function<void()> on_complete);

  // One-second decrement. No-op unless kCounting.
  void Tick();

  // kCounting -> kCancelled. Restores controllers; on_complete is not
  // invoked. Returns false if not counting.
  bool Cancel();

  // Hides the countdown: cancels if counting, otherwise restores.
  void Hide();

  // Idempotent. Returns the number of controllers restored by this call.
  size_t EnsureRestored();

  [[nodiscard]] State state() const { return state_; }
  [[nodiscard]] int remaining_s() const { return remaining_s_; }
  [[nodiscard]] int total_s() const { return total_s_; }
  [[nodiscard]] CycleId cycle_id() const { return cycle_id_; }
  [[nodiscard]] bool IsFullyRestored() const;
  [[nodiscard]] size_t suspended_count() const { return suspended_.size(); }

 private:
  struct Suspended {
    std::weak_ptr<IControllable> controller;
    const IControllable* key = nullptr;
    bool was_enabled = false;
    bool already_restored = false;
  };

  void SuspendAll();
  void Complete();
  void EmitEnded();

  const CycleId cycle_id_;
  std::unique_ptr<SuspensionLedger> owned_ledger_;
  SuspensionLedger* ledger_;
  std::vector<std::weak_ptr<IControllable>> controllers_;
  ICountdownObserver* observer_;

  State state_ = State::kIdle;
  int remaining_s_ = 0;
  int total_s_ = 0;
  bool ended_emitted_ = false;
  std::function<void()> on_complete_;
  std::vector<Suspended> suspended_;
};

const char* ToString(CountdownController::State state);

}  // namespace intermission::countdown

#endif  // INTERMISSION_COUNTDOWN_COUNTDOWN_CONTROLLER_HPP_
