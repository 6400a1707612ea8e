// Repository: Intermission
// Component: Tick Loop
// Purpose: Drives AdmissionScheduler::Tick() on a fixed cadence using
//          absolute deadlines, so a slow tick never shifts later ones.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_RUNTIME_TICK_LOOP_HPP_
#define INTERMISSION_RUNTIME_TICK_LOOP_HPP_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>

namespace intermission::timing {
class IWaitStrategy;
}

namespace intermission::runtime {

class AdmissionScheduler;

class TickLoop {
 public:
  // Runs on the tick thread right before each Tick(); tick_index counts
  // from 0 within one RunTicks() call.
  using BeforeTick = std::function<void(int64_t tick_index)>;

  static constexpr std::chrono::milliseconds kDefaultInterval{1000};

  // scheduler and wait must outlive the loop.
  TickLoop(AdmissionScheduler* scheduler,
           timing::IWaitStrategy* wait,
           std::chrono::milliseconds interval = kDefaultInterval);

  TickLoop(const TickLoop&) = delete;
  TickLoop& operator=(const TickLoop&) = delete;

  // Runs count ticks on the calling thread (count < 0: until RequestStop()).
  // The first tick runs immediately. Returns the number of ticks run.
  int64_t RunTicks(int64_t count, const BeforeTick& before_tick = BeforeTick());

  // Lock-free; safe from a signal handler.
  void RequestStop() { stop_requested_.store(true, std::memory_order_release); }
  bool stop_requested() const { return stop_requested_.load(std::memory_order_acquire); }

  int64_t total_ticks() const { return total_ticks_; }
  std::chrono::milliseconds interval() const { return interval_; }

 private:
  AdmissionScheduler* scheduler_;
  timing::IWaitStrategy* wait_;
  std::chrono::milliseconds interval_;
  std::atomic<bool> stop_requested_{false};
  int64_t total_ticks_ = 0;
};

}  // namespace intermission::runtime

#endif  // INTERMISSION_RUNTIME_TICK_LOOP_HPP_
