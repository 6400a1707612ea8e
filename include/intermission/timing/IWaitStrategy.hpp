// Repository: Intermission
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from deadline math in TickLoop.
//          Production: RealtimeWaitStrategy sleeps until deadline.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_TIMING_IWAIT_STRATEGY_HPP_
#define INTERMISSION_TIMING_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <thread>

namespace intermission::timing {

class IWaitStrategy {
 public:
  virtual void WaitUntil(std::chrono::steady_clock::time_point deadline) = 0;
  virtual ~IWaitStrategy() = default;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  void WaitUntil(std::chrono::steady_clock::time_point deadline) override {
    std::this_thread::sleep_until(deadline);
  }
};

}  // namespace intermission::timing

#endif  // INTERMISSION_TIMING_IWAIT_STRATEGY_HPP_
