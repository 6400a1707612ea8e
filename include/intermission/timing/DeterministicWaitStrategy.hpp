// Repository: Intermission
// Component: Deterministic Wait Strategy
// Purpose: Delta-based virtual time advancement. Advances a
//          DeterministicTimeSource by exactly the deadline delta on each
//          wait. No sleep, no wall-clock drift.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_TIMING_DETERMINISTIC_WAIT_STRATEGY_HPP_
#define INTERMISSION_TIMING_DETERMINISTIC_WAIT_STRATEGY_HPP_

#include <chrono>
#include <memory>

#include "intermission/timing/DeterministicTimeSource.hpp"
#include "intermission/timing/IWaitStrategy.hpp"

namespace intermission::timing {

class DeterministicWaitStrategy : public IWaitStrategy {
 public:
  explicit DeterministicWaitStrategy(std::shared_ptr<DeterministicTimeSource> ts)
      : ts_(std::move(ts)) {}

  void WaitUntil(std::chrono::steady_clock::time_point deadline) override {
    if (has_prev_) {
      auto delta = deadline - prev_deadline_;
      ts_->AdvanceNs(
          std::chrono::duration_cast<std::chrono::nanoseconds>(delta).count());
    }
    prev_deadline_ = deadline;
    has_prev_ = true;
    ++waits_;
  }

  int64_t waits() const { return waits_; }

 private:
  std::shared_ptr<DeterministicTimeSource> ts_;
  std::chrono::steady_clock::time_point prev_deadline_{};
  bool has_prev_ = false;
  int64_t waits_ = 0;
};

}  // namespace intermission::timing

#endif  // INTERMISSION_TIMING_DETERMINISTIC_WAIT_STRATEGY_HPP_
