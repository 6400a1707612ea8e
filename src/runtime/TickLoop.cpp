// Repository: Intermission
// Component: Tick Loop
// Copyright (c) 2026 Intermission

#include "intermission/runtime/TickLoop.hpp"

#include <sstream>

#include "intermission/runtime/AdmissionScheduler.hpp"
#include "intermission/timing/IWaitStrategy.hpp"
#include "intermission/util/Logger.hpp"

namespace intermission::runtime {

using util::Logger;

TickLoop::TickLoop(AdmissionScheduler* scheduler,
                   timing::IWaitStrategy* wait,
                   std::chrono::milliseconds interval)
    : scheduler_(scheduler),
      wait_(wait),
      interval_(interval.count() > 0 ? interval : kDefaultInterval) {}

int64_t TickLoop::RunTicks(int64_t count, const BeforeTick& before_tick) {
  const auto start = std::chrono::steady_clock::now();
  int64_t ran = 0;

  for (int64_t i = 0; count < 0 || i < count; ++i) {
    if (stop_requested()) {
      Logger::Info("[TickLoop] STOP_REQUESTED");
      break;
    }
    // Absolute deadline: tick i is due at start + i * interval.
    wait_->WaitUntil(start + interval_ * i);
    if (stop_requested()) {
      Logger::Info("[TickLoop] STOP_REQUESTED");
      break;
    }

    if (before_tick) {
      before_tick(i);
    }
    const GateVerdict verdict = scheduler_->Tick();
    ++ran;
    ++total_ticks_;

    std::ostringstream oss;
    oss << "[TickLoop] TICK index=" << i << " verdict=" << admission::ToString(verdict)
        << " phase=" << ToString(scheduler_->phase());
    Logger::Debug(oss.str());
  }
  return ran;
}

}  // namespace intermission::runtime
