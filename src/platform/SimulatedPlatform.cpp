// Repository: Intermission
// Component: Simulated Platform
// Copyright (c) 2026 Intermission

#include "intermission/platform/SimulatedPlatform.hpp"

#include <algorithm>
#include <sstream>

#include "intermission/timing/ITimeSource.hpp"
#include "intermission/util/Logger.hpp"

namespace intermission::platform {

using util::Logger;

SimulatedPlatform::SimulatedPlatform(const timing::ITimeSource* clock,
                                     Options options)
    : clock_(clock),
      options_(options),
      available_(options.available),
      next_ready_ms_(clock->NowMs() + std::max<int64_t>(0, options.timer_interval_ms)) {
  options_.open_delay_ms = std::max<int64_t>(0, options_.open_delay_ms);
  options_.event_length_ms = std::max<int64_t>(0, options_.event_length_ms);
}

bool SimulatedPlatform::IsNaturalTimerReady() const {
  return clock_->NowMs() >= next_ready_ms_;
}

double SimulatedPlatform::SecondsUntilNaturalTimer() const {
  const int64_t left_ms = std::max<int64_t>(0, next_ready_ms_ - clock_->NowMs());
  return static_cast<double>(left_ms) / 1000.0;
}

void SimulatedPlatform::Show() {
  if (!available_ || IsEventInFlight() || !IsNaturalTimerReady()) {
    ++shows_ignored_;
    std::ostringstream oss;
    oss << "[SimulatedPlatform] SHOW_IGNORED available=" << available_
        << " in_flight=" << IsEventInFlight()
        << " timer_ready=" << IsNaturalTimerReady();
    Logger::Debug(oss.str());
    return;
  }
  Schedule(EventKind::kInterstitial, std::string());
}

void SimulatedPlatform::ShowRewarded(const std::string& reward_id) {
  if (!available_ || IsEventInFlight()) {
    ++shows_ignored_;
    Logger::Debug("[SimulatedPlatform] SHOW_REWARDED_IGNORED id=" + reward_id);
    return;
  }
  Schedule(EventKind::kRewarded, reward_id);
}

void SimulatedPlatform::ForceNaturalTimerReady() {
  next_ready_ms_ = clock_->NowMs();
}

void SimulatedPlatform::ResetNaturalTimerToFullInterval() {
  next_ready_ms_ = clock_->NowMs() + options_.timer_interval_ms;
}

void SimulatedPlatform::Schedule(EventKind kind, const std::string& reward_id) {
  ++shows_accepted_;
  const int64_t open_ms = clock_->NowMs() + options_.open_delay_ms;
  const int64_t close_ms = open_ms + options_.event_length_ms;

  auto push = [&](int64_t due_ms, Step step) {
    Pending pending;
    pending.due_ms = due_ms;
    pending.step = step;
    pending.kind = kind;
    pending.reward_id = reward_id;
    pending_.push_back(pending);
  };

  if (options_.pause_host) push(open_ms, Step::kPauseOn);
  push(open_ms, Step::kOpen);
  if (kind == EventKind::kRewarded) push(close_ms, Step::kReward);
  push(close_ms, Step::kClose);
  if (options_.pause_host) push(close_ms, Step::kPauseOff);

  std::ostringstream oss;
  oss << "[SimulatedPlatform] SHOW_ACCEPTED kind=" << ToString(kind)
      << " open_at_ms=" << open_ms << " close_at_ms=" << close_ms;
  Logger::Debug(oss.str());
}

size_t SimulatedPlatform::Pump() {
  size_t delivered = 0;
  while (!pending_.empty() && pending_.front().due_ms <= clock_->NowMs()) {
    const Pending pending = pending_.front();
    pending_.pop_front();
    Dispatch(pending);
    ++delivered;
  }
  return delivered;
}

void SimulatedPlatform::Dispatch(const Pending& pending) {
  switch (pending.step) {
    case Step::kOpen:
      showing_ = true;
      break;
    case Step::kClose:
      showing_ = false;
      next_ready_ms_ = clock_->NowMs() + options_.timer_interval_ms;
      break;
    default:
      break;
  }

  if (listener_ == nullptr) {
    return;
  }
  switch (pending.step) {
    case Step::kPauseOn:  listener_->OnPauseChanged(true); break;
    case Step::kOpen:     listener_->OnOpened(pending.kind); break;
    case Step::kReward:   listener_->OnRewardGranted(pending.reward_id); break;
    case Step::kClose:    listener_->OnClosed(pending.kind); break;
    case Step::kPauseOff: listener_->OnPauseChanged(false); break;
  }
}

}  // namespace intermission::platform
