// Repository: Intermission
// Component: Countdown Controller
// Copyright (c) 2026 Intermission

#include "intermission/countdown/CountdownController.hpp"

#include <cmath>
#include <limits>
#include <set>
#include <sstream>
#include <utility>

#include "intermission/countdown/IControllable.hpp"
#include "intermission/countdown/ICountdownObserver.hpp"
#include "intermission/util/Logger.hpp"

namespace intermission::countdown {

using util::Logger;

namespace {

int WholeSeconds(double duration_s) {
  if (std::isnan(duration_s) || duration_s <= 0.0) {
    return 0;
  }
  const double rounded = std::ceil(duration_s);
  if (rounded >= static_cast<double>(std::numeric_limits<int>::max())) {
    return std::numeric_limits<int>::max();
  }
  return static_cast<int>(rounded);
}

}  // namespace

const char* ToString(CountdownController::State state) {
  switch (state) {
    case CountdownController::State::kIdle:      return "IDLE";
    case CountdownController::State::kCounting:  return "COUNTING";
    case CountdownController::State::kCompleted: return "COMPLETED";
    case CountdownController::State::kCancelled: return "CANCELLED";
  }
  return "UNKNOWN";
}

CountdownController::CountdownController(
    CycleId cycle_id,
    SuspensionLedger* ledger,
    std::vector<std::weak_ptr<IControllable>> controllers,
    ICountdownObserver* observer)
    : cycle_id_(cycle_id),
      owned_ledger_(ledger == nullptr ? std::make_unique<SuspensionLedger>()
                                      : nullptr),
      ledger_(ledger == nullptr ? owned_ledger_.get() : ledger),
      controllers_(std::move(controllers)),
      observer_(observer) {}

CountdownController::~CountdownController() {
  EnsureRestored();
}

bool CountdownController::Start(double duration_s,
                                std::function<void()> on_complete) {
  if (state_ != State::kIdle) {
    std::ostringstream oss;
    oss << "[CountdownController] START_REJECTED cycle=" << cycle_id_
        << " state=" << ToString(state_);
    Logger::Warn(oss.str());
    return false;
  }

  total_s_ = WholeSeconds(duration_s);
  remaining_s_ = total_s_;
  on_complete_ = std::move(on_complete);
  state_ = State::kCounting;

  SuspendAll();

  {
    std::ostringstream oss;
    oss << "[CountdownController] STARTED cycle=" << cycle_id_
        << " duration_s=" << total_s_ << " suspended=" << suspended_.size();
    Logger::Debug(oss.str());
  }

  if (observer_ != nullptr) {
    observer_->OnCountdownStarted();
  }

  if (remaining_s_ <= 0) {
    Complete();
    return true;
  }

  if (observer_ != nullptr) {
    observer_->OnCountdownTick(remaining_s_);
  }
  return true;
}

void CountdownController::Tick() {
  if (state_ != State::kCounting) {
    return;
  }
  --remaining_s_;
  if (remaining_s_ <= 0) {
    remaining_s_ = 0;
    Complete();
    return;
  }
  if (observer_ != nullptr) {
    observer_->OnCountdownTick(remaining_s_);
  }
}

bool CountdownController::Cancel() {
  if (state_ != State::kCounting) {
    return false;
  }
  state_ = State::kCancelled;
  on_complete_ = nullptr;
  const size_t restored = EnsureRestored();

  std::ostringstream oss;
  oss << "[CountdownController] CANCELLED cycle=" << cycle_id_
      << " remaining_s=" << remaining_s_ << " restored=" << restored;
  Logger::Debug(oss.str());

  EmitEnded();
  return true;
}

void CountdownController::Hide() {
  if (!Cancel()) {
    EnsureRestored();
  }
}

size_t CountdownController::EnsureRestored() {
  size_t restored = 0;
  for (auto& entry : suspended_) {
    if (entry.already_restored) {
      continue;
    }
    entry.already_restored = true;

    const auto outcome = ledger_->Release(cycle_id_, entry.key);
    if (outcome == SuspensionLedger::ReleaseOutcome::kEnabled ||
        outcome == SuspensionLedger::ReleaseOutcome::kLeftDisabled) {
      ++restored;
    } else {
      // kNotOwner: a newer cycle holds it. kDeferred: the ledger finishes
      // the job when its hold is released.
      std::ostringstream oss;
      oss << "[CountdownController] RESTORE_SKIPPED cycle=" << cycle_id_
          << " outcome=" << ToString(outcome);
      Logger::Debug(oss.str());
    }
  }
  return restored;
}

bool CountdownController::IsFullyRestored() const {
  for (const auto& entry : suspended_) {
    if (!entry.already_restored) {
      return false;
    }
  }
  return true;
}

void CountdownController::SuspendAll() {
  std::set<const IControllable*> seen;
  for (const auto& weak : controllers_) {
    auto controller = weak.lock();
    if (!controller || !seen.insert(controller.get()).second) {
      continue;
    }
    Suspended entry;
    entry.controller = controller;
    entry.key = controller.get();
    entry.was_enabled = ledger_->Claim(cycle_id_, controller);
    suspended_.push_back(std::move(entry));
  }
}

void CountdownController::Complete() {
  state_ = State::kCompleted;

  std::ostringstream oss;
  oss << "[CountdownController] COMPLETED cycle=" << cycle_id_;
  Logger::Debug(oss.str());

  EmitEnded();

  auto on_complete = std::move(on_complete_);
  on_complete_ = nullptr;
  if (on_complete) {
    on_complete();
  }
}

void CountdownController::EmitEnded() {
  if (ended_emitted_) {
    return;
  }
  ended_emitted_ = true;
  if (observer_ != nullptr) {
    observer_->OnCountdownEnded();
  }
}

}  // namespace intermission::countdown
