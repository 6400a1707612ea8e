// Repository: Intermission
// Component: Admission Scheduler
// Copyright (c) 2026 Intermission

#include "intermission/runtime/AdmissionScheduler.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "intermission/countdown/IControllable.hpp"
#include "intermission/countdown/ICountdownObserver.hpp"
#include "intermission/persistence/IKeyValueStore.hpp"
#include "intermission/timing/ITimeSource.hpp"
#include "intermission/timing/SystemTimeSource.hpp"
#include "intermission/util/Logger.hpp"

namespace intermission::runtime {

using countdown::CountdownController;
using platform::EventKind;
using platform::PlatformSignal;
using util::Logger;

namespace {

SchedulerConfig Validated(SchedulerConfig config) {
  const auto problems = config.Validate();
  if (!problems.empty()) {
    std::ostringstream oss;
    oss << "invalid scheduler config:";
    for (const auto& problem : problems) {
      oss << " " << problem << ";";
    }
    throw std::invalid_argument(oss.str());
  }
  return config;
}

platform::PlatformShim::StaleTimerGuard StaleGuardFor(const SchedulerConfig& config) {
  platform::PlatformShim::StaleTimerGuard guard;
  guard.threshold_s = config.stale_timer_threshold_s;
  guard.window_ms = config.cooldown_window_ms + config.stale_timer_grace_ms;
  return guard;
}

}  // namespace

AdmissionScheduler::AdmissionScheduler(SchedulerConfig config,
                                       Collaborators collaborators,
                                       Callbacks callbacks)
    : config_(Validated(std::move(config))),
      callbacks_(std::move(callbacks)),
      owned_clock_(collaborators.clock == nullptr
                       ? std::make_unique<timing::SystemTimeSource>()
                       : nullptr),
      clock_(collaborators.clock == nullptr ? owned_clock_.get()
                                            : collaborators.clock),
      countdown_observer_(collaborators.countdown_observer),
      cooldown_(config_.cooldown_window_ms),
      policy_(config_.manual_trigger_frequency, collaborators.store,
              config_.manual_trigger_counter_key),
      zone_(config_.restrict_to_allowed_zones, config_.allowed_zones),
      shim_(collaborators.platform, StaleGuardFor(config_)) {
  if (config_.debug_logging) {
    Logger::SetDebugEnabled(true);
  }
  shim_.SetSignalHandler(
      [this](const PlatformSignal& signal) { HandleSignal(signal); });

  {
    std::ostringstream oss;
    oss << "[AdmissionScheduler] CREATED countdown_s=" << config_.countdown_duration_s
        << " cooldown_ms=" << config_.cooldown_window_ms
        << " manual_frequency=" << config_.manual_trigger_frequency
        << " manual_mode=" << ToString(config_.manual_trigger_mode)
        << " restrict_zones=" << config_.restrict_to_allowed_zones
        << " platform=" << (shim_.IsAvailable() ? "available" : "unavailable");
    Logger::Info(oss.str());
  }

  if (config_.block_until_initialized) {
    // Released by OnHostInitialized().
    blocks_.Block();
  } else {
    initialized_ = true;
    StartPolling("startup");
  }
}

AdmissionScheduler::~AdmissionScheduler() {
  active_countdown_.reset();
  awaiting_restore_.clear();
  retired_.clear();
  // Anything still deferred or owned goes back to its prior state; an
  // enabled controller is preferable to an inoperable one.
  ledger_.RestoreAll();
}

// =============================================================================
// Controllers
// =============================================================================

void AdmissionScheduler::RegisterController(
    const std::shared_ptr<countdown::IControllable>& controller) {
  if (!controller) {
    return;
  }
  for (const auto& weak : controllers_) {
    if (auto existing = weak.lock(); existing && existing.get() == controller.get()) {
      return;
    }
  }
  controllers_.push_back(controller);
  Logger::Debug("[AdmissionScheduler] CONTROLLER_REGISTERED name=" + controller->Name());
}

void AdmissionScheduler::UnregisterController(const countdown::IControllable* controller) {
  controllers_.erase(
      std::remove_if(controllers_.begin(), controllers_.end(),
                     [controller](const std::weak_ptr<countdown::IControllable>& weak) {
                       auto locked = weak.lock();
                       return !locked || locked.get() == controller;
                     }),
      controllers_.end());
}

size_t AdmissionScheduler::controller_count() const {
  size_t count = 0;
  for (const auto& weak : controllers_) {
    if (!weak.expired()) ++count;
  }
  return count;
}

std::vector<std::weak_ptr<countdown::IControllable>> AdmissionScheduler::LiveControllers() {
  controllers_.erase(
      std::remove_if(controllers_.begin(), controllers_.end(),
                     [](const std::weak_ptr<countdown::IControllable>& weak) {
                       return weak.expired();
                     }),
      controllers_.end());
  return controllers_;
}

// =============================================================================
// Lifecycle
// =============================================================================

void AdmissionScheduler::OnHostInitialized() {
  if (initialized_) {
    return;
  }
  initialized_ = true;
  Logger::Info("[AdmissionScheduler] HOST_INITIALIZED");
  if (config_.block_until_initialized) {
    Unblock();
  }
  if (!blocks_.IsBlocked()) {
    StartPolling("host_initialized");
  }
}

void AdmissionScheduler::AttachZoneSource(std::optional<admission::ZoneId> current_zone) {
  zone_.AttachSource(std::move(current_zone));
  std::ostringstream oss;
  oss << "[AdmissionScheduler] ZONE_SOURCE_ATTACHED zone="
      << zone_.current_zone().value_or("<unknown>")
      << " allowed=" << zone_.IsAllowed();
  Logger::Debug(oss.str());
  if (initialized_ && zone_.IsAllowed()) {
    StartPolling("zone_source_attached");
  }
}

void AdmissionScheduler::DetachZoneSource() {
  zone_.DetachSource();
  if (!zone_.IsAllowed()) {
    CancelCountdown("zone_source_detached");
    StopPolling("zone_source_detached");
  }
}

GateVerdict AdmissionScheduler::Tick() {
  // Safe point: nothing below is running a callback of a retired instance.
  retired_.clear();

  const int64_t now_ms = NowMs();
  CheckAwaitingOpenTimeout(now_ms);

  if (active_countdown_) {
    active_countdown_->Tick();
  }
  return Poll(now_ms);
}

int64_t AdmissionScheduler::NowMs() const {
  return clock_->NowMs();
}

// =============================================================================
// Phase state machine
// =============================================================================

bool AdmissionScheduler::Dispatch(SchedulerEvent event) {
  const auto next = NextPhase(phase_, event);
  if (!next.has_value()) {
    ++metrics_.illegal_transition_total;
    std::ostringstream oss;
    oss << "[AdmissionScheduler] ILLEGAL_TRANSITION phase=" << ToString(phase_)
        << " event=" << ToString(event);
    Logger::Warn(oss.str());
    return false;
  }
  if (*next != phase_) {
    metrics_.transitions[{phase_, *next}]++;
    std::ostringstream oss;
    oss << "[AdmissionScheduler] PHASE " << ToString(phase_) << " -> "
        << ToString(*next) << " event=" << ToString(event);
    Logger::Debug(oss.str());
    phase_ = *next;
  }
  return true;
}

// =============================================================================
// Natural admission
// =============================================================================

GateVerdict AdmissionScheduler::Evaluate(int64_t now_ms) const {
  if (!polling_) return GateVerdict::kPollingStopped;
  if (phase_ != Phase::kIdle) return GateVerdict::kBusy;
  // zone -> block -> cooldown -> timer
  if (!zone_.IsAllowed()) return GateVerdict::kZoneDisallowed;
  if (blocks_.IsBlocked()) return GateVerdict::kBlocked;
  if (!cooldown_.IsReady(now_ms)) return GateVerdict::kCooldown;
  return shim_.CheckNaturalTimer(now_ms, cooldown_.last_close_ms());
}

GateVerdict AdmissionScheduler::Poll(int64_t now_ms) {
  const GateVerdict verdict = Evaluate(now_ms);
  metrics_.polls_by_verdict[static_cast<size_t>(verdict)]++;

  if (!last_poll_verdict_.has_value() || *last_poll_verdict_ != verdict) {
    std::ostringstream oss;
    oss << "[AdmissionScheduler] POLL verdict=" << admission::ToString(verdict)
        << " now_ms=" << now_ms;
    if (verdict == GateVerdict::kCooldown) {
      oss << " cooldown_left_ms=" << cooldown_.RemainingMs(now_ms);
    }
    Logger::Debug(oss.str());
    last_poll_verdict_ = verdict;
  }

  if (verdict != GateVerdict::kAdmitted) {
    return verdict;
  }

  if (config_.countdown_warning_enabled) {
    StartCountdown();
  } else {
    RequestDisplay(EventKind::kInterstitial, std::string());
  }
  return verdict;
}

// =============================================================================
// Countdown
// =============================================================================

void AdmissionScheduler::StartCountdown() {
  const CycleId cycle_id = next_cycle_id_++;
  active_countdown_ = std::make_unique<CountdownController>(
      cycle_id, &ledger_, LiveControllers(), countdown_observer_);
  Dispatch(SchedulerEvent::kCountdownStarted);
  ++metrics_.countdowns_started_total;

  {
    std::ostringstream oss;
    oss << "[AdmissionScheduler] COUNTDOWN_START cycle=" << cycle_id
        << " duration_s=" << config_.countdown_duration_s;
    Logger::Info(oss.str());
  }

  if (callbacks_.on_countdown_started) {
    callbacks_.on_countdown_started(cycle_id);
  }
  // The callback may have blocked admission and cancelled this cycle.
  if (!active_countdown_ || active_countdown_->cycle_id() != cycle_id) {
    return;
  }

  // Dispatched first: a zero-length countdown completes inside Start().
  active_countdown_->Start(config_.countdown_duration_s,
                           [this, cycle_id] { OnCountdownCompleted(cycle_id); });
}

void AdmissionScheduler::OnCountdownCompleted(CycleId cycle_id) {
  if (!active_countdown_ || active_countdown_->cycle_id() != cycle_id) {
    std::ostringstream oss;
    oss << "[AdmissionScheduler] STALE_COMPLETION cycle=" << cycle_id;
    Logger::Warn(oss.str());
    return;
  }
  ++metrics_.countdowns_completed_total;

  // Controllers stay suspended until this cycle's close.
  awaiting_restore_.push_back(std::move(active_countdown_));
  RequestDisplay(EventKind::kInterstitial, std::string());
}

bool AdmissionScheduler::CancelCountdown(const char* reason) {
  if (!active_countdown_) {
    return false;
  }
  std::unique_ptr<CountdownController> countdown = std::move(active_countdown_);
  const CycleId cycle_id = countdown->cycle_id();
  countdown->Hide();
  retired_.push_back(std::move(countdown));

  if (phase_ == Phase::kCountingDown) {
    Dispatch(SchedulerEvent::kCountdownCancelled);
  }
  ++metrics_.countdowns_cancelled_total;

  std::ostringstream oss;
  oss << "[AdmissionScheduler] COUNTDOWN_CANCELLED cycle=" << cycle_id
      << " reason=" << reason;
  Logger::Info(oss.str());
  return true;
}

void AdmissionScheduler::RestoreAwaitingCycles() {
  for (auto& countdown : awaiting_restore_) {
    const size_t restored = countdown->EnsureRestored();
    if (restored > 0) {
      std::ostringstream oss;
      oss << "[AdmissionScheduler] CONTROLLERS_RESTORED cycle=" << countdown->cycle_id()
          << " count=" << restored;
      Logger::Debug(oss.str());
    }
    retired_.push_back(std::move(countdown));
  }
  awaiting_restore_.clear();
}

// =============================================================================
// Display
// =============================================================================

bool AdmissionScheduler::RequestDisplay(EventKind kind, const std::string& reward_id) {
  if (phase_ == Phase::kShowing || phase_ == Phase::kAwaitingOpen) {
    std::ostringstream oss;
    oss << "[AdmissionScheduler] SHOW_SUPPRESSED kind=" << platform::ToString(kind)
        << " phase=" << ToString(phase_);
    Logger::Warn(oss.str());
    return false;
  }

  // Phase first: an adapter may open synchronously inside Show().
  Dispatch(SchedulerEvent::kShowRequested);
  awaiting_open_since_ms_ = NowMs();

  if (!shim_.RequestShow(kind, reward_id)) {
    ++metrics_.displays_failed_total;
    awaiting_open_since_ms_.reset();
    Dispatch(SchedulerEvent::kShowFailed);
    RestoreAwaitingCycles();
    return false;
  }

  ++metrics_.displays_requested_total;
  {
    std::ostringstream oss;
    oss << "[AdmissionScheduler] SHOW_REQUESTED kind=" << platform::ToString(kind);
    if (!reward_id.empty()) {
      oss << " reward_id=" << reward_id;
    }
    Logger::Info(oss.str());
  }
  if (callbacks_.on_event_requested) {
    callbacks_.on_event_requested(kind);
  }
  return true;
}

void AdmissionScheduler::CheckAwaitingOpenTimeout(int64_t now_ms) {
  if (phase_ != Phase::kAwaitingOpen || !awaiting_open_since_ms_.has_value()) {
    return;
  }
  const int64_t waited_ms = now_ms - *awaiting_open_since_ms_;
  if (waited_ms < config_.awaiting_open_timeout_ms) {
    return;
  }

  ++metrics_.displays_timed_out_total;
  std::ostringstream oss;
  oss << "[AdmissionScheduler] SHOW_TIMEOUT waited_ms=" << waited_ms
      << " timeout_ms=" << config_.awaiting_open_timeout_ms;
  Logger::Warn(oss.str());

  awaiting_open_since_ms_.reset();
  Dispatch(SchedulerEvent::kShowFailed);
  RestoreAwaitingCycles();
  // Pending reward callbacks survive: a late open can still pay out. They
  // are dropped on the rewarded close.
}

// =============================================================================
// Block counter
// =============================================================================

void AdmissionScheduler::Block() {
  const int count = blocks_.Block();
  std::ostringstream oss;
  oss << "[AdmissionScheduler] BLOCK count=" << count;
  Logger::Debug(oss.str());

  // A blocking UI wins over a pending interruption.
  if (phase_ == Phase::kCountingDown) {
    CancelCountdown("blocked");
  }
}

void AdmissionScheduler::Unblock() {
  const int count = blocks_.Unblock();
  std::ostringstream oss;
  oss << "[AdmissionScheduler] UNBLOCK count=" << count;
  Logger::Debug(oss.str());

  if (count == 0 && initialized_) {
    StartPolling("unblocked");
  }
}

void AdmissionScheduler::ForceReset() {
  blocks_.ForceReset();
  if (initialized_) {
    StartPolling("force_reset");
  }
}

// =============================================================================
// Manual and rewarded triggers
// =============================================================================

ManualTriggerResult AdmissionScheduler::RequestManualTrigger() {
  const ManualTriggerResult result = EvaluateManualTrigger();
  metrics_.manual_requests_by_result[static_cast<size_t>(result)]++;

  std::ostringstream oss;
  oss << "[AdmissionScheduler] MANUAL_TRIGGER result=" << ToString(result)
      << " counter=" << policy_.counter()
      << " next_admit_at=" << policy_.NextAdmitCounter();
  Logger::Info(oss.str());
  return result;
}

ManualTriggerResult AdmissionScheduler::EvaluateManualTrigger() {
  if (phase_ == Phase::kShowing || phase_ == Phase::kAwaitingOpen) {
    return ManualTriggerResult::kRejectedShowing;
  }
  if (blocks_.IsBlocked()) {
    return ManualTriggerResult::kRejectedBlocked;
  }
  if (!shim_.IsAvailable()) {
    return ManualTriggerResult::kPlatformUnavailable;
  }
  const bool with_countdown =
      config_.manual_trigger_mode == ManualTriggerMode::kWithCountdown;
  if (with_countdown && phase_ == Phase::kCountingDown) {
    return ManualTriggerResult::kRejectedBusy;
  }
  if (policy_.IsDisabled()) {
    return ManualTriggerResult::kDisabled;
  }
  if (!policy_.ShouldAdmit()) {
    return ManualTriggerResult::kSkippedByFrequency;
  }

  // The natural timer must not hold back an admitted manual request.
  shim_.ForceReady();

  if (with_countdown) {
    StartCountdown();
    return ManualTriggerResult::kCountdownStarted;
  }

  // A natural countdown already running is superseded by this request.
  if (phase_ == Phase::kCountingDown) {
    CancelCountdown("manual_trigger");
  }
  return RequestDisplay(EventKind::kInterstitial, std::string())
             ? ManualTriggerResult::kShown
             : ManualTriggerResult::kPlatformUnavailable;
}

bool AdmissionScheduler::WouldManualTriggerFire() const {
  if (phase_ == Phase::kShowing || phase_ == Phase::kAwaitingOpen) return false;
  if (blocks_.IsBlocked() || !shim_.IsAvailable()) return false;
  if (config_.manual_trigger_mode == ManualTriggerMode::kWithCountdown &&
      phase_ == Phase::kCountingDown) {
    return false;
  }
  return policy_.Peek();
}

bool AdmissionScheduler::RequestRewarded(const std::string& reward_id,
                                         std::function<void()> on_reward) {
  if (phase_ == Phase::kShowing || phase_ == Phase::kAwaitingOpen) {
    Logger::Warn("[AdmissionScheduler] REWARDED_REJECTED reason=event_showing id=" +
                 reward_id);
    return false;
  }
  if (!shim_.IsAvailable()) {
    Logger::Warn("[AdmissionScheduler] REWARDED_REJECTED reason=platform_unavailable id=" +
                 reward_id);
    return false;
  }
  if (phase_ == Phase::kCountingDown) {
    CancelCountdown("rewarded_request");
  }

  ++metrics_.rewarded_requests_total;
  pending_rewards_[reward_id] = std::move(on_reward);
  if (!RequestDisplay(EventKind::kRewarded, reward_id)) {
    pending_rewards_.erase(reward_id);
    return false;
  }
  return true;
}

// =============================================================================
// Notifications
// =============================================================================

void AdmissionScheduler::OnZoneChanged(const admission::ZoneId& zone) {
  const admission::ZoneTransition transition = zone_.OnZoneChanged(zone);
  {
    std::ostringstream oss;
    oss << "[AdmissionScheduler] ZONE_CHANGED zone=" << zone
        << " transition=" << admission::ToString(transition);
    Logger::Debug(oss.str());
  }

  switch (transition) {
    case admission::ZoneTransition::kReturnedToAllowed: {
      if (config_.reset_blocks_on_zone_return && initialized_ && blocks_.IsBlocked()) {
        std::ostringstream oss;
        oss << "[AdmissionScheduler] STUCK_BLOCKS_RESET count=" << blocks_.count()
            << " zone=" << zone;
        Logger::Warn(oss.str());
        blocks_.ForceReset();
      }
      CancelCountdown("zone_return");
      // A fresh full interval rather than an immediate re-trigger.
      shim_.ResetToFullInterval();
      if (initialized_) {
        StartPolling("zone_return");
      }
      break;
    }
    case admission::ZoneTransition::kFirstReport:
      // Blocks and the natural timer are left alone.
      if (zone_.IsAllowed()) {
        if (initialized_) {
          StartPolling("zone_first_report");
        }
      } else {
        CancelCountdown("zone_first_report");
        StopPolling("zone_first_report");
      }
      break;
    case admission::ZoneTransition::kLeftAllowed:
      CancelCountdown("zone_left");
      StopPolling("zone_left");
      break;
    case admission::ZoneTransition::kUnchanged:
    case admission::ZoneTransition::kMovedWithinAllowed:
    case admission::ZoneTransition::kMovedWithinDisallowed:
      break;
  }
}

void AdmissionScheduler::OnOpened(EventKind kind) {
  if (phase_ == Phase::kShowing) {
    ++metrics_.duplicate_notification_total;
    Logger::Debug(std::string("[AdmissionScheduler] DUPLICATE_OPENED kind=") +
                  platform::ToString(kind));
    return;
  }

  // Any countdown UI still up (platform-initiated event) goes away.
  if (active_countdown_) {
    std::unique_ptr<CountdownController> countdown = std::move(active_countdown_);
    countdown->Hide();
    retired_.push_back(std::move(countdown));
    ++metrics_.countdowns_cancelled_total;
  }

  if (!Dispatch(SchedulerEvent::kOpened)) {
    return;
  }
  awaiting_open_since_ms_.reset();
  ++metrics_.events_opened_total;
  Logger::Info(std::string("[AdmissionScheduler] EVENT_OPENED kind=") +
               platform::ToString(kind));
}

void AdmissionScheduler::OnClosed(EventKind kind) {
  if (phase_ != Phase::kShowing && phase_ != Phase::kAwaitingOpen) {
    ++metrics_.duplicate_notification_total;
    std::ostringstream oss;
    oss << "[AdmissionScheduler] DUPLICATE_CLOSED kind=" << platform::ToString(kind)
        << " phase=" << ToString(phase_);
    Logger::Debug(oss.str());
    if (kind == EventKind::kRewarded) {
      ForfeitPendingRewards();
    }
    return;
  }

  const int64_t now_ms = NowMs();
  Dispatch(SchedulerEvent::kClosed);
  awaiting_open_since_ms_.reset();
  ++metrics_.events_closed_total;

  if (kind == EventKind::kInterstitial) {
    cooldown_.RecordClose(now_ms);
  }
  RestoreAwaitingCycles();

  if (kind == EventKind::kRewarded) {
    ForfeitPendingRewards();
  }

  {
    std::ostringstream oss;
    oss << "[AdmissionScheduler] EVENT_CLOSED kind=" << platform::ToString(kind)
        << " now_ms=" << now_ms;
    Logger::Info(oss.str());
  }

  if (callbacks_.on_event_closed) {
    callbacks_.on_event_closed(kind);
  }
  if (initialized_ && zone_.IsAllowed()) {
    StartPolling("event_closed");
  }
}

void AdmissionScheduler::ForfeitPendingRewards() {
  if (pending_rewards_.empty()) {
    return;
  }
  std::ostringstream oss;
  oss << "[AdmissionScheduler] REWARDS_FORFEITED count=" << pending_rewards_.size();
  Logger::Debug(oss.str());
  pending_rewards_.clear();
}

void AdmissionScheduler::OnRewardGranted(const std::string& reward_id) {
  auto it = pending_rewards_.find(reward_id);
  if (it == pending_rewards_.end()) {
    ++metrics_.rewards_unmatched_total;
    Logger::Warn("[AdmissionScheduler] REWARD_UNMATCHED id=" + reward_id);
    return;
  }
  std::function<void()> on_reward = std::move(it->second);
  pending_rewards_.erase(it);
  ++metrics_.rewards_granted_total;
  Logger::Info("[AdmissionScheduler] REWARD_GRANTED id=" + reward_id);
  if (on_reward) {
    on_reward();
  }
}

void AdmissionScheduler::OnPlatformPauseChanged(bool paused) {
  if (paused) {
    ledger_.AddHold(kPauseHold);
    return;
  }
  const size_t restored = ledger_.ReleaseHold(kPauseHold);
  if (restored > 0) {
    std::ostringstream oss;
    oss << "[AdmissionScheduler] DEFERRED_RESTORED count=" << restored;
    Logger::Debug(oss.str());
  }
  // Fallback for a close that never arrived through the normal path.
  if (phase_ != Phase::kShowing) {
    RestoreAwaitingCycles();
  }
}

void AdmissionScheduler::HandleSignal(const PlatformSignal& signal) {
  switch (signal.type) {
    case PlatformSignal::Type::kOpened:
      OnOpened(signal.kind);
      break;
    case PlatformSignal::Type::kClosed:
      OnClosed(signal.kind);
      break;
    case PlatformSignal::Type::kRewardGranted:
      OnRewardGranted(signal.reward_id);
      break;
    case PlatformSignal::Type::kPauseChanged:
      OnPlatformPauseChanged(signal.paused);
      break;
  }
}

// =============================================================================
// Polling
// =============================================================================

void AdmissionScheduler::StartPolling(const char* reason) {
  if (!zone_.IsAllowed()) {
    return;
  }
  if (!polling_) {
    polling_ = true;
    last_poll_verdict_.reset();
    Logger::Debug(std::string("[AdmissionScheduler] POLLING_STARTED reason=") + reason);
  }
}

void AdmissionScheduler::StopPolling(const char* reason) {
  if (polling_) {
    polling_ = false;
    Logger::Debug(std::string("[AdmissionScheduler] POLLING_STOPPED reason=") + reason);
  }
}

// =============================================================================
// Diagnostics
// =============================================================================

double AdmissionScheduler::SecondsUntilNaturalTimer() const {
  return shim_.SecondsUntilNaturalTimer();
}

SchedulerMetrics AdmissionScheduler::Snapshot() const {
  SchedulerMetrics snapshot = metrics_;
  snapshot.phase = phase_;
  snapshot.polling = polling_;
  snapshot.block_count = blocks_.count();
  snapshot.unmatched_unblock_total = blocks_.unmatched_unblock_total();
  snapshot.force_reset_total = blocks_.force_reset_total();
  snapshot.controllers_restored_total = ledger_.restored_total();
  snapshot.controllers_deferred_total = ledger_.deferred_total();
  snapshot.controllers_inherited_total = ledger_.inherited_total();
  return snapshot;
}

}  // namespace intermission::runtime
