// Repository: Intermission
// Component: Suspension Ledger
// Purpose: Scheduler-wide record of which countdown cycle holds each
//          controller disabled, and what state it must be restored to.
// Copyright (c) 2026 Intermission
//
// Countdown instances come and go once per cycle, but their restoration
// requests can arrive late (a close notification for cycle N while cycle N+1
// is already counting). Restoration is therefore keyed to the owning cycle:
//
//   - Claim() by a newer cycle on a controller still owned by an older cycle
//     inherits the ORIGINAL prior state and takes ownership. The older
//     cycle's later Release() is answered with kNotOwner and leaves the
//     controller alone.
//   - While any hold is active (e.g. "platform-pause": the platform still
//     has the host paused) Release() parks the entry as deferred. The last
//     ReleaseHold() performs every deferred restoration that no newer cycle
//     has re-claimed in the meantime.
//   - RestoreAll() ignores holds and returns everything to its prior state.
//     Used on shutdown: leaving a controller enabled is preferable to
//     leaving it inoperable.

#ifndef INTERMISSION_COUNTDOWN_SUSPENSION_LEDGER_HPP_
#define INTERMISSION_COUNTDOWN_SUSPENSION_LEDGER_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

namespace intermission::countdown {

class IControllable;

class SuspensionLedger {
 public:
  using CycleId = uint64_t;

  // Cycle id used for entries parked by a deferred release.
  static constexpr CycleId kDeferredOwner = 0;

  enum class ReleaseOutcome {
    kEnabled,       // Prior state was enabled; controller is enabled again
    kLeftDisabled,  // Prior state was disabled; left as is
    kDeferred,      // A hold is active; restoration parked
    kNotOwner,      // Another cycle owns it now (or nothing is tracked)
    kExpired,       // Controller no longer exists
  };

  SuspensionLedger() = default;

  SuspensionLedger(const SuspensionLedger&) = delete;
  SuspensionLedger& operator=(const SuspensionLedger&) = delete;

  // Disables controller on behalf of cycle. Returns the prior enabled state
  // this cycle is responsible for restoring.
  bool Claim(CycleId cycle, const std::shared_ptr<IControllable>& controller);

  // Restores the controller registered under key if cycle still owns it.
  // key is the address passed to Claim(); it is never dereferenced here.
  ReleaseOutcome Release(CycleId cycle, const IControllable* key);

  void AddHold(const std::string& holder);

  // Returns the number of deferred entries restored (0 while other holds
  // remain).
  size_t ReleaseHold(const std::string& holder);

  // Restores every tracked controller regardless of holds. Returns the count
  // of entries processed.
  size_t RestoreAll();

  bool IsHeld() const { return !holds_.empty(); }
  bool IsTracked(const IControllable* controller) const;
  std::optional<CycleId> OwnerOf(const IControllable* controller) const;

  size_t tracked_count() const { return entries_.size(); }
  size_t deferred_count() const;

  uint64_t restored_total() const { return restored_total_; }
  uint64_t deferred_total() const { return deferred_total_; }
  uint64_t inherited_total() const { return inherited_total_; }

 private:
  struct Entry {
    std::weak_ptr<IControllable> controller;
    CycleId owner = kDeferredOwner;
    bool was_enabled = false;
    bool deferred = false;
  };

  ReleaseOutcome RestoreEntry(const Entry& entry);

  std::map<const IControllable*, Entry> entries_;
  std::set<std::string> holds_;
  uint64_t restored_total_ = 0;
  uint64_t deferred_total_ = 0;
  uint64_t inherited_total_ = 0;
};

const char* ToString(SuspensionLedger::ReleaseOutcome outcome);

}  // namespace intermission::countdown

#endif  // INTERMISSION_COUNTDOWN_SUSPENSION_LEDGER_HPP_
