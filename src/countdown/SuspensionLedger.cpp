// Repository: Intermission
// Component: Suspension Ledger
// Copyright (c) 2026 Intermission

#include "intermission/countdown/SuspensionLedger.hpp"

#include <sstream>
#include <vector>

#include "intermission/countdown/IControllable.hpp"
#include "intermission/util/Logger.hpp"

namespace intermission::countdown {

using util::Logger;

const char* ToString(SuspensionLedger::ReleaseOutcome outcome) {
  switch (outcome) {
    case SuspensionLedger::ReleaseOutcome::kEnabled:      return "ENABLED";
    case SuspensionLedger::ReleaseOutcome::kLeftDisabled: return "LEFT_DISABLED";
    case SuspensionLedger::ReleaseOutcome::kDeferred:     return "DEFERRED";
    case SuspensionLedger::ReleaseOutcome::kNotOwner:     return "NOT_OWNER";
    case SuspensionLedger::ReleaseOutcome::kExpired:      return "EXPIRED";
  }
  return "UNKNOWN";
}

bool SuspensionLedger::Claim(CycleId cycle,
                             const std::shared_ptr<IControllable>& controller) {
  auto it = entries_.find(controller.get());
  if (it != entries_.end() && it->second.controller.expired()) {
    // Address reuse after the previous controller was destroyed.
    entries_.erase(it);
    it = entries_.end();
  }

  if (it != entries_.end()) {
    Entry& entry = it->second;
    if (entry.owner != cycle) {
      ++inherited_total_;
      std::ostringstream oss;
      oss << "[SuspensionLedger] INHERIT controller=" << controller->Name()
          << " from_cycle=" << entry.owner << " to_cycle=" << cycle
          << " was_enabled=" << entry.was_enabled;
      Logger::Debug(oss.str());
    }
    entry.owner = cycle;
    entry.deferred = false;
    if (controller->IsEnabled()) {
      controller->SetEnabled(false);
    }
    return entry.was_enabled;
  }

  Entry entry;
  entry.controller = controller;
  entry.owner = cycle;
  entry.was_enabled = controller->IsEnabled();
  if (entry.was_enabled) {
    controller->SetEnabled(false);
  }
  entries_.emplace(controller.get(), entry);

  std::ostringstream oss;
  oss << "[SuspensionLedger] SUSPEND controller=" << controller->Name()
      << " cycle=" << cycle << " was_enabled=" << entry.was_enabled;
  Logger::Debug(oss.str());
  return entry.was_enabled;
}

SuspensionLedger::ReleaseOutcome SuspensionLedger::RestoreEntry(const Entry& entry) {
  auto controller = entry.controller.lock();
  if (!controller) {
    return ReleaseOutcome::kExpired;
  }
  ++restored_total_;
  if (!entry.was_enabled) {
    return ReleaseOutcome::kLeftDisabled;
  }
  if (!controller->IsEnabled()) {
    controller->SetEnabled(true);
  }
  return ReleaseOutcome::kEnabled;
}

SuspensionLedger::ReleaseOutcome SuspensionLedger::Release(
    CycleId cycle, const IControllable* key) {
  auto it = entries_.find(key);
  if (it == entries_.end() || it->second.owner != cycle || it->second.deferred) {
    return ReleaseOutcome::kNotOwner;
  }
  auto controller = it->second.controller.lock();
  if (!controller) {
    entries_.erase(it);
    return ReleaseOutcome::kExpired;
  }

  if (IsHeld()) {
    it->second.owner = kDeferredOwner;
    it->second.deferred = true;
    ++deferred_total_;
    std::ostringstream oss;
    oss << "[SuspensionLedger] DEFER controller=" << controller->Name()
        << " cycle=" << cycle << " holds=" << holds_.size();
    Logger::Debug(oss.str());
    return ReleaseOutcome::kDeferred;
  }

  const Entry entry = it->second;
  entries_.erase(it);
  const ReleaseOutcome outcome = RestoreEntry(entry);

  std::ostringstream oss;
  oss << "[SuspensionLedger] RESTORE controller=" << controller->Name()
      << " cycle=" << cycle << " outcome=" << ToString(outcome);
  Logger::Debug(oss.str());
  return outcome;
}

void SuspensionLedger::AddHold(const std::string& holder) {
  if (holds_.insert(holder).second) {
    Logger::Debug("[SuspensionLedger] HOLD_ADDED holder=" + holder);
  }
}

size_t SuspensionLedger::ReleaseHold(const std::string& holder) {
  if (holds_.erase(holder) == 0) {
    return 0;
  }
  Logger::Debug("[SuspensionLedger] HOLD_RELEASED holder=" + holder);
  if (IsHeld()) {
    return 0;
  }

  std::vector<Entry> due;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.deferred) {
      due.push_back(it->second);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }

  size_t restored = 0;
  for (const auto& entry : due) {
    const ReleaseOutcome outcome = RestoreEntry(entry);
    if (outcome != ReleaseOutcome::kExpired) {
      ++restored;
    }
  }
  if (restored > 0) {
    std::ostringstream oss;
    oss << "[SuspensionLedger] DEFERRED_RESTORED count=" << restored;
    Logger::Debug(oss.str());
  }
  return restored;
}

size_t SuspensionLedger::RestoreAll() {
  std::map<const IControllable*, Entry> entries;
  entries.swap(entries_);
  for (const auto& kv : entries) {
    RestoreEntry(kv.second);
  }
  if (!entries.empty()) {
    std::ostringstream oss;
    oss << "[SuspensionLedger] RESTORE_ALL count=" << entries.size();
    Logger::Info(oss.str());
  }
  return entries.size();
}

bool SuspensionLedger::IsTracked(const IControllable* controller) const {
  auto it = entries_.find(controller);
  return it != entries_.end() && !it->second.controller.expired();
}

std::optional<SuspensionLedger::CycleId> SuspensionLedger::OwnerOf(
    const IControllable* controller) const {
  auto it = entries_.find(controller);
  if (it == entries_.end() || it->second.controller.expired()) {
    return std::nullopt;
  }
  return it->second.owner;
}

size_t SuspensionLedger::deferred_count() const {
  size_t count = 0;
  for (const auto& kv : entries_) {
    if (kv.second.deferred) ++count;
  }
  return count;
}

}  // namespace intermission::countdown
