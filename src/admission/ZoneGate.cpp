// Repository: Intermission
// Component: Zone Gate
// Copyright (c) 2026 Intermission

#include "intermission/admission/ZoneGate.hpp"

#include <sstream>

#include "intermission/util/Logger.hpp"

namespace intermission::admission {

using util::Logger;

const char* ToString(ZoneTransition transition) {
  switch (transition) {
    case ZoneTransition::kUnchanged:             return "UNCHANGED";
    case ZoneTransition::kFirstReport:           return "FIRST_REPORT";
    case ZoneTransition::kReturnedToAllowed:     return "RETURNED_TO_ALLOWED";
    case ZoneTransition::kLeftAllowed:           return "LEFT_ALLOWED";
    case ZoneTransition::kMovedWithinAllowed:    return "MOVED_WITHIN_ALLOWED";
    case ZoneTransition::kMovedWithinDisallowed: return "MOVED_WITHIN_DISALLOWED";
  }
  return "UNKNOWN";
}

ZoneGate::ZoneGate(bool restrict_to_allowed, std::set<ZoneId> allowed_zones)
    : restrict_to_allowed_(restrict_to_allowed),
      allowed_zones_(std::move(allowed_zones)) {}

void ZoneGate::AttachSource(std::optional<ZoneId> initial) {
  has_source_ = true;
  current_zone_ = std::move(initial);
  previous_zone_.reset();
}

void ZoneGate::DetachSource() {
  has_source_ = false;
  previous_zone_ = current_zone_;
  current_zone_.reset();
}

bool ZoneGate::IsZoneAllowed(const ZoneId& zone) const {
  if (!restrict_to_allowed_) return true;
  return allowed_zones_.count(zone) > 0;
}

bool ZoneGate::IsAllowed() const {
  if (!restrict_to_allowed_) return true;
  if (!has_source_ || !current_zone_.has_value()) return false;
  return IsZoneAllowed(*current_zone_);
}

ZoneTransition ZoneGate::OnZoneChanged(const ZoneId& zone) {
  const bool was_allowed = IsAllowed();
  const bool zone_known = has_source_ && current_zone_.has_value();
  const bool same_zone = zone_known && *current_zone_ == zone;

  has_source_ = true;
  if (!same_zone) {
    previous_zone_ = current_zone_;
    current_zone_ = zone;
  }
  const bool now_allowed = IsAllowed();

  ZoneTransition transition;
  if (same_zone) {
    transition = ZoneTransition::kUnchanged;
  } else if (!zone_known) {
    // First zone since attach (or since a detach). Never a return.
    transition = ZoneTransition::kFirstReport;
  } else if (!was_allowed && now_allowed) {
    transition = ZoneTransition::kReturnedToAllowed;
  } else if (was_allowed && !now_allowed) {
    transition = ZoneTransition::kLeftAllowed;
  } else if (now_allowed) {
    transition = ZoneTransition::kMovedWithinAllowed;
  } else {
    transition = ZoneTransition::kMovedWithinDisallowed;
  }

  std::ostringstream oss;
  oss << "[ZoneGate] ZONE_CHANGED zone=" << zone
      << " previous=" << previous_zone_.value_or("<none>")
      << " transition=" << ToString(transition);
  Logger::Debug(oss.str());
  return transition;
}

}  // namespace intermission::admission
