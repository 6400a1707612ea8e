// Repository: Intermission
// Component: Zone Gate
// Purpose: Restricts admission to permitted gameplay zones and classifies
//          zone changes for the scheduler.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_ADMISSION_ZONE_GATE_HPP_
#define INTERMISSION_ADMISSION_ZONE_GATE_HPP_

#include <optional>
#include <set>
#include <string>

namespace intermission::admission {

using ZoneId = std::string;

enum class ZoneTransition {
  kUnchanged,              // Same zone reported again
  kFirstReport,            // No zone was known before this report
  kReturnedToAllowed,      // Known disallowed -> allowed
  kLeftAllowed,            // Allowed -> disallowed
  kMovedWithinAllowed,     // Allowed -> different allowed zone
  kMovedWithinDisallowed,  // Disallowed -> different disallowed zone
};

const char* ToString(ZoneTransition transition);

class ZoneGate {
 public:
  // When restrict_to_allowed is false every zone (and no zone at all)
  // admits, and allowed_zones is ignored.
  ZoneGate(bool restrict_to_allowed, std::set<ZoneId> allowed_zones);

  // Zone collaborator is present; initial is its current zone (if known).
  void AttachSource(std::optional<ZoneId> initial);
  void DetachSource();
  bool HasSource() const { return has_source_; }

  // Restricted gate without a zone collaborator never admits.
  bool IsAllowed() const;
  bool IsZoneAllowed(const ZoneId& zone) const;

  // Records the new zone and classifies the change. A notification implies
  // the collaborator exists, so this attaches the source if needed.
  ZoneTransition OnZoneChanged(const ZoneId& zone);

  const std::optional<ZoneId>& current_zone() const { return current_zone_; }
  const std::optional<ZoneId>& previous_zone() const { return previous_zone_; }
  bool restricted() const { return restrict_to_allowed_; }

 private:
  bool restrict_to_allowed_;
  std::set<ZoneId> allowed_zones_;
  bool has_source_ = false;
  std::optional<ZoneId> current_zone_;
  std::optional<ZoneId> previous_zone_;
};

}  // namespace intermission::admission

#endif  // INTERMISSION_ADMISSION_ZONE_GATE_HPP_
