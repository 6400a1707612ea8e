// Repository: Intermission
// Component: Scheduler Configuration
// Purpose: Tunables for the Admission Scheduler, with file and environment
//          loaders for the simulator and host integrations.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_RUNTIME_SCHEDULER_CONFIG_HPP_
#define INTERMISSION_RUNTIME_SCHEDULER_CONFIG_HPP_

#include <cstdint>
#include <set>
#include <string>
#include <vector>

#include "intermission/runtime/SchedulerTypes.hpp"

namespace intermission::runtime {

struct SchedulerConfig {
  // ---- Countdown ----
  double countdown_duration_s = 3.0;        // Rounded up to whole seconds
  bool countdown_warning_enabled = true;    // false: natural path shows at once

  // ---- Cooldown / stale timer ----
  int64_t cooldown_window_ms = 3000;
  int64_t stale_timer_grace_ms = 1000;      // Added to the cooldown window
  double stale_timer_threshold_s = 0.1;

  // ---- Manual trigger ----
  int manual_trigger_frequency = 2;         // <= 0 disables manual triggers
  std::string manual_trigger_counter_key = "manualTriggerCounter";
  ManualTriggerMode manual_trigger_mode = ManualTriggerMode::kImmediate;

  // ---- Zones ----
  bool restrict_to_allowed_zones = true;
  std::set<std::string> allowed_zones = {"workshop"};
  bool reset_blocks_on_zone_return = true;

  // ---- Lifecycle ----
  bool block_until_initialized = true;
  int64_t awaiting_open_timeout_ms = 10000;

  bool debug_logging = false;

  // Empty when valid. A non-positive manual frequency is not a problem.
  std::vector<std::string> Validate() const;
};

// Reads "key = value" lines ('#' comments). Keys are the field names above;
// allowed_zones is a comma list, booleans are true/false/1/0 and
// manual_trigger_mode is immediate/with_countdown. Fields not named keep
// their current value. On failure returns false and sets *error (with the
// line number); *config may be partially updated.
bool LoadSchedulerConfigFile(const std::string& path,
                             SchedulerConfig* config,
                             std::string* error);

// INTERMISSION_DEBUG, INTERMISSION_MANUAL_FREQUENCY,
// INTERMISSION_COOLDOWN_MS, INTERMISSION_COUNTDOWN_S. Malformed values are
// logged and ignored. Returns the number of overrides applied.
int ApplyEnvOverrides(SchedulerConfig* config);

}  // namespace intermission::runtime

#endif  // INTERMISSION_RUNTIME_SCHEDULER_CONFIG_HPP_
