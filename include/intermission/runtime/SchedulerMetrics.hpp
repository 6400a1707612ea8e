// Repository: Intermission
// Component: Scheduler Metrics
// Purpose: Passive observability counters for AdmissionScheduler.
// Copyright (c) 2026 Intermission
//
// These metrics are passive observations only. They do NOT affect admission
// decisions. Tolerated desynchronisations (unmatched unblocks, duplicate
// notifications, illegal transitions) surface here instead of failing.

#ifndef INTERMISSION_RUNTIME_SCHEDULER_METRICS_HPP_
#define INTERMISSION_RUNTIME_SCHEDULER_METRICS_HPP_

#include <array>
#include <cstdint>
#include <map>
#include <sstream>
#include <string>
#include <utility>

#include "intermission/runtime/SchedulerTypes.hpp"

namespace intermission::runtime {

// =============================================================================
// SchedulerMetrics
// Copied out by AdmissionScheduler::Snapshot(). Plain value type.
// =============================================================================

struct SchedulerMetrics {
  // ---- Phase state machine ----
  std::map<std::pair<Phase, Phase>, uint64_t> transitions;
  uint64_t illegal_transition_total = 0;
  uint64_t duplicate_notification_total = 0;
  Phase phase = Phase::kIdle;

  // ---- Natural admission polls ----
  std::array<uint64_t, admission::kGateVerdictCount> polls_by_verdict{};
  bool polling = false;

  // ---- Countdown ----
  uint64_t countdowns_started_total = 0;
  uint64_t countdowns_completed_total = 0;
  uint64_t countdowns_cancelled_total = 0;

  // ---- Display ----
  uint64_t displays_requested_total = 0;
  uint64_t displays_failed_total = 0;       // Request could not be passed on
  uint64_t displays_timed_out_total = 0;    // Requested but never opened
  uint64_t events_opened_total = 0;
  uint64_t events_closed_total = 0;

  // ---- Manual / rewarded ----
  std::array<uint64_t, kManualTriggerResultCount> manual_requests_by_result{};
  uint64_t rewarded_requests_total = 0;
  uint64_t rewards_granted_total = 0;
  uint64_t rewards_unmatched_total = 0;

  // ---- Block counter ----
  int block_count = 0;
  uint64_t unmatched_unblock_total = 0;
  uint64_t force_reset_total = 0;

  // ---- Controller suspension ----
  uint64_t controllers_restored_total = 0;
  uint64_t controllers_deferred_total = 0;
  uint64_t controllers_inherited_total = 0;

  uint64_t polls(GateVerdict verdict) const {
    return polls_by_verdict[static_cast<size_t>(verdict)];
  }
  uint64_t manual_requests(ManualTriggerResult result) const {
    return manual_requests_by_result[static_cast<size_t>(result)];
  }

  // Generate Prometheus text exposition format
  std::string GeneratePrometheusText() const {
    std::ostringstream oss;

    oss << "# HELP intermission_phase Current scheduler phase (0=idle 1=counting_down 2=awaiting_open 3=showing)\n";
    oss << "# TYPE intermission_phase gauge\n";
    oss << "intermission_phase " << static_cast<int>(phase) << "\n";

    oss << "\n# HELP intermission_phase_transitions_total Phase transitions by edge\n";
    oss << "# TYPE intermission_phase_transitions_total counter\n";
    for (const auto& [edge, count] : transitions) {
      oss << "intermission_phase_transitions_total{from=\"" << ToString(edge.first)
          << "\",to=\"" << ToString(edge.second) << "\"} " << count << "\n";
    }

    oss << "\n# HELP intermission_illegal_transitions_total Events with no transition-table row\n";
    oss << "# TYPE intermission_illegal_transitions_total counter\n";
    oss << "intermission_illegal_transitions_total " << illegal_transition_total << "\n";

    oss << "\n# HELP intermission_duplicate_notifications_total Repeated open/close notifications ignored\n";
    oss << "# TYPE intermission_duplicate_notifications_total counter\n";
    oss << "intermission_duplicate_notifications_total " << duplicate_notification_total << "\n";

    oss << "\n# HELP intermission_polling Whether natural admission polling is running\n";
    oss << "# TYPE intermission_polling gauge\n";
    oss << "intermission_polling " << (polling ? 1 : 0) << "\n";

    oss << "\n# HELP intermission_polls_total Natural admission polls by verdict\n";
    oss << "# TYPE intermission_polls_total counter\n";
    for (int i = 0; i < admission::kGateVerdictCount; ++i) {
      oss << "intermission_polls_total{verdict=\""
          << admission::ToString(static_cast<GateVerdict>(i)) << "\"} "
          << polls_by_verdict[static_cast<size_t>(i)] << "\n";
    }

    oss << "\n# HELP intermission_countdowns_total Warning countdowns by outcome\n";
    oss << "# TYPE intermission_countdowns_total counter\n";
    oss << "intermission_countdowns_total{outcome=\"started\"} " << countdowns_started_total << "\n";
    oss << "intermission_countdowns_total{outcome=\"completed\"} " << countdowns_completed_total << "\n";
    oss << "intermission_countdowns_total{outcome=\"cancelled\"} " << countdowns_cancelled_total << "\n";

    oss << "\n# HELP intermission_displays_total Display requests by outcome\n";
    oss << "# TYPE intermission_displays_total counter\n";
    oss << "intermission_displays_total{outcome=\"requested\"} " << displays_requested_total << "\n";
    oss << "intermission_displays_total{outcome=\"failed\"} " << displays_failed_total << "\n";
    oss << "intermission_displays_total{outcome=\"timed_out\"} " << displays_timed_out_total << "\n";
    oss << "intermission_displays_total{outcome=\"opened\"} " << events_opened_total << "\n";
    oss << "intermission_displays_total{outcome=\"closed\"} " << events_closed_total << "\n";

    oss << "\n# HELP intermission_manual_requests_total Manual trigger requests by result\n";
    oss << "# TYPE intermission_manual_requests_total counter\n";
    for (int i = 0; i < kManualTriggerResultCount; ++i) {
      oss << "intermission_manual_requests_total{result=\""
          << ToString(static_cast<ManualTriggerResult>(i)) << "\"} "
          << manual_requests_by_result[static_cast<size_t>(i)] << "\n";
    }

    oss << "\n# HELP intermission_rewards_total Rewarded event activity\n";
    oss << "# TYPE intermission_rewards_total counter\n";
    oss << "intermission_rewards_total{kind=\"requested\"} " << rewarded_requests_total << "\n";
    oss << "intermission_rewards_total{kind=\"granted\"} " << rewards_granted_total << "\n";
    oss << "intermission_rewards_total{kind=\"unmatched\"} " << rewards_unmatched_total << "\n";

    oss << "\n# HELP intermission_block_count Outstanding admission blocks\n";
    oss << "# TYPE intermission_block_count gauge\n";
    oss << "intermission_block_count " << block_count << "\n";

    oss << "\n# HELP intermission_unmatched_unblocks_total Unblock calls with nothing held\n";
    oss << "# TYPE intermission_unmatched_unblocks_total counter\n";
    oss << "intermission_unmatched_unblocks_total " << unmatched_unblock_total << "\n";

    oss << "\n# HELP intermission_block_force_resets_total Block counter force resets\n";
    oss << "# TYPE intermission_block_force_resets_total counter\n";
    oss << "intermission_block_force_resets_total " << force_reset_total << "\n";

    oss << "\n# HELP intermission_controllers_total Controller suspension bookkeeping\n";
    oss << "# TYPE intermission_controllers_total counter\n";
    oss << "intermission_controllers_total{kind=\"restored\"} " << controllers_restored_total << "\n";
    oss << "intermission_controllers_total{kind=\"deferred\"} " << controllers_deferred_total << "\n";
    oss << "intermission_controllers_total{kind=\"inherited\"} " << controllers_inherited_total << "\n";

    return oss.str();
  }
};

}  // namespace intermission::runtime

#endif  // INTERMISSION_RUNTIME_SCHEDULER_METRICS_HPP_
