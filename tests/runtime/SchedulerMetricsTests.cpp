// Repository: Intermission
// Component: Scheduler metrics exposition tests

#include <gtest/gtest.h>

#include "intermission/runtime/SchedulerMetrics.hpp"

namespace intermission::runtime {
namespace {

bool Contains(const std::string& text, const std::string& needle) {
  return text.find(needle) != std::string::npos;
}

TEST(SchedulerMetricsTest, EmptySnapshotRendersEveryFamily) {
  SchedulerMetrics metrics;
  const std::string text = metrics.GeneratePrometheusText();

  EXPECT_TRUE(Contains(text, "# TYPE intermission_phase gauge"));
  EXPECT_TRUE(Contains(text, "intermission_phase 0\n"));
  EXPECT_TRUE(Contains(text, "intermission_polls_total{verdict=\"ADMITTED\"} 0\n"));
  EXPECT_TRUE(Contains(text, "intermission_polls_total{verdict=\"POLLING_STOPPED\"} 0\n"));
  EXPECT_TRUE(Contains(text, "intermission_manual_requests_total{result=\"SHOWN\"} 0\n"));
  EXPECT_TRUE(Contains(text, "intermission_block_count 0\n"));
  EXPECT_TRUE(Contains(text, "intermission_controllers_total{kind=\"deferred\"} 0\n"));
  // No edges recorded yet.
  EXPECT_FALSE(Contains(text, "intermission_phase_transitions_total{"));
}

TEST(SchedulerMetricsTest, RendersCountersAndEdges) {
  SchedulerMetrics metrics;
  metrics.phase = Phase::kShowing;
  metrics.polling = true;
  metrics.transitions[{Phase::kIdle, Phase::kCountingDown}] = 2;
  metrics.transitions[{Phase::kShowing, Phase::kIdle}] = 1;
  metrics.polls_by_verdict[static_cast<size_t>(GateVerdict::kCooldown)] = 3;
  metrics.manual_requests_by_result[static_cast<size_t>(ManualTriggerResult::kSkippedByFrequency)] = 5;
  metrics.countdowns_cancelled_total = 4;
  metrics.block_count = 2;

  EXPECT_EQ(metrics.polls(GateVerdict::kCooldown), 3u);
  EXPECT_EQ(metrics.manual_requests(ManualTriggerResult::kSkippedByFrequency), 5u);

  const std::string text = metrics.GeneratePrometheusText();
  EXPECT_TRUE(Contains(text, "intermission_phase 3\n"));
  EXPECT_TRUE(Contains(text, "intermission_polling 1\n"));
  EXPECT_TRUE(Contains(text,
      "intermission_phase_transitions_total{from=\"IDLE\",to=\"COUNTING_DOWN\"} 2\n"));
  EXPECT_TRUE(Contains(text,
      "intermission_phase_transitions_total{from=\"SHOWING\",to=\"IDLE\"} 1\n"));
  EXPECT_TRUE(Contains(text, "intermission_polls_total{verdict=\"COOLDOWN\"} 3\n"));
  EXPECT_TRUE(Contains(text,
      "intermission_manual_requests_total{result=\"SKIPPED_BY_FREQUENCY\"} 5\n"));
  EXPECT_TRUE(Contains(text, "intermission_countdowns_total{outcome=\"cancelled\"} 4\n"));
  EXPECT_TRUE(Contains(text, "intermission_block_count 2\n"));
}

}  // namespace
}  // namespace intermission::runtime
