// Repository: Intermission
// Component: Simulated platform unit tests

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "intermission/platform/SimulatedPlatform.hpp"
#include "intermission/timing/DeterministicTimeSource.hpp"

namespace intermission::platform {
namespace {

// Listener that records each notification as a short token.
class RecordingListener : public IPlatformListener {
 public:
  void OnOpened(EventKind kind) override { events.push_back(std::string("open:") + ToString(kind)); }
  void OnClosed(EventKind kind) override { events.push_back(std::string("close:") + ToString(kind)); }
  void OnRewardGranted(const std::string& id) override { events.push_back("reward:" + id); }
  void OnPauseChanged(bool paused) override { events.push_back(paused ? "pause:on" : "pause:off"); }

  std::vector<std::string> events;
};

SimulatedPlatform::Options FastOptions() {
  SimulatedPlatform::Options options;
  options.timer_interval_ms = 10'000;
  options.open_delay_ms = 500;
  options.event_length_ms = 2'000;
  return options;
}

TEST(SimulatedPlatformTest, TimerBecomesReadyAfterInterval) {
  timing::DeterministicTimeSource clock(0);
  SimulatedPlatform platform(&clock, FastOptions());

  EXPECT_FALSE(platform.IsNaturalTimerReady());
  EXPECT_DOUBLE_EQ(platform.SecondsUntilNaturalTimer(), 10.0);
  clock.AdvanceMs(9'999);
  EXPECT_FALSE(platform.IsNaturalTimerReady());
  clock.AdvanceMs(1);
  EXPECT_TRUE(platform.IsNaturalTimerReady());
  EXPECT_DOUBLE_EQ(platform.SecondsUntilNaturalTimer(), 0.0);
}

// -----------------------------------------------------------------------------
// Interstitial: pause, open after the delay; close, unpause after the length;
// the close rearms the natural timer
// -----------------------------------------------------------------------------
TEST(SimulatedPlatformTest, InterstitialSequenceAndTimerReset) {
  timing::DeterministicTimeSource clock(0);
  SimulatedPlatform platform(&clock, FastOptions());
  RecordingListener listener;
  platform.SetListener(&listener);

  clock.SetMs(10'000);
  platform.Show();
  EXPECT_EQ(platform.shows_accepted(), 1u);
  EXPECT_TRUE(platform.IsEventInFlight());
  EXPECT_EQ(platform.Pump(), 0u);

  clock.SetMs(10'500);
  EXPECT_EQ(platform.Pump(), 2u);
  EXPECT_TRUE(platform.IsShowing());

  clock.SetMs(12'500);
  EXPECT_EQ(platform.Pump(), 2u);
  EXPECT_FALSE(platform.IsShowing());
  EXPECT_FALSE(platform.IsEventInFlight());

  EXPECT_EQ(listener.events,
            (std::vector<std::string>{"pause:on", "open:INTERSTITIAL",
                                      "close:INTERSTITIAL", "pause:off"}));
  EXPECT_FALSE(platform.IsNaturalTimerReady());
  EXPECT_DOUBLE_EQ(platform.SecondsUntilNaturalTimer(), 10.0);
}

TEST(SimulatedPlatformTest, ShowIgnoredWhenNotReadyOrInFlight) {
  timing::DeterministicTimeSource clock(0);
  SimulatedPlatform platform(&clock, FastOptions());

  platform.Show();  // timer not ready
  EXPECT_EQ(platform.shows_ignored(), 1u);

  platform.ForceNaturalTimerReady();
  platform.Show();
  platform.Show();  // in flight
  EXPECT_EQ(platform.shows_accepted(), 1u);
  EXPECT_EQ(platform.shows_ignored(), 2u);

  platform.SetAvailable(false);
  EXPECT_FALSE(platform.IsAvailable());
}

// -----------------------------------------------------------------------------
// Rewarded ignores the timer and grants before closing
// -----------------------------------------------------------------------------
TEST(SimulatedPlatformTest, RewardedSequence) {
  timing::DeterministicTimeSource clock(0);
  SimulatedPlatform::Options options = FastOptions();
  options.open_delay_ms = 0;
  options.pause_host = false;
  SimulatedPlatform platform(&clock, options);
  RecordingListener listener;
  platform.SetListener(&listener);

  platform.ShowRewarded("coins");
  EXPECT_EQ(platform.Pump(), 1u);
  clock.AdvanceMs(2'000);
  EXPECT_EQ(platform.Pump(), 2u);

  EXPECT_EQ(listener.events,
            (std::vector<std::string>{"open:REWARDED", "reward:coins", "close:REWARDED"}));
}

TEST(SimulatedPlatformTest, ResetToFullIntervalRearms) {
  timing::DeterministicTimeSource clock(0);
  SimulatedPlatform platform(&clock, FastOptions());
  clock.SetMs(15'000);
  ASSERT_TRUE(platform.IsNaturalTimerReady());

  platform.ResetNaturalTimerToFullInterval();
  EXPECT_FALSE(platform.IsNaturalTimerReady());
  EXPECT_DOUBLE_EQ(platform.SecondsUntilNaturalTimer(), 10.0);
}

}  // namespace
}  // namespace intermission::platform
