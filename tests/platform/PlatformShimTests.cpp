// Repository: Intermission
// Component: Platform shim unit tests

#include <gtest/gtest.h>

#include <vector>

#include "fixtures/FakePlatformAdapter.h"
#include "intermission/platform/PlatformShim.hpp"
#include "support/LogCapture.hpp"

namespace intermission::platform {
namespace {

using admission::GateVerdict;
using tests::fixtures::FakePlatformAdapter;

PlatformShim::StaleTimerGuard DefaultGuard() {
  PlatformShim::StaleTimerGuard guard;
  guard.threshold_s = 0.1;
  guard.window_ms = 4000;
  return guard;
}

TEST(PlatformShimTest, SubscribesAndUnsubscribes) {
  FakePlatformAdapter adapter;
  {
    PlatformShim shim(&adapter, DefaultGuard());
    EXPECT_TRUE(adapter.HasListener());
    EXPECT_TRUE(shim.HasAdapter());
  }
  EXPECT_FALSE(adapter.HasListener());
}

// -----------------------------------------------------------------------------
// No adapter: unavailable everywhere, nothing passed on
// -----------------------------------------------------------------------------
TEST(PlatformShimTest, NullAdapterIsUnavailable) {
  tests::LogCapture logs;
  PlatformShim shim(nullptr, DefaultGuard());
  EXPECT_EQ(logs.CountWarn("NO_ADAPTER"), 1);

  EXPECT_FALSE(shim.IsAvailable());
  EXPECT_EQ(shim.CheckNaturalTimer(0, std::nullopt), GateVerdict::kPlatformUnavailable);
  EXPECT_EQ(shim.SecondsUntilNaturalTimer(), -1.0);
  EXPECT_FALSE(shim.RequestShow(EventKind::kInterstitial));
  EXPECT_FALSE(shim.ForceReady());
  EXPECT_FALSE(shim.ResetToFullInterval());
}

TEST(PlatformShimTest, DisabledAdapterIsUnavailable) {
  FakePlatformAdapter adapter;
  adapter.SetAvailable(false);
  adapter.SetTimer(true, 0.0);
  PlatformShim shim(&adapter, DefaultGuard());

  EXPECT_EQ(shim.CheckNaturalTimer(0, std::nullopt), GateVerdict::kPlatformUnavailable);
  EXPECT_FALSE(shim.RequestShow(EventKind::kInterstitial));
  EXPECT_EQ(adapter.show_count(), 0);
}

TEST(PlatformShimTest, TimerVerdicts) {
  FakePlatformAdapter adapter;
  PlatformShim shim(&adapter, DefaultGuard());

  adapter.SetTimer(false, 12.0);
  EXPECT_EQ(shim.CheckNaturalTimer(0, std::nullopt), GateVerdict::kTimerNotReady);

  adapter.SetTimer(true, 0.0);
  EXPECT_EQ(shim.CheckNaturalTimer(0, std::nullopt), GateVerdict::kAdmitted);
}

// -----------------------------------------------------------------------------
// Ready with ~0s left within the window after a close is a leftover flag
// -----------------------------------------------------------------------------
TEST(PlatformShimTest, StaleReadyFlagAfterClose) {
  FakePlatformAdapter adapter;
  PlatformShim shim(&adapter, DefaultGuard());
  adapter.SetTimer(true, 0.05);

  const int64_t close_ms = 10'000;
  EXPECT_EQ(shim.CheckNaturalTimer(close_ms + 1000, close_ms), GateVerdict::kTimerStale);
  EXPECT_EQ(shim.CheckNaturalTimer(close_ms + 3999, close_ms), GateVerdict::kTimerStale);
  EXPECT_EQ(shim.CheckNaturalTimer(close_ms + 4000, close_ms), GateVerdict::kAdmitted);

  // Above the threshold the platform has genuinely rearmed.
  adapter.SetTimer(true, 0.5);
  EXPECT_EQ(shim.CheckNaturalTimer(close_ms + 1000, close_ms), GateVerdict::kAdmitted);
}

// -----------------------------------------------------------------------------
// ForceReady only touches a timer that is not ready
// -----------------------------------------------------------------------------
TEST(PlatformShimTest, ForceReadyOnlyWhenNotReady) {
  FakePlatformAdapter adapter;
  PlatformShim shim(&adapter, DefaultGuard());

  adapter.SetTimer(true, 0.0);
  EXPECT_FALSE(shim.ForceReady());
  EXPECT_EQ(adapter.force_ready_count(), 0);

  adapter.SetTimer(false, 30.0);
  EXPECT_TRUE(shim.ForceReady());
  EXPECT_EQ(adapter.force_ready_count(), 1);
  EXPECT_TRUE(adapter.IsNaturalTimerReady());
}

TEST(PlatformShimTest, RequestsReachAdapter) {
  FakePlatformAdapter adapter;
  PlatformShim shim(&adapter, DefaultGuard());

  EXPECT_TRUE(shim.RequestShow(EventKind::kInterstitial));
  EXPECT_TRUE(shim.RequestShow(EventKind::kRewarded, "coins"));
  EXPECT_TRUE(shim.ResetToFullInterval());
  EXPECT_EQ(adapter.show_count(), 1);
  ASSERT_EQ(adapter.rewarded_ids().size(), 1u);
  EXPECT_EQ(adapter.rewarded_ids()[0], "coins");
  EXPECT_EQ(adapter.reset_count(), 1);
  EXPECT_EQ(shim.SecondsUntilNaturalTimer(), 60.0);
}

// -----------------------------------------------------------------------------
// Notifications become PlatformSignals; dropped (and counted) without handler
// -----------------------------------------------------------------------------
TEST(PlatformShimTest, ForwardsNotificationsAsSignals) {
  FakePlatformAdapter adapter;
  PlatformShim shim(&adapter, DefaultGuard());

  {
    tests::LogCapture logs;
    adapter.DeliverOpened();
    EXPECT_EQ(shim.signals_dropped(), 1u);
    EXPECT_EQ(logs.CountWarn("SIGNAL_DROPPED type=OPENED"), 1);
  }

  std::vector<PlatformSignal> seen;
  shim.SetSignalHandler([&](const PlatformSignal& s) { seen.push_back(s); });
  adapter.DeliverPause(true);
  adapter.DeliverOpened(EventKind::kRewarded);
  adapter.DeliverReward("coins");
  adapter.DeliverClosed(EventKind::kRewarded);
  adapter.DeliverPause(false);

  ASSERT_EQ(seen.size(), 5u);
  EXPECT_EQ(shim.signals_delivered(), 5u);
  EXPECT_EQ(seen[0].type, PlatformSignal::Type::kPauseChanged);
  EXPECT_TRUE(seen[0].paused);
  EXPECT_EQ(seen[1].type, PlatformSignal::Type::kOpened);
  EXPECT_EQ(seen[1].kind, EventKind::kRewarded);
  EXPECT_EQ(seen[2].type, PlatformSignal::Type::kRewardGranted);
  EXPECT_EQ(seen[2].reward_id, "coins");
  EXPECT_EQ(seen[3].type, PlatformSignal::Type::kClosed);
  EXPECT_EQ(seen[4].type, PlatformSignal::Type::kPauseChanged);
  EXPECT_FALSE(seen[4].paused);
}

}  // namespace
}  // namespace intermission::platform
