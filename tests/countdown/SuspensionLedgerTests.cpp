// Repository: Intermission
// Component: Suspension ledger unit tests

#include <gtest/gtest.h>

#include <memory>

#include "fixtures/FakeControllable.h"
#include "intermission/countdown/SuspensionLedger.hpp"

namespace intermission::countdown {
namespace {

using tests::fixtures::FakeControllable;
using Outcome = SuspensionLedger::ReleaseOutcome;

TEST(SuspensionLedgerTest, ClaimDisablesAndReleaseRestores) {
  SuspensionLedger ledger;
  auto movement = std::make_shared<FakeControllable>("movement", true);

  EXPECT_TRUE(ledger.Claim(1, movement));
  EXPECT_FALSE(movement->IsEnabled());
  EXPECT_TRUE(ledger.IsTracked(movement.get()));
  EXPECT_EQ(ledger.OwnerOf(movement.get()).value(), 1u);

  EXPECT_EQ(ledger.Release(1, movement.get()), Outcome::kEnabled);
  EXPECT_TRUE(movement->IsEnabled());
  EXPECT_FALSE(ledger.IsTracked(movement.get()));
  EXPECT_EQ(ledger.restored_total(), 1u);
}

// -----------------------------------------------------------------------------
// A controller that was already disabled stays disabled after release
// -----------------------------------------------------------------------------
TEST(SuspensionLedgerTest, PriorDisabledStateIsPreserved) {
  SuspensionLedger ledger;
  auto menu = std::make_shared<FakeControllable>("menu", false);

  EXPECT_FALSE(ledger.Claim(1, menu));
  EXPECT_TRUE(menu->calls().empty());
  EXPECT_EQ(ledger.Release(1, menu.get()), Outcome::kLeftDisabled);
  EXPECT_FALSE(menu->IsEnabled());
  EXPECT_TRUE(menu->calls().empty());
}

// -----------------------------------------------------------------------------
// A newer cycle inherits the original prior state; the older cycle's late
// release leaves the controller alone
// -----------------------------------------------------------------------------
TEST(SuspensionLedgerTest, NewerCycleInheritsAndOldReleaseIsIgnored) {
  SuspensionLedger ledger;
  auto movement = std::make_shared<FakeControllable>("movement", true);

  ledger.Claim(1, movement);
  EXPECT_TRUE(ledger.Claim(2, movement));  // inherits was_enabled=true
  EXPECT_EQ(ledger.inherited_total(), 1u);
  EXPECT_EQ(ledger.OwnerOf(movement.get()).value(), 2u);

  EXPECT_EQ(ledger.Release(1, movement.get()), Outcome::kNotOwner);
  EXPECT_FALSE(movement->IsEnabled());

  EXPECT_EQ(ledger.Release(2, movement.get()), Outcome::kEnabled);
  EXPECT_TRUE(movement->IsEnabled());
}

TEST(SuspensionLedgerTest, ReleaseOfUntrackedIsNotOwner) {
  SuspensionLedger ledger;
  FakeControllable stray;
  EXPECT_EQ(ledger.Release(1, &stray), Outcome::kNotOwner);
  EXPECT_TRUE(stray.calls().empty());
}

// -----------------------------------------------------------------------------
// Releases during a hold are parked and finished by the last ReleaseHold
// -----------------------------------------------------------------------------
TEST(SuspensionLedgerTest, HoldDefersRestorationUntilLastHolderReleases) {
  SuspensionLedger ledger;
  auto movement = std::make_shared<FakeControllable>("movement", true);
  ledger.Claim(1, movement);

  ledger.AddHold("platform-pause");
  ledger.AddHold("other");
  EXPECT_TRUE(ledger.IsHeld());

  EXPECT_EQ(ledger.Release(1, movement.get()), Outcome::kDeferred);
  EXPECT_FALSE(movement->IsEnabled());
  EXPECT_EQ(ledger.deferred_count(), 1u);
  EXPECT_EQ(ledger.deferred_total(), 1u);

  EXPECT_EQ(ledger.ReleaseHold("platform-pause"), 0u);
  EXPECT_FALSE(movement->IsEnabled());

  EXPECT_EQ(ledger.ReleaseHold("other"), 1u);
  EXPECT_TRUE(movement->IsEnabled());
  EXPECT_EQ(ledger.deferred_count(), 0u);
  EXPECT_EQ(ledger.tracked_count(), 0u);
}

// -----------------------------------------------------------------------------
// A deferred entry re-claimed by a new cycle is not restored when the hold
// lifts
// -----------------------------------------------------------------------------
TEST(SuspensionLedgerTest, ReclaimedDeferredEntryIsNotRestoredByHoldRelease) {
  SuspensionLedger ledger;
  auto movement = std::make_shared<FakeControllable>("movement", true);
  ledger.Claim(1, movement);
  ledger.AddHold("platform-pause");
  ASSERT_EQ(ledger.Release(1, movement.get()), Outcome::kDeferred);

  EXPECT_TRUE(ledger.Claim(2, movement));
  EXPECT_EQ(ledger.deferred_count(), 0u);

  EXPECT_EQ(ledger.ReleaseHold("platform-pause"), 0u);
  EXPECT_FALSE(movement->IsEnabled());

  EXPECT_EQ(ledger.Release(2, movement.get()), Outcome::kEnabled);
  EXPECT_TRUE(movement->IsEnabled());
}

TEST(SuspensionLedgerTest, ReleasingUnknownHoldIsNoOp) {
  SuspensionLedger ledger;
  EXPECT_EQ(ledger.ReleaseHold("nobody"), 0u);
  EXPECT_FALSE(ledger.IsHeld());
}

// -----------------------------------------------------------------------------
// RestoreAll ignores holds
// -----------------------------------------------------------------------------
TEST(SuspensionLedgerTest, RestoreAllIgnoresHolds) {
  SuspensionLedger ledger;
  auto a = std::make_shared<FakeControllable>("a", true);
  auto b = std::make_shared<FakeControllable>("b", false);
  auto c = std::make_shared<FakeControllable>("c", true);
  ledger.Claim(1, a);
  ledger.Claim(1, b);
  ledger.Claim(2, c);
  ledger.AddHold("platform-pause");
  ledger.Release(1, a.get());

  EXPECT_EQ(ledger.RestoreAll(), 3u);
  EXPECT_TRUE(a->IsEnabled());
  EXPECT_FALSE(b->IsEnabled());
  EXPECT_TRUE(c->IsEnabled());
  EXPECT_EQ(ledger.tracked_count(), 0u);
}

// -----------------------------------------------------------------------------
// A destroyed controller is reported expired and dropped
// -----------------------------------------------------------------------------
TEST(SuspensionLedgerTest, ExpiredControllerIsDropped) {
  SuspensionLedger ledger;
  auto movement = std::make_shared<FakeControllable>("movement", true);
  const IControllable* key = movement.get();
  ledger.Claim(1, movement);
  movement.reset();

  EXPECT_FALSE(ledger.IsTracked(key));
  EXPECT_FALSE(ledger.OwnerOf(key).has_value());
  EXPECT_EQ(ledger.Release(1, key), Outcome::kExpired);
  EXPECT_EQ(ledger.tracked_count(), 0u);
}

TEST(SuspensionLedgerTest, OutcomeNames) {
  EXPECT_STREQ(ToString(Outcome::kDeferred), "DEFERRED");
  EXPECT_STREQ(ToString(Outcome::kNotOwner), "NOT_OWNER");
}

}  // namespace
}  // namespace intermission::countdown
