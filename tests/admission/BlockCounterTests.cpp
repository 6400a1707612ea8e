// Repository: Intermission
// Component: Block counter unit tests

#include <gtest/gtest.h>

#include "intermission/admission/BlockCounter.hpp"
#include "support/LogCapture.hpp"

namespace intermission::admission {
namespace {

// -----------------------------------------------------------------------------
// Nested Block/Unblock pairs: blocked until the last one is released
// -----------------------------------------------------------------------------
TEST(BlockCounterTest, NestedBlocksRequireMatchingUnblocks) {
  BlockCounter blocks;
  EXPECT_FALSE(blocks.IsBlocked());

  EXPECT_EQ(blocks.Block(), 1);
  EXPECT_EQ(blocks.Block(), 2);
  EXPECT_TRUE(blocks.IsBlocked());

  EXPECT_EQ(blocks.Unblock(), 1);
  EXPECT_TRUE(blocks.IsBlocked());
  EXPECT_EQ(blocks.Unblock(), 0);
  EXPECT_FALSE(blocks.IsBlocked());
  EXPECT_EQ(blocks.unmatched_unblock_total(), 0u);
}

// -----------------------------------------------------------------------------
// Unblock with nothing held clamps at zero and is counted, with a warning
// -----------------------------------------------------------------------------
TEST(BlockCounterTest, UnmatchedUnblockClampsAtZero) {
  tests::LogCapture logs;
  BlockCounter blocks;

  EXPECT_EQ(blocks.Unblock(), 0);
  EXPECT_EQ(blocks.Unblock(), 0);
  EXPECT_EQ(blocks.count(), 0);
  EXPECT_EQ(blocks.unmatched_unblock_total(), 2u);
  EXPECT_EQ(logs.CountWarn("UNMATCHED_UNBLOCK"), 2);

  // A later Block() is not swallowed by the earlier surplus.
  EXPECT_EQ(blocks.Block(), 1);
  EXPECT_TRUE(blocks.IsBlocked());
}

// -----------------------------------------------------------------------------
// ForceReset clears any count and is recorded
// -----------------------------------------------------------------------------
TEST(BlockCounterTest, ForceResetClearsStuckCount) {
  tests::LogCapture logs;
  BlockCounter blocks;
  blocks.Block();
  blocks.Block();
  blocks.Block();

  blocks.ForceReset();
  EXPECT_EQ(blocks.count(), 0);
  EXPECT_FALSE(blocks.IsBlocked());
  EXPECT_EQ(blocks.force_reset_total(), 1u);
  EXPECT_EQ(logs.CountWarn("FORCE_RESET previous_count=3"), 1);

  // Resetting an empty counter is not a warning.
  blocks.ForceReset();
  EXPECT_EQ(blocks.force_reset_total(), 2u);
  EXPECT_EQ(logs.CountWarn("FORCE_RESET"), 1);
}

}  // namespace
}  // namespace intermission::admission
