// Repository: Intermission
// Component: Manual trigger policy unit tests

#include <gtest/gtest.h>

#include "fixtures/InMemoryKeyValueStore.h"
#include "intermission/admission/ManualTriggerPolicy.hpp"
#include "support/LogCapture.hpp"

namespace intermission::admission {
namespace {

using tests::fixtures::InMemoryKeyValueStore;

// -----------------------------------------------------------------------------
// frequency=2: counter is incremented before the check, so the 2nd, 4th...
// requests are admitted
// -----------------------------------------------------------------------------
TEST(ManualTriggerPolicyTest, FrequencyTwoAdmitsEverySecondRequest) {
  InMemoryKeyValueStore store;
  ManualTriggerPolicy policy(2, &store);

  EXPECT_FALSE(policy.ShouldAdmit());  // 1
  EXPECT_TRUE(policy.ShouldAdmit());   // 2
  EXPECT_FALSE(policy.ShouldAdmit());  // 3
  EXPECT_TRUE(policy.ShouldAdmit());   // 4
  EXPECT_EQ(policy.counter(), 4);
  EXPECT_EQ(store.GetInt(ManualTriggerPolicy::kDefaultCounterKey).value(), 4);
}

TEST(ManualTriggerPolicyTest, FrequencyOneAdmitsEveryRequest) {
  InMemoryKeyValueStore store;
  ManualTriggerPolicy policy(1, &store);
  for (int i = 0; i < 5; ++i) {
    EXPECT_TRUE(policy.ShouldAdmit());
  }
  EXPECT_EQ(policy.counter(), 5);
}

// -----------------------------------------------------------------------------
// frequency <= 0 never admits and leaves the persisted counter untouched
// -----------------------------------------------------------------------------
TEST(ManualTriggerPolicyTest, NonPositiveFrequencyDisables) {
  InMemoryKeyValueStore store;
  store.Put(ManualTriggerPolicy::kDefaultCounterKey, 7);

  for (int frequency : {0, -3}) {
    ManualTriggerPolicy policy(frequency, &store);
    EXPECT_TRUE(policy.IsDisabled());
    EXPECT_FALSE(policy.Peek());
    EXPECT_FALSE(policy.ShouldAdmit());
    EXPECT_EQ(policy.counter(), 7);
    EXPECT_EQ(policy.NextAdmitCounter(), -1);
  }
  EXPECT_EQ(store.write_count(), 0u);
}

// -----------------------------------------------------------------------------
// The counter survives a restart through the store
// -----------------------------------------------------------------------------
TEST(ManualTriggerPolicyTest, CounterResumesFromStore) {
  InMemoryKeyValueStore store;
  {
    ManualTriggerPolicy policy(3, &store);
    policy.ShouldAdmit();
    policy.ShouldAdmit();
  }
  ManualTriggerPolicy restarted(3, &store);
  EXPECT_EQ(restarted.counter(), 2);
  EXPECT_TRUE(restarted.Peek());
  EXPECT_TRUE(restarted.ShouldAdmit());  // 3
}

TEST(ManualTriggerPolicyTest, CustomCounterKey) {
  InMemoryKeyValueStore store;
  store.Put("other", 1);
  ManualTriggerPolicy policy(2, &store, "other");
  EXPECT_EQ(policy.counter(), 1);
  EXPECT_TRUE(policy.ShouldAdmit());
  EXPECT_EQ(store.GetInt("other").value(), 2);
  EXPECT_FALSE(store.GetInt(ManualTriggerPolicy::kDefaultCounterKey).has_value());
}

TEST(ManualTriggerPolicyTest, NegativePersistedCounterResetsToZero) {
  tests::LogCapture logs;
  InMemoryKeyValueStore store;
  store.Put(ManualTriggerPolicy::kDefaultCounterKey, -4);
  ManualTriggerPolicy policy(2, &store);
  EXPECT_EQ(policy.counter(), 0);
  EXPECT_EQ(logs.CountWarn("NEGATIVE_COUNTER"), 1);
}

// -----------------------------------------------------------------------------
// A failed write keeps the in-memory count and is counted
// -----------------------------------------------------------------------------
TEST(ManualTriggerPolicyTest, PersistFailureKeepsSessionCounter) {
  tests::LogCapture logs;
  InMemoryKeyValueStore store;
  store.SetFailWrites(true);
  ManualTriggerPolicy policy(2, &store);

  EXPECT_FALSE(policy.ShouldAdmit());
  EXPECT_TRUE(policy.ShouldAdmit());
  EXPECT_EQ(policy.counter(), 2);
  EXPECT_EQ(policy.persist_failure_total(), 2u);
  EXPECT_EQ(logs.CountWarn("PERSIST_FAILED"), 2);
}

TEST(ManualTriggerPolicyTest, NullStoreIsSessionOnly) {
  ManualTriggerPolicy policy(2, nullptr);
  EXPECT_FALSE(policy.ShouldAdmit());
  EXPECT_TRUE(policy.ShouldAdmit());
  EXPECT_EQ(policy.persist_failure_total(), 0u);
}

// -----------------------------------------------------------------------------
// Peek and NextAdmitCounter never move the counter
// -----------------------------------------------------------------------------
TEST(ManualTriggerPolicyTest, PeekAndNextAdmitCounterDoNotMutate) {
  InMemoryKeyValueStore store;
  ManualTriggerPolicy policy(3, &store);

  EXPECT_FALSE(policy.Peek());
  EXPECT_EQ(policy.NextAdmitCounter(), 3);
  EXPECT_EQ(policy.counter(), 0);
  EXPECT_EQ(store.write_count(), 0u);

  policy.ShouldAdmit();
  policy.ShouldAdmit();
  EXPECT_TRUE(policy.Peek());
  EXPECT_EQ(policy.NextAdmitCounter(), 3);

  policy.ShouldAdmit();  // 3, admitted
  EXPECT_EQ(policy.NextAdmitCounter(), 6);

  ManualTriggerPolicy every(1, nullptr);
  EXPECT_EQ(every.NextAdmitCounter(), 1);
}

}  // namespace
}  // namespace intermission::admission
