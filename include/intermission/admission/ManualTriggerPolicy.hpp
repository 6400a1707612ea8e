// Repository: Intermission
// Component: Manual Trigger Policy
// Purpose: Frequency gate for explicitly requested interruptions, with a
//          counter that survives across sessions.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_ADMISSION_MANUAL_TRIGGER_POLICY_HPP_
#define INTERMISSION_ADMISSION_MANUAL_TRIGGER_POLICY_HPP_

#include <cstdint>
#include <string>

namespace intermission::persistence {
class IKeyValueStore;
}

namespace intermission::admission {

// Admission rule (counter is incremented BEFORE the check):
//   frequency <= 0 : never admits, counter untouched
//   frequency == 1 : admits every call
//   frequency >= 2 : admits when counter % frequency == 0
// e.g. frequency=2 admits the 2nd, 4th, 6th... request.
class ManualTriggerPolicy {
 public:
  static constexpr const char* kDefaultCounterKey = "manualTriggerCounter";

  // Reads the persisted counter from store (if any). store may be null, in
  // which case the counter lives in memory for this session only. store must
  // outlive the policy.
  ManualTriggerPolicy(int frequency,
                      persistence::IKeyValueStore* store,
                      std::string counter_key = kDefaultCounterKey);

  ManualTriggerPolicy(const ManualTriggerPolicy&) = delete;
  ManualTriggerPolicy& operator=(const ManualTriggerPolicy&) = delete;

  // Increments and persists the counter, then applies the admission rule.
  bool ShouldAdmit();

  // What the next ShouldAdmit() would return. Does not mutate.
  [[nodiscard]] bool Peek() const;

  // Counter value at which the next admission happens; -1 when disabled.
  [[nodiscard]] int64_t NextAdmitCounter() const;

  bool IsDisabled() const { return frequency_ <= 0; }
  int frequency() const { return frequency_; }
  int64_t counter() const { return counter_; }
  const std::string& counter_key() const { return counter_key_; }

  uint64_t persist_failure_total() const { return persist_failure_total_; }

 private:
  bool Admits(int64_t counter_value) const;

  int frequency_;
  persistence::IKeyValueStore* store_;
  std::string counter_key_;
  int64_t counter_ = 0;
  uint64_t persist_failure_total_ = 0;
};

}  // namespace intermission::admission

#endif  // INTERMISSION_ADMISSION_MANUAL_TRIGGER_POLICY_HPP_
