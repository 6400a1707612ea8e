// Repository: Intermission
// Component: Manual Trigger Policy
// Copyright (c) 2026 Intermission

#include "intermission/admission/ManualTriggerPolicy.hpp"

#include <sstream>

#include "intermission/persistence/IKeyValueStore.hpp"
#include "intermission/util/Logger.hpp"

namespace intermission::admission {

using util::Logger;

ManualTriggerPolicy::ManualTriggerPolicy(int frequency,
                                         persistence::IKeyValueStore* store,
                                         std::string counter_key)
    : frequency_(frequency), store_(store), counter_key_(std::move(counter_key)) {
  if (store_ == nullptr) {
    Logger::Warn("[ManualTriggerPolicy] NO_STORE counter is session-only key=" +
                 counter_key_);
  } else if (auto persisted = store_->GetInt(counter_key_)) {
    if (*persisted < 0) {
      std::ostringstream oss;
      oss << "[ManualTriggerPolicy] NEGATIVE_COUNTER key=" << counter_key_
          << " value=" << *persisted << " reset_to=0";
      Logger::Warn(oss.str());
    } else {
      counter_ = *persisted;
    }
  }

  std::ostringstream oss;
  oss << "[ManualTriggerPolicy] LOADED counter=" << counter_
      << " frequency=" << frequency_;
  if (IsDisabled()) {
    oss << " disabled=true";
  }
  Logger::Debug(oss.str());
}

bool ManualTriggerPolicy::Admits(int64_t counter_value) const {
  if (frequency_ <= 0) return false;
  if (frequency_ == 1) return true;
  return counter_value % frequency_ == 0;
}

bool ManualTriggerPolicy::ShouldAdmit() {
  if (IsDisabled()) {
    return false;
  }

  ++counter_;
  if (store_ != nullptr && !store_->SetInt(counter_key_, counter_)) {
    ++persist_failure_total_;
    std::ostringstream oss;
    oss << "[ManualTriggerPolicy] PERSIST_FAILED key=" << counter_key_
        << " counter=" << counter_;
    Logger::Warn(oss.str());
  }

  const bool admitted = Admits(counter_);
  std::ostringstream oss;
  oss << "[ManualTriggerPolicy] " << (admitted ? "ADMIT" : "SKIP")
      << " counter=" << counter_ << " frequency=" << frequency_
      << " next_admit_at=" << NextAdmitCounter();
  Logger::Debug(oss.str());
  return admitted;
}

bool ManualTriggerPolicy::Peek() const {
  return Admits(counter_ + 1);
}

int64_t ManualTriggerPolicy::NextAdmitCounter() const {
  if (frequency_ <= 0) return -1;
  if (frequency_ == 1) return counter_ + 1;
  return ((counter_ / frequency_) + 1) * frequency_;
}

}  // namespace intermission::admission
