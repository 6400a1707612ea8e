// Repository: Intermission
// Component: Block Counter
// Copyright (c) 2026 Intermission

#include "intermission/admission/BlockCounter.hpp"

#include <sstream>

#include "intermission/util/Logger.hpp"

namespace intermission::admission {

using util::Logger;

int BlockCounter::Block() {
  ++count_;
  std::ostringstream oss;
  oss << "[BlockCounter] BLOCK count=" << count_;
  Logger::Debug(oss.str());
  return count_;
}

int BlockCounter::Unblock() {
  if (count_ > 0) {
    --count_;
  } else {
    ++unmatched_unblock_total_;
    std::ostringstream oss;
    oss << "[BlockCounter] UNMATCHED_UNBLOCK count=0 unmatched_total="
        << unmatched_unblock_total_;
    Logger::Warn(oss.str());
    return count_;
  }
  std::ostringstream oss;
  oss << "[BlockCounter] UNBLOCK count=" << count_;
  Logger::Debug(oss.str());
  return count_;
}

void BlockCounter::ForceReset() {
  std::ostringstream oss;
  oss << "[BlockCounter] FORCE_RESET previous_count=" << count_;
  if (count_ > 0) {
    Logger::Warn(oss.str());
  } else {
    Logger::Debug(oss.str());
  }
  count_ = 0;
  ++force_reset_total_;
}

}  // namespace intermission::admission
