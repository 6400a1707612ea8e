// Repository: Intermission
// Component: Cooldown Guard
// Copyright (c) 2026 Intermission

#include "intermission/admission/CooldownGuard.hpp"

#include <algorithm>

namespace intermission::admission {

CooldownGuard::CooldownGuard(int64_t window_ms)
    : window_ms_(std::max<int64_t>(window_ms, 0)) {}

bool CooldownGuard::IsReady(int64_t now_ms) const {
  return RemainingMs(now_ms) == 0;
}

void CooldownGuard::RecordClose(int64_t now_ms) {
  last_close_ms_ = now_ms;
}

int64_t CooldownGuard::RemainingMs(int64_t now_ms) const {
  if (!last_close_ms_.has_value()) {
    return 0;
  }
  const int64_t elapsed = now_ms - *last_close_ms_;
  return std::max<int64_t>(window_ms_ - elapsed, 0);
}

std::optional<int64_t> CooldownGuard::ElapsedSinceCloseMs(int64_t now_ms) const {
  if (!last_close_ms_.has_value()) {
    return std::nullopt;
  }
  return now_ms - *last_close_ms_;
}

}  // namespace intermission::admission
