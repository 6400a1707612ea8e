// Repository: Intermission
// Component: Cooldown Guard
// Purpose: Minimum quiet period after an interruption closes. Absorbs the
//          window in which the platform's natural timer still reports ready
//          from the event that just finished.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_ADMISSION_COOLDOWN_GUARD_HPP_
#define INTERMISSION_ADMISSION_COOLDOWN_GUARD_HPP_

#include <cstdint>
#include <optional>

namespace intermission::admission {

class CooldownGuard {
 public:
  // Negative windows are clamped to zero.
  explicit CooldownGuard(int64_t window_ms);

  // True when no close has been recorded yet, or when at least window_ms has
  // elapsed since the last one.
  bool IsReady(int64_t now_ms) const;

  void RecordClose(int64_t now_ms);

  // Quiet time left before IsReady(now_ms) turns true. 0 when ready.
  int64_t RemainingMs(int64_t now_ms) const;

  // Milliseconds since the last recorded close, or nullopt if none.
  std::optional<int64_t> ElapsedSinceCloseMs(int64_t now_ms) const;

  int64_t window_ms() const { return window_ms_; }
  const std::optional<int64_t>& last_close_ms() const { return last_close_ms_; }

 private:
  int64_t window_ms_;
  std::optional<int64_t> last_close_ms_;
};

}  // namespace intermission::admission

#endif  // INTERMISSION_ADMISSION_COOLDOWN_GUARD_HPP_
