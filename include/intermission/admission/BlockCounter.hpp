// Repository: Intermission
// Component: Block Counter
// Purpose: Reference count of open UIs that suppress interruption admission.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_ADMISSION_BLOCK_COUNTER_HPP_
#define INTERMISSION_ADMISSION_BLOCK_COUNTER_HPP_

#include <cstdint>

namespace intermission::admission {

// Counts outstanding Block() requests. The count never goes negative: an
// Unblock() with nothing held is clamped and recorded as unmatched so that a
// mismatched caller can be found in the metrics instead of corrupting state.
class BlockCounter {
 public:
  BlockCounter() = default;

  BlockCounter(const BlockCounter&) = delete;
  BlockCounter& operator=(const BlockCounter&) = delete;

  // Returns the count after the call.
  int Block();
  int Unblock();

  // Escape hatch for a stuck count. Not part of the normal flow.
  void ForceReset();

  int count() const { return count_; }
  bool IsBlocked() const { return count_ > 0; }

  uint64_t unmatched_unblock_total() const { return unmatched_unblock_total_; }
  uint64_t force_reset_total() const { return force_reset_total_; }

 private:
  int count_ = 0;
  uint64_t unmatched_unblock_total_ = 0;
  uint64_t force_reset_total_ = 0;
};

}  // namespace intermission::admission

#endif  // INTERMISSION_ADMISSION_BLOCK_COUNTER_HPP_
