#pragma once
#include <cstdint>

namespace intermission::timing {

// Monotonic millisecond clock. All scheduler timestamps (cooldown, awaiting
// open deadline, simulated platform timer) are expressed in this unit.
class ITimeSource {
public:
  virtual ~ITimeSource() = default;
  virtual int64_t NowMs() const = 0;
};

}  // namespace intermission::timing
