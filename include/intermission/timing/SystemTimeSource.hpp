#pragma once
#include "intermission/timing/ITimeSource.hpp"
#include <chrono>

namespace intermission::timing {

class SystemTimeSource : public ITimeSource {
public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace intermission::timing
