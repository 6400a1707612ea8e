// Repository: Intermission
// Component: Recording Countdown Observer
// Purpose: Captures countdown display notifications for verification.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_TESTS_FIXTURES_RECORDING_COUNTDOWN_OBSERVER_H_
#define INTERMISSION_TESTS_FIXTURES_RECORDING_COUNTDOWN_OBSERVER_H_

#include <vector>

#include "intermission/countdown/ICountdownObserver.hpp"

namespace intermission::tests::fixtures
{

  class RecordingCountdownObserver : public countdown::ICountdownObserver
  {
  public:
    void OnCountdownStarted() override { ++started; }
    void OnCountdownTick(int remaining_s) override { ticks.push_back(remaining_s); }
    void OnCountdownEnded() override { ++ended; }

    int started = 0;
    int ended = 0;
    std::vector<int> ticks;
  };

} // namespace intermission::tests::fixtures

#endif // INTERMISSION_TESTS_FIXTURES_RECORDING_COUNTDOWN_OBSERVER_H_
