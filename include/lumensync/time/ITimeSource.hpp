// Repository: LumenSync
// Component: Time Source Interface
// Purpose: Monotonic millisecond clock. Production reads steady_clock,
//          tests advance a DeterministicTimeSource by hand.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_TIME_ITIME_SOURCE_HPP_
#define LUMENSYNC_TIME_ITIME_SOURCE_HPP_

#include <chrono>
#include <cstdint>

namespace lumensync::time {

class ITimeSource {
 public:
  virtual ~ITimeSource() = default;
  // Milliseconds on a monotonic timeline. Origin is unspecified.
  virtual int64_t NowMs() const = 0;
};

class SteadyTimeSource : public ITimeSource {
 public:
  int64_t NowMs() const override {
    using namespace std::chrono;
    return duration_cast<milliseconds>(
        steady_clock::now().time_since_epoch()).count();
  }
};

}  // namespace lumensync::time

#endif  // LUMENSYNC_TIME_ITIME_SOURCE_HPP_
