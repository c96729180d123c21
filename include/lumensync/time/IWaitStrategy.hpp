// Repository: LumenSync
// Component: Wait Strategy Interface
// Purpose: Decouple sleeping from cadence math in the sync loop.
//          Production: RealtimeWaitStrategy sleeps and can be interrupted.
//          Tests: DeterministicWaitStrategy (advances virtual time, no sleep).
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_TIME_IWAIT_STRATEGY_HPP_
#define LUMENSYNC_TIME_IWAIT_STRATEGY_HPP_

#include <chrono>
#include <condition_variable>
#include <mutex>

namespace lumensync::time {

class IWaitStrategy {
 public:
  virtual ~IWaitStrategy() = default;

  // Waits for `duration`. Returns false if Interrupt() cut the wait short.
  virtual bool WaitFor(std::chrono::milliseconds duration) = 0;

  // Wakes the current wait and every later one. Not reversible.
  virtual void Interrupt() = 0;
};

class RealtimeWaitStrategy : public IWaitStrategy {
 public:
  bool WaitFor(std::chrono::milliseconds duration) override {
    std::unique_lock<std::mutex> lock(mutex_);
    if (duration.count() <= 0) return !interrupted_;
    return !cv_.wait_for(lock, duration, [this] { return interrupted_; });
  }

  void Interrupt() override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      interrupted_ = true;
    }
    cv_.notify_all();
  }

 private:
  std::mutex mutex_;
  std::condition_variable cv_;
  bool interrupted_ = false;
};

}  // namespace lumensync::time

#endif  // LUMENSYNC_TIME_IWAIT_STRATEGY_HPP_
