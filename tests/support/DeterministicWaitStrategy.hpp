// Repository: LumenSync
// Component: Deterministic Wait Strategy (test only)
// Purpose: Advances DeterministicTimeSource by exactly the requested wait.
//          No sleep, no wall-clock drift.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_
#define LUMENSYNC_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_

#include <chrono>
#include <cstdint>
#include <functional>
#include <vector>

#include "DeterministicTimeSource.hpp"
#include "lumensync/time/IWaitStrategy.hpp"

namespace lumensync::tests {

class DeterministicWaitStrategy : public time::IWaitStrategy {
 public:
  explicit DeterministicWaitStrategy(DeterministicTimeSource& ts) : ts_(ts) {}

  bool WaitFor(std::chrono::milliseconds duration) override {
    if (interrupted_) return false;
    waits_.push_back(duration.count());
    ts_.AdvanceMs(duration.count());
    if (on_wait_) on_wait_(waits_.size());
    return !interrupted_;
  }

  void Interrupt() override { interrupted_ = true; }

  // Called after every wait with the number of waits so far. Tests use it
  // to stop Run() after a fixed number of cycles.
  void SetOnWait(std::function<void(size_t)> hook) { on_wait_ = std::move(hook); }

  const std::vector<int64_t>& waits() const { return waits_; }
  bool interrupted() const { return interrupted_; }

 private:
  DeterministicTimeSource& ts_;
  std::vector<int64_t> waits_;
  std::function<void(size_t)> on_wait_;
  bool interrupted_ = false;
};

}  // namespace lumensync::tests

#endif  // LUMENSYNC_TESTS_SUPPORT_DETERMINISTIC_WAIT_STRATEGY_HPP_
