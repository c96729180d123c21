// Repository: LumenSync
// Component: Fake TV device (test only)
// Purpose: Scripted ITvDevice for the color sample source.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_TESTS_FIXTURES_FAKE_TV_DEVICE_HPP_
#define LUMENSYNC_TESTS_FIXTURES_FAKE_TV_DEVICE_HPP_

#include <deque>
#include <string>

#include "lumensync/tv/ITvDevice.hpp"

namespace lumensync::tests::fixtures {

class FakeTvDevice : public tv::ITvDevice {
 public:
  void QueueFrame(tv::TvFrameResult result) { frames_.push_back(std::move(result)); }

  void SetPowerState(bool supported, tv::TvPowerStateResult result) {
    supports_power_state_ = supported;
    power_state_ = std::move(result);
  }

  tv::TvError Authenticate(std::chrono::milliseconds /*timeout*/) override { return {}; }

  tv::TvFrameResult FetchZoneFrame(std::chrono::milliseconds timeout) override {
    ++fetch_calls_;
    last_timeout_ = timeout;
    if (frames_.empty()) {
      return tv::TvFrameResult::Failure(tv::TvErrorKind::kUnreachable, "no frame queued");
    }
    tv::TvFrameResult next = frames_.front();
    frames_.pop_front();
    return next;
  }

  bool SupportsPowerState() const override { return supports_power_state_; }

  tv::TvPowerStateResult QueryPowerState(std::chrono::milliseconds /*timeout*/) override {
    ++power_calls_;
    return power_state_;
  }

  std::string Describe() const override { return "fake-tv"; }

  int fetch_calls() const { return fetch_calls_; }
  int power_calls() const { return power_calls_; }
  std::chrono::milliseconds last_timeout() const { return last_timeout_; }

 private:
  std::deque<tv::TvFrameResult> frames_;
  bool supports_power_state_ = false;
  tv::TvPowerStateResult power_state_{false, "", {}};
  int fetch_calls_ = 0;
  int power_calls_ = 0;
  std::chrono::milliseconds last_timeout_{0};
};

}  // namespace lumensync::tests::fixtures

#endif  // LUMENSYNC_TESTS_FIXTURES_FAKE_TV_DEVICE_HPP_
