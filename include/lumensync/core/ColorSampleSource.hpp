// Repository: LumenSync
// Component: Color Sample Source
// Purpose: Acquires one ZoneFrame per call from the TV adapter and
//          classifies the connectivity outcome.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_CORE_COLOR_SAMPLE_SOURCE_HPP_
#define LUMENSYNC_CORE_COLOR_SAMPLE_SOURCE_HPP_

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "lumensync/core/ColorTypes.hpp"
#include "lumensync/time/ITimeSource.hpp"
#include "lumensync/tv/ITvDevice.hpp"

namespace lumensync::core {

enum class SampleOutcome {
  kOk = 0,
  kTransient,    // network hiccup, TV still booting, malformed payload
  kUnreachable,  // TV confirmed off or not on the network
};

const char* SampleOutcomeToString(SampleOutcome outcome);

struct SampleResult {
  ZoneFrame frame;
  SampleOutcome outcome = SampleOutcome::kOk;
  std::string detail;

  bool ok() const { return outcome == SampleOutcome::kOk; }
};

// IColorSampleSource is what the sync loop pulls from. No retries are done
// behind this interface: retry policy belongs to the sync loop.
class IColorSampleSource {
 public:
  virtual ~IColorSampleSource() = default;

  virtual SampleResult Sample() = 0;

  // True when every channel of every zone is at or below the black
  // threshold. An empty frame is black.
  virtual bool IsBlackScreen(const ZoneFrame& frame) const = 0;

  // Power state if the device can report one; nullopt otherwise or on error.
  virtual std::optional<std::string> PowerState() = 0;
};

// Shared black-screen rule, also used by fakes in tests.
bool IsFrameBelowThreshold(const ZoneFrame& frame, int threshold);

// Production source: wraps an ITvDevice with a fixed per-call timeout and
// an expected zone count.
class TvColorSampleSource : public IColorSampleSource {
 public:
  static constexpr int kDefaultBlackThreshold = 15;

  TvColorSampleSource(tv::ITvDevice& device,
                      const time::ITimeSource& time_source,
                      std::chrono::milliseconds sample_timeout,
                      size_t expected_zone_count,
                      int black_threshold = kDefaultBlackThreshold);

  SampleResult Sample() override;
  bool IsBlackScreen(const ZoneFrame& frame) const override;
  std::optional<std::string> PowerState() override;

  static SampleOutcome Classify(tv::TvErrorKind kind);

 private:
  tv::ITvDevice& device_;
  const time::ITimeSource& time_source_;
  std::chrono::milliseconds sample_timeout_;
  size_t expected_zone_count_;
  int black_threshold_;
};

}  // namespace lumensync::core

#endif  // LUMENSYNC_CORE_COLOR_SAMPLE_SOURCE_HPP_
