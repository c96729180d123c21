// Repository: LumenSync
// Component: Color Sample Source
// Purpose: Acquires one ZoneFrame per call from the TV adapter and
//          classifies the connectivity outcome.
// Copyright (c) 2026 LumenSync

#include "lumensync/core/ColorSampleSource.hpp"

#include <sstream>

namespace lumensync::core {

const char* SampleOutcomeToString(SampleOutcome outcome) {
  switch (outcome) {
    case SampleOutcome::kOk: return "ok";
    case SampleOutcome::kTransient: return "transient";
    case SampleOutcome::kUnreachable: return "unreachable";
  }
  return "unknown";
}

bool IsFrameBelowThreshold(const ZoneFrame& frame, int threshold) {
  for (const auto& c : frame.zones) {
    if (c.r > threshold || c.g > threshold || c.b > threshold) {
      return false;
    }
  }
  return true;
}

TvColorSampleSource::TvColorSampleSource(tv::ITvDevice& device,
                                         const time::ITimeSource& time_source,
                                         std::chrono::milliseconds sample_timeout,
                                         size_t expected_zone_count,
                                         int black_threshold)
    : device_(device),
      time_source_(time_source),
      sample_timeout_(sample_timeout),
      expected_zone_count_(expected_zone_count),
      black_threshold_(black_threshold) {}

SampleOutcome TvColorSampleSource::Classify(tv::TvErrorKind kind) {
  switch (kind) {
    case tv::TvErrorKind::kNone:
      return SampleOutcome::kOk;
    case tv::TvErrorKind::kUnreachable:
      return SampleOutcome::kUnreachable;
    case tv::TvErrorKind::kTimeout:
    case tv::TvErrorKind::kAuthRejected:
    case tv::TvErrorKind::kMalformed:
    case tv::TvErrorKind::kHttpStatus:
      return SampleOutcome::kTransient;
  }
  return SampleOutcome::kTransient;
}

SampleResult TvColorSampleSource::Sample() {
  SampleResult result;
  auto fetched = device_.FetchZoneFrame(sample_timeout_);
  if (!fetched.ok) {
    result.outcome = Classify(fetched.error.kind);
    result.detail = std::string(tv::TvErrorKindToString(fetched.error.kind));
    if (!fetched.error.detail.empty()) {
      result.detail += ": " + fetched.error.detail;
    }
    return result;
  }

  // A TV reporting a different zone layout than configured would index
  // past the frame in the mixer. Reject it here, as a transient condition:
  // some sets report a partial layer while the ambilight engine boots.
  if (fetched.frame.size() != expected_zone_count_) {
    std::ostringstream detail;
    detail << "zone count mismatch (got " << fetched.frame.size()
           << ", configured " << expected_zone_count_ << ")";
    result.outcome = SampleOutcome::kTransient;
    result.detail = detail.str();
    return result;
  }

  result.frame = std::move(fetched.frame);
  result.frame.captured_at_ms = time_source_.NowMs();
  result.outcome = SampleOutcome::kOk;
  return result;
}

bool TvColorSampleSource::IsBlackScreen(const ZoneFrame& frame) const {
  return IsFrameBelowThreshold(frame, black_threshold_);
}

std::optional<std::string> TvColorSampleSource::PowerState() {
  if (!device_.SupportsPowerState()) return std::nullopt;
  auto result = device_.QueryPowerState(sample_timeout_);
  if (!result.ok) return std::nullopt;
  return result.power_state;
}

}  // namespace lumensync::core
