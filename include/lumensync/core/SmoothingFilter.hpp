// Repository: LumenSync
// Component: Smoothing Filter
// Purpose: Per-fixture exponential moving average across frames.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_CORE_SMOOTHING_FILTER_HPP_
#define LUMENSYNC_CORE_SMOOTHING_FILTER_HPP_

#include <map>
#include <optional>
#include <vector>

#include "lumensync/core/ColorTypes.hpp"

namespace lumensync::core {

// output = alpha * previous + (1 - alpha) * input, per channel.
//
// alpha is fixed for the lifetime of the filter, in [0, kMaxAlpha].
// alpha == 0 passes input through unchanged. The first Apply() for a
// fixture seeds `previous` with the input, so there is no ramp from black.
//
// The memory set is fixed at construction to the configured fixtures.
// Apply() with an id outside that set throws std::logic_error.
class SmoothingFilter {
 public:
  static constexpr double kMaxAlpha = 0.95;

  // Throws std::invalid_argument if alpha is outside [0, kMaxAlpha].
  SmoothingFilter(const std::vector<Fixture>& fixtures, double alpha);

  FixtureColor Apply(const FixtureColor& input);

  double alpha() const { return alpha_; }
  size_t size() const { return memory_.size(); }

  // Last emitted value for `id`; nullopt before the first Apply().
  std::optional<RgbF> Previous(FixtureId id) const;

 private:
  double alpha_;
  std::map<FixtureId, std::optional<RgbF>> memory_;
};

}  // namespace lumensync::core

#endif  // LUMENSYNC_CORE_SMOOTHING_FILTER_HPP_
