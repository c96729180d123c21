// Repository: LumenSync
// Component: Smoothing Filter
// Purpose: Per-fixture exponential moving average across frames.
// Copyright (c) 2026 LumenSync

#include "lumensync/core/SmoothingFilter.hpp"

#include <stdexcept>
#include <string>

namespace lumensync::core {

namespace {

double Blend(double previous, double input, double alpha) {
  return alpha * previous + (1.0 - alpha) * input;
}

}  // namespace

SmoothingFilter::SmoothingFilter(const std::vector<Fixture>& fixtures, double alpha)
    : alpha_(alpha) {
  if (!(alpha >= 0.0 && alpha <= kMaxAlpha)) {
    throw std::invalid_argument("SmoothingFilter: alpha " + std::to_string(alpha) +
                                " outside [0, 0.95]");
  }
  for (const auto& fixture : fixtures) {
    memory_.emplace(fixture.id, std::nullopt);
  }
}

FixtureColor SmoothingFilter::Apply(const FixtureColor& input) {
  auto it = memory_.find(input.id);
  if (it == memory_.end()) {
    throw std::logic_error("SmoothingFilter: unknown fixture id " +
                           std::to_string(static_cast<int>(input.id)));
  }

  if (!it->second.has_value()) {
    it->second = input.color;
    return input;
  }

  const RgbF& prev = *it->second;
  RgbF next{Blend(prev.r, input.color.r, alpha_),
            Blend(prev.g, input.color.g, alpha_),
            Blend(prev.b, input.color.b, alpha_)};
  it->second = next;
  return FixtureColor{input.id, next};
}

std::optional<RgbF> SmoothingFilter::Previous(FixtureId id) const {
  auto it = memory_.find(id);
  if (it == memory_.end()) return std::nullopt;
  return it->second;
}

}  // namespace lumensync::core
