// Repository: LumenSync
// Component: Zone Mixer
// Purpose: Averages the zones each fixture draws from into one color.
// Copyright (c) 2026 LumenSync

#include "lumensync/core/ZoneMixer.hpp"

namespace lumensync::core {

std::vector<FixtureColor> ZoneMixer::Mix(const ZoneFrame& frame,
                                         const std::vector<Fixture>& fixtures) {
  std::vector<FixtureColor> out;
  out.reserve(fixtures.size());
  for (const auto& fixture : fixtures) {
    FixtureColor fc;
    fc.id = fixture.id;
    fc.color = Average(frame, fixture.zones);
    out.push_back(fc);
  }
  return out;
}

RgbF ZoneMixer::Average(const ZoneFrame& frame, const std::vector<int>& zones) {
  RgbF sum;
  if (zones.empty()) return sum;

  for (int zone : zones) {
    const Rgb8& c = frame.zones[static_cast<size_t>(zone)];
    sum.r += c.r;
    sum.g += c.g;
    sum.b += c.b;
  }
  const double n = static_cast<double>(zones.size());
  return RgbF{sum.r / n, sum.g / n, sum.b / n};
}

}  // namespace lumensync::core
