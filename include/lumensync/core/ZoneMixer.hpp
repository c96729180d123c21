// Repository: LumenSync
// Component: Zone Mixer
// Purpose: Averages the zones each fixture draws from into one color.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_CORE_ZONE_MIXER_HPP_
#define LUMENSYNC_CORE_ZONE_MIXER_HPP_

#include <vector>

#include "lumensync/core/ColorTypes.hpp"

namespace lumensync::core {

// Stateless. Zone lists are validated at config load (non-empty, in range
// of the configured zone count), so Mix() does no bounds recovery: a frame
// shorter than the configured zone count must be rejected by the sample
// source before it reaches here.
class ZoneMixer {
 public:
  // One entry per fixture, in configured order. Each channel is the
  // arithmetic mean over the fixture's zones.
  static std::vector<FixtureColor> Mix(const ZoneFrame& frame,
                                       const std::vector<Fixture>& fixtures);

  static RgbF Average(const ZoneFrame& frame, const std::vector<int>& zones);
};

}  // namespace lumensync::core

#endif  // LUMENSYNC_CORE_ZONE_MIXER_HPP_
