// Repository: LumenSync
// Component: Color Types
// Purpose: Data structures shared by the sample source, mixer, smoothing
//          filter and session manager.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_CORE_COLOR_TYPES_HPP_
#define LUMENSYNC_CORE_COLOR_TYPES_HPP_

#include <cstdint>
#include <string>
#include <vector>

namespace lumensync::core {

// One zone sample as reported by the TV (8 bits per channel).
struct Rgb8 {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  bool operator==(const Rgb8& other) const {
    return r == other.r && g == other.g && b == other.b;
  }
  bool operator!=(const Rgb8& other) const { return !(*this == other); }
};

// Floating RGB on the 0..255 scale. Averaging and smoothing keep full
// precision; quantization happens once, in the wire encoder.
struct RgbF {
  double r = 0.0;
  double g = 0.0;
  double b = 0.0;
};

// =============================================================================
// ZoneFrame
// Ordered per-zone samples captured at one instant. Zone order:
//   left side bottom->top, top left->right, right side top->bottom.
// For a 4/9/4 TV:
//   [4]  [5]  [6]  [7]  [8]  [9]  [10] [11] [12]
//   [3]                                     [13]
//   [2]                                     [14]
//   [1]                                     [15]
//   [0]                                     [16]
// =============================================================================
struct ZoneFrame {
  std::vector<Rgb8> zones;
  int64_t captured_at_ms = 0;

  size_t size() const { return zones.size(); }
  bool empty() const { return zones.empty(); }
};

// Bridge-local channel id within the entertainment configuration.
using FixtureId = uint8_t;

struct Fixture {
  std::string name;
  FixtureId id = 0;
  std::vector<int> zones;
};

struct FixtureColor {
  FixtureId id = 0;
  RgbF color;
};

}  // namespace lumensync::core

#endif  // LUMENSYNC_CORE_COLOR_TYPES_HPP_
