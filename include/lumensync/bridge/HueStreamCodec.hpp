// Repository: LumenSync
// Component: HueStream Encoder
// Purpose: Frame layout of the Hue Entertainment streaming protocol, v2.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_BRIDGE_HUE_STREAM_CODEC_HPP_
#define LUMENSYNC_BRIDGE_HUE_STREAM_CODEC_HPP_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "lumensync/core/ColorTypes.hpp"

namespace lumensync::bridge {

// Datagram layout (all multi-byte fields big-endian):
//
//   off  len  field
//   0    9    "HueStream"
//   9    2    version 0x02 0x00
//   11   1    sequence id (wraps, ignored by the bridge)
//   12   2    reserved 0x00 0x00
//   14   1    color space, 0x00 = RGB
//   15   1    reserved 0x00
//   16   36   entertainment configuration id (ASCII UUID)
//   52   7*n  per channel: id (1), R (2), G (2), B (2)
class HueStreamEncoder {
 public:
  static constexpr size_t kHeaderSize = 52;
  static constexpr size_t kChannelSize = 7;
  static constexpr size_t kMaxChannels = 20;
  static constexpr size_t kConfigIdLength = 36;

  // Throws std::invalid_argument unless `entertainment_config_id` is 36
  // characters.
  explicit HueStreamEncoder(const std::string& entertainment_config_id);

  // Advances the sequence id. Throws std::invalid_argument for more than
  // kMaxChannels entries.
  std::vector<uint8_t> Encode(const std::vector<core::FixtureColor>& colors);

  uint8_t sequence() const { return sequence_; }

  // 0..255 floating channel -> 16-bit wire value (rounded, then x257, so
  // 255 maps to 0xFFFF). Out-of-range input is clamped.
  static uint16_t ScaleChannel(double value);

 private:
  std::string config_id_;
  uint8_t sequence_ = 0;
};

// Even-length hex string -> bytes. False on any non-hex character.
bool DecodeHex(const std::string& hex, std::vector<uint8_t>& out);

}  // namespace lumensync::bridge

#endif  // LUMENSYNC_BRIDGE_HUE_STREAM_CODEC_HPP_
