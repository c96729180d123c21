// Repository: LumenSync
// Component: HueStream Encoder
// Purpose: Frame layout of the Hue Entertainment streaming protocol, v2.
// Copyright (c) 2026 LumenSync

#include "lumensync/bridge/HueStreamCodec.hpp"

#include <cmath>
#include <cstring>
#include <stdexcept>

namespace lumensync::bridge {

namespace {

constexpr char kProtocolName[] = "HueStream";
constexpr uint8_t kVersionMajor = 0x02;
constexpr uint8_t kVersionMinor = 0x00;
constexpr uint8_t kColorSpaceRgb = 0x00;

void PutU16(std::vector<uint8_t>& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

int HexNibble(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  if (c >= 'A' && c <= 'F') return c - 'A' + 10;
  return -1;
}

}  // namespace

HueStreamEncoder::HueStreamEncoder(const std::string& entertainment_config_id)
    : config_id_(entertainment_config_id) {
  if (config_id_.size() != kConfigIdLength) {
    throw std::invalid_argument("HueStreamEncoder: entertainment configuration id must be " +
                                std::to_string(kConfigIdLength) + " characters, got " +
                                std::to_string(config_id_.size()));
  }
}

uint16_t HueStreamEncoder::ScaleChannel(double value) {
  if (!(value > 0.0)) return 0;  // also catches NaN
  if (value >= 255.0) return 0xFFFF;
  return static_cast<uint16_t>(std::lround(value) * 257);
}

std::vector<uint8_t> HueStreamEncoder::Encode(const std::vector<core::FixtureColor>& colors) {
  if (colors.size() > kMaxChannels) {
    throw std::invalid_argument("HueStreamEncoder: " + std::to_string(colors.size()) +
                                " channels exceed the limit of " + std::to_string(kMaxChannels));
  }

  std::vector<uint8_t> out;
  out.reserve(kHeaderSize + kChannelSize * colors.size());
  out.insert(out.end(), kProtocolName, kProtocolName + std::strlen(kProtocolName));
  out.push_back(kVersionMajor);
  out.push_back(kVersionMinor);
  out.push_back(sequence_++);
  out.push_back(0x00);
  out.push_back(0x00);
  out.push_back(kColorSpaceRgb);
  out.push_back(0x00);
  out.insert(out.end(), config_id_.begin(), config_id_.end());

  for (const auto& fc : colors) {
    out.push_back(fc.id);
    PutU16(out, ScaleChannel(fc.color.r));
    PutU16(out, ScaleChannel(fc.color.g));
    PutU16(out, ScaleChannel(fc.color.b));
  }
  return out;
}

bool DecodeHex(const std::string& hex, std::vector<uint8_t>& out) {
  if (hex.size() % 2 != 0) return false;
  out.clear();
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    int hi = HexNibble(hex[i]);
    int lo = HexNibble(hex[i + 1]);
    if (hi < 0 || lo < 0) return false;
    out.push_back(static_cast<uint8_t>((hi << 4) | lo));
  }
  return true;
}

}  // namespace lumensync::bridge
