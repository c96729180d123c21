// Repository: LumenSync
// Component: Ambilight Payload Decoder
// Purpose: JointSpace "ambilight/processed" JSON -> ZoneFrame.
// Copyright (c) 2026 LumenSync

#include "lumensync/tv/AmbilightDecoder.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <utility>
#include <vector>

namespace lumensync::tv {

using util::JsonValue;

namespace {

bool ReadChannel(const JsonValue& pixel, const char* name, uint8_t& out) {
  const JsonValue* v = pixel.Find(name);
  if (v == nullptr || !v->is_number()) return false;
  const double d = v->AsNumber();
  if (d < 0.0 || d > 255.0) return false;
  out = static_cast<uint8_t>(d);
  return true;
}

bool IsIndexKey(const std::string& key) {
  return !key.empty() && std::all_of(key.begin(), key.end(), [](unsigned char c) {
    return std::isdigit(c) != 0;
  });
}

// One side in ascending numeric key order.
bool ReadSide(const JsonValue& layer, const char* side, std::vector<core::Rgb8>& out,
              std::string& error) {
  const JsonValue* obj = layer.Find(side);
  if (obj == nullptr || !obj->is_object()) {
    error = std::string("layer1.") + side + " missing";
    return false;
  }
  std::vector<std::pair<long, core::Rgb8>> pixels;
  for (const auto& member : obj->AsObject()) {
    if (!IsIndexKey(member.first)) {
      error = std::string("layer1.") + side + ": non-numeric key '" + member.first + "'";
      return false;
    }
    core::Rgb8 color;
    if (!member.second.is_object() || !ReadChannel(member.second, "r", color.r) ||
        !ReadChannel(member.second, "g", color.g) || !ReadChannel(member.second, "b", color.b)) {
      error = std::string("layer1.") + side + "." + member.first + ": bad r/g/b";
      return false;
    }
    pixels.emplace_back(std::strtol(member.first.c_str(), nullptr, 10), color);
  }
  std::sort(pixels.begin(), pixels.end(),
            [](const auto& a, const auto& b) { return a.first < b.first; });
  out.clear();
  for (const auto& p : pixels) out.push_back(p.second);
  return true;
}

}  // namespace

AmbilightDecodeResult DecodeAmbilight(const JsonValue& document) {
  AmbilightDecodeResult result;
  const JsonValue* layer = document.Find("layer1");
  if (layer == nullptr || !layer->is_object()) {
    result.error = "layer1 missing";
    return result;
  }

  std::vector<core::Rgb8> left;
  std::vector<core::Rgb8> top;
  std::vector<core::Rgb8> right;
  if (!ReadSide(*layer, "left", left, result.error) ||
      !ReadSide(*layer, "top", top, result.error) ||
      !ReadSide(*layer, "right", right, result.error)) {
    return result;
  }

  auto& zones = result.frame.zones;
  zones.reserve(left.size() + top.size() + right.size());
  zones.insert(zones.end(), left.begin(), left.end());
  zones.insert(zones.end(), top.begin(), top.end());
  zones.insert(zones.end(), right.rbegin(), right.rend());
  result.ok = true;
  return result;
}

AmbilightDecodeResult DecodeAmbilight(const std::string& body) {
  try {
    return DecodeAmbilight(util::ParseJson(body));
  } catch (const util::JsonParseError& e) {
    AmbilightDecodeResult result;
    result.error = std::string("invalid JSON: ") + e.what();
    return result;
  }
}

std::optional<std::string> DecodePowerState(const std::string& body) {
  try {
    JsonValue doc = util::ParseJson(body);
    const JsonValue* state = doc.Find("powerstate");
    if (state == nullptr || !state->is_string()) return std::nullopt;
    return state->AsString();
  } catch (const util::JsonParseError&) {
    return std::nullopt;
  }
}

}  // namespace lumensync::tv
