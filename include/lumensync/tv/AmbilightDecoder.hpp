// Repository: LumenSync
// Component: Ambilight Payload Decoder
// Purpose: JointSpace "ambilight/processed" JSON -> ZoneFrame.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_TV_AMBILIGHT_DECODER_HPP_
#define LUMENSYNC_TV_AMBILIGHT_DECODER_HPP_

#include <optional>
#include <string>

#include "lumensync/core/ColorTypes.hpp"
#include "lumensync/util/MiniJson.hpp"

namespace lumensync::tv {

struct AmbilightDecodeResult {
  bool ok = false;
  core::ZoneFrame frame;
  std::string error;
};

// Payload:
//   {"layer1": {"left":  {"0": {"r":..,"g":..,"b":..}, "1": {...}, ...},
//               "top":   {...},
//               "right": {...}}}
//
// Zones are emitted left (key 0 upward), then top (key 0 rightward), then
// right in descending key order, so the index runs clockwise from the
// bottom-left corner. Keys are ordered numerically, not as sent. Any other
// layer or side (e.g. "bottom") is ignored.
AmbilightDecodeResult DecodeAmbilight(const std::string& body);
AmbilightDecodeResult DecodeAmbilight(const util::JsonValue& document);

// {"powerstate": "On"} -> "On". nullopt when the field is missing.
std::optional<std::string> DecodePowerState(const std::string& body);

}  // namespace lumensync::tv

#endif  // LUMENSYNC_TV_AMBILIGHT_DECODER_HPP_
