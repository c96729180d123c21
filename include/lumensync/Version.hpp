// Repository: LumenSync
// Component: Version
// Purpose: Release and control API version strings.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_VERSION_HPP_
#define LUMENSYNC_VERSION_HPP_

namespace lumensync {

constexpr const char* kVersion = "0.4.0";
constexpr const char* kControlApiVersion = "1.0.0";

}  // namespace lumensync

#endif  // LUMENSYNC_VERSION_HPP_
