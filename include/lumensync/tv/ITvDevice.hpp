// Repository: LumenSync
// Component: TV Device Interface
// Purpose: Capability interface over the JointSpace API generations.
//          The sync loop and everything downstream are version-agnostic.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_TV_ITV_DEVICE_HPP_
#define LUMENSYNC_TV_ITV_DEVICE_HPP_

#include <chrono>
#include <string>

#include "lumensync/core/ColorTypes.hpp"

namespace lumensync::tv {

enum class TvErrorKind {
  kNone = 0,
  kTimeout,       // no answer within the per-call bound
  kUnreachable,   // connection refused, no route, name resolution failed
  kAuthRejected,  // 401/403 from a v6 TV
  kMalformed,     // answer did not decode as an ambilight payload
  kHttpStatus,    // any other non-2xx status
};

const char* TvErrorKindToString(TvErrorKind kind);

struct TvError {
  TvErrorKind kind = TvErrorKind::kNone;
  int http_status = 0;
  std::string detail;
};

struct TvFrameResult {
  bool ok;
  core::ZoneFrame frame;
  TvError error;

  static TvFrameResult Success(core::ZoneFrame f) {
    return {true, std::move(f), {}};
  }
  static TvFrameResult Failure(TvErrorKind kind, std::string detail, int http_status = 0) {
    return {false, {}, TvError{kind, http_status, std::move(detail)}};
  }
};

struct TvPowerStateResult {
  bool ok;
  std::string power_state;  // "On", "Standby", "StandbyKeep", ...
  TvError error;
};

// ITvDevice is the TV adapter consumed by the color sample source.
// Implementations are already configured with host and credentials.
// Every call is bounded by its timeout argument and never retries.
class ITvDevice {
 public:
  virtual ~ITvDevice() = default;

  // Checks that the configured credentials are accepted. Variants without
  // authentication return success without I/O.
  virtual TvError Authenticate(std::chrono::milliseconds timeout) = 0;

  virtual TvFrameResult FetchZoneFrame(std::chrono::milliseconds timeout) = 0;

  virtual bool SupportsPowerState() const = 0;
  virtual TvPowerStateResult QueryPowerState(std::chrono::milliseconds timeout) = 0;

  // Human-readable identity for logs ("JointSpace v6 @ 192.168.1.20:1926").
  virtual std::string Describe() const = 0;
};

}  // namespace lumensync::tv

#endif  // LUMENSYNC_TV_ITV_DEVICE_HPP_
