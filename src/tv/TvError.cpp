// Repository: LumenSync
// Component: TV Device Interface
// Purpose: Error kind names for logs and status reports.
// Copyright (c) 2026 LumenSync

#include "lumensync/tv/ITvDevice.hpp"

namespace lumensync::tv {

const char* TvErrorKindToString(TvErrorKind kind) {
  switch (kind) {
    case TvErrorKind::kNone: return "NONE";
    case TvErrorKind::kTimeout: return "TIMEOUT";
    case TvErrorKind::kUnreachable: return "UNREACHABLE";
    case TvErrorKind::kAuthRejected: return "AUTH_REJECTED";
    case TvErrorKind::kMalformed: return "MALFORMED";
    case TvErrorKind::kHttpStatus: return "HTTP_STATUS";
  }
  return "UNKNOWN";
}

}  // namespace lumensync::tv
