// Repository: LumenSync
// Component: Light Bridge Interface
// Purpose: Error kind names for logs and status reports.
// Copyright (c) 2026 LumenSync

#include "lumensync/bridge/ILightBridge.hpp"

namespace lumensync::bridge {

const char* BridgeErrorKindToString(BridgeErrorKind kind) {
  switch (kind) {
    case BridgeErrorKind::kNone: return "NONE";
    case BridgeErrorKind::kAuthRejected: return "AUTH_REJECTED";
    case BridgeErrorKind::kUnreachable: return "UNREACHABLE";
    case BridgeErrorKind::kNegotiationFailed: return "NEGOTIATION_FAILED";
    case BridgeErrorKind::kTimeout: return "TIMEOUT";
    case BridgeErrorKind::kTransportReset: return "TRANSPORT_RESET";
    case BridgeErrorKind::kClosed: return "CLOSED";
  }
  return "UNKNOWN";
}

}  // namespace lumensync::bridge
