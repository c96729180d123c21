// Repository: LumenSync
// Component: Light Bridge Interface
// Purpose: Low-latency streaming primitive (open / send frame / close)
//          consumed by the streaming session manager.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_BRIDGE_ILIGHT_BRIDGE_HPP_
#define LUMENSYNC_BRIDGE_ILIGHT_BRIDGE_HPP_

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "lumensync/core/ColorTypes.hpp"

namespace lumensync::bridge {

// Where to stream. Opaque to the core: supplied by configuration.
struct BridgeEndpoint {
  std::string host;
  uint16_t rest_port = 443;
  uint16_t stream_port = 2100;
  // Entertainment configuration (area) UUID, 36 characters.
  std::string entertainment_config_id;
};

struct BridgeCredentials {
  std::string application_key;  // a.k.a. username; also the PSK identity
  std::string client_key_hex;   // 32 hex chars, decoded into the PSK
};

enum class BridgeErrorKind {
  kNone = 0,
  kAuthRejected,       // bridge refused the application key / PSK
  kUnreachable,        // no route, refused, name resolution failed
  kNegotiationFailed,  // DTLS handshake or activation failed otherwise
  kTimeout,            // bounded wait expired
  kTransportReset,     // peer reset / alert during streaming
  kClosed,             // operation on a stream that is not open
};

const char* BridgeErrorKindToString(BridgeErrorKind kind);

struct BridgeStatus {
  BridgeErrorKind kind = BridgeErrorKind::kNone;
  std::string detail;

  bool ok() const { return kind == BridgeErrorKind::kNone; }

  static BridgeStatus Ok() { return {}; }
  static BridgeStatus Error(BridgeErrorKind k, std::string d) {
    return BridgeStatus{k, std::move(d)};
  }
};

// ILightBridge owns at most one stream at a time. It is driven from a
// single thread (the session manager serializes access).
class ILightBridge {
 public:
  virtual ~ILightBridge() = default;

  virtual BridgeStatus Open(const BridgeEndpoint& endpoint,
                            const BridgeCredentials& credentials,
                            std::chrono::milliseconds timeout) = 0;

  // Transmits one frame. Never blocks past `timeout`.
  virtual BridgeStatus SendFrame(const std::vector<core::FixtureColor>& colors,
                                 std::chrono::milliseconds timeout) = 0;

  // Idempotent.
  virtual void Close() = 0;

  virtual std::string Describe() const = 0;
};

}  // namespace lumensync::bridge

#endif  // LUMENSYNC_BRIDGE_ILIGHT_BRIDGE_HPP_
