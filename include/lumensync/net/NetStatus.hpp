// Repository: LumenSync
// Component: Network Status
// Purpose: Result record shared by the socket, TLS and HTTP layers.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_NET_NET_STATUS_HPP_
#define LUMENSYNC_NET_NET_STATUS_HPP_

#include <string>
#include <utility>

namespace lumensync::net {

enum class NetErrorKind {
  kNone = 0,
  kTimeout,      // deadline passed before the operation completed
  kUnreachable,  // name resolution failed, connection refused, no route
  kReset,        // peer reset or closed mid-exchange
  kClosed,       // operation on a closed socket / channel
  kTlsAlert,     // peer aborted the (D)TLS handshake with a fatal alert
  kTls,          // any other (D)TLS failure
  kProtocol,     // malformed HTTP
};

const char* NetErrorKindToString(NetErrorKind kind);

struct NetStatus {
  NetErrorKind kind = NetErrorKind::kNone;
  std::string detail;

  bool ok() const { return kind == NetErrorKind::kNone; }

  static NetStatus Ok() { return {}; }
  static NetStatus Error(NetErrorKind k, std::string d) { return NetStatus{k, std::move(d)}; }
};

}  // namespace lumensync::net

#endif  // LUMENSYNC_NET_NET_STATUS_HPP_
