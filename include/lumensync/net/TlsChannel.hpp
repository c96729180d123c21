// Repository: LumenSync
// Component: TLS / DTLS Channel
// Purpose: mbedtls session layered over a connected Socket. Stream mode
//          carries HTTPS to the TV and bridge; datagram mode carries the
//          DTLS-PSK entertainment stream.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_NET_TLS_CHANNEL_HPP_
#define LUMENSYNC_NET_TLS_CHANNEL_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "lumensync/net/NetStatus.hpp"
#include "lumensync/net/Socket.hpp"

namespace lumensync::net {

struct PskParams {
  std::string identity;
  std::vector<uint8_t> key;
};

// Peer certificates are not verified: both the TV and the bridge present
// self-signed certificates, and the bridge stream authenticates by PSK.
class TlsChannel {
 public:
  TlsChannel();
  ~TlsChannel();

  TlsChannel(const TlsChannel&) = delete;
  TlsChannel& operator=(const TlsChannel&) = delete;

  // Takes ownership of `socket`. A kUdp socket selects DTLS. With `psk`
  // set, the handshake offers TLS_PSK_WITH_AES_128_GCM_SHA256 only.
  NetStatus Handshake(Socket socket, const std::string& server_name,
                      const PskParams* psk, std::chrono::milliseconds timeout);

  // Stream: writes every byte. Datagram: one record.
  NetStatus Write(const uint8_t* data, size_t len, std::chrono::milliseconds timeout);

  // ok() with received == 0 means the peer closed the session.
  NetStatus Read(uint8_t* data, size_t len, size_t& received, std::chrono::milliseconds timeout);

  // Sends close_notify (best effort) and releases the socket. Idempotent.
  void Close();

  bool is_open() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace lumensync::net

#endif  // LUMENSYNC_NET_TLS_CHANNEL_HPP_
