// Repository: LumenSync
// Component: POSIX Socket
// Purpose: Non-blocking TCP / UDP client socket with poll()-bounded
//          connect, send and receive.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_NET_SOCKET_HPP_
#define LUMENSYNC_NET_SOCKET_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

#include "lumensync/net/NetStatus.hpp"

namespace lumensync::net {

// Owns one file descriptor. The fd is always O_NONBLOCK; every blocking
// operation is a poll() bounded by the caller's timeout. Move-only.
class Socket {
 public:
  enum class Type { kTcp, kUdp };

  Socket() = default;
  ~Socket();

  Socket(Socket&& other) noexcept;
  Socket& operator=(Socket&& other) noexcept;
  Socket(const Socket&) = delete;
  Socket& operator=(const Socket&) = delete;

  // Resolves `host` and connects to the first address that answers. For
  // UDP "connect" only fixes the peer; unreachability shows up on the
  // first receive as ECONNREFUSED.
  NetStatus Connect(const std::string& host, uint16_t port, Type type,
                    std::chrono::milliseconds timeout);

  // TCP: writes all of [data, data+len). UDP: one datagram.
  NetStatus SendAll(const uint8_t* data, size_t len, std::chrono::milliseconds timeout);

  // Waits for at most `timeout`, then reads up to `len` bytes into `data`.
  // ok() with received == 0 means orderly TCP shutdown by the peer.
  NetStatus Receive(uint8_t* data, size_t len, size_t& received,
                    std::chrono::milliseconds timeout);

  void Close();

  bool is_open() const { return fd_ >= 0; }
  int fd() const { return fd_; }
  Type type() const { return type_; }

 private:
  int fd_ = -1;
  Type type_ = Type::kTcp;
};

// errno -> error kind for socket calls.
NetErrorKind ClassifyErrno(int err);

}  // namespace lumensync::net

#endif  // LUMENSYNC_NET_SOCKET_HPP_
