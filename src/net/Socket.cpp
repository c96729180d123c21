// Repository: LumenSync
// Component: POSIX Socket
// Purpose: Non-blocking TCP / UDP client socket with poll()-bounded
//          connect, send and receive.
// Copyright (c) 2026 LumenSync

#include "lumensync/net/Socket.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace lumensync::net {

const char* NetErrorKindToString(NetErrorKind kind) {
  switch (kind) {
    case NetErrorKind::kNone: return "NONE";
    case NetErrorKind::kTimeout: return "TIMEOUT";
    case NetErrorKind::kUnreachable: return "UNREACHABLE";
    case NetErrorKind::kReset: return "RESET";
    case NetErrorKind::kClosed: return "CLOSED";
    case NetErrorKind::kTlsAlert: return "TLS_ALERT";
    case NetErrorKind::kTls: return "TLS";
    case NetErrorKind::kProtocol: return "PROTOCOL";
  }
  return "UNKNOWN";
}

NetErrorKind ClassifyErrno(int err) {
  switch (err) {
    case ETIMEDOUT:
    case EAGAIN:
      return NetErrorKind::kTimeout;
    case ECONNREFUSED:
    case EHOSTUNREACH:
    case ENETUNREACH:
    case EHOSTDOWN:
    case ENETDOWN:
    case EADDRNOTAVAIL:
      return NetErrorKind::kUnreachable;
    case ECONNRESET:
    case EPIPE:
    case ECONNABORTED:
    case ENOTCONN:
      return NetErrorKind::kReset;
    default:
      return NetErrorKind::kReset;
  }
}

namespace {

using Clock = std::chrono::steady_clock;

NetStatus ErrnoStatus(const char* what, int err) {
  return NetStatus::Error(ClassifyErrno(err), std::string(what) + ": " + std::strerror(err));
}

int RemainingMs(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return left.count() > 0 ? static_cast<int>(left.count()) : 0;
}

// 1 ready, 0 timeout, -1 error (errno set).
int PollFor(int fd, short events, Clock::time_point deadline) {
  while (true) {
    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = events;
    pfd.revents = 0;
    int rc = ::poll(&pfd, 1, RemainingMs(deadline));
    if (rc < 0 && errno == EINTR) continue;
    if (rc <= 0) return rc;
    return 1;
  }
}

}  // namespace

Socket::~Socket() {
  Close();
}

Socket::Socket(Socket&& other) noexcept : fd_(other.fd_), type_(other.type_) {
  other.fd_ = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
  if (this != &other) {
    Close();
    fd_ = other.fd_;
    type_ = other.type_;
    other.fd_ = -1;
  }
  return *this;
}

void Socket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

NetStatus Socket::Connect(const std::string& host, uint16_t port, Type type,
                          std::chrono::milliseconds timeout) {
  Close();
  type_ = type;
  const auto deadline = Clock::now() + timeout;

  struct addrinfo hints;
  std::memset(&hints, 0, sizeof(hints));
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = (type == Type::kTcp) ? SOCK_STREAM : SOCK_DGRAM;
  struct addrinfo* results = nullptr;
  const std::string service = std::to_string(port);
  int gai = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
  if (gai != 0) {
    return NetStatus::Error(NetErrorKind::kUnreachable,
                            "resolve " + host + ": " + ::gai_strerror(gai));
  }

  NetStatus last = NetStatus::Error(NetErrorKind::kUnreachable, "no usable address for " + host);
  for (struct addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
    int fd = ::socket(ai->ai_family, ai->ai_socktype | SOCK_CLOEXEC, ai->ai_protocol);
    if (fd < 0) {
      last = ErrnoStatus("socket", errno);
      continue;
    }
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
      last = ErrnoStatus("fcntl", errno);
      ::close(fd);
      continue;
    }

    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) == 0) {
      fd_ = fd;
      break;
    }
    if (errno != EINPROGRESS) {
      last = ErrnoStatus("connect", errno);
      ::close(fd);
      continue;
    }

    int ready = PollFor(fd, POLLOUT, deadline);
    if (ready == 0) {
      last = NetStatus::Error(NetErrorKind::kTimeout,
                              "connect " + host + ":" + service + " timed out");
      ::close(fd);
      break;
    }
    if (ready < 0) {
      last = ErrnoStatus("poll", errno);
      ::close(fd);
      continue;
    }
    int so_error = 0;
    socklen_t so_len = sizeof(so_error);
    if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &so_len) < 0) {
      so_error = errno;
    }
    if (so_error != 0) {
      last = ErrnoStatus("connect", so_error);
      ::close(fd);
      continue;
    }
    fd_ = fd;
    break;
  }
  ::freeaddrinfo(results);

  return is_open() ? NetStatus::Ok() : last;
}

NetStatus Socket::SendAll(const uint8_t* data, size_t len, std::chrono::milliseconds timeout) {
  if (!is_open()) return NetStatus::Error(NetErrorKind::kClosed, "socket not open");
  const auto deadline = Clock::now() + timeout;
  size_t sent = 0;
  while (sent < len) {
    ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
    if (n >= 0) {
      sent += static_cast<size_t>(n);
      if (type_ == Type::kUdp) break;
      continue;
    }
    if (errno == EINTR) continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      return ErrnoStatus("send", errno);
    }
    int ready = PollFor(fd_, POLLOUT, deadline);
    if (ready == 0) return NetStatus::Error(NetErrorKind::kTimeout, "send timed out");
    if (ready < 0) return ErrnoStatus("poll", errno);
  }
  return NetStatus::Ok();
}

NetStatus Socket::Receive(uint8_t* data, size_t len, size_t& received,
                          std::chrono::milliseconds timeout) {
  received = 0;
  if (!is_open()) return NetStatus::Error(NetErrorKind::kClosed, "socket not open");
  const auto deadline = Clock::now() + timeout;
  while (true) {
    ssize_t n = ::recv(fd_, data, len, 0);
    if (n >= 0) {
      received = static_cast<size_t>(n);
      return NetStatus::Ok();
    }
    if (errno == EINTR) continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      return ErrnoStatus("recv", errno);
    }
    int ready = PollFor(fd_, POLLIN, deadline);
    if (ready == 0) return NetStatus::Error(NetErrorKind::kTimeout, "receive timed out");
    if (ready < 0) return ErrnoStatus("poll", errno);
  }
}

}  // namespace lumensync::net
