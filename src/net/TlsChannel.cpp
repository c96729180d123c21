// Repository: LumenSync
// Component: TLS / DTLS Channel
// Purpose: mbedtls session layered over a connected Socket.
// Copyright (c) 2026 LumenSync

#include "lumensync/net/TlsChannel.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>

#include <poll.h>
#include <sys/socket.h>

#include <mbedtls/ctr_drbg.h>
#include <mbedtls/entropy.h>
#include <mbedtls/error.h>
#include <mbedtls/net_sockets.h>
#include <mbedtls/ssl.h>
#include <mbedtls/ssl_ciphersuites.h>
#include <mbedtls/timing.h>
#include <mbedtls/version.h>

#if MBEDTLS_VERSION_MAJOR >= 3
#include <psa/crypto.h>
#endif

namespace lumensync::net {

namespace {

using Clock = std::chrono::steady_clock;

constexpr char kDrbgPersonalization[] = "lumensync";

// DTLS handshake retransmission window (RFC 6347 style doubling).
constexpr uint32_t kDtlsHandshakeMinMs = 400;
constexpr uint32_t kDtlsHandshakeMaxMs = 3200;

const int kPskCiphersuites[] = {MBEDTLS_TLS_PSK_WITH_AES_128_GCM_SHA256, 0};

std::string MbedtlsErrorString(int ret) {
  char text[128];
  mbedtls_strerror(ret, text, sizeof(text));
  char line[160];
  std::snprintf(line, sizeof(line), "%s (-0x%04x)", text, static_cast<unsigned>(-ret));
  return line;
}

}  // namespace

struct TlsChannel::Impl {
  Socket socket;
  bool datagram = false;
  bool open = false;
  bool contexts_ready = false;

  mbedtls_ssl_context ssl;
  mbedtls_ssl_config conf;
  mbedtls_ctr_drbg_context ctr_drbg;
  mbedtls_entropy_context entropy;
  mbedtls_timing_delay_context timer;

  // Bound for the bio callbacks of the operation in progress.
  Clock::time_point deadline;
  // Socket failure observed inside a bio callback, reported over the
  // generic mbedtls error code.
  NetStatus io_error;

  Impl() { InitContexts(); }
  ~Impl() { FreeContexts(); }

  void InitContexts() {
    mbedtls_ssl_init(&ssl);
    mbedtls_ssl_config_init(&conf);
    mbedtls_ctr_drbg_init(&ctr_drbg);
    mbedtls_entropy_init(&entropy);
    contexts_ready = true;
  }

  void FreeContexts() {
    if (!contexts_ready) return;
    mbedtls_ssl_free(&ssl);
    mbedtls_ssl_config_free(&conf);
    mbedtls_ctr_drbg_free(&ctr_drbg);
    mbedtls_entropy_free(&entropy);
    contexts_ready = false;
  }

  void Reset() {
    FreeContexts();
    InitContexts();
    socket.Close();
    open = false;
    io_error = NetStatus::Ok();
  }

  int RemainingMs() const {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    return left.count() > 0 ? static_cast<int>(left.count()) : 0;
  }

  static int BioSend(void* ctx, const unsigned char* buf, size_t len) {
    auto* self = static_cast<Impl*>(ctx);
    int fd = self->socket.fd();
    while (true) {
      ssize_t n = ::send(fd, buf, len, MSG_NOSIGNAL);
      if (n >= 0) return static_cast<int>(n);
      if (errno == EINTR) continue;
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        self->io_error = NetStatus::Error(ClassifyErrno(errno),
                                          std::string("send: ") + std::strerror(errno));
        return MBEDTLS_ERR_NET_SEND_FAILED;
      }
      struct pollfd pfd = {fd, POLLOUT, 0};
      int rc = ::poll(&pfd, 1, self->RemainingMs());
      if (rc == 0) {
        self->io_error = NetStatus::Error(NetErrorKind::kTimeout, "send timed out");
        return MBEDTLS_ERR_SSL_TIMEOUT;
      }
      if (rc < 0 && errno != EINTR) {
        self->io_error = NetStatus::Error(ClassifyErrno(errno), "poll failed");
        return MBEDTLS_ERR_NET_SEND_FAILED;
      }
    }
  }

  // `timeout_ms` comes from mbedtls (DTLS retransmission timer); 0 means
  // "no limit of its own", in which case only the operation deadline applies.
  static int BioRecvTimeout(void* ctx, unsigned char* buf, size_t len, uint32_t timeout_ms) {
    auto* self = static_cast<Impl*>(ctx);
    int fd = self->socket.fd();
    int wait_ms = self->RemainingMs();
    const bool retransmit_bound = timeout_ms > 0 && static_cast<int>(timeout_ms) < wait_ms;
    if (retransmit_bound) wait_ms = static_cast<int>(timeout_ms);

    while (true) {
      ssize_t n = ::recv(fd, buf, len, 0);
      if (n >= 0) return static_cast<int>(n);
      if (errno == EINTR) continue;
      if (errno != EAGAIN && errno != EWOULDBLOCK) {
        self->io_error = NetStatus::Error(ClassifyErrno(errno),
                                          std::string("recv: ") + std::strerror(errno));
        return errno == ECONNRESET ? MBEDTLS_ERR_NET_CONN_RESET : MBEDTLS_ERR_NET_RECV_FAILED;
      }
      struct pollfd pfd = {fd, POLLIN, 0};
      int rc = ::poll(&pfd, 1, wait_ms);
      if (rc == 0) {
        if (!retransmit_bound) {
          self->io_error = NetStatus::Error(NetErrorKind::kTimeout, "receive timed out");
        }
        return MBEDTLS_ERR_SSL_TIMEOUT;
      }
      if (rc < 0 && errno != EINTR) {
        self->io_error = NetStatus::Error(ClassifyErrno(errno), "poll failed");
        return MBEDTLS_ERR_NET_RECV_FAILED;
      }
    }
  }

  NetStatus MapError(int ret, const char* op) const {
    if (!io_error.ok()) {
      return NetStatus::Error(io_error.kind, std::string(op) + ": " + io_error.detail);
    }
    if (ret == MBEDTLS_ERR_SSL_TIMEOUT) {
      return NetStatus::Error(NetErrorKind::kTimeout, std::string(op) + " timed out");
    }
    if (ret == MBEDTLS_ERR_SSL_FATAL_ALERT_MESSAGE) {
      return NetStatus::Error(NetErrorKind::kTlsAlert,
                              std::string(op) + ": peer sent fatal alert");
    }
    if (ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY || ret == MBEDTLS_ERR_NET_CONN_RESET) {
      return NetStatus::Error(NetErrorKind::kReset, std::string(op) + ": " + MbedtlsErrorString(ret));
    }
    return NetStatus::Error(NetErrorKind::kTls, std::string(op) + ": " + MbedtlsErrorString(ret));
  }
};

TlsChannel::TlsChannel() : impl_(std::make_unique<Impl>()) {}

TlsChannel::~TlsChannel() {
  Close();
}

bool TlsChannel::is_open() const {
  return impl_->open;
}

NetStatus TlsChannel::Handshake(Socket socket, const std::string& server_name,
                                const PskParams* psk, std::chrono::milliseconds timeout) {
  Close();
  Impl& s = *impl_;
  s.Reset();
  s.socket = std::move(socket);
  s.datagram = s.socket.type() == Socket::Type::kUdp;
  s.deadline = Clock::now() + timeout;

#if MBEDTLS_VERSION_MAJOR >= 3
  // 3.x routes the record cipher through PSA; initialization is idempotent.
  if (psa_crypto_init() != PSA_SUCCESS) {
    return NetStatus::Error(NetErrorKind::kTls, "psa_crypto_init failed");
  }
#endif

  int ret = mbedtls_ctr_drbg_seed(&s.ctr_drbg, mbedtls_entropy_func, &s.entropy,
                                  reinterpret_cast<const unsigned char*>(kDrbgPersonalization),
                                  sizeof(kDrbgPersonalization) - 1);
  if (ret != 0) return s.MapError(ret, "drbg seed");

  ret = mbedtls_ssl_config_defaults(
      &s.conf, MBEDTLS_SSL_IS_CLIENT,
      s.datagram ? MBEDTLS_SSL_TRANSPORT_DATAGRAM : MBEDTLS_SSL_TRANSPORT_STREAM,
      MBEDTLS_SSL_PRESET_DEFAULT);
  if (ret != 0) return s.MapError(ret, "config");

  mbedtls_ssl_conf_authmode(&s.conf, MBEDTLS_SSL_VERIFY_NONE);
  mbedtls_ssl_conf_rng(&s.conf, mbedtls_ctr_drbg_random, &s.ctr_drbg);

  if (psk != nullptr) {
    ret = mbedtls_ssl_conf_psk(&s.conf, psk->key.data(), psk->key.size(),
                               reinterpret_cast<const unsigned char*>(psk->identity.data()),
                               psk->identity.size());
    if (ret != 0) return s.MapError(ret, "psk");
    mbedtls_ssl_conf_ciphersuites(&s.conf, kPskCiphersuites);
#if MBEDTLS_VERSION_NUMBER >= 0x03020000
    mbedtls_ssl_conf_max_tls_version(&s.conf, MBEDTLS_SSL_VERSION_TLS1_2);
#endif
  }
  if (s.datagram) {
    mbedtls_ssl_conf_handshake_timeout(&s.conf, kDtlsHandshakeMinMs, kDtlsHandshakeMaxMs);
  }

  ret = mbedtls_ssl_setup(&s.ssl, &s.conf);
  if (ret != 0) return s.MapError(ret, "setup");
  if (!server_name.empty()) {
    ret = mbedtls_ssl_set_hostname(&s.ssl, server_name.c_str());
    if (ret != 0) return s.MapError(ret, "hostname");
  }
  mbedtls_ssl_set_bio(&s.ssl, &s, &Impl::BioSend, nullptr, &Impl::BioRecvTimeout);
  if (s.datagram) {
    mbedtls_ssl_set_timer_cb(&s.ssl, &s.timer, mbedtls_timing_set_delay, mbedtls_timing_get_delay);
  }

  while ((ret = mbedtls_ssl_handshake(&s.ssl)) != 0) {
    if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
      continue;
    }
    // DTLS retransmission timer fired; mbedtls resends the flight.
    if (ret == MBEDTLS_ERR_SSL_TIMEOUT && s.datagram && s.RemainingMs() > 0 && s.io_error.ok()) {
      continue;
    }
    NetStatus status = s.MapError(ret, "handshake");
    s.Reset();
    return status;
  }

  s.open = true;
  return NetStatus::Ok();
}

NetStatus TlsChannel::Write(const uint8_t* data, size_t len, std::chrono::milliseconds timeout) {
  Impl& s = *impl_;
  if (!s.open) return NetStatus::Error(NetErrorKind::kClosed, "channel not open");
  s.deadline = Clock::now() + timeout;
  s.io_error = NetStatus::Ok();

  size_t written = 0;
  while (written < len) {
    int ret = mbedtls_ssl_write(&s.ssl, data + written, len - written);
    if (ret >= 0) {
      written += static_cast<size_t>(ret);
      if (s.datagram) break;
      continue;
    }
    if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
      if (s.RemainingMs() == 0) return NetStatus::Error(NetErrorKind::kTimeout, "write timed out");
      continue;
    }
    return s.MapError(ret, "write");
  }
  return NetStatus::Ok();
}

NetStatus TlsChannel::Read(uint8_t* data, size_t len, size_t& received,
                           std::chrono::milliseconds timeout) {
  received = 0;
  Impl& s = *impl_;
  if (!s.open) return NetStatus::Error(NetErrorKind::kClosed, "channel not open");
  s.deadline = Clock::now() + timeout;
  s.io_error = NetStatus::Ok();

  while (true) {
    int ret = mbedtls_ssl_read(&s.ssl, data, len);
    if (ret > 0) {
      received = static_cast<size_t>(ret);
      return NetStatus::Ok();
    }
    if (ret == 0 || ret == MBEDTLS_ERR_SSL_PEER_CLOSE_NOTIFY) {
      return NetStatus::Ok();
    }
    if (ret == MBEDTLS_ERR_SSL_WANT_READ || ret == MBEDTLS_ERR_SSL_WANT_WRITE) {
      if (s.RemainingMs() == 0) return NetStatus::Error(NetErrorKind::kTimeout, "read timed out");
      continue;
    }
    return s.MapError(ret, "read");
  }
}

void TlsChannel::Close() {
  Impl& s = *impl_;
  if (s.open) {
    s.deadline = Clock::now() + std::chrono::milliseconds(200);
    int ret;
    do {
      ret = mbedtls_ssl_close_notify(&s.ssl);
    } while (ret == MBEDTLS_ERR_SSL_WANT_WRITE && s.RemainingMs() > 0);
  }
  s.Reset();
}

}  // namespace lumensync::net
