// Repository: LumenSync
// Component: HTTP Client
// Purpose: Minimal HTTP/1.1 client (GET / PUT, keep-alive, Content-Length
//          and chunked bodies, Digest authentication) over plain TCP or TLS.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_NET_HTTP_CLIENT_HPP_
#define LUMENSYNC_NET_HTTP_CLIENT_HPP_

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "lumensync/net/NetStatus.hpp"
#include "lumensync/net/Socket.hpp"
#include "lumensync/net/TlsChannel.hpp"

namespace lumensync::net {

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method = "GET";
  std::string path = "/";
  HeaderList headers;
  std::string body;
};

struct HttpResponse {
  int status = 0;
  std::string reason;
  // Lower-cased names. Repeated headers are joined with ", ".
  std::map<std::string, std::string> headers;
  std::string body;

  // Empty when absent. `name` is matched case-insensitively.
  std::string Header(const std::string& name) const;
  bool KeepAlive() const;
};

enum class HttpParseStatus { kNeedMore, kComplete, kError };

// Parses one response from the front of `buffer`. `eof` says the peer has
// closed, which completes a body without a declared length. On kError,
// `error` says why.
HttpParseStatus ParseHttpResponse(const std::string& buffer, bool eof,
                                  HttpResponse& response, std::string& error);

// RFC 7616 / 2617 Digest, MD5 only.
struct DigestChallenge {
  std::string realm;
  std::string nonce;
  std::string opaque;
  std::string qop;        // as offered, e.g. "auth,auth-int"
  std::string algorithm;  // empty or "MD5"
  bool stale = false;

  bool SupportsQopAuth() const;

  // Parses a WWW-Authenticate value. False when it is not a Digest
  // challenge or lacks a nonce.
  static bool Parse(const std::string& header, DigestChallenge& out);
};

std::string Md5Hex(const std::string& input);

// Authorization header value for one request.
std::string BuildDigestAuthorization(const DigestChallenge& challenge,
                                     const std::string& user,
                                     const std::string& password,
                                     const std::string& method,
                                     const std::string& uri,
                                     uint32_t nonce_count,
                                     const std::string& cnonce);

struct HttpResult {
  NetStatus status;
  HttpResponse response;

  bool ok() const { return status.ok(); }
};

// One persistent connection to one host. Not thread-safe; each adapter
// owns its own client.
class HttpClient {
 public:
  static constexpr size_t kMaxResponseBytes = 1 << 20;

  HttpClient(std::string host, uint16_t port, bool use_tls);
  ~HttpClient();

  HttpClient(const HttpClient&) = delete;
  HttpClient& operator=(const HttpClient&) = delete;

  // Enables Digest: the first 401 carrying a Digest challenge is answered
  // once, and later requests authenticate up front.
  void SetDigestCredentials(std::string user, std::string password);

  // The whole exchange (connect, handshake, write, read, one auth round
  // trip) is bounded by `timeout`. A transport error drops the connection;
  // the next call reconnects.
  HttpResult Send(const HttpRequest& request, std::chrono::milliseconds timeout);

  HttpResult Get(const std::string& path, std::chrono::milliseconds timeout);
  HttpResult Put(const std::string& path, const std::string& body,
                 const HeaderList& headers, std::chrono::milliseconds timeout);

  void Disconnect();
  bool connected() const;

  // "https://host:port"
  std::string BaseUrl() const;

 private:
  using Clock = std::chrono::steady_clock;

  NetStatus EnsureConnected(Clock::time_point deadline);
  HttpResult Exchange(const HttpRequest& request, Clock::time_point deadline);
  NetStatus WriteAll(const std::string& data, Clock::time_point deadline);
  NetStatus ReadSome(uint8_t* buf, size_t len, size_t& received, Clock::time_point deadline);
  std::string Serialize(const HttpRequest& request);

  static std::chrono::milliseconds Remaining(Clock::time_point deadline);

  std::string host_;
  uint16_t port_;
  bool use_tls_;

  Socket socket_;
  std::unique_ptr<TlsChannel> tls_;
  bool connected_ = false;

  std::string user_;
  std::string password_;
  std::optional<DigestChallenge> challenge_;
  uint32_t nonce_count_ = 0;
};

}  // namespace lumensync::net

#endif  // LUMENSYNC_NET_HTTP_CLIENT_HPP_
