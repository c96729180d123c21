// Repository: LumenSync
// Component: HTTP Client
// Purpose: Persistent HTTP/1.1 connection with Digest authentication.
// Copyright (c) 2026 LumenSync

#include "lumensync/net/HttpClient.hpp"

#include <cstdio>
#include <random>

#include "lumensync/util/Logger.hpp"

namespace lumensync::net {

using util::Logger;

namespace {

std::string MakeCnonce() {
  static thread_local std::mt19937_64 rng{std::random_device{}()};
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx", static_cast<unsigned long long>(rng()));
  return buf;
}

}  // namespace

HttpClient::HttpClient(std::string host, uint16_t port, bool use_tls)
    : host_(std::move(host)), port_(port), use_tls_(use_tls) {}

HttpClient::~HttpClient() {
  Disconnect();
}

void HttpClient::SetDigestCredentials(std::string user, std::string password) {
  user_ = std::move(user);
  password_ = std::move(password);
  challenge_.reset();
  nonce_count_ = 0;
}

std::string HttpClient::BaseUrl() const {
  return std::string(use_tls_ ? "https" : "http") + "://" + host_ + ":" + std::to_string(port_);
}

bool HttpClient::connected() const {
  return connected_;
}

std::chrono::milliseconds HttpClient::Remaining(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

void HttpClient::Disconnect() {
  if (tls_) {
    tls_->Close();
    tls_.reset();
  }
  socket_.Close();
  connected_ = false;
}

NetStatus HttpClient::EnsureConnected(Clock::time_point deadline) {
  if (connected_) return NetStatus::Ok();

  Socket socket;
  NetStatus st = socket.Connect(host_, port_, Socket::Type::kTcp, Remaining(deadline));
  if (!st.ok()) return st;

  if (use_tls_) {
    auto tls = std::make_unique<TlsChannel>();
    st = tls->Handshake(std::move(socket), host_, nullptr, Remaining(deadline));
    if (!st.ok()) return st;
    tls_ = std::move(tls);
  } else {
    socket_ = std::move(socket);
  }
  connected_ = true;
  Logger::Debug("[HttpClient] Connected to " + BaseUrl());
  return NetStatus::Ok();
}

NetStatus HttpClient::WriteAll(const std::string& data, Clock::time_point deadline) {
  const auto* bytes = reinterpret_cast<const uint8_t*>(data.data());
  if (tls_) return tls_->Write(bytes, data.size(), Remaining(deadline));
  return socket_.SendAll(bytes, data.size(), Remaining(deadline));
}

NetStatus HttpClient::ReadSome(uint8_t* buf, size_t len, size_t& received,
                               Clock::time_point deadline) {
  if (tls_) return tls_->Read(buf, len, received, Remaining(deadline));
  return socket_.Receive(buf, len, received, Remaining(deadline));
}

std::string HttpClient::Serialize(const HttpRequest& request) {
  std::string out = request.method + " " + request.path + " HTTP/1.1\r\n";
  out += "Host: " + host_ + ":" + std::to_string(port_) + "\r\n";
  out += "Connection: keep-alive\r\n";
  out += "Accept: application/json\r\n";
  for (const auto& header : request.headers) {
    out += header.first + ": " + header.second + "\r\n";
  }
  if (challenge_ && !user_.empty()) {
    out += "Authorization: " +
           BuildDigestAuthorization(*challenge_, user_, password_, request.method, request.path,
                                    ++nonce_count_, MakeCnonce()) +
           "\r\n";
  }
  if (!request.body.empty() || request.method == "PUT" || request.method == "POST") {
    out += "Content-Type: application/json\r\n";
    out += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
  }
  out += "\r\n";
  out += request.body;
  return out;
}

HttpResult HttpClient::Exchange(const HttpRequest& request, Clock::time_point deadline) {
  HttpResult result;
  result.status = EnsureConnected(deadline);
  if (!result.ok()) return result;

  result.status = WriteAll(Serialize(request), deadline);
  if (!result.ok()) {
    Disconnect();
    return result;
  }

  std::string buffer;
  uint8_t chunk[4096];
  bool eof = false;
  while (true) {
    std::string error;
    HttpParseStatus parsed = ParseHttpResponse(buffer, eof, result.response, error);
    if (parsed == HttpParseStatus::kComplete) break;
    if (parsed == HttpParseStatus::kError) {
      result.status = NetStatus::Error(eof ? NetErrorKind::kReset : NetErrorKind::kProtocol, error);
      Disconnect();
      return result;
    }
    if (buffer.size() > kMaxResponseBytes) {
      result.status = NetStatus::Error(NetErrorKind::kProtocol, "response too large");
      Disconnect();
      return result;
    }

    size_t got = 0;
    result.status = ReadSome(chunk, sizeof(chunk), got, deadline);
    if (!result.ok()) {
      Disconnect();
      return result;
    }
    if (got == 0) {
      eof = true;
    } else {
      buffer.append(reinterpret_cast<const char*>(chunk), got);
    }
  }

  if (!result.response.KeepAlive()) {
    Disconnect();
  }
  return result;
}

HttpResult HttpClient::Send(const HttpRequest& request, std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;

  const bool reused = connected_;
  HttpResult result = Exchange(request, deadline);

  // A kept-alive connection the server already dropped fails on first use.
  if (!result.ok() && reused &&
      (result.status.kind == NetErrorKind::kReset || result.status.kind == NetErrorKind::kClosed) &&
      Remaining(deadline).count() > 0) {
    result = Exchange(request, deadline);
  }
  if (!result.ok()) return result;

  if (result.response.status == 401 && !user_.empty()) {
    DigestChallenge challenge;
    const bool had_challenge = challenge_.has_value();
    if (DigestChallenge::Parse(result.response.Header("www-authenticate"), challenge) &&
        (!had_challenge || challenge.stale || challenge.nonce != challenge_->nonce)) {
      challenge_ = challenge;
      nonce_count_ = 0;
      if (Remaining(deadline).count() > 0) {
        result = Exchange(request, deadline);
      }
    }
  }
  return result;
}

HttpResult HttpClient::Get(const std::string& path, std::chrono::milliseconds timeout) {
  HttpRequest request;
  request.method = "GET";
  request.path = path;
  return Send(request, timeout);
}

HttpResult HttpClient::Put(const std::string& path, const std::string& body,
                           const HeaderList& headers, std::chrono::milliseconds timeout) {
  HttpRequest request;
  request.method = "PUT";
  request.path = path;
  request.headers = headers;
  request.body = body;
  return Send(request, timeout);
}

}  // namespace lumensync::net
