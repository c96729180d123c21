// Repository: LumenSync
// Component: HTTP Client
// Purpose: Response parsing and Digest authentication helpers.
// Copyright (c) 2026 LumenSync

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>

#include <mbedtls/md.h>

#include "lumensync/net/HttpClient.hpp"

namespace lumensync::net {

namespace {

std::string ToLower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return s;
}

std::string Trim(const std::string& s) {
  size_t b = s.find_first_not_of(" \t");
  if (b == std::string::npos) return "";
  size_t e = s.find_last_not_of(" \t");
  return s.substr(b, e - b + 1);
}

bool ParseStatusLine(const std::string& line, HttpResponse& response) {
  // HTTP/1.x SP status [SP reason]
  if (line.compare(0, 5, "HTTP/") != 0) return false;
  size_t sp = line.find(' ');
  if (sp == std::string::npos || sp + 4 > line.size()) return false;
  const std::string code = line.substr(sp + 1, 3);
  for (char c : code) {
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  }
  response.status = std::atoi(code.c_str());
  response.reason = sp + 5 <= line.size() ? line.substr(sp + 5) : "";
  return true;
}

// Decodes a chunked body starting at `pos`. kComplete leaves the body in
// `out`.
HttpParseStatus DecodeChunked(const std::string& buf, size_t pos, std::string& out,
                              std::string& error) {
  out.clear();
  while (true) {
    size_t eol = buf.find("\r\n", pos);
    if (eol == std::string::npos) return HttpParseStatus::kNeedMore;
    std::string size_field = buf.substr(pos, eol - pos);
    size_t semi = size_field.find(';');
    if (semi != std::string::npos) size_field.resize(semi);
    size_field = Trim(size_field);
    if (size_field.empty() ||
        !std::all_of(size_field.begin(), size_field.end(),
                     [](unsigned char c) { return std::isxdigit(c) != 0; })) {
      error = "bad chunk size";
      return HttpParseStatus::kError;
    }
    // Longer size fields are over the limit and may overflow strtoul.
    const size_t chunk =
        size_field.size() > 8 ? SIZE_MAX : std::strtoul(size_field.c_str(), nullptr, 16);
    if (chunk > HttpClient::kMaxResponseBytes - out.size()) {
      error = "chunk size " + size_field + " exceeds the response limit";
      return HttpParseStatus::kError;
    }
    pos = eol + 2;
    if (chunk == 0) {
      // Trailer section ends with an empty line.
      while (true) {
        size_t end = buf.find("\r\n", pos);
        if (end == std::string::npos) return HttpParseStatus::kNeedMore;
        if (end == pos) return HttpParseStatus::kComplete;
        pos = end + 2;
      }
    }
    if (buf.size() - pos < chunk + 2) return HttpParseStatus::kNeedMore;
    out.append(buf, pos, chunk);
    if (buf.compare(pos + chunk, 2, "\r\n") != 0) {
      error = "chunk not terminated by CRLF";
      return HttpParseStatus::kError;
    }
    pos += chunk + 2;
  }
}

}  // namespace

std::string HttpResponse::Header(const std::string& name) const {
  auto it = headers.find(ToLower(name));
  return it == headers.end() ? std::string() : it->second;
}

bool HttpResponse::KeepAlive() const {
  return ToLower(Header("connection")).find("close") == std::string::npos;
}

HttpParseStatus ParseHttpResponse(const std::string& buffer, bool eof,
                                  HttpResponse& response, std::string& error) {
  const size_t head_end = buffer.find("\r\n\r\n");
  if (head_end == std::string::npos) {
    if (eof) {
      error = "connection closed before end of headers";
      return HttpParseStatus::kError;
    }
    return HttpParseStatus::kNeedMore;
  }

  response = HttpResponse{};
  size_t line_start = 0;
  size_t line_end = buffer.find("\r\n");
  if (!ParseStatusLine(buffer.substr(0, line_end), response)) {
    error = "malformed status line";
    return HttpParseStatus::kError;
  }
  line_start = line_end + 2;
  while (line_start < head_end) {
    line_end = buffer.find("\r\n", line_start);
    const std::string line = buffer.substr(line_start, line_end - line_start);
    line_start = line_end + 2;
    size_t colon = line.find(':');
    if (colon == std::string::npos) {
      error = "malformed header line";
      return HttpParseStatus::kError;
    }
    const std::string name = ToLower(Trim(line.substr(0, colon)));
    const std::string value = Trim(line.substr(colon + 1));
    auto it = response.headers.find(name);
    if (it == response.headers.end()) {
      response.headers.emplace(name, value);
    } else {
      it->second += ", " + value;
    }
  }

  const size_t body_start = head_end + 4;
  if (response.status == 204 || response.status == 304 ||
      (response.status >= 100 && response.status < 200)) {
    return HttpParseStatus::kComplete;
  }

  if (ToLower(response.Header("transfer-encoding")).find("chunked") != std::string::npos) {
    HttpParseStatus st = DecodeChunked(buffer, body_start, response.body, error);
    if (st == HttpParseStatus::kNeedMore && eof) {
      error = "connection closed inside chunked body";
      return HttpParseStatus::kError;
    }
    return st;
  }

  const std::string length = response.Header("content-length");
  if (!length.empty()) {
    if (!std::all_of(length.begin(), length.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
      error = "bad Content-Length";
      return HttpParseStatus::kError;
    }
    const size_t want = std::strtoul(length.c_str(), nullptr, 10);
    if (buffer.size() - body_start < want) {
      if (eof) {
        error = "connection closed before end of body";
        return HttpParseStatus::kError;
      }
      return HttpParseStatus::kNeedMore;
    }
    response.body = buffer.substr(body_start, want);
    return HttpParseStatus::kComplete;
  }

  // No framing: the body runs to connection close.
  if (!eof) return HttpParseStatus::kNeedMore;
  response.body = buffer.substr(body_start);
  response.headers["connection"] = "close";
  return HttpParseStatus::kComplete;
}

// ---------------------------------------------------------------------------
// Digest
// ---------------------------------------------------------------------------

bool DigestChallenge::SupportsQopAuth() const {
  size_t start = 0;
  while (start <= qop.size()) {
    size_t comma = qop.find(',', start);
    std::string token = Trim(qop.substr(start, comma == std::string::npos ? std::string::npos
                                                                         : comma - start));
    if (ToLower(token) == "auth") return true;
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return false;
}

bool DigestChallenge::Parse(const std::string& header, DigestChallenge& out) {
  const std::string trimmed = Trim(header);
  if (trimmed.size() < 7 || ToLower(trimmed.substr(0, 7)) != "digest ") return false;

  out = DigestChallenge{};
  size_t pos = 7;
  while (pos < trimmed.size()) {
    while (pos < trimmed.size() && (trimmed[pos] == ' ' || trimmed[pos] == ',')) ++pos;
    size_t eq = trimmed.find('=', pos);
    if (eq == std::string::npos) break;
    const std::string key = ToLower(Trim(trimmed.substr(pos, eq - pos)));
    pos = eq + 1;
    std::string value;
    if (pos < trimmed.size() && trimmed[pos] == '"') {
      ++pos;
      while (pos < trimmed.size() && trimmed[pos] != '"') {
        if (trimmed[pos] == '\\' && pos + 1 < trimmed.size()) ++pos;
        value += trimmed[pos++];
      }
      ++pos;  // closing quote
    } else {
      size_t comma = trimmed.find(',', pos);
      value = Trim(trimmed.substr(pos, comma == std::string::npos ? std::string::npos
                                                                  : comma - pos));
      pos = comma == std::string::npos ? trimmed.size() : comma;
    }

    if (key == "realm") out.realm = value;
    else if (key == "nonce") out.nonce = value;
    else if (key == "opaque") out.opaque = value;
    else if (key == "qop") out.qop = value;
    else if (key == "algorithm") out.algorithm = value;
    else if (key == "stale") out.stale = ToLower(value) == "true";
  }
  return !out.nonce.empty();
}

std::string Md5Hex(const std::string& input) {
  unsigned char digest[16];
  const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_MD5);
  if (info == nullptr ||
      mbedtls_md(info, reinterpret_cast<const unsigned char*>(input.data()), input.size(),
                 digest) != 0) {
    throw std::runtime_error("MD5 unavailable in this mbedtls build");
  }
  char hex[33];
  for (int i = 0; i < 16; ++i) {
    std::snprintf(hex + 2 * i, 3, "%02x", digest[i]);
  }
  return std::string(hex, 32);
}

std::string BuildDigestAuthorization(const DigestChallenge& challenge,
                                     const std::string& user,
                                     const std::string& password,
                                     const std::string& method,
                                     const std::string& uri,
                                     uint32_t nonce_count,
                                     const std::string& cnonce) {
  const std::string ha1 = Md5Hex(user + ":" + challenge.realm + ":" + password);
  const std::string ha2 = Md5Hex(method + ":" + uri);

  char nc[9];
  std::snprintf(nc, sizeof(nc), "%08x", nonce_count);

  const bool qop_auth = challenge.SupportsQopAuth();
  const std::string response =
      qop_auth ? Md5Hex(ha1 + ":" + challenge.nonce + ":" + nc + ":" + cnonce + ":auth:" + ha2)
               : Md5Hex(ha1 + ":" + challenge.nonce + ":" + ha2);

  std::string header = "Digest username=\"" + user + "\", realm=\"" + challenge.realm +
                       "\", nonce=\"" + challenge.nonce + "\", uri=\"" + uri + "\"";
  if (!challenge.algorithm.empty()) {
    header += ", algorithm=" + challenge.algorithm;
  }
  header += ", response=\"" + response + "\"";
  if (!challenge.opaque.empty()) {
    header += ", opaque=\"" + challenge.opaque + "\"";
  }
  if (qop_auth) {
    header += std::string(", qop=auth, nc=") + nc + ", cnonce=\"" + cnonce + "\"";
  }
  return header;
}

}  // namespace lumensync::net
