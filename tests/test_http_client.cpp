// Repository: LumenSync
// Component: HTTP client unit tests
// Purpose: Response framing, Digest computation, and a keep-alive Digest
//          exchange against a loopback server.
// Copyright (c) 2026 LumenSync

#include <gtest/gtest.h>

#include <chrono>
#include <string>

#include "lumensync/net/HttpClient.hpp"
#include "support/LoopbackHttpServer.hpp"

namespace lumensync::net {
namespace {

using tests::LoopbackHttpServer;

// -----------------------------------------------------------------------------
// Response parsing
// -----------------------------------------------------------------------------
TEST(HttpResponseParseTest, ContentLengthBody) {
  const std::string raw =
      "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 11\r\n"
      "X-Multi: a\r\nx-multi: b\r\n\r\n{\"ok\":true}";
  HttpResponse response;
  std::string error;
  ASSERT_EQ(ParseHttpResponse(raw, false, response, error), HttpParseStatus::kComplete) << error;
  EXPECT_EQ(response.status, 200);
  EXPECT_EQ(response.reason, "OK");
  EXPECT_EQ(response.body, "{\"ok\":true}");
  EXPECT_EQ(response.Header("CONTENT-TYPE"), "application/json");
  EXPECT_EQ(response.Header("x-multi"), "a, b");
  EXPECT_TRUE(response.KeepAlive());
}

TEST(HttpResponseParseTest, NeedsMoreUntilBodyComplete) {
  HttpResponse response;
  std::string error;
  EXPECT_EQ(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Le", false, response, error),
            HttpParseStatus::kNeedMore);
  EXPECT_EQ(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nab", false, response,
                              error),
            HttpParseStatus::kNeedMore);
  EXPECT_EQ(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: 4\r\n\r\nab", true, response,
                              error),
            HttpParseStatus::kError);
}

TEST(HttpResponseParseTest, ChunkedBody) {
  const std::string raw =
      "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n"
      "4\r\n{\"a\"\r\n3;ext=1\r\n:1}\r\n0\r\n\r\n";
  HttpResponse response;
  std::string error;
  ASSERT_EQ(ParseHttpResponse(raw, false, response, error), HttpParseStatus::kComplete) << error;
  EXPECT_EQ(response.body, "{\"a\":1}");

  EXPECT_EQ(ParseHttpResponse(raw.substr(0, raw.size() - 2), false, response, error),
            HttpParseStatus::kNeedMore);
  EXPECT_EQ(ParseHttpResponse("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n",
                              false, response, error),
            HttpParseStatus::kError);
}

TEST(HttpResponseParseTest, OversizedChunkIsRejected) {
  HttpResponse response;
  std::string error;
  const std::string head = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n";
  EXPECT_EQ(ParseHttpResponse(head + "ffffffffffffffff\r\nab", false, response, error),
            HttpParseStatus::kError);
  EXPECT_EQ(ParseHttpResponse(head + "100001\r\nab", false, response, error),
            HttpParseStatus::kError);
  EXPECT_NE(error.find("exceeds"), std::string::npos);
  // Within the limit but not yet received.
  EXPECT_EQ(ParseHttpResponse(head + "fffff\r\nab", false, response, error),
            HttpParseStatus::kNeedMore);
}

TEST(HttpResponseParseTest, BodyUntilCloseAndNoBodyStatuses) {
  HttpResponse response;
  std::string error;
  const std::string raw = "HTTP/1.0 200 OK\r\nServer: tv\r\n\r\nhello";
  EXPECT_EQ(ParseHttpResponse(raw, false, response, error), HttpParseStatus::kNeedMore);
  ASSERT_EQ(ParseHttpResponse(raw, true, response, error), HttpParseStatus::kComplete);
  EXPECT_EQ(response.body, "hello");
  EXPECT_FALSE(response.KeepAlive());

  ASSERT_EQ(ParseHttpResponse("HTTP/1.1 204 No Content\r\n\r\n", false, response, error),
            HttpParseStatus::kComplete);
  EXPECT_EQ(response.status, 204);
  EXPECT_TRUE(response.body.empty());
}

TEST(HttpResponseParseTest, RejectsGarbage) {
  HttpResponse response;
  std::string error;
  EXPECT_EQ(ParseHttpResponse("SSH-2.0-OpenSSH\r\n\r\n", false, response, error),
            HttpParseStatus::kError);
  EXPECT_EQ(ParseHttpResponse("HTTP/1.1 200 OK\r\nno colon here\r\n\r\n", false, response, error),
            HttpParseStatus::kError);
  EXPECT_EQ(ParseHttpResponse("HTTP/1.1 200 OK\r\nContent-Length: x1\r\n\r\n", false, response,
                              error),
            HttpParseStatus::kError);
}

// -----------------------------------------------------------------------------
// Digest
// -----------------------------------------------------------------------------
TEST(DigestTest, Md5KnownVectors) {
  EXPECT_EQ(Md5Hex(""), "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(Md5Hex("abc"), "900150983cd24fb0d6963f7d28e17f72");
}

TEST(DigestTest, ParsesChallenge) {
  DigestChallenge challenge;
  ASSERT_TRUE(DigestChallenge::Parse(
      R"(Digest realm="testrealm@host.com", qop="auth,auth-int", nonce="dcd98b7102dd2f0e8b11d0f600bfb0c093", opaque="5ccc069c403ebaf9f0171e9517f40e41", stale=FALSE)",
      challenge));
  EXPECT_EQ(challenge.realm, "testrealm@host.com");
  EXPECT_EQ(challenge.nonce, "dcd98b7102dd2f0e8b11d0f600bfb0c093");
  EXPECT_EQ(challenge.opaque, "5ccc069c403ebaf9f0171e9517f40e41");
  EXPECT_TRUE(challenge.SupportsQopAuth());
  EXPECT_FALSE(challenge.stale);

  DigestChallenge other;
  EXPECT_FALSE(DigestChallenge::Parse("Basic realm=\"tv\"", other));
  EXPECT_FALSE(DigestChallenge::Parse("Digest realm=\"tv\"", other));
}

TEST(DigestTest, Rfc2617Example) {
  DigestChallenge challenge;
  challenge.realm = "testrealm@host.com";
  challenge.nonce = "dcd98b7102dd2f0e8b11d0f600bfb0c093";
  challenge.opaque = "5ccc069c403ebaf9f0171e9517f40e41";
  challenge.qop = "auth,auth-int";

  const std::string header = BuildDigestAuthorization(
      challenge, "Mufasa", "Circle Of Life", "GET", "/dir/index.html", 1, "0a4f113b");
  EXPECT_NE(header.find("response=\"6629fae49393a05397450978507c4ef1\""), std::string::npos)
      << header;
  EXPECT_NE(header.find("nc=00000001"), std::string::npos);
  EXPECT_NE(header.find("cnonce=\"0a4f113b\""), std::string::npos);
  EXPECT_NE(header.find("opaque=\"5ccc069c403ebaf9f0171e9517f40e41\""), std::string::npos);
  EXPECT_EQ(header.rfind("Digest username=\"Mufasa\"", 0), 0u);
}

TEST(DigestTest, WithoutQopUsesLegacyResponse) {
  DigestChallenge challenge;
  challenge.realm = "r";
  challenge.nonce = "n";
  const std::string ha1 = Md5Hex("u:r:p");
  const std::string ha2 = Md5Hex("GET:/x");
  const std::string header = BuildDigestAuthorization(challenge, "u", "p", "GET", "/x", 1, "c");
  EXPECT_NE(header.find("response=\"" + Md5Hex(ha1 + ":n:" + ha2) + "\""), std::string::npos);
  EXPECT_EQ(header.find("qop="), std::string::npos);
}

// -----------------------------------------------------------------------------
// Client against a loopback server
// -----------------------------------------------------------------------------
TEST(HttpClientLoopbackTest, DigestChallengeThenPreemptiveAuth) {
  LoopbackHttpServer server;
  server.QueueResponse(LoopbackHttpServer::Response(
      401, "Unauthorized", "",
      "WWW-Authenticate: Digest realm=\"XTV\", nonce=\"n0nce\", qop=\"auth\"\r\n"));
  server.QueueResponse(LoopbackHttpServer::Response(200, "OK", "{\"first\":1}"));
  server.QueueResponse(LoopbackHttpServer::Response(200, "OK", "{\"second\":2}"));
  server.Start();

  HttpClient client("127.0.0.1", server.port(), /*use_tls=*/false);
  client.SetDigestCredentials("tvuser", "secret");

  HttpResult first = client.Get("/6/powerstate", std::chrono::milliseconds(2000));
  ASSERT_TRUE(first.ok()) << first.status.detail;
  EXPECT_EQ(first.response.status, 200);
  EXPECT_EQ(first.response.body, "{\"first\":1}");
  EXPECT_TRUE(client.connected());

  HttpResult second = client.Get("/6/powerstate", std::chrono::milliseconds(2000));
  ASSERT_TRUE(second.ok()) << second.status.detail;
  EXPECT_EQ(second.response.body, "{\"second\":2}");

  const auto requests = server.requests();
  ASSERT_EQ(requests.size(), 3u);
  EXPECT_EQ(requests[0].rfind("GET /6/powerstate HTTP/1.1\r\n", 0), 0u);
  EXPECT_EQ(requests[0].find("Authorization:"), std::string::npos);
  EXPECT_NE(requests[1].find("Authorization: Digest username=\"tvuser\", realm=\"XTV\""),
            std::string::npos);
  EXPECT_NE(requests[1].find("nc=00000001"), std::string::npos);
  EXPECT_NE(requests[2].find("nc=00000002"), std::string::npos);
  EXPECT_EQ(server.connections(), 1);
}

TEST(HttpClientLoopbackTest, PutCarriesBodyAndHeaders) {
  LoopbackHttpServer server;
  server.QueueResponse(LoopbackHttpServer::Response(200, "OK", "{}", "Connection: close\r\n"));
  server.Start();

  HttpClient client("127.0.0.1", server.port(), /*use_tls=*/false);
  HttpResult result = client.Put("/clip/v2/resource/x", "{\"action\":\"start\"}",
                                 {{"hue-application-key", "k"}}, std::chrono::milliseconds(2000));
  ASSERT_TRUE(result.ok()) << result.status.detail;
  EXPECT_FALSE(client.connected());

  const auto requests = server.requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].rfind("PUT /clip/v2/resource/x HTTP/1.1\r\n", 0), 0u);
  EXPECT_NE(requests[0].find("hue-application-key: k\r\n"), std::string::npos);
  EXPECT_NE(requests[0].find("Content-Length: 18\r\n"), std::string::npos);
  EXPECT_NE(requests[0].find("\r\n\r\n{\"action\":\"start\"}"), std::string::npos);
}

TEST(HttpClientLoopbackTest, RefusedConnectionIsUnreachable) {
  uint16_t closed_port = 0;
  {
    LoopbackHttpServer released;
    closed_port = released.port();
  }
  HttpClient client("127.0.0.1", closed_port, /*use_tls=*/false);
  HttpResult result = client.Get("/", std::chrono::milliseconds(1000));
  EXPECT_FALSE(result.ok());
  EXPECT_EQ(result.status.kind, NetErrorKind::kUnreachable);
  EXPECT_EQ(client.BaseUrl(), "http://127.0.0.1:" + std::to_string(closed_port));
}

}  // namespace
}  // namespace lumensync::net
