// Repository: LumenSync
// Component: Hue Entertainment bridge tests
// Copyright (c) 2026 LumenSync

#include <gtest/gtest.h>

#include <chrono>

#include "lumensync/bridge/HueEntertainmentBridge.hpp"

namespace lumensync::bridge {
namespace {

constexpr const char* kConfigId = "1a8d99cc-967b-44f2-9202-43f976c0fa6b";

net::HttpResult Answer(int status, const std::string& body) {
  net::HttpResult result;
  result.response.status = status;
  result.response.body = body;
  return result;
}

TEST(HueEntertainmentBridgeTest, ConfigurationPath) {
  EXPECT_EQ(HueEntertainmentBridge::ConfigurationPath(kConfigId),
            std::string("/clip/v2/resource/entertainment_configuration/") + kConfigId);
}

TEST(HueEntertainmentBridgeTest, ActivationSucceedsOnCleanAnswer) {
  BridgeStatus status = HueEntertainmentBridge::ClassifyActivation(
      Answer(200, R"({"errors": [], "data": [{"rid": "x"}]})"));
  EXPECT_TRUE(status.ok());
}

TEST(HueEntertainmentBridgeTest, ActivationRejectedKey) {
  EXPECT_EQ(HueEntertainmentBridge::ClassifyActivation(Answer(401, "")).kind,
            BridgeErrorKind::kAuthRejected);
  EXPECT_EQ(HueEntertainmentBridge::ClassifyActivation(Answer(403, "")).kind,
            BridgeErrorKind::kAuthRejected);
}

TEST(HueEntertainmentBridgeTest, ActivationErrorsArrayFailsEvenOn2xx) {
  BridgeStatus status = HueEntertainmentBridge::ClassifyActivation(
      Answer(207, R"({"errors": [{"description": "area in use"}]})"));
  EXPECT_EQ(status.kind, BridgeErrorKind::kNegotiationFailed);
  EXPECT_NE(status.detail.find("area in use"), std::string::npos);
}

TEST(HueEntertainmentBridgeTest, ActivationTransportFailure) {
  net::HttpResult timed_out;
  timed_out.status = net::NetStatus::Error(net::NetErrorKind::kTimeout, "read");
  EXPECT_EQ(HueEntertainmentBridge::ClassifyActivation(timed_out).kind, BridgeErrorKind::kTimeout);

  net::HttpResult refused;
  refused.status = net::NetStatus::Error(net::NetErrorKind::kUnreachable, "connect");
  EXPECT_EQ(HueEntertainmentBridge::ClassifyActivation(refused).kind,
            BridgeErrorKind::kUnreachable);
}

TEST(HueEntertainmentBridgeTest, OpenRejectsBadClientKeyWithoutNetwork) {
  HueEntertainmentBridge bridge;
  BridgeEndpoint endpoint;
  endpoint.host = "192.0.2.1";
  endpoint.entertainment_config_id = kConfigId;
  BridgeCredentials credentials{"app-key", "not-hex!"};

  BridgeStatus status = bridge.Open(endpoint, credentials, std::chrono::milliseconds(100));
  EXPECT_EQ(status.kind, BridgeErrorKind::kAuthRejected);
}

TEST(HueEntertainmentBridgeTest, SendWithoutOpenIsClosed) {
  HueEntertainmentBridge bridge;
  BridgeStatus status = bridge.SendFrame({}, std::chrono::milliseconds(10));
  EXPECT_EQ(status.kind, BridgeErrorKind::kClosed);
}

}  // namespace
}  // namespace lumensync::bridge
