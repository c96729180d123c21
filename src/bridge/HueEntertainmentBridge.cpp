// Repository: LumenSync
// Component: Hue Entertainment Bridge
// Purpose: ILightBridge over the Hue Entertainment API: CLIP v2 REST
//          activation plus a DTLS 1.2 PSK datagram stream.
// Copyright (c) 2026 LumenSync

#include "lumensync/bridge/HueEntertainmentBridge.hpp"

#include <stdexcept>

#include "lumensync/util/Logger.hpp"
#include "lumensync/util/MiniJson.hpp"

namespace lumensync::bridge {

using util::Logger;

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds Remaining(Clock::time_point deadline) {
  auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
  return left.count() > 0 ? left : std::chrono::milliseconds(0);
}

BridgeStatus FromTransport(const net::NetStatus& status, const std::string& stage) {
  const std::string detail = stage + ": " + status.detail;
  switch (status.kind) {
    case net::NetErrorKind::kNone:
      return BridgeStatus::Ok();
    case net::NetErrorKind::kUnreachable:
      return BridgeStatus::Error(BridgeErrorKind::kUnreachable, detail);
    case net::NetErrorKind::kTimeout:
      return BridgeStatus::Error(BridgeErrorKind::kTimeout, detail);
    case net::NetErrorKind::kTlsAlert:
      // Wrong PSK surfaces as a fatal alert during the handshake.
      return BridgeStatus::Error(BridgeErrorKind::kAuthRejected, detail);
    default:
      return BridgeStatus::Error(BridgeErrorKind::kNegotiationFailed, detail);
  }
}

}  // namespace

HueEntertainmentBridge::~HueEntertainmentBridge() {
  Close();
}

std::string HueEntertainmentBridge::ConfigurationPath(const std::string& entertainment_config_id) {
  return "/clip/v2/resource/entertainment_configuration/" + entertainment_config_id;
}

std::string HueEntertainmentBridge::Describe() const {
  return "Hue bridge " + endpoint_.host + " area " + endpoint_.entertainment_config_id;
}

BridgeStatus HueEntertainmentBridge::ClassifyActivation(const net::HttpResult& result) {
  if (!result.ok()) {
    return FromTransport(result.status, "activation");
  }
  const int status = result.response.status;
  if (status == 401 || status == 403) {
    return BridgeStatus::Error(BridgeErrorKind::kAuthRejected,
                               "activation: HTTP " + std::to_string(status));
  }

  std::string api_error;
  try {
    util::JsonValue doc = util::ParseJson(result.response.body);
    const util::JsonValue* errors = doc.Find("errors");
    if (errors != nullptr && errors->is_array() && !errors->AsArray().empty()) {
      const util::JsonValue* description = errors->AsArray().front().Find("description");
      api_error = (description != nullptr && description->is_string()) ? description->AsString()
                                                                       : "unspecified error";
    }
  } catch (const util::JsonParseError&) {
    // Non-JSON body: the status code alone decides.
  }

  if (status < 200 || status >= 300) {
    return BridgeStatus::Error(BridgeErrorKind::kNegotiationFailed,
                               "activation: HTTP " + std::to_string(status) +
                                   (api_error.empty() ? "" : " (" + api_error + ")"));
  }
  if (!api_error.empty()) {
    return BridgeStatus::Error(BridgeErrorKind::kNegotiationFailed, "activation: " + api_error);
  }
  return BridgeStatus::Ok();
}

BridgeStatus HueEntertainmentBridge::SetActive(bool active, std::chrono::milliseconds timeout) {
  const std::string body = std::string("{\"action\":") + (active ? "\"start\"" : "\"stop\"") + "}";
  net::HttpResult result =
      rest_->Put(ConfigurationPath(endpoint_.entertainment_config_id), body,
                 {{"hue-application-key", credentials_.application_key}}, timeout);
  return ClassifyActivation(result);
}

BridgeStatus HueEntertainmentBridge::Open(const BridgeEndpoint& endpoint,
                                          const BridgeCredentials& credentials,
                                          std::chrono::milliseconds timeout) {
  Close();
  const auto deadline = Clock::now() + timeout;
  endpoint_ = endpoint;
  credentials_ = credentials;

  net::PskParams psk;
  psk.identity = credentials.application_key;
  if (!DecodeHex(credentials.client_key_hex, psk.key) || psk.key.empty()) {
    return BridgeStatus::Error(BridgeErrorKind::kAuthRejected, "client key is not valid hex");
  }
  try {
    encoder_.emplace(endpoint.entertainment_config_id);
  } catch (const std::invalid_argument& e) {
    return BridgeStatus::Error(BridgeErrorKind::kNegotiationFailed, e.what());
  }

  rest_ = std::make_unique<net::HttpClient>(endpoint.host, endpoint.rest_port, /*use_tls=*/true);
  BridgeStatus status = SetActive(true, Remaining(deadline));
  if (!status.ok()) {
    rest_.reset();
    encoder_.reset();
    return status;
  }
  activated_ = true;
  Logger::Debug("[HueBridge] Entertainment area activated: " + endpoint.entertainment_config_id);

  net::Socket socket;
  net::NetStatus net_status =
      socket.Connect(endpoint.host, endpoint.stream_port, net::Socket::Type::kUdp,
                     Remaining(deadline));
  if (net_status.ok()) {
    net_status = stream_.Handshake(std::move(socket), "", &psk, Remaining(deadline));
  }
  if (!net_status.ok()) {
    status = FromTransport(net_status, "stream handshake");
    Close();
    return status;
  }
  return BridgeStatus::Ok();
}

BridgeStatus HueEntertainmentBridge::SendFrame(const std::vector<core::FixtureColor>& colors,
                                               std::chrono::milliseconds timeout) {
  if (!stream_.is_open() || !encoder_) {
    return BridgeStatus::Error(BridgeErrorKind::kClosed, "stream not open");
  }
  const std::vector<uint8_t> datagram = encoder_->Encode(colors);
  net::NetStatus st = stream_.Write(datagram.data(), datagram.size(), timeout);
  switch (st.kind) {
    case net::NetErrorKind::kNone:
      return BridgeStatus::Ok();
    case net::NetErrorKind::kTimeout:
      return BridgeStatus::Error(BridgeErrorKind::kTimeout, st.detail);
    case net::NetErrorKind::kClosed:
      return BridgeStatus::Error(BridgeErrorKind::kClosed, st.detail);
    default:
      return BridgeStatus::Error(BridgeErrorKind::kTransportReset, st.detail);
  }
}

void HueEntertainmentBridge::Close() {
  stream_.Close();
  if (activated_ && rest_) {
    BridgeStatus status = SetActive(false, kStopTimeout);
    if (!status.ok()) {
      Logger::Warn("[HueBridge] Deactivating entertainment area failed: " + status.detail);
    }
  }
  activated_ = false;
  rest_.reset();
  encoder_.reset();
}

}  // namespace lumensync::bridge
