// Repository: LumenSync
// Component: Hue Entertainment Bridge
// Purpose: ILightBridge over the Hue Entertainment API: CLIP v2 REST
//          activation plus a DTLS 1.2 PSK datagram stream.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_BRIDGE_HUE_ENTERTAINMENT_BRIDGE_HPP_
#define LUMENSYNC_BRIDGE_HUE_ENTERTAINMENT_BRIDGE_HPP_

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "lumensync/bridge/HueStreamCodec.hpp"
#include "lumensync/bridge/ILightBridge.hpp"
#include "lumensync/net/HttpClient.hpp"
#include "lumensync/net/TlsChannel.hpp"

namespace lumensync::bridge {

// Open():
//   1. PUT /clip/v2/resource/entertainment_configuration/<id>
//      {"action":"start"} with hue-application-key
//   2. DTLS handshake to <host>:2100, identity = application key,
//      PSK = hex-decoded client key
// Close():
//   close_notify, then {"action":"stop"}
class HueEntertainmentBridge final : public ILightBridge {
 public:
  // Bound for the deactivation request issued by Close().
  static constexpr std::chrono::milliseconds kStopTimeout{1000};

  HueEntertainmentBridge() = default;
  ~HueEntertainmentBridge() override;

  BridgeStatus Open(const BridgeEndpoint& endpoint,
                    const BridgeCredentials& credentials,
                    std::chrono::milliseconds timeout) override;

  BridgeStatus SendFrame(const std::vector<core::FixtureColor>& colors,
                         std::chrono::milliseconds timeout) override;

  void Close() override;

  std::string Describe() const override;

  // "/clip/v2/resource/entertainment_configuration/<id>"
  static std::string ConfigurationPath(const std::string& entertainment_config_id);

  // Maps the activation PUT outcome. Also inspects the CLIP v2 "errors"
  // array, which the bridge fills even on some 2xx answers.
  static BridgeStatus ClassifyActivation(const net::HttpResult& result);

 private:
  BridgeStatus SetActive(bool active, std::chrono::milliseconds timeout);

  BridgeEndpoint endpoint_;
  BridgeCredentials credentials_;
  std::unique_ptr<net::HttpClient> rest_;
  net::TlsChannel stream_;
  std::optional<HueStreamEncoder> encoder_;
  bool activated_ = false;
};

}  // namespace lumensync::bridge

#endif  // LUMENSYNC_BRIDGE_HUE_ENTERTAINMENT_BRIDGE_HPP_
