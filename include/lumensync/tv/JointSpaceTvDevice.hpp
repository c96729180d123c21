// Repository: LumenSync
// Component: JointSpace TV Device
// Purpose: ITvDevice over the Philips JointSpace HTTP API, v1 / v5 / v6.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_TV_JOINTSPACE_TV_DEVICE_HPP_
#define LUMENSYNC_TV_JOINTSPACE_TV_DEVICE_HPP_

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include "lumensync/config/SyncConfig.hpp"
#include "lumensync/net/HttpClient.hpp"
#include "lumensync/tv/ITvDevice.hpp"

namespace lumensync::tv {

// Shared transport and decoding. Generations differ in default scheme and
// port, authentication, and whether /<v>/powerstate exists.
class JointSpaceTvDevice : public ITvDevice {
 public:
  ~JointSpaceTvDevice() override = default;

  TvError Authenticate(std::chrono::milliseconds timeout) override;
  TvFrameResult FetchZoneFrame(std::chrono::milliseconds timeout) override;
  TvPowerStateResult QueryPowerState(std::chrono::milliseconds timeout) override;
  std::string Describe() const override;

  int api_version() const { return api_version_; }

  // "/6/ambilight/processed"
  std::string AmbilightPath() const;
  std::string PowerStatePath() const;

  static TvError ClassifyTransport(const net::NetStatus& status);
  static TvError ClassifyHttpStatus(int status);

 protected:
  JointSpaceTvDevice(int api_version, const std::string& host, bool use_tls, uint16_t port);

  virtual bool RequiresAuthentication() const = 0;

  net::HttpClient& client() { return client_; }

 private:
  // Transport + status mapping for one GET. On success `body` holds the
  // response body.
  TvError GetBody(const std::string& path, std::chrono::milliseconds timeout, std::string& body);

  int api_version_;
  net::HttpClient client_;
};

// v1: plain HTTP on 1925, no authentication, no power state.
class JointSpaceV1Device final : public JointSpaceTvDevice {
 public:
  JointSpaceV1Device(const std::string& host, bool use_tls, uint16_t port)
      : JointSpaceTvDevice(1, host, use_tls, port) {}

  bool SupportsPowerState() const override { return false; }
  TvPowerStateResult QueryPowerState(std::chrono::milliseconds timeout) override;

 protected:
  bool RequiresAuthentication() const override { return false; }
};

// v5: plain HTTP on 1925, no authentication, /5/powerstate.
class JointSpaceV5Device final : public JointSpaceTvDevice {
 public:
  JointSpaceV5Device(const std::string& host, bool use_tls, uint16_t port)
      : JointSpaceTvDevice(5, host, use_tls, port) {}

  bool SupportsPowerState() const override { return true; }

 protected:
  bool RequiresAuthentication() const override { return false; }
};

// v6: HTTPS on 1926 with Digest credentials from pairing, /6/powerstate.
class JointSpaceV6Device final : public JointSpaceTvDevice {
 public:
  JointSpaceV6Device(const std::string& host, bool use_tls, uint16_t port,
                     const std::string& user, const std::string& password);

  bool SupportsPowerState() const override { return true; }

 protected:
  bool RequiresAuthentication() const override { return true; }
};

// Picks the variant for `settings.api_version` and fills in default
// scheme / port. Throws std::invalid_argument for an unsupported version.
std::unique_ptr<ITvDevice> CreateTvDevice(const config::TvSettings& settings);

}  // namespace lumensync::tv

#endif  // LUMENSYNC_TV_JOINTSPACE_TV_DEVICE_HPP_
