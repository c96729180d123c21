// Repository: LumenSync
// Component: JointSpace TV Device
// Purpose: ITvDevice over the Philips JointSpace HTTP API, v1 / v5 / v6.
// Copyright (c) 2026 LumenSync

#include "lumensync/tv/JointSpaceTvDevice.hpp"

#include <stdexcept>

#include "lumensync/tv/AmbilightDecoder.hpp"
#include "lumensync/util/Logger.hpp"

namespace lumensync::tv {

namespace {

constexpr uint16_t kHttpPort = 1925;
constexpr uint16_t kHttpsPort = 1926;

}  // namespace

JointSpaceTvDevice::JointSpaceTvDevice(int api_version, const std::string& host, bool use_tls,
                                       uint16_t port)
    : api_version_(api_version), client_(host, port, use_tls) {}

std::string JointSpaceTvDevice::AmbilightPath() const {
  return "/" + std::to_string(api_version_) + "/ambilight/processed";
}

std::string JointSpaceTvDevice::PowerStatePath() const {
  return "/" + std::to_string(api_version_) + "/powerstate";
}

std::string JointSpaceTvDevice::Describe() const {
  return "JointSpace v" + std::to_string(api_version_) + " @ " + client_.BaseUrl();
}

TvError JointSpaceTvDevice::ClassifyTransport(const net::NetStatus& status) {
  TvError error;
  error.detail = status.detail;
  switch (status.kind) {
    case net::NetErrorKind::kNone:
      error.kind = TvErrorKind::kNone;
      break;
    case net::NetErrorKind::kUnreachable:
      error.kind = TvErrorKind::kUnreachable;
      break;
    case net::NetErrorKind::kTimeout:
    case net::NetErrorKind::kReset:
    case net::NetErrorKind::kClosed:
      error.kind = TvErrorKind::kTimeout;
      break;
    case net::NetErrorKind::kTlsAlert:
    case net::NetErrorKind::kTls:
    case net::NetErrorKind::kProtocol:
      error.kind = TvErrorKind::kMalformed;
      break;
  }
  return error;
}

TvError JointSpaceTvDevice::ClassifyHttpStatus(int status) {
  TvError error;
  error.http_status = status;
  if (status >= 200 && status < 300) {
    return error;
  }
  error.kind = (status == 401 || status == 403) ? TvErrorKind::kAuthRejected
                                                : TvErrorKind::kHttpStatus;
  error.detail = "HTTP " + std::to_string(status);
  return error;
}

TvError JointSpaceTvDevice::GetBody(const std::string& path, std::chrono::milliseconds timeout,
                                    std::string& body) {
  net::HttpResult result = client_.Get(path, timeout);
  if (!result.ok()) {
    return ClassifyTransport(result.status);
  }
  TvError error = ClassifyHttpStatus(result.response.status);
  if (error.kind == TvErrorKind::kNone) {
    body = std::move(result.response.body);
  }
  return error;
}

TvError JointSpaceTvDevice::Authenticate(std::chrono::milliseconds timeout) {
  if (!RequiresAuthentication()) {
    return TvError{};
  }
  std::string body;
  TvError error = GetBody(AmbilightPath(), timeout, body);
  if (error.kind == TvErrorKind::kAuthRejected) {
    util::Logger::Error("[JointSpace] " + Describe() + " rejected the configured credentials");
  }
  return error;
}

TvFrameResult JointSpaceTvDevice::FetchZoneFrame(std::chrono::milliseconds timeout) {
  std::string body;
  TvError error = GetBody(AmbilightPath(), timeout, body);
  if (error.kind != TvErrorKind::kNone) {
    return TvFrameResult::Failure(error.kind, error.detail, error.http_status);
  }
  AmbilightDecodeResult decoded = DecodeAmbilight(body);
  if (!decoded.ok) {
    return TvFrameResult::Failure(TvErrorKind::kMalformed, decoded.error);
  }
  return TvFrameResult::Success(std::move(decoded.frame));
}

TvPowerStateResult JointSpaceTvDevice::QueryPowerState(std::chrono::milliseconds timeout) {
  TvPowerStateResult result{false, "", {}};
  std::string body;
  result.error = GetBody(PowerStatePath(), timeout, body);
  if (result.error.kind != TvErrorKind::kNone) {
    return result;
  }
  auto state = DecodePowerState(body);
  if (!state) {
    result.error = TvError{TvErrorKind::kMalformed, 0, "powerstate field missing"};
    return result;
  }
  result.ok = true;
  result.power_state = *state;
  return result;
}

TvPowerStateResult JointSpaceV1Device::QueryPowerState(std::chrono::milliseconds) {
  return TvPowerStateResult{false, "", TvError{TvErrorKind::kHttpStatus, 404,
                                               "power state not available on JointSpace v1"}};
}

JointSpaceV6Device::JointSpaceV6Device(const std::string& host, bool use_tls, uint16_t port,
                                       const std::string& user, const std::string& password)
    : JointSpaceTvDevice(6, host, use_tls, port) {
  client().SetDigestCredentials(user, password);
}

std::unique_ptr<ITvDevice> CreateTvDevice(const config::TvSettings& settings) {
  const bool default_tls = settings.api_version == 6;
  const bool use_tls = settings.scheme.empty() ? default_tls : settings.scheme == "https";
  const uint16_t port =
      settings.port != 0 ? settings.port : (default_tls ? kHttpsPort : kHttpPort);

  switch (settings.api_version) {
    case 1:
      return std::make_unique<JointSpaceV1Device>(settings.host, use_tls, port);
    case 5:
      return std::make_unique<JointSpaceV5Device>(settings.host, use_tls, port);
    case 6:
      return std::make_unique<JointSpaceV6Device>(settings.host, use_tls, port, settings.user,
                                                  settings.password);
    default:
      throw std::invalid_argument("unsupported JointSpace API version " +
                                  std::to_string(settings.api_version));
  }
}

}  // namespace lumensync::tv
