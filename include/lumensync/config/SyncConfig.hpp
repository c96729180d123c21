// Repository: LumenSync
// Component: Sync Configuration
// Purpose: Validated, immutable run configuration handed to the engine.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_CONFIG_SYNC_CONFIG_HPP_
#define LUMENSYNC_CONFIG_SYNC_CONFIG_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "lumensync/bridge/ILightBridge.hpp"
#include "lumensync/core/ColorTypes.hpp"

namespace lumensync::config {

struct TvSettings {
  std::string host;
  // JointSpace API generation: 1, 5 or 6.
  int api_version = 6;
  // "http" or "https". Empty picks the variant default.
  std::string scheme;
  // 0 picks the variant default (1925 for v1/v5, 1926 for v6).
  uint16_t port = 0;
  std::string user;
  std::string password;
};

struct BridgeSettings {
  bridge::BridgeEndpoint endpoint;
  bridge::BridgeCredentials credentials;
};

// Timing and policy knobs of the sync loop. Zero-means-unbounded fields are
// called out; everything else is a plain duration.
struct SyncSettings {
  int64_t refresh_rate_ms = 10;          // 0 = as fast as the TV answers
  int64_t idle_refresh_rate_ms = 5000;
  double transition_smoothing = 0.0;     // [0, 0.95]
  int64_t black_screen_timeout_s = 30;
  int64_t wait_for_startup_s = 0;        // 0 = wait forever
  int64_t runtime_error_threshold = 10;  // 0 = never exit
  int black_threshold = 15;
  int max_consecutive_send_errors = 3;
  int64_t error_backoff_ms = 3000;
  int64_t stream_retry_backoff_ms = 2000;
  int64_t sample_timeout_ms = 200;
  int64_t send_timeout_ms = 100;
  int64_t open_timeout_ms = 5000;
  int64_t powerstate_probe_after_s = 5;  // 0 = never probe
  int64_t power_on_delay_s = 0;
  int64_t status_interval_s = 60;        // 0 = no status report
  int zone_count = 17;

  bool automation_mode() const {
    return wait_for_startup_s == 0 && runtime_error_threshold == 0;
  }
};

struct SyncConfig {
  TvSettings tv;
  BridgeSettings bridge;
  std::vector<core::Fixture> fixtures;
  SyncSettings sync;
};

}  // namespace lumensync::config

#endif  // LUMENSYNC_CONFIG_SYNC_CONFIG_HPP_
