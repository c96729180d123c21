// Repository: LumenSync
// Component: Configuration Loader
// Purpose: JSON config file -> validated immutable SyncConfig.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_CONFIG_CONFIG_LOADER_HPP_
#define LUMENSYNC_CONFIG_CONFIG_LOADER_HPP_

#include <stdexcept>
#include <string>
#include <vector>

#include "lumensync/config/SyncConfig.hpp"

namespace lumensync::config {

// Startup-only. Carries every problem found, not just the first.
class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(std::vector<std::string> issues);

  const std::vector<std::string>& issues() const { return issues_; }

 private:
  std::vector<std::string> issues_;
};

// Reads and parses `path`. Throws ConfigError (unreadable file, bad JSON,
// invalid values).
SyncConfig LoadConfigFile(const std::string& path);

// Parses a JSON document. Throws ConfigError.
//
//   {
//     "tv":       {"host": "...", "api_version": 6, "user": "...", "password": "..."},
//     "bridge":   {"host": "...", "application_key": "...", "client_key": "...",
//                  "entertainment_config_id": "..."},
//     "fixtures": [{"name": "wall_left", "id": 0, "zones": [0, 1, 3]}, ...],
//     "sync":     {"refresh_rate_ms": 10, ...}
//   }
//
// `fixtures` may also be a map keyed by name; `positions` is accepted for
// `zones`, and zones may be a "0,1,3" string.
SyncConfig ParseConfig(const std::string& json_text);

// Issues found in an already-built config; empty when valid.
std::vector<std::string> ValidateConfig(const SyncConfig& config);

// Parses "0,1,3" (spaces allowed). Returns false on any non-integer item.
bool ParseZoneList(const std::string& text, std::vector<int>& zones);

bool IsHexString(const std::string& s);

}  // namespace lumensync::config

#endif  // LUMENSYNC_CONFIG_CONFIG_LOADER_HPP_
