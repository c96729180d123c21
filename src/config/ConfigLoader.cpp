// Repository: LumenSync
// Component: Configuration Loader
// Purpose: JSON config file -> validated immutable SyncConfig.
// Copyright (c) 2026 LumenSync

#include "lumensync/config/ConfigLoader.hpp"

#include <cctype>
#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

#include "lumensync/bridge/HueStreamCodec.hpp"
#include "lumensync/core/SmoothingFilter.hpp"
#include "lumensync/util/MiniJson.hpp"

namespace lumensync::config {

using util::JsonValue;

namespace {

std::string JoinIssues(const std::vector<std::string>& issues) {
  std::ostringstream oss;
  oss << "invalid configuration (" << issues.size() << " issue"
      << (issues.size() == 1 ? "" : "s") << ")";
  for (const auto& issue : issues) {
    oss << "\n  - " << issue;
  }
  return oss.str();
}

// Collects issues while reading so that one pass reports all of them.
class Reader {
 public:
  std::vector<std::string>& issues() { return issues_; }

  void Issue(const std::string& what) { issues_.push_back(what); }

  const JsonValue* Section(const JsonValue& root, const char* name, bool required) {
    const JsonValue* section = root.Find(name);
    if (section == nullptr) {
      if (required) Issue(std::string("missing section '") + name + "'");
      return nullptr;
    }
    if (!section->is_object() && std::string(name) != "fixtures") {
      Issue(std::string("section '") + name + "' must be an object");
      return nullptr;
    }
    return section;
  }

  void String(const JsonValue* obj, const std::string& path, const char* key, std::string& out) {
    if (obj == nullptr) return;
    const JsonValue* v = obj->Find(key);
    if (v == nullptr || v->is_null()) return;
    if (!v->is_string()) {
      Issue(path + "." + key + " must be a string");
      return;
    }
    out = v->AsString();
  }

  template <typename T>
  void Integer(const JsonValue* obj, const std::string& path, const char* key, T& out) {
    if (obj == nullptr) return;
    const JsonValue* v = obj->Find(key);
    if (v == nullptr || v->is_null()) return;
    if (!v->is_number() || std::floor(v->AsNumber()) != v->AsNumber()) {
      Issue(path + "." + key + " must be an integer");
      return;
    }
    out = static_cast<T>(v->AsNumber());
  }

  void Double(const JsonValue* obj, const std::string& path, const char* key, double& out) {
    if (obj == nullptr) return;
    const JsonValue* v = obj->Find(key);
    if (v == nullptr || v->is_null()) return;
    if (!v->is_number()) {
      Issue(path + "." + key + " must be a number");
      return;
    }
    out = v->AsNumber();
  }

 private:
  std::vector<std::string> issues_;
};

bool ReadZones(const JsonValue& value, std::vector<int>& zones) {
  if (value.is_string()) {
    return ParseZoneList(value.AsString(), zones);
  }
  if (!value.is_array()) return false;
  for (const auto& item : value.AsArray()) {
    if (!item.is_number() || std::floor(item.AsNumber()) != item.AsNumber()) return false;
    zones.push_back(static_cast<int>(item.AsNumber()));
  }
  return true;
}

// Fixture ids are checked for range here because FixtureId is 8 bits wide.
void ReadFixture(Reader& reader, const std::string& path, const std::string& name,
                 const JsonValue& entry, std::vector<core::Fixture>& out) {
  if (!entry.is_object()) {
    reader.Issue(path + " must be an object");
    return;
  }
  core::Fixture fixture;
  fixture.name = name;

  const JsonValue* id = entry.Find("id");
  if (id == nullptr || !id->is_number() || std::floor(id->AsNumber()) != id->AsNumber()) {
    reader.Issue(path + ".id missing or not an integer");
    return;
  }
  const double raw_id = id->AsNumber();
  if (raw_id < 0 || raw_id > 255) {
    reader.Issue(path + ".id " + std::to_string(static_cast<long long>(raw_id)) +
                 " outside 0..255");
    return;
  }
  fixture.id = static_cast<core::FixtureId>(raw_id);

  const JsonValue* zones = entry.Find("zones");
  if (zones == nullptr) zones = entry.Find("positions");
  if (zones == nullptr) {
    reader.Issue(path + ".zones missing");
    return;
  }
  if (!ReadZones(*zones, fixture.zones)) {
    reader.Issue(path + ".zones must be a list of integers or a \"0,1,3\" string");
    return;
  }
  out.push_back(std::move(fixture));
}

void ReadFixtures(Reader& reader, const JsonValue& section, std::vector<core::Fixture>& out) {
  if (section.is_array()) {
    const auto& items = section.AsArray();
    for (size_t i = 0; i < items.size(); ++i) {
      const std::string path = "fixtures[" + std::to_string(i) + "]";
      std::string name;
      if (items[i].is_object()) {
        const JsonValue* n = items[i].Find("name");
        if (n != nullptr && n->is_string()) name = n->AsString();
      }
      if (name.empty()) {
        reader.Issue(path + ".name missing");
        continue;
      }
      ReadFixture(reader, path, name, items[i], out);
    }
    return;
  }
  if (section.is_object()) {
    for (const auto& member : section.AsObject()) {
      ReadFixture(reader, "fixtures." + member.first, member.first, member.second, out);
    }
    return;
  }
  reader.Issue("fixtures must be a list or an object");
}

}  // namespace

ConfigError::ConfigError(std::vector<std::string> issues)
    : std::runtime_error(JoinIssues(issues)), issues_(std::move(issues)) {}

bool ParseZoneList(const std::string& text, std::vector<int>& zones) {
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    size_t b = item.find_first_not_of(" \t");
    size_t e = item.find_last_not_of(" \t");
    if (b == std::string::npos) return false;
    item = item.substr(b, e - b + 1);
    size_t i = (item[0] == '-') ? 1 : 0;
    if (i == item.size()) return false;
    for (; i < item.size(); ++i) {
      if (!std::isdigit(static_cast<unsigned char>(item[i]))) return false;
    }
    zones.push_back(std::stoi(item));
  }
  return true;
}

bool IsHexString(const std::string& s) {
  if (s.empty() || s.size() % 2 != 0) return false;
  for (char c : s) {
    if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

SyncConfig ParseConfig(const std::string& json_text) {
  JsonValue root;
  try {
    root = util::ParseJson(json_text);
  } catch (const util::JsonParseError& e) {
    throw ConfigError(std::vector<std::string>{std::string("malformed JSON: ") + e.what()});
  }
  if (!root.is_object()) {
    throw ConfigError(std::vector<std::string>{"top level must be a JSON object"});
  }

  Reader reader;
  SyncConfig config;

  const JsonValue* tv = reader.Section(root, "tv", true);
  reader.String(tv, "tv", "host", config.tv.host);
  reader.Integer(tv, "tv", "api_version", config.tv.api_version);
  reader.String(tv, "tv", "scheme", config.tv.scheme);
  int tv_port = config.tv.port;
  reader.Integer(tv, "tv", "port", tv_port);
  reader.String(tv, "tv", "user", config.tv.user);
  reader.String(tv, "tv", "password", config.tv.password);

  const JsonValue* br = reader.Section(root, "bridge", true);
  auto& endpoint = config.bridge.endpoint;
  auto& credentials = config.bridge.credentials;
  reader.String(br, "bridge", "host", endpoint.host);
  int rest_port = endpoint.rest_port;
  int stream_port = endpoint.stream_port;
  reader.Integer(br, "bridge", "rest_port", rest_port);
  reader.Integer(br, "bridge", "stream_port", stream_port);
  reader.String(br, "bridge", "entertainment_config_id", endpoint.entertainment_config_id);
  // "username" / "clientkey" are the names the bridge pairing flow hands out.
  reader.String(br, "bridge", "username", credentials.application_key);
  reader.String(br, "bridge", "application_key", credentials.application_key);
  reader.String(br, "bridge", "clientkey", credentials.client_key_hex);
  reader.String(br, "bridge", "client_key", credentials.client_key_hex);

  for (const auto* p : {&tv_port, &rest_port, &stream_port}) {
    if (*p < 0 || *p > 65535) {
      reader.Issue("port " + std::to_string(*p) + " outside 0..65535");
    }
  }
  config.tv.port = static_cast<uint16_t>(tv_port < 0 || tv_port > 65535 ? 0 : tv_port);
  endpoint.rest_port = static_cast<uint16_t>(rest_port < 0 || rest_port > 65535 ? 0 : rest_port);
  endpoint.stream_port =
      static_cast<uint16_t>(stream_port < 0 || stream_port > 65535 ? 0 : stream_port);

  const JsonValue* fixtures = reader.Section(root, "fixtures", true);
  if (fixtures != nullptr) {
    ReadFixtures(reader, *fixtures, config.fixtures);
  }

  const JsonValue* sy = reader.Section(root, "sync", false);
  auto& s = config.sync;
  reader.Integer(sy, "sync", "refresh_rate_ms", s.refresh_rate_ms);
  reader.Integer(sy, "sync", "idle_refresh_rate_ms", s.idle_refresh_rate_ms);
  reader.Double(sy, "sync", "transition_smoothing", s.transition_smoothing);
  reader.Integer(sy, "sync", "black_screen_timeout_s", s.black_screen_timeout_s);
  reader.Integer(sy, "sync", "wait_for_startup_s", s.wait_for_startup_s);
  reader.Integer(sy, "sync", "runtime_error_threshold", s.runtime_error_threshold);
  reader.Integer(sy, "sync", "black_threshold", s.black_threshold);
  reader.Integer(sy, "sync", "max_consecutive_send_errors", s.max_consecutive_send_errors);
  reader.Integer(sy, "sync", "error_backoff_ms", s.error_backoff_ms);
  reader.Integer(sy, "sync", "stream_retry_backoff_ms", s.stream_retry_backoff_ms);
  reader.Integer(sy, "sync", "sample_timeout_ms", s.sample_timeout_ms);
  reader.Integer(sy, "sync", "send_timeout_ms", s.send_timeout_ms);
  reader.Integer(sy, "sync", "open_timeout_ms", s.open_timeout_ms);
  reader.Integer(sy, "sync", "powerstate_probe_after_s", s.powerstate_probe_after_s);
  reader.Integer(sy, "sync", "power_on_delay_s", s.power_on_delay_s);
  reader.Integer(sy, "sync", "status_interval_s", s.status_interval_s);
  reader.Integer(sy, "sync", "zone_count", s.zone_count);

  for (auto& issue : ValidateConfig(config)) {
    reader.Issue(issue);
  }
  if (!reader.issues().empty()) {
    throw ConfigError(std::move(reader.issues()));
  }
  return config;
}

std::vector<std::string> ValidateConfig(const SyncConfig& config) {
  std::vector<std::string> issues;

  if (config.tv.host.empty()) issues.push_back("tv.host is required");
  if (config.tv.api_version != 1 && config.tv.api_version != 5 && config.tv.api_version != 6) {
    issues.push_back("tv.api_version " + std::to_string(config.tv.api_version) +
                     " unsupported (1, 5 or 6)");
  }
  if (!config.tv.scheme.empty() && config.tv.scheme != "http" && config.tv.scheme != "https") {
    issues.push_back("tv.scheme must be \"http\" or \"https\"");
  }
  if (config.tv.api_version == 6 && (config.tv.user.empty() || config.tv.password.empty())) {
    issues.push_back("tv.user and tv.password are required for api_version 6");
  }

  const auto& endpoint = config.bridge.endpoint;
  const auto& credentials = config.bridge.credentials;
  if (endpoint.host.empty()) issues.push_back("bridge.host is required");
  if (endpoint.rest_port == 0 || endpoint.stream_port == 0) {
    issues.push_back("bridge.rest_port and bridge.stream_port must be non-zero");
  }
  if (endpoint.entertainment_config_id.size() != 36) {
    issues.push_back("bridge.entertainment_config_id must be a 36-character id");
  }
  if (credentials.application_key.empty()) issues.push_back("bridge.application_key is required");
  if (credentials.client_key_hex.empty()) {
    issues.push_back("bridge.client_key is required");
  } else if (!IsHexString(credentials.client_key_hex)) {
    issues.push_back("bridge.client_key must be an even-length hex string");
  }

  const auto& s = config.sync;
  if (s.zone_count <= 0) issues.push_back("sync.zone_count must be positive");

  if (config.fixtures.empty()) issues.push_back("at least one fixture is required");
  if (config.fixtures.size() > bridge::HueStreamEncoder::kMaxChannels) {
    issues.push_back("at most " + std::to_string(bridge::HueStreamEncoder::kMaxChannels) +
                     " fixtures can be streamed");
  }
  std::set<core::FixtureId> ids;
  std::set<std::string> names;
  for (const auto& fixture : config.fixtures) {
    const std::string path = "fixture '" + fixture.name + "'";
    if (!ids.insert(fixture.id).second) {
      issues.push_back(path + ": duplicate id " + std::to_string(static_cast<int>(fixture.id)));
    }
    if (!names.insert(fixture.name).second) {
      issues.push_back(path + ": duplicate name");
    }
    if (fixture.zones.empty()) {
      issues.push_back(path + ": zone list is empty");
    }
    for (int zone : fixture.zones) {
      if (zone < 0 || zone >= s.zone_count) {
        issues.push_back(path + ": zone " + std::to_string(zone) + " outside [0, " +
                         std::to_string(s.zone_count) + ")");
      }
    }
  }

  if (s.transition_smoothing < 0.0 || s.transition_smoothing > core::SmoothingFilter::kMaxAlpha) {
    issues.push_back("sync.transition_smoothing must be within [0, 0.95]");
  }
  if (s.black_threshold < 0 || s.black_threshold > 255) {
    issues.push_back("sync.black_threshold must be within [0, 255]");
  }
  if (s.max_consecutive_send_errors < 1) {
    issues.push_back("sync.max_consecutive_send_errors must be at least 1");
  }

  const std::pair<const char*, int64_t> non_negative[] = {
      {"refresh_rate_ms", s.refresh_rate_ms},
      {"idle_refresh_rate_ms", s.idle_refresh_rate_ms},
      {"black_screen_timeout_s", s.black_screen_timeout_s},
      {"wait_for_startup_s", s.wait_for_startup_s},
      {"runtime_error_threshold", s.runtime_error_threshold},
      {"error_backoff_ms", s.error_backoff_ms},
      {"stream_retry_backoff_ms", s.stream_retry_backoff_ms},
      {"powerstate_probe_after_s", s.powerstate_probe_after_s},
      {"power_on_delay_s", s.power_on_delay_s},
      {"status_interval_s", s.status_interval_s},
  };
  for (const auto& field : non_negative) {
    if (field.second < 0) {
      issues.push_back(std::string("sync.") + field.first + " must not be negative");
    }
  }
  const std::pair<const char*, int64_t> positive[] = {
      {"sample_timeout_ms", s.sample_timeout_ms},
      {"send_timeout_ms", s.send_timeout_ms},
      {"open_timeout_ms", s.open_timeout_ms},
  };
  for (const auto& field : positive) {
    if (field.second <= 0) {
      issues.push_back(std::string("sync.") + field.first + " must be positive");
    }
  }
  return issues;
}

SyncConfig LoadConfigFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError(std::vector<std::string>{"cannot read config file '" + path + "'"});
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return ParseConfig(buffer.str());
}

}  // namespace lumensync::config
