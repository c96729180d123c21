// Repository: LumenSync
// Component: lumensync executable
// Purpose: Process entry point. Loads the config, wires the TV adapter,
//          bridge adapter, session manager and sync engine, and maps the
//          outcome to an exit code.
// Copyright (c) 2026 LumenSync
//
// MODES OF OPERATION:
// 1. Sync (default): run until a signal, a control-plane shutdown request,
//    or the retry policy gives up.
// 2. --verify tv: authenticate and fetch one ambilight frame, then exit.
// 3. --verify bridge: activate the entertainment configuration, open the
//    DTLS stream, send one black frame, close, then exit.

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "lumensync/Version.hpp"
#include "lumensync/bridge/HueEntertainmentBridge.hpp"
#include "lumensync/config/ConfigLoader.hpp"
#include "lumensync/control/SyncControlService.hpp"
#include "lumensync/core/ColorSampleSource.hpp"
#include "lumensync/core/ExitCodes.hpp"
#include "lumensync/core/StreamSessionManager.hpp"
#include "lumensync/core/SyncEngine.hpp"
#include "lumensync/time/ITimeSource.hpp"
#include "lumensync/time/IWaitStrategy.hpp"
#include "lumensync/tv/JointSpaceTvDevice.hpp"
#include "lumensync/util/Logger.hpp"

namespace {

using lumensync::util::Logger;
namespace core = lumensync::core;

// =============================================================================
// Global state for signal handling
// =============================================================================
std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

// =============================================================================
// CLI Arguments
// =============================================================================
constexpr const char* kDefaultConfigPath = "lumensync.json";

struct CliArgs {
  std::string config_path;
  std::string control_address;  // empty = no control plane
  std::string verify_target;    // "", "tv" or "bridge"
  bool debug = false;
  bool help = false;
  bool version = false;
  bool valid = false;
  std::string error;
};

void PrintUsage(const char* program_name) {
  std::cerr << "Usage: " << program_name << " [OPTIONS]\n"
            << "\n"
            << "Mirrors the ambilight colors of a JointSpace TV onto Hue lights\n"
            << "through an Entertainment streaming session.\n"
            << "\n"
            << "OPTIONS:\n"
            << "  --config PATH             JSON config file (default: $LUMENSYNC_CONFIG,\n"
            << "                            then " << kDefaultConfigPath << ")\n"
            << "  --control-address H:P     Serve the SyncControl gRPC API on H:P\n"
            << "  --verify tv|bridge        Probe one side once and exit (0 ok, 12 failed)\n"
            << "  --debug                   Enable debug logging (also LUMENSYNC_DEBUG)\n"
            << "  --version                 Print version and exit\n"
            << "  --help                    Show this help message\n"
            << "\n"
            << "EXIT CODES:\n"
            << "  0   graceful shutdown\n"
            << "  1   usage or configuration error\n"
            << "  10  TV lost after streaming; error threshold exhausted\n"
            << "  11  TV never answered (wait_for_startup_s elapsed or error threshold\n"
            << "      exhausted before the first successful sample)\n"
            << "  12  --verify failed\n"
            << "\n"
            << "EXAMPLES:\n"
            << "  " << program_name << " --config /etc/lumensync.json\n"
            << "  " << program_name << " --config lumensync.json --verify tv\n"
            << "  " << program_name << " --control-address 127.0.0.1:50071 --debug\n"
            << "\n";
}

CliArgs ParseArgs(int argc, char* argv[]) {
  CliArgs args;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help" || arg == "-h") {
      args.help = true;
      args.valid = true;
      return args;
    } else if (arg == "--version") {
      args.version = true;
      args.valid = true;
      return args;
    } else if (arg == "--config" && i + 1 < argc) {
      args.config_path = argv[++i];
    } else if (arg == "--control-address" && i + 1 < argc) {
      args.control_address = argv[++i];
    } else if (arg == "--verify" && i + 1 < argc) {
      args.verify_target = argv[++i];
    } else if (arg == "--debug") {
      args.debug = true;
    } else {
      args.error = "Unknown or incomplete argument: " + arg;
      return args;
    }
  }

  if (!args.verify_target.empty() && args.verify_target != "tv" &&
      args.verify_target != "bridge") {
    args.error = "--verify expects 'tv' or 'bridge', got '" + args.verify_target + "'";
    return args;
  }

  if (args.config_path.empty()) {
    const char* env = std::getenv("LUMENSYNC_CONFIG");
    args.config_path = (env && *env) ? env : kDefaultConfigPath;
  }

  args.valid = true;
  return args;
}

// =============================================================================
// Verification modes
// =============================================================================

int VerifyTv(const lumensync::config::SyncConfig& config) {
  std::unique_ptr<lumensync::tv::ITvDevice> device = lumensync::tv::CreateTvDevice(config.tv);
  const std::chrono::milliseconds timeout{config.sync.open_timeout_ms};
  Logger::Info("[Verify] TV: " + device->Describe());

  const lumensync::tv::TvError auth = device->Authenticate(timeout);
  if (auth.kind != lumensync::tv::TvErrorKind::kNone) {
    Logger::Error(std::string("[Verify] TV authentication failed: ") +
                  lumensync::tv::TvErrorKindToString(auth.kind) + " " + auth.detail);
    return core::kExitVerifyFailed;
  }

  const lumensync::tv::TvFrameResult frame = device->FetchZoneFrame(timeout);
  if (!frame.ok) {
    Logger::Error(std::string("[Verify] TV ambilight fetch failed: ") +
                  lumensync::tv::TvErrorKindToString(frame.error.kind) + " " +
                  frame.error.detail);
    return core::kExitVerifyFailed;
  }
  Logger::Info("[Verify] TV answered with " + std::to_string(frame.frame.zones.size()) +
               " zones (configured zone_count " + std::to_string(config.sync.zone_count) +
               ")");
  if (frame.frame.zones.size() != static_cast<size_t>(config.sync.zone_count)) {
    Logger::Error("[Verify] zone count mismatch; fix sync.zone_count");
    return core::kExitVerifyFailed;
  }

  if (device->SupportsPowerState()) {
    const lumensync::tv::TvPowerStateResult power = device->QueryPowerState(timeout);
    if (power.ok) {
      Logger::Info("[Verify] TV power state: " + power.power_state);
    } else {
      Logger::Warn(std::string("[Verify] TV power state unavailable: ") +
                   lumensync::tv::TvErrorKindToString(power.error.kind));
    }
  }

  Logger::Info("[Verify] TV OK");
  return core::kExitOk;
}

int VerifyBridge(const lumensync::config::SyncConfig& config) {
  lumensync::bridge::HueEntertainmentBridge bridge;
  const std::chrono::milliseconds open_timeout{config.sync.open_timeout_ms};
  const std::chrono::milliseconds send_timeout{config.sync.send_timeout_ms};

  Logger::Info("[Verify] Bridge: " + config.bridge.endpoint.host);
  const lumensync::bridge::BridgeStatus opened =
      bridge.Open(config.bridge.endpoint, config.bridge.credentials, open_timeout);
  if (!opened.ok()) {
    Logger::Error(std::string("[Verify] Bridge stream open failed: ") +
                  lumensync::bridge::BridgeErrorKindToString(opened.kind) + " " +
                  opened.detail);
    return core::kExitVerifyFailed;
  }

  std::vector<core::FixtureColor> black;
  black.reserve(config.fixtures.size());
  for (const auto& fixture : config.fixtures) {
    black.push_back(core::FixtureColor{fixture.id, core::RgbF{0.0, 0.0, 0.0}});
  }
  const lumensync::bridge::BridgeStatus sent = bridge.SendFrame(black, send_timeout);
  bridge.Close();
  if (!sent.ok()) {
    Logger::Error(std::string("[Verify] Bridge frame send failed: ") +
                  lumensync::bridge::BridgeErrorKindToString(sent.kind) + " " + sent.detail);
    return core::kExitVerifyFailed;
  }

  Logger::Info("[Verify] Bridge OK (" + bridge.Describe() + ")");
  return core::kExitOk;
}

// =============================================================================
// Sync mode
// =============================================================================

int RunSync(const lumensync::config::SyncConfig& config, const CliArgs& args) {
  const auto& sync = config.sync;

  std::unique_ptr<lumensync::tv::ITvDevice> device = lumensync::tv::CreateTvDevice(config.tv);
  lumensync::time::SteadyTimeSource clock;
  lumensync::time::RealtimeWaitStrategy wait;

  core::TvColorSampleSource source(*device, clock,
                                   std::chrono::milliseconds(sync.sample_timeout_ms),
                                   static_cast<size_t>(sync.zone_count), sync.black_threshold);

  lumensync::bridge::HueEntertainmentBridge bridge;
  core::StreamSessionManager sessions(bridge, config.fixtures,
                                      std::chrono::milliseconds(sync.open_timeout_ms),
                                      std::chrono::milliseconds(sync.send_timeout_ms),
                                      sync.max_consecutive_send_errors);

  core::SyncEngine engine(config, source, sessions, clock, wait);

  std::unique_ptr<lumensync::control::ControlServer> control;
  if (!args.control_address.empty()) {
    control = std::make_unique<lumensync::control::ControlServer>(engine, sessions);
    if (!control->Start(args.control_address)) {
      return core::kExitUsage;
    }
  }

  Logger::Info("[Main] TV " + device->Describe() + ", bridge " + bridge.Describe());

  // Signal handlers only flip a flag; this thread turns it into a stop
  // request so the engine's wait is interrupted outside signal context.
  std::atomic<bool> engine_done{false};
  std::thread signal_watcher([&engine, &engine_done] {
    while (!engine_done.load(std::memory_order_acquire)) {
      if (g_termination_requested.load(std::memory_order_acquire)) {
        Logger::Info("[Main] Termination signal received, stopping");
        engine.RequestStop();
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
  });

  const int exit_code = engine.Run();

  engine_done.store(true, std::memory_order_release);
  signal_watcher.join();
  if (control) control->Stop();

  Logger::Info("[Main] Exiting with code " + std::to_string(exit_code));
  return exit_code;
}

}  // namespace

int main(int argc, char* argv[]) {
  CliArgs args = ParseArgs(argc, argv);

  if (args.help) {
    PrintUsage(argv[0]);
    return core::kExitOk;
  }
  if (args.version) {
    std::cout << "lumensync " << lumensync::kVersion << " (control API "
              << lumensync::kControlApiVersion << ")\n";
    return core::kExitOk;
  }
  if (!args.valid) {
    std::cerr << "Error: " << args.error << "\n\n";
    PrintUsage(argv[0]);
    return core::kExitUsage;
  }

  if (args.debug) {
    Logger::SetDebugEnabled(true);
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);
  std::signal(SIGPIPE, SIG_IGN);

  lumensync::config::SyncConfig config;
  try {
    config = lumensync::config::LoadConfigFile(args.config_path);
  } catch (const lumensync::config::ConfigError& e) {
    Logger::Error("[Config] " + args.config_path + " is invalid:");
    for (const auto& issue : e.issues()) {
      Logger::Error("[Config]   " + issue);
    }
    return core::kExitUsage;
  }

  try {
    if (args.verify_target == "tv") return VerifyTv(config);
    if (args.verify_target == "bridge") return VerifyBridge(config);
  } catch (const std::invalid_argument& e) {
    Logger::Error(std::string("[Main] ") + e.what());
    return core::kExitUsage;
  }

  Logger::Info(std::string("[Main] lumensync ") + lumensync::kVersion + " using " +
               args.config_path);
  try {
    return RunSync(config, args);
  } catch (const std::invalid_argument& e) {
    Logger::Error(std::string("[Main] ") + e.what());
    return core::kExitUsage;
  }
}
