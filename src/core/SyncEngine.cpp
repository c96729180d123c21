// Repository: LumenSync
// Component: Sync Engine
// Purpose: Top-level control loop and activity state machine.
// Copyright (c) 2026 LumenSync

#include "lumensync/core/SyncEngine.hpp"

#include <algorithm>
#include <chrono>
#include <iomanip>
#include <sstream>

#include "lumensync/core/ExitCodes.hpp"
#include "lumensync/core/ZoneMixer.hpp"
#include "lumensync/util/Logger.hpp"

namespace lumensync::core {

using util::Logger;

const char* SyncPhaseToString(SyncPhase phase) {
  switch (phase) {
    case SyncPhase::kWaitingForDevice: return "WaitingForDevice";
    case SyncPhase::kStreaming: return "Streaming";
    case SyncPhase::kIdle: return "Idle";
    case SyncPhase::kDisconnected: return "Disconnected";
    case SyncPhase::kTerminated: return "Terminated";
  }
  return "Unknown";
}

SyncEngine::SyncEngine(const config::SyncConfig& config,
                       IColorSampleSource& source,
                       StreamSessionManager& sessions,
                       const time::ITimeSource& time,
                       time::IWaitStrategy& wait)
    : config_(config),
      source_(source),
      sessions_(sessions),
      time_(time),
      wait_(wait) {}

SyncState SyncEngine::InitialState() const {
  return SyncState(SmoothingFilter(config_.fixtures, config_.sync.transition_smoothing));
}

SyncState SyncEngine::Step(SyncState state) {
  if (state.phase == SyncPhase::kTerminated) {
    state.next_delay_ms = 0;
    return state;
  }

  const int64_t now_ms = time_.NowMs();
  if (state.started_at_ms < 0) {
    state.started_at_ms = now_ms;
    state.status_window_start_ms = now_ms;
  }
  MaybeReportStatus(state, now_ms);

  SampleResult sample = source_.Sample();
  if (!sample.ok()) {
    return OnSampleFailure(std::move(state), sample, now_ms);
  }
  return OnFrame(std::move(state), sample.frame, now_ms);
}

// ---------------------------------------------------------------------------
// Sample failures
// ---------------------------------------------------------------------------

SyncState SyncEngine::OnSampleFailure(SyncState state, const SampleResult& sample, int64_t now_ms) {
  const auto& sync = config_.sync;
  ++state.consecutive_errors;

  const std::string what = std::string(SampleOutcomeToString(sample.outcome)) +
                           (sample.detail.empty() ? "" : ": " + sample.detail);
  Logger::Debug("[SyncEngine] Sample failed (" + std::to_string(state.consecutive_errors) +
                " consecutive): " + what);

  if (state.phase == SyncPhase::kWaitingForDevice) {
    if (!state.failed_during_startup) {
      state.failed_during_startup = true;
      Logger::Warn("[SyncEngine] TV not answering yet, waiting: " + what);
    }
    if (sync.wait_for_startup_s > 0 &&
        now_ms - state.started_at_ms >= sync.wait_for_startup_s * 1000) {
      Terminate(state, kExitDeviceNeverFound,
                "TV did not answer within " + std::to_string(sync.wait_for_startup_s) + "s");
      return state;
    }
    if (sync.runtime_error_threshold > 0 &&
        state.consecutive_errors >= sync.runtime_error_threshold) {
      Terminate(state, kExitDeviceNeverFound,
                std::to_string(state.consecutive_errors) +
                    " consecutive sample errors before the TV ever answered, last: " + what);
      return state;
    }
    state.next_delay_ms = RetryDelayMs(state);
    return state;
  }

  if (state.phase == SyncPhase::kStreaming || state.phase == SyncPhase::kIdle) {
    state.outage_since_ms = now_ms;
    state.black_since_ms.reset();
    state.powerstate_probed = false;
    Transition(state, SyncPhase::kDisconnected, "device lost (" + what + ")", /*warn=*/true);
  }

  if (sync.runtime_error_threshold > 0 &&
      state.consecutive_errors >= sync.runtime_error_threshold) {
    Terminate(state, state.ever_connected ? kExitDeviceLost : kExitDeviceNeverFound,
              std::to_string(state.consecutive_errors) + " consecutive sample errors, last: " + what);
    return state;
  }

  // The session outlives short outages; a long one is treated like a black
  // screen and releases the bridge.
  if (state.handle.valid() && state.outage_since_ms &&
      now_ms - *state.outage_since_ms >= sync.black_screen_timeout_s * 1000) {
    Logger::Info("[SyncEngine] TV unreachable for " +
                 std::to_string(sync.black_screen_timeout_s) + "s, releasing bridge stream");
    CloseSession(state);
  }

  state.next_delay_ms = RetryDelayMs(state);
  return state;
}

int64_t SyncEngine::RetryDelayMs(const SyncState& state) const {
  const auto& sync = config_.sync;
  const bool unbounded = sync.runtime_error_threshold == 0 &&
                         (state.phase != SyncPhase::kWaitingForDevice ||
                          sync.wait_for_startup_s == 0);
  // Nothing bounds the wait, so there is no point polling a dark TV fast.
  if (unbounded) {
    return sync.idle_refresh_rate_ms;
  }
  return sync.error_backoff_ms;
}

// ---------------------------------------------------------------------------
// Successful samples
// ---------------------------------------------------------------------------

SyncState SyncEngine::OnFrame(SyncState state, const ZoneFrame& frame, int64_t now_ms) {
  const auto& sync = config_.sync;
  state.consecutive_errors = 0;

  if (state.phase == SyncPhase::kWaitingForDevice || state.phase == SyncPhase::kDisconnected) {
    const bool restored = state.phase == SyncPhase::kDisconnected;
    std::string reason = restored ? "device restored" : "device found";
    if (state.outage_since_ms) {
      reason += " after " + std::to_string((now_ms - *state.outage_since_ms) / 1000) + "s";
    }
    state.outage_since_ms.reset();
    state.ever_connected = true;
    Transition(state, SyncPhase::kStreaming, reason);

    // A TV that was off at startup answers before its ambilight has
    // settled; give it time before the first frame is used.
    if (!restored && state.failed_during_startup && sync.power_on_delay_s > 0) {
      Logger::Info("[SyncEngine] Waiting " + std::to_string(sync.power_on_delay_s) +
                   "s for TV power-on to settle");
      state.next_delay_ms = sync.power_on_delay_s * 1000;
      return state;
    }
  }

  if (source_.IsBlackScreen(frame)) {
    return OnBlackFrame(std::move(state), now_ms);
  }

  if (state.phase == SyncPhase::kIdle) {
    Transition(state, SyncPhase::kStreaming, "TV content resumed");
  } else if (state.black_since_ms) {
    Logger::Info("[SyncEngine] TV content resumed, updating lights");
  }
  state.black_since_ms.reset();
  state.powerstate_probed = false;

  return StreamFrame(std::move(state), frame, now_ms);
}

SyncState SyncEngine::OnBlackFrame(SyncState state, int64_t now_ms) {
  const auto& sync = config_.sync;
  state.next_delay_ms = sync.idle_refresh_rate_ms;

  if (state.phase == SyncPhase::kIdle) {
    return state;
  }

  if (!state.black_since_ms) {
    state.black_since_ms = now_ms;
    Logger::Info("[SyncEngine] TV screen is black, pausing light updates");
  }
  const int64_t black_for_ms = now_ms - *state.black_since_ms;

  if (sync.powerstate_probe_after_s > 0 && !state.powerstate_probed &&
      black_for_ms >= sync.powerstate_probe_after_s * 1000) {
    state.powerstate_probed = true;
    auto power = source_.PowerState();
    if (power && *power != "On") {
      EnterIdle(state, "idle: TV power state " + *power);
      return state;
    }
  }

  if (black_for_ms >= sync.black_screen_timeout_s * 1000) {
    EnterIdle(state, "idle: black screen for " + std::to_string(black_for_ms / 1000) + "s");
  }
  return state;
}

SyncState SyncEngine::StreamFrame(SyncState state, const ZoneFrame& frame, int64_t now_ms) {
  const auto& sync = config_.sync;
  state.next_delay_ms = sync.refresh_rate_ms;

  if (!EnsureSession(state, now_ms)) {
    // Keep sampling so the black/idle and outage rules still see the TV;
    // the open is retried once the backoff has passed.
    state.next_delay_ms = std::max<int64_t>(
        sync.refresh_rate_ms, std::min<int64_t>(sync.stream_retry_backoff_ms,
                                                state.next_open_attempt_ms - now_ms));
    return state;
  }

  std::vector<FixtureColor> colors = ZoneMixer::Mix(frame, config_.fixtures);
  for (auto& color : colors) {
    color = state.smoothing.Apply(color);
  }

  SendResult sent = sessions_.Send(state.handle, colors);
  switch (sent.status) {
    case SendStatus::kOk:
      ++state.frames_in_window;
      ++state.frames_sent_total;
      break;
    case SendStatus::kTransient:
      Logger::Debug("[SyncEngine] Frame send failed: " + sent.detail);
      if (sent.auto_closed) {
        Logger::Warn("[SyncEngine] Bridge stream dropped after repeated send errors, reopening");
        state.handle = StreamHandle{};
      }
      break;
    case SendStatus::kClosed:
      Logger::Warn("[SyncEngine] Bridge stream closed (" + sent.detail + "), reopening");
      state.handle = StreamHandle{};
      break;
  }
  return state;
}

bool SyncEngine::EnsureSession(SyncState& state, int64_t now_ms) {
  if (state.handle.valid() && sessions_.state() == SessionState::kOpen &&
      sessions_.handle() == state.handle) {
    return true;
  }
  state.handle = StreamHandle{};
  if (now_ms < state.next_open_attempt_ms) {
    return false;
  }

  OpenResult opened = sessions_.Open(config_.bridge.endpoint, config_.bridge.credentials);
  if (!opened.ok && opened.error == StreamError::kAlreadyOpen) {
    state.handle = sessions_.handle();
    return state.handle.valid();
  }
  if (!opened.ok) {
    state.next_open_attempt_ms = now_ms + config_.sync.stream_retry_backoff_ms;
    if (!state.open_failure_logged) {
      state.open_failure_logged = true;
      Logger::Warn(std::string("[SyncEngine] Cannot open bridge stream: ") +
                   StreamErrorToString(opened.error) +
                   (opened.detail.empty() ? "" : " (" + opened.detail + ")") +
                   ", retrying every " + std::to_string(config_.sync.stream_retry_backoff_ms) + "ms");
    }
    return false;
  }

  if (state.open_failure_logged) {
    Logger::Info("[SyncEngine] Bridge stream available again");
  }
  state.open_failure_logged = false;
  state.next_open_attempt_ms = 0;
  state.handle = opened.handle;
  return true;
}

// ---------------------------------------------------------------------------
// Transitions
// ---------------------------------------------------------------------------

void SyncEngine::Transition(SyncState& state, SyncPhase to, const std::string& reason, bool warn) {
  if (state.phase == to) return;
  std::string line = std::string("[SyncEngine] ") + SyncPhaseToString(state.phase) + " -> " +
                     SyncPhaseToString(to) + ": " + reason;
  if (warn) {
    Logger::Warn(line);
  } else {
    Logger::Info(line);
  }
  state.phase = to;
  std::lock_guard<std::mutex> lock(status_mutex_);
  last_transition_ = std::move(line);
}

void SyncEngine::EnterIdle(SyncState& state, const std::string& reason) {
  Transition(state, SyncPhase::kIdle, reason);
  CloseSession(state);
  state.next_delay_ms = config_.sync.idle_refresh_rate_ms;
}

void SyncEngine::Terminate(SyncState& state, int exit_code, const std::string& reason) {
  Transition(state, SyncPhase::kTerminated, reason, /*warn=*/true);
  CloseSession(state);
  sessions_.CloseAll();
  state.exit_code = exit_code;
  state.exit_reason = reason;
  state.next_delay_ms = 0;
  Logger::Error("[SyncEngine] Exiting with code " + std::to_string(exit_code) + ": " + reason);
}

void SyncEngine::CloseSession(SyncState& state) {
  if (state.handle.valid()) {
    sessions_.Close(state.handle);
  }
  state.handle = StreamHandle{};
}

// ---------------------------------------------------------------------------
// Status
// ---------------------------------------------------------------------------

void SyncEngine::MaybeReportStatus(SyncState& state, int64_t now_ms) {
  const int64_t interval_ms = config_.sync.status_interval_s * 1000;
  if (interval_ms <= 0) return;
  const int64_t window_ms = now_ms - state.status_window_start_ms;
  if (window_ms < interval_ms) return;

  const double hz = window_ms > 0
                        ? static_cast<double>(state.frames_in_window) * 1000.0 / window_ms
                        : 0.0;
  std::ostringstream oss;
  oss << "[SyncEngine] Status: " << SyncPhaseToString(state.phase);
  switch (state.phase) {
    case SyncPhase::kStreaming:
      if (state.black_since_ms) {
        oss << ", screen black, updates paused";
      } else {
        oss << ", " << std::fixed << std::setprecision(1) << hz << " Hz ("
            << state.frames_in_window << " frames in " << window_ms / 1000 << "s)";
      }
      break;
    case SyncPhase::kIdle:
      oss << ", waiting for content";
      break;
    case SyncPhase::kWaitingForDevice:
    case SyncPhase::kDisconnected:
      oss << ", " << state.consecutive_errors << " consecutive sample errors";
      break;
    case SyncPhase::kTerminated:
      break;
  }
  Logger::Info(oss.str());

  {
    std::lock_guard<std::mutex> lock(status_mutex_);
    last_rate_hz_ = hz;
  }
  state.status_window_start_ms = now_ms;
  state.frames_in_window = 0;
}

void SyncEngine::PublishStatus(const SyncState& state) {
  const SessionState session = sessions_.state();
  std::lock_guard<std::mutex> lock(status_mutex_);
  status_.phase = state.phase;
  status_.session = session;
  status_.consecutive_errors = state.consecutive_errors;
  status_.ever_connected = state.ever_connected;
  status_.frames_sent_total = state.frames_sent_total;
  status_.last_rate_hz = last_rate_hz_;
  status_.last_transition = last_transition_;
}

SyncEngine::Status SyncEngine::GetStatus() const {
  std::lock_guard<std::mutex> lock(status_mutex_);
  return status_;
}

// ---------------------------------------------------------------------------
// Loop
// ---------------------------------------------------------------------------

void SyncEngine::RequestStop() {
  stop_requested_.store(true, std::memory_order_release);
  wait_.Interrupt();
}

int SyncEngine::Run() {
  Logger::Info("[SyncEngine] Starting: " + std::to_string(config_.fixtures.size()) +
               " fixture(s), refresh " + std::to_string(config_.sync.refresh_rate_ms) + "ms" +
               (config_.sync.automation_mode() ? ", automation mode" : ""));

  SyncState state = InitialState();
  PublishStatus(state);

  while (!StopRequested()) {
    state = Step(std::move(state));
    PublishStatus(state);
    if (state.phase == SyncPhase::kTerminated) {
      break;
    }
    if (!wait_.WaitFor(std::chrono::milliseconds(state.next_delay_ms))) {
      break;
    }
  }

  CloseSession(state);
  sessions_.CloseAll();

  if (state.phase == SyncPhase::kTerminated) {
    return state.exit_code;
  }
  Logger::Info("[SyncEngine] Shutdown requested, bridge stream released");
  return kExitOk;
}

}  // namespace lumensync::core
