// Repository: LumenSync
// Component: Sync Engine
// Purpose: Top-level control loop. Pulls frames from the color sample
//          source, decides activity state, drives mixer + smoothing filter,
//          pushes frames through the session manager and applies the
//          retry / exit policy.
// Copyright (c) 2026 LumenSync
//
// PHASES
//   WaitingForDevice  initial; never connected yet; bounded by
//                     wait_for_startup_s (0 = forever)
//   Streaming         TV answering; frames mixed and sent (paused while
//                     the screen is black)
//   Idle              black screen sustained past black_screen_timeout_s;
//                     session closed, slow polling
//   Disconnected      TV stopped answering after having answered; bounded
//                     by runtime_error_threshold (0 = forever)
//   Terminated        exit code decided, loop stops
//
// STATE OWNERSHIP
//   Everything that changes between cycles (phase, counters, black-span
//   tracking, the smoothing memory, the session handle) lives in SyncState.
//   Step() takes the state by value and returns the next one. Run() is the
//   only owner of the state while the process runs.

#ifndef LUMENSYNC_CORE_SYNC_ENGINE_HPP_
#define LUMENSYNC_CORE_SYNC_ENGINE_HPP_

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "lumensync/config/SyncConfig.hpp"
#include "lumensync/core/ColorSampleSource.hpp"
#include "lumensync/core/SmoothingFilter.hpp"
#include "lumensync/core/StreamSessionManager.hpp"
#include "lumensync/time/ITimeSource.hpp"
#include "lumensync/time/IWaitStrategy.hpp"

namespace lumensync::core {

enum class SyncPhase {
  kWaitingForDevice = 0,
  kStreaming = 1,
  kIdle = 2,
  kDisconnected = 3,
  kTerminated = 4,
};

const char* SyncPhaseToString(SyncPhase phase);

struct SyncState {
  explicit SyncState(SmoothingFilter filter) : smoothing(std::move(filter)) {}

  SyncPhase phase = SyncPhase::kWaitingForDevice;
  int64_t consecutive_errors = 0;
  bool ever_connected = false;
  bool failed_during_startup = false;
  int64_t started_at_ms = -1;

  // Black-span tracking (Streaming / Idle).
  std::optional<int64_t> black_since_ms;
  bool powerstate_probed = false;

  // Outage tracking (Disconnected).
  std::optional<int64_t> outage_since_ms;

  // Session bookkeeping.
  StreamHandle handle;
  int64_t next_open_attempt_ms = 0;
  bool open_failure_logged = false;

  SmoothingFilter smoothing;

  // Status window.
  int64_t status_window_start_ms = 0;
  uint64_t frames_in_window = 0;
  uint64_t frames_sent_total = 0;

  // Output of the last Step().
  int64_t next_delay_ms = 0;
  int exit_code = 0;
  std::string exit_reason;
};

class SyncEngine {
 public:
  struct Status {
    SyncPhase phase = SyncPhase::kWaitingForDevice;
    SessionState session = SessionState::kClosed;
    int64_t consecutive_errors = 0;
    bool ever_connected = false;
    uint64_t frames_sent_total = 0;
    double last_rate_hz = 0.0;
    std::string last_transition;
  };

  // The engine keeps a copy of the config. `source`, `sessions`, `time`
  // and `wait` must outlive it.
  SyncEngine(const config::SyncConfig& config,
             IColorSampleSource& source,
             StreamSessionManager& sessions,
             const time::ITimeSource& time,
             time::IWaitStrategy& wait);

  SyncEngine(const SyncEngine&) = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  // Fresh state: WaitingForDevice, empty smoothing memory for every fixture.
  SyncState InitialState() const;

  // One cycle: sample, classify, mix, smooth, send. Returns the next state;
  // next_delay_ms says how long to wait before the following cycle.
  SyncState Step(SyncState state);

  // Loops Step() until Terminated or RequestStop(). Closes the session
  // before returning. Returns the process exit code.
  int Run();

  // Thread-safe. Interrupts the inter-cycle wait; the in-flight sample or
  // send finishes within its own timeout.
  void RequestStop();
  bool StopRequested() const { return stop_requested_.load(std::memory_order_acquire); }

  Status GetStatus() const;

 private:
  SyncState OnSampleFailure(SyncState state, const SampleResult& sample, int64_t now_ms);
  SyncState OnFrame(SyncState state, const ZoneFrame& frame, int64_t now_ms);
  SyncState OnBlackFrame(SyncState state, int64_t now_ms);
  SyncState StreamFrame(SyncState state, const ZoneFrame& frame, int64_t now_ms);

  void Transition(SyncState& state, SyncPhase to, const std::string& reason, bool warn = false);
  void EnterIdle(SyncState& state, const std::string& reason);
  void Terminate(SyncState& state, int exit_code, const std::string& reason);
  void CloseSession(SyncState& state);
  bool EnsureSession(SyncState& state, int64_t now_ms);
  void MaybeReportStatus(SyncState& state, int64_t now_ms);
  void PublishStatus(const SyncState& state);

  int64_t RetryDelayMs(const SyncState& state) const;

  const config::SyncConfig config_;
  IColorSampleSource& source_;
  StreamSessionManager& sessions_;
  const time::ITimeSource& time_;
  time::IWaitStrategy& wait_;

  std::atomic<bool> stop_requested_{false};

  mutable std::mutex status_mutex_;
  Status status_;
  std::string last_transition_;
  double last_rate_hz_ = 0.0;
};

}  // namespace lumensync::core

#endif  // LUMENSYNC_CORE_SYNC_ENGINE_HPP_
