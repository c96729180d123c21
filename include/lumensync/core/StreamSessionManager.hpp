// Repository: LumenSync
// Component: Streaming Session Manager
// Purpose: Lifecycle of the low-latency channel to the lighting bridge:
//          open, send frame, auto-close on repeated transport errors, close.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_CORE_STREAM_SESSION_MANAGER_HPP_
#define LUMENSYNC_CORE_STREAM_SESSION_MANAGER_HPP_

#include <chrono>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "lumensync/bridge/ILightBridge.hpp"
#include "lumensync/core/ColorTypes.hpp"

namespace lumensync::core {

// Closed -> Opening -> Open -> Closing -> Closed
enum class SessionState {
  kClosed = 0,
  kOpening = 1,
  kOpen = 2,
  kClosing = 3,
};

const char* SessionStateToString(SessionState state);

enum class StreamError {
  kNone = 0,
  kAuthRejected,
  kUnreachable,
  kNegotiationFailed,
  kAlreadyOpening,  // another Open() is in flight
  kAlreadyOpen,     // session already open; use handle()
};

const char* StreamErrorToString(StreamError error);

// Identifies one open period of the session. A handle from an earlier
// open period is stale: sends on it fail fast, closes on it are no-ops.
struct StreamHandle {
  uint64_t generation = 0;

  bool valid() const { return generation != 0; }
  bool operator==(const StreamHandle& other) const { return generation == other.generation; }
  bool operator!=(const StreamHandle& other) const { return !(*this == other); }
};

struct OpenResult {
  bool ok;
  StreamHandle handle;
  StreamError error;
  std::string detail;

  static OpenResult Success(StreamHandle h) {
    return {true, h, StreamError::kNone, ""};
  }
  static OpenResult Failure(StreamError err, const std::string& detail = "") {
    return {false, {}, err, detail};
  }
};

enum class SendStatus {
  kOk = 0,
  kTransient,  // timeout or reset; handle stays open unless auto-closed
  kClosed,     // session not open or handle stale; nothing was sent
};

struct SendResult {
  SendStatus status = SendStatus::kOk;
  std::string detail;
  // True when this send's failure exhausted the consecutive error budget
  // and the manager closed the session.
  bool auto_closed = false;

  bool ok() const { return status == SendStatus::kOk; }
};

// Open, Send and Close are driven by the sync loop. state(), handle() and
// GetSnapshot() may be called from any thread and never wait on bridge
// I/O: the mutex is released while the bridge opens, sends or closes.
class StreamSessionManager {
 public:
  static constexpr int kDefaultMaxConsecutiveSendErrors = 3;

  struct Snapshot {
    SessionState state = SessionState::kClosed;
    uint64_t opens_total = 0;
    uint64_t open_failures_total = 0;
    uint64_t frames_sent_total = 0;
    uint64_t transient_errors_total = 0;
    uint64_t auto_close_total = 0;
    int consecutive_send_errors = 0;
  };

  // `fixtures` defines the ids a frame may carry.
  StreamSessionManager(bridge::ILightBridge& bridge,
                       const std::vector<Fixture>& fixtures,
                       std::chrono::milliseconds open_timeout,
                       std::chrono::milliseconds send_timeout,
                       int max_consecutive_send_errors = kDefaultMaxConsecutiveSendErrors);
  ~StreamSessionManager();

  StreamSessionManager(const StreamSessionManager&) = delete;
  StreamSessionManager& operator=(const StreamSessionManager&) = delete;

  OpenResult Open(const bridge::BridgeEndpoint& endpoint,
                  const bridge::BridgeCredentials& credentials);

  // Throws std::logic_error if `colors` carries an id outside the
  // configured fixture set.
  SendResult Send(StreamHandle handle, const std::vector<FixtureColor>& colors);

  // Idempotent. Stale or invalid handles are ignored.
  void Close(StreamHandle handle);

  // Closes whatever is open. Used on shutdown.
  void CloseAll();

  [[nodiscard]] SessionState state() const;
  [[nodiscard]] StreamHandle handle() const;
  [[nodiscard]] Snapshot GetSnapshot() const;

 private:
  // Called with `lock` held; releases it around bridge_.Close().
  void CloseLocked(std::unique_lock<std::mutex>& lock, const std::string& reason);
  static StreamError MapOpenError(bridge::BridgeErrorKind kind);

  bridge::ILightBridge& bridge_;
  std::set<FixtureId> fixture_ids_;
  std::chrono::milliseconds open_timeout_;
  std::chrono::milliseconds send_timeout_;
  int max_consecutive_send_errors_;

  mutable std::mutex mutex_;
  SessionState state_ = SessionState::kClosed;
  StreamHandle current_;
  uint64_t next_generation_ = 1;
  int consecutive_send_errors_ = 0;

  uint64_t opens_total_ = 0;
  uint64_t open_failures_total_ = 0;
  uint64_t frames_sent_total_ = 0;
  uint64_t transient_errors_total_ = 0;
  uint64_t auto_close_total_ = 0;
};

}  // namespace lumensync::core

#endif  // LUMENSYNC_CORE_STREAM_SESSION_MANAGER_HPP_
