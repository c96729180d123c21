// Repository: LumenSync
// Component: Streaming Session Manager
// Purpose: Lifecycle of the low-latency channel to the lighting bridge:
//          open, send frame, auto-close on repeated transport errors, close.
// Copyright (c) 2026 LumenSync

#include "lumensync/core/StreamSessionManager.hpp"

#include <sstream>
#include <stdexcept>

#include "lumensync/util/Logger.hpp"

namespace lumensync::core {

using util::Logger;

const char* SessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::kClosed: return "Closed";
    case SessionState::kOpening: return "Opening";
    case SessionState::kOpen: return "Open";
    case SessionState::kClosing: return "Closing";
  }
  return "Unknown";
}

const char* StreamErrorToString(StreamError error) {
  switch (error) {
    case StreamError::kNone: return "NONE";
    case StreamError::kAuthRejected: return "AUTH_REJECTED";
    case StreamError::kUnreachable: return "UNREACHABLE";
    case StreamError::kNegotiationFailed: return "NEGOTIATION_FAILED";
    case StreamError::kAlreadyOpening: return "ALREADY_OPENING";
    case StreamError::kAlreadyOpen: return "ALREADY_OPEN";
  }
  return "UNKNOWN";
}

StreamSessionManager::StreamSessionManager(bridge::ILightBridge& bridge,
                                           const std::vector<Fixture>& fixtures,
                                           std::chrono::milliseconds open_timeout,
                                           std::chrono::milliseconds send_timeout,
                                           int max_consecutive_send_errors)
    : bridge_(bridge),
      open_timeout_(open_timeout),
      send_timeout_(send_timeout),
      max_consecutive_send_errors_(max_consecutive_send_errors < 1 ? 1 : max_consecutive_send_errors) {
  for (const auto& fixture : fixtures) {
    fixture_ids_.insert(fixture.id);
  }
}

StreamSessionManager::~StreamSessionManager() {
  CloseAll();
}

StreamError StreamSessionManager::MapOpenError(bridge::BridgeErrorKind kind) {
  switch (kind) {
    case bridge::BridgeErrorKind::kAuthRejected:
      return StreamError::kAuthRejected;
    case bridge::BridgeErrorKind::kUnreachable:
    case bridge::BridgeErrorKind::kTimeout:
      return StreamError::kUnreachable;
    default:
      return StreamError::kNegotiationFailed;
  }
}

OpenResult StreamSessionManager::Open(const bridge::BridgeEndpoint& endpoint,
                                      const bridge::BridgeCredentials& credentials) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == SessionState::kOpening || state_ == SessionState::kClosing) {
      return OpenResult::Failure(StreamError::kAlreadyOpening,
                                 std::string("session is ") + SessionStateToString(state_));
    }
    if (state_ == SessionState::kOpen) {
      return OpenResult::Failure(StreamError::kAlreadyOpen);
    }
    state_ = SessionState::kOpening;
  }

  // Bridge I/O runs outside the lock; kOpening keeps a second Open() out.
  auto status = bridge_.Open(endpoint, credentials, open_timeout_);

  std::lock_guard<std::mutex> lock(mutex_);
  if (!status.ok()) {
    state_ = SessionState::kClosed;
    ++open_failures_total_;
    return OpenResult::Failure(MapOpenError(status.kind), status.detail);
  }

  state_ = SessionState::kOpen;
  current_ = StreamHandle{next_generation_++};
  consecutive_send_errors_ = 0;
  ++opens_total_;
  Logger::Info("[SessionManager] Streaming session opened: " + bridge_.Describe() +
               " (generation=" + std::to_string(current_.generation) + ")");
  return OpenResult::Success(current_);
}

SendResult StreamSessionManager::Send(StreamHandle handle,
                                      const std::vector<FixtureColor>& colors) {
  for (const auto& fc : colors) {
    if (fixture_ids_.count(fc.id) == 0) {
      throw std::logic_error("StreamSessionManager: unknown fixture id " +
                             std::to_string(static_cast<int>(fc.id)));
    }
  }

  std::unique_lock<std::mutex> lock(mutex_);
  SendResult result;
  if (state_ != SessionState::kOpen || !handle.valid() || handle != current_) {
    result.status = SendStatus::kClosed;
    result.detail = std::string("session ") + SessionStateToString(state_);
    return result;
  }

  // Bridge I/O runs outside the lock so status reads never wait on it.
  lock.unlock();
  auto status = bridge_.SendFrame(colors, send_timeout_);
  lock.lock();
  if (state_ != SessionState::kOpen || handle != current_) {
    result.status = SendStatus::kClosed;
    result.detail = std::string("session ") + SessionStateToString(state_) + " during send";
    return result;
  }
  if (status.ok()) {
    consecutive_send_errors_ = 0;
    ++frames_sent_total_;
    return result;
  }

  if (status.kind == bridge::BridgeErrorKind::kClosed) {
    result.status = SendStatus::kClosed;
    result.detail = status.detail;
    CloseLocked(lock, "bridge reports stream closed");
    return result;
  }

  ++transient_errors_total_;
  ++consecutive_send_errors_;
  result.status = SendStatus::kTransient;
  result.detail = std::string(bridge::BridgeErrorKindToString(status.kind)) +
                  (status.detail.empty() ? "" : ": " + status.detail);

  if (consecutive_send_errors_ >= max_consecutive_send_errors_) {
    std::ostringstream reason;
    reason << consecutive_send_errors_ << " consecutive send errors, last: " << result.detail;
    ++auto_close_total_;
    result.auto_closed = true;
    CloseLocked(lock, reason.str());
  }
  return result;
}

void StreamSessionManager::Close(StreamHandle handle) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (state_ != SessionState::kOpen || !handle.valid() || handle != current_) {
    return;
  }
  CloseLocked(lock, "requested");
}

void StreamSessionManager::CloseAll() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (state_ != SessionState::kOpen) return;
  CloseLocked(lock, "shutdown");
}

void StreamSessionManager::CloseLocked(std::unique_lock<std::mutex>& lock,
                                       const std::string& reason) {
  // kClosing keeps Open() and Send() out while the bridge tears down.
  state_ = SessionState::kClosing;
  const uint64_t generation = current_.generation;
  current_ = StreamHandle{};
  consecutive_send_errors_ = 0;
  lock.unlock();
  bridge_.Close();
  lock.lock();
  state_ = SessionState::kClosed;
  Logger::Info("[SessionManager] Streaming session closed (" + reason +
               ", generation=" + std::to_string(generation) + ")");
}

SessionState StreamSessionManager::state() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

StreamHandle StreamSessionManager::handle() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

StreamSessionManager::Snapshot StreamSessionManager::GetSnapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  Snapshot s;
  s.state = state_;
  s.opens_total = opens_total_;
  s.open_failures_total = open_failures_total_;
  s.frames_sent_total = frames_sent_total_;
  s.transient_errors_total = transient_errors_total_;
  s.auto_close_total = auto_close_total_;
  s.consecutive_send_errors = consecutive_send_errors_;
  return s;
}

}  // namespace lumensync::core
