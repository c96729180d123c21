// Repository: LumenSync
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission, no interleave between threads.
// Copyright (c) 2026 LumenSync

#ifndef LUMENSYNC_UTIL_LOGGER_HPP_
#define LUMENSYNC_UTIL_LOGGER_HPP_

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace lumensync::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes. Stream output carries an "HH:MM:SS.mmm" local-time prefix.
// The sync loop, the gRPC control handlers and the signal watcher
// all log through here.
//
// Info  -> stdout (state transitions, status reports)
// Debug -> stdout only when LUMENSYNC_DEBUG is set or SetDebugEnabled(true)
// Warn  -> stderr (degraded but recoverable: device lost, send errors)
// Error -> stderr (configuration errors, hard faults)
//
// Test-only: the sink setters install a callback invoked for every line of
// that level (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetDebugEnabled(bool enabled);
  static bool DebugEnabled();

  static void SetErrorSink(std::function<void(const std::string&)> sink);
  static void SetWarnSink(std::function<void(const std::string&)> sink);
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::atomic<bool> debug_forced_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> warn_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace lumensync::util

#endif  // LUMENSYNC_UTIL_LOGGER_HPP_
