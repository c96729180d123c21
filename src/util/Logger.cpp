// Repository: LumenSync
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission, no interleave between threads.
// Copyright (c) 2026 LumenSync

#include "lumensync/util/Logger.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iostream>

namespace lumensync::util {

std::mutex Logger::mutex_;
std::atomic<bool> Logger::debug_forced_{false};
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::warn_sink_;
std::function<void(const std::string&)> Logger::info_sink_;

namespace {

// "HH:MM:SS.mmm " in local time. Sinks receive the bare line.
std::string TimestampPrefix() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t secs = std::chrono::system_clock::to_time_t(now);
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()).count() % 1000;
  std::tm local{};
  localtime_r(&secs, &local);
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%02d:%02d:%02d.%03d ", local.tm_hour, local.tm_min,
                local.tm_sec, static_cast<int>(millis));
  return buf;
}

// Caller holds the logger mutex.
void Emit(std::ostream& out, const std::function<void(const std::string&)>& sink,
          const std::string& line) {
  if (sink) sink(line);
  out << TimestampPrefix() << line << '\n';
  out.flush();
}

}  // namespace

void Logger::SetDebugEnabled(bool enabled) {
  debug_forced_.store(enabled, std::memory_order_relaxed);
}

bool Logger::DebugEnabled() {
  return debug_forced_.load(std::memory_order_relaxed) ||
         std::getenv("LUMENSYNC_DEBUG") != nullptr;
}

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetWarnSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  warn_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, info_sink_, line);
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cout, nullptr, "[debug] " + line);
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, warn_sink_, line);
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  Emit(std::cerr, error_sink_, line);
}

}  // namespace lumensync::util
