// Repository: Intermission
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; prevents multi-thread interleave.
// Copyright (c) 2026 Intermission

#ifndef INTERMISSION_UTIL_LOGGER_HPP_
#define INTERMISSION_UTIL_LOGGER_HPP_

#include <atomic>
#include <functional>
#include <mutex>
#include <string>

namespace intermission::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, guaranteeing no interleave between the tick loop, signal-driven
// shutdown, and any host thread that forwards platform notifications.
//
// Info:  stdout (normal operational logs)
// Debug: stdout only when INTERMISSION_DEBUG env is set or
//        SetDebugEnabled(true) was called (scheduler debug_logging)
// Warn:  stderr (degraded but recoverable conditions)
// Error: stderr (violations, bugs, hard faults)
//
// Test-only: the Set*Sink hooks install a callback invoked for every line of
// that level (in addition to the stream). Call with nullptr to clear.
class Logger {
 public:
  using Sink = std::function<void(const std::string&)>;

  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  static void SetDebugEnabled(bool enabled);
  static bool IsDebugEnabled();

  static void SetInfoSink(Sink sink);
  static void SetWarnSink(Sink sink);
  static void SetErrorSink(Sink sink);

 private:
  static std::mutex mutex_;
  static std::atomic<bool> debug_enabled_;
  static Sink info_sink_;
  static Sink warn_sink_;
  static Sink error_sink_;
};

}  // namespace intermission::util

#endif  // INTERMISSION_UTIL_LOGGER_HPP_
