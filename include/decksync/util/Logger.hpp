// Repository: DeckSync
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the control thread and link threads.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_UTIL_LOGGER_HPP_
#define DECKSYNC_UTIL_LOGGER_HPP_

#include <array>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace decksync::util {

// One static mutex; each call writes a full line, appends '\n' and flushes,
// so lines from the control thread and the link threads never interleave.
//
// Debug -> stdout, only when enabled (DECKSYNC_DEBUG or SetDebugOverride)
// Info  -> stdout
// Warn  -> stderr (suppressed corrections, skipped decks, bad messages)
// Error -> stderr (link failures)
//
// Sinks receive every emitted line of their level in addition to the stream.
// Contract tests use them to assert reason codes; pass nullptr to clear.
class Logger {
 public:
  enum class Level { kDebug = 0, kInfo, kWarn, kError };
  using Sink = std::function<void(const std::string&)>;

  static void Debug(const std::string& line) { Emit(Level::kDebug, line); }
  static void Info(const std::string& line) { Emit(Level::kInfo, line); }
  static void Warn(const std::string& line) { Emit(Level::kWarn, line); }
  static void Error(const std::string& line) { Emit(Level::kError, line); }

  static bool DebugEnabled();
  // Forces debug output on or off regardless of the environment.
  // std::nullopt restores the DECKSYNC_DEBUG check.
  static void SetDebugOverride(std::optional<bool> enabled);

  static void SetSink(Level level, Sink sink);
  static void SetInfoSink(Sink sink) { SetSink(Level::kInfo, std::move(sink)); }
  static void SetWarnSink(Sink sink) { SetSink(Level::kWarn, std::move(sink)); }
  static void SetErrorSink(Sink sink) { SetSink(Level::kError, std::move(sink)); }

 private:
  static void Emit(Level level, const std::string& line);

  static std::mutex mutex_;
  static std::array<Sink, 4> sinks_;
  static std::optional<bool> debug_override_;
};

}  // namespace decksync::util

#endif  // DECKSYNC_UTIL_LOGGER_HPP_
