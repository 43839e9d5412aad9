// Repository: DeckSync
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission shared by the control thread and link threads.
// Copyright (c) 2025 DeckSync

#include "decksync/util/Logger.hpp"

#include <cstddef>
#include <cstdlib>
#include <iostream>

namespace decksync::util {

std::mutex Logger::mutex_;
std::array<Logger::Sink, 4> Logger::sinks_;
std::optional<bool> Logger::debug_override_;

void Logger::SetSink(Level level, Sink sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  sinks_[static_cast<size_t>(level)] = std::move(sink);
}

void Logger::SetDebugOverride(std::optional<bool> enabled) {
  std::lock_guard<std::mutex> lock(mutex_);
  debug_override_ = enabled;
}

bool Logger::DebugEnabled() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (debug_override_) return *debug_override_;
  }
  return std::getenv("DECKSYNC_DEBUG") != nullptr;
}

void Logger::Emit(Level level, const std::string& line) {
  if (level == Level::kDebug && !DebugEnabled()) return;

  std::lock_guard<std::mutex> lock(mutex_);
  const Sink& sink = sinks_[static_cast<size_t>(level)];
  if (sink) {
    sink(line);
  }
  std::ostream& out = (level == Level::kWarn || level == Level::kError) ? std::cerr : std::cout;
  out << line << '\n';
  out.flush();
}

}  // namespace decksync::util
