// Repository: DeckSync
// Component: Sync Configuration
// Purpose: Environment overrides for SyncConfig.
// Copyright (c) 2025 DeckSync

#include "decksync/sync/SyncConfig.hpp"

#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

#include "decksync/util/Logger.hpp"

namespace decksync::sync {

namespace {

using util::Logger;

std::optional<int64_t> ReadPositiveMs(const char* name) {
  const char* env = std::getenv(name);
  if (env == nullptr) return std::nullopt;
  try {
    size_t consumed = 0;
    const long long value = std::stoll(env, &consumed);
    if (consumed == std::string(env).size() && value > 0) {
      return static_cast<int64_t>(value);
    }
  } catch (const std::exception&) {
    // Fall through to the warning below.
  }
  Logger::Warn(std::string("[SyncConfig] ignoring ") + name + "=" + env +
               " reason=not_a_positive_integer");
  return std::nullopt;
}

}  // namespace

SyncConfig ApplyEnvironmentOverrides(SyncConfig base) {
  if (const char* mode = std::getenv("DECKSYNC_CORRECTION_MODE")) {
    if (auto parsed = ParseCorrectionMode(mode)) {
      base.reconciler.correction_mode = *parsed;
    } else {
      Logger::Warn(std::string("[SyncConfig] ignoring DECKSYNC_CORRECTION_MODE=") +
                   mode + " reason=unknown_mode");
    }
  }
  if (auto ping = ReadPositiveMs("DECKSYNC_PING_INTERVAL_MS")) {
    base.ping_interval_ms = *ping;
  }
  if (auto cooldown = ReadPositiveMs("DECKSYNC_SNAP_COOLDOWN_MS")) {
    base.reconciler.snap_cooldown_ms = *cooldown;
  }
  return base;
}

}  // namespace decksync::sync
