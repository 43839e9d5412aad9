// Repository: DeckSync
// Component: Sync Domain Types
// Purpose: Name tables for sync enums (log lines and CLI parsing).
// Copyright (c) 2025 DeckSync

#include "decksync/sync/SyncTypes.hpp"

namespace decksync::sync {

const char* PlayStateName(PlayState state) {
  switch (state) {
    case PlayState::kStopped:
      return "stopped";
    case PlayState::kPlaying:
      return "playing";
    case PlayState::kPaused:
      return "paused";
    case PlayState::kCued:
      return "cued";
  }
  return "unknown";
}

const char* LocalActionName(LocalAction::Type type) {
  switch (type) {
    case LocalAction::Type::kPlay:
      return "PLAY";
    case LocalAction::Type::kPause:
      return "PAUSE";
    case LocalAction::Type::kStop:
      return "STOP";
    case LocalAction::Type::kCue:
      return "CUE";
    case LocalAction::Type::kSeek:
      return "SEEK";
    case LocalAction::Type::kTempoChange:
      return "TEMPO_CHANGE";
  }
  return "UNKNOWN";
}

const char* CorrectionModeName(CorrectionMode mode) {
  switch (mode) {
    case CorrectionMode::kDisabled:
      return "disabled";
    case CorrectionMode::kProportionalPll:
      return "pll";
    case CorrectionMode::kLegacySnap:
      return "legacy";
  }
  return "unknown";
}

std::optional<CorrectionMode> ParseCorrectionMode(const std::string& text) {
  if (text == "disabled") return CorrectionMode::kDisabled;
  if (text == "pll") return CorrectionMode::kProportionalPll;
  if (text == "legacy") return CorrectionMode::kLegacySnap;
  return std::nullopt;
}

}  // namespace decksync::sync
