// Repository: DeckSync
// Component: Sync Domain Types
// Purpose: Transport beacons, per-deck transport state, local actions and
//          correction modes shared by every sync module.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SYNC_SYNC_TYPES_HPP_
#define DECKSYNC_SYNC_SYNC_TYPES_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace decksync::sync {

// Decks are addressed by the server's deck id ("A", "B", ...).
using DeckId = std::string;

// Mirrors the external playback engine's transport states.
enum class PlayState {
  kStopped,
  kPlaying,
  kPaused,
  kCued,
};

const char* PlayStateName(PlayState state);

// Authoritative snapshot of one deck, as broadcast by the server.
// Immutable once decoded. epoch_seq increases monotonically within epoch_id.
struct TransportBeacon {
  DeckId deck_id;
  std::string epoch_id;
  uint64_t epoch_seq = 0;
  PlayState play_state = PlayState::kStopped;
  double position_sec = 0.0;
  double playback_rate = 1.0;
  int64_t server_timestamp_ms = 0;  // Server clock when position_sec was sampled
};

// One periodic broadcast: a beacon for every deck in the room.
struct BeaconTick {
  int64_t server_timestamp_ms = 0;
  uint64_t room_version = 0;
  std::vector<TransportBeacon> decks;
};

// TIME_PONG: the server's answer to a ping sent at local time t0_ms.
struct PingResponse {
  int64_t t0_ms = 0;
  int64_t server_timestamp_ms = 0;
};

// Per-deck transport state owned by the TransportReconciler.
// last_seen_seq never decreases within an epoch.
struct TransportState {
  PlayState play_state = PlayState::kStopped;
  double position_sec = 0.0;
  double playback_rate = 1.0;
  std::string epoch_id;  // Empty until the first beacon arrives
  uint64_t epoch_seq = 0;
  uint64_t last_seen_seq = 0;

  bool operator==(const TransportState& other) const {
    return play_state == other.play_state &&
           position_sec == other.position_sec &&
           playback_rate == other.playback_rate &&
           epoch_id == other.epoch_id &&
           epoch_seq == other.epoch_seq &&
           last_seen_seq == other.last_seen_seq;
  }
  bool operator!=(const TransportState& other) const { return !(*this == other); }
};

// User-originated (or server-relayed) transport command, applied optimistically.
struct LocalAction {
  enum class Type {
    kPlay,
    kPause,
    kStop,
    kCue,
    kSeek,
    kTempoChange,
  };

  Type type = Type::kPlay;
  std::optional<double> position_sec;   // CUE (optional), SEEK (required)
  std::optional<double> playback_rate;  // TEMPO_CHANGE (required)

  static LocalAction Play() { return LocalAction{Type::kPlay, std::nullopt, std::nullopt}; }
  static LocalAction Pause() { return LocalAction{Type::kPause, std::nullopt, std::nullopt}; }
  static LocalAction Stop() { return LocalAction{Type::kStop, std::nullopt, std::nullopt}; }
  static LocalAction Cue(std::optional<double> position_sec = std::nullopt) {
    return LocalAction{Type::kCue, position_sec, std::nullopt};
  }
  static LocalAction Seek(double position_sec) {
    return LocalAction{Type::kSeek, position_sec, std::nullopt};
  }
  static LocalAction TempoChange(double playback_rate) {
    return LocalAction{Type::kTempoChange, std::nullopt, playback_rate};
  }
};

const char* LocalActionName(LocalAction::Type type);

// Drift-correction strategy for soft corrections.
// kProportionalPll is authoritative; kLegacySnap is the deprecated fixed-rate
// catch-up scheme kept for backward-compatible testing.
enum class CorrectionMode {
  kDisabled,
  kProportionalPll,
  kLegacySnap,
};

const char* CorrectionModeName(CorrectionMode mode);

// Accepts "disabled", "pll" and "legacy". Returns nullopt for anything else.
std::optional<CorrectionMode> ParseCorrectionMode(const std::string& text);

}  // namespace decksync::sync

#endif  // DECKSYNC_SYNC_SYNC_TYPES_HPP_
