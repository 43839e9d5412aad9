// Repository: DeckSync
// Component: Sync Manager
// Purpose: Session owner for the clock estimator and every deck's reconciler:
//          ping scheduling, beacon fan-out, command routing and resync.
// Copyright (c) 2025 DeckSync

#include "decksync/sync/SyncManager.hpp"

#include <stdexcept>

#include "decksync/util/Logger.hpp"

namespace decksync::sync {

using util::Logger;

SyncManager::SyncManager(std::shared_ptr<const time::ITimeSource> time_source,
                         SyncConfig config)
    : time_source_(std::move(time_source)),
      config_(config) {
  if (!time_source_) {
    throw std::invalid_argument("SyncManager requires a time source");
  }
  clock_ = std::make_shared<ClockOffsetEstimator>(time_source_, config_.clock);
  Logger::Info(std::string("[SyncManager] created mode=") +
               CorrectionModeName(config_.reconciler.correction_mode) +
               " ping_interval=" + std::to_string(config_.ping_interval_ms) + "ms");
}

// ============================================================================
// Decks
// ============================================================================

bool SyncManager::AddDeck(const DeckId& deck_id, std::shared_ptr<IPlaybackEngine> engine) {
  if (decks_.count(deck_id) != 0) {
    Logger::Warn("[SyncManager] deck " + deck_id + " not added reason=duplicate_deck");
    return false;
  }
  decks_.emplace(deck_id, std::make_unique<TransportReconciler>(
                              deck_id, clock_, time_source_, config_.reconciler,
                              std::move(engine)));
  Logger::Info("[SyncManager] deck " + deck_id + " added");
  return true;
}

bool SyncManager::RemoveDeck(const DeckId& deck_id) {
  if (decks_.erase(deck_id) == 0) {
    return false;
  }
  Logger::Info("[SyncManager] deck " + deck_id + " removed");
  return true;
}

bool SyncManager::AttachEngine(const DeckId& deck_id,
                               std::shared_ptr<IPlaybackEngine> engine) {
  auto* deck = Deck(deck_id);
  if (deck == nullptr) {
    Logger::Warn("[SyncManager] engine not attached deck=" + deck_id +
                 " reason=unknown_deck");
    return false;
  }
  deck->AttachEngine(std::move(engine));
  return true;
}

bool SyncManager::HasDeck(const DeckId& deck_id) const {
  return decks_.count(deck_id) != 0;
}

TransportReconciler* SyncManager::Deck(const DeckId& deck_id) {
  auto it = decks_.find(deck_id);
  return it == decks_.end() ? nullptr : it->second.get();
}

const TransportReconciler* SyncManager::Deck(const DeckId& deck_id) const {
  auto it = decks_.find(deck_id);
  return it == decks_.end() ? nullptr : it->second.get();
}

std::vector<DeckId> SyncManager::DeckIds() const {
  std::vector<DeckId> ids;
  ids.reserve(decks_.size());
  for (const auto& entry : decks_) {
    ids.push_back(entry.first);
  }
  return ids;
}

// ============================================================================
// Clock
// ============================================================================

bool SyncManager::IsPingDue() const {
  if (!last_ping_at_ms_) return true;
  return time_source_->NowUtcMs() - *last_ping_at_ms_ >= config_.ping_interval_ms;
}

int64_t SyncManager::BeginPing() {
  const int64_t t0 = time_source_->NowUtcMs();
  clock_->RecordRequestSent(t0);
  last_ping_at_ms_ = t0;
  return t0;
}

PingResponseResult SyncManager::OnPingResponse(const PingResponse& response) {
  return clock_->RecordResponse(response.t0_ms, response.server_timestamp_ms);
}

// ============================================================================
// Server events
// ============================================================================

std::map<DeckId, BeaconResult> SyncManager::OnBeaconTick(const BeaconTick& tick) {
  std::map<DeckId, BeaconResult> results;
  for (const auto& beacon : tick.decks) {
    if (auto result = OnBeacon(beacon)) {
      results[beacon.deck_id] = *result;
    }
  }
  return results;
}

std::optional<BeaconResult> SyncManager::OnBeacon(const TransportBeacon& beacon) {
  // Subscribers learn about a clock gone stale before the beacon is judged.
  clock_->Expire();
  auto* deck = Deck(beacon.deck_id);
  if (deck == nullptr) {
    Logger::Debug("[SyncManager] beacon ignored deck=" + beacon.deck_id +
                  " reason=unknown_deck");
    return std::nullopt;
  }
  return deck->ApplyBeacon(beacon);
}

bool SyncManager::OnLocalAction(const DeckId& deck_id, const LocalAction& action) {
  auto* deck = Deck(deck_id);
  if (deck == nullptr) {
    Logger::Warn(std::string("[SyncManager] ") + LocalActionName(action.type) +
                 " dropped deck=" + deck_id + " reason=unknown_deck");
    return false;
  }
  return deck->ApplyLocalAction(action);
}

bool SyncManager::OnRemoteTempoSet(const DeckId& deck_id, double playback_rate) {
  return OnLocalAction(deck_id, LocalAction::TempoChange(playback_rate));
}

bool SyncManager::OnRemoteSeek(const DeckId& deck_id, double position_sec) {
  return OnLocalAction(deck_id, LocalAction::Seek(position_sec));
}

bool SyncManager::OnRemoteTransport(const DeckId& deck_id, const LocalAction& action) {
  return OnLocalAction(deck_id, action);
}

// ============================================================================
// Session
// ============================================================================

void SyncManager::Resync(const std::string& reason) {
  clock_->Reset();
  for (auto& entry : decks_) {
    entry.second->Reset();
  }
  last_ping_at_ms_.reset();
  session_generation_++;
  Logger::Info("[SyncManager] resync generation=" + std::to_string(session_generation_) +
               " reason=" + reason);
}

void SyncManager::SetCorrectionMode(CorrectionMode mode) {
  config_.reconciler.correction_mode = mode;
  for (auto& entry : decks_) {
    entry.second->SetCorrectionMode(mode);
  }
}

}  // namespace decksync::sync
