// Repository: DeckSync
// Component: Sync Manager
// Purpose: Session owner for the clock estimator and every deck's reconciler:
//          ping scheduling, beacon fan-out, command routing and resync.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SYNC_SYNC_MANAGER_HPP_
#define DECKSYNC_SYNC_SYNC_MANAGER_HPP_

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "decksync/sync/ClockOffsetEstimator.hpp"
#include "decksync/sync/IPlaybackEngine.hpp"
#include "decksync/sync/SyncConfig.hpp"
#include "decksync/sync/SyncTypes.hpp"
#include "decksync/sync/TransportReconciler.hpp"
#include "decksync/time/ITimeSource.hpp"

namespace decksync::sync {

// SyncManager owns one ClockOffsetEstimator and one TransportReconciler per
// deck. It is the single entry point the link layer feeds; all calls happen
// on the control thread.
//
// session_generation() increments on every Resync(). Work started under an
// older generation (a ping, a scheduled correction) can compare generations
// instead of holding references into reset state.
class SyncManager {
 public:
  explicit SyncManager(std::shared_ptr<const time::ITimeSource> time_source,
                       SyncConfig config = SyncConfig());

  SyncManager(const SyncManager&) = delete;
  SyncManager& operator=(const SyncManager&) = delete;

  // ---- Decks ----
  // Returns false if the deck already exists.
  bool AddDeck(const DeckId& deck_id, std::shared_ptr<IPlaybackEngine> engine = nullptr);
  bool RemoveDeck(const DeckId& deck_id);
  bool AttachEngine(const DeckId& deck_id, std::shared_ptr<IPlaybackEngine> engine);
  bool HasDeck(const DeckId& deck_id) const;
  TransportReconciler* Deck(const DeckId& deck_id);
  const TransportReconciler* Deck(const DeckId& deck_id) const;
  std::vector<DeckId> DeckIds() const;

  // ---- Clock ----
  bool IsPingDue() const;
  // Registers a ping sent now and returns its t0 for the outbound message.
  int64_t BeginPing();
  PingResponseResult OnPingResponse(const PingResponse& response);

  // ---- Server events ----
  // Beacons for decks that were never added are ignored.
  std::map<DeckId, BeaconResult> OnBeaconTick(const BeaconTick& tick);
  std::optional<BeaconResult> OnBeacon(const TransportBeacon& beacon);

  bool OnLocalAction(const DeckId& deck_id, const LocalAction& action);
  bool OnRemoteTempoSet(const DeckId& deck_id, double playback_rate);
  bool OnRemoteSeek(const DeckId& deck_id, double position_sec);
  bool OnRemoteTransport(const DeckId& deck_id, const LocalAction& action);

  // Clears the estimator and every deck's transport and controller state.
  void Resync(const std::string& reason);

  void SetCorrectionMode(CorrectionMode mode);

  uint64_t session_generation() const { return session_generation_; }
  const ClockOffsetEstimator& clock() const { return *clock_; }
  const SyncConfig& config() const { return config_; }

 private:
  std::shared_ptr<const time::ITimeSource> time_source_;
  SyncConfig config_;
  std::shared_ptr<ClockOffsetEstimator> clock_;
  std::map<DeckId, std::unique_ptr<TransportReconciler>> decks_;

  std::optional<int64_t> last_ping_at_ms_;
  uint64_t session_generation_ = 0;
};

}  // namespace decksync::sync

#endif  // DECKSYNC_SYNC_SYNC_MANAGER_HPP_
