// Repository: DeckSync
// Component: Transport Reconciler
// Purpose: Per-deck epoch/sequence reconciliation of server transport beacons
//          against the local playback engine.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SYNC_TRANSPORT_RECONCILER_HPP_
#define DECKSYNC_SYNC_TRANSPORT_RECONCILER_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "decksync/sync/ClockOffsetEstimator.hpp"
#include "decksync/sync/IPlaybackEngine.hpp"
#include "decksync/sync/LegacySnapCorrector.hpp"
#include "decksync/sync/PllController.hpp"
#include "decksync/sync/SyncConfig.hpp"
#include "decksync/sync/SyncTypes.hpp"
#include "decksync/time/ITimeSource.hpp"

namespace decksync::sync {

enum class BeaconOutcome {
  kStale,                 // Same epoch, seq <= last seen; state untouched
  kEpochReset,            // New epoch; state overwritten, engine commanded
  kStateCopied,           // Same epoch, not playing; state copied, no correction
  kAligned,               // Drift inside the ignore threshold
  kRateAdjusted,          // Corrected rate sent to the engine
  kSnapped,               // SeekWithCrossfade to the expected position
  kSnapDeferredCooldown,  // Snap wanted but the previous one was too recent
  kCorrectionHeld,        // Legacy mode: adjustment running or cooling down
  kClockUnreliable,       // Too few clock samples; no correction
  kPositionUnavailable,   // Engine reported a non-finite position
  kCorrectionDisabled,    // Drift measured, correction mode is kDisabled
  kEngineUnavailable,     // No engine attached or engine not ready
  kMalformedBeacon,       // Rejected before touching state
};

const char* BeaconOutcomeName(BeaconOutcome outcome);

struct BeaconResult {
  BeaconOutcome outcome = BeaconOutcome::kStale;
  std::optional<double> drift_ms;    // Raw drift, when it could be measured
  double correction_factor = 1.0;    // Factor in force after this beacon
  double effective_rate = 1.0;       // Rate the engine should now be playing at
};

struct ReconcilerStats {
  uint64_t beacons_received = 0;
  uint64_t stale_dropped = 0;
  uint64_t epoch_resets = 0;
  uint64_t snaps = 0;
  uint64_t snaps_deferred = 0;
  uint64_t rate_adjustments = 0;
  uint64_t clock_unreliable_skips = 0;
  uint64_t engine_unavailable_skips = 0;
  uint64_t malformed_rejected = 0;
  uint64_t local_actions = 0;
  uint64_t resets = 0;
};

// TransportReconciler owns one deck's TransportState and drift controllers.
//
// ApplyBeacon:
//   engine missing / not ready             -> kEngineUnavailable
//   malformed beacon                       -> kMalformedBeacon
//   same epoch, seq <= last_seen_seq       -> kStale (idempotent)
//   different epoch                        -> hard reset, controllers reset
//   same epoch, newer seq, not playing     -> copy state
//   same epoch, newer seq, playing         -> measure drift, correct per mode
//
// Corrections are always relative to the beacon's playback_rate, so they
// compose with tempo changes made by any client.
//
// Control thread only. Never throws after construction.
class TransportReconciler {
 public:
  TransportReconciler(DeckId deck_id,
                      std::shared_ptr<const ClockOffsetEstimator> clock,
                      std::shared_ptr<const time::ITimeSource> time_source,
                      ReconcilerConfig config = ReconcilerConfig(),
                      std::shared_ptr<IPlaybackEngine> engine = nullptr);

  TransportReconciler(const TransportReconciler&) = delete;
  TransportReconciler& operator=(const TransportReconciler&) = delete;

  BeaconResult ApplyBeacon(const TransportBeacon& beacon);

  // Sends the action to the engine immediately. The next beacon reconciles.
  // Returns false when the engine is unavailable or an argument is missing.
  bool ApplyLocalAction(const LocalAction& action);

  // Back to the initial state: no epoch, controllers and snap cooldown reset.
  void Reset();

  void AttachEngine(std::shared_ptr<IPlaybackEngine> engine);
  void SetCorrectionMode(CorrectionMode mode);

  const DeckId& deck_id() const { return deck_id_; }
  const TransportState& State() const { return state_; }
  const ReconcilerStats& Stats() const { return stats_; }
  CorrectionMode correction_mode() const { return config_.correction_mode; }
  double correction_factor() const { return correction_factor_; }
  bool has_engine() const { return engine_ != nullptr; }

 private:
  bool EngineReady() const;
  std::optional<std::string> ValidateBeacon(const TransportBeacon& beacon) const;

  BeaconResult HardReset(const TransportBeacon& beacon);
  BeaconResult CorrectWithPll(const TransportBeacon& beacon, double drift_ms,
                              double expected_sec);
  BeaconResult CorrectWithLegacy(const TransportBeacon& beacon, double drift_ms,
                                 double expected_sec);

  // Snap with cooldown. Returns kSnapped or kSnapDeferredCooldown.
  BeaconOutcome TrySnap(double target_sec, double drift_ms);

  // Sends `rate` unless the engine already plays at it.
  void ApplyRate(double rate);

  void ResetControllers();
  double CurrentRate() const;
  BeaconResult MakeResult(BeaconOutcome outcome, std::optional<double> drift_ms) const;
  std::string Tag() const;

  DeckId deck_id_;
  std::shared_ptr<const ClockOffsetEstimator> clock_;
  std::shared_ptr<const time::ITimeSource> time_source_;
  ReconcilerConfig config_;
  std::shared_ptr<IPlaybackEngine> engine_;

  TransportState state_;
  PllController pll_;
  LegacySnapCorrector legacy_;
  double correction_factor_ = 1.0;
  std::optional<double> applied_rate_;      // Last rate sent to the engine
  std::optional<int64_t> last_snap_at_ms_;  // Local clock

  ReconcilerStats stats_;
};

}  // namespace decksync::sync

#endif  // DECKSYNC_SYNC_TRANSPORT_RECONCILER_HPP_
