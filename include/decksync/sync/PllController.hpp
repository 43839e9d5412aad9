// Repository: DeckSync
// Component: PLL Controller
// Purpose: Bounded proportional rate correction driven by median-filtered drift.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SYNC_PLL_CONTROLLER_HPP_
#define DECKSYNC_SYNC_PLL_CONTROLLER_HPP_

#include "decksync/sync/MedianFilter.hpp"
#include "decksync/sync/SyncConfig.hpp"

namespace decksync::sync {

struct PllCorrection {
  double correction_factor = 1.0;  // Multiplies the authoritative playback rate
  bool should_snap = false;        // Drift too large for rate correction
  double filtered_drift_ms = 0.0;  // Median of the drift window
};

// Software phase-locked loop. Proportional only:
//
//   |median| > snap_threshold    -> should_snap, factor 1.0
//   |median| < ignore_threshold  -> aligned, factor 1.0
//   otherwise                    -> factor = 1 + clamp(-median * gain, +-max)
//
// Positive drift (local ahead) yields factor < 1, negative drift factor > 1.
// The factor never leaves [1 - max_correction, 1 + max_correction].
//
// One controller per deck. Callers Reset() after every snap and epoch change.
class PllController {
 public:
  explicit PllController(PllConfig config = PllConfig());

  // Non-finite drift is ignored; the current factor is returned unchanged.
  PllCorrection AddMeasurement(double drift_ms);

  void Reset();

  double correction_factor() const { return correction_factor_; }
  size_t history_size() const { return history_.size(); }
  const PllConfig& config() const { return config_; }

 private:
  PllConfig config_;
  MedianFilter history_;
  double correction_factor_ = 1.0;
};

}  // namespace decksync::sync

#endif  // DECKSYNC_SYNC_PLL_CONTROLLER_HPP_
