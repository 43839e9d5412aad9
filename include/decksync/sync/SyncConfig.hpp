// Repository: DeckSync
// Component: Sync Configuration
// Purpose: Tunables for clock estimation, drift correction and reconciliation.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SYNC_SYNC_CONFIG_HPP_
#define DECKSYNC_SYNC_SYNC_CONFIG_HPP_

#include <cstddef>
#include <cstdint>

#include "decksync/sync/SyncTypes.hpp"

namespace decksync::sync {

// POD structs - immutable after the owning component is constructed.

struct ClockEstimatorConfig {
  size_t window_size = 7;             // Ping samples kept
  size_t min_reliable_samples = 5;    // Valid samples before offset is trusted
  int64_t max_sample_age_ms = 60'000; // Older samples are evicted
  double outlier_rtt_factor = 2.0;    // RTT above factor * median is an outlier
  size_t max_outstanding_pings = 32;  // Unanswered pings remembered
};

struct PllConfig {
  size_t filter_window = 5;
  double proportional_gain = 0.001;   // Correction per ms of median drift
  double max_correction = 0.02;       // Factor stays within 1 +- max_correction
  double ignore_threshold_ms = 10.0;  // Below this the deck counts as aligned
  double snap_threshold_ms = 500.0;   // Above this rate correction is too slow
};

struct LegacySnapConfig {
  size_t filter_window = 5;
  double ignore_threshold_ms = 10.0;
  double snap_threshold_ms = 100.0;
  double catch_up_rate = 1.02;
  double slow_down_rate = 0.98;
  double min_rate = 0.95;
  double max_rate = 1.05;
  int64_t cooldown_ms = 500;
  int64_t rate_adjust_duration_ms = 1'000;
};

struct ReconcilerConfig {
  CorrectionMode correction_mode = CorrectionMode::kProportionalPll;
  int snap_crossfade_ms = 50;
  int64_t snap_cooldown_ms = 500;
  double rate_epsilon = 1e-4;  // Factors closer than this to 1.0 are not applied
  PllConfig pll;
  LegacySnapConfig legacy;
};

struct SyncConfig {
  int64_t ping_interval_ms = 2'000;
  ClockEstimatorConfig clock;
  ReconcilerConfig reconciler;
};

// Applies DECKSYNC_CORRECTION_MODE (disabled|pll|legacy),
// DECKSYNC_PING_INTERVAL_MS and DECKSYNC_SNAP_COOLDOWN_MS on top of `base`.
// Unparseable values are logged and ignored.
SyncConfig ApplyEnvironmentOverrides(SyncConfig base);

}  // namespace decksync::sync

#endif  // DECKSYNC_SYNC_SYNC_CONFIG_HPP_
