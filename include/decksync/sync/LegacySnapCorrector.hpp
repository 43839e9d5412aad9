// Repository: DeckSync
// Component: Legacy Snap Corrector
// Purpose: Deprecated fixed-rate catch-up / snap drift correction, selectable
//          as CorrectionMode::kLegacySnap.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SYNC_LEGACY_SNAP_CORRECTOR_HPP_
#define DECKSYNC_SYNC_LEGACY_SNAP_CORRECTOR_HPP_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include "decksync/sync/MedianFilter.hpp"
#include "decksync/sync/SyncConfig.hpp"
#include "decksync/time/ITimeSource.hpp"

namespace decksync::sync {

enum class LegacyCorrectionType {
  kNone,
  kRateAdjust,
  kSnap,
};

const char* LegacyCorrectionTypeName(LegacyCorrectionType type);

struct LegacyCorrection {
  LegacyCorrectionType type = LegacyCorrectionType::kNone;
  double rate_factor = 1.0;           // Relative to the authoritative rate
  std::optional<double> snap_to_sec;  // Set for kSnap
  double drift_ms = 0.0;              // Median-filtered drift
  bool applied = false;               // false: informational, nothing to do
  std::string reason;                 // Why nothing was applied
};

// Decision table, evaluated on the median of the last filter_window readings:
//   rate adjustment still running     -> hold (not applied)
//   inside cooldown                   -> none, reason=cooldown
//   |drift| < ignore_threshold        -> restore 1.0 if a rate was active
//   |drift| > snap_threshold          -> snap to expected, history cleared
//   otherwise                         -> slow_down_rate / catch_up_rate for
//                                        rate_adjust_duration_ms
class LegacySnapCorrector {
 public:
  LegacySnapCorrector(std::shared_ptr<const time::ITimeSource> time_source,
                      LegacySnapConfig config = LegacySnapConfig());

  LegacyCorrection Evaluate(double drift_ms, double expected_position_sec);

  void Reset();

  double current_rate() const { return current_rate_; }
  bool rate_adjust_active() const { return rate_adjust_ends_at_ms_.has_value(); }

 private:
  std::shared_ptr<const time::ITimeSource> time_source_;
  LegacySnapConfig config_;
  MedianFilter history_;

  double current_rate_ = 1.0;
  std::optional<int64_t> last_correction_at_ms_;
  std::optional<int64_t> rate_adjust_ends_at_ms_;
};

}  // namespace decksync::sync

#endif  // DECKSYNC_SYNC_LEGACY_SNAP_CORRECTOR_HPP_
