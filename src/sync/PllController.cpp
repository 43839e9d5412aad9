// Repository: DeckSync
// Component: PLL Controller
// Purpose: Bounded proportional rate correction driven by median-filtered drift.
// Copyright (c) 2025 DeckSync

#include "decksync/sync/PllController.hpp"

#include <algorithm>
#include <cmath>

namespace decksync::sync {

PllController::PllController(PllConfig config)
    : config_(config), history_(config.filter_window) {
  config_.max_correction = std::abs(config_.max_correction);
}

PllCorrection PllController::AddMeasurement(double drift_ms) {
  PllCorrection out;
  if (!std::isfinite(drift_ms)) {
    out.correction_factor = correction_factor_;
    out.filtered_drift_ms = history_.Median();
    return out;
  }

  history_.Add(drift_ms);
  const double median = history_.Median();
  out.filtered_drift_ms = median;

  if (std::abs(median) > config_.snap_threshold_ms) {
    out.should_snap = true;
    correction_factor_ = 1.0;
  } else if (std::abs(median) < config_.ignore_threshold_ms) {
    correction_factor_ = 1.0;
  } else {
    const double correction = std::clamp(-median * config_.proportional_gain,
                                         -config_.max_correction,
                                         config_.max_correction);
    correction_factor_ = 1.0 + correction;
  }

  out.correction_factor = correction_factor_;
  return out;
}

void PllController::Reset() {
  history_.Clear();
  correction_factor_ = 1.0;
}

}  // namespace decksync::sync
