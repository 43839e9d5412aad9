// Repository: DeckSync
// Component: Legacy Snap Corrector
// Purpose: Deprecated fixed-rate catch-up / snap drift correction, selectable
//          as CorrectionMode::kLegacySnap.
// Copyright (c) 2025 DeckSync

#include "decksync/sync/LegacySnapCorrector.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

#include "decksync/util/Logger.hpp"

namespace decksync::sync {

using util::Logger;

const char* LegacyCorrectionTypeName(LegacyCorrectionType type) {
  switch (type) {
    case LegacyCorrectionType::kNone:
      return "none";
    case LegacyCorrectionType::kRateAdjust:
      return "rate_adjust";
    case LegacyCorrectionType::kSnap:
      return "snap";
  }
  return "unknown";
}

LegacySnapCorrector::LegacySnapCorrector(
    std::shared_ptr<const time::ITimeSource> time_source,
    LegacySnapConfig config)
    : time_source_(std::move(time_source)),
      config_(config),
      history_(config.filter_window) {
  if (!time_source_) {
    throw std::invalid_argument("LegacySnapCorrector requires a time source");
  }
}

LegacyCorrection LegacySnapCorrector::Evaluate(double drift_ms,
                                               double expected_position_sec) {
  const int64_t now = time_source_->NowUtcMs();
  history_.Add(drift_ms);
  const double smoothed = history_.Median();

  LegacyCorrection out;
  out.drift_ms = smoothed;
  out.rate_factor = current_rate_;

  if (rate_adjust_ends_at_ms_) {
    if (now < *rate_adjust_ends_at_ms_) {
      out.type = LegacyCorrectionType::kRateAdjust;
      out.reason = "rate_adjust_in_progress";
      return out;
    }
    rate_adjust_ends_at_ms_.reset();
    if (std::abs(smoothed) < config_.ignore_threshold_ms) {
      current_rate_ = 1.0;
      last_correction_at_ms_ = now;
      out.type = LegacyCorrectionType::kRateAdjust;
      out.rate_factor = 1.0;
      out.applied = true;
      std::ostringstream oss;
      oss << "[LegacySnapCorrector] rate adjustment complete drift=" << smoothed << "ms";
      Logger::Info(oss.str());
      return out;
    }
  }

  if (last_correction_at_ms_ && now - *last_correction_at_ms_ < config_.cooldown_ms) {
    out.reason = "cooldown";
    return out;
  }

  const double abs_drift = std::abs(smoothed);

  if (abs_drift < config_.ignore_threshold_ms) {
    if (current_rate_ != 1.0) {
      current_rate_ = 1.0;
      out.type = LegacyCorrectionType::kRateAdjust;
      out.rate_factor = 1.0;
      out.applied = true;
      return out;
    }
    out.rate_factor = 1.0;
    out.reason = "drift_negligible";
    return out;
  }

  if (abs_drift > config_.snap_threshold_ms) {
    current_rate_ = 1.0;
    last_correction_at_ms_ = now;
    history_.Clear();

    out.type = LegacyCorrectionType::kSnap;
    out.rate_factor = 1.0;
    out.snap_to_sec = expected_position_sec;
    out.applied = true;
    std::ostringstream oss;
    oss << "[LegacySnapCorrector] snap drift=" << smoothed
        << "ms target=" << expected_position_sec << "s";
    Logger::Info(oss.str());
    return out;
  }

  const double rate = smoothed > 0 ? config_.slow_down_rate : config_.catch_up_rate;
  current_rate_ = std::clamp(rate, config_.min_rate, config_.max_rate);
  last_correction_at_ms_ = now;
  rate_adjust_ends_at_ms_ = now + config_.rate_adjust_duration_ms;

  out.type = LegacyCorrectionType::kRateAdjust;
  out.rate_factor = current_rate_;
  out.applied = true;
  std::ostringstream oss;
  oss << "[LegacySnapCorrector] rate correction drift=" << smoothed
      << "ms rate=" << current_rate_;
  Logger::Info(oss.str());
  return out;
}

void LegacySnapCorrector::Reset() {
  history_.Clear();
  current_rate_ = 1.0;
  last_correction_at_ms_.reset();
  rate_adjust_ends_at_ms_.reset();
}

}  // namespace decksync::sync
