// Repository: DeckSync
// Component: Transport Reconciler
// Purpose: Per-deck epoch/sequence reconciliation of server transport beacons
//          against the local playback engine.
// Copyright (c) 2025 DeckSync

#include "decksync/sync/TransportReconciler.hpp"

#include <cmath>
#include <sstream>
#include <stdexcept>

#include "decksync/sync/DriftMeter.hpp"
#include "decksync/util/Logger.hpp"

namespace decksync::sync {

using util::Logger;

namespace {

const std::shared_ptr<const time::ITimeSource>& RequireTimeSource(
    const std::shared_ptr<const time::ITimeSource>& time_source) {
  if (!time_source) {
    throw std::invalid_argument("TransportReconciler requires a time source");
  }
  return time_source;
}

}  // namespace

const char* BeaconOutcomeName(BeaconOutcome outcome) {
  switch (outcome) {
    case BeaconOutcome::kStale:
      return "stale";
    case BeaconOutcome::kEpochReset:
      return "epoch_reset";
    case BeaconOutcome::kStateCopied:
      return "state_copied";
    case BeaconOutcome::kAligned:
      return "aligned";
    case BeaconOutcome::kRateAdjusted:
      return "rate_adjusted";
    case BeaconOutcome::kSnapped:
      return "snapped";
    case BeaconOutcome::kSnapDeferredCooldown:
      return "snap_deferred_cooldown";
    case BeaconOutcome::kCorrectionHeld:
      return "correction_held";
    case BeaconOutcome::kClockUnreliable:
      return "clock_unreliable";
    case BeaconOutcome::kPositionUnavailable:
      return "position_unavailable";
    case BeaconOutcome::kCorrectionDisabled:
      return "correction_disabled";
    case BeaconOutcome::kEngineUnavailable:
      return "engine_unavailable";
    case BeaconOutcome::kMalformedBeacon:
      return "malformed_beacon";
  }
  return "unknown";
}

TransportReconciler::TransportReconciler(
    DeckId deck_id,
    std::shared_ptr<const ClockOffsetEstimator> clock,
    std::shared_ptr<const time::ITimeSource> time_source,
    ReconcilerConfig config,
    std::shared_ptr<IPlaybackEngine> engine)
    : deck_id_(std::move(deck_id)),
      clock_(std::move(clock)),
      time_source_(std::move(time_source)),
      config_(config),
      engine_(std::move(engine)),
      pll_(config.pll),
      legacy_(RequireTimeSource(time_source_), config.legacy) {
  if (!clock_) {
    throw std::invalid_argument("TransportReconciler requires a clock estimator");
  }
}

// ============================================================================
// Beacons
// ============================================================================

BeaconResult TransportReconciler::ApplyBeacon(const TransportBeacon& beacon) {
  stats_.beacons_received++;

  if (!EngineReady()) {
    stats_.engine_unavailable_skips++;
    Logger::Warn(Tag() + " beacon skipped epoch=" + beacon.epoch_id +
                 " seq=" + std::to_string(beacon.epoch_seq) +
                 " reason=engine_unavailable");
    return MakeResult(BeaconOutcome::kEngineUnavailable, std::nullopt);
  }

  if (auto problem = ValidateBeacon(beacon)) {
    stats_.malformed_rejected++;
    Logger::Warn(Tag() + " beacon rejected epoch=" + beacon.epoch_id +
                 " seq=" + std::to_string(beacon.epoch_seq) + " reason=" + *problem);
    return MakeResult(BeaconOutcome::kMalformedBeacon, std::nullopt);
  }

  if (beacon.epoch_id == state_.epoch_id && beacon.epoch_seq <= state_.last_seen_seq) {
    stats_.stale_dropped++;
    Logger::Debug(Tag() + " beacon dropped epoch=" + beacon.epoch_id +
                  " seq=" + std::to_string(beacon.epoch_seq) +
                  " last_seen=" + std::to_string(state_.last_seen_seq) + " reason=stale");
    return MakeResult(BeaconOutcome::kStale, std::nullopt);
  }

  if (beacon.epoch_id != state_.epoch_id) {
    return HardReset(beacon);
  }

  // Soft correction: continuation of the current epoch.
  state_.epoch_seq = beacon.epoch_seq;
  state_.last_seen_seq = beacon.epoch_seq;
  state_.play_state = beacon.play_state;
  state_.position_sec = beacon.position_sec;
  state_.playback_rate = beacon.playback_rate;

  if (beacon.play_state != PlayState::kPlaying) {
    return MakeResult(BeaconOutcome::kStateCopied, std::nullopt);
  }

  const DriftMeasurement measurement =
      MeasureDrift(beacon, engine_->CurrentPositionSec(), *clock_);
  if (!measurement.has_value()) {
    const BeaconOutcome outcome = measurement.reason == DriftSkipReason::kClockUnreliable
                                      ? BeaconOutcome::kClockUnreliable
                                      : BeaconOutcome::kPositionUnavailable;
    if (outcome == BeaconOutcome::kClockUnreliable) {
      stats_.clock_unreliable_skips++;
    }
    Logger::Debug(Tag() + " correction skipped seq=" + std::to_string(beacon.epoch_seq) +
                  " reason=" + DriftSkipReasonName(measurement.reason));
    return MakeResult(outcome, std::nullopt);
  }

  const double drift_ms = *measurement.drift_ms;
  switch (config_.correction_mode) {
    case CorrectionMode::kProportionalPll:
      return CorrectWithPll(beacon, drift_ms, measurement.expected_position_sec);
    case CorrectionMode::kLegacySnap:
      return CorrectWithLegacy(beacon, drift_ms, measurement.expected_position_sec);
    case CorrectionMode::kDisabled:
      break;
  }

  std::ostringstream oss;
  oss << Tag() << " drift=" << drift_ms << "ms reason=correction_disabled";
  Logger::Debug(oss.str());
  return MakeResult(BeaconOutcome::kCorrectionDisabled, drift_ms);
}

std::optional<std::string> TransportReconciler::ValidateBeacon(
    const TransportBeacon& beacon) const {
  if (beacon.epoch_id.empty()) return std::string("empty_epoch_id");
  if (!std::isfinite(beacon.position_sec)) return std::string("non_finite_position");
  if (beacon.position_sec < 0.0) return std::string("negative_position");
  if (!std::isfinite(beacon.playback_rate)) return std::string("non_finite_rate");
  if (beacon.playback_rate <= 0.0) return std::string("non_positive_rate");
  return std::nullopt;
}

BeaconResult TransportReconciler::HardReset(const TransportBeacon& beacon) {
  const std::string previous_epoch = state_.epoch_id;

  state_.epoch_id = beacon.epoch_id;
  state_.epoch_seq = beacon.epoch_seq;
  state_.last_seen_seq = beacon.epoch_seq;
  state_.play_state = beacon.play_state;
  state_.position_sec = beacon.position_sec;
  state_.playback_rate = beacon.playback_rate;

  ResetControllers();
  last_snap_at_ms_.reset();
  stats_.epoch_resets++;

  // Match the beacon exactly; no interpolation across an epoch boundary.
  engine_->SetPlaybackRate(beacon.playback_rate);
  applied_rate_ = beacon.playback_rate;
  switch (beacon.play_state) {
    case PlayState::kPlaying:
      engine_->Seek(beacon.position_sec);
      engine_->Play();
      break;
    case PlayState::kPaused:
      engine_->Pause();
      engine_->Seek(beacon.position_sec);
      break;
    case PlayState::kStopped:
      engine_->Stop();
      engine_->Seek(beacon.position_sec);
      break;
    case PlayState::kCued:
      engine_->Cue(beacon.position_sec);
      break;
  }

  std::ostringstream oss;
  oss << Tag() << " epoch reset "
      << (previous_epoch.empty() ? std::string("<none>") : previous_epoch) << " -> "
      << beacon.epoch_id << " seq=" << beacon.epoch_seq
      << " state=" << PlayStateName(beacon.play_state)
      << " position=" << beacon.position_sec << "s rate=" << beacon.playback_rate;
  Logger::Info(oss.str());
  return MakeResult(BeaconOutcome::kEpochReset, std::nullopt);
}

BeaconResult TransportReconciler::CorrectWithPll(const TransportBeacon& beacon,
                                                 double drift_ms,
                                                 double expected_sec) {
  const PllCorrection correction = pll_.AddMeasurement(drift_ms);
  correction_factor_ = correction.correction_factor;

  if (correction.should_snap) {
    const BeaconOutcome outcome = TrySnap(expected_sec, correction.filtered_drift_ms);
    if (outcome == BeaconOutcome::kSnapped) {
      pll_.Reset();
    }
    ApplyRate(beacon.playback_rate);
    return MakeResult(outcome, drift_ms);
  }

  if (std::abs(correction.correction_factor - 1.0) > config_.rate_epsilon) {
    ApplyRate(beacon.playback_rate * correction.correction_factor);
    stats_.rate_adjustments++;
    std::ostringstream oss;
    oss << Tag() << " rate correction drift=" << correction.filtered_drift_ms
        << "ms factor=" << correction.correction_factor
        << " rate=" << beacon.playback_rate * correction.correction_factor;
    Logger::Debug(oss.str());
    return MakeResult(BeaconOutcome::kRateAdjusted, drift_ms);
  }

  // Aligned: drop any correction still applied, keep tempo changes.
  ApplyRate(beacon.playback_rate);
  return MakeResult(BeaconOutcome::kAligned, drift_ms);
}

BeaconResult TransportReconciler::CorrectWithLegacy(const TransportBeacon& beacon,
                                                    double drift_ms,
                                                    double expected_sec) {
  const LegacyCorrection correction = legacy_.Evaluate(drift_ms, expected_sec);
  correction_factor_ = legacy_.current_rate();

  if (correction.type == LegacyCorrectionType::kSnap && correction.snap_to_sec) {
    const BeaconOutcome outcome = TrySnap(*correction.snap_to_sec, correction.drift_ms);
    ApplyRate(beacon.playback_rate);
    return MakeResult(outcome, drift_ms);
  }

  ApplyRate(beacon.playback_rate * correction_factor_);

  if (!correction.applied) {
    if (correction.reason == "drift_negligible") {
      return MakeResult(BeaconOutcome::kAligned, drift_ms);
    }
    Logger::Debug(Tag() + " legacy correction held reason=" + correction.reason);
    return MakeResult(BeaconOutcome::kCorrectionHeld, drift_ms);
  }

  if (std::abs(correction_factor_ - 1.0) > config_.rate_epsilon) {
    stats_.rate_adjustments++;
    return MakeResult(BeaconOutcome::kRateAdjusted, drift_ms);
  }
  return MakeResult(BeaconOutcome::kAligned, drift_ms);
}

BeaconOutcome TransportReconciler::TrySnap(double target_sec, double drift_ms) {
  const int64_t now = time_source_->NowUtcMs();
  if (last_snap_at_ms_ && now - *last_snap_at_ms_ < config_.snap_cooldown_ms) {
    stats_.snaps_deferred++;
    std::ostringstream oss;
    oss << Tag() << " snap deferred drift=" << drift_ms << "ms since_last="
        << (now - *last_snap_at_ms_) << "ms reason=snap_cooldown";
    Logger::Debug(oss.str());
    return BeaconOutcome::kSnapDeferredCooldown;
  }

  engine_->SeekWithCrossfade(target_sec, config_.snap_crossfade_ms);
  last_snap_at_ms_ = now;
  stats_.snaps++;

  std::ostringstream oss;
  oss << Tag() << " snap drift=" << drift_ms << "ms target=" << target_sec
      << "s crossfade=" << config_.snap_crossfade_ms << "ms";
  Logger::Info(oss.str());
  return BeaconOutcome::kSnapped;
}

// ============================================================================
// Local actions
// ============================================================================

bool TransportReconciler::ApplyLocalAction(const LocalAction& action) {
  const char* name = LocalActionName(action.type);
  if (!EngineReady()) {
    Logger::Warn(Tag() + " local " + name + " dropped reason=engine_unavailable");
    return false;
  }

  switch (action.type) {
    case LocalAction::Type::kPlay:
      engine_->Play();
      state_.play_state = PlayState::kPlaying;
      break;
    case LocalAction::Type::kPause:
      engine_->Pause();
      state_.play_state = PlayState::kPaused;
      break;
    case LocalAction::Type::kStop:
      engine_->Stop();
      state_.play_state = PlayState::kStopped;
      break;
    case LocalAction::Type::kCue:
      if (action.position_sec &&
          (!std::isfinite(*action.position_sec) || *action.position_sec < 0.0)) {
        Logger::Warn(Tag() + " local CUE dropped reason=invalid_position");
        return false;
      }
      engine_->Cue(action.position_sec);
      state_.play_state = PlayState::kCued;
      if (action.position_sec) state_.position_sec = *action.position_sec;
      ResetControllers();
      break;
    case LocalAction::Type::kSeek:
      if (!action.position_sec || !std::isfinite(*action.position_sec) ||
          *action.position_sec < 0.0) {
        Logger::Warn(Tag() + " local SEEK dropped reason=invalid_position");
        return false;
      }
      engine_->Seek(*action.position_sec);
      state_.position_sec = *action.position_sec;
      ResetControllers();
      break;
    case LocalAction::Type::kTempoChange:
      if (!action.playback_rate || !std::isfinite(*action.playback_rate) ||
          *action.playback_rate <= 0.0) {
        Logger::Warn(Tag() + " local TEMPO_CHANGE dropped reason=invalid_rate");
        return false;
      }
      engine_->SetPlaybackRate(*action.playback_rate);
      applied_rate_ = *action.playback_rate;
      state_.playback_rate = *action.playback_rate;
      break;
  }

  stats_.local_actions++;
  Logger::Debug(Tag() + " local " + name + " applied");
  return true;
}

// ============================================================================
// Lifecycle
// ============================================================================

void TransportReconciler::Reset() {
  state_ = TransportState();
  ResetControllers();
  last_snap_at_ms_.reset();
  applied_rate_.reset();
  stats_.resets++;
  Logger::Info(Tag() + " reset");
}

void TransportReconciler::AttachEngine(std::shared_ptr<IPlaybackEngine> engine) {
  engine_ = std::move(engine);
  applied_rate_.reset();
  Logger::Info(Tag() + (engine_ ? " engine attached" : " engine detached"));
}

void TransportReconciler::SetCorrectionMode(CorrectionMode mode) {
  if (mode == config_.correction_mode) return;
  Logger::Info(Tag() + " correction mode " + CorrectionModeName(config_.correction_mode) +
               " -> " + CorrectionModeName(mode));
  config_.correction_mode = mode;
  ResetControllers();
  if (EngineReady() && !state_.epoch_id.empty()) {
    ApplyRate(state_.playback_rate);
  }
}

bool TransportReconciler::EngineReady() const {
  return engine_ != nullptr && engine_->IsReady();
}

void TransportReconciler::ApplyRate(double rate) {
  if (applied_rate_ && *applied_rate_ == rate) return;
  engine_->SetPlaybackRate(rate);
  applied_rate_ = rate;
}

void TransportReconciler::ResetControllers() {
  pll_.Reset();
  legacy_.Reset();
  correction_factor_ = 1.0;
}

double TransportReconciler::CurrentRate() const {
  return applied_rate_.value_or(state_.playback_rate);
}

BeaconResult TransportReconciler::MakeResult(BeaconOutcome outcome,
                                             std::optional<double> drift_ms) const {
  BeaconResult result;
  result.outcome = outcome;
  result.drift_ms = drift_ms;
  result.correction_factor = correction_factor_;
  result.effective_rate = CurrentRate();
  return result;
}

std::string TransportReconciler::Tag() const {
  return "[TransportReconciler deck=" + deck_id_ + "]";
}

}  // namespace decksync::sync
