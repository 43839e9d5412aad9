// Repository: DeckSync
// Component: Drift Meter
// Purpose: Signed drift between a deck's local position and the position the
//          authoritative timeline implies right now.
// Copyright (c) 2025 DeckSync

#include "decksync/sync/DriftMeter.hpp"

#include <cmath>

namespace decksync::sync {

const char* DriftSkipReasonName(DriftSkipReason reason) {
  switch (reason) {
    case DriftSkipReason::kNone:
      return "none";
    case DriftSkipReason::kNotPlaying:
      return "not_playing";
    case DriftSkipReason::kClockUnreliable:
      return "clock_unreliable";
    case DriftSkipReason::kInvalidLocalPosition:
      return "invalid_local_position";
  }
  return "unknown";
}

double ExpectedPositionSec(const TransportBeacon& beacon,
                           const ClockOffsetEstimator& clock) {
  const double elapsed_ms =
      static_cast<double>(clock.EstimatedServerNow() - beacon.server_timestamp_ms);
  const double one_way_latency_sec = clock.AverageRoundTripMs() / 2.0 / 1000.0;
  return beacon.position_sec +
         (elapsed_ms / 1000.0 + one_way_latency_sec) * beacon.playback_rate;
}

DriftMeasurement MeasureDrift(const TransportBeacon& beacon,
                              double local_position_sec,
                              const ClockOffsetEstimator& clock) {
  DriftMeasurement result;
  if (beacon.play_state != PlayState::kPlaying) {
    result.reason = DriftSkipReason::kNotPlaying;
    return result;
  }
  if (!clock.IsReliable()) {
    result.reason = DriftSkipReason::kClockUnreliable;
    return result;
  }
  if (!std::isfinite(local_position_sec)) {
    result.reason = DriftSkipReason::kInvalidLocalPosition;
    return result;
  }

  result.expected_position_sec = ExpectedPositionSec(beacon, clock);
  result.drift_ms = local_position_sec * 1000.0 - result.expected_position_sec * 1000.0;
  return result;
}

}  // namespace decksync::sync
