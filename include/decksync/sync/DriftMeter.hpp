// Repository: DeckSync
// Component: Drift Meter
// Purpose: Signed drift between a deck's local position and the position the
//          authoritative timeline implies right now.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SYNC_DRIFT_METER_HPP_
#define DECKSYNC_SYNC_DRIFT_METER_HPP_

#include <optional>

#include "decksync/sync/ClockOffsetEstimator.hpp"
#include "decksync/sync/SyncTypes.hpp"

namespace decksync::sync {

enum class DriftSkipReason {
  kNone,                  // drift_ms holds a measurement
  kNotPlaying,            // Beacon describes a deck that is not advancing
  kClockUnreliable,       // Too few valid clock samples
  kInvalidLocalPosition,  // Engine reported a non-finite position
};

const char* DriftSkipReasonName(DriftSkipReason reason);

// "No measurement" is distinct from a measured zero: drift_ms is empty
// whenever reason != kNone.
struct DriftMeasurement {
  std::optional<double> drift_ms;  // local - expected; positive = local ahead
  double expected_position_sec = 0.0;
  DriftSkipReason reason = DriftSkipReason::kNone;

  bool has_value() const { return drift_ms.has_value(); }
};

// expected = position + (elapsed_since_beacon + rtt / 2) * rate
// drift    = (local - expected) in milliseconds
//
// elapsed_since_beacon uses the estimator's server clock. The one-way latency
// term assumes the beacon took half a round trip to arrive.
DriftMeasurement MeasureDrift(const TransportBeacon& beacon,
                              double local_position_sec,
                              const ClockOffsetEstimator& clock);

// Expected position only; no reliability or play-state checks.
double ExpectedPositionSec(const TransportBeacon& beacon,
                           const ClockOffsetEstimator& clock);

}  // namespace decksync::sync

#endif  // DECKSYNC_SYNC_DRIFT_METER_HPP_
