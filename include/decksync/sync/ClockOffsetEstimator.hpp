// Repository: DeckSync
// Component: Clock Offset Estimator
// Purpose: NTP-style server clock offset from TIME_PING / TIME_PONG round trips.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SYNC_CLOCK_OFFSET_ESTIMATOR_HPP_
#define DECKSYNC_SYNC_CLOCK_OFFSET_ESTIMATOR_HPP_

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <vector>

#include "decksync/sync/SyncConfig.hpp"
#include "decksync/time/ITimeSource.hpp"

namespace decksync::sync {

struct ClockSample {
  double round_trip_ms = 0.0;
  double offset_ms = 0.0;       // server - client, estimated at round-trip midpoint
  int64_t captured_at_ms = 0;   // Local clock when the response arrived
};

struct ClockState {
  std::vector<ClockSample> samples;  // Fresh samples, oldest first
  double average_offset_ms = 0.0;
  double average_round_trip_ms = 0.0;
  size_t valid_sample_count = 0;     // Fresh samples that survived outlier rejection
  bool is_reliable = false;
};

enum class PingResponseResult {
  kAccepted,
  kRejectedUnknownPing,    // t0 never registered, or registered before Reset()
  kRejectedNegativeRtt,    // Local clock stepped backwards during the round trip
};

// ClockOffsetEstimator keeps the last N ping samples and derives a weighted
// server clock offset from them.
//
// Single writer: the ping-response handler on the control thread.
// Many readers: DriftMeter, TransportReconciler, SyncManager.
//
// Per response:
//   rtt    = now - t0
//   offset = server_ts - (t0 + rtt / 2)
// Samples older than max_sample_age_ms are evicted, samples whose RTT exceeds
// max(outlier_rtt_factor * median RTT, median RTT + 1ms) are ignored, and the
// offset is averaged with weight 1 / (rtt + 1) so low-latency samples dominate.
//
// Freshness is judged against the time source on every read: once the server
// stops answering, IsReliable() turns false as soon as fewer than
// min_reliable_samples valid samples are younger than max_sample_age_ms.
//
// Never throws. An unreachable server simply leaves IsReliable() false.
class ClockOffsetEstimator {
 public:
  using Listener = std::function<void(const ClockState&)>;
  using SubscriptionId = uint64_t;

  explicit ClockOffsetEstimator(std::shared_ptr<const time::ITimeSource> time_source,
                                ClockEstimatorConfig config = ClockEstimatorConfig());

  ClockOffsetEstimator(const ClockOffsetEstimator&) = delete;
  ClockOffsetEstimator& operator=(const ClockOffsetEstimator&) = delete;

  // Registers an outstanding ping sent at local time t0_ms.
  void RecordRequestSent(int64_t t0_ms);

  // Folds a TIME_PONG into the estimate and notifies subscribers.
  PingResponseResult RecordResponse(int64_t t0_ms, int64_t server_timestamp_ms);

  // Local now shifted onto the server's clock.
  int64_t EstimatedServerNow() const;

  // Converts a server timestamp to the local clock.
  int64_t ServerToLocalTime(int64_t server_timestamp_ms) const;

  bool IsReliable() const;
  double AverageRoundTripMs() const { return state_.average_round_trip_ms; }
  double AverageOffsetMs() const { return state_.average_offset_ms; }
  size_t OutstandingPings() const { return outstanding_.size(); }

  // Snapshot with stale samples dropped and validity judged at the current time.
  ClockState State() const;

  // Evicts stale samples; recomputes and notifies subscribers if any went.
  void Expire();

  SubscriptionId Subscribe(Listener listener);
  void Unsubscribe(SubscriptionId id);

  // Drops every sample and outstanding ping. Responses to pings sent before
  // the reset are rejected afterwards.
  void Reset();

 private:
  void Recompute();
  void NotifyListeners();
  bool IsFresh(const ClockSample& sample, int64_t now_ms) const;
  size_t FreshValidCount(int64_t now_ms) const;

  std::shared_ptr<const time::ITimeSource> time_source_;
  ClockEstimatorConfig config_;

  ClockState state_;
  double outlier_limit_ms_ = 0.0;
  std::deque<int64_t> outstanding_;  // t0 values, oldest first

  std::map<SubscriptionId, Listener> listeners_;
  SubscriptionId next_subscription_id_ = 1;
};

}  // namespace decksync::sync

#endif  // DECKSYNC_SYNC_CLOCK_OFFSET_ESTIMATOR_HPP_
