// Repository: DeckSync
// Component: Clock Offset Estimator
// Purpose: NTP-style server clock offset from TIME_PING / TIME_PONG round trips.
// Copyright (c) 2025 DeckSync

#include "decksync/sync/ClockOffsetEstimator.hpp"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <iterator>
#include <sstream>
#include <stdexcept>

#include "decksync/util/Logger.hpp"

namespace decksync::sync {

using util::Logger;

ClockOffsetEstimator::ClockOffsetEstimator(
    std::shared_ptr<const time::ITimeSource> time_source,
    ClockEstimatorConfig config)
    : time_source_(std::move(time_source)),
      config_(config) {
  if (!time_source_) {
    throw std::invalid_argument("ClockOffsetEstimator requires a time source");
  }
  config_.window_size = std::max<size_t>(config_.window_size, 1);
  config_.max_outstanding_pings = std::max<size_t>(config_.max_outstanding_pings, 1);
}

void ClockOffsetEstimator::RecordRequestSent(int64_t t0_ms) {
  outstanding_.push_back(t0_ms);
  while (outstanding_.size() > config_.max_outstanding_pings) {
    outstanding_.pop_front();
  }
}

PingResponseResult ClockOffsetEstimator::RecordResponse(int64_t t0_ms,
                                                        int64_t server_timestamp_ms) {
  auto pending = std::find(outstanding_.begin(), outstanding_.end(), t0_ms);
  if (pending == outstanding_.end()) {
    Logger::Debug("[ClockOffsetEstimator] pong dropped t0=" + std::to_string(t0_ms) +
                  " reason=unknown_ping");
    return PingResponseResult::kRejectedUnknownPing;
  }
  outstanding_.erase(pending);

  const int64_t now = time_source_->NowUtcMs();
  if (now < t0_ms) {
    Logger::Warn("[ClockOffsetEstimator] pong dropped t0=" + std::to_string(t0_ms) +
                 " now=" + std::to_string(now) + " reason=negative_rtt");
    return PingResponseResult::kRejectedNegativeRtt;
  }

  // The server stamped its reply at the midpoint of the round trip.
  ClockSample sample;
  sample.round_trip_ms = static_cast<double>(now - t0_ms);
  sample.offset_ms = static_cast<double>(server_timestamp_ms) -
                     (static_cast<double>(t0_ms) + sample.round_trip_ms / 2.0);
  sample.captured_at_ms = now;

  std::vector<ClockSample> fresh;
  fresh.reserve(config_.window_size);
  for (const auto& s : state_.samples) {
    if (IsFresh(s, now)) {
      fresh.push_back(s);
    }
  }
  if (fresh.size() > config_.window_size - 1) {
    fresh.erase(fresh.begin(),
                fresh.begin() + static_cast<std::ptrdiff_t>(fresh.size() - (config_.window_size - 1)));
  }
  fresh.push_back(sample);
  state_.samples = std::move(fresh);

  Recompute();
  NotifyListeners();
  return PingResponseResult::kAccepted;
}

void ClockOffsetEstimator::Expire() {
  const int64_t now = time_source_->NowUtcMs();
  auto& samples = state_.samples;
  const auto stale = std::remove_if(samples.begin(), samples.end(),
                                    [&](const ClockSample& s) { return !IsFresh(s, now); });
  if (stale == samples.end()) return;

  const auto evicted = static_cast<size_t>(std::distance(stale, samples.end()));
  samples.erase(stale, samples.end());
  Logger::Debug("[ClockOffsetEstimator] expired samples=" + std::to_string(evicted) +
                " remaining=" + std::to_string(samples.size()));
  Recompute();
  NotifyListeners();
}

void ClockOffsetEstimator::Recompute() {
  const bool was_reliable = state_.is_reliable;

  std::vector<ClockSample> valid;
  if (state_.samples.empty()) {
    outlier_limit_ms_ = 0.0;
  } else {
    std::vector<double> rtts;
    rtts.reserve(state_.samples.size());
    for (const auto& s : state_.samples) {
      rtts.push_back(s.round_trip_ms);
    }
    std::sort(rtts.begin(), rtts.end());
    const double median_rtt = rtts[rtts.size() / 2];
    // A zero median would otherwise reject every sample with any latency.
    outlier_limit_ms_ = std::max(median_rtt * config_.outlier_rtt_factor, median_rtt + 1.0);

    valid.reserve(state_.samples.size());
    for (const auto& s : state_.samples) {
      if (s.round_trip_ms <= outlier_limit_ms_) {
        valid.push_back(s);
      }
    }
    if (valid.empty()) {
      valid.push_back(state_.samples.back());
    }
  }

  // With no samples left the last offset is kept as the best guess.
  if (!valid.empty()) {
    double total_weight = 0.0;
    double weighted_offset = 0.0;
    double total_rtt = 0.0;
    for (const auto& s : valid) {
      const double weight = 1.0 / (s.round_trip_ms + 1.0);
      total_weight += weight;
      weighted_offset += s.offset_ms * weight;
      total_rtt += s.round_trip_ms;
    }
    state_.average_offset_ms = weighted_offset / total_weight;
    state_.average_round_trip_ms = total_rtt / static_cast<double>(valid.size());
  }
  state_.valid_sample_count = valid.size();
  state_.is_reliable = valid.size() >= config_.min_reliable_samples;

  if (state_.is_reliable != was_reliable) {
    std::ostringstream oss;
    oss << "[ClockOffsetEstimator] clock " << (state_.is_reliable ? "reliable" : "unreliable")
        << " offset=" << state_.average_offset_ms << "ms"
        << " rtt=" << state_.average_round_trip_ms << "ms"
        << " valid=" << state_.valid_sample_count << "/" << state_.samples.size();
    if (state_.is_reliable) {
      Logger::Info(oss.str());
    } else {
      Logger::Warn(oss.str() + " reason=too_few_valid_samples");
    }
  }
}

bool ClockOffsetEstimator::IsFresh(const ClockSample& sample, int64_t now_ms) const {
  return now_ms - sample.captured_at_ms < config_.max_sample_age_ms;
}

size_t ClockOffsetEstimator::FreshValidCount(int64_t now_ms) const {
  return static_cast<size_t>(
      std::count_if(state_.samples.begin(), state_.samples.end(), [&](const ClockSample& s) {
        return IsFresh(s, now_ms) && s.round_trip_ms <= outlier_limit_ms_;
      }));
}

bool ClockOffsetEstimator::IsReliable() const {
  return state_.is_reliable &&
         FreshValidCount(time_source_->NowUtcMs()) >= config_.min_reliable_samples;
}

ClockState ClockOffsetEstimator::State() const {
  const int64_t now = time_source_->NowUtcMs();
  ClockState snapshot = state_;
  snapshot.samples.erase(
      std::remove_if(snapshot.samples.begin(), snapshot.samples.end(),
                     [&](const ClockSample& s) { return !IsFresh(s, now); }),
      snapshot.samples.end());
  snapshot.valid_sample_count = FreshValidCount(now);
  snapshot.is_reliable = state_.is_reliable &&
                         snapshot.valid_sample_count >= config_.min_reliable_samples;
  return snapshot;
}

int64_t ClockOffsetEstimator::EstimatedServerNow() const {
  return time_source_->NowUtcMs() +
         static_cast<int64_t>(std::llround(state_.average_offset_ms));
}

int64_t ClockOffsetEstimator::ServerToLocalTime(int64_t server_timestamp_ms) const {
  return server_timestamp_ms - static_cast<int64_t>(std::llround(state_.average_offset_ms));
}

ClockOffsetEstimator::SubscriptionId ClockOffsetEstimator::Subscribe(Listener listener) {
  const SubscriptionId id = next_subscription_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void ClockOffsetEstimator::Unsubscribe(SubscriptionId id) {
  listeners_.erase(id);
}

void ClockOffsetEstimator::NotifyListeners() {
  // Listeners may unsubscribe from inside the callback.
  const auto listeners = listeners_;
  for (const auto& [id, listener] : listeners) {
    if (listener) {
      listener(state_);
    }
  }
}

void ClockOffsetEstimator::Reset() {
  state_ = ClockState();
  outlier_limit_ms_ = 0.0;
  outstanding_.clear();
  Logger::Info("[ClockOffsetEstimator] reset");
  NotifyListeners();
}

}  // namespace decksync::sync
