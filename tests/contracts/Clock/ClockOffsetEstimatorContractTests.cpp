// Repository: DeckSync
// Component: Clock Offset Estimator Contract Tests
// Purpose: Offset convergence, outlier rejection, sample aging and stale-pong
//          rejection for ClockOffsetEstimator.
// Copyright (c) 2025 DeckSync

#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "decksync/sync/ClockOffsetEstimator.hpp"
#include "decksync/util/Logger.hpp"
#include "support/ClockPriming.hpp"
#include "support/DeterministicTimeSource.hpp"

using namespace decksync;
using namespace decksync::sync;
using decksync::tests::DeterministicTimeSource;
using decksync::tests::PrimeClock;
using decksync::util::Logger;

namespace {

class ClockOffsetEstimatorContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    time_ = std::make_shared<DeterministicTimeSource>(1'000'000);
    clock_ = std::make_unique<ClockOffsetEstimator>(time_);
  }

  void TearDown() override {
    Logger::SetInfoSink(nullptr);
    Logger::SetWarnSink(nullptr);
  }

  // One ping with an explicit round trip and server stamp.
  PingResponseResult Sample(int64_t rtt_ms, int64_t server_ts_delta_ms) {
    const int64_t t0 = time_->NowUtcMs();
    clock_->RecordRequestSent(t0);
    time_->AdvanceMs(rtt_ms);
    return clock_->RecordResponse(t0, t0 + server_ts_delta_ms);
  }

  std::shared_ptr<DeterministicTimeSource> time_;
  std::unique_ptr<ClockOffsetEstimator> clock_;
};

// =============================================================================
// Convergence and reliability
// =============================================================================

TEST_F(ClockOffsetEstimatorContractTest, ConstantRoundTripConvergesToTrueOffset) {
  PrimeClock(*clock_, *time_, /*offset_ms=*/250, /*rtt_ms=*/40);

  EXPECT_NEAR(clock_->AverageOffsetMs(), 250.0, 1e-9);
  EXPECT_NEAR(clock_->AverageRoundTripMs(), 40.0, 1e-9);
  EXPECT_TRUE(clock_->IsReliable());
  EXPECT_EQ(clock_->State().valid_sample_count, 5u);
}

TEST_F(ClockOffsetEstimatorContractTest, ReliableExactlyAtFifthValidSample) {
  for (int i = 0; i < 4; ++i) {
    PrimeClock(*clock_, *time_, 100, 20, 1);
    EXPECT_FALSE(clock_->IsReliable()) << "after sample " << (i + 1);
  }
  PrimeClock(*clock_, *time_, 100, 20, 1);
  EXPECT_TRUE(clock_->IsReliable());
}

TEST_F(ClockOffsetEstimatorContractTest, UnreachableServerNeverBecomesReliable) {
  for (int i = 0; i < 10; ++i) {
    clock_->RecordRequestSent(time_->NowUtcMs());
    time_->AdvanceMs(2'000);
  }
  EXPECT_FALSE(clock_->IsReliable());
  EXPECT_TRUE(clock_->State().samples.empty());
}

TEST_F(ClockOffsetEstimatorContractTest, ReliableTransitionIsLoggedOnce) {
  std::vector<std::string> info;
  Logger::SetInfoSink([&](const std::string& line) { info.push_back(line); });

  PrimeClock(*clock_, *time_, 100, 20, 6);

  ASSERT_EQ(info.size(), 1u);
  EXPECT_EQ(info[0].rfind("[ClockOffsetEstimator] clock reliable", 0), 0u);
  EXPECT_NE(info[0].find("offset=100ms"), std::string::npos);
  EXPECT_NE(info[0].find("valid=5/5"), std::string::npos);
}

TEST_F(ClockOffsetEstimatorContractTest, EstimatedServerNowAppliesOffset) {
  PrimeClock(*clock_, *time_, 500, 20);
  EXPECT_EQ(clock_->EstimatedServerNow(), time_->NowUtcMs() + 500);
  EXPECT_EQ(clock_->ServerToLocalTime(10'500), 10'000);
}

// =============================================================================
// Outlier rejection
// =============================================================================

TEST_F(ClockOffsetEstimatorContractTest, SlowAsymmetricSampleIsDiscarded) {
  PrimeClock(*clock_, *time_, 100, 20, 6);
  // 200 ms round trip whose delay was all on the return path: a naive
  // midpoint estimate would read offset 190.
  ASSERT_EQ(Sample(200, 290), PingResponseResult::kAccepted);

  EXPECT_NEAR(clock_->AverageOffsetMs(), 100.0, 1e-9);
  EXPECT_EQ(clock_->State().valid_sample_count, 6u);
  EXPECT_EQ(clock_->State().samples.size(), 7u);
}

TEST_F(ClockOffsetEstimatorContractTest, OutlierShiftsOffsetByLittleWhenMedianIsHigh) {
  // Uniform 40 ms samples plus one at 10x the median.
  PrimeClock(*clock_, *time_, 0, 40, 6);
  ASSERT_EQ(Sample(400, 300), PingResponseResult::kAccepted);
  EXPECT_LE(std::abs(clock_->AverageOffsetMs()), 1.0);
}

TEST_F(ClockOffsetEstimatorContractTest, ZeroMedianRoundTripKeepsOneMsSamples) {
  // Loopback server: the median RTT is 0 ms, yet 1 ms samples are not outliers.
  for (int i = 0; i < 3; ++i) {
    ASSERT_EQ(Sample(1, 0), PingResponseResult::kAccepted);
  }
  for (int i = 0; i < 4; ++i) {
    ASSERT_EQ(Sample(0, 0), PingResponseResult::kAccepted);
  }

  EXPECT_EQ(clock_->State().samples.size(), 7u);
  EXPECT_EQ(clock_->State().valid_sample_count, 7u);
  EXPECT_TRUE(clock_->IsReliable());
}

TEST_F(ClockOffsetEstimatorContractTest, OutlierLimitStillAppliesAtZeroMedian) {
  PrimeClock(*clock_, *time_, 0, 0, 6);
  ASSERT_EQ(Sample(2, 500), PingResponseResult::kAccepted);

  EXPECT_EQ(clock_->State().valid_sample_count, 6u);
  EXPECT_NEAR(clock_->AverageOffsetMs(), 0.0, 1e-9);
}

TEST_F(ClockOffsetEstimatorContractTest, LowLatencySamplesDominateWeightedOffset) {
  Sample(10, 5 + 100);   // offset 100
  Sample(18, 9 + 200);   // offset 200, weight 1/19 vs 1/11
  const double expected = (100.0 / 11.0 + 200.0 / 19.0) / (1.0 / 11.0 + 1.0 / 19.0);
  EXPECT_NEAR(clock_->AverageOffsetMs(), expected, 1e-9);
  EXPECT_NEAR(clock_->AverageRoundTripMs(), 14.0, 1e-9);
}

// =============================================================================
// Window and aging
// =============================================================================

TEST_F(ClockOffsetEstimatorContractTest, WindowKeepsSevenSamples) {
  PrimeClock(*clock_, *time_, 10, 20, 12);
  EXPECT_EQ(clock_->State().samples.size(), 7u);
}

TEST_F(ClockOffsetEstimatorContractTest, SamplesOlderThanSixtySecondsAreEvicted) {
  PrimeClock(*clock_, *time_, 10, 20, 5);
  ASSERT_TRUE(clock_->IsReliable());

  time_->AdvanceMs(60'000);
  PrimeClock(*clock_, *time_, 30, 20, 1);

  EXPECT_EQ(clock_->State().samples.size(), 1u);
  EXPECT_FALSE(clock_->IsReliable());
  EXPECT_NEAR(clock_->AverageOffsetMs(), 30.0, 1e-9);
}

TEST_F(ClockOffsetEstimatorContractTest, ClockGoesUnreliableWhenSamplesAgeOutWithoutNewPongs) {
  PrimeClock(*clock_, *time_, 10, 20, 5);
  ASSERT_TRUE(clock_->IsReliable());

  time_->AdvanceMs(60'000);

  EXPECT_FALSE(clock_->IsReliable());
  const ClockState state = clock_->State();
  EXPECT_FALSE(state.is_reliable);
  EXPECT_TRUE(state.samples.empty());
  EXPECT_EQ(state.valid_sample_count, 0u);
}

TEST_F(ClockOffsetEstimatorContractTest, PartialAgingDropsBelowReliableThreshold) {
  PrimeClock(*clock_, *time_, 10, 20, 3);
  time_->AdvanceMs(30'000);
  PrimeClock(*clock_, *time_, 10, 20, 2);
  ASSERT_TRUE(clock_->IsReliable());

  // The first three samples cross sixty seconds, the last two do not.
  time_->AdvanceMs(30'000);

  EXPECT_FALSE(clock_->IsReliable());
  EXPECT_EQ(clock_->State().samples.size(), 2u);
  EXPECT_EQ(clock_->State().valid_sample_count, 2u);
}

TEST_F(ClockOffsetEstimatorContractTest, ExpireEvictsStaleSamplesAndNotifies) {
  std::vector<std::string> warnings;
  Logger::SetWarnSink([&](const std::string& line) { warnings.push_back(line); });
  PrimeClock(*clock_, *time_, 10, 20, 5);

  int notifications = 0;
  bool last_reliable = true;
  clock_->Subscribe([&](const ClockState& state) {
    notifications++;
    last_reliable = state.is_reliable;
  });

  clock_->Expire();
  EXPECT_EQ(notifications, 0);

  time_->AdvanceMs(60'000);
  clock_->Expire();
  EXPECT_EQ(notifications, 1);
  EXPECT_FALSE(last_reliable);
  ASSERT_EQ(warnings.size(), 1u);
  EXPECT_NE(warnings[0].find("clock unreliable"), std::string::npos);
  EXPECT_NE(warnings[0].find("reason=too_few_valid_samples"), std::string::npos);
  // The last estimate survives as a best guess until fresh pongs arrive.
  EXPECT_NEAR(clock_->AverageOffsetMs(), 10.0, 1e-9);

  clock_->Expire();
  EXPECT_EQ(notifications, 1);
}

// =============================================================================
// Stale and invalid responses
// =============================================================================

TEST_F(ClockOffsetEstimatorContractTest, UnregisteredPongIsRejected) {
  EXPECT_EQ(clock_->RecordResponse(time_->NowUtcMs(), 123), PingResponseResult::kRejectedUnknownPing);
  EXPECT_TRUE(clock_->State().samples.empty());
}

TEST_F(ClockOffsetEstimatorContractTest, PongIsAcceptedOnlyOnce) {
  const int64_t t0 = time_->NowUtcMs();
  clock_->RecordRequestSent(t0);
  time_->AdvanceMs(20);
  EXPECT_EQ(clock_->RecordResponse(t0, t0 + 10), PingResponseResult::kAccepted);
  EXPECT_EQ(clock_->RecordResponse(t0, t0 + 10), PingResponseResult::kRejectedUnknownPing);
  EXPECT_EQ(clock_->State().samples.size(), 1u);
}

TEST_F(ClockOffsetEstimatorContractTest, NegativeRoundTripIsRejected) {
  const int64_t t0 = time_->NowUtcMs() + 500;
  clock_->RecordRequestSent(t0);
  EXPECT_EQ(clock_->RecordResponse(t0, t0), PingResponseResult::kRejectedNegativeRtt);
  EXPECT_TRUE(clock_->State().samples.empty());
}

TEST_F(ClockOffsetEstimatorContractTest, PongForPingSentBeforeResetIsRejected) {
  const int64_t t0 = time_->NowUtcMs();
  clock_->RecordRequestSent(t0);
  clock_->Reset();
  time_->AdvanceMs(20);
  EXPECT_EQ(clock_->RecordResponse(t0, t0 + 10), PingResponseResult::kRejectedUnknownPing);
}

TEST_F(ClockOffsetEstimatorContractTest, OutstandingPingsAreBounded) {
  for (int i = 0; i < 40; ++i) {
    clock_->RecordRequestSent(time_->NowUtcMs());
    time_->AdvanceMs(1);
  }
  EXPECT_EQ(clock_->OutstandingPings(), 32u);
}

// =============================================================================
// Reset and subscription
// =============================================================================

TEST_F(ClockOffsetEstimatorContractTest, ResetClearsStateAndNotifies) {
  int notifications = 0;
  bool last_reliable = true;
  clock_->Subscribe([&](const ClockState& state) {
    notifications++;
    last_reliable = state.is_reliable;
  });

  PrimeClock(*clock_, *time_, 10, 20);
  EXPECT_EQ(notifications, 5);
  EXPECT_TRUE(last_reliable);

  clock_->Reset();
  EXPECT_EQ(notifications, 6);
  EXPECT_FALSE(last_reliable);
  EXPECT_TRUE(clock_->State().samples.empty());
  EXPECT_EQ(clock_->AverageOffsetMs(), 0.0);
}

TEST_F(ClockOffsetEstimatorContractTest, UnsubscribedListenerIsNotCalled) {
  int notifications = 0;
  const auto id = clock_->Subscribe([&](const ClockState&) { notifications++; });
  PrimeClock(*clock_, *time_, 10, 20, 1);
  clock_->Unsubscribe(id);
  PrimeClock(*clock_, *time_, 10, 20, 1);
  EXPECT_EQ(notifications, 1);
}

TEST_F(ClockOffsetEstimatorContractTest, ListenerMayUnsubscribeItself) {
  int notifications = 0;
  ClockOffsetEstimator::SubscriptionId id = 0;
  id = clock_->Subscribe([&](const ClockState&) {
    notifications++;
    clock_->Unsubscribe(id);
  });
  PrimeClock(*clock_, *time_, 10, 20, 3);
  EXPECT_EQ(notifications, 1);
}

TEST(ClockOffsetEstimatorConstruction, NullTimeSourceThrows) {
  EXPECT_THROW(ClockOffsetEstimator(nullptr), std::invalid_argument);
}

}  // namespace
