// Repository: DeckSync
// Component: Transport Reconciler Contract Tests
// Purpose: Epoch hard reset, sequence idempotence, PLL and legacy soft
//          correction, snap cooldown, tempo composition and local actions.
// Copyright (c) 2025 DeckSync

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <string>
#include <vector>

#include "decksync/sync/ClockOffsetEstimator.hpp"
#include "decksync/sync/TransportReconciler.hpp"
#include "decksync/util/Logger.hpp"
#include "fixtures/FakePlaybackEngine.h"
#include "support/ClockPriming.hpp"
#include "support/DeterministicTimeSource.hpp"

using namespace decksync::sync;
using decksync::tests::DeterministicTimeSource;
using decksync::tests::PrimeClock;
using decksync::tests::fixtures::FakePlaybackEngine;
using decksync::util::Logger;

namespace {

class TransportReconcilerContractTest : public ::testing::Test {
 protected:
  void SetUp() override {
    time_ = std::make_shared<DeterministicTimeSource>(1'000);
    clock_ = std::make_shared<ClockOffsetEstimator>(time_);
    engine_ = std::make_shared<FakePlaybackEngine>();
    reconciler_ = std::make_unique<TransportReconciler>("A", clock_, time_, ReconcilerConfig(),
                                                        engine_);
  }

  void TearDown() override {
    Logger::SetWarnSink(nullptr);
  }

  // Zero offset, zero round trip: estimated server now == local now.
  void PrimeReliableClock() {
    PrimeClock(*clock_, *time_, 0, 0);
  }

  TransportBeacon Beacon(uint64_t seq, PlayState state, double position_sec,
                         double rate = 1.0, const std::string& epoch = "e1") {
    TransportBeacon beacon;
    beacon.deck_id = "A";
    beacon.epoch_id = epoch;
    beacon.epoch_seq = seq;
    beacon.play_state = state;
    beacon.position_sec = position_sec;
    beacon.playback_rate = rate;
    beacon.server_timestamp_ms = time_->NowUtcMs();
    return beacon;
  }

  // Starts epoch e1 playing at `position_sec` and clears recorded calls.
  void StartPlaying(double position_sec = 10.0, double rate = 1.0) {
    ASSERT_EQ(reconciler_->ApplyBeacon(Beacon(1, PlayState::kPlaying, position_sec, rate)).outcome,
              BeaconOutcome::kEpochReset);
    engine_->ClearCalls();
  }

  // A playing continuation beacon stamped now; the engine reports drift_ms.
  BeaconResult Continue(uint64_t seq, double position_sec, double drift_ms, double rate = 1.0) {
    engine_->position_sec = position_sec + drift_ms / 1000.0;
    return reconciler_->ApplyBeacon(Beacon(seq, PlayState::kPlaying, position_sec, rate));
  }

  std::shared_ptr<DeterministicTimeSource> time_;
  std::shared_ptr<ClockOffsetEstimator> clock_;
  std::shared_ptr<FakePlaybackEngine> engine_;
  std::unique_ptr<TransportReconciler> reconciler_;
};

// =============================================================================
// Epoch hard reset
// =============================================================================

TEST_F(TransportReconcilerContractTest, FirstBeaconIsHardReset) {
  auto beacon = Beacon(7, PlayState::kPlaying, 12.25, 1.1);
  auto result = reconciler_->ApplyBeacon(beacon);

  EXPECT_EQ(result.outcome, BeaconOutcome::kEpochReset);
  EXPECT_EQ(result.correction_factor, 1.0);

  const auto& state = reconciler_->State();
  EXPECT_EQ(state.epoch_id, "e1");
  EXPECT_EQ(state.epoch_seq, 7u);
  EXPECT_EQ(state.last_seen_seq, 7u);
  EXPECT_EQ(state.play_state, PlayState::kPlaying);
  EXPECT_EQ(state.position_sec, 12.25);
  EXPECT_EQ(state.playback_rate, 1.1);

  EXPECT_EQ(engine_->CallNames(),
            (std::vector<std::string>{"SetPlaybackRate", "Seek", "Play"}));
  EXPECT_EQ(engine_->rate, 1.1);
  EXPECT_EQ(engine_->position_sec, 12.25);
}

TEST_F(TransportReconcilerContractTest, HardResetMatchesEveryPlayState) {
  reconciler_->ApplyBeacon(Beacon(1, PlayState::kPaused, 3.0, 1.0, "p"));
  EXPECT_EQ(engine_->CallNames(), (std::vector<std::string>{"SetPlaybackRate", "Pause", "Seek"}));

  engine_->ClearCalls();
  reconciler_->ApplyBeacon(Beacon(1, PlayState::kStopped, 0.0, 1.0, "s"));
  EXPECT_EQ(engine_->CallNames(), (std::vector<std::string>{"SetPlaybackRate", "Stop", "Seek"}));

  engine_->ClearCalls();
  reconciler_->ApplyBeacon(Beacon(1, PlayState::kCued, 8.0, 1.0, "c"));
  EXPECT_EQ(engine_->CallNames(), (std::vector<std::string>{"SetPlaybackRate", "Cue"}));
  EXPECT_EQ(engine_->position_sec, 8.0);
}

TEST_F(TransportReconcilerContractTest, NewEpochDiscardsCorrectionAndLowerSequence) {
  PrimeReliableClock();
  StartPlaying();
  ASSERT_EQ(Continue(2, 10.0, 40.0).outcome, BeaconOutcome::kRateAdjusted);
  ASSERT_LT(reconciler_->correction_factor(), 1.0);

  // Sequence restarts in the new epoch; it must still be accepted.
  auto result = reconciler_->ApplyBeacon(Beacon(1, PlayState::kPlaying, 99.0, 1.0, "e2"));
  EXPECT_EQ(result.outcome, BeaconOutcome::kEpochReset);
  EXPECT_EQ(reconciler_->correction_factor(), 1.0);
  EXPECT_EQ(reconciler_->State().epoch_id, "e2");
  EXPECT_EQ(reconciler_->State().last_seen_seq, 1u);
  EXPECT_EQ(engine_->rate, 1.0);
  EXPECT_EQ(engine_->position_sec, 99.0);
}

// =============================================================================
// Idempotence
// =============================================================================

TEST_F(TransportReconcilerContractTest, RedeliveredBeaconNeverChangesState) {
  PrimeReliableClock();
  StartPlaying();
  Continue(2, 10.0, 0.0);
  const TransportState before = reconciler_->State();
  engine_->ClearCalls();

  EXPECT_EQ(Continue(2, 10.0, 300.0).outcome, BeaconOutcome::kStale);
  EXPECT_EQ(Continue(1, 10.0, 300.0).outcome, BeaconOutcome::kStale);

  EXPECT_EQ(reconciler_->State(), before);
  EXPECT_TRUE(engine_->calls.empty());
  EXPECT_EQ(reconciler_->Stats().stale_dropped, 2u);
}

// =============================================================================
// Soft correction (PLL)
// =============================================================================

TEST_F(TransportReconcilerContractTest, TwentyMillisecondDriftAdjustsRate) {
  PrimeReliableClock();
  ASSERT_EQ(reconciler_->ApplyBeacon(Beacon(1, PlayState::kPlaying, 10.0)).outcome,
            BeaconOutcome::kEpochReset);
  engine_->ClearCalls();

  // 500 ms later the server says 10.50; the engine is at 10.52.
  time_->AdvanceMs(500);
  engine_->position_sec = 10.52;
  auto result = reconciler_->ApplyBeacon(Beacon(2, PlayState::kPlaying, 10.5));

  EXPECT_EQ(result.outcome, BeaconOutcome::kRateAdjusted);
  ASSERT_TRUE(result.drift_ms.has_value());
  EXPECT_NEAR(*result.drift_ms, 20.0, 0.5);
  EXPECT_GE(result.correction_factor, 0.98);
  EXPECT_LT(result.correction_factor, 1.0);
  EXPECT_EQ(engine_->CountOf("SeekWithCrossfade"), 0u);
  EXPECT_EQ(engine_->CountOf("SetPlaybackRate"), 1u);
  EXPECT_DOUBLE_EQ(engine_->rate, result.correction_factor);
  EXPECT_DOUBLE_EQ(result.effective_rate, engine_->rate);
}

TEST_F(TransportReconcilerContractTest, SixHundredMillisecondDriftSnaps) {
  PrimeReliableClock();
  StartPlaying();

  auto result = Continue(2, 10.5, 600.0);
  EXPECT_EQ(result.outcome, BeaconOutcome::kSnapped);
  ASSERT_EQ(engine_->CountOf("SeekWithCrossfade"), 1u);
  EXPECT_NEAR(engine_->calls.back().value, 10.5, 1e-9);
  EXPECT_EQ(engine_->calls.back().crossfade_ms, 50);
  EXPECT_EQ(result.correction_factor, 1.0);
  EXPECT_EQ(reconciler_->Stats().snaps, 1u);

  // History was cleared: a 15 ms reading is judged on its own.
  time_->AdvanceMs(250);
  auto next = Continue(3, 10.75, 15.0);
  EXPECT_EQ(next.outcome, BeaconOutcome::kRateAdjusted);
  EXPECT_NEAR(next.correction_factor, 0.985, 1e-6);
}

TEST_F(TransportReconcilerContractTest, SecondSnapWithinCooldownIsDeferred) {
  PrimeReliableClock();
  StartPlaying();
  ASSERT_EQ(Continue(2, 10.0, 600.0).outcome, BeaconOutcome::kSnapped);

  time_->AdvanceMs(250);
  auto deferred = Continue(3, 10.25, 700.0);
  EXPECT_EQ(deferred.outcome, BeaconOutcome::kSnapDeferredCooldown);
  EXPECT_EQ(engine_->CountOf("SeekWithCrossfade"), 1u);
  EXPECT_EQ(reconciler_->Stats().snaps_deferred, 1u);

  time_->AdvanceMs(250);
  auto snapped = Continue(4, 10.5, 700.0);
  EXPECT_EQ(snapped.outcome, BeaconOutcome::kSnapped);
  EXPECT_EQ(engine_->CountOf("SeekWithCrossfade"), 2u);
}

TEST_F(TransportReconcilerContractTest, CorrectionComposesWithTempo) {
  PrimeReliableClock();
  StartPlaying(10.0, 1.5);

  auto result = Continue(2, 10.0, 20.0, 1.5);
  EXPECT_EQ(result.outcome, BeaconOutcome::kRateAdjusted);
  EXPECT_NEAR(engine_->rate, 1.5 * 0.98, 1e-9);

  // Tempo changes mid-correction; the factor follows the new base rate.
  auto retempo = Continue(3, 10.0, 20.0, 1.2);
  EXPECT_EQ(retempo.outcome, BeaconOutcome::kRateAdjusted);
  EXPECT_NEAR(engine_->rate, 1.2 * 0.98, 1e-9);
}

TEST_F(TransportReconcilerContractTest, AlignedDeckRestoresAuthoritativeRate) {
  PrimeReliableClock();
  StartPlaying(10.0, 1.5);
  ASSERT_EQ(Continue(2, 10.0, 20.0, 1.5).outcome, BeaconOutcome::kRateAdjusted);

  BeaconResult result;
  for (uint64_t seq = 3; seq <= 5; ++seq) {
    result = Continue(seq, 10.0, 0.0, 1.5);
  }
  EXPECT_EQ(result.outcome, BeaconOutcome::kAligned);
  EXPECT_EQ(result.correction_factor, 1.0);
  EXPECT_EQ(engine_->rate, 1.5);
  EXPECT_EQ(result.effective_rate, 1.5);
}

TEST_F(TransportReconcilerContractTest, PausedContinuationCopiesStateWithoutCorrection) {
  PrimeReliableClock();
  StartPlaying();

  auto result = reconciler_->ApplyBeacon(Beacon(2, PlayState::kPaused, 14.0, 1.25));
  EXPECT_EQ(result.outcome, BeaconOutcome::kStateCopied);
  EXPECT_EQ(reconciler_->State().play_state, PlayState::kPaused);
  EXPECT_EQ(reconciler_->State().position_sec, 14.0);
  EXPECT_EQ(reconciler_->State().playback_rate, 1.25);
  EXPECT_EQ(reconciler_->State().last_seen_seq, 2u);
  EXPECT_TRUE(engine_->calls.empty());
}

// =============================================================================
// Suppressed corrections
// =============================================================================

TEST_F(TransportReconcilerContractTest, UnreliableClockSuppressesCorrection) {
  StartPlaying();

  auto result = Continue(2, 10.0, 100.0);
  EXPECT_EQ(result.outcome, BeaconOutcome::kClockUnreliable);
  EXPECT_FALSE(result.drift_ms.has_value());
  EXPECT_TRUE(engine_->calls.empty());
  EXPECT_EQ(reconciler_->State().last_seen_seq, 2u);
  EXPECT_EQ(reconciler_->Stats().clock_unreliable_skips, 1u);
}

TEST_F(TransportReconcilerContractTest, ClockThatAgedOutSuppressesCorrection) {
  PrimeReliableClock();
  StartPlaying();
  ASSERT_EQ(Continue(2, 10.0, 0.0).outcome, BeaconOutcome::kAligned);
  engine_->ClearCalls();

  // No pong for a minute: every sample is now too old to trust.
  time_->AdvanceMs(60'000);
  auto result = Continue(3, 70.0, 300.0);

  EXPECT_EQ(result.outcome, BeaconOutcome::kClockUnreliable);
  EXPECT_FALSE(result.drift_ms.has_value());
  EXPECT_TRUE(engine_->calls.empty());
  EXPECT_EQ(reconciler_->Stats().clock_unreliable_skips, 1u);
}

TEST_F(TransportReconcilerContractTest, EngineNotReadySkipsTick) {
  std::vector<std::string> warnings;
  Logger::SetWarnSink([&](const std::string& line) { warnings.push_back(line); });
  engine_->ready = false;

  auto result = reconciler_->ApplyBeacon(Beacon(1, PlayState::kPlaying, 10.0));
  EXPECT_EQ(result.outcome, BeaconOutcome::kEngineUnavailable);
  EXPECT_EQ(reconciler_->State(), TransportState());
  EXPECT_TRUE(engine_->calls.empty());
  ASSERT_FALSE(warnings.empty());
  EXPECT_NE(warnings.back().find("reason=engine_unavailable"), std::string::npos);
}

TEST_F(TransportReconcilerContractTest, MissingEngineSkipsTick) {
  TransportReconciler detached("B", clock_, time_);
  auto result = detached.ApplyBeacon(Beacon(1, PlayState::kPlaying, 10.0));
  EXPECT_EQ(result.outcome, BeaconOutcome::kEngineUnavailable);
  EXPECT_FALSE(detached.has_engine());

  detached.AttachEngine(engine_);
  EXPECT_EQ(detached.ApplyBeacon(Beacon(1, PlayState::kPlaying, 10.0)).outcome,
            BeaconOutcome::kEpochReset);
}

TEST_F(TransportReconcilerContractTest, MalformedBeaconsAreRejected) {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const double inf = std::numeric_limits<double>::infinity();
  std::vector<TransportBeacon> bad = {
      Beacon(1, PlayState::kPlaying, 10.0, 1.0, ""),
      Beacon(1, PlayState::kPlaying, nan),
      Beacon(1, PlayState::kPlaying, -1.0),
      Beacon(1, PlayState::kPlaying, 10.0, 0.0),
      Beacon(1, PlayState::kPlaying, 10.0, inf),
  };
  for (const auto& beacon : bad) {
    EXPECT_EQ(reconciler_->ApplyBeacon(beacon).outcome, BeaconOutcome::kMalformedBeacon);
  }
  EXPECT_EQ(reconciler_->State(), TransportState());
  EXPECT_TRUE(engine_->calls.empty());
  EXPECT_EQ(reconciler_->Stats().malformed_rejected, bad.size());
}

TEST_F(TransportReconcilerContractTest, DisabledModeMeasuresButDoesNotCorrect) {
  PrimeReliableClock();
  StartPlaying();
  reconciler_->SetCorrectionMode(CorrectionMode::kDisabled);

  auto result = Continue(2, 10.0, 600.0);
  EXPECT_EQ(result.outcome, BeaconOutcome::kCorrectionDisabled);
  ASSERT_TRUE(result.drift_ms.has_value());
  EXPECT_NEAR(*result.drift_ms, 600.0, 1e-6);
  EXPECT_TRUE(engine_->calls.empty());
}

// =============================================================================
// Legacy correction mode
// =============================================================================

TEST_F(TransportReconcilerContractTest, LegacyModeUsesFixedRateRelativeToBeacon) {
  ReconcilerConfig config;
  config.correction_mode = CorrectionMode::kLegacySnap;
  reconciler_ = std::make_unique<TransportReconciler>("A", clock_, time_, config, engine_);
  PrimeReliableClock();
  StartPlaying(10.0, 1.25);

  auto result = Continue(2, 10.0, 50.0, 1.25);
  EXPECT_EQ(result.outcome, BeaconOutcome::kRateAdjusted);
  EXPECT_NEAR(engine_->rate, 1.25 * 0.98, 1e-9);

  time_->AdvanceMs(100);
  EXPECT_EQ(Continue(3, 10.0, 50.0, 1.25).outcome, BeaconOutcome::kCorrectionHeld);
}

TEST_F(TransportReconcilerContractTest, LegacyModeSnapsAboveOneHundredMilliseconds) {
  PrimeReliableClock();
  StartPlaying();
  reconciler_->SetCorrectionMode(CorrectionMode::kLegacySnap);

  auto result = Continue(2, 10.0, 150.0);
  EXPECT_EQ(result.outcome, BeaconOutcome::kSnapped);
  EXPECT_EQ(engine_->CountOf("SeekWithCrossfade"), 1u);
}

// =============================================================================
// Local actions
// =============================================================================

TEST_F(TransportReconcilerContractTest, LocalTransportActionsReachEngineImmediately) {
  StartPlaying();

  EXPECT_TRUE(reconciler_->ApplyLocalAction(LocalAction::Pause()));
  EXPECT_EQ(reconciler_->State().play_state, PlayState::kPaused);
  EXPECT_TRUE(reconciler_->ApplyLocalAction(LocalAction::Play()));
  EXPECT_TRUE(reconciler_->ApplyLocalAction(LocalAction::Stop()));
  EXPECT_TRUE(reconciler_->ApplyLocalAction(LocalAction::Cue(4.0)));
  EXPECT_EQ(reconciler_->State().play_state, PlayState::kCued);

  EXPECT_EQ(engine_->CallNames(),
            (std::vector<std::string>{"Pause", "Play", "Stop", "Cue"}));
  EXPECT_EQ(engine_->position_sec, 4.0);
}

TEST_F(TransportReconcilerContractTest, LocalSeekResetsController) {
  PrimeReliableClock();
  StartPlaying();
  ASSERT_EQ(Continue(2, 10.0, 40.0).outcome, BeaconOutcome::kRateAdjusted);

  EXPECT_TRUE(reconciler_->ApplyLocalAction(LocalAction::Seek(30.0)));
  EXPECT_EQ(reconciler_->correction_factor(), 1.0);
  EXPECT_EQ(engine_->calls.back().name, "Seek");
  EXPECT_EQ(engine_->position_sec, 30.0);
}

TEST_F(TransportReconcilerContractTest, LocalTempoChangeSetsRate) {
  StartPlaying();
  EXPECT_TRUE(reconciler_->ApplyLocalAction(LocalAction::TempoChange(1.2)));
  EXPECT_EQ(engine_->rate, 1.2);
  EXPECT_EQ(reconciler_->State().playback_rate, 1.2);
}

TEST_F(TransportReconcilerContractTest, InvalidLocalActionsAreRejected) {
  StartPlaying();
  LocalAction seek_without_position;
  seek_without_position.type = LocalAction::Type::kSeek;

  EXPECT_FALSE(reconciler_->ApplyLocalAction(seek_without_position));
  EXPECT_FALSE(reconciler_->ApplyLocalAction(LocalAction::TempoChange(0.0)));
  EXPECT_FALSE(reconciler_->ApplyLocalAction(
      LocalAction::Seek(std::numeric_limits<double>::quiet_NaN())));
  EXPECT_TRUE(engine_->calls.empty());

  engine_->ready = false;
  EXPECT_FALSE(reconciler_->ApplyLocalAction(LocalAction::Play()));
}

// =============================================================================
// Reset
// =============================================================================

TEST_F(TransportReconcilerContractTest, ResetReturnsToInitialState) {
  PrimeReliableClock();
  StartPlaying();
  Continue(2, 10.0, 40.0);

  reconciler_->Reset();
  EXPECT_EQ(reconciler_->State(), TransportState());
  EXPECT_EQ(reconciler_->correction_factor(), 1.0);

  // The same epoch is new again after a reset.
  EXPECT_EQ(reconciler_->ApplyBeacon(Beacon(2, PlayState::kPlaying, 10.0)).outcome,
            BeaconOutcome::kEpochReset);
}

TEST(TransportReconcilerConstruction, MissingCollaboratorsThrow) {
  auto time = std::make_shared<DeterministicTimeSource>();
  auto clock = std::make_shared<ClockOffsetEstimator>(time);
  EXPECT_THROW(TransportReconciler("A", nullptr, time), std::invalid_argument);
  EXPECT_THROW(TransportReconciler("A", clock, nullptr), std::invalid_argument);
}

}  // namespace
