// Repository: DeckSync
// Component: Simulated Playback Engine
// Purpose: Clock-driven IPlaybackEngine for the standalone tools; models an
//          audio oscillator that runs fast or slow by a fixed fraction.
// Copyright (c) 2025 DeckSync

#pragma once

#include <cstdint>
#include <memory>
#include <optional>

#include "decksync/sync/IPlaybackEngine.hpp"
#include "decksync/time/ITimeSource.hpp"

namespace decksync::standalone {

// position = anchor_position + elapsed * rate * (1 + oscillator_error)
// while playing. Every transport call re-anchors at the current position.
class SimulatedPlaybackEngine : public sync::IPlaybackEngine {
 public:
  SimulatedPlaybackEngine(std::shared_ptr<const time::ITimeSource> time_source,
                          double oscillator_error = 0.0);

  bool IsReady() const override { return ready_; }
  double CurrentPositionSec() const override;
  void SetPlaybackRate(double rate) override;
  void SeekWithCrossfade(double position_sec, int crossfade_ms) override;
  void Seek(double position_sec) override;
  void Play() override;
  void Pause() override;
  void Stop() override;
  void Cue(std::optional<double> position_sec) override;

  void SetReady(bool ready) { ready_ = ready; }

  double rate() const { return rate_; }
  bool playing() const { return playing_; }
  uint64_t crossfade_seeks() const { return crossfade_seeks_; }
  uint64_t rate_changes() const { return rate_changes_; }

 private:
  void Reanchor();

  std::shared_ptr<const time::ITimeSource> time_source_;
  double oscillator_error_;
  bool ready_ = true;

  bool playing_ = false;
  double rate_ = 1.0;
  double anchor_position_sec_ = 0.0;
  int64_t anchor_time_ms_ = 0;

  uint64_t crossfade_seeks_ = 0;
  uint64_t rate_changes_ = 0;
};

}  // namespace decksync::standalone
