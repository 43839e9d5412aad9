// Repository: DeckSync
// Component: Simulated Playback Engine
// Purpose: Clock-driven IPlaybackEngine for the standalone tools; models an
//          audio oscillator that runs fast or slow by a fixed fraction.
// Copyright (c) 2025 DeckSync

#include "standalone/SimulatedPlaybackEngine.hpp"

#include <stdexcept>

namespace decksync::standalone {

SimulatedPlaybackEngine::SimulatedPlaybackEngine(
    std::shared_ptr<const time::ITimeSource> time_source, double oscillator_error)
    : time_source_(std::move(time_source)), oscillator_error_(oscillator_error) {
  if (!time_source_) {
    throw std::invalid_argument("SimulatedPlaybackEngine requires a time source");
  }
  anchor_time_ms_ = time_source_->NowUtcMs();
}

double SimulatedPlaybackEngine::CurrentPositionSec() const {
  if (!playing_) {
    return anchor_position_sec_;
  }
  const double elapsed_sec =
      static_cast<double>(time_source_->NowUtcMs() - anchor_time_ms_) / 1000.0;
  return anchor_position_sec_ + elapsed_sec * rate_ * (1.0 + oscillator_error_);
}

void SimulatedPlaybackEngine::Reanchor() {
  anchor_position_sec_ = CurrentPositionSec();
  anchor_time_ms_ = time_source_->NowUtcMs();
}

void SimulatedPlaybackEngine::SetPlaybackRate(double rate) {
  Reanchor();
  rate_ = rate;
  rate_changes_++;
}

void SimulatedPlaybackEngine::SeekWithCrossfade(double position_sec, int /*crossfade_ms*/) {
  Seek(position_sec);
  crossfade_seeks_++;
}

void SimulatedPlaybackEngine::Seek(double position_sec) {
  anchor_position_sec_ = position_sec;
  anchor_time_ms_ = time_source_->NowUtcMs();
}

void SimulatedPlaybackEngine::Play() {
  Reanchor();
  playing_ = true;
}

void SimulatedPlaybackEngine::Pause() {
  Reanchor();
  playing_ = false;
}

void SimulatedPlaybackEngine::Stop() {
  Reanchor();
  playing_ = false;
}

void SimulatedPlaybackEngine::Cue(std::optional<double> position_sec) {
  Reanchor();
  playing_ = false;
  if (position_sec) {
    anchor_position_sec_ = *position_sec;
  }
}

}  // namespace decksync::standalone
