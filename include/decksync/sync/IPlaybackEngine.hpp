// Repository: DeckSync
// Component: Playback Engine Interface
// Purpose: The per-deck adapter the sync core drives. Decoding, buffer
//          scheduling and crossfade mechanics live behind it.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_SYNC_IPLAYBACK_ENGINE_HPP_
#define DECKSYNC_SYNC_IPLAYBACK_ENGINE_HPP_

#include <optional>

namespace decksync::sync {

// One instance per deck. Every call is non-blocking and completes in bounded
// (sub-frame) time; it is invoked from the control thread only.
class IPlaybackEngine {
 public:
  virtual ~IPlaybackEngine() = default;

  // False while no track is loaded or the audio graph is not initialized.
  // The reconciler skips ticks for engines that are not ready.
  virtual bool IsReady() const = 0;

  // Rate-adjusted elapsed time since the last local transport change.
  virtual double CurrentPositionSec() const = 0;

  // Applied immediately, no ramp.
  virtual void SetPlaybackRate(double rate) = 0;

  // Repositions with a short crossfade. Used for drift snaps.
  virtual void SeekWithCrossfade(double position_sec, int crossfade_ms) = 0;

  // Hard reposition. Used for epoch resets and local SEEK.
  virtual void Seek(double position_sec) = 0;

  virtual void Play() = 0;
  virtual void Pause() = 0;
  virtual void Stop() = 0;
  virtual void Cue(std::optional<double> position_sec) = 0;
};

}  // namespace decksync::sync

#endif  // DECKSYNC_SYNC_IPLAYBACK_ENGINE_HPP_
