// Repository: DeckSync
// Component: Wire Codec
// Purpose: Conversion and validation between decksync.v1 protobuf messages
//          and sync domain types.
// Copyright (c) 2025 DeckSync

#include "decksync/wire/WireCodec.hpp"

#include <cmath>

#include "decksync/util/Logger.hpp"

namespace decksync::wire {

using util::Logger;

namespace {

bool Fail(std::string* error, const char* reason) {
  if (error != nullptr) *error = reason;
  return false;
}

bool ValidDeckId(const std::string& deck_id) {
  return !deck_id.empty();
}

bool ValidPosition(double position_sec) {
  return std::isfinite(position_sec) && position_sec >= 0.0;
}

bool ValidRate(double playback_rate) {
  return std::isfinite(playback_rate) && playback_rate > 0.0;
}

}  // namespace

std::optional<sync::PlayState> FromProto(v1::PlayState state) {
  switch (state) {
    case v1::PLAY_STATE_STOPPED:
      return sync::PlayState::kStopped;
    case v1::PLAY_STATE_PLAYING:
      return sync::PlayState::kPlaying;
    case v1::PLAY_STATE_PAUSED:
      return sync::PlayState::kPaused;
    case v1::PLAY_STATE_CUED:
      return sync::PlayState::kCued;
    default:
      return std::nullopt;
  }
}

v1::PlayState ToProto(sync::PlayState state) {
  switch (state) {
    case sync::PlayState::kStopped:
      return v1::PLAY_STATE_STOPPED;
    case sync::PlayState::kPlaying:
      return v1::PLAY_STATE_PLAYING;
    case sync::PlayState::kPaused:
      return v1::PLAY_STATE_PAUSED;
    case sync::PlayState::kCued:
      return v1::PLAY_STATE_CUED;
  }
  return v1::PLAY_STATE_UNSPECIFIED;
}

// ---------------------------------------------------------------------------
// Decoding
// ---------------------------------------------------------------------------

bool DecodePong(const v1::TimePong& msg, sync::PingResponse* out, std::string* error) {
  if (msg.t0_ms() < 0) return Fail(error, "negative_t0");
  if (msg.server_ts_ms() < 0) return Fail(error, "negative_server_ts");
  out->t0_ms = msg.t0_ms();
  out->server_timestamp_ms = msg.server_ts_ms();
  return true;
}

bool DecodeBeacon(const v1::DeckBeacon& msg, sync::TransportBeacon* out,
                  std::string* error) {
  if (!ValidDeckId(msg.deck_id())) return Fail(error, "missing_deck_id");
  if (msg.epoch_id().empty()) return Fail(error, "missing_epoch_id");
  if (msg.play_state() == v1::PLAY_STATE_UNSPECIFIED) {
    return Fail(error, "unspecified_play_state");
  }
  auto state = FromProto(msg.play_state());
  if (!state) return Fail(error, "unknown_play_state");
  if (!std::isfinite(msg.position_sec())) return Fail(error, "non_finite_position");
  if (msg.position_sec() < 0.0) return Fail(error, "negative_position");
  if (!std::isfinite(msg.playback_rate())) return Fail(error, "non_finite_rate");
  if (msg.playback_rate() <= 0.0) return Fail(error, "non_positive_rate");

  out->deck_id = msg.deck_id();
  out->epoch_id = msg.epoch_id();
  out->epoch_seq = msg.epoch_seq();
  out->play_state = *state;
  out->position_sec = msg.position_sec();
  out->playback_rate = msg.playback_rate();
  out->server_timestamp_ms = msg.server_ts_ms();
  return true;
}

bool DecodeBeaconTick(const v1::BeaconTick& msg, sync::BeaconTick* out,
                      std::string* error) {
  if (msg.server_ts_ms() < 0) return Fail(error, "negative_server_ts");

  sync::BeaconTick tick;
  tick.server_timestamp_ms = msg.server_ts_ms();
  tick.room_version = msg.room_version();
  tick.decks.reserve(static_cast<size_t>(msg.decks_size()));
  for (const auto& deck : msg.decks()) {
    sync::TransportBeacon beacon;
    std::string reason;
    if (!DecodeBeacon(deck, &beacon, &reason)) {
      Logger::Warn("[WireCodec] beacon dropped deck=" + deck.deck_id() +
                   " epoch=" + deck.epoch_id() + " reason=" + reason);
      continue;
    }
    if (beacon.server_timestamp_ms == 0) {
      beacon.server_timestamp_ms = tick.server_timestamp_ms;
    }
    tick.decks.push_back(std::move(beacon));
  }
  *out = std::move(tick);
  return true;
}

bool DecodeServerEvent(const v1::ServerEvent& msg, InboundEvent* out,
                       std::string* error) {
  switch (msg.event_case()) {
    case v1::ServerEvent::kPong: {
      sync::PingResponse pong;
      if (!DecodePong(msg.pong(), &pong, error)) return false;
      *out = pong;
      return true;
    }
    case v1::ServerEvent::kBeaconTick: {
      sync::BeaconTick tick;
      if (!DecodeBeaconTick(msg.beacon_tick(), &tick, error)) return false;
      *out = std::move(tick);
      return true;
    }
    case v1::ServerEvent::kTempoSet: {
      const auto& tempo = msg.tempo_set();
      if (!ValidDeckId(tempo.deck_id())) return Fail(error, "missing_deck_id");
      if (!ValidRate(tempo.playback_rate())) return Fail(error, "invalid_rate");
      *out = RemoteTempoSet{tempo.deck_id(), tempo.playback_rate()};
      return true;
    }
    case v1::ServerEvent::kSeek: {
      const auto& seek = msg.seek();
      if (!ValidDeckId(seek.deck_id())) return Fail(error, "missing_deck_id");
      if (!ValidPosition(seek.position_sec())) return Fail(error, "invalid_position");
      *out = RemoteSeek{seek.deck_id(), seek.position_sec()};
      return true;
    }
    case v1::ServerEvent::kTransport: {
      const auto& cmd = msg.transport();
      if (!ValidDeckId(cmd.deck_id())) return Fail(error, "missing_deck_id");
      sync::LocalAction action;
      switch (cmd.action()) {
        case v1::TRANSPORT_ACTION_PLAY:
          action = sync::LocalAction::Play();
          break;
        case v1::TRANSPORT_ACTION_PAUSE:
          action = sync::LocalAction::Pause();
          break;
        case v1::TRANSPORT_ACTION_STOP:
          action = sync::LocalAction::Stop();
          break;
        case v1::TRANSPORT_ACTION_CUE:
          if (cmd.has_cue_position_sec()) {
            if (!ValidPosition(cmd.cue_position_sec())) {
              return Fail(error, "invalid_position");
            }
            action = sync::LocalAction::Cue(cmd.cue_position_sec());
          } else {
            action = sync::LocalAction::Cue();
          }
          break;
        default:
          return Fail(error, "unspecified_transport_action");
      }
      *out = RemoteTransport{cmd.deck_id(), action};
      return true;
    }
    case v1::ServerEvent::EVENT_NOT_SET:
      break;
  }
  return Fail(error, "empty_event");
}

bool ParseServerEvent(const std::string& bytes, InboundEvent* out, std::string* error) {
  v1::ServerEvent msg;
  if (!msg.ParseFromString(bytes)) return Fail(error, "unparseable");
  return DecodeServerEvent(msg, out, error);
}

// ---------------------------------------------------------------------------
// Encoding
// ---------------------------------------------------------------------------

v1::TimePing EncodePing(int64_t t0_ms, const std::string& client_id) {
  v1::TimePing p;
  p.set_t0_ms(t0_ms);
  p.set_client_id(client_id);
  return p;
}

v1::DeckBeacon EncodeBeacon(const sync::TransportBeacon& beacon) {
  v1::DeckBeacon p;
  p.set_deck_id(beacon.deck_id);
  p.set_epoch_id(beacon.epoch_id);
  p.set_epoch_seq(beacon.epoch_seq);
  p.set_play_state(ToProto(beacon.play_state));
  p.set_position_sec(beacon.position_sec);
  p.set_playback_rate(beacon.playback_rate);
  p.set_server_ts_ms(beacon.server_timestamp_ms);
  return p;
}

v1::BeaconTick EncodeBeaconTick(const sync::BeaconTick& tick) {
  v1::BeaconTick p;
  p.set_server_ts_ms(tick.server_timestamp_ms);
  p.set_room_version(tick.room_version);
  for (const auto& beacon : tick.decks) {
    *p.add_decks() = EncodeBeacon(beacon);
  }
  return p;
}

v1::ServerEvent MakePongEvent(int64_t t0_ms, int64_t server_ts_ms) {
  v1::ServerEvent e;
  auto* pong = e.mutable_pong();
  pong->set_t0_ms(t0_ms);
  pong->set_server_ts_ms(server_ts_ms);
  return e;
}

v1::ServerEvent MakeBeaconTickEvent(const sync::BeaconTick& tick) {
  v1::ServerEvent e;
  *e.mutable_beacon_tick() = EncodeBeaconTick(tick);
  return e;
}

v1::ServerEvent MakeTempoSetEvent(const sync::DeckId& deck_id, double playback_rate) {
  v1::ServerEvent e;
  auto* tempo = e.mutable_tempo_set();
  tempo->set_deck_id(deck_id);
  tempo->set_playback_rate(playback_rate);
  return e;
}

v1::ServerEvent MakeSeekEvent(const sync::DeckId& deck_id, double position_sec) {
  v1::ServerEvent e;
  auto* seek = e.mutable_seek();
  seek->set_deck_id(deck_id);
  seek->set_position_sec(position_sec);
  return e;
}

bool MakeTransportEvent(const sync::DeckId& deck_id, const sync::LocalAction& action,
                        v1::ServerEvent* out) {
  v1::ServerEvent e;
  auto* cmd = e.mutable_transport();
  cmd->set_deck_id(deck_id);
  switch (action.type) {
    case sync::LocalAction::Type::kPlay:
      cmd->set_action(v1::TRANSPORT_ACTION_PLAY);
      break;
    case sync::LocalAction::Type::kPause:
      cmd->set_action(v1::TRANSPORT_ACTION_PAUSE);
      break;
    case sync::LocalAction::Type::kStop:
      cmd->set_action(v1::TRANSPORT_ACTION_STOP);
      break;
    case sync::LocalAction::Type::kCue:
      cmd->set_action(v1::TRANSPORT_ACTION_CUE);
      if (action.position_sec) cmd->set_cue_position_sec(*action.position_sec);
      break;
    default:
      return false;
  }
  *out = std::move(e);
  return true;
}

}  // namespace decksync::wire
