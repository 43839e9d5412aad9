// Repository: DeckSync
// Component: Wire Codec
// Purpose: Conversion and validation between decksync.v1 protobuf messages
//          and sync domain types.
// Copyright (c) 2025 DeckSync

#ifndef DECKSYNC_WIRE_WIRE_CODEC_HPP_
#define DECKSYNC_WIRE_WIRE_CODEC_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

#include "decksync/sync/SyncTypes.hpp"
#include "decksync/v1/deck_sync.pb.h"

namespace decksync::wire {

// Server-relayed commands, applied like local actions.
struct RemoteTempoSet {
  sync::DeckId deck_id;
  double playback_rate = 1.0;
};

struct RemoteSeek {
  sync::DeckId deck_id;
  double position_sec = 0.0;
};

struct RemoteTransport {
  sync::DeckId deck_id;
  sync::LocalAction action;
};

using InboundEvent = std::variant<sync::PingResponse,
                                  sync::BeaconTick,
                                  RemoteTempoSet,
                                  RemoteSeek,
                                  RemoteTransport>;

// ---- Decoding ----
// Each Decode* returns false and sets *error to a reason code
// (e.g. "missing_deck_id", "non_finite_position") when the message is
// rejected. *out is only written on success. Unknown fields are ignored.

bool DecodePong(const v1::TimePong& msg, sync::PingResponse* out, std::string* error);

bool DecodeBeacon(const v1::DeckBeacon& msg, sync::TransportBeacon* out,
                  std::string* error);

// Invalid deck entries are dropped with a warning; the rest of the tick is
// kept. Fails only when the tick itself is unusable.
bool DecodeBeaconTick(const v1::BeaconTick& msg, sync::BeaconTick* out,
                      std::string* error);

bool DecodeServerEvent(const v1::ServerEvent& msg, InboundEvent* out,
                       std::string* error);

// Parses serialized ServerEvent bytes, then decodes.
bool ParseServerEvent(const std::string& bytes, InboundEvent* out, std::string* error);

std::optional<sync::PlayState> FromProto(v1::PlayState state);
v1::PlayState ToProto(sync::PlayState state);

// ---- Encoding (tools and tests) ----

v1::TimePing EncodePing(int64_t t0_ms, const std::string& client_id = std::string());
v1::DeckBeacon EncodeBeacon(const sync::TransportBeacon& beacon);
v1::BeaconTick EncodeBeaconTick(const sync::BeaconTick& tick);

v1::ServerEvent MakePongEvent(int64_t t0_ms, int64_t server_ts_ms);
v1::ServerEvent MakeBeaconTickEvent(const sync::BeaconTick& tick);
v1::ServerEvent MakeTempoSetEvent(const sync::DeckId& deck_id, double playback_rate);
v1::ServerEvent MakeSeekEvent(const sync::DeckId& deck_id, double position_sec);
// PLAY, PAUSE, STOP and CUE only. Returns false for other action types.
bool MakeTransportEvent(const sync::DeckId& deck_id, const sync::LocalAction& action,
                        v1::ServerEvent* out);

}  // namespace decksync::wire

#endif  // DECKSYNC_WIRE_WIRE_CODEC_HPP_
