// Repository: DeckSync
// Component: Sync Soak Harness
// Purpose: Offline deterministic simulation of a room server, a jittery
//          network and drifting decks, driven through the wire codec, the
//          event queue and SyncManager. Reports drift convergence per deck.
// Copyright (c) 2025 DeckSync
//
// Usage:
//   decksync_soak [--decks <n>] [--duration-sec <s>] [--oscillator-ppm <ppm>]
//                 [--rtt-ms <ms>] [--jitter-ms <ms>] [--spike-every <n>]
//                 [--server-offset-ms <ms>] [--mode pll|legacy|disabled]
//                 [--seed <n>] [--max-drift-ms <ms>] [--no-tempo-change]

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <queue>
#include <random>
#include <sstream>
#include <string>
#include <vector>

#include "decksync/sync/SyncConfig.hpp"
#include "decksync/sync/SyncManager.hpp"
#include "decksync/time/ITimeSource.hpp"
#include "decksync/util/Logger.hpp"
#include "decksync/wire/WireCodec.hpp"
#include "link/SyncEventQueue.hpp"
#include "standalone/SimulatedPlaybackEngine.hpp"

using namespace decksync;
using util::Logger;

namespace {

struct Args {
  int decks = 2;
  int64_t duration_sec = 120;
  double oscillator_ppm = 500.0;
  int64_t rtt_ms = 40;
  int64_t jitter_ms = 10;
  int spike_every = 25;  // Every Nth message is delayed 8x; 0 disables spikes
  int64_t server_offset_ms = 1'234;
  std::string mode = "pll";
  uint32_t seed = 42;
  double max_drift_ms = 25.0;
  bool tempo_change = true;
};

void PrintUsage(const char* prog) {
  std::cerr << "Usage: " << prog << " \\\n"
            << "  [--decks <n>] [--duration-sec <s>] [--oscillator-ppm <ppm>] \\\n"
            << "  [--rtt-ms <ms>] [--jitter-ms <ms>] [--spike-every <n>] \\\n"
            << "  [--server-offset-ms <ms>] [--mode pll|legacy|disabled] \\\n"
            << "  [--seed <n>] [--max-drift-ms <ms>] [--no-tempo-change]\n";
}

bool ParseArgs(int argc, char** argv, Args& args) {
  try {
    for (int i = 1; i < argc; i++) {
      std::string arg = argv[i];
      if (arg == "--decks" && i + 1 < argc) {
        args.decks = std::stoi(argv[++i]);
      } else if (arg == "--duration-sec" && i + 1 < argc) {
        args.duration_sec = std::stoll(argv[++i]);
      } else if (arg == "--oscillator-ppm" && i + 1 < argc) {
        args.oscillator_ppm = std::stod(argv[++i]);
      } else if (arg == "--rtt-ms" && i + 1 < argc) {
        args.rtt_ms = std::stoll(argv[++i]);
      } else if (arg == "--jitter-ms" && i + 1 < argc) {
        args.jitter_ms = std::stoll(argv[++i]);
      } else if (arg == "--spike-every" && i + 1 < argc) {
        args.spike_every = std::stoi(argv[++i]);
      } else if (arg == "--server-offset-ms" && i + 1 < argc) {
        args.server_offset_ms = std::stoll(argv[++i]);
      } else if (arg == "--mode" && i + 1 < argc) {
        args.mode = argv[++i];
      } else if (arg == "--seed" && i + 1 < argc) {
        args.seed = static_cast<uint32_t>(std::stoul(argv[++i]));
      } else if (arg == "--max-drift-ms" && i + 1 < argc) {
        args.max_drift_ms = std::stod(argv[++i]);
      } else if (arg == "--no-tempo-change") {
        args.tempo_change = false;
      } else if (arg == "--help" || arg == "-h") {
        return false;
      } else {
        std::cerr << "Unknown argument: " << arg << "\n";
        return false;
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "Error: bad numeric argument (" << e.what() << ")\n";
    return false;
  }

  if (args.decks < 1 || args.decks > 26) {
    std::cerr << "Error: --decks must be between 1 and 26\n";
    return false;
  }
  if (args.duration_sec < 1 || args.rtt_ms < 0 || args.jitter_ms < 0) {
    std::cerr << "Error: durations must be positive\n";
    return false;
  }
  if (!sync::ParseCorrectionMode(args.mode)) {
    std::cerr << "Error: --mode must be pll, legacy or disabled\n";
    return false;
  }
  return true;
}

// Local clock of the simulated client, advanced by the main loop.
class SimClock : public time::ITimeSource {
 public:
  explicit SimClock(int64_t start_ms) : now_ms_(start_ms) {}
  int64_t NowUtcMs() const override { return now_ms_; }
  void Advance(int64_t delta_ms) { now_ms_ += delta_ms; }

 private:
  int64_t now_ms_;
};

// The room server's view of one deck.
struct DeckTimeline {
  sync::DeckId deck_id;
  std::string epoch_id;
  uint64_t seq = 0;
  double anchor_position_sec = 0.0;
  int64_t anchor_server_ms = 0;
  double rate = 1.0;

  double PositionAt(int64_t server_ms) const {
    return anchor_position_sec +
           static_cast<double>(server_ms - anchor_server_ms) / 1000.0 * rate;
  }
};

struct Delivery {
  int64_t at_ms = 0;
  uint64_t order = 0;
  std::string bytes;

  bool operator>(const Delivery& other) const {
    return at_ms != other.at_ms ? at_ms > other.at_ms : order > other.order;
  }
};

class SimNetwork {
 public:
  explicit SimNetwork(const Args& args)
      : rng_(args.seed),
        base_one_way_ms_(args.rtt_ms / 2),
        jitter_(0, args.jitter_ms),
        spike_every_(args.spike_every) {}

  int64_t OneWayDelayMs() {
    int64_t delay = base_one_way_ms_ + jitter_(rng_);
    messages_++;
    if (spike_every_ > 0 && messages_ % static_cast<uint64_t>(spike_every_) == 0) {
      delay *= 8;
    }
    return delay;
  }

 private:
  std::mt19937 rng_;
  int64_t base_one_way_ms_;
  std::uniform_int_distribution<int64_t> jitter_;
  int spike_every_;
  uint64_t messages_ = 0;
};

struct DeckReport {
  std::vector<double> late_measured_ms;  // Core-measured drift, second half of run
  double last_truth_drift_ms = 0.0;      // Engine vs true server timeline
  double max_abs_late_truth_ms = 0.0;
};

std::string DeckName(int index) {
  return std::string(1, static_cast<char>('A' + index));
}

}  // namespace

int main(int argc, char** argv) {
  Args args;
  if (!ParseArgs(argc, argv, args)) {
    PrintUsage(argv[0]);
    return 1;
  }

  constexpr int64_t kClientStartMs = 1'700'000'000'000;
  constexpr int64_t kBeaconIntervalMs = 250;

  auto clock = std::make_shared<SimClock>(kClientStartMs);
  sync::SyncConfig config = sync::ApplyEnvironmentOverrides(sync::SyncConfig());
  config.reconciler.correction_mode = *sync::ParseCorrectionMode(args.mode);

  sync::SyncManager manager(clock, config);
  link::SyncEventQueue queue;
  SimNetwork network(args);

  std::map<sync::DeckId, std::shared_ptr<standalone::SimulatedPlaybackEngine>> engines;
  std::map<sync::DeckId, DeckTimeline> timelines;
  std::map<sync::DeckId, DeckReport> reports;

  const int64_t server_start_ms = kClientStartMs + args.server_offset_ms;
  for (int i = 0; i < args.decks; ++i) {
    const sync::DeckId id = DeckName(i);
    // Alternate fast and slow oscillators so decks drift apart.
    const double error = (i % 2 == 0 ? 1.0 : -1.0) * args.oscillator_ppm * 1e-6;
    auto engine = std::make_shared<standalone::SimulatedPlaybackEngine>(clock, error);
    engines[id] = engine;
    if (!manager.AddDeck(id, engine)) {
      std::cerr << "Error: could not add deck " << id << "\n";
      return 1;
    }

    DeckTimeline timeline;
    timeline.deck_id = id;
    timeline.epoch_id = "soak-" + id + "-1";
    timeline.anchor_position_sec = 5.0 * i;
    timeline.anchor_server_ms = server_start_ms;
    timelines[id] = timeline;
  }

  std::priority_queue<Delivery, std::vector<Delivery>, std::greater<Delivery>> in_flight;
  uint64_t order = 0;
  auto send = [&](const v1::ServerEvent& event, int64_t deliver_at_ms) {
    Delivery d;
    d.at_ms = deliver_at_ms;
    d.order = order++;
    if (!event.SerializeToString(&d.bytes)) {
      Logger::Error("[SyncSoak] event serialization failed");
      return;
    }
    in_flight.push(std::move(d));
  };

  const int64_t end_ms = kClientStartMs + args.duration_sec * 1'000;
  const int64_t late_phase_ms = kClientStartMs + args.duration_sec * 500;
  const int64_t tempo_change_server_ms = server_start_ms + args.duration_sec * 400;
  bool tempo_changed = !args.tempo_change;
  int64_t next_beacon_server_ms = server_start_ms;
  uint64_t room_version = 0;

  Logger::Info("[SyncSoak] decks=" + std::to_string(args.decks) +
               " duration=" + std::to_string(args.duration_sec) + "s mode=" + args.mode +
               " seed=" + std::to_string(args.seed));

  while (clock->NowUtcMs() < end_ms) {
    const int64_t now = clock->NowUtcMs();
    const int64_t server_now = now + args.server_offset_ms;

    if (manager.IsPingDue()) {
      const int64_t t0 = manager.BeginPing();
      const int64_t up = network.OneWayDelayMs();
      const int64_t down = network.OneWayDelayMs();
      send(wire::MakePongEvent(t0, t0 + up + args.server_offset_ms), t0 + up + down);
    }

    if (!tempo_changed && server_now >= tempo_change_server_ms) {
      tempo_changed = true;
      DeckTimeline& timeline = timelines.begin()->second;
      timeline.anchor_position_sec = timeline.PositionAt(server_now);
      timeline.anchor_server_ms = server_now;
      timeline.rate = 1.04;
      send(wire::MakeTempoSetEvent(timeline.deck_id, timeline.rate),
           now + network.OneWayDelayMs());
    }

    if (server_now >= next_beacon_server_ms) {
      sync::BeaconTick tick;
      tick.server_timestamp_ms = server_now;
      tick.room_version = ++room_version;
      for (auto& entry : timelines) {
        DeckTimeline& timeline = entry.second;
        sync::TransportBeacon beacon;
        beacon.deck_id = timeline.deck_id;
        beacon.epoch_id = timeline.epoch_id;
        beacon.epoch_seq = ++timeline.seq;
        beacon.play_state = sync::PlayState::kPlaying;
        beacon.position_sec = timeline.PositionAt(server_now);
        beacon.playback_rate = timeline.rate;
        beacon.server_timestamp_ms = server_now;
        tick.decks.push_back(beacon);
      }
      send(wire::MakeBeaconTickEvent(tick), now + network.OneWayDelayMs());
      next_beacon_server_ms += kBeaconIntervalMs;
    }

    while (!in_flight.empty() && in_flight.top().at_ms <= now) {
      wire::InboundEvent event;
      std::string error;
      if (wire::ParseServerEvent(in_flight.top().bytes, &event, &error)) {
        queue.Push(std::move(event));
      } else {
        Logger::Warn("[SyncSoak] event dropped reason=" + error);
      }
      in_flight.pop();
    }

    queue.Drain(manager, [&](const sync::DeckId& deck_id, const sync::BeaconResult& result) {
      DeckReport& report = reports[deck_id];
      const double truth_ms =
          (engines[deck_id]->CurrentPositionSec() - timelines[deck_id].PositionAt(server_now)) *
          1000.0;
      report.last_truth_drift_ms = truth_ms;
      if (now >= late_phase_ms) {
        report.max_abs_late_truth_ms = std::max(report.max_abs_late_truth_ms, std::abs(truth_ms));
        if (result.drift_ms) {
          report.late_measured_ms.push_back(*result.drift_ms);
        }
      }
    });

    clock->Advance(1);
  }

  bool converged = true;
  for (const auto& entry : reports) {
    const DeckReport& report = entry.second;
    double mean_abs = 0.0;
    for (double d : report.late_measured_ms) {
      mean_abs += std::abs(d);
    }
    if (!report.late_measured_ms.empty()) {
      mean_abs /= static_cast<double>(report.late_measured_ms.size());
    }
    const bool deck_ok = !report.late_measured_ms.empty() && mean_abs <= args.max_drift_ms;
    converged = converged && deck_ok;

    const auto* deck = manager.Deck(entry.first);
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << "[SyncSoak] deck=" << entry.first
        << " late_mean_abs_drift=" << mean_abs << "ms"
        << " late_max_abs_truth_drift=" << report.max_abs_late_truth_ms << "ms"
        << " final_truth_drift=" << report.last_truth_drift_ms << "ms"
        << " snaps=" << deck->Stats().snaps
        << " rate_adjustments=" << deck->Stats().rate_adjustments
        << " stale=" << deck->Stats().stale_dropped
        << " clock_unreliable=" << deck->Stats().clock_unreliable_skips
        << (deck_ok ? " ok" : " NOT_CONVERGED");
    Logger::Info(oss.str());
  }

  std::ostringstream clock_line;
  clock_line << std::fixed << std::setprecision(1)
             << "[SyncSoak] clock offset=" << manager.clock().AverageOffsetMs()
             << "ms (true " << args.server_offset_ms << "ms) rtt="
             << manager.clock().AverageRoundTripMs() << "ms reliable="
             << (manager.clock().IsReliable() ? "yes" : "no");
  Logger::Info(clock_line.str());

  // Disabled mode never corrects; the run only exercises the pipeline.
  if (config.reconciler.correction_mode == sync::CorrectionMode::kDisabled) {
    return 0;
  }
  return converged ? 0 : 2;
}
