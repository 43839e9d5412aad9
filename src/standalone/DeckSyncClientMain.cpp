// Repository: DeckSync
// Component: DeckSync Client
// Purpose: Connects to a DeckSyncService room, keeps simulated decks locked to
//          the server timeline and logs every correction.
// Copyright (c) 2025 DeckSync
//
// Usage:
//   decksync_client [--server <host:port>] [--room <id>] [--client-id <id>]
//                   [--decks A,B] [--mode pll|legacy|disabled] [--verbose]

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include "decksync/sync/SyncConfig.hpp"
#include "decksync/sync/SyncManager.hpp"
#include "decksync/util/Logger.hpp"
#include "link/GrpcSyncLink.hpp"
#include "link/SyncEventQueue.hpp"
#include "standalone/SimulatedPlaybackEngine.hpp"
#include "time/SystemTimeSource.hpp"

using namespace decksync;
using util::Logger;

namespace {

std::atomic<bool> g_termination_requested{false};

void SignalHandler(int signal) {
  if (signal == SIGINT || signal == SIGTERM) {
    g_termination_requested.store(true, std::memory_order_release);
  }
}

struct CliArgs {
  std::string server = "localhost:50061";
  std::string room = "default";
  std::string client_id = "decksync-client";
  std::vector<std::string> decks = {"A", "B"};
  std::string mode;  // Empty: configuration default / environment
  bool verbose = false;
};

void PrintUsage(const char* prog) {
  std::cerr << "Usage: " << prog << " \\\n"
            << "  [--server <host:port>] [--room <id>] [--client-id <id>] \\\n"
            << "  [--decks A,B] [--mode pll|legacy|disabled] [--verbose]\n"
            << "Environment: DECKSYNC_CORRECTION_MODE, DECKSYNC_PING_INTERVAL_MS,\n"
            << "             DECKSYNC_SNAP_COOLDOWN_MS, DECKSYNC_DEBUG\n";
}

std::vector<std::string> SplitDecks(const std::string& list) {
  std::vector<std::string> decks;
  std::stringstream ss(list);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) decks.push_back(item);
  }
  return decks;
}

bool ParseArgs(int argc, char** argv, CliArgs& args) {
  for (int i = 1; i < argc; i++) {
    std::string arg = argv[i];
    if (arg == "--server" && i + 1 < argc) {
      args.server = argv[++i];
    } else if (arg == "--room" && i + 1 < argc) {
      args.room = argv[++i];
    } else if (arg == "--client-id" && i + 1 < argc) {
      args.client_id = argv[++i];
    } else if (arg == "--decks" && i + 1 < argc) {
      args.decks = SplitDecks(argv[++i]);
    } else if (arg == "--mode" && i + 1 < argc) {
      args.mode = argv[++i];
    } else if (arg == "--verbose" || arg == "-v") {
      args.verbose = true;
    } else if (arg == "--help" || arg == "-h") {
      return false;
    } else {
      std::cerr << "Unknown argument: " << arg << "\n";
      return false;
    }
  }

  if (args.decks.empty()) {
    std::cerr << "Error: --decks needs at least one deck id\n";
    return false;
  }
  if (!args.mode.empty() && !sync::ParseCorrectionMode(args.mode)) {
    std::cerr << "Error: --mode must be pll, legacy or disabled\n";
    return false;
  }
  return true;
}

void LogCorrection(const sync::DeckId& deck_id, const sync::BeaconResult& result) {
  switch (result.outcome) {
    case sync::BeaconOutcome::kEpochReset:
    case sync::BeaconOutcome::kSnapped:
    case sync::BeaconOutcome::kSnapDeferredCooldown:
    case sync::BeaconOutcome::kRateAdjusted:
      break;
    default:
      return;
  }
  std::ostringstream oss;
  oss << "[DeckSyncClient] deck=" << deck_id
      << " outcome=" << sync::BeaconOutcomeName(result.outcome);
  if (result.drift_ms) {
    oss << " drift=" << *result.drift_ms << "ms";
  }
  oss << " factor=" << result.correction_factor << " rate=" << result.effective_rate;
  Logger::Info(oss.str());
}

}  // namespace

int main(int argc, char** argv) {
  CliArgs args;
  if (!ParseArgs(argc, argv, args)) {
    PrintUsage(argv[0]);
    return 1;
  }

  if (args.verbose) {
    Logger::SetDebugOverride(true);
  }

  std::signal(SIGINT, SignalHandler);
  std::signal(SIGTERM, SignalHandler);

  sync::SyncConfig config = sync::ApplyEnvironmentOverrides(sync::SyncConfig());
  if (!args.mode.empty()) {
    config.reconciler.correction_mode = *sync::ParseCorrectionMode(args.mode);
  }

  auto time_source = std::make_shared<time::SystemTimeSource>();
  sync::SyncManager manager(time_source, config);
  for (const auto& deck_id : args.decks) {
    if (!manager.AddDeck(deck_id,
                         std::make_shared<standalone::SimulatedPlaybackEngine>(time_source))) {
      std::cerr << "Error: duplicate deck id " << deck_id << "\n";
      return 1;
    }
  }

  auto queue = std::make_shared<link::SyncEventQueue>();
  link::GrpcSyncLinkOptions options;
  options.target = args.server;
  options.room_id = args.room;
  options.client_id = args.client_id;
  link::GrpcSyncLink grpc_link(options, queue);
  grpc_link.Start();

  while (!g_termination_requested.load(std::memory_order_acquire)) {
    if (grpc_link.IsConnected() && manager.IsPingDue()) {
      grpc_link.SendPing(manager.BeginPing());
    }
    queue->WaitForEvents(std::chrono::milliseconds(50));
    queue->Drain(manager, LogCorrection);
  }

  Logger::Info("[DeckSyncClient] shutting down");
  grpc_link.Stop();
  return 0;
}
