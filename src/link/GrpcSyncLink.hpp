// Repository: DeckSync
// Component: gRPC Sync Link
// Purpose: Client side of DeckSyncService: event subscription with reconnect
//          and unary clock pings, feeding SyncEventQueue.
// Copyright (c) 2025 DeckSync

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include <grpcpp/grpcpp.h>
#include "decksync/v1/deck_sync.grpc.pb.h"

#include "link/SyncEventQueue.hpp"

namespace decksync::link {

struct GrpcSyncLinkOptions {
  std::string target = "localhost:50061";
  std::string room_id = "default";
  std::string client_id = "decksync-client";
  int ping_deadline_ms = 1'000;
};

// Owns two threads; neither touches sync state.
//
//   connection thread: Subscribe stream, reconnect with backoff
//                      (100 ms doubling to 5 s). Posts link up/down and every
//                      decoded ServerEvent to the queue.
//   sender thread:     drains pings queued by SendPing() through the unary
//                      Ping RPC and posts each pong.
//
// Undecodable events are logged and dropped.
class GrpcSyncLink {
 public:
  GrpcSyncLink(GrpcSyncLinkOptions options, std::shared_ptr<SyncEventQueue> queue);
  ~GrpcSyncLink();

  GrpcSyncLink(const GrpcSyncLink&) = delete;
  GrpcSyncLink& operator=(const GrpcSyncLink&) = delete;

  void Start();
  void Stop();

  // Non-blocking; called from the control thread after SyncManager::BeginPing().
  void SendPing(int64_t t0_ms);

  bool IsConnected() const { return connected_.load(std::memory_order_relaxed); }

 private:
  void ConnectionLoop();
  bool RunOneSession();
  void SenderLoop();
  void PostEvent(const v1::ServerEvent& msg);

  GrpcSyncLinkOptions options_;
  std::shared_ptr<SyncEventQueue> queue_;
  std::shared_ptr<grpc::Channel> grpc_channel_;
  std::unique_ptr<v1::DeckSyncService::Stub> stub_;

  std::mutex ping_mutex_;
  std::condition_variable ping_cv_;
  std::deque<int64_t> pending_pings_;

  std::mutex backoff_mutex_;
  std::condition_variable backoff_cv_;

  std::mutex context_mutex_;
  grpc::ClientContext* active_context_ = nullptr;

  std::atomic<bool> shutdown_{false};
  std::atomic<bool> connected_{false};
  bool started_ = false;

  std::thread connection_thread_;
  std::thread sender_thread_;
};

}  // namespace decksync::link
