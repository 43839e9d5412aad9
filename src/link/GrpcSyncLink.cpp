// Repository: DeckSync
// Component: gRPC Sync Link
// Purpose: Client side of DeckSyncService: event subscription with reconnect
//          and unary clock pings, feeding SyncEventQueue.
// Copyright (c) 2025 DeckSync

#include "link/GrpcSyncLink.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include "decksync/util/Logger.hpp"
#include "decksync/wire/WireCodec.hpp"

namespace decksync::link {

using util::Logger;

GrpcSyncLink::GrpcSyncLink(GrpcSyncLinkOptions options,
                           std::shared_ptr<SyncEventQueue> queue)
    : options_(std::move(options)),
      queue_(std::move(queue)),
      grpc_channel_(grpc::CreateChannel(options_.target, grpc::InsecureChannelCredentials())),
      stub_(v1::DeckSyncService::NewStub(grpc_channel_)) {
  if (!queue_) {
    throw std::invalid_argument("GrpcSyncLink requires an event queue");
  }
}

GrpcSyncLink::~GrpcSyncLink() {
  Stop();
}

void GrpcSyncLink::Start() {
  if (started_) return;
  started_ = true;
  Logger::Info("[GrpcSyncLink] connecting target=" + options_.target +
               " room=" + options_.room_id);
  connection_thread_ = std::thread([this] { ConnectionLoop(); });
  sender_thread_ = std::thread([this] { SenderLoop(); });
}

void GrpcSyncLink::Stop() {
  if (shutdown_.exchange(true, std::memory_order_acq_rel)) return;
  {
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (active_context_ != nullptr) {
      active_context_->TryCancel();
    }
  }
  // Waiters test shutdown_ under their mutex; taking it here closes the gap
  // between their predicate check and the wait.
  { std::lock_guard<std::mutex> lock(ping_mutex_); }
  { std::lock_guard<std::mutex> lock(backoff_mutex_); }
  ping_cv_.notify_all();
  backoff_cv_.notify_all();
  if (connection_thread_.joinable()) connection_thread_.join();
  if (sender_thread_.joinable()) sender_thread_.join();
}

void GrpcSyncLink::SendPing(int64_t t0_ms) {
  {
    std::lock_guard<std::mutex> lock(ping_mutex_);
    pending_pings_.push_back(t0_ms);
  }
  ping_cv_.notify_one();
}

// ---------------------------------------------------------------------------
// Connection loop: reconnect with backoff
// ---------------------------------------------------------------------------

void GrpcSyncLink::ConnectionLoop() {
  constexpr int kInitialBackoffMs = 100;
  constexpr int kMaxBackoffMs = 5000;
  int backoff_ms = kInitialBackoffMs;

  while (!shutdown_.load(std::memory_order_acquire)) {
    const bool received_any = RunOneSession();

    if (connected_.exchange(false, std::memory_order_relaxed)) {
      queue_->PushLinkDown("stream_closed");
    }
    if (shutdown_.load(std::memory_order_acquire)) break;

    if (received_any) {
      backoff_ms = kInitialBackoffMs;
    }

    std::unique_lock<std::mutex> lock(backoff_mutex_);
    backoff_cv_.wait_for(lock, std::chrono::milliseconds(backoff_ms), [this] {
      return shutdown_.load(std::memory_order_relaxed);
    });

    backoff_ms = std::min(backoff_ms * 2, kMaxBackoffMs);
  }
}

// ---------------------------------------------------------------------------
// Single subscription. Returns true if at least one event arrived.
// ---------------------------------------------------------------------------

bool GrpcSyncLink::RunOneSession() {
  grpc::ClientContext context;
  {
    std::lock_guard<std::mutex> lock(context_mutex_);
    if (shutdown_.load(std::memory_order_acquire)) return false;
    active_context_ = &context;
  }

  v1::SubscribeRequest request;
  request.set_room_id(options_.room_id);
  request.set_client_id(options_.client_id);

  auto reader = stub_->Subscribe(&context, request);
  bool received_any = false;
  v1::ServerEvent event;
  while (reader->Read(&event)) {
    if (!received_any) {
      received_any = true;
      connected_.store(true, std::memory_order_relaxed);
      queue_->PushLinkUp();
      Logger::Info("[GrpcSyncLink] subscribed room=" + options_.room_id);
    }
    PostEvent(event);
  }

  const grpc::Status status = reader->Finish();
  {
    std::lock_guard<std::mutex> lock(context_mutex_);
    active_context_ = nullptr;
  }
  if (!status.ok() && !shutdown_.load(std::memory_order_acquire)) {
    Logger::Warn("[GrpcSyncLink] subscription ended code=" +
                 std::to_string(static_cast<int>(status.error_code())) +
                 " message=" + status.error_message());
  }
  return received_any;
}

void GrpcSyncLink::PostEvent(const v1::ServerEvent& msg) {
  wire::InboundEvent decoded;
  std::string error;
  if (!wire::DecodeServerEvent(msg, &decoded, &error)) {
    Logger::Warn("[GrpcSyncLink] event dropped reason=" + error);
    return;
  }
  queue_->Push(std::move(decoded));
}

// ---------------------------------------------------------------------------
// Ping sender
// ---------------------------------------------------------------------------

void GrpcSyncLink::SenderLoop() {
  while (!shutdown_.load(std::memory_order_acquire)) {
    std::deque<int64_t> batch;
    {
      std::unique_lock<std::mutex> lock(ping_mutex_);
      ping_cv_.wait(lock, [this] {
        return !pending_pings_.empty() || shutdown_.load(std::memory_order_relaxed);
      });
      batch.swap(pending_pings_);
    }

    for (int64_t t0 : batch) {
      if (shutdown_.load(std::memory_order_acquire)) return;
      grpc::ClientContext context;
      context.set_deadline(std::chrono::system_clock::now() +
                           std::chrono::milliseconds(options_.ping_deadline_ms));
      v1::TimePong pong;
      const grpc::Status status =
          stub_->Ping(&context, wire::EncodePing(t0, options_.client_id), &pong);
      if (!status.ok()) {
        Logger::Debug("[GrpcSyncLink] ping failed t0=" + std::to_string(t0) +
                      " code=" + std::to_string(static_cast<int>(status.error_code())));
        continue;
      }
      sync::PingResponse response;
      std::string error;
      if (!wire::DecodePong(pong, &response, &error)) {
        Logger::Warn("[GrpcSyncLink] pong dropped reason=" + error);
        continue;
      }
      queue_->Push(response);
    }
  }
}

}  // namespace decksync::link
