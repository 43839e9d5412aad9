// Repository: DeckSync
// Component: Sync Event Queue
// Purpose: Hands decoded server events from link I/O threads to the single
//          control thread that owns all sync state.
// Copyright (c) 2025 DeckSync

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

#include "decksync/sync/SyncManager.hpp"
#include "decksync/wire/WireCodec.hpp"

namespace decksync::link {

struct QueuedEvent {
  enum class Kind {
    kInbound,
    kLinkUp,
    kLinkDown,
  };

  Kind kind = Kind::kInbound;
  std::optional<wire::InboundEvent> event;  // kInbound only
  std::string detail;                       // kLinkDown reason
};

// Multi-producer, single-consumer. Producers (reader/sender threads) only
// Push*; the control thread calls Drain(), which applies events to the
// SyncManager outside the lock.
//
// A link-up that follows a link-down triggers SyncManager::Resync("reconnect").
// When full, the oldest event is dropped.
class SyncEventQueue {
 public:
  using BeaconObserver =
      std::function<void(const sync::DeckId&, const sync::BeaconResult&)>;

  explicit SyncEventQueue(size_t capacity = 1024);

  void Push(wire::InboundEvent event);
  void PushLinkUp();
  void PushLinkDown(const std::string& reason);

  // Applies every queued event in FIFO order. Returns the number applied.
  size_t Drain(sync::SyncManager& manager, const BeaconObserver& observer = nullptr);

  // Blocks until an event is queued or the timeout expires.
  bool WaitForEvents(std::chrono::milliseconds timeout);

  // Wakes WaitForEvents() callers.
  void Notify();

  size_t size() const;
  uint64_t dropped() const;
  bool link_up() const { return link_up_; }

 private:
  void Enqueue(QueuedEvent event);
  void Apply(const QueuedEvent& event, sync::SyncManager& manager,
             const BeaconObserver& observer);

  const size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<QueuedEvent> queue_;
  uint64_t dropped_ = 0;

  // Control thread only.
  bool link_up_ = false;
  bool link_was_down_ = false;
};

}  // namespace decksync::link
