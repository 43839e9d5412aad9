// Repository: DeckSync
// Component: Sync Event Queue
// Purpose: Hands decoded server events from link I/O threads to the single
//          control thread that owns all sync state.
// Copyright (c) 2025 DeckSync

#include "link/SyncEventQueue.hpp"

#include <algorithm>
#include <type_traits>
#include <vector>

#include "decksync/util/Logger.hpp"

namespace decksync::link {

using util::Logger;

SyncEventQueue::SyncEventQueue(size_t capacity)
    : capacity_(std::max<size_t>(capacity, 1)) {}

void SyncEventQueue::Push(wire::InboundEvent event) {
  QueuedEvent queued;
  queued.kind = QueuedEvent::Kind::kInbound;
  queued.event = std::move(event);
  Enqueue(std::move(queued));
}

void SyncEventQueue::PushLinkUp() {
  QueuedEvent queued;
  queued.kind = QueuedEvent::Kind::kLinkUp;
  Enqueue(std::move(queued));
}

void SyncEventQueue::PushLinkDown(const std::string& reason) {
  QueuedEvent queued;
  queued.kind = QueuedEvent::Kind::kLinkDown;
  queued.detail = reason;
  Enqueue(std::move(queued));
}

void SyncEventQueue::Enqueue(QueuedEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      dropped_++;
      Logger::Warn("[SyncEventQueue] oldest event dropped dropped_total=" +
                   std::to_string(dropped_) + " reason=queue_full");
    }
    queue_.push_back(std::move(event));
  }
  cv_.notify_one();
}

size_t SyncEventQueue::Drain(sync::SyncManager& manager, const BeaconObserver& observer) {
  std::deque<QueuedEvent> batch;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    batch.swap(queue_);
  }
  for (const auto& event : batch) {
    Apply(event, manager, observer);
  }
  return batch.size();
}

void SyncEventQueue::Apply(const QueuedEvent& event, sync::SyncManager& manager,
                           const BeaconObserver& observer) {
  switch (event.kind) {
    case QueuedEvent::Kind::kLinkDown:
      if (link_up_) {
        Logger::Warn("[SyncEventQueue] link down reason=" + event.detail);
      }
      link_up_ = false;
      link_was_down_ = true;
      return;
    case QueuedEvent::Kind::kLinkUp:
      link_up_ = true;
      if (link_was_down_) {
        link_was_down_ = false;
        manager.Resync("reconnect");
      }
      Logger::Info("[SyncEventQueue] link up generation=" +
                   std::to_string(manager.session_generation()));
      return;
    case QueuedEvent::Kind::kInbound:
      break;
  }
  if (!event.event) return;

  std::visit(
      [&manager, &observer](const auto& e) {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, sync::PingResponse>) {
          manager.OnPingResponse(e);
        } else if constexpr (std::is_same_v<T, sync::BeaconTick>) {
          auto results = manager.OnBeaconTick(e);
          if (observer) {
            for (const auto& [deck_id, result] : results) {
              observer(deck_id, result);
            }
          }
        } else if constexpr (std::is_same_v<T, wire::RemoteTempoSet>) {
          manager.OnRemoteTempoSet(e.deck_id, e.playback_rate);
        } else if constexpr (std::is_same_v<T, wire::RemoteSeek>) {
          manager.OnRemoteSeek(e.deck_id, e.position_sec);
        } else if constexpr (std::is_same_v<T, wire::RemoteTransport>) {
          manager.OnRemoteTransport(e.deck_id, e.action);
        }
      },
      *event.event);
}

bool SyncEventQueue::WaitForEvents(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  return cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
}

void SyncEventQueue::Notify() {
  cv_.notify_all();
}

size_t SyncEventQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

uint64_t SyncEventQueue::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

}  // namespace decksync::link
