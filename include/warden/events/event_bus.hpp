#pragma once

#include "warden/events/event.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace warden::events {

struct Envelope {
  std::uint64_t seq = 0;
  Event event;
};

struct EventFilter {
  /// Events with an empty session id pass any session filter.
  std::optional<std::string> session_id;
  /// Empty accepts every kind.
  std::vector<EventKind> kinds;

  [[nodiscard]] bool matches(const Event &event) const;
};

/// Bounded per-subscriber queue. A full queue drops its oldest entry so publishers
/// never block on a slow reader.
class Subscription {
public:
  Subscription(EventFilter filter, std::size_t capacity);

  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  [[nodiscard]] std::optional<Envelope> next(std::chrono::milliseconds timeout);
  [[nodiscard]] std::optional<Envelope> try_next();
  void close();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] std::uint64_t dropped() const;
  /// Sequence number of the newest event accepted into this queue.
  [[nodiscard]] std::uint64_t last_enqueued_seq() const;
  [[nodiscard]] const EventFilter &filter() const { return filter_; }

private:
  friend class EventBus;
  void offer(const Envelope &envelope);

  EventFilter filter_;
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<Envelope> queue_;
  bool closed_ = false;
  std::uint64_t dropped_ = 0;
  std::uint64_t last_enqueued_seq_ = 0;
};

using SubscriptionPtr = std::shared_ptr<Subscription>;

class EventBus {
public:
  explicit EventBus(std::size_t default_capacity = 1024);

  EventBus(const EventBus &) = delete;
  EventBus &operator=(const EventBus &) = delete;

  [[nodiscard]] SubscriptionPtr subscribe(EventFilter filter = {},
                                          std::optional<std::size_t> capacity = std::nullopt);

  /// Stamps the event and delivers it to every matching subscription. Returns its
  /// sequence number.
  std::uint64_t publish(Event event);
  std::uint64_t publish(std::string session_id, EventPayload payload);

  [[nodiscard]] std::uint64_t last_seq() const;
  [[nodiscard]] std::size_t subscriber_count() const;

private:
  std::size_t default_capacity_;
  mutable std::mutex mutex_;
  std::vector<std::weak_ptr<Subscription>> subscribers_;
  std::uint64_t seq_ = 0;
};

} // namespace warden::events
