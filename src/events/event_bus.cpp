#include "warden/events/event_bus.hpp"

#include "warden/common/time.hpp"

#include <algorithm>

namespace warden::events {

bool EventFilter::matches(const Event &event) const {
  if (session_id.has_value() && !event.session_id.empty() && event.session_id != *session_id) {
    return false;
  }
  if (kinds.empty()) {
    return true;
  }
  return std::find(kinds.begin(), kinds.end(), event.kind()) != kinds.end();
}

Subscription::Subscription(EventFilter filter, const std::size_t capacity)
    : filter_(std::move(filter)), capacity_(std::max<std::size_t>(capacity, 1)) {}

void Subscription::offer(const Envelope &envelope) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
      return;
    }
    if (queue_.size() >= capacity_) {
      queue_.pop_front();
      ++dropped_;
    }
    queue_.push_back(envelope);
    last_enqueued_seq_ = envelope.seq;
  }
  cv_.notify_one();
}

std::optional<Envelope> Subscription::next(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !queue_.empty(); });
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto value = std::move(queue_.front());
  queue_.pop_front();
  return value;
}

std::optional<Envelope> Subscription::try_next() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (queue_.empty()) {
    return std::nullopt;
  }
  auto value = std::move(queue_.front());
  queue_.pop_front();
  return value;
}

void Subscription::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool Subscription::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::uint64_t Subscription::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

std::uint64_t Subscription::last_enqueued_seq() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_enqueued_seq_;
}

EventBus::EventBus(const std::size_t default_capacity) : default_capacity_(default_capacity) {}

SubscriptionPtr EventBus::subscribe(EventFilter filter, const std::optional<std::size_t> capacity) {
  auto subscription =
      std::make_shared<Subscription>(std::move(filter), capacity.value_or(default_capacity_));
  std::lock_guard<std::mutex> lock(mutex_);
  subscribers_.push_back(subscription);
  return subscription;
}

std::uint64_t EventBus::publish(Event event) {
  if (event.timestamp.empty()) {
    event.timestamp = common::now_rfc3339();
  }

  // Delivery happens under the bus lock so every subscriber sees one global order.
  std::lock_guard<std::mutex> lock(mutex_);
  const Envelope envelope{.seq = ++seq_, .event = std::move(event)};
  auto it = subscribers_.begin();
  while (it != subscribers_.end()) {
    auto subscription = it->lock();
    if (subscription == nullptr || subscription->closed()) {
      it = subscribers_.erase(it);
      continue;
    }
    if (subscription->filter().matches(envelope.event)) {
      subscription->offer(envelope);
    }
    ++it;
  }
  return envelope.seq;
}

std::uint64_t EventBus::publish(std::string session_id, EventPayload payload) {
  return publish(Event{.session_id = std::move(session_id), .payload = std::move(payload)});
}

std::uint64_t EventBus::last_seq() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return seq_;
}

std::size_t EventBus::subscriber_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t count = 0;
  for (const auto &weak : subscribers_) {
    if (const auto subscription = weak.lock(); subscription != nullptr && !subscription->closed()) {
      ++count;
    }
  }
  return count;
}

} // namespace warden::events
