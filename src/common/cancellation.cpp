#include "warden/common/cancellation.hpp"

#include <algorithm>

namespace warden::common {

namespace {

constexpr auto kPollSlice = std::chrono::milliseconds(20);

} // namespace

CancellationToken::CancellationToken(std::shared_ptr<const CancellationToken> parent,
                                     std::optional<Clock::time_point> deadline)
    : parent_(std::move(parent)), deadline_(deadline) {}

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

void CancellationToken::set_deadline(const Clock::time_point deadline) {
  std::lock_guard<std::mutex> lock(mutex_);
  deadline_ = deadline;
}

bool CancellationToken::cancel_requested() const {
  if (cancelled_) {
    return true;
  }
  return parent_ != nullptr && parent_->cancel_requested();
}

bool CancellationToken::deadline_exceeded() const {
  const auto effective = deadline();
  return effective.has_value() && Clock::now() >= *effective;
}

bool CancellationToken::is_cancelled() const { return cancel_requested() || deadline_exceeded(); }

std::optional<CancellationToken::Clock::time_point> CancellationToken::deadline() const {
  std::optional<Clock::time_point> own;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    own = deadline_;
  }
  if (parent_ == nullptr) {
    return own;
  }
  const auto inherited = parent_->deadline();
  if (!own.has_value()) {
    return inherited;
  }
  if (!inherited.has_value()) {
    return own;
  }
  return std::min(*own, *inherited);
}

bool CancellationToken::sleep_for(const std::chrono::milliseconds duration) const {
  const auto until = Clock::now() + duration;
  std::unique_lock<std::mutex> lock(mutex_);
  while (Clock::now() < until) {
    if (cancelled_) {
      return false;
    }
    lock.unlock();
    const bool cancelled = is_cancelled();
    lock.lock();
    if (cancelled) {
      return false;
    }
    const auto remaining = until - Clock::now();
    cv_.wait_for(lock, std::min<Clock::duration>(remaining, kPollSlice));
  }
  lock.unlock();
  return !is_cancelled();
}

} // namespace warden::common
