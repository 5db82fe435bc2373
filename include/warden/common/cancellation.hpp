#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>

namespace warden::common {

/// Cooperative cancellation with an optional deadline. A token is cancelled when
/// cancel() was called, its deadline passed, or its parent is cancelled.
class CancellationToken {
public:
  using Clock = std::chrono::steady_clock;

  CancellationToken() = default;
  explicit CancellationToken(std::shared_ptr<const CancellationToken> parent,
                             std::optional<Clock::time_point> deadline = std::nullopt);

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void cancel();
  void set_deadline(Clock::time_point deadline);

  [[nodiscard]] bool is_cancelled() const;
  [[nodiscard]] bool cancel_requested() const;
  [[nodiscard]] bool deadline_exceeded() const;
  [[nodiscard]] std::optional<Clock::time_point> deadline() const;

  /// Sleep for up to duration. Returns false if the token was cancelled first.
  [[nodiscard]] bool sleep_for(std::chrono::milliseconds duration) const;

private:
  std::shared_ptr<const CancellationToken> parent_;
  std::atomic<bool> cancelled_{false};
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::optional<Clock::time_point> deadline_;
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace warden::common
