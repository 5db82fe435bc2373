#pragma once

#include "warden/common/cancellation.hpp"
#include "warden/common/result.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <functional>

namespace warden::common {

struct RetryPolicy {
  std::uint32_t max_retries = 3;
  std::uint64_t backoff_ms = 200;
  std::uint64_t max_backoff_ms = 10'000;
};

/// Delay before retry number `attempt` (0-based): backoff_ms * 2^attempt, capped.
[[nodiscard]] inline std::uint64_t backoff_delay_ms(const RetryPolicy &policy,
                                                    const std::uint32_t attempt) {
  const std::uint32_t shift = std::min<std::uint32_t>(attempt, 30);
  return std::min<std::uint64_t>(policy.backoff_ms * (1ULL << shift), policy.max_backoff_ms);
}

/// Run fn until it succeeds, fails with a non-transient error, the retry budget is
/// spent, or the token is cancelled. on_retry (optional) sees each retried failure.
template <typename T, typename Fn>
[[nodiscard]] Result<T>
retry_transient(const RetryPolicy &policy, const CancellationToken &token, Fn &&fn,
                const std::function<void(std::uint32_t, const std::string &)> &on_retry = {}) {
  for (std::uint32_t attempt = 0;; ++attempt) {
    Result<T> result = fn(attempt);
    if (result.ok() || !is_transient(result.error_kind()) || attempt >= policy.max_retries) {
      return result;
    }
    if (on_retry) {
      on_retry(attempt, result.error());
    }
    if (!token.sleep_for(std::chrono::milliseconds(backoff_delay_ms(policy, attempt)))) {
      return Result<T>::failure(ErrorKind::Cancelled,
                                "cancelled while retrying: " + result.error());
    }
  }
}

} // namespace warden::common
