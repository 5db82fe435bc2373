#pragma once

#include <chrono>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace warden::guardian {

enum class HintKind { Stall, DoomLoop, BudgetWarning, BudgetExceeded };

[[nodiscard]] std::string hint_kind_to_string(HintKind kind);

/// Advisory text for the next turn. Never authoritative.
struct Hint {
  HintKind kind = HintKind::Stall;
  std::string message;
  std::chrono::steady_clock::time_point raised_at;
};

class HintQueue {
public:
  void push(Hint hint);
  [[nodiscard]] std::vector<Hint> pop_all();
  [[nodiscard]] bool empty() const;
  [[nodiscard]] std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::queue<Hint> queue_;
};

} // namespace warden::guardian
