#include "warden/guardian/hint_queue.hpp"

namespace warden::guardian {

std::string hint_kind_to_string(const HintKind kind) {
  switch (kind) {
  case HintKind::Stall:
    return "stall";
  case HintKind::DoomLoop:
    return "doom_loop";
  case HintKind::BudgetWarning:
    return "budget_warning";
  case HintKind::BudgetExceeded:
    return "budget_exceeded";
  }
  return "stall";
}

void HintQueue::push(Hint hint) {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.push(std::move(hint));
}

std::vector<Hint> HintQueue::pop_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Hint> out;
  while (!queue_.empty()) {
    out.push_back(std::move(queue_.front()));
    queue_.pop();
  }
  return out;
}

bool HintQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

std::size_t HintQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

} // namespace warden::guardian
