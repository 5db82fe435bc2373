#include "warden/guardian/watchdog.hpp"

#include "warden/common/crypto.hpp"
#include "warden/observability/global.hpp"

#include <algorithm>
#include <utility>
#include <vector>

namespace warden::guardian {

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(100);
constexpr std::size_t kMaxLabelArgs = 80;

events::EventFilter watchdog_filter(const std::string &session_id) {
  events::EventFilter filter;
  filter.session_id = session_id;
  for (int k = 0; k <= static_cast<int>(events::EventKind::RunFailed); ++k) {
    const auto kind = static_cast<events::EventKind>(k);
    if (kind != events::EventKind::WatchdogHint) {
      filter.kinds.push_back(kind);
    }
  }
  return filter;
}

std::string call_label(const std::string &tool, const std::string &arguments_json) {
  std::string args = arguments_json;
  if (args.size() > kMaxLabelArgs) {
    args = args.substr(0, kMaxLabelArgs) + "...";
  }
  return tool + "(" + args + ")";
}

} // namespace

std::string call_signature(const std::string &tool, const std::string &arguments_json) {
  return tool + ":" + common::sha256_hex(arguments_json);
}

Watchdog::Watchdog(GuardianConfig config, std::shared_ptr<events::EventBus> bus,
                   std::string session_id, std::shared_ptr<HintQueue> hints)
    : config_(config), bus_(std::move(bus)), session_id_(std::move(session_id)),
      hints_(std::move(hints)) {
  state_.last_event = std::chrono::steady_clock::now();
  if (bus_ != nullptr && config_.enabled) {
    subscription_ = bus_->subscribe(watchdog_filter(session_id_));
  }
}

Watchdog::~Watchdog() { stop(); }

void Watchdog::start() {
  if (running_ || !config_.enabled || subscription_ == nullptr) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.last_event = std::chrono::steady_clock::now();
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void Watchdog::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
  if (subscription_ != nullptr) {
    subscription_->close();
  }
  progress_cv_.notify_all();
}

bool Watchdog::is_running() const { return running_; }

void Watchdog::run_loop() {
  while (running_) {
    auto envelope = subscription_->next(kPollInterval);
    const auto now = std::chrono::steady_clock::now();
    if (envelope.has_value()) {
      observe(envelope->event, now);
      {
        std::lock_guard<std::mutex> lock(progress_mutex_);
        processed_seq_ = envelope->seq;
      }
      progress_cv_.notify_all();
    }
    check_stall(now);
  }
}

bool Watchdog::await_caught_up(const std::uint64_t seq, const std::chrono::milliseconds timeout) {
  if (!running_ || subscription_ == nullptr) {
    return true;
  }
  const std::uint64_t target = std::min(seq, subscription_->last_enqueued_seq());
  std::unique_lock<std::mutex> lock(progress_mutex_);
  return progress_cv_.wait_for(lock, timeout,
                               [this, target] { return processed_seq_ >= target || !running_; });
}

void Watchdog::observe(const events::Event &event, const std::chrono::steady_clock::time_point now) {
  if (!config_.enabled || event.kind() == events::EventKind::WatchdogHint) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.last_event = now;
  }
  if (const auto *started = std::get_if<events::ToolStarted>(&event.payload)) {
    observe_tool_started(*started);
  } else if (const auto *usage = std::get_if<events::UsageUpdated>(&event.payload)) {
    observe_usage(*usage);
  }
}

void Watchdog::observe_tool_started(const events::ToolStarted &started) {
  const std::size_t threshold = config_.doom_loop_threshold;
  // Retries of one call are not a loop.
  if (threshold == 0 || started.attempt > 1) {
    return;
  }

  std::string message;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.window.push_back(call_signature(started.tool, started.arguments_json));
    state_.window_labels.push_back(call_label(started.tool, started.arguments_json));
    while (state_.window.size() > threshold * 2) {
      state_.window.pop_front();
      state_.window_labels.pop_front();
    }
    if (state_.window.size() < threshold) {
      return;
    }
    const std::string &latest = state_.window.back();
    const bool repeated = std::all_of(state_.window.end() - static_cast<std::ptrdiff_t>(threshold),
                                      state_.window.end(),
                                      [&latest](const std::string &sig) { return sig == latest; });
    if (!repeated) {
      return;
    }
    message = "The call " + state_.window_labels.back() + " has repeated " +
              std::to_string(threshold) +
              " times in a row without progress. Stop repeating it and try a different approach "
              "or tool.";
    state_.window.clear();
    state_.window_labels.clear();
  }
  emit(HintKind::DoomLoop, std::move(message));
}

void Watchdog::observe_usage(const events::UsageUpdated &usage) {
  std::vector<std::pair<HintKind, std::string>> pending;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.cumulative_tokens += usage.input_tokens + usage.output_tokens;
    if (config_.budget_tokens == 0) {
      return;
    }
    const std::uint64_t used = state_.cumulative_tokens;
    const std::uint64_t warn_at = config_.budget_tokens * config_.budget_warn_pct / 100;
    if (!state_.budget_warned && config_.budget_warn_pct > 0 && used >= warn_at &&
        used <= config_.budget_tokens) {
      state_.budget_warned = true;
      pending.emplace_back(HintKind::BudgetWarning,
                           "Token usage is at " + std::to_string(used) + " of " +
                               std::to_string(config_.budget_tokens) +
                               ". Prioritize the remaining work.");
    }
    if (!state_.budget_exceeded && used > config_.budget_tokens) {
      state_.budget_exceeded = true;
      state_.budget_warned = true;
      pending.emplace_back(HintKind::BudgetExceeded,
                           "Token budget of " + std::to_string(config_.budget_tokens) +
                               " exceeded (" + std::to_string(used) +
                               " used). Wrap up now or summarize what remains.");
    }
  }
  for (auto &[kind, message] : pending) {
    emit(kind, std::move(message));
  }
}

void Watchdog::check_stall(const std::chrono::steady_clock::time_point now) {
  if (!config_.enabled || config_.stall_timeout_secs == 0) {
    return;
  }
  const auto limit = std::chrono::seconds(config_.stall_timeout_secs);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (now - state_.last_event < limit) {
      return;
    }
    state_.last_event = now;
  }
  emit(HintKind::Stall, "No progress observed for " + std::to_string(config_.stall_timeout_secs) +
                            "s. Check whether the current step is stuck and change course.");
}

WatchdogState Watchdog::snapshot() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

void Watchdog::emit(const HintKind kind, std::string message) {
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    ++state_.hints_emitted;
  }
  const std::string kind_name = hint_kind_to_string(kind);
  observability::record_watchdog_hint(session_id_, kind_name, message);
  if (bus_ != nullptr) {
    bus_->publish(session_id_, events::WatchdogHint{.kind = kind_name, .message = message});
  }
  if (hints_ != nullptr) {
    hints_->push(Hint{.kind = kind,
                      .message = std::move(message),
                      .raised_at = std::chrono::steady_clock::now()});
  }
}

} // namespace warden::guardian
