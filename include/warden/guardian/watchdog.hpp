#pragma once

#include "warden/events/event_bus.hpp"
#include "warden/guardian/hint_queue.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace warden::guardian {

struct GuardianConfig {
  bool enabled = true;
  /// 0 disables stall detection.
  std::uint64_t stall_timeout_secs = 120;
  /// 0 disables doom-loop detection.
  std::size_t doom_loop_threshold = 5;
  /// 0 disables the budget checks.
  std::uint64_t budget_tokens = 0;
  std::uint32_t budget_warn_pct = 80;
};

struct WatchdogState {
  /// Recent ToolStarted signatures, oldest first. Holds at most threshold * 2.
  std::deque<std::string> window;
  std::deque<std::string> window_labels;
  std::chrono::steady_clock::time_point last_event;
  std::uint64_t cumulative_tokens = 0;
  bool budget_warned = false;
  bool budget_exceeded = false;
  std::uint64_t hints_emitted = 0;
};

/// Signature used for doom-loop detection: tool name plus a digest of its arguments.
[[nodiscard]] std::string call_signature(const std::string &tool, const std::string &arguments_json);

/// Watches one session's event stream on its own thread and turns pathological
/// patterns into hints. Owns its state; never touches the session.
class Watchdog {
public:
  Watchdog(GuardianConfig config, std::shared_ptr<events::EventBus> bus, std::string session_id,
           std::shared_ptr<HintQueue> hints);
  ~Watchdog();

  Watchdog(const Watchdog &) = delete;
  Watchdog &operator=(const Watchdog &) = delete;

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;

  void observe(const events::Event &event,
               std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());
  void check_stall(std::chrono::steady_clock::time_point now = std::chrono::steady_clock::now());

  /// Waits until every event up to seq that reached this watchdog has been observed.
  bool await_caught_up(std::uint64_t seq, std::chrono::milliseconds timeout);

  [[nodiscard]] WatchdogState snapshot() const;

private:
  void run_loop();
  void emit(HintKind kind, std::string message);
  void observe_tool_started(const events::ToolStarted &started);
  void observe_usage(const events::UsageUpdated &usage);

  GuardianConfig config_;
  std::shared_ptr<events::EventBus> bus_;
  std::string session_id_;
  std::shared_ptr<HintQueue> hints_;
  events::SubscriptionPtr subscription_;

  mutable std::mutex state_mutex_;
  WatchdogState state_;

  std::mutex progress_mutex_;
  std::condition_variable progress_cv_;
  std::uint64_t processed_seq_ = 0;

  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace warden::guardian
