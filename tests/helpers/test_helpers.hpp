#pragma once

#include "warden/checkpoint/store.hpp"
#include "warden/config/schema.hpp"
#include "warden/events/event_bus.hpp"
#include "warden/observability/observer.hpp"
#include "warden/providers/traits.hpp"
#include "warden/tools/tool.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::testing {

config::Config mock_config();

/// One scripted model reply: the deltas to stream, or a failure status.
struct ScriptedTurn {
  std::vector<providers::ModelDelta> deltas;
  common::Status status = common::Status::success();
  /// Delay before streaming, checked against cancellation.
  std::chrono::milliseconds delay{0};
};

[[nodiscard]] ScriptedTurn text_turn(const std::string &text, std::uint64_t input_tokens = 10,
                                     std::uint64_t output_tokens = 5);
[[nodiscard]] ScriptedTurn tool_turn(const std::vector<tools::ToolCall> &calls,
                                     const std::string &text = "");
[[nodiscard]] ScriptedTurn failed_turn(common::ErrorKind kind, const std::string &message);
/// Streams text but never sends EndOfTurn.
[[nodiscard]] ScriptedTurn truncated_turn(const std::string &text);

/// Model client replaying scripted turns in order. Once the script runs out it
/// answers with a final "done" message.
class ScriptedModelClient final : public providers::IModelClient {
public:
  void push(ScriptedTurn turn);

  [[nodiscard]] common::Status stream(const providers::ModelRequest &request,
                                      const providers::DeltaCallback &on_delta,
                                      const common::CancellationToken &cancel) override;
  [[nodiscard]] std::string name() const override { return "scripted"; }

  [[nodiscard]] std::vector<providers::ModelRequest> requests() const;
  [[nodiscard]] std::size_t calls() const;

private:
  mutable std::mutex mutex_;
  std::deque<ScriptedTurn> script_;
  std::vector<providers::ModelRequest> requests_;
};

using ToolHandler =
    std::function<common::Result<tools::ToolResult>(const tools::ToolArgs &, const tools::ToolContext &)>;

struct FakeToolOptions {
  security::SecurityTier tier = security::SecurityTier::T0;
  std::uint32_t timeout_ms = 5'000;
  std::uint32_t max_retries = 0;
  bool parallel_safe = true;
  std::string schema = R"({"type":"object","properties":{"value":{"type":"string"}}})";
};

class FakeTool final : public tools::ITool {
public:
  FakeTool(std::string name, ToolHandler handler, FakeToolOptions options = {});

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::string_view description() const override { return "test tool"; }
  [[nodiscard]] std::string parameters_schema() const override { return options_.schema; }
  [[nodiscard]] security::SecurityTier tier() const override { return options_.tier; }
  [[nodiscard]] common::Result<tools::ToolResult> execute(const tools::ToolArgs &args,
                                                          const tools::ToolContext &ctx) override;
  [[nodiscard]] std::uint32_t timeout_ms() const override { return options_.timeout_ms; }
  [[nodiscard]] std::uint32_t max_retries() const override { return options_.max_retries; }
  [[nodiscard]] bool parallel_safe() const override { return options_.parallel_safe; }

  [[nodiscard]] std::size_t invocations() const { return invocations_; }

private:
  std::string name_;
  ToolHandler handler_;
  FakeToolOptions options_;
  std::atomic<std::size_t> invocations_{0};
};

/// Tool that echoes its "value" argument.
[[nodiscard]] std::shared_ptr<FakeTool> echo_tool(const std::string &name = "echo",
                                                  FakeToolOptions options = {});

[[nodiscard]] tools::ToolCall make_call(const std::string &id, const std::string &name,
                                        const std::string &arguments_json = "{}",
                                        std::vector<std::string> depends_on = {});

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Everything currently queued on a subscription.
[[nodiscard]] std::vector<events::Event> drain(events::Subscription &subscription);

/// Payloads of one kind, in publication order.
template <typename T> std::vector<T> payloads_of(const std::vector<events::Event> &events) {
  std::vector<T> out;
  for (const auto &event : events) {
    if (const auto *payload = std::get_if<T>(&event.payload)) {
      out.push_back(*payload);
    }
  }
  return out;
}

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::string read_file(const std::string &name) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();
};

/// Polls until predicate holds or timeout passes.
bool wait_until(const std::function<bool()> &predicate,
                std::chrono::milliseconds timeout = std::chrono::milliseconds(2000));

} // namespace warden::testing
