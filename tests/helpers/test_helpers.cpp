#include "tests/helpers/test_helpers.hpp"

#include <cstdlib>
#include <fstream>
#include <random>
#include <sstream>
#include <thread>

namespace warden::testing {

config::Config mock_config() {
  config::Config config;
  config.model.model = "test-model";
  config.model.api_key = "test-key";
  config.observability.backend = "none";
  config.checkpoint.enabled = false;
  config.sandbox.enabled = false;
  config.judge.enabled = false;
  return config;
}

ScriptedTurn text_turn(const std::string &text, const std::uint64_t input_tokens,
                       const std::uint64_t output_tokens) {
  ScriptedTurn turn;
  turn.deltas.push_back(providers::TextChunk{.text = text});
  turn.deltas.push_back(
      providers::Usage{.input_tokens = input_tokens, .output_tokens = output_tokens});
  turn.deltas.push_back(providers::EndOfTurn{.stop_reason = "stop"});
  return turn;
}

ScriptedTurn tool_turn(const std::vector<tools::ToolCall> &calls, const std::string &text) {
  ScriptedTurn turn;
  if (!text.empty()) {
    turn.deltas.push_back(providers::TextChunk{.text = text});
  }
  for (std::size_t i = 0; i < calls.size(); ++i) {
    turn.deltas.push_back(providers::ToolCallStart{.index = i,
                                                   .id = calls[i].id,
                                                   .name = calls[i].name,
                                                   .depends_on = calls[i].depends_on});
    turn.deltas.push_back(providers::ToolCallArgs{.index = i, .fragment = calls[i].arguments_json});
  }
  turn.deltas.push_back(providers::Usage{.input_tokens = 20, .output_tokens = 10});
  turn.deltas.push_back(providers::EndOfTurn{.stop_reason = "tool_calls"});
  return turn;
}

ScriptedTurn failed_turn(const common::ErrorKind kind, const std::string &message) {
  ScriptedTurn turn;
  turn.status = common::Status::error(kind, message);
  return turn;
}

ScriptedTurn truncated_turn(const std::string &text) {
  ScriptedTurn turn;
  turn.deltas.push_back(providers::TextChunk{.text = text});
  return turn;
}

void ScriptedModelClient::push(ScriptedTurn turn) {
  std::lock_guard<std::mutex> lock(mutex_);
  script_.push_back(std::move(turn));
}

common::Status ScriptedModelClient::stream(const providers::ModelRequest &request,
                                           const providers::DeltaCallback &on_delta,
                                           const common::CancellationToken &cancel) {
  ScriptedTurn turn;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
    if (script_.empty()) {
      turn = text_turn("done");
    } else {
      turn = std::move(script_.front());
      script_.pop_front();
    }
  }
  if (turn.delay.count() > 0 && !cancel.sleep_for(turn.delay)) {
    return common::Status::error(common::ErrorKind::Cancelled, "cancelled");
  }
  if (!turn.status.ok()) {
    return turn.status;
  }
  for (const auto &delta : turn.deltas) {
    if (!on_delta(delta)) {
      return common::Status::error(common::ErrorKind::Cancelled, "stream stopped");
    }
  }
  return common::Status::success();
}

std::vector<providers::ModelRequest> ScriptedModelClient::requests() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_;
}

std::size_t ScriptedModelClient::calls() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return requests_.size();
}

FakeTool::FakeTool(std::string name, ToolHandler handler, FakeToolOptions options)
    : name_(std::move(name)), handler_(std::move(handler)), options_(std::move(options)) {}

common::Result<tools::ToolResult> FakeTool::execute(const tools::ToolArgs &args,
                                                    const tools::ToolContext &ctx) {
  ++invocations_;
  return handler_(args, ctx);
}

std::shared_ptr<FakeTool> echo_tool(const std::string &name, FakeToolOptions options) {
  return std::make_shared<FakeTool>(
      name,
      [](const tools::ToolArgs &args, const tools::ToolContext &) {
        tools::ToolResult result;
        const auto it = args.find("value");
        result.output = it == args.end() ? "" : it->second;
        return common::Result<tools::ToolResult>::success(std::move(result));
      },
      std::move(options));
}

tools::ToolCall make_call(const std::string &id, const std::string &name,
                          const std::string &arguments_json, std::vector<std::string> depends_on) {
  return tools::ToolCall{.id = id,
                         .name = name,
                         .arguments_json = arguments_json,
                         .depends_on = std::move(depends_on)};
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

std::vector<events::Event> drain(events::Subscription &subscription) {
  std::vector<events::Event> out;
  while (auto envelope = subscription.try_next()) {
    out.push_back(std::move(envelope->event));
  }
  return out;
}

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("warden-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::trunc);
  out << content;
}

std::string TempWorkspace::read_file(const std::string &name) const {
  std::ifstream in(path_ / name);
  std::stringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

EnvGuard::EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
  if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
    old_value = existing;
  }
  if (value.has_value()) {
    setenv(key.c_str(), value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

EnvGuard::~EnvGuard() {
  if (old_value.has_value()) {
    setenv(key.c_str(), old_value->c_str(), 1);
  } else {
    unsetenv(key.c_str());
  }
}

bool wait_until(const std::function<bool()> &predicate, const std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (predicate()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return predicate();
}

} // namespace warden::testing
