#include "warden/agent/spawn_tool.hpp"

#include "warden/common/crypto.hpp"
#include "warden/common/fs.hpp"

namespace warden::agent {

SpawnAgentTool::SpawnAgentTool(std::weak_ptr<const AgentFactory> factory, SpawnOptions options)
    : factory_(std::move(factory)), options_(options) {}

std::string_view SpawnAgentTool::name() const { return "spawn_agent"; }

std::string_view SpawnAgentTool::description() const {
  return "Delegate a self-contained task to a sub-agent and return its final answer";
}

std::string SpawnAgentTool::parameters_schema() const {
  return R"({"type":"object","required":["prompt"],"properties":{"prompt":{"type":"string","description":"Task for the sub-agent"}},"additionalProperties":false})";
}

security::SecurityTier SpawnAgentTool::tier() const { return security::SecurityTier::T3; }

std::uint32_t SpawnAgentTool::timeout_ms() const { return options_.timeout_ms; }

common::Result<tools::ToolResult> SpawnAgentTool::execute(const tools::ToolArgs &args,
                                                          const tools::ToolContext &ctx) {
  auto prompt = tools::required_arg(args, "prompt");
  if (!prompt.ok()) {
    return common::Result<tools::ToolResult>::failure(prompt.status());
  }
  if (common::trim(prompt.value()).empty()) {
    return common::Result<tools::ToolResult>::failure(common::ErrorKind::ToolExecution,
                                                      "prompt must not be empty");
  }
  if (ctx.depth >= options_.max_depth) {
    return common::Result<tools::ToolResult>::failure(
        common::ErrorKind::ToolExecution,
        "sub-agent depth limit of " + std::to_string(options_.max_depth) + " reached");
  }
  const auto factory = factory_.lock();
  if (factory == nullptr) {
    return common::Result<tools::ToolResult>::failure("agent runtime is shutting down");
  }

  auto loop = factory->create_sub_agent(ctx.depth + 1, ctx.cancel, options_.max_turns);
  const std::string session_id = ctx.session_id + ".sub-" + common::random_hex(4);
  auto outcome = loop->run(RunRequest{.prompt = prompt.value(), .session_id = session_id});
  if (!outcome.ok()) {
    return common::Result<tools::ToolResult>::failure(outcome.status());
  }

  const auto &run = outcome.value();
  tools::ToolResult result;
  result.metadata["session_id"] = session_id;
  result.metadata["status"] = session_status_to_string(run.session.status);
  result.metadata["turns"] = std::to_string(run.session.turns.size());
  if (run.session.status == SessionStatus::Cancelled) {
    return common::Result<tools::ToolResult>::failure(common::ErrorKind::Cancelled,
                                                      "sub-agent cancelled");
  }
  if (!run.completed()) {
    result.success = false;
    result.output = "Sub-agent " + session_id + " failed: " + run.reason;
    return common::Result<tools::ToolResult>::success(std::move(result));
  }
  result.output = run.output;
  return common::Result<tools::ToolResult>::success(std::move(result));
}

} // namespace warden::agent
