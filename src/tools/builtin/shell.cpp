#include "warden/tools/builtin/shell.hpp"

#include "warden/sandbox/process.hpp"

namespace warden::tools {

ShellTool::ShellTool(sandbox::SandboxConfig sandbox, const std::uint32_t timeout_ms)
    : sandbox_(std::move(sandbox)), timeout_ms_(timeout_ms) {}

std::string_view ShellTool::name() const { return "shell"; }

std::string_view ShellTool::description() const {
  return "Run a shell command in the workspace";
}

std::string ShellTool::parameters_schema() const {
  return R"({"type":"object","required":["command"],"properties":{"command":{"type":"string"}},"additionalProperties":false})";
}

security::SecurityTier ShellTool::tier() const { return security::SecurityTier::T3; }

std::uint32_t ShellTool::timeout_ms() const { return timeout_ms_; }

bool ShellTool::parallel_safe() const { return false; }

common::Result<ToolResult> ShellTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  auto command = required_arg(args, "command");
  if (!command.ok()) {
    return common::Result<ToolResult>::failure(command.status());
  }

  sandbox::ProcessRequest request;
  request.timeout = std::chrono::milliseconds(timeout_ms_);
  request.cancel = ctx.cancel;
  if (sandbox_.enabled) {
    const auto container = sandbox::container_name_for(sandbox_, ctx.session_id, ctx.call_id);
    request.argv = {"docker"};
    for (auto &arg : sandbox::build_docker_run_args(sandbox_, container, ctx.workspace_path,
                                                    command.value())) {
      request.argv.push_back(std::move(arg));
    }
    request.container_name = container;
  } else {
    request.argv = {"/bin/sh", "-c", command.value()};
    request.working_dir = ctx.workspace_path;
  }

  auto ran = sandbox::run_process(request);
  if (!ran.ok()) {
    return common::Result<ToolResult>::failure(ran.status());
  }
  const auto &process = ran.value();
  if (process.cancelled) {
    return common::Result<ToolResult>::failure(common::ErrorKind::Cancelled,
                                               "command cancelled");
  }
  if (process.timed_out) {
    return common::Result<ToolResult>::failure(
        common::ErrorKind::TransientInfra,
        "command timed out after " + std::to_string(timeout_ms_) + "ms");
  }

  ToolResult result;
  result.output = process.output;
  result.truncated = process.truncated;
  if (process.truncated) {
    result.output += "\n[output truncated]";
  }
  result.success = process.exit_code == 0;
  result.metadata["exit_code"] =
      process.signaled ? "signal" : std::to_string(process.exit_code);
  if (sandbox_.enabled) {
    result.metadata["sandboxed"] = "true";
  }
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace warden::tools
