#include "warden/tools/builtin/file_write.hpp"

#include <filesystem>
#include <fstream>

namespace warden::tools {

std::string_view FileWriteTool::name() const { return "file_write"; }

std::string_view FileWriteTool::description() const { return "Write content to a file atomically"; }

std::string FileWriteTool::parameters_schema() const {
  return R"({"type":"object","required":["path","content"],"properties":{"path":{"type":"string"},"content":{"type":"string"}},"additionalProperties":false})";
}

security::SecurityTier FileWriteTool::tier() const { return security::SecurityTier::T2; }

bool FileWriteTool::parallel_safe() const { return false; }

common::Result<ToolResult> FileWriteTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  auto path_arg = required_arg(args, "path");
  if (!path_arg.ok()) {
    return common::Result<ToolResult>::failure(path_arg.status());
  }
  const auto content = args.find("content");
  if (content == args.end()) {
    return common::Result<ToolResult>::failure(common::ErrorKind::ToolExecution,
                                               "Missing argument: content");
  }

  auto resolved = resolve_in_workspace(ctx.workspace_path, path_arg.value());
  if (!resolved.ok()) {
    return common::Result<ToolResult>::failure(resolved.status());
  }
  const auto &target = resolved.value();

  std::error_code ec;
  std::filesystem::create_directories(target.parent_path(), ec);
  if (ec) {
    return common::Result<ToolResult>::failure(common::ErrorKind::ToolExecution,
                                               "Failed to create parent directory");
  }

  const auto temp_path = target.string() + ".tmp";
  {
    std::ofstream out(temp_path, std::ios::trunc | std::ios::binary);
    if (!out) {
      return common::Result<ToolResult>::failure(common::ErrorKind::ToolExecution,
                                                 "Failed to open temporary file");
    }
    out << content->second;
    if (!out) {
      return common::Result<ToolResult>::failure(common::ErrorKind::ToolExecution,
                                                 "Failed to write temporary file");
    }
  }

  std::filesystem::rename(temp_path, target, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    return common::Result<ToolResult>::failure(common::ErrorKind::ToolExecution,
                                               "Failed to atomically replace file");
  }

  ToolResult result;
  result.output = "File written: " + target.string();
  result.metadata["bytes"] = std::to_string(content->second.size());
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace warden::tools
