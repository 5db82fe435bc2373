#include "warden/tools/builtin/file_read.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace warden::tools {

namespace {

constexpr std::size_t kMaxReadBytes = 64 * 1024;

bool is_binary_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return false;
  }

  std::array<char, 8192> buffer{};
  in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
  const auto count = in.gcount();
  for (std::streamsize i = 0; i < count; ++i) {
    if (buffer[static_cast<std::size_t>(i)] == '\0') {
      return true;
    }
  }
  return false;
}

} // namespace

std::string_view FileReadTool::name() const { return "file_read"; }

std::string_view FileReadTool::description() const { return "Read a UTF-8 text file"; }

std::string FileReadTool::parameters_schema() const {
  return R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"}},"additionalProperties":false})";
}

security::SecurityTier FileReadTool::tier() const { return security::SecurityTier::T0; }

common::Result<ToolResult> FileReadTool::execute(const ToolArgs &args, const ToolContext &ctx) {
  auto path_arg = required_arg(args, "path");
  if (!path_arg.ok()) {
    return common::Result<ToolResult>::failure(path_arg.status());
  }
  auto resolved = resolve_in_workspace(ctx.workspace_path, path_arg.value());
  if (!resolved.ok()) {
    return common::Result<ToolResult>::failure(resolved.status());
  }

  if (is_binary_file(resolved.value())) {
    return common::Result<ToolResult>::failure(common::ErrorKind::ToolExecution,
                                               "Binary file read is not allowed");
  }

  std::ifstream in(resolved.value());
  if (!in) {
    return common::Result<ToolResult>::failure(common::ErrorKind::ToolExecution,
                                               "Failed to open file: " + path_arg.value());
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  std::string content = buffer.str();

  ToolResult result;
  if (content.size() > kMaxReadBytes) {
    content.resize(kMaxReadBytes);
    result.truncated = true;
  }
  result.output = std::move(content);
  return common::Result<ToolResult>::success(std::move(result));
}

} // namespace warden::tools
