#pragma once

#include "warden/common/cancellation.hpp"
#include "warden/common/result.hpp"
#include "warden/security/tier.hpp"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace warden::tools {

/// Decoded top-level arguments. String values are unescaped; nested values stay as
/// raw JSON text.
using ToolArgs = std::unordered_map<std::string, std::string>;

/// One action requested by the model.
struct ToolCall {
  std::string id;
  std::string name;
  std::string arguments_json = "{}";
  /// Ids of calls in the same turn whose results this call needs first.
  std::vector<std::string> depends_on;
};

struct ToolResult {
  std::string output;
  bool success = true;
  bool truncated = false;
  std::unordered_map<std::string, std::string> metadata;
};

struct ToolSpec {
  std::string name;
  std::string description;
  std::string parameters_json;
  security::SecurityTier tier = security::SecurityTier::T4;
};

struct ToolContext {
  std::filesystem::path workspace_path;
  std::string session_id;
  std::string call_id;
  bool is_sub_agent = false;
  std::size_t depth = 0;
  std::shared_ptr<const common::CancellationToken> cancel;

  [[nodiscard]] bool cancelled() const { return cancel != nullptr && cancel->is_cancelled(); }
};

class ITool {
public:
  virtual ~ITool() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string_view description() const = 0;
  [[nodiscard]] virtual std::string parameters_schema() const = 0;
  [[nodiscard]] virtual security::SecurityTier tier() const = 0;
  [[nodiscard]] virtual common::Result<ToolResult> execute(const ToolArgs &args,
                                                           const ToolContext &ctx) = 0;

  [[nodiscard]] virtual std::uint32_t timeout_ms() const { return 60'000; }
  /// Extra attempts after a ToolExecution failure.
  [[nodiscard]] virtual std::uint32_t max_retries() const { return 0; }
  /// False for tools that mutate shared state; such calls run one at a time.
  [[nodiscard]] virtual bool parallel_safe() const { return true; }

  [[nodiscard]] ToolSpec spec() const;
};

/// Check arguments against a JSON schema of the form
/// {"type":"object","required":[...],"properties":{"k":{"type":"string"}},
///  "additionalProperties":false}. Failures carry ErrorKind::Schema.
[[nodiscard]] common::Status validate_arguments(const std::string &schema_json,
                                                const std::string &arguments_json);

/// Decode validated arguments into the flat map handed to ITool::execute.
[[nodiscard]] ToolArgs decode_arguments(const std::string &arguments_json);

/// Resolve a tool-supplied path against the workspace, rejecting anything that
/// escapes it.
[[nodiscard]] common::Result<std::filesystem::path>
resolve_in_workspace(const std::filesystem::path &workspace, const std::string &path);

/// Fetch a required string argument.
[[nodiscard]] common::Result<std::string> required_arg(const ToolArgs &args,
                                                       const std::string &name);

} // namespace warden::tools
