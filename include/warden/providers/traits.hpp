#pragma once

#include "warden/common/cancellation.hpp"
#include "warden/common/result.hpp"
#include "warden/tools/tool.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden::providers {

enum class Role { System, User, Assistant, Tool };

[[nodiscard]] std::string role_to_string(Role role);

struct ChatMessage {
  Role role = Role::User;
  std::string content;
  /// Set on Role::Tool messages.
  std::string tool_call_id;
  /// Set on assistant messages that requested tools.
  std::vector<tools::ToolCall> tool_calls;

  [[nodiscard]] static ChatMessage system(std::string content);
  [[nodiscard]] static ChatMessage user(std::string content);
  [[nodiscard]] static ChatMessage assistant(std::string content,
                                             std::vector<tools::ToolCall> tool_calls = {});
  [[nodiscard]] static ChatMessage tool(std::string tool_call_id, std::string content);
};

struct GenerationOptions {
  std::string model;
  std::optional<std::uint32_t> max_tokens;
  /// "low", "medium" or "high"; empty leaves it to the provider.
  std::string reasoning_effort;
  double temperature = 0.2;
};

struct ModelRequest {
  std::vector<ChatMessage> messages;
  std::vector<tools::ToolSpec> tools;
  GenerationOptions options;
};

struct TextChunk {
  std::string text;
};

struct ToolCallStart {
  std::size_t index = 0;
  std::string id;
  std::string name;
  /// Ids of earlier calls in the same turn this one must wait for.
  std::vector<std::string> depends_on;
};

struct ToolCallArgs {
  std::size_t index = 0;
  std::string fragment;
};

struct Usage {
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
};

struct EndOfTurn {
  std::string stop_reason;
};

using ModelDelta = std::variant<TextChunk, ToolCallStart, ToolCallArgs, Usage, EndOfTurn>;

/// Returning false stops the stream; the client then returns a Cancelled status.
using DeltaCallback = std::function<bool(const ModelDelta &)>;

/// Streaming language-model capability. Implementations must honour token
/// cancellation mid-stream and classify retryable failures as TransientInfra.
class IModelClient {
public:
  virtual ~IModelClient() = default;

  [[nodiscard]] virtual common::Status stream(const ModelRequest &request,
                                              const DeltaCallback &on_delta,
                                              const common::CancellationToken &cancel) = 0;
  [[nodiscard]] virtual std::string name() const = 0;
};

/// Runs a tools-free request and returns the concatenated text.
[[nodiscard]] common::Result<std::string> complete_text(IModelClient &client,
                                                        const ModelRequest &request,
                                                        const common::CancellationToken &cancel);

} // namespace warden::providers
