#include "warden/providers/traits.hpp"

namespace warden::providers {

std::string role_to_string(const Role role) {
  switch (role) {
  case Role::System:
    return "system";
  case Role::User:
    return "user";
  case Role::Assistant:
    return "assistant";
  case Role::Tool:
    return "tool";
  }
  return "user";
}

ChatMessage ChatMessage::system(std::string content) {
  return ChatMessage{.role = Role::System, .content = std::move(content)};
}

ChatMessage ChatMessage::user(std::string content) {
  return ChatMessage{.role = Role::User, .content = std::move(content)};
}

ChatMessage ChatMessage::assistant(std::string content, std::vector<tools::ToolCall> tool_calls) {
  return ChatMessage{
      .role = Role::Assistant, .content = std::move(content), .tool_calls = std::move(tool_calls)};
}

ChatMessage ChatMessage::tool(std::string tool_call_id, std::string content) {
  return ChatMessage{
      .role = Role::Tool, .content = std::move(content), .tool_call_id = std::move(tool_call_id)};
}

common::Result<std::string> complete_text(IModelClient &client, const ModelRequest &request,
                                          const common::CancellationToken &cancel) {
  std::string text;
  const auto status = client.stream(
      request,
      [&text](const ModelDelta &delta) {
        if (const auto *chunk = std::get_if<TextChunk>(&delta)) {
          text += chunk->text;
        }
        return true;
      },
      cancel);
  if (!status.ok()) {
    return common::Result<std::string>::failure(status);
  }
  return common::Result<std::string>::success(std::move(text));
}

} // namespace warden::providers
