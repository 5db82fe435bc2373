#include "warden/agent/context.hpp"

namespace warden::agent {

namespace {

constexpr std::size_t kCharsPerToken = 4;
constexpr std::size_t kMessageOverhead = 4;
/// System prompt and the user's prompt.
constexpr std::size_t kPinnedMessages = 2;

} // namespace

std::size_t estimate_tokens(const std::string &text) {
  return (text.size() + kCharsPerToken - 1) / kCharsPerToken;
}

std::size_t estimate_message_tokens(const providers::ChatMessage &message) {
  std::size_t tokens = estimate_tokens(message.content) + kMessageOverhead;
  for (const auto &call : message.tool_calls) {
    tokens += estimate_tokens(call.name) + estimate_tokens(call.arguments_json);
  }
  return tokens;
}

std::size_t estimate_request_tokens(const std::vector<providers::ChatMessage> &messages) {
  std::size_t total = 0;
  for (const auto &message : messages) {
    total += estimate_message_tokens(message);
  }
  return total;
}

std::size_t prune_to_budget(std::vector<providers::ChatMessage> &messages, const std::size_t budget,
                            const std::size_t min_tail) {
  std::size_t removed = 0;
  std::size_t total = estimate_request_tokens(messages);
  while (total > budget && messages.size() > kPinnedMessages + min_tail) {
    total -= estimate_message_tokens(messages[kPinnedMessages]);
    messages.erase(messages.begin() + static_cast<std::ptrdiff_t>(kPinnedMessages));
    ++removed;
    // A tool result without its assistant message is rejected by the API.
    while (messages.size() > kPinnedMessages + min_tail &&
           messages[kPinnedMessages].role == providers::Role::Tool) {
      total -= estimate_message_tokens(messages[kPinnedMessages]);
      messages.erase(messages.begin() + static_cast<std::ptrdiff_t>(kPinnedMessages));
      ++removed;
    }
  }
  return removed;
}

std::string compact_tool_output(const std::string &output, const std::size_t max_tokens) {
  const std::size_t max_chars = max_tokens * kCharsPerToken;
  if (max_tokens == 0 || output.size() <= max_chars) {
    return output;
  }
  std::string head = output.substr(0, max_chars);
  if (const auto newline = head.rfind('\n'); newline != std::string::npos && newline > 0) {
    head.resize(newline);
  }
  return head + "\n[truncated]";
}

void FailureTracker::record_success(const std::string &tool) { counts_.erase(tool); }

std::size_t FailureTracker::record_failure(const std::string &tool) { return ++counts_[tool]; }

std::size_t FailureTracker::failures(const std::string &tool) const {
  const auto it = counts_.find(tool);
  return it == counts_.end() ? 0 : it->second;
}

std::string reflexion_hint(const std::string &tool, const std::size_t failures) {
  return "The tool `" + tool + "` has failed " + std::to_string(failures) +
         " times in a row. Try a different approach or use a different tool to accomplish "
         "the task.";
}

} // namespace warden::agent
