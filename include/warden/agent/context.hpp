#pragma once

#include "warden/providers/traits.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden::agent {

struct ContextLimits {
  /// Estimated token budget for the whole request. 0 disables pruning.
  std::size_t max_context_tokens = 80'000;
  /// Per tool result fed back to the model. 0 disables compaction.
  std::size_t max_tool_output_tokens = 4'000;
  /// Most recent messages that are never pruned.
  std::size_t min_tail = 6;
};

/// Rough estimate of four characters per token.
[[nodiscard]] std::size_t estimate_tokens(const std::string &text);

/// Content, tool call names and arguments, plus a fixed per-message overhead.
[[nodiscard]] std::size_t estimate_message_tokens(const providers::ChatMessage &message);

[[nodiscard]] std::size_t estimate_request_tokens(const std::vector<providers::ChatMessage> &messages);

/// Drops the oldest messages after the system prompt and the user's prompt until the
/// estimate fits the budget. The last min_tail messages are kept, and tool results
/// whose assistant message was dropped go with it. Returns the number removed.
std::size_t prune_to_budget(std::vector<providers::ChatMessage> &messages, std::size_t budget,
                            std::size_t min_tail);

/// Cuts output to max_tokens worth of characters, preferring a line boundary, and
/// marks it with "[truncated]".
[[nodiscard]] std::string compact_tool_output(const std::string &output, std::size_t max_tokens);

/// Consecutive failures per tool within one run.
class FailureTracker {
public:
  void record_success(const std::string &tool);
  /// Returns the new consecutive failure count.
  std::size_t record_failure(const std::string &tool);
  [[nodiscard]] std::size_t failures(const std::string &tool) const;

private:
  std::unordered_map<std::string, std::size_t> counts_;
};

[[nodiscard]] std::string reflexion_hint(const std::string &tool, std::size_t failures);

} // namespace warden::agent
