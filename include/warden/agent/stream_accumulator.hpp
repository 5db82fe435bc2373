#pragma once

#include "warden/providers/traits.hpp"
#include "warden/tools/tool.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden::agent {

/// Folds the deltas of one model turn into text, ordered tool calls and usage.
class StreamAccumulator {
public:
  explicit StreamAccumulator(std::size_t turn_index);

  void add(const providers::ModelDelta &delta);

  [[nodiscard]] const std::string &text() const { return text_; }
  /// Calls ordered by stream index. Missing ids are filled in as call-<turn>-<index>
  /// and empty argument text becomes "{}".
  [[nodiscard]] std::vector<tools::ToolCall> tool_calls() const;
  [[nodiscard]] std::uint64_t input_tokens() const { return input_tokens_; }
  [[nodiscard]] std::uint64_t output_tokens() const { return output_tokens_; }
  [[nodiscard]] bool ended() const { return stop_reason_.has_value(); }
  [[nodiscard]] const std::optional<std::string> &stop_reason() const { return stop_reason_; }

private:
  struct PendingCall {
    std::string id;
    std::string name;
    std::string arguments;
    std::vector<std::string> depends_on;
  };

  std::size_t turn_index_;
  std::string text_;
  std::map<std::size_t, PendingCall> calls_;
  std::uint64_t input_tokens_ = 0;
  std::uint64_t output_tokens_ = 0;
  std::optional<std::string> stop_reason_;
};

} // namespace warden::agent
