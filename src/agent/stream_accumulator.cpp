#include "warden/agent/stream_accumulator.hpp"

#include "warden/common/fs.hpp"

#include <algorithm>
#include <type_traits>

namespace warden::agent {

StreamAccumulator::StreamAccumulator(const std::size_t turn_index) : turn_index_(turn_index) {}

void StreamAccumulator::add(const providers::ModelDelta &delta) {
  std::visit(
      [this](auto &&value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, providers::TextChunk>) {
          text_ += value.text;
        } else if constexpr (std::is_same_v<T, providers::ToolCallStart>) {
          auto &call = calls_[value.index];
          if (!value.id.empty()) {
            call.id = value.id;
          }
          if (!value.name.empty()) {
            call.name = value.name;
          }
          for (const auto &dependency : value.depends_on) {
            call.depends_on.push_back(dependency);
          }
        } else if constexpr (std::is_same_v<T, providers::ToolCallArgs>) {
          calls_[value.index].arguments += value.fragment;
        } else if constexpr (std::is_same_v<T, providers::Usage>) {
          // Providers report cumulative usage; keep the largest figure seen.
          input_tokens_ = std::max(input_tokens_, value.input_tokens);
          output_tokens_ = std::max(output_tokens_, value.output_tokens);
        } else if constexpr (std::is_same_v<T, providers::EndOfTurn>) {
          stop_reason_ = value.stop_reason;
        }
      },
      delta);
}

std::vector<tools::ToolCall> StreamAccumulator::tool_calls() const {
  std::vector<tools::ToolCall> out;
  out.reserve(calls_.size());
  for (const auto &[index, pending] : calls_) {
    tools::ToolCall call;
    call.id = pending.id.empty()
                  ? "call-" + std::to_string(turn_index_) + "-" + std::to_string(index)
                  : pending.id;
    call.name = pending.name;
    call.arguments_json = common::trim(pending.arguments).empty() ? "{}" : pending.arguments;
    call.depends_on = pending.depends_on;
    out.push_back(std::move(call));
  }
  return out;
}

} // namespace warden::agent
