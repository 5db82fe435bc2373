#pragma once

#include "warden/agent/factory.hpp"
#include "warden/tools/tool.hpp"

#include <memory>

namespace warden::agent {

struct SpawnOptions {
  std::size_t max_turns = 8;
  /// Sub-agents at this depth may not spawn further.
  std::size_t max_depth = 2;
  std::uint32_t timeout_ms = 600'000;
};

/// Delegates a task to a nested loop running under the sub-agent policy overlay.
class SpawnAgentTool final : public tools::ITool {
public:
  SpawnAgentTool(std::weak_ptr<const AgentFactory> factory, SpawnOptions options = {});

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] security::SecurityTier tier() const override;
  [[nodiscard]] common::Result<tools::ToolResult> execute(const tools::ToolArgs &args,
                                                          const tools::ToolContext &ctx) override;
  [[nodiscard]] std::uint32_t timeout_ms() const override;

private:
  std::weak_ptr<const AgentFactory> factory_;
  SpawnOptions options_;
};

} // namespace warden::agent
