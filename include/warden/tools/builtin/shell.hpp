#pragma once

#include "warden/sandbox/sandbox.hpp"
#include "warden/tools/tool.hpp"

#include <cstdint>

namespace warden::tools {

class ShellTool final : public ITool {
public:
  explicit ShellTool(sandbox::SandboxConfig sandbox = {}, std::uint32_t timeout_ms = 60'000);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] security::SecurityTier tier() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;

  [[nodiscard]] std::uint32_t timeout_ms() const override;
  [[nodiscard]] bool parallel_safe() const override;

private:
  sandbox::SandboxConfig sandbox_;
  std::uint32_t timeout_ms_;
};

} // namespace warden::tools
