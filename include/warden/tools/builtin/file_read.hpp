#pragma once

#include "warden/tools/tool.hpp"

namespace warden::tools {

class FileReadTool final : public ITool {
public:
  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string_view description() const override;
  [[nodiscard]] std::string parameters_schema() const override;
  [[nodiscard]] security::SecurityTier tier() const override;
  [[nodiscard]] common::Result<ToolResult> execute(const ToolArgs &args,
                                                   const ToolContext &ctx) override;
};

} // namespace warden::tools
