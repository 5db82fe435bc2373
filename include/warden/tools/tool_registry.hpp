#pragma once

#include "warden/sandbox/sandbox.hpp"
#include "warden/tools/tool.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace warden::tools {

enum class RegistryChange { Registered, Unregistered };

/// Name -> capability map. Safe for concurrent lookups and invocations; registration
/// changes notify every listener after the lock is released.
class ToolRegistry {
public:
  using Listener = std::function<void(RegistryChange, const std::string &)>;

  ToolRegistry() = default;

  /// Registry holding shell, file_read and file_write.
  [[nodiscard]] static std::shared_ptr<ToolRegistry>
  create_default(const sandbox::SandboxConfig &sandbox, std::uint32_t shell_timeout_ms = 60'000);

  ToolRegistry(const ToolRegistry &) = delete;
  ToolRegistry &operator=(const ToolRegistry &) = delete;

  /// Registers or replaces the tool under its lowercase name.
  void register_tool(std::shared_ptr<ITool> tool);
  bool unregister_tool(std::string_view name);

  [[nodiscard]] std::shared_ptr<ITool> get_tool(std::string_view name) const;
  [[nodiscard]] std::optional<security::SecurityTier> declared_tier(std::string_view name) const;
  [[nodiscard]] std::optional<std::string> schema(std::string_view name) const;
  [[nodiscard]] std::vector<ToolSpec> all_specs() const;
  [[nodiscard]] std::size_t size() const;

  /// Validates and runs a tool without consulting the gate. Callers outside the
  /// executor must have obtained a decision first.
  [[nodiscard]] common::Result<ToolResult> invoke(std::string_view name,
                                                  const std::string &arguments_json,
                                                  const ToolContext &ctx) const;

  void add_listener(Listener listener);

private:
  void notify(RegistryChange change, const std::string &name) const;

  mutable std::shared_mutex mutex_;
  std::unordered_map<std::string, std::shared_ptr<ITool>> by_name_;
  std::vector<std::string> order_;
  std::vector<Listener> listeners_;
};

} // namespace warden::tools
