#include "warden/tools/tool_registry.hpp"

#include "warden/common/fs.hpp"
#include "warden/tools/builtin/file_read.hpp"
#include "warden/tools/builtin/file_write.hpp"
#include "warden/tools/builtin/shell.hpp"

#include <algorithm>
#include <mutex>

namespace warden::tools {

std::shared_ptr<ToolRegistry> ToolRegistry::create_default(const sandbox::SandboxConfig &sandbox,
                                                           const std::uint32_t shell_timeout_ms) {
  auto registry = std::make_shared<ToolRegistry>();
  registry->register_tool(std::make_shared<ShellTool>(sandbox, shell_timeout_ms));
  registry->register_tool(std::make_shared<FileReadTool>());
  registry->register_tool(std::make_shared<FileWriteTool>());
  return registry;
}

void ToolRegistry::register_tool(std::shared_ptr<ITool> tool) {
  if (tool == nullptr) {
    return;
  }
  const std::string key = common::to_lower(std::string(tool->name()));
  {
    std::unique_lock lock(mutex_);
    if (!by_name_.contains(key)) {
      order_.push_back(key);
    }
    by_name_[key] = std::move(tool);
  }
  notify(RegistryChange::Registered, key);
}

bool ToolRegistry::unregister_tool(const std::string_view name) {
  const std::string key = common::to_lower(std::string(name));
  {
    std::unique_lock lock(mutex_);
    if (by_name_.erase(key) == 0) {
      return false;
    }
    order_.erase(std::remove(order_.begin(), order_.end(), key), order_.end());
  }
  notify(RegistryChange::Unregistered, key);
  return true;
}

std::shared_ptr<ITool> ToolRegistry::get_tool(const std::string_view name) const {
  std::shared_lock lock(mutex_);
  const auto it = by_name_.find(common::to_lower(std::string(name)));
  if (it == by_name_.end()) {
    return nullptr;
  }
  return it->second;
}

std::optional<security::SecurityTier> ToolRegistry::declared_tier(const std::string_view name) const {
  const auto tool = get_tool(name);
  if (tool == nullptr) {
    return std::nullopt;
  }
  return tool->tier();
}

std::optional<std::string> ToolRegistry::schema(const std::string_view name) const {
  const auto tool = get_tool(name);
  if (tool == nullptr) {
    return std::nullopt;
  }
  return tool->parameters_schema();
}

std::vector<ToolSpec> ToolRegistry::all_specs() const {
  std::shared_lock lock(mutex_);
  std::vector<ToolSpec> specs;
  specs.reserve(order_.size());
  for (const auto &key : order_) {
    specs.push_back(by_name_.at(key)->spec());
  }
  return specs;
}

std::size_t ToolRegistry::size() const {
  std::shared_lock lock(mutex_);
  return by_name_.size();
}

common::Result<ToolResult> ToolRegistry::invoke(const std::string_view name,
                                                const std::string &arguments_json,
                                                const ToolContext &ctx) const {
  const auto tool = get_tool(name);
  if (tool == nullptr) {
    return common::Result<ToolResult>::failure(common::ErrorKind::PolicyViolation,
                                               "unknown tool: " + std::string(name));
  }
  const auto valid = validate_arguments(tool->parameters_schema(), arguments_json);
  if (!valid.ok()) {
    return common::Result<ToolResult>::failure(valid);
  }
  if (ctx.cancelled()) {
    return common::Result<ToolResult>::failure(common::ErrorKind::Cancelled,
                                               "cancelled before " + std::string(name) + " started");
  }
  return tool->execute(decode_arguments(arguments_json), ctx);
}

void ToolRegistry::add_listener(Listener listener) {
  std::unique_lock lock(mutex_);
  listeners_.push_back(std::move(listener));
}

void ToolRegistry::notify(const RegistryChange change, const std::string &name) const {
  std::vector<Listener> listeners;
  {
    std::shared_lock lock(mutex_);
    listeners = listeners_;
  }
  for (const auto &listener : listeners) {
    listener(change, name);
  }
}

} // namespace warden::tools
