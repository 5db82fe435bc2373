#pragma once

#include "warden/agent/loop.hpp"

#include <memory>

namespace warden::agent {

/// Shared wiring for every loop of one process: the top-level run and the sub-agents
/// it spawns all use the same bus, broker, gate and store.
class AgentFactory {
public:
  AgentFactory(AgentDependencies deps, LoopOptions options, security::SecurityPolicy policy);

  [[nodiscard]] std::unique_ptr<AgentLoop> create(LoopScope scope = {}) const;
  /// Loop for a sub-agent: sub-agent scope under parent_cancel and at most max_turns.
  [[nodiscard]] std::unique_ptr<AgentLoop>
  create_sub_agent(std::size_t depth, std::shared_ptr<const common::CancellationToken> parent_cancel,
                   std::size_t max_turns) const;

  [[nodiscard]] const AgentDependencies &dependencies() const { return deps_; }
  [[nodiscard]] const LoopOptions &options() const { return options_; }
  [[nodiscard]] const security::SecurityPolicy &policy() const { return policy_; }

private:
  AgentDependencies deps_;
  LoopOptions options_;
  security::SecurityPolicy policy_;
};

} // namespace warden::agent
