#pragma once

#include "warden/agent/factory.hpp"
#include "warden/checkpoint/store.hpp"
#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/events/event_bus.hpp"
#include "warden/goal/evaluator.hpp"
#include "warden/providers/traits.hpp"
#include "warden/security/approval.hpp"
#include "warden/security/decision_log.hpp"
#include "warden/tools/tool_registry.hpp"

#include <memory>

namespace warden::runtime {

/// Everything one process shares across its runs.
struct AgentRuntime {
  std::shared_ptr<events::EventBus> bus;
  std::shared_ptr<security::ApprovalBroker> broker;
  std::shared_ptr<tools::ToolRegistry> registry;
  std::shared_ptr<security::DecisionLog> decisions;
  std::shared_ptr<checkpoint::ICheckpointStore> checkpoints;
  std::shared_ptr<goal::PredicateRegistry> predicates;
  std::shared_ptr<agent::AgentFactory> factory;
};

class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  /// Installs the configured observer and wires the runtime around model.
  [[nodiscard]] common::Result<AgentRuntime>
  create_runtime(std::shared_ptr<providers::IModelClient> model) const;

  /// Null when checkpoints are disabled.
  [[nodiscard]] common::Result<std::shared_ptr<checkpoint::ICheckpointStore>>
  open_checkpoints() const;

private:
  config::Config config_;
};

} // namespace warden::runtime
