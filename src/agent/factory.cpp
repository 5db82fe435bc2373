#include "warden/agent/factory.hpp"

#include <algorithm>

namespace warden::agent {

AgentFactory::AgentFactory(AgentDependencies deps, LoopOptions options,
                           security::SecurityPolicy policy)
    : deps_(std::move(deps)), options_(std::move(options)), policy_(std::move(policy)) {
  if (deps_.bus == nullptr) {
    deps_.bus = std::make_shared<events::EventBus>();
  }
  if (deps_.registry == nullptr) {
    deps_.registry = std::make_shared<tools::ToolRegistry>();
  }
  if (deps_.gate == nullptr) {
    deps_.gate = std::make_shared<security::SecurityGate>(deps_.registry);
  }
}

std::unique_ptr<AgentLoop> AgentFactory::create(LoopScope scope) const {
  return std::make_unique<AgentLoop>(deps_, options_, policy_, std::move(scope));
}

std::unique_ptr<AgentLoop>
AgentFactory::create_sub_agent(const std::size_t depth,
                               std::shared_ptr<const common::CancellationToken> parent_cancel,
                               const std::size_t max_turns) const {
  LoopOptions options = options_;
  options.max_turns = std::min(options.max_turns, max_turns);
  return std::make_unique<AgentLoop>(deps_, std::move(options), policy_,
                                     LoopScope{.is_sub_agent = true,
                                               .depth = depth,
                                               .parent_cancel = std::move(parent_cancel)});
}

} // namespace warden::agent
