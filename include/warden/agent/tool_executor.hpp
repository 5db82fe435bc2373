#pragma once

#include "warden/agent/session.hpp"
#include "warden/common/cancellation.hpp"
#include "warden/common/retry.hpp"
#include "warden/events/event_bus.hpp"
#include "warden/security/approval.hpp"
#include "warden/security/gate.hpp"
#include "warden/tools/tool_registry.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace warden::agent {

struct ExecutionContext {
  std::string session_id;
  std::size_t turn = 0;
  bool is_sub_agent = false;
  std::size_t depth = 0;
  std::filesystem::path workspace;
  std::shared_ptr<const common::CancellationToken> cancel;
};

/// Runs one turn's tool calls: a gate decision per call, approval where needed,
/// then execution with retries. Independent calls run concurrently.
class ToolExecutor {
public:
  struct Dependencies {
    std::shared_ptr<const tools::ToolRegistry> registry;
    std::shared_ptr<security::SecurityGate> gate;
    std::shared_ptr<security::ApprovalBroker> broker;
    std::shared_ptr<events::EventBus> bus;
  };

  ToolExecutor(Dependencies dependencies, common::RetryPolicy retry);

  /// Outcomes come back sorted by call id whatever order the calls finish in. A failed
  /// call never cancels its siblings.
  [[nodiscard]] std::vector<ToolOutcome> execute(const std::vector<tools::ToolCall> &calls,
                                                 const security::SecurityPolicy &policy,
                                                 const ExecutionContext &ctx) const;

private:
  [[nodiscard]] ToolOutcome run_call(const tools::ToolCall &call,
                                     const security::SecurityDecision &decision,
                                     const ExecutionContext &ctx) const;
  [[nodiscard]] bool await_approval(const tools::ToolCall &call,
                                    const security::SecurityDecision &decision,
                                    const ExecutionContext &ctx, ToolOutcome &outcome) const;
  void publish(const ExecutionContext &ctx, events::EventPayload payload) const;

  Dependencies deps_;
  common::RetryPolicy retry_;
};

} // namespace warden::agent
