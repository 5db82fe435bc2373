#include "warden/agent/tool_executor.hpp"

#include "warden/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <optional>
#include <thread>
#include <unordered_map>

namespace warden::agent {

namespace {

using common::ErrorKind;

bool is_cancelled(const ExecutionContext &ctx) {
  return ctx.cancel != nullptr && ctx.cancel->is_cancelled();
}

bool is_parallel_safe(const tools::ToolRegistry &registry, const std::string &name) {
  const auto tool = registry.get_tool(name);
  return tool == nullptr || tool->parallel_safe();
}

} // namespace

ToolExecutor::ToolExecutor(Dependencies dependencies, common::RetryPolicy retry)
    : deps_(std::move(dependencies)), retry_(retry) {}

void ToolExecutor::publish(const ExecutionContext &ctx, events::EventPayload payload) const {
  if (deps_.bus != nullptr) {
    deps_.bus->publish(ctx.session_id, std::move(payload));
  }
}

std::vector<ToolOutcome> ToolExecutor::execute(const std::vector<tools::ToolCall> &calls,
                                               const security::SecurityPolicy &policy,
                                               const ExecutionContext &ctx) const {
  // Decisions are taken up front, in proposal order, so the audit trail is stable.
  std::vector<security::SecurityDecision> decisions;
  decisions.reserve(calls.size());
  const security::GateContext gate_ctx{
      .is_sub_agent = ctx.is_sub_agent, .session_id = ctx.session_id, .turn = ctx.turn};
  for (const auto &call : calls) {
    auto decision = deps_.gate->decide(call, policy, gate_ctx);
    publish(ctx, events::ToolCallDecided{
                     .turn = ctx.turn,
                     .call_id = call.id,
                     .tool = call.name,
                     .base_tier = decision.base_tier,
                     .effective_tier = decision.effective_tier,
                     .outcome = decision.outcome,
                     .matched_pattern = decision.matched_pattern,
                     .reason = decision.reason,
                 });
    decisions.push_back(std::move(decision));
  }

  std::vector<std::shared_future<ToolOutcome>> futures;
  futures.reserve(calls.size());
  std::unordered_map<std::string, std::size_t> index_by_id;
  std::optional<std::size_t> last_serial;

  for (std::size_t i = 0; i < calls.size(); ++i) {
    const auto &call = calls[i];
    std::vector<std::shared_future<ToolOutcome>> prerequisites;
    for (const auto &dependency : call.depends_on) {
      // Only earlier calls can be waited on; anything else cannot form a cycle.
      const auto it = index_by_id.find(dependency);
      if (it != index_by_id.end()) {
        prerequisites.push_back(futures[it->second]);
      }
    }
    const bool serial = decisions[i].outcome != security::GateOutcome::Deny &&
                        !is_parallel_safe(*deps_.registry, call.name);
    if (serial) {
      if (last_serial.has_value()) {
        prerequisites.push_back(futures[*last_serial]);
      }
      last_serial = i;
    }

    const auto decision = decisions[i];
    futures.push_back(std::async(std::launch::async, [this, call, decision, ctx,
                                                      prerequisites = std::move(prerequisites)]() {
                        for (const auto &prerequisite : prerequisites) {
                          prerequisite.wait();
                        }
                        return run_call(call, decision, ctx);
                      }).share());
    index_by_id.emplace(call.id, i);
  }

  std::vector<ToolOutcome> outcomes;
  outcomes.reserve(calls.size());
  for (auto &future : futures) {
    outcomes.push_back(future.get());
  }
  std::stable_sort(outcomes.begin(), outcomes.end(),
                   [](const ToolOutcome &a, const ToolOutcome &b) { return a.call_id < b.call_id; });
  return outcomes;
}

bool ToolExecutor::await_approval(const tools::ToolCall &call,
                                  const security::SecurityDecision &decision,
                                  const ExecutionContext &ctx, ToolOutcome &outcome) const {
  if (deps_.broker == nullptr) {
    outcome.error_kind = ErrorKind::PolicyViolation;
    outcome.output = "Approval required but no approver is available: " + decision.reason;
    return false;
  }
  const auto ticket = deps_.broker->request_approval(
      call, decision, std::chrono::seconds(decision.approval_timeout_secs), ctx.session_id);
  const auto status = deps_.broker->await_outcome(ticket, ctx.cancel.get());
  if (status == security::ApprovalStatus::Approved) {
    return true;
  }
  if (is_cancelled(ctx)) {
    outcome.error_kind = ErrorKind::Cancelled;
    outcome.output = "Run cancelled while awaiting approval";
    return false;
  }
  outcome.error_kind = ErrorKind::PolicyViolation;
  outcome.output = status == security::ApprovalStatus::TimedOut
                       ? "Approval timed out for " + call.name
                       : "Approval denied for " + call.name;
  return false;
}

ToolOutcome ToolExecutor::run_call(const tools::ToolCall &call,
                                   const security::SecurityDecision &decision,
                                   const ExecutionContext &ctx) const {
  ToolOutcome outcome{
      .call_id = call.id,
      .tool = call.name,
      .decision = decision.outcome,
      .effective_tier = decision.effective_tier,
  };

  if (decision.outcome == security::GateOutcome::Deny) {
    outcome.error_kind = decision.error_kind == ErrorKind::None ? ErrorKind::PolicyViolation
                                                                : decision.error_kind;
    outcome.output = "Denied: " + decision.reason;
    return outcome;
  }
  if (decision.outcome == security::GateOutcome::NeedsApproval &&
      !await_approval(call, decision, ctx, outcome)) {
    return outcome;
  }

  const auto tool = deps_.registry->get_tool(call.name);
  if (tool == nullptr) {
    outcome.error_kind = ErrorKind::PolicyViolation;
    outcome.output = "Tool was unregistered before it ran: " + call.name;
    return outcome;
  }

  std::uint32_t transient_failures = 0;
  std::uint32_t tool_failures = 0;
  for (std::uint32_t attempt = 1;; ++attempt) {
    if (is_cancelled(ctx)) {
      outcome.error_kind = ErrorKind::Cancelled;
      outcome.output = "Run cancelled before " + call.name + " finished";
      return outcome;
    }
    outcome.attempts = attempt;
    publish(ctx, events::ToolStarted{.turn = ctx.turn,
                                     .call_id = call.id,
                                     .tool = call.name,
                                     .arguments_json = call.arguments_json,
                                     .attempt = attempt});

    const auto deadline = common::CancellationToken::Clock::now() +
                          std::chrono::milliseconds(tool->timeout_ms());
    auto call_token = std::make_shared<common::CancellationToken>(ctx.cancel, deadline);
    const tools::ToolContext tool_ctx{
        .workspace_path = ctx.workspace,
        .session_id = ctx.session_id,
        .call_id = call.id,
        .is_sub_agent = ctx.is_sub_agent,
        .depth = ctx.depth,
        .cancel = call_token,
    };

    const auto started = std::chrono::steady_clock::now();
    auto result = deps_.registry->invoke(call.name, call.arguments_json, tool_ctx);
    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    ErrorKind kind = ErrorKind::None;
    std::string message;
    if (!result.ok()) {
      kind = result.error_kind();
      message = result.error();
    } else if (!result.value().success) {
      kind = ErrorKind::ToolExecution;
      message = result.value().output;
    }
    if (kind != ErrorKind::None && call_token->deadline_exceeded() && !is_cancelled(ctx)) {
      kind = ErrorKind::TransientInfra;
      message = call.name + " timed out after " + std::to_string(tool->timeout_ms()) + "ms";
    }

    publish(ctx, events::ToolFinished{.turn = ctx.turn,
                                      .call_id = call.id,
                                      .tool = call.name,
                                      .success = kind == ErrorKind::None,
                                      .error_kind = kind,
                                      .duration_ms = static_cast<std::uint64_t>(duration.count())});
    observability::record_tool_call(call.name, duration, kind == ErrorKind::None);

    if (kind == ErrorKind::None) {
      outcome.success = true;
      outcome.error_kind = ErrorKind::None;
      outcome.output = result.value().output;
      return outcome;
    }

    outcome.error_kind = kind;
    outcome.output = message;
    bool retry = false;
    if (common::is_transient(kind) && transient_failures < retry_.max_retries) {
      retry = true;
      ++transient_failures;
    } else if (kind == ErrorKind::ToolExecution && tool_failures < tool->max_retries()) {
      retry = true;
      ++tool_failures;
    }
    if (!retry) {
      return outcome;
    }
    const auto delay = common::backoff_delay_ms(retry_, attempt - 1);
    if (ctx.cancel == nullptr) {
      std::this_thread::sleep_for(std::chrono::milliseconds(delay));
    } else if (!ctx.cancel->sleep_for(std::chrono::milliseconds(delay))) {
      outcome.error_kind = ErrorKind::Cancelled;
      outcome.output = "Run cancelled while retrying " + call.name + ": " + message;
      return outcome;
    }
  }
}

} // namespace warden::agent
