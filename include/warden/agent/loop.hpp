#pragma once

#include "warden/agent/context.hpp"
#include "warden/agent/session.hpp"
#include "warden/agent/tool_executor.hpp"
#include "warden/checkpoint/store.hpp"
#include "warden/common/cancellation.hpp"
#include "warden/common/retry.hpp"
#include "warden/events/event_bus.hpp"
#include "warden/goal/evaluator.hpp"
#include "warden/guardian/watchdog.hpp"
#include "warden/providers/traits.hpp"
#include "warden/security/approval.hpp"
#include "warden/security/gate.hpp"
#include "warden/security/policy.hpp"
#include "warden/tools/tool_registry.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::agent {

/// What to do when max_turns or max_duration is reached.
enum class LimitBehavior { Fail, Complete };

struct LoopOptions {
  std::string system_prompt =
      "You are an autonomous agent. Work towards the user's request using the available "
      "tools. When the task is done, reply with the final answer and no tool calls.";
  std::size_t max_turns = 20;
  std::chrono::seconds max_duration{900};
  LimitBehavior on_limit = LimitBehavior::Fail;
  /// Whole-turn retries after the model client's own retries are spent.
  std::uint32_t turn_retries = 1;
  common::RetryPolicy model_retry;
  common::RetryPolicy tool_retry;
  providers::GenerationOptions generation;
  std::filesystem::path workspace = ".";
  guardian::GuardianConfig guardian;
  /// Bound on how long a turn waits for the watchdog to process earlier events.
  std::chrono::milliseconds watchdog_sync{200};
  ContextLimits context;
  /// Consecutive failures of one tool before the model is told to change approach.
  /// 0 disables the hint.
  std::size_t reflexion_threshold = 3;
};

struct AgentDependencies {
  std::shared_ptr<providers::IModelClient> model;
  std::shared_ptr<tools::ToolRegistry> registry;
  std::shared_ptr<security::SecurityGate> gate;
  std::shared_ptr<security::ApprovalBroker> broker;
  std::shared_ptr<events::EventBus> bus;
  /// Optional: without a store nothing is checkpointed and resume is unavailable.
  std::shared_ptr<checkpoint::ICheckpointStore> checkpoints;
  /// Optional: defaults to a Level 0 only evaluator.
  std::shared_ptr<const goal::GoalEvaluator> evaluator;
};

/// Where a loop sits in the agent tree.
struct LoopScope {
  bool is_sub_agent = false;
  std::size_t depth = 0;
  std::shared_ptr<const common::CancellationToken> parent_cancel;
};

struct RunRequest {
  std::string prompt;
  std::optional<std::string> session_id;
  std::optional<goal::Goal> goal;
};

struct RunOutcome {
  Session session;
  /// Final model output for completed runs.
  std::string output;
  common::ErrorKind error_kind = common::ErrorKind::None;
  std::string reason;

  [[nodiscard]] bool completed() const { return session.status == SessionStatus::Completed; }
};

/// Drives one session from prompt to a terminal state, one turn at a time.
class AgentLoop {
public:
  AgentLoop(AgentDependencies deps, LoopOptions options, security::SecurityPolicy policy,
            LoopScope scope = {});

  AgentLoop(const AgentLoop &) = delete;
  AgentLoop &operator=(const AgentLoop &) = delete;

  [[nodiscard]] common::Result<RunOutcome> run(const RunRequest &request);

  /// Continues a checkpointed session at its next turn. A corrupt checkpoint fails the
  /// session; a terminal one is refused.
  [[nodiscard]] common::Result<RunOutcome> resume(const std::string &session_id);

  /// Safe from any thread. In-flight tools are terminated and pending approvals denied.
  void cancel();

  [[nodiscard]] const LoopOptions &options() const { return options_; }

private:
  struct TurnResult {
    bool ok = true;
    common::ErrorKind kind = common::ErrorKind::None;
    std::string error;
  };

  [[nodiscard]] RunOutcome drive(Session session, bool resumed);
  [[nodiscard]] TurnResult run_turn(Session &session, Turn &turn,
                                    const std::shared_ptr<const common::CancellationToken> &token);
  [[nodiscard]] providers::ModelRequest build_request(const Session &session,
                                                      const std::vector<std::string> &notes) const;
  [[nodiscard]] RunOutcome finish(Session &session, SessionStatus status, std::string reason,
                                  common::ErrorKind kind, std::chrono::steady_clock::time_point started);
  void save_checkpoint(const Session &session);
  void publish(const std::string &session_id, events::EventPayload payload);
  [[nodiscard]] std::shared_ptr<common::CancellationToken> begin_run();

  AgentDependencies deps_;
  LoopOptions options_;
  security::SecurityPolicy policy_;
  LoopScope scope_;
  ToolExecutor executor_;

  std::mutex run_mutex_;
  std::shared_ptr<common::CancellationToken> run_token_;
};

/// Human-readable transcript of a session, as handed to the judge.
[[nodiscard]] std::string render_transcript(const Session &session);

/// System prompt section describing the goal, its criteria and constraints.
[[nodiscard]] std::string describe_goal(const goal::Goal &goal);

} // namespace warden::agent
