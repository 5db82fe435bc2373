#include "warden/agent/loop.hpp"

#include "warden/agent/stream_accumulator.hpp"
#include "warden/common/crypto.hpp"
#include "warden/common/time.hpp"
#include "warden/guardian/hint_queue.hpp"
#include "warden/observability/global.hpp"

#include <algorithm>
#include <sstream>

namespace warden::agent {

namespace {

using common::ErrorKind;

constexpr std::size_t kTranscriptOutputLimit = 2000;

AgentDependencies with_defaults(AgentDependencies deps) {
  if (deps.registry == nullptr) {
    deps.registry = std::make_shared<tools::ToolRegistry>();
  }
  if (deps.bus == nullptr) {
    deps.bus = std::make_shared<events::EventBus>();
  }
  if (deps.gate == nullptr) {
    deps.gate = std::make_shared<security::SecurityGate>(deps.registry);
  }
  if (deps.evaluator == nullptr) {
    deps.evaluator = std::make_shared<goal::GoalEvaluator>(goal::JudgeConfig{.llm_enabled = false});
  }
  return deps;
}

std::string format_number(const double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

std::string tool_message_content(const ToolOutcome &outcome) {
  if (outcome.success) {
    return outcome.output;
  }
  return "Error [" + std::string(common::error_kind_to_string(outcome.error_kind)) +
         "]: " + outcome.output;
}

std::string clip(const std::string &text, const std::size_t limit) {
  if (text.size() <= limit) {
    return text;
  }
  return text.substr(0, limit) + "...";
}

} // namespace

std::string describe_goal(const goal::Goal &goal) {
  std::ostringstream out;
  out << "Goal: " << goal.description << "\n";
  if (!goal.criteria.empty()) {
    out << "Success criteria:\n";
    for (const auto &criterion : goal.criteria) {
      out << "- " << criterion.id;
      if (!criterion.description.empty()) {
        out << ": " << criterion.description;
      }
      out << " (weight " << format_number(criterion.weight) << ")\n";
    }
  }
  if (!goal.constraints.empty()) {
    out << "Constraints:\n";
    for (const auto &constraint : goal.constraints) {
      out << "- [" << (constraint.kind == goal::ConstraintKind::Hard ? "hard " : "soft ")
          << goal::constraint_category_to_string(constraint.category) << "] "
          << constraint.description;
      if (constraint.limit.has_value()) {
        out << " (limit " << format_number(*constraint.limit) << ")";
      }
      out << "\n";
    }
  }
  out << "Success threshold: " << format_number(goal.success_threshold * 100.0) << "%\n";
  return out.str();
}

std::string render_transcript(const Session &session) {
  std::ostringstream out;
  out << "User: " << session.prompt << "\n";
  for (const auto &turn : session.turns) {
    for (const auto &note : turn.notes) {
      out << "Note: " << note << "\n";
    }
    if (!turn.model_output.empty()) {
      out << "Assistant: " << turn.model_output << "\n";
    }
    for (const auto &call : turn.tool_calls) {
      out << "Tool call " << call.name << " " << call.arguments_json << "\n";
      const auto result =
          std::find_if(turn.tool_results.begin(), turn.tool_results.end(),
                       [&call](const ToolOutcome &outcome) { return outcome.call_id == call.id; });
      if (result != turn.tool_results.end()) {
        out << "Tool result: " << clip(tool_message_content(*result), kTranscriptOutputLimit)
            << "\n";
      }
    }
  }
  return out.str();
}

AgentLoop::AgentLoop(AgentDependencies deps, LoopOptions options, security::SecurityPolicy policy,
                     LoopScope scope)
    : deps_(with_defaults(std::move(deps))), options_(std::move(options)),
      policy_(std::move(policy)), scope_(std::move(scope)),
      executor_(ToolExecutor::Dependencies{.registry = deps_.registry,
                                           .gate = deps_.gate,
                                           .broker = deps_.broker,
                                           .bus = deps_.bus},
                options_.tool_retry) {}

std::shared_ptr<common::CancellationToken> AgentLoop::begin_run() {
  std::lock_guard<std::mutex> lock(run_mutex_);
  run_token_ = std::make_shared<common::CancellationToken>(
      scope_.parent_cancel, common::CancellationToken::Clock::now() + options_.max_duration);
  return run_token_;
}

void AgentLoop::cancel() {
  std::lock_guard<std::mutex> lock(run_mutex_);
  if (run_token_ != nullptr) {
    run_token_->cancel();
  }
}

void AgentLoop::publish(const std::string &session_id, events::EventPayload payload) {
  deps_.bus->publish(session_id, std::move(payload));
}

common::Result<RunOutcome> AgentLoop::run(const RunRequest &request) {
  if (deps_.model == nullptr) {
    return common::Result<RunOutcome>::failure("no model client configured");
  }
  Session session;
  session.id = request.session_id.value_or("ses-" + common::random_hex(6));
  session.prompt = request.prompt;
  session.created_at = common::now_rfc3339();
  session.goal = request.goal;

  if (deps_.checkpoints != nullptr && request.session_id.has_value()) {
    auto existing = deps_.checkpoints->load_latest(session.id);
    if (!existing.ok() && existing.error_kind() != ErrorKind::CorruptCheckpoint) {
      return common::Result<RunOutcome>::failure(existing.status());
    }
    if (!existing.ok() || existing.value().has_value()) {
      return common::Result<RunOutcome>::failure(
          "session " + session.id + " already exists; use resume to continue it");
    }
  }
  return common::Result<RunOutcome>::success(drive(std::move(session), false));
}

common::Result<RunOutcome> AgentLoop::resume(const std::string &session_id) {
  using R = common::Result<RunOutcome>;
  if (deps_.checkpoints == nullptr) {
    return R::failure("resume requires a checkpoint store");
  }

  auto fail_corrupt = [&](const std::string &reason) {
    if (auto marked = deps_.checkpoints->mark_failed(session_id, reason); !marked.ok()) {
      observability::record_error("checkpoint", marked.error());
    }
    publish(session_id,
            events::RunFailed{.reason = reason, .kind = ErrorKind::CorruptCheckpoint, .turns = 0});
    observability::record_run_end(session_id, "failed", std::chrono::milliseconds(0));
    Session failed;
    failed.id = session_id;
    failed.status = SessionStatus::Failed;
    failed.failure_reason = reason;
    return R::success(RunOutcome{.session = std::move(failed),
                                 .error_kind = ErrorKind::CorruptCheckpoint,
                                 .reason = reason});
  };

  auto loaded = deps_.checkpoints->load_latest(session_id);
  if (!loaded.ok()) {
    if (loaded.error_kind() == ErrorKind::CorruptCheckpoint) {
      return fail_corrupt(loaded.error());
    }
    return R::failure(loaded.status());
  }
  if (!loaded.value().has_value()) {
    return R::failure("no checkpoint for session " + session_id);
  }
  const auto &checkpoint = *loaded.value();
  if (checkpoint.status == checkpoint::CheckpointStatus::Failed) {
    return R::failure("session " + session_id + " failed and cannot be resumed: " +
                      checkpoint.reason);
  }
  auto decoded = decode_session(checkpoint.blob);
  if (!decoded.ok()) {
    return fail_corrupt(decoded.error());
  }
  if (decoded.value().is_terminal()) {
    return R::failure("session " + session_id + " is already " +
                      session_status_to_string(decoded.value().status));
  }
  if (deps_.model == nullptr) {
    return R::failure("no model client configured");
  }
  return R::success(drive(std::move(decoded.value()), true));
}

RunOutcome AgentLoop::drive(Session session, const bool resumed) {
  const auto started = std::chrono::steady_clock::now();
  const auto token = begin_run();
  auto hints = std::make_shared<guardian::HintQueue>();
  guardian::Watchdog watchdog(options_.guardian, deps_.bus, session.id, hints);
  if (options_.guardian.enabled) {
    watchdog.start();
  }

  publish(session.id, events::RunStarted{.prompt = session.prompt,
                                         .resumed = resumed,
                                         .next_turn = session.next_turn_index(),
                                         .sub_agent = scope_.is_sub_agent});
  observability::record_run_start(session.id, options_.generation.model, resumed);

  auto limit_reached = [&](const std::string &reason) {
    if (options_.on_limit == LimitBehavior::Complete) {
      return finish(session, SessionStatus::Completed, reason + "; returning partial output",
                    ErrorKind::None, started);
    }
    return finish(session, SessionStatus::Failed, reason, ErrorKind::ConstraintViolation, started);
  };

  std::vector<std::string> carried_notes;
  FailureTracker failures;
  while (true) {
    if (token->is_cancelled()) {
      if (token->cancel_requested()) {
        return finish(session, SessionStatus::Cancelled, "run cancelled", ErrorKind::Cancelled,
                      started);
      }
      return limit_reached("max_duration of " + std::to_string(options_.max_duration.count()) +
                           "s exceeded");
    }
    if (session.turns.size() >= options_.max_turns) {
      return limit_reached("max_turns of " + std::to_string(options_.max_turns) + " reached");
    }

    if (watchdog.is_running()) {
      (void)watchdog.await_caught_up(deps_.bus->last_seq(), options_.watchdog_sync);
    }
    Turn turn;
    turn.index = session.next_turn_index();
    turn.notes = std::move(carried_notes);
    carried_notes.clear();
    for (const auto &hint : hints->pop_all()) {
      turn.notes.push_back("[watchdog " + guardian::hint_kind_to_string(hint.kind) + "] " +
                           hint.message);
    }
    publish(session.id, events::TurnStarted{.turn = turn.index, .hints = turn.notes.size()});

    const auto result = run_turn(session, turn, token);
    if (!result.ok) {
      if (token->is_cancelled()) {
        continue;
      }
      return finish(session, SessionStatus::Failed, result.error, result.kind, started);
    }

    session.turns.push_back(std::move(turn));
    const Turn &done = session.turns.back();
    save_checkpoint(session);
    publish(session.id, events::TurnCompleted{.turn = done.index,
                                              .tool_calls = done.tool_calls.size(),
                                              .final_turn = done.is_final()});
    for (const auto &outcome : done.tool_results) {
      if (outcome.success) {
        failures.record_success(outcome.tool);
        continue;
      }
      const auto count = failures.record_failure(outcome.tool);
      if (options_.reflexion_threshold > 0 && count >= options_.reflexion_threshold) {
        carried_notes.push_back(reflexion_hint(outcome.tool, count));
      }
    }

    if (!session.goal.has_value()) {
      if (done.is_final()) {
        return finish(session, SessionStatus::Completed, "", ErrorKind::None, started);
      }
      continue;
    }

    const goal::EvaluationContext context{
        .latest_output = done.model_output,
        .final_turn = done.is_final(),
        .turns_completed = session.turns.size(),
        .elapsed = std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::steady_clock::now() - started),
        .tokens_used = session.tokens_used(),
        .conversation = render_transcript(session),
    };
    auto evaluated = deps_.evaluator->evaluate(*session.goal, context, *token);
    const auto verdict = evaluated.verdict;
    observability::record_verdict(session.id, goal::verdict_kind_to_string(verdict.kind),
                                  verdict.confidence.value_or(0.0));
    publish(session.id, events::VerdictIssued{.turn = done.index,
                                              .verdict = verdict,
                                              .evaluation = std::move(evaluated.evaluation)});

    switch (verdict.kind) {
    case goal::VerdictKind::Accept:
      return finish(session, SessionStatus::Completed, verdict.reason, ErrorKind::None, started);
    case goal::VerdictKind::Escalate:
      if (verdict.cause == ErrorKind::ConstraintViolation) {
        return finish(session, SessionStatus::Failed, verdict.reason,
                      ErrorKind::ConstraintViolation, started);
      }
      session.escalated = true;
      return finish(session, SessionStatus::Completed, verdict.reason, ErrorKind::None, started);
    case goal::VerdictKind::Retry:
      carried_notes.push_back("The judge determined your response needs improvement: " +
                              verdict.reason + ". Hint: " + verdict.hint);
      break;
    case goal::VerdictKind::Continue:
      if (done.is_final()) {
        return finish(session, SessionStatus::Completed, verdict.reason, ErrorKind::None,
                      started);
      }
      break;
    }
  }
}

AgentLoop::TurnResult
AgentLoop::run_turn(Session &session, Turn &turn,
                    const std::shared_ptr<const common::CancellationToken> &token) {
  const auto request = build_request(session, turn.notes);
  TurnResult last;
  for (std::uint32_t attempt = 0; attempt <= options_.turn_retries; ++attempt) {
    StreamAccumulator accumulator(turn.index);
    const auto model_started = std::chrono::steady_clock::now();
    auto streamed = common::retry_transient<bool>(
        options_.model_retry, *token,
        [&](std::uint32_t) {
          accumulator = StreamAccumulator(turn.index);
          const auto status = deps_.model->stream(
              request,
              [&](const providers::ModelDelta &delta) {
                accumulator.add(delta);
                if (const auto *chunk = std::get_if<providers::TextChunk>(&delta)) {
                  publish(session.id, events::TextDelta{.turn = turn.index, .text = chunk->text});
                }
                return !token->is_cancelled();
              },
              *token);
          if (!status.ok()) {
            return common::Result<bool>::failure(status);
          }
          if (!accumulator.ended()) {
            return common::Result<bool>::failure(ErrorKind::TransientInfra,
                                                 "model stream ended before end of turn");
          }
          return common::Result<bool>::success(true);
        },
        [](const std::uint32_t retry, const std::string &error) {
          observability::record_error("model", "retry " + std::to_string(retry + 1) +
                                                   " after: " + error);
        });

    if (streamed.ok()) {
      observability::record_metric(
          observability::ModelLatencyMetric{.latency =
                                                std::chrono::duration_cast<std::chrono::milliseconds>(
                                                    std::chrono::steady_clock::now() - model_started)});
      turn.model_output = accumulator.text();
      turn.tool_calls = accumulator.tool_calls();
      turn.input_tokens = accumulator.input_tokens();
      turn.output_tokens = accumulator.output_tokens();
      const std::uint64_t turn_tokens = turn.input_tokens + turn.output_tokens;
      publish(session.id, events::UsageUpdated{.turn = turn.index,
                                               .input_tokens = turn.input_tokens,
                                               .output_tokens = turn.output_tokens,
                                               .total_tokens = session.tokens_used() + turn_tokens});
      observability::record_metric(observability::TokensUsedMetric{.tokens = turn_tokens});

      if (!turn.tool_calls.empty()) {
        const ExecutionContext ctx{.session_id = session.id,
                                   .turn = turn.index,
                                   .is_sub_agent = scope_.is_sub_agent,
                                   .depth = scope_.depth,
                                   .workspace = options_.workspace,
                                   .cancel = token};
        turn.tool_results = executor_.execute(turn.tool_calls, policy_, ctx);
      }
      return TurnResult{};
    }

    last = TurnResult{.ok = false,
                      .kind = streamed.error_kind(),
                      .error = "model turn failed: " + streamed.error()};
    if (token->is_cancelled() || streamed.error_kind() == ErrorKind::Cancelled) {
      return last;
    }
    observability::record_error("agent", "turn " + std::to_string(turn.index) + " attempt " +
                                             std::to_string(attempt + 1) + " failed: " +
                                             streamed.error());
  }
  return last;
}

providers::ModelRequest AgentLoop::build_request(const Session &session,
                                                 const std::vector<std::string> &notes) const {
  providers::ModelRequest request;
  std::string system = options_.system_prompt;
  if (scope_.is_sub_agent) {
    system += "\nYou are a sub-agent working on a delegated task. Report your result concisely.";
  }
  if (session.goal.has_value()) {
    system += "\n\n" + describe_goal(*session.goal);
  }
  request.messages.push_back(providers::ChatMessage::system(std::move(system)));
  request.messages.push_back(providers::ChatMessage::user(session.prompt));

  for (const auto &turn : session.turns) {
    for (const auto &note : turn.notes) {
      request.messages.push_back(providers::ChatMessage::user("Note: " + note));
    }
    request.messages.push_back(providers::ChatMessage::assistant(turn.model_output, turn.tool_calls));
    for (const auto &outcome : turn.tool_results) {
      request.messages.push_back(providers::ChatMessage::tool(
          outcome.call_id, compact_tool_output(tool_message_content(outcome),
                                               options_.context.max_tool_output_tokens)));
    }
  }
  for (const auto &note : notes) {
    request.messages.push_back(providers::ChatMessage::user("Note: " + note));
  }
  if (options_.context.max_context_tokens > 0) {
    if (const auto pruned = prune_to_budget(request.messages, options_.context.max_context_tokens,
                                            options_.context.min_tail);
        pruned > 0) {
      observability::record_context_pruned(session.id, pruned,
                                           estimate_request_tokens(request.messages));
    }
  }

  request.tools = deps_.registry->all_specs();
  request.options = options_.generation;
  return request;
}

void AgentLoop::save_checkpoint(const Session &session) {
  if (deps_.checkpoints == nullptr) {
    return;
  }
  const auto turn_index = static_cast<std::int64_t>(session.turns.size()) - 1;
  if (auto saved = deps_.checkpoints->save(session.id, turn_index, encode_session(session));
      !saved.ok()) {
    observability::record_error("checkpoint", "save failed for " + session.id + ": " +
                                                  saved.error());
  }
}

RunOutcome AgentLoop::finish(Session &session, const SessionStatus status, std::string reason,
                             const ErrorKind kind,
                             const std::chrono::steady_clock::time_point started) {
  session.status = status;
  if (status != SessionStatus::Completed) {
    session.failure_reason = reason;
  }
  if (deps_.broker != nullptr) {
    (void)deps_.broker->cancel_session(session.id);
  }

  if (deps_.checkpoints != nullptr) {
    if (status == SessionStatus::Completed) {
      if (auto removed = deps_.checkpoints->remove(session.id); !removed.ok()) {
        observability::record_error("checkpoint", removed.error());
      }
    } else {
      save_checkpoint(session);
      if (status == SessionStatus::Failed) {
        if (auto marked = deps_.checkpoints->mark_failed(session.id, reason); !marked.ok()) {
          observability::record_error("checkpoint", marked.error());
        }
      }
    }
  }

  const std::string output = status == SessionStatus::Completed ? session.latest_output() : "";
  if (status == SessionStatus::Completed) {
    publish(session.id, events::RunCompleted{.output = output,
                                             .turns = session.turns.size(),
                                             .escalated = session.escalated,
                                             .reason = reason});
  } else {
    publish(session.id, events::RunFailed{.reason = reason, .kind = kind, .turns = session.turns.size()});
  }
  observability::record_run_end(
      session.id, session_status_to_string(status),
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                            started),
      session.tokens_used());

  return RunOutcome{.session = session,
                    .output = output,
                    .error_kind = kind,
                    .reason = std::move(reason)};
}

} // namespace warden::agent
