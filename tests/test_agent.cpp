#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/agent/context.hpp"
#include "warden/agent/factory.hpp"
#include "warden/agent/loop.hpp"
#include "warden/agent/spawn_tool.hpp"
#include "warden/agent/stream_accumulator.hpp"

#include <thread>

namespace {

namespace agent = warden::agent;
namespace common = warden::common;
namespace events = warden::events;
namespace goal = warden::goal;
namespace providers = warden::providers;
namespace security = warden::security;
namespace tools = warden::tools;
namespace wt = warden::testing;

agent::LoopOptions fast_options() {
  agent::LoopOptions options;
  options.max_turns = 6;
  options.turn_retries = 1;
  options.model_retry = common::RetryPolicy{.max_retries = 2, .backoff_ms = 1, .max_backoff_ms = 5};
  options.tool_retry = common::RetryPolicy{.max_retries = 1, .backoff_ms = 1, .max_backoff_ms = 5};
  options.guardian.enabled = false;
  return options;
}

struct LoopHarness {
  std::shared_ptr<wt::ScriptedModelClient> model = std::make_shared<wt::ScriptedModelClient>();
  std::shared_ptr<tools::ToolRegistry> registry = std::make_shared<tools::ToolRegistry>();
  std::shared_ptr<events::EventBus> bus = std::make_shared<events::EventBus>();
  std::shared_ptr<security::ApprovalBroker> broker =
      std::make_shared<security::ApprovalBroker>(bus);
  agent::LoopOptions options = fast_options();
  security::SecurityPolicy policy;

  LoopHarness() { policy.deny_above = security::SecurityTier::T3; }

  [[nodiscard]] agent::AgentDependencies deps() const {
    return agent::AgentDependencies{
        .model = model, .registry = registry, .broker = broker, .bus = bus};
  }

  [[nodiscard]] std::unique_ptr<agent::AgentLoop> loop() const {
    return std::make_unique<agent::AgentLoop>(deps(), options, policy);
  }
};

agent::RunOutcome run_prompt(agent::AgentLoop &loop, const std::string &prompt,
                             std::optional<goal::Goal> run_goal = std::nullopt) {
  auto outcome = loop.run(agent::RunRequest{.prompt = prompt, .goal = std::move(run_goal)});
  warden::tests::require(outcome.ok(), outcome.ok() ? "" : outcome.error());
  return outcome.value();
}

goal::Goal contains_goal(const std::string &pattern) {
  goal::Goal result;
  result.description = "answer contains " + pattern;
  result.criteria.push_back(goal::Criterion{
      .id = "has-" + pattern, .check = goal::OutputContains{.pattern = pattern}});
  return result;
}

} // namespace

void register_agent_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;

  tests.push_back({"final_answer_completes_run", [] {
                     LoopHarness h;
                     auto events_seen = h.bus->subscribe();
                     h.model->push(wt::text_turn("hello there"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "greet me");

                     require(outcome.completed(), "completed");
                     require(outcome.output == "hello there", "final output");
                     require(outcome.error_kind == common::ErrorKind::None, "no error");
                     require(outcome.session.turns.size() == 1, "one turn");
                     require(outcome.session.id.rfind("ses-", 0) == 0 &&
                                 outcome.session.id.size() == 16,
                             "generated session id");
                     require(outcome.session.tokens_used() == 15, "usage recorded");

                     const auto seen = wt::drain(*events_seen);
                     require(!seen.empty() && seen.front().kind() == events::EventKind::RunStarted,
                             "run started first");
                     require(seen.back().kind() == events::EventKind::RunCompleted,
                             "run completed last");
                     const auto texts = wt::payloads_of<events::TextDelta>(seen);
                     require(texts.size() == 1 && texts[0].text == "hello there", "text streamed");
                   }});

  tests.push_back({"tool_results_are_fed_into_the_next_turn", [] {
                     LoopHarness h;
                     h.registry->register_tool(wt::echo_tool());
                     h.model->push(wt::tool_turn({wt::make_call("c1", "echo", R"({"value":"pong"})")},
                                                 "checking"));
                     h.model->push(wt::text_turn("the echo said pong"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "ping");

                     require(outcome.completed(), "completed");
                     require(outcome.session.turns.size() == 2, "two turns");
                     const auto &first = outcome.session.turns[0];
                     require(first.tool_results.size() == 1, "one tool result");
                     require(first.tool_results[0].success && first.tool_results[0].output == "pong",
                             "tool output");
                     require(first.tool_results[0].decision == security::GateOutcome::Allow,
                             "auto-approved");

                     const auto requests = h.model->requests();
                     require(requests.size() == 2, "two model calls");
                     require(requests[0].tools.size() == 1 && requests[0].tools[0].name == "echo",
                             "tool specs offered");
                     const auto &messages = requests[1].messages;
                     require(messages.size() == 4, "system, user, assistant, tool");
                     require(messages[0].role == providers::Role::System, "system first");
                     require(messages[1].content == "ping", "prompt");
                     require(messages[2].role == providers::Role::Assistant &&
                                 messages[2].content == "checking" &&
                                 messages[2].tool_calls.size() == 1,
                             "assistant turn with calls");
                     require(messages[3].role == providers::Role::Tool &&
                                 messages[3].tool_call_id == "c1" && messages[3].content == "pong",
                             "tool message");
                   }});

  tests.push_back({"failed_tool_is_reported_to_the_model", [] {
                     LoopHarness h;
                     h.registry->register_tool(std::make_shared<wt::FakeTool>(
                         "flaky", [](const tools::ToolArgs &, const tools::ToolContext &) {
                           return common::Result<tools::ToolResult>::failure(
                               common::ErrorKind::ToolExecution, "disk full");
                         }));
                     h.model->push(wt::tool_turn({wt::make_call("c1", "flaky")}));
                     h.model->push(wt::text_turn("could not write"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "write it");

                     require(outcome.completed(), "tool failure does not end the run");
                     const auto requests = h.model->requests();
                     require(requests[1].messages.back().content ==
                                 "Error [tool_execution]: disk full",
                             requests[1].messages.back().content);
                   }});

  tests.push_back({"max_turns_fails_with_constraint_violation", [] {
                     LoopHarness h;
                     h.options.max_turns = 2;
                     h.registry->register_tool(wt::echo_tool());
                     for (int i = 0; i < 3; ++i) {
                       h.model->push(wt::tool_turn(
                           {wt::make_call("c" + std::to_string(i), "echo",
                                          R"({"value":")" + std::to_string(i) + "\"}")}));
                     }
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "loop forever");

                     require(outcome.session.status == agent::SessionStatus::Failed, "failed");
                     require(outcome.error_kind == common::ErrorKind::ConstraintViolation, "kind");
                     require(outcome.reason == "max_turns of 2 reached", outcome.reason);
                     require(outcome.session.turns.size() == 2, "turns kept");
                     require(outcome.output.empty(), "no output for failed runs");
                   }});

  tests.push_back({"limit_can_complete_with_partial_output", [] {
                     LoopHarness h;
                     h.options.max_turns = 1;
                     h.options.on_limit = agent::LimitBehavior::Complete;
                     h.registry->register_tool(wt::echo_tool());
                     h.model->push(wt::tool_turn({wt::make_call("c1", "echo")}, "halfway"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "work");

                     require(outcome.completed(), "completed");
                     require(outcome.output == "halfway", "latest output returned");
                     require(outcome.reason == "max_turns of 1 reached; returning partial output",
                             outcome.reason);
                   }});

  tests.push_back({"transient_model_failure_is_retried", [] {
                     LoopHarness h;
                     h.model->push(wt::failed_turn(common::ErrorKind::TransientInfra, "503"));
                     h.model->push(wt::text_turn("recovered"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "hi");

                     require(outcome.completed(), "completed after retry");
                     require(outcome.output == "recovered", "output");
                     require(h.model->calls() == 2, "one retry");
                   }});

  tests.push_back({"truncated_stream_fails_the_run", [] {
                     LoopHarness h;
                     h.options.model_retry.max_retries = 0;
                     h.options.turn_retries = 1;
                     h.model->push(wt::truncated_turn("par"));
                     h.model->push(wt::truncated_turn("tial"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "hi");

                     require(outcome.session.status == agent::SessionStatus::Failed, "failed");
                     require(outcome.error_kind == common::ErrorKind::TransientInfra, "kind");
                     require(outcome.reason ==
                                 "model turn failed: model stream ended before end of turn",
                             outcome.reason);
                     require(h.model->calls() == 2, "turn retried once");
                     require(outcome.session.turns.empty(), "failed turn not recorded");
                   }});

  tests.push_back({"non_transient_model_failure_skips_client_retries", [] {
                     LoopHarness h;
                     h.options.turn_retries = 0;
                     h.model->push(wt::failed_turn(common::ErrorKind::Schema, "bad request"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "hi");

                     require(outcome.error_kind == common::ErrorKind::Schema, "kind kept");
                     require(h.model->calls() == 1, "no retries");
                   }});

  tests.push_back({"run_without_model_is_rejected", [] {
                     LoopHarness h;
                     auto deps = h.deps();
                     deps.model = nullptr;
                     agent::AgentLoop loop(deps, h.options, h.policy);
                     auto outcome = loop.run(agent::RunRequest{.prompt = "hi"});
                     require(!outcome.ok(), "rejected");
                     require(outcome.error() == "no model client configured", outcome.error());
                     auto resumed = loop.resume("ses-x");
                     require(!resumed.ok() && resumed.error() == "resume requires a checkpoint store",
                             "resume needs a store");
                   }});

  tests.push_back({"cancel_stops_an_in_flight_turn", [] {
                     LoopHarness h;
                     wt::ScriptedTurn slow = wt::text_turn("too late");
                     slow.delay = std::chrono::seconds(10);
                     h.model->push(slow);
                     auto loop = h.loop();
                     auto *raw = loop.get();
                     auto model = h.model;
                     std::thread canceller([raw, model] {
                       (void)wt::wait_until([&] { return model->calls() == 1; });
                       raw->cancel();
                     });
                     const auto started = std::chrono::steady_clock::now();
                     const auto outcome = run_prompt(*loop, "slow");
                     canceller.join();

                     require(outcome.session.status == agent::SessionStatus::Cancelled,
                             "cancelled");
                     require(outcome.error_kind == common::ErrorKind::Cancelled, "kind");
                     require(outcome.reason == "run cancelled", outcome.reason);
                     require(std::chrono::steady_clock::now() - started < std::chrono::seconds(5),
                             "did not wait for the delay");
                   }});

  tests.push_back({"max_duration_ends_the_run", [] {
                     LoopHarness h;
                     h.options.max_duration = std::chrono::seconds(0);
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "hi");
                     require(outcome.session.status == agent::SessionStatus::Failed, "failed");
                     require(outcome.reason == "max_duration of 0s exceeded", outcome.reason);
                     require(h.model->calls() == 0, "model never called");
                   }});

  tests.push_back({"goal_accepts_matching_answer", [] {
                     LoopHarness h;
                     auto verdicts = h.bus->subscribe({.kinds = {events::EventKind::VerdictIssued}});
                     h.model->push(wt::text_turn("the answer is 42"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "compute", contains_goal("42"));

                     require(outcome.completed(), "accepted");
                     require(!outcome.session.escalated, "not escalated");
                     const auto issued = wt::payloads_of<events::VerdictIssued>(wt::drain(*verdicts));
                     require(issued.size() == 1 && issued[0].verdict.kind == goal::VerdictKind::Accept,
                             "accept verdict published");

                     const auto requests = h.model->requests();
                     require(requests[0].messages[0].content.find("Goal: answer contains 42") !=
                                 std::string::npos,
                             "goal described in system prompt");
                   }});

  tests.push_back({"goal_retry_feeds_judge_note_into_next_turn", [] {
                     LoopHarness h;
                     h.model->push(wt::text_turn("no idea"));
                     h.model->push(wt::text_turn("it is 42"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "compute", contains_goal("42"));

                     require(outcome.completed(), "accepted on second attempt");
                     require(outcome.session.turns.size() == 2, "two turns");
                     const auto &notes = outcome.session.turns[1].notes;
                     require(notes.size() == 1, "one note");
                     require(notes[0].rfind("The judge determined your response needs improvement: "
                                            "Score 0% < threshold 90%",
                                            0) == 0,
                             notes[0]);
                     require(notes[0].find("Hint: Failed:") != std::string::npos, "hint carried");

                     const auto requests = h.model->requests();
                     require(requests[1].messages.back().role == providers::Role::User &&
                                 requests[1].messages.back().content.rfind("Note: The judge", 0) ==
                                     0,
                             "note sent to the model");
                   }});

  tests.push_back({"hard_turn_constraint_fails_run", [] {
                     LoopHarness h;
                     h.registry->register_tool(wt::echo_tool());
                     h.model->push(wt::tool_turn({wt::make_call("c1", "echo")}));
                     h.model->push(wt::tool_turn({wt::make_call("c2", "echo")}));
                     auto run_goal = contains_goal("done");
                     run_goal.constraints.push_back(goal::Constraint{
                         .id = "short",
                         .category = goal::ConstraintCategory::Turns,
                         .kind = goal::ConstraintKind::Hard,
                         .limit = 1.0});
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "work", run_goal);

                     require(outcome.session.status == agent::SessionStatus::Failed, "failed");
                     require(outcome.error_kind == common::ErrorKind::ConstraintViolation, "kind");
                     require(outcome.reason == "Hard turns constraint violated: 2 turns > 1 turns",
                             outcome.reason);
                   }});

  tests.push_back({"watchdog_hint_becomes_turn_note", [] {
                     LoopHarness h;
                     h.options.guardian.enabled = true;
                     h.options.guardian.doom_loop_threshold = 2;
                     h.options.guardian.stall_timeout_secs = 0;
                     h.options.watchdog_sync = std::chrono::milliseconds(2000);
                     h.registry->register_tool(wt::echo_tool());
                     h.model->push(wt::tool_turn({wt::make_call("c1", "echo", R"({"value":"x"})")}));
                     h.model->push(wt::tool_turn({wt::make_call("c2", "echo", R"({"value":"x"})")}));
                     h.model->push(wt::text_turn("stopping"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "repeat");

                     require(outcome.completed(), "completed");
                     require(outcome.session.turns.size() == 3, "three turns");
                     const auto &notes = outcome.session.turns[2].notes;
                     require(notes.size() == 1, "hint delivered");
                     require(notes[0].rfind("[watchdog doom_loop] ", 0) == 0, notes[0]);
                   }});

  tests.push_back({"spawned_sub_agent_returns_its_answer", [] {
                     LoopHarness h;
                     h.policy.auto_approve_up_to = security::SecurityTier::T3;
                     h.policy.deny_above.reset();
                     h.registry->register_tool(
                         wt::echo_tool("deployer", {.tier = security::SecurityTier::T3}));
                     auto factory = std::make_shared<const agent::AgentFactory>(h.deps(), h.options,
                                                                                h.policy);
                     h.registry->register_tool(std::make_shared<agent::SpawnAgentTool>(factory));
                     auto starts = h.bus->subscribe({.kinds = {events::EventKind::RunStarted}});

                     h.model->push(wt::tool_turn(
                         {wt::make_call("s1", "spawn_agent", R"({"prompt":"summarise logs"})")}));
                     h.model->push(wt::tool_turn({wt::make_call("d1", "deployer")}));
                     h.model->push(wt::text_turn("logs are quiet"));
                     h.model->push(wt::text_turn("sub-agent says logs are quiet"));

                     auto loop = factory->create();
                     auto outcome = loop->run(agent::RunRequest{.prompt = "check logs",
                                                                .session_id = "ses-parent"});
                     require(outcome.ok(), outcome.ok() ? "" : outcome.error());
                     require(outcome.value().completed(), "parent completed");
                     const auto &spawn_result = outcome.value().session.turns[0].tool_results[0];
                     require(spawn_result.success && spawn_result.output == "logs are quiet",
                             "sub-agent answer is the tool output");

                     const auto requests = h.model->requests();
                     require(requests.size() == 4, "four model calls");
                     require(requests[1].messages[0].content.find("sub-agent") != std::string::npos,
                             "sub-agent system prompt");
                     require(requests[1].messages[1].content == "summarise logs", "delegated prompt");
                     require(requests[2].messages.back().content.rfind(
                                 "Error [policy_violation]: Denied: ", 0) == 0,
                             "sub-agent policy is stricter than the parent's");

                     const auto started = wt::drain(*starts);
                     require(started.size() == 2, "two runs started");
                     require(started[1].session_id.rfind("ses-parent.sub-", 0) == 0,
                             started[1].session_id);
                     require(std::get<events::RunStarted>(started[1].payload).sub_agent,
                             "flagged as sub-agent");
                   }});

  tests.push_back({"spawn_respects_depth_limit", [] {
                     LoopHarness h;
                     auto factory = std::make_shared<const agent::AgentFactory>(h.deps(), h.options,
                                                                                h.policy);
                     agent::SpawnAgentTool tool(factory, {.max_depth = 1});
                     require(tool.name() == "spawn_agent", "name");
                     require(tool.tier() == security::SecurityTier::T3, "tier");

                     tools::ToolContext ctx{.session_id = "ses-x", .is_sub_agent = true, .depth = 1};
                     auto limited = tool.execute({{"prompt", "go deeper"}}, ctx);
                     require(!limited.ok(), "refused");
                     require(limited.error_kind() == common::ErrorKind::ToolExecution, "kind");
                     require(limited.error() == "sub-agent depth limit of 1 reached", limited.error());

                     auto empty = tool.execute({{"prompt", "  "}}, tools::ToolContext{});
                     require(!empty.ok(), "blank prompt refused");
                     require(h.model->calls() == 0, "no sub-agent ran");
                   }});

  tests.push_back({"spawn_fails_once_runtime_is_gone", [] {
                     LoopHarness h;
                     std::weak_ptr<const agent::AgentFactory> dangling;
                     {
                       auto factory = std::make_shared<const agent::AgentFactory>(
                           h.deps(), h.options, h.policy);
                       dangling = factory;
                     }
                     agent::SpawnAgentTool tool(dangling);
                     auto result = tool.execute({{"prompt", "anything"}}, tools::ToolContext{});
                     require(!result.ok(), "no factory");
                     require(result.error() == "agent runtime is shutting down", result.error());
                   }});

  tests.push_back({"prune_to_budget_drops_oldest_history_first", [] {
                     std::vector<providers::ChatMessage> messages = {
                         providers::ChatMessage::system("s"),
                         providers::ChatMessage::user("p"),
                         providers::ChatMessage::assistant(
                             "", {wt::make_call("c1", "echo", std::string(40, 'a'))}),
                         providers::ChatMessage::tool("c1", std::string(400, 'o')),
                         providers::ChatMessage::assistant(std::string(40, 'x')),
                     };
                     for (int i = 0; i < 6; ++i) {
                       messages.push_back(providers::ChatMessage::user("y"));
                     }
                     require(agent::estimate_request_tokens(messages) == 173, "estimate");

                     auto pruned = messages;
                     require(agent::prune_to_budget(pruned, 60, 6) == 2,
                             "assistant and its tool result removed together");
                     require(pruned.size() == 9, "nine left");
                     require(pruned[0].role == providers::Role::System && pruned[1].content == "p",
                             "system prompt and user prompt kept");
                     require(pruned[2].content == std::string(40, 'x'), "oldest survivor");

                     auto squeezed = messages;
                     require(agent::prune_to_budget(squeezed, 10, 6) == 3, "stops at the tail");
                     require(squeezed.size() == 8, "pinned messages plus tail");

                     auto roomy = messages;
                     require(agent::prune_to_budget(roomy, 1000, 6) == 0, "fits already");
                   }});

  tests.push_back({"tool_output_compaction_and_failure_tracking", [] {
                     require(agent::estimate_tokens("") == 0 && agent::estimate_tokens("abcde") == 2,
                             "four characters per token");
                     require(agent::compact_tool_output("line1\nline2\nline3", 2) ==
                                 "line1\n[truncated]",
                             "cut at a line boundary");
                     require(agent::compact_tool_output("abcdefghij", 1) == "abcd\n[truncated]",
                             "hard cut without newlines");
                     require(agent::compact_tool_output("short", 4) == "short", "short output kept");
                     require(agent::compact_tool_output("abcdefghij", 0) == "abcdefghij",
                             "zero disables compaction");

                     agent::FailureTracker tracker;
                     require(tracker.record_failure("shell") == 1, "first failure");
                     require(tracker.record_failure("shell") == 2, "second failure");
                     require(tracker.record_failure("file_read") == 1, "counted per tool");
                     tracker.record_success("shell");
                     require(tracker.failures("shell") == 0, "success resets");
                     require(tracker.failures("file_read") == 1, "other tool unaffected");
                     require(agent::reflexion_hint("shell", 3) ==
                                 "The tool `shell` has failed 3 times in a row. Try a different "
                                 "approach or use a different tool to accomplish the task.",
                             "hint text");
                   }});

  tests.push_back({"long_tool_output_is_compacted_for_the_model", [] {
                     LoopHarness h;
                     h.options.context.max_tool_output_tokens = 2;
                     h.registry->register_tool(wt::echo_tool());
                     h.model->push(wt::tool_turn(
                         {wt::make_call("c1", "echo", R"({"value":"line1\nline2\nline3"})")}));
                     h.model->push(wt::text_turn("done"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "read it");

                     const auto requests = h.model->requests();
                     require(requests.size() == 2, "two turns");
                     require(requests[1].messages.back().content == "line1\n[truncated]",
                             requests[1].messages.back().content);
                     require(outcome.session.turns[0].tool_results[0].output ==
                                 "line1\nline2\nline3",
                             "session keeps the full output");
                   }});

  tests.push_back({"context_is_pruned_to_budget_between_turns", [] {
                     LoopHarness h;
                     h.options.system_prompt = "sys";
                     h.options.context.max_context_tokens = 250;
                     h.options.context.min_tail = 2;
                     h.registry->register_tool(wt::echo_tool());
                     const std::string big(400, 'z');
                     for (int i = 0; i < 3; ++i) {
                       h.model->push(wt::tool_turn({wt::make_call(
                           "c" + std::to_string(i), "echo", R"({"value":")" + big + "\"}")}));
                     }
                     h.model->push(wt::text_turn("finished"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "go");
                     require(outcome.completed(), "completed");

                     const auto requests = h.model->requests();
                     require(requests.size() == 4, "four turns");
                     require(requests[1].messages.size() == 4, "first history fits");
                     for (std::size_t turn = 2; turn < requests.size(); ++turn) {
                       const auto &messages = requests[turn].messages;
                       require(messages.size() == 4, "older turns pruned");
                       require(messages[0].content == "sys" && messages[1].content == "go",
                               "system and prompt pinned");
                       require(messages[2].tool_calls.size() == 1 &&
                                   messages[2].tool_calls[0].id == "c" + std::to_string(turn - 1),
                               "latest exchange kept");
                       require(messages[3].role == providers::Role::Tool &&
                                   messages[3].tool_call_id == messages[2].tool_calls[0].id,
                               "tool result follows its call");
                       require(agent::estimate_request_tokens(messages) <= 250, "within budget");
                     }
                     require(outcome.session.turns.size() == 4, "session history untouched");
                   }});

  tests.push_back({"repeated_tool_failures_add_reflexion_note", [] {
                     LoopHarness h;
                     h.options.reflexion_threshold = 2;
                     h.registry->register_tool(std::make_shared<wt::FakeTool>(
                         "broken", [](const tools::ToolArgs &, const tools::ToolContext &) {
                           return common::Result<tools::ToolResult>::failure(
                               common::ErrorKind::ToolExecution, "no such file");
                         }));
                     h.model->push(wt::tool_turn({wt::make_call("c1", "broken")}));
                     h.model->push(wt::tool_turn({wt::make_call("c2", "broken")}));
                     h.model->push(wt::text_turn("trying something else"));
                     auto loop = h.loop();
                     const auto outcome = run_prompt(*loop, "open the file");

                     require(outcome.session.turns.size() == 3, "three turns");
                     require(outcome.session.turns[1].notes.empty(), "one failure is not enough");
                     const auto &notes = outcome.session.turns[2].notes;
                     require(notes.size() == 1 && notes[0] == agent::reflexion_hint("broken", 2),
                             notes.empty() ? "no note" : notes[0]);
                     const auto requests = h.model->requests();
                     require(requests[2].messages.back().content == "Note: " + notes[0],
                             "hint sent to the model");
                   }});

  tests.push_back({"stream_accumulator_orders_and_fills_calls", [] {
                     agent::StreamAccumulator accumulator(3);
                     accumulator.add(providers::TextChunk{.text = "Let me "});
                     accumulator.add(providers::ToolCallStart{.index = 1, .name = "file_read"});
                     accumulator.add(providers::ToolCallStart{.index = 0, .id = "a", .name = "shell"});
                     accumulator.add(providers::ToolCallArgs{.index = 0, .fragment = R"({"command":)"});
                     accumulator.add(providers::TextChunk{.text = "look."});
                     accumulator.add(providers::ToolCallArgs{.index = 0, .fragment = R"("ls"})"});
                     accumulator.add(providers::ToolCallStart{.index = 1, .depends_on = {"a"}});
                     accumulator.add(providers::Usage{.input_tokens = 40, .output_tokens = 3});
                     accumulator.add(providers::Usage{.input_tokens = 40, .output_tokens = 9});
                     require(!accumulator.ended(), "not ended yet");
                     accumulator.add(providers::EndOfTurn{.stop_reason = "tool_calls"});

                     require(accumulator.text() == "Let me look.", "text concatenated");
                     require(accumulator.ended() && *accumulator.stop_reason() == "tool_calls",
                             "stop reason");
                     require(accumulator.input_tokens() == 40 && accumulator.output_tokens() == 9,
                             "usage keeps the latest totals");
                     const auto calls = accumulator.tool_calls();
                     require(calls.size() == 2, "two calls");
                     require(calls[0].id == "a" && calls[0].arguments_json == R"({"command":"ls"})",
                             "fragments joined");
                     require(calls[1].id == "call-3-1", calls[1].id);
                     require(calls[1].name == "file_read", "name kept across starts");
                     require(calls[1].arguments_json == "{}", "empty args default");
                     require(calls[1].depends_on == std::vector<std::string>{"a"}, "dependency");
                   }});

  tests.push_back({"transcript_and_goal_description", [] {
                     agent::Session session;
                     session.prompt = "tidy up";
                     agent::Turn turn;
                     turn.notes = {"[watchdog stall] no progress"};
                     turn.model_output = "removing";
                     turn.tool_calls = {wt::make_call("c1", "shell", R"({"command":"rm a.tmp"})")};
                     turn.tool_results = {agent::ToolOutcome{.call_id = "c1",
                                                             .tool = "shell",
                                                             .success = false,
                                                             .output = "Denied: nope",
                                                             .error_kind =
                                                                 common::ErrorKind::PolicyViolation}};
                     session.turns.push_back(turn);

                     const auto transcript = agent::render_transcript(session);
                     require(transcript.find("User: tidy up\n") == 0, "prompt first");
                     require(transcript.find("Note: [watchdog stall] no progress\n") !=
                                 std::string::npos,
                             "notes");
                     require(transcript.find("Tool call shell {\"command\":\"rm a.tmp\"}\n") !=
                                 std::string::npos,
                             "tool call");
                     require(transcript.find("Tool result: Error [policy_violation]: Denied: nope") !=
                                 std::string::npos,
                             "tool failure");

                     auto described_goal = contains_goal("tidy");
                     described_goal.constraints.push_back(
                         goal::Constraint{.id = "cheap",
                                          .category = goal::ConstraintCategory::Cost,
                                          .kind = goal::ConstraintKind::Soft,
                                          .description = "stay cheap",
                                          .limit = 5000.0});
                     const auto described = agent::describe_goal(described_goal);
                     require(described.find("- has-tidy (weight 1)") != std::string::npos,
                             described);
                     require(described.find("- [soft cost] stay cheap (limit 5000)") !=
                                 std::string::npos,
                             described);
                     require(described.find("Success threshold: 90%") != std::string::npos,
                             described);
                   }});
}
