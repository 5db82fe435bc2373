#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/goal/evaluator.hpp"
#include "warden/goal/goal.hpp"
#include "warden/goal/judge.hpp"

namespace {

namespace goal = warden::goal;

goal::Goal report_goal() {
  goal::Goal g;
  g.description = "Write the release report";
  g.success_threshold = 0.6;
  g.criteria.push_back(goal::Criterion{.id = "mentions",
                                       .description = "mentions the version",
                                       .weight = 2.0,
                                       .check = goal::OutputContains{.pattern = "v1.2"}});
  g.criteria.push_back(goal::Criterion{
      .id = "exact", .weight = 1.0, .check = goal::OutputEquals{.expected = "v1.2 shipped"}});
  return g;
}

goal::Goal judged_goal() {
  goal::Goal g;
  g.description = "Summarize the design";
  g.criteria.push_back(
      goal::Criterion{.id = "judge", .check = goal::LlmJudge{.prompt = "Is it accurate?"}});
  return g;
}

} // namespace

void register_goal_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;
  namespace common = warden::common;
  namespace wt = warden::testing;

  tests.push_back({"goal_encoding_preserves_criteria_and_constraints", [] {
                     auto g = report_goal();
                     g.criteria.push_back(goal::Criterion{.id = "custom",
                                                          .check = goal::Custom{.name = "non_empty"}});
                     g.constraints.push_back(goal::Constraint{.id = "turns",
                                                              .category = goal::ConstraintCategory::Turns,
                                                              .kind = goal::ConstraintKind::Hard,
                                                              .description = "keep it short",
                                                              .limit = 4});
                     g.constraints.push_back(goal::Constraint{.id = "tone"});

                     auto decoded = goal::decode_goal(goal::encode_goal(g));
                     require(decoded.ok(), decoded.error());
                     const auto &out = decoded.value();
                     require(out.description == g.description, "description");
                     require(out.success_threshold == 0.6, "threshold");
                     require(out.criteria.size() == 3, "criteria count");
                     require(out.criteria[0].weight == 2.0, "weight");
                     const auto *contains = std::get_if<goal::OutputContains>(&out.criteria[0].check);
                     require(contains != nullptr && contains->pattern == "v1.2", "contains check");
                     require(std::holds_alternative<goal::Custom>(out.criteria[2].check), "custom");
                     require(out.constraints.size() == 2, "constraints count");
                     require(out.constraints[0].kind == goal::ConstraintKind::Hard, "hard");
                     require(out.constraints[0].limit == 4.0, "limit");
                     require(!out.constraints[1].limit.has_value(), "no limit");
                   }});

  tests.push_back({"goal_decoding_rejects_unknown_kinds", [] {
                     auto bad_kind = goal::decode_goal(
                         R"({"description":"x","criteria":[{"id":"a","kind":"vibes"}]})");
                     require(!bad_kind.ok(), "unknown criterion kind");
                     require(bad_kind.error_kind() == common::ErrorKind::Schema, "schema error");

                     auto bad_category = goal::decode_goal(
                         R"({"description":"x","constraints":[{"id":"a","category":"mood"}]})");
                     require(!bad_category.ok(), "unknown category");
                     require(!goal::decode_goal("[]").ok(), "not an object");
                   }});

  tests.push_back({"verdict_factories_fill_every_field", [] {
                     const auto accepted = goal::Verdict::accept(0.9, "good");
                     require(accepted.kind == goal::VerdictKind::Accept &&
                                 accepted.confidence == std::optional<double>(0.9),
                             "accept");
                     require(accepted.hint.empty() &&
                                 accepted.cause == warden::common::ErrorKind::None,
                             "accept has no hint or cause");

                     const auto retried = goal::Verdict::retry("short", "add detail");
                     require(retried.hint == "add detail" && !retried.confidence.has_value() &&
                                 retried.cause == warden::common::ErrorKind::None,
                             "retry");

                     const auto escalated = goal::Verdict::escalate(
                         "over budget", warden::common::ErrorKind::ConstraintViolation);
                     require(escalated.kind == goal::VerdictKind::Escalate &&
                                 escalated.cause == warden::common::ErrorKind::ConstraintViolation,
                             "escalate cause");
                     require(!escalated.confidence.has_value() && escalated.hint.empty(),
                             "escalate has no confidence or hint");

                     const auto proceeding = goal::Verdict::proceed();
                     require(proceeding.kind == goal::VerdictKind::Continue &&
                                 proceeding.reason.empty() && proceeding.hint.empty() &&
                                 !proceeding.confidence.has_value() &&
                                 proceeding.cause == warden::common::ErrorKind::None,
                             "continue");
                   }});

  tests.push_back({"score_weights_each_criterion", [] {
                     const goal::GoalEvaluator evaluator(goal::JudgeConfig{});
                     const auto evaluation = evaluator.score(report_goal(), "Release V1.2 is out");
                     require(evaluation.results.size() == 2, "two results");
                     require(evaluation.results[0].passed, "contains is case-insensitive");
                     require(!evaluation.results[1].passed, "equals fails");
                     require(evaluation.score > 0.66 && evaluation.score < 0.67, "2/3 weighted");
                     require(evaluation.passed, "above 0.6 threshold");

                     const auto exact = evaluator.score(report_goal(), "  v1.2 shipped\n");
                     require(exact.score == 1.0, "equals compares trimmed output");
                   }});

  tests.push_back({"custom_criteria_use_registered_predicates", [] {
                     auto predicates = std::make_shared<goal::PredicateRegistry>();
                     predicates->register_predicate(
                         "short", [](const std::string &output) { return output.size() < 10; });
                     const goal::GoalEvaluator evaluator(goal::JudgeConfig{}, nullptr, predicates);

                     goal::Goal g;
                     g.criteria.push_back(
                         goal::Criterion{.id = "short", .check = goal::Custom{.name = "short"}});
                     g.criteria.push_back(
                         goal::Criterion{.id = "missing", .check = goal::Custom{.name = "nope"}});
                     const auto evaluation = evaluator.score(g, "tiny");
                     require(evaluation.results[0].passed, "predicate passed");
                     require(!evaluation.results[1].passed, "missing predicate fails");
                     require(evaluation.results[1].detail == "No predicate registered for 'nope'",
                             evaluation.results[1].detail);
                   }});

  tests.push_back({"evaluate_continues_mid_run_and_retries_on_final_turn", [] {
                     const goal::GoalEvaluator evaluator(goal::JudgeConfig{});
                     const common::CancellationToken cancel;
                     const auto g = report_goal();

                     const auto mid = evaluator.evaluate(
                         g, {.latest_output = "working on it", .final_turn = false}, cancel);
                     require(mid.verdict.kind == goal::VerdictKind::Continue, "mid-run continue");

                     const auto last = evaluator.evaluate(
                         g, {.latest_output = "all done", .final_turn = true}, cancel);
                     require(last.verdict.kind == goal::VerdictKind::Retry, "final turn retry");
                     require(last.verdict.reason == "Score 0% < threshold 60%", last.verdict.reason);
                     require(last.verdict.hint.find("Output does not contain 'v1.2'") !=
                                 std::string::npos,
                             last.verdict.hint);
                     require(!last.level1_invoked, "no judge configured");

                     const auto accepted = evaluator.evaluate(
                         g, {.latest_output = "v1.2 shipped", .final_turn = false}, cancel);
                     require(accepted.verdict.kind == goal::VerdictKind::Accept,
                             "passing output accepted even mid-run");
                     require(accepted.verdict.confidence == 1.0, "confidence is the score");
                   }});

  tests.push_back({"low_confidence_accept_is_downgraded", [] {
                     const goal::GoalEvaluator evaluator(goal::JudgeConfig{.confidence_floor = 0.7});
                     auto g = report_goal();
                     g.success_threshold = 0.5;
                     const common::CancellationToken cancel;
                     const auto outcome =
                         evaluator.evaluate(g, {.latest_output = "v1.2", .final_turn = true}, cancel);
                     require(outcome.evaluation.passed, "score passes");
                     require(outcome.verdict.kind == goal::VerdictKind::Continue, "downgraded");
                     require(outcome.verdict.reason.starts_with("confidence 67% below floor 70%"),
                             outcome.verdict.reason);
                   }});

  tests.push_back({"hard_constraints_escalate_only_when_exceeded", [] {
                     goal::Goal g;
                     g.constraints.push_back(goal::Constraint{.id = "turns",
                                                              .category = goal::ConstraintCategory::Turns,
                                                              .kind = goal::ConstraintKind::Hard,
                                                              .limit = 3});
                     g.constraints.push_back(goal::Constraint{.id = "cost",
                                                              .category = goal::ConstraintCategory::Cost,
                                                              .kind = goal::ConstraintKind::Soft,
                                                              .limit = 10});

                     require(!goal::GoalEvaluator::check_constraints(
                                  g, {.turns_completed = 3, .tokens_used = 500})
                                  .has_value(),
                             "at the limit is fine and soft limits never escalate");
                     const auto violation =
                         goal::GoalEvaluator::check_constraints(g, {.turns_completed = 4});
                     require(violation.has_value(), "exceeded");
                     require(violation->kind == goal::VerdictKind::Escalate, "escalate");
                     require(violation->cause == common::ErrorKind::ConstraintViolation, "cause");
                     require(violation->reason ==
                                 "Hard turns constraint violated: 4 turns > 3 turns",
                             violation->reason);
                   }});

  tests.push_back({"goal_without_criteria_accepts_final_answer", [] {
                     const goal::GoalEvaluator evaluator(goal::JudgeConfig{});
                     const common::CancellationToken cancel;
                     const goal::Goal g{.description = "anything"};
                     require(evaluator.evaluate(g, {.final_turn = false}, cancel).verdict.kind ==
                                 goal::VerdictKind::Continue,
                             "mid-run continue");
                     require(evaluator.evaluate(g, {.final_turn = true}, cancel).verdict.kind ==
                                 goal::VerdictKind::Accept,
                             "final accept");
                   }});

  tests.push_back({"judge_reply_parsing_tolerates_fences_and_noise", [] {
                     const auto fenced = goal::parse_judge_reply(
                         "Here you go:\n```json\n{\"verdict\":\"accept\",\"confidence\":0.92,"
                         "\"reason\":\"complete\"}\n```");
                     require(fenced.kind == goal::VerdictKind::Accept, "accept");
                     require(fenced.confidence == 0.92, "confidence");
                     require(fenced.reason == "complete", "reason");

                     const auto retry = goal::parse_judge_reply(
                         R"(noise {"verdict":"RETRY","confidence":3,"reason":"thin"} trailing)");
                     require(retry.kind == goal::VerdictKind::Retry, "case-insensitive verdict");
                     require(retry.hint == "Try a different approach.", "default hint");
                     require(retry.confidence == 1.0, "confidence clamped");

                     const auto garbage = goal::parse_judge_reply("I think it is fine");
                     require(garbage.kind == goal::VerdictKind::Continue, "garbage continues");
                     require(garbage.reason == "unparseable judge reply", garbage.reason);

                     const auto unknown = goal::parse_judge_reply(R"({"verdict":"maybe"})");
                     require(unknown.kind == goal::VerdictKind::Continue, "unknown continues");
                   }});

  tests.push_back({"judge_prompt_lists_goal_and_transcript", [] {
                     auto g = judged_goal();
                     g.constraints.push_back(goal::Constraint{
                         .id = "scope", .category = goal::ConstraintCategory::Scope,
                         .description = "only the storage layer"});
                     const auto prompt = goal::build_judge_prompt(g, "user: hello");
                     require(prompt.find("Goal: Summarize the design") != std::string::npos,
                             "goal");
                     require(prompt.find("Is it accurate?") != std::string::npos, "criterion");
                     require(prompt.find("[soft scope] only the storage layer") !=
                                 std::string::npos,
                             "constraint");
                     require(prompt.find("user: hello") != std::string::npos, "conversation");
                   }});

  tests.push_back({"level1_judge_decides_llm_criteria_on_final_turn", [] {
                     auto client = std::make_shared<wt::ScriptedModelClient>();
                     client->push(wt::text_turn(
                         R"({"verdict":"retry","confidence":0.8,"reason":"misses caching","hint":"cover the cache"})"));
                     auto judge = std::make_shared<goal::ModelJudge>(
                         client, warden::providers::GenerationOptions{.model = "judge-model",
                                                                      .temperature = 0.0});
                     const goal::GoalEvaluator evaluator(goal::JudgeConfig{}, judge);
                     const common::CancellationToken cancel;

                     const auto mid = evaluator.evaluate(
                         judged_goal(), {.latest_output = "draft", .final_turn = false}, cancel);
                     require(!mid.level1_invoked, "judge waits for the final turn");

                     const auto outcome = evaluator.evaluate(
                         judged_goal(),
                         {.latest_output = "summary", .final_turn = true, .conversation = "t"},
                         cancel);
                     require(outcome.level1_invoked, "judge invoked");
                     require(outcome.verdict.kind == goal::VerdictKind::Retry, "retry verdict");
                     require(outcome.verdict.hint == "cover the cache", "hint");
                     require(client->calls() == 1, "one judge call");
                     require(client->requests()[0].options.model == "judge-model", "judge model");
                     require(client->requests()[0].tools.empty(), "judge gets no tools");
                   }});

  tests.push_back({"judge_failure_continues_instead_of_failing", [] {
                     auto client = std::make_shared<wt::ScriptedModelClient>();
                     client->push(wt::failed_turn(common::ErrorKind::TransientInfra, "503"));
                     auto judge = std::make_shared<goal::ModelJudge>(
                         client, warden::providers::GenerationOptions{});
                     const goal::GoalEvaluator evaluator(goal::JudgeConfig{}, judge);
                     const common::CancellationToken cancel;
                     const auto outcome = evaluator.evaluate(
                         judged_goal(), {.latest_output = "x", .final_turn = true}, cancel);
                     require(outcome.level1_invoked, "judge invoked");
                     require(outcome.verdict.kind == goal::VerdictKind::Continue, "continue");
                     require(outcome.verdict.reason.starts_with("judge unavailable: "),
                             outcome.verdict.reason);
                   }});

  tests.push_back({"disabled_judge_falls_back_to_deterministic_retry", [] {
                     auto client = std::make_shared<wt::ScriptedModelClient>();
                     auto judge = std::make_shared<goal::ModelJudge>(
                         client, warden::providers::GenerationOptions{});
                     const goal::GoalEvaluator evaluator(goal::JudgeConfig{.llm_enabled = false}, judge);
                     const common::CancellationToken cancel;
                     const auto outcome = evaluator.evaluate(
                         judged_goal(), {.latest_output = "x", .final_turn = true}, cancel);
                     require(!outcome.level1_invoked, "judge skipped");
                     require(outcome.evaluation.results[0].deferred, "criterion deferred");
                     require(outcome.verdict.kind == goal::VerdictKind::Retry, "retry");
                     require(client->calls() == 0, "model untouched");
                   }});
}
