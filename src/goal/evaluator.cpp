#include "warden/goal/evaluator.hpp"

#include "warden/common/fs.hpp"
#include "warden/observability/global.hpp"

#include <sstream>
#include <type_traits>

namespace warden::goal {

namespace {

std::string percent(const double value) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(0);
  out << value * 100.0;
  return out.str();
}

std::string format_limit(const double value) {
  std::ostringstream out;
  out << value;
  return out.str();
}

} // namespace

void PredicateRegistry::register_predicate(const std::string &name, Predicate predicate) {
  std::lock_guard<std::mutex> lock(mutex_);
  predicates_[name] = std::move(predicate);
}

std::optional<Predicate> PredicateRegistry::find(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = predicates_.find(name);
  if (it == predicates_.end()) {
    return std::nullopt;
  }
  return it->second;
}

GoalEvaluator::GoalEvaluator(JudgeConfig config, std::shared_ptr<const ModelJudge> judge,
                             std::shared_ptr<const PredicateRegistry> predicates)
    : config_(config), judge_(std::move(judge)), predicates_(std::move(predicates)) {}

GoalEvaluation GoalEvaluator::score(const Goal &goal, const std::string &output) const {
  GoalEvaluation evaluation;
  double total = 0.0;
  double passed = 0.0;
  for (const auto &criterion : goal.criteria) {
    CriterionResult result{.id = criterion.id, .weight = criterion.weight};
    std::visit(
        [&](auto &&check) {
          using T = std::decay_t<decltype(check)>;
          if constexpr (std::is_same_v<T, OutputContains>) {
            result.passed = check.case_sensitive
                                ? output.find(check.pattern) != std::string::npos
                                : common::to_lower(output).find(common::to_lower(check.pattern)) !=
                                      std::string::npos;
            result.detail = std::string(result.passed ? "Output contains '"
                                                      : "Output does not contain '") +
                            check.pattern + "'";
          } else if constexpr (std::is_same_v<T, OutputEquals>) {
            result.passed = common::trim(output) == common::trim(check.expected);
            result.detail = result.passed ? "Output matches expected value"
                                          : "Output does not match expected value";
          } else if constexpr (std::is_same_v<T, LlmJudge>) {
            result.deferred = true;
            result.detail = "Criterion '" + criterion.id + "' needs the judge";
          } else if constexpr (std::is_same_v<T, Custom>) {
            const auto predicate =
                predicates_ != nullptr ? predicates_->find(check.name) : std::nullopt;
            if (!predicate.has_value()) {
              result.detail = "No predicate registered for '" + check.name + "'";
            } else {
              result.passed = (*predicate)(output);
              result.detail = "Predicate '" + check.name + (result.passed ? "' passed" : "' failed");
            }
          }
        },
        criterion.check);
    total += criterion.weight;
    if (result.passed) {
      passed += criterion.weight;
    }
    evaluation.results.push_back(std::move(result));
  }
  evaluation.score = total > 0.0 ? passed / total : 0.0;
  evaluation.passed = !goal.criteria.empty() && evaluation.score >= goal.success_threshold;
  return evaluation;
}

std::optional<Verdict> GoalEvaluator::check_constraints(const Goal &goal,
                                                        const EvaluationContext &context) {
  for (const auto &constraint : goal.constraints) {
    if (constraint.kind != ConstraintKind::Hard || !constraint.limit.has_value()) {
      continue;
    }
    const double limit = *constraint.limit;
    double observed = 0.0;
    std::string unit;
    switch (constraint.category) {
    case ConstraintCategory::Time:
      observed = static_cast<double>(context.elapsed.count());
      unit = "s";
      break;
    case ConstraintCategory::Cost:
      observed = static_cast<double>(context.tokens_used);
      unit = " tokens";
      break;
    case ConstraintCategory::Turns:
      observed = static_cast<double>(context.turns_completed);
      unit = " turns";
      break;
    default:
      continue;
    }
    if (observed > limit) {
      std::string reason = "Hard " + constraint_category_to_string(constraint.category) +
                           " constraint violated: " + format_limit(observed) + unit + " > " +
                           format_limit(limit) + unit;
      if (!constraint.description.empty()) {
        reason += " (" + constraint.description + ")";
      }
      return Verdict::escalate(std::move(reason), common::ErrorKind::ConstraintViolation);
    }
  }
  return std::nullopt;
}

Verdict GoalEvaluator::apply_floor(Verdict verdict) const {
  if (verdict.confidence.has_value() && *verdict.confidence < config_.confidence_floor) {
    return Verdict::proceed("confidence " + percent(*verdict.confidence) + "% below floor " +
                            percent(config_.confidence_floor) + "% for " +
                            verdict_kind_to_string(verdict.kind) + ": " + verdict.reason);
  }
  return verdict;
}

EvaluationOutcome GoalEvaluator::evaluate(const Goal &goal, const EvaluationContext &context,
                                          const common::CancellationToken &cancel) const {
  EvaluationOutcome outcome;
  outcome.evaluation = score(goal, context.latest_output);

  if (auto violation = check_constraints(goal, context); violation.has_value()) {
    outcome.evaluation.passed = false;
    outcome.verdict = std::move(*violation);
    return outcome;
  }

  if (goal.criteria.empty()) {
    outcome.verdict = context.final_turn ? Verdict::accept(1.0, "goal has no criteria")
                                         : Verdict::proceed();
    return outcome;
  }

  if (outcome.evaluation.passed) {
    outcome.verdict = apply_floor(Verdict::accept(
        outcome.evaluation.score, "Score " + percent(outcome.evaluation.score) + "% meets threshold " +
                                      percent(goal.success_threshold) + "%"));
    return outcome;
  }

  if (!context.final_turn) {
    outcome.verdict = Verdict::proceed();
    return outcome;
  }

  if (goal.has_llm_criterion() && config_.llm_enabled && judge_ != nullptr) {
    outcome.level1_invoked = true;
    auto judged = judge_->judge(goal, context.conversation, cancel);
    if (!judged.ok()) {
      observability::record_error("judge", judged.error());
      outcome.verdict = Verdict::proceed("judge unavailable: " + judged.error());
      return outcome;
    }
    outcome.verdict = apply_floor(std::move(judged.value()));
    return outcome;
  }

  std::string failed;
  for (const auto &result : outcome.evaluation.results) {
    if (result.passed) {
      continue;
    }
    if (!failed.empty()) {
      failed += "; ";
    }
    failed += result.detail;
  }
  outcome.verdict = Verdict::retry("Score " + percent(outcome.evaluation.score) +
                                       "% < threshold " + percent(goal.success_threshold) + "%",
                                   failed.empty() ? "Try a different approach." : "Failed: " + failed);
  return outcome;
}

} // namespace warden::goal
