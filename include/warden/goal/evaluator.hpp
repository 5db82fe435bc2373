#pragma once

#include "warden/common/cancellation.hpp"
#include "warden/goal/goal.hpp"
#include "warden/goal/judge.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace warden::goal {

using Predicate = std::function<bool(const std::string &output)>;

/// Pure predicates available to Custom criteria, by name.
class PredicateRegistry {
public:
  void register_predicate(const std::string &name, Predicate predicate);
  [[nodiscard]] std::optional<Predicate> find(const std::string &name) const;

private:
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Predicate> predicates_;
};

struct JudgeConfig {
  /// Allows Level 1 when a goal carries an LlmJudge criterion.
  bool llm_enabled = true;
  /// Verdicts carrying a lower confidence are downgraded to Continue.
  double confidence_floor = 0.6;
};

struct EvaluationContext {
  std::string latest_output;
  /// The turn proposed no tool calls.
  bool final_turn = false;
  std::size_t turns_completed = 0;
  std::chrono::seconds elapsed{0};
  std::uint64_t tokens_used = 0;
  /// Transcript handed to the Level 1 judge.
  std::string conversation;
};

struct EvaluationOutcome {
  Verdict verdict;
  GoalEvaluation evaluation;
  bool level1_invoked = false;
};

class GoalEvaluator {
public:
  explicit GoalEvaluator(JudgeConfig config, std::shared_ptr<const ModelJudge> judge = nullptr,
                         std::shared_ptr<const PredicateRegistry> predicates = nullptr);

  [[nodiscard]] EvaluationOutcome evaluate(const Goal &goal, const EvaluationContext &context,
                                           const common::CancellationToken &cancel) const;

  /// Level 0: deterministic weighted score of the latest output.
  [[nodiscard]] GoalEvaluation score(const Goal &goal, const std::string &output) const;

  /// First violated hard Time, Cost or Turns constraint, as an Escalate verdict.
  [[nodiscard]] static std::optional<Verdict> check_constraints(const Goal &goal,
                                                                const EvaluationContext &context);

private:
  [[nodiscard]] Verdict apply_floor(Verdict verdict) const;

  JudgeConfig config_;
  std::shared_ptr<const ModelJudge> judge_;
  std::shared_ptr<const PredicateRegistry> predicates_;
};

} // namespace warden::goal
