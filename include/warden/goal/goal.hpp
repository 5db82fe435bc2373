#pragma once

#include "warden/common/result.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace warden::goal {

struct OutputContains {
  std::string pattern;
  bool case_sensitive = false;
};

/// Compared after trimming both sides.
struct OutputEquals {
  std::string expected;
};

struct LlmJudge {
  std::string prompt;
};

/// Named pure predicate resolved through a PredicateRegistry.
struct Custom {
  std::string name;
};

using CriterionCheck = std::variant<OutputContains, OutputEquals, LlmJudge, Custom>;

struct Criterion {
  std::string id;
  std::string description;
  double weight = 1.0;
  CriterionCheck check;

  [[nodiscard]] bool is_llm_judge() const { return std::holds_alternative<LlmJudge>(check); }
};

enum class ConstraintCategory { Time, Cost, Turns, Safety, Scope, Quality };
enum class ConstraintKind { Hard, Soft };

struct Constraint {
  std::string id;
  ConstraintCategory category = ConstraintCategory::Quality;
  ConstraintKind kind = ConstraintKind::Soft;
  std::string description;
  /// Seconds for Time, tokens for Cost, turns for Turns.
  std::optional<double> limit;
};

struct Goal {
  std::string description;
  std::vector<Criterion> criteria;
  std::vector<Constraint> constraints;
  double success_threshold = 0.9;

  [[nodiscard]] bool has_llm_criterion() const;
};

enum class VerdictKind { Accept, Retry, Escalate, Continue };

struct Verdict {
  VerdictKind kind = VerdictKind::Continue;
  std::optional<double> confidence;
  std::string reason;
  std::string hint;
  common::ErrorKind cause = common::ErrorKind::None;

  [[nodiscard]] static Verdict accept(double confidence, std::string reason = "");
  [[nodiscard]] static Verdict retry(std::string reason, std::string hint,
                                     std::optional<double> confidence = std::nullopt);
  [[nodiscard]] static Verdict escalate(std::string reason,
                                        common::ErrorKind cause = common::ErrorKind::None);
  [[nodiscard]] static Verdict proceed(std::string reason = "");
};

struct CriterionResult {
  std::string id;
  double weight = 1.0;
  bool passed = false;
  /// LlmJudge criteria are left to Level 1.
  bool deferred = false;
  std::string detail;
};

struct GoalEvaluation {
  std::vector<CriterionResult> results;
  double score = 0.0;
  bool passed = false;
};

[[nodiscard]] std::string verdict_kind_to_string(VerdictKind kind);
[[nodiscard]] common::Result<VerdictKind> verdict_kind_from_string(const std::string &value);
[[nodiscard]] std::string constraint_category_to_string(ConstraintCategory category);
[[nodiscard]] common::Result<ConstraintCategory> constraint_category_from_string(const std::string &value);

[[nodiscard]] std::string encode_goal(const Goal &goal);
[[nodiscard]] common::Result<Goal> decode_goal(const std::string &json);

} // namespace warden::goal
