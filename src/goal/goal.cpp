#include "warden/goal/goal.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"

#include <cstdlib>
#include <type_traits>
#include <sstream>

namespace warden::goal {

namespace {

std::string format_number(const double value) {
  std::ostringstream out;
  out.precision(12);
  out << value;
  return out.str();
}

bool parse_number(const std::string &raw, double &out) {
  if (raw.empty()) {
    return false;
  }
  char *end = nullptr;
  out = std::strtod(raw.c_str(), &end);
  return end != nullptr && *end == '\0';
}

std::string encode_criterion(const Criterion &criterion) {
  std::string out = "{\"id\":" + common::json_quote(criterion.id) +
                    ",\"description\":" + common::json_quote(criterion.description) +
                    ",\"weight\":" + format_number(criterion.weight);
  std::visit(
      [&out](auto &&check) {
        using T = std::decay_t<decltype(check)>;
        if constexpr (std::is_same_v<T, OutputContains>) {
          out += ",\"kind\":\"output_contains\",\"pattern\":" + common::json_quote(check.pattern) +
                 ",\"case_sensitive\":" + (check.case_sensitive ? "true" : "false");
        } else if constexpr (std::is_same_v<T, OutputEquals>) {
          out += ",\"kind\":\"output_equals\",\"expected\":" + common::json_quote(check.expected);
        } else if constexpr (std::is_same_v<T, LlmJudge>) {
          out += ",\"kind\":\"llm_judge\",\"prompt\":" + common::json_quote(check.prompt);
        } else if constexpr (std::is_same_v<T, Custom>) {
          out += ",\"kind\":\"custom\",\"name\":" + common::json_quote(check.name);
        }
      },
      criterion.check);
  out += "}";
  return out;
}

common::Result<Criterion> decode_criterion(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  const auto get = [&fields](const std::string &key) {
    const auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
  };

  Criterion criterion;
  criterion.id = get("id");
  criterion.description = get("description");
  if (const auto weight = get("weight"); !weight.empty() && !parse_number(weight, criterion.weight)) {
    return common::Result<Criterion>::failure(common::ErrorKind::Schema,
                                              "invalid criterion weight: " + weight);
  }
  const std::string kind = get("kind");
  if (kind == "output_contains") {
    criterion.check = OutputContains{.pattern = get("pattern"),
                                     .case_sensitive = get("case_sensitive") == "true"};
  } else if (kind == "output_equals") {
    criterion.check = OutputEquals{.expected = get("expected")};
  } else if (kind == "llm_judge") {
    criterion.check = LlmJudge{.prompt = get("prompt")};
  } else if (kind == "custom") {
    criterion.check = Custom{.name = get("name")};
  } else {
    return common::Result<Criterion>::failure(common::ErrorKind::Schema,
                                              "unknown criterion kind: " + kind);
  }
  return common::Result<Criterion>::success(std::move(criterion));
}

common::Result<Constraint> decode_constraint(const std::string &json) {
  const auto fields = common::json_parse_flat(json);
  const auto get = [&fields](const std::string &key) {
    const auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
  };

  Constraint constraint;
  constraint.id = get("id");
  constraint.description = get("description");
  auto category = constraint_category_from_string(get("category"));
  if (!category.ok()) {
    return common::Result<Constraint>::failure(category.status());
  }
  constraint.category = category.value();
  constraint.kind = get("kind") == "hard" ? ConstraintKind::Hard : ConstraintKind::Soft;
  if (const auto limit = get("limit"); !limit.empty() && limit != "null") {
    double value = 0.0;
    if (!parse_number(limit, value)) {
      return common::Result<Constraint>::failure(common::ErrorKind::Schema,
                                                 "invalid constraint limit: " + limit);
    }
    constraint.limit = value;
  }
  return common::Result<Constraint>::success(std::move(constraint));
}

} // namespace

bool Goal::has_llm_criterion() const {
  for (const auto &criterion : criteria) {
    if (criterion.is_llm_judge()) {
      return true;
    }
  }
  return false;
}

Verdict Verdict::accept(const double confidence, std::string reason) {
  return Verdict{.kind = VerdictKind::Accept,
                 .confidence = confidence,
                 .reason = std::move(reason),
                 .hint = "",
                 .cause = common::ErrorKind::None};
}

Verdict Verdict::retry(std::string reason, std::string hint, const std::optional<double> confidence) {
  return Verdict{.kind = VerdictKind::Retry,
                 .confidence = confidence,
                 .reason = std::move(reason),
                 .hint = std::move(hint),
                 .cause = common::ErrorKind::None};
}

Verdict Verdict::escalate(std::string reason, const common::ErrorKind cause) {
  return Verdict{.kind = VerdictKind::Escalate,
                 .confidence = std::nullopt,
                 .reason = std::move(reason),
                 .hint = "",
                 .cause = cause};
}

Verdict Verdict::proceed(std::string reason) {
  return Verdict{.kind = VerdictKind::Continue,
                 .confidence = std::nullopt,
                 .reason = std::move(reason),
                 .hint = "",
                 .cause = common::ErrorKind::None};
}

std::string verdict_kind_to_string(const VerdictKind kind) {
  switch (kind) {
  case VerdictKind::Accept:
    return "accept";
  case VerdictKind::Retry:
    return "retry";
  case VerdictKind::Escalate:
    return "escalate";
  case VerdictKind::Continue:
    return "continue";
  }
  return "continue";
}

common::Result<VerdictKind> verdict_kind_from_string(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (lowered == "accept") {
    return common::Result<VerdictKind>::success(VerdictKind::Accept);
  }
  if (lowered == "retry") {
    return common::Result<VerdictKind>::success(VerdictKind::Retry);
  }
  if (lowered == "escalate") {
    return common::Result<VerdictKind>::success(VerdictKind::Escalate);
  }
  if (lowered == "continue") {
    return common::Result<VerdictKind>::success(VerdictKind::Continue);
  }
  return common::Result<VerdictKind>::failure(common::ErrorKind::Schema,
                                              "unknown verdict: " + value);
}

std::string constraint_category_to_string(const ConstraintCategory category) {
  switch (category) {
  case ConstraintCategory::Time:
    return "time";
  case ConstraintCategory::Cost:
    return "cost";
  case ConstraintCategory::Turns:
    return "turns";
  case ConstraintCategory::Safety:
    return "safety";
  case ConstraintCategory::Scope:
    return "scope";
  case ConstraintCategory::Quality:
    return "quality";
  }
  return "quality";
}

common::Result<ConstraintCategory> constraint_category_from_string(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  for (const auto category :
       {ConstraintCategory::Time, ConstraintCategory::Cost, ConstraintCategory::Turns,
        ConstraintCategory::Safety, ConstraintCategory::Scope, ConstraintCategory::Quality}) {
    if (constraint_category_to_string(category) == lowered) {
      return common::Result<ConstraintCategory>::success(category);
    }
  }
  return common::Result<ConstraintCategory>::failure(common::ErrorKind::Schema,
                                                     "unknown constraint category: " + value);
}

std::string encode_goal(const Goal &goal) {
  std::string out = "{\"description\":" + common::json_quote(goal.description) +
                    ",\"success_threshold\":" + format_number(goal.success_threshold) +
                    ",\"criteria\":[";
  for (std::size_t i = 0; i < goal.criteria.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += encode_criterion(goal.criteria[i]);
  }
  out += "],\"constraints\":[";
  for (std::size_t i = 0; i < goal.constraints.size(); ++i) {
    const auto &c = goal.constraints[i];
    if (i > 0) {
      out += ",";
    }
    out += "{\"id\":" + common::json_quote(c.id) +
           ",\"category\":" + common::json_quote(constraint_category_to_string(c.category)) +
           ",\"kind\":" + std::string(c.kind == ConstraintKind::Hard ? "\"hard\"" : "\"soft\"") +
           ",\"description\":" + common::json_quote(c.description) +
           ",\"limit\":" + (c.limit.has_value() ? format_number(*c.limit) : std::string("null")) +
           "}";
  }
  out += "]}";
  return out;
}

common::Result<Goal> decode_goal(const std::string &json) {
  auto members = common::json_object_members(json);
  if (!members.ok()) {
    return common::Result<Goal>::failure(members.status());
  }

  Goal goal;
  for (const auto &[key, raw] : members.value()) {
    if (key == "description") {
      if (common::json_value_type(raw) != common::JsonType::String) {
        return common::Result<Goal>::failure(common::ErrorKind::Schema,
                                             "goal description must be a string");
      }
      goal.description = common::json_unescape(raw.substr(1, raw.size() - 2));
    } else if (key == "success_threshold") {
      if (!parse_number(raw, goal.success_threshold)) {
        return common::Result<Goal>::failure(common::ErrorKind::Schema,
                                             "invalid success_threshold: " + raw);
      }
    } else if (key == "criteria") {
      for (const auto &item : common::json_split_top_level_objects(raw)) {
        auto criterion = decode_criterion(item);
        if (!criterion.ok()) {
          return common::Result<Goal>::failure(criterion.status());
        }
        goal.criteria.push_back(std::move(criterion.value()));
      }
    } else if (key == "constraints") {
      for (const auto &item : common::json_split_top_level_objects(raw)) {
        auto constraint = decode_constraint(item);
        if (!constraint.ok()) {
          return common::Result<Goal>::failure(constraint.status());
        }
        goal.constraints.push_back(std::move(constraint.value()));
      }
    }
  }
  return common::Result<Goal>::success(std::move(goal));
}

} // namespace warden::goal
