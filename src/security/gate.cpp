#include "warden/security/gate.hpp"

#include "warden/common/json_util.hpp"
#include "warden/observability/global.hpp"

#include <vector>

namespace warden::security {

namespace {

std::string patterns_key(const std::vector<DangerousPattern> &patterns) {
  std::string key;
  for (const auto &pattern : patterns) {
    key += pattern.label;
    key.push_back('\x1f');
    key += pattern.pattern;
    key.push_back('\x1e');
  }
  return key;
}

constexpr int kMaxScanDepth = 32;

/// Decoded strings anywhere in value. Arrays whose elements are all strings are
/// also emitted joined with single spaces so argv-style commands read as one line.
void collect_strings(const std::string &raw, const int depth, std::vector<std::string> &out) {
  if (depth > kMaxScanDepth) {
    return;
  }
  switch (common::json_value_type(raw)) {
  case common::JsonType::String: {
    const auto begin = raw.find('"');
    const auto end = raw.rfind('"');
    if (begin != std::string::npos && end > begin) {
      out.push_back(common::json_unescape(raw.substr(begin + 1, end - begin - 1)));
    }
    break;
  }
  case common::JsonType::Object: {
    auto members = common::json_object_members(raw);
    if (!members.ok()) {
      break;
    }
    for (const auto &[key, value] : members.value()) {
      out.push_back(key);
      collect_strings(value, depth + 1, out);
    }
    break;
  }
  case common::JsonType::Array: {
    const auto elements = common::json_array_elements(raw);
    std::string joined;
    bool all_strings = !elements.empty();
    for (const auto &element : elements) {
      const std::size_t before = out.size();
      collect_strings(element, depth + 1, out);
      if (common::json_value_type(element) != common::JsonType::String ||
          out.size() != before + 1) {
        all_strings = false;
        continue;
      }
      if (!joined.empty()) {
        joined.push_back(' ');
      }
      joined += out.back();
    }
    if (all_strings) {
      out.push_back(std::move(joined));
    }
    break;
  }
  default:
    break;
  }
}

std::optional<std::string> scan_arguments(const PatternMatcher &matcher,
                                          const std::string &arguments_json) {
  if (auto hit = matcher.match(arguments_json); hit.has_value()) {
    return hit;
  }
  // Escapes and nesting in the raw text can hide a command, so every decoded string is scanned.
  std::vector<std::string> strings;
  collect_strings(arguments_json, 0, strings);
  for (const auto &value : strings) {
    if (auto hit = matcher.match(value); hit.has_value()) {
      return hit;
    }
  }
  return std::nullopt;
}

} // namespace

SecurityGate::SecurityGate(std::shared_ptr<const tools::ToolRegistry> registry,
                           std::shared_ptr<DecisionLog> decision_log)
    : registry_(std::move(registry)), decision_log_(std::move(decision_log)) {}

std::shared_ptr<const PatternMatcher>
SecurityGate::matcher_for(const std::vector<DangerousPattern> &patterns) const {
  const std::string key = patterns_key(patterns);
  std::lock_guard<std::mutex> lock(cache_mutex_);
  if (const auto it = matchers_.find(key); it != matchers_.end()) {
    return it->second;
  }
  auto matcher = std::make_shared<const PatternMatcher>(PatternMatcher::compile(patterns));
  for (const auto &warning : matcher->warnings()) {
    observability::record_error("security", "skipping dangerous pattern: " + warning);
  }
  matchers_.emplace(key, matcher);
  return matcher;
}

SecurityDecision SecurityGate::decide(const tools::ToolCall &call, const SecurityPolicy &policy,
                                      const GateContext &context) const {
  SecurityDecision decision;
  decision.call_id = call.id;
  decision.tool = call.name;

  const SecurityPolicy effective_policy = context.is_sub_agent ? overlay(policy) : policy;
  decision.approval_timeout_secs = effective_policy.approval_timeout_secs;

  const auto tool = registry_ != nullptr ? registry_->get_tool(call.name) : nullptr;
  bool schema_failed = false;
  if (tool == nullptr) {
    decision.base_tier = SecurityTier::T4;
    decision.reason = "unknown tool: " + call.name;
    schema_failed = true;
  } else {
    decision.base_tier = tool->tier();
    if (const auto it = effective_policy.tool_overrides.find(std::string(tool->name()));
        it != effective_policy.tool_overrides.end()) {
      decision.base_tier = it->second;
    }
    const auto valid = tools::validate_arguments(tool->parameters_schema(), call.arguments_json);
    if (!valid.ok()) {
      decision.reason = valid.error();
      schema_failed = true;
    }
  }

  decision.effective_tier = decision.base_tier;
  if (schema_failed) {
    decision.effective_tier = SecurityTier::T4;
    decision.outcome = GateOutcome::Deny;
    decision.error_kind = common::ErrorKind::Schema;
  } else {
    const auto matcher = matcher_for(effective_policy.dangerous_patterns);
    decision.matched_pattern = scan_arguments(*matcher, call.arguments_json);
    if (decision.matched_pattern.has_value()) {
      decision.effective_tier = SecurityTier::T4;
    }

    decision.outcome = effective_policy.outcome_for(decision.effective_tier);
    switch (decision.outcome) {
    case GateOutcome::Allow:
      decision.reason = tier_to_string(decision.effective_tier) + " is within auto-approval (" +
                        tier_to_string(effective_policy.auto_approve_up_to) + ")";
      break;
    case GateOutcome::NeedsApproval:
      decision.reason = tier_to_string(decision.effective_tier) + " requires approval";
      break;
    case GateOutcome::Deny:
      decision.reason = tier_to_string(decision.effective_tier) + " exceeds deny threshold (" +
                        tier_to_string(effective_policy.deny_above.value_or(SecurityTier::T4)) +
                        ")";
      decision.error_kind = common::ErrorKind::PolicyViolation;
      break;
    }
    if (decision.matched_pattern.has_value()) {
      decision.reason = "matched dangerous pattern '" + *decision.matched_pattern + "'; " +
                        decision.reason;
    }
  }
  if (context.is_sub_agent) {
    decision.reason += " [sub-agent policy]";
  }

  if (decision_log_ != nullptr) {
    decision_log_->record(DecisionRecord{.session_id = context.session_id,
                                         .turn = context.turn,
                                         .call_id = call.id,
                                         .tool = call.name,
                                         .base_tier = decision.base_tier,
                                         .effective_tier = decision.effective_tier,
                                         .outcome = decision.outcome,
                                         .matched_pattern = decision.matched_pattern,
                                         .reason = decision.reason,
                                         .sub_agent = context.is_sub_agent});
  }
  observability::record_gate_decision(call.name, tier_to_string(decision.effective_tier),
                                      gate_outcome_to_string(decision.outcome),
                                      decision.matched_pattern);
  return decision;
}

} // namespace warden::security
