#include "warden/security/policy.hpp"

namespace warden::security {

namespace {

int strictness(const GateOutcome outcome) {
  switch (outcome) {
  case GateOutcome::Allow:
    return 0;
  case GateOutcome::NeedsApproval:
    return 1;
  case GateOutcome::Deny:
    return 2;
  }
  return 2;
}

std::optional<SecurityTier> tighter_ceiling(const std::optional<SecurityTier> &a,
                                            const std::optional<SecurityTier> &b) {
  if (!a.has_value()) {
    return b;
  }
  if (!b.has_value()) {
    return a;
  }
  return min_tier(*a, *b);
}

} // namespace

std::string gate_outcome_to_string(const GateOutcome outcome) {
  switch (outcome) {
  case GateOutcome::Allow:
    return "allow";
  case GateOutcome::NeedsApproval:
    return "needs_approval";
  case GateOutcome::Deny:
    return "deny";
  }
  return "deny";
}

GateOutcome gate_outcome_from_string(const std::string &value) {
  if (value == "allow") {
    return GateOutcome::Allow;
  }
  if (value == "needs_approval") {
    return GateOutcome::NeedsApproval;
  }
  return GateOutcome::Deny;
}

GateOutcome SecurityPolicy::outcome_for(const SecurityTier tier) const {
  if (deny_above.has_value() && static_cast<int>(tier) > static_cast<int>(*deny_above)) {
    return GateOutcome::Deny;
  }
  if (static_cast<int>(tier) <= static_cast<int>(auto_approve_up_to)) {
    return GateOutcome::Allow;
  }
  return GateOutcome::NeedsApproval;
}

bool SecurityPolicy::at_least_as_strict_as(const SecurityPolicy &other) const {
  for (int t = 0; t <= 4; ++t) {
    const auto tier = static_cast<SecurityTier>(t);
    if (strictness(outcome_for(tier)) < strictness(other.outcome_for(tier))) {
      return false;
    }
  }
  if (approval_timeout_secs > other.approval_timeout_secs) {
    return false;
  }
  for (const auto &[tool, tier] : other.tool_overrides) {
    const auto it = tool_overrides.find(tool);
    if (it == tool_overrides.end() || static_cast<int>(it->second) < static_cast<int>(tier)) {
      return false;
    }
  }
  return true;
}

SecurityPolicy overlay(const SecurityPolicy &parent) {
  SecurityPolicy child = parent;
  if (!parent.sub_agent.has_value()) {
    return child;
  }
  const SubAgentOverlay &limits = *parent.sub_agent;
  child.auto_approve_up_to = min_tier(parent.auto_approve_up_to, limits.auto_approve_up_to);
  child.deny_above = tighter_ceiling(parent.deny_above, limits.deny_above);
  if (child.deny_above.has_value()) {
    child.auto_approve_up_to = min_tier(child.auto_approve_up_to, *child.deny_above);
  }
  return child;
}

} // namespace warden::security
