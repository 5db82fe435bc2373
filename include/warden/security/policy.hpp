#pragma once

#include "warden/security/patterns.hpp"
#include "warden/security/tier.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden::security {

enum class GateOutcome { Allow, NeedsApproval, Deny };

[[nodiscard]] std::string gate_outcome_to_string(GateOutcome outcome);
/// Unknown names map to Deny.
[[nodiscard]] GateOutcome gate_outcome_from_string(const std::string &value);

/// Thresholds applied to tool calls made from a sub-agent. Both tiers are upper
/// bounds: overlaying can only make a policy stricter.
struct SubAgentOverlay {
  SecurityTier auto_approve_up_to = SecurityTier::T0;
  std::optional<SecurityTier> deny_above = SecurityTier::T2;
};

struct SecurityPolicy {
  SecurityTier auto_approve_up_to = SecurityTier::T1;
  /// Tiers strictly above this are denied. Unset means nothing is denied by tier.
  std::optional<SecurityTier> deny_above;
  std::uint64_t approval_timeout_secs = 60;
  std::unordered_map<std::string, SecurityTier> tool_overrides;
  std::vector<DangerousPattern> dangerous_patterns = default_dangerous_patterns();
  std::optional<SubAgentOverlay> sub_agent;

  [[nodiscard]] GateOutcome outcome_for(SecurityTier tier) const;

  /// True when, for every tier, this policy's outcome is no more permissive than
  /// other's.
  [[nodiscard]] bool at_least_as_strict_as(const SecurityPolicy &other) const;
};

/// Policy for a sub-agent spawned under parent. Pure: the result never auto-approves
/// or tolerates more than the parent does.
[[nodiscard]] SecurityPolicy overlay(const SecurityPolicy &parent);

} // namespace warden::security
