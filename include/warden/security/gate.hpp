#pragma once

#include "warden/common/result.hpp"
#include "warden/security/decision_log.hpp"
#include "warden/security/policy.hpp"
#include "warden/tools/tool.hpp"
#include "warden/tools/tool_registry.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace warden::security {

struct GateContext {
  bool is_sub_agent = false;
  std::string session_id;
  std::size_t turn = 0;
};

struct SecurityDecision {
  std::string call_id;
  std::string tool;
  SecurityTier base_tier = SecurityTier::T4;
  SecurityTier effective_tier = SecurityTier::T4;
  GateOutcome outcome = GateOutcome::Deny;
  std::optional<std::string> matched_pattern;
  std::string reason;
  /// Schema when the arguments could not be validated, PolicyViolation for any other
  /// denial, None otherwise.
  common::ErrorKind error_kind = common::ErrorKind::None;
  /// Effective approval timeout under the policy that produced this decision.
  std::uint64_t approval_timeout_secs = 0;
};

/// Mandatory check between a proposed tool call and its execution. Fails closed:
/// unknown tools and unreadable arguments are denied at T4.
class SecurityGate {
public:
  SecurityGate(std::shared_ptr<const tools::ToolRegistry> registry,
               std::shared_ptr<DecisionLog> decision_log = nullptr);

  [[nodiscard]] SecurityDecision decide(const tools::ToolCall &call, const SecurityPolicy &policy,
                                        const GateContext &context) const;

  [[nodiscard]] const std::shared_ptr<DecisionLog> &decision_log() const { return decision_log_; }

private:
  [[nodiscard]] std::shared_ptr<const PatternMatcher>
  matcher_for(const std::vector<DangerousPattern> &patterns) const;

  std::shared_ptr<const tools::ToolRegistry> registry_;
  std::shared_ptr<DecisionLog> decision_log_;
  mutable std::mutex cache_mutex_;
  mutable std::unordered_map<std::string, std::shared_ptr<const PatternMatcher>> matchers_;
};

} // namespace warden::security
