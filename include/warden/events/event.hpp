#pragma once

#include "warden/common/result.hpp"
#include "warden/goal/goal.hpp"
#include "warden/security/approval_status.hpp"
#include "warden/security/policy.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace warden::events {

/// Same order as EventPayload alternatives.
enum class EventKind {
  RunStarted,
  TurnStarted,
  TextDelta,
  ToolCallDecided,
  ToolStarted,
  ToolFinished,
  ApprovalRequested,
  ApprovalResolved,
  UsageUpdated,
  TurnCompleted,
  WatchdogHint,
  VerdictIssued,
  RunCompleted,
  RunFailed,
};

[[nodiscard]] std::string event_kind_to_string(EventKind kind);

struct RunStarted {
  std::string prompt;
  bool resumed = false;
  std::size_t next_turn = 0;
  bool sub_agent = false;
};

struct TurnStarted {
  std::size_t turn = 0;
  std::size_t hints = 0;
};

struct TextDelta {
  std::size_t turn = 0;
  std::string text;
};

struct ToolCallDecided {
  std::size_t turn = 0;
  std::string call_id;
  std::string tool;
  security::SecurityTier base_tier = security::SecurityTier::T4;
  security::SecurityTier effective_tier = security::SecurityTier::T4;
  security::GateOutcome outcome = security::GateOutcome::Deny;
  std::optional<std::string> matched_pattern;
  std::string reason;
};

struct ToolStarted {
  std::size_t turn = 0;
  std::string call_id;
  std::string tool;
  std::string arguments_json;
  std::uint32_t attempt = 1;
};

struct ToolFinished {
  std::size_t turn = 0;
  std::string call_id;
  std::string tool;
  bool success = false;
  common::ErrorKind error_kind = common::ErrorKind::None;
  std::uint64_t duration_ms = 0;
};

struct ApprovalRequested {
  std::string request_id;
  std::string call_id;
  std::string tool;
  std::string arguments_json;
  security::SecurityTier tier = security::SecurityTier::T4;
  std::string reason;
  std::uint64_t timeout_secs = 0;
};

struct ApprovalResolved {
  std::string request_id;
  std::string call_id;
  std::string tool;
  security::ApprovalStatus status = security::ApprovalStatus::Pending;
};

struct UsageUpdated {
  std::size_t turn = 0;
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;
  std::uint64_t total_tokens = 0;
};

struct TurnCompleted {
  std::size_t turn = 0;
  std::size_t tool_calls = 0;
  bool final_turn = false;
};

struct WatchdogHint {
  std::string kind;
  std::string message;
};

struct VerdictIssued {
  std::size_t turn = 0;
  goal::Verdict verdict;
  goal::GoalEvaluation evaluation;
};

struct RunCompleted {
  std::string output;
  std::size_t turns = 0;
  bool escalated = false;
  std::string reason;
};

struct RunFailed {
  std::string reason;
  common::ErrorKind kind = common::ErrorKind::Internal;
  std::size_t turns = 0;
};

using EventPayload =
    std::variant<RunStarted, TurnStarted, TextDelta, ToolCallDecided, ToolStarted, ToolFinished,
                 ApprovalRequested, ApprovalResolved, UsageUpdated, TurnCompleted, WatchdogHint,
                 VerdictIssued, RunCompleted, RunFailed>;

struct Event {
  /// Empty for events not tied to one session.
  std::string session_id;
  std::string timestamp;
  EventPayload payload;

  [[nodiscard]] EventKind kind() const { return static_cast<EventKind>(payload.index()); }
};

/// One-line human readable rendering, used by the CLI.
[[nodiscard]] std::string describe(const Event &event);

} // namespace warden::events
