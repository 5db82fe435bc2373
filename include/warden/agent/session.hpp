#pragma once

#include "warden/common/result.hpp"
#include "warden/goal/goal.hpp"
#include "warden/security/policy.hpp"
#include "warden/security/tier.hpp"
#include "warden/tools/tool.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace warden::agent {

enum class SessionStatus { Running, Completed, Failed, Cancelled };

[[nodiscard]] std::string session_status_to_string(SessionStatus status);
[[nodiscard]] common::Result<SessionStatus> session_status_from_string(const std::string &value);

struct ToolOutcome {
  std::string call_id;
  std::string tool;
  bool success = false;
  std::string output;
  common::ErrorKind error_kind = common::ErrorKind::None;
  security::GateOutcome decision = security::GateOutcome::Deny;
  security::SecurityTier effective_tier = security::SecurityTier::T4;
  std::uint32_t attempts = 0;
};

struct Turn {
  std::size_t index = 0;
  /// Watchdog hints and judge feedback fed into this turn.
  std::vector<std::string> notes;
  std::string model_output;
  std::vector<tools::ToolCall> tool_calls;
  /// Same order as tool_calls.
  std::vector<ToolOutcome> tool_results;
  std::uint64_t input_tokens = 0;
  std::uint64_t output_tokens = 0;

  [[nodiscard]] bool is_final() const { return tool_calls.empty(); }
};

struct Session {
  std::string id;
  std::string prompt;
  SessionStatus status = SessionStatus::Running;
  /// Append-only.
  std::vector<Turn> turns;
  std::string failure_reason;
  std::string created_at;
  std::optional<goal::Goal> goal;
  /// Set when a run ended on a judge escalation.
  bool escalated = false;

  [[nodiscard]] bool is_terminal() const { return status != SessionStatus::Running; }
  [[nodiscard]] std::size_t next_turn_index() const { return turns.size(); }
  [[nodiscard]] std::uint64_t tokens_used() const;
  /// Model output of the most recent turn, empty before the first.
  [[nodiscard]] std::string latest_output() const;
};

[[nodiscard]] std::string encode_session(const Session &session);
/// Any malformed input is reported as CorruptCheckpoint.
[[nodiscard]] common::Result<Session> decode_session(const std::string &json);

} // namespace warden::agent
