#include "warden/events/event.hpp"

#include <type_traits>

namespace warden::events {

std::string event_kind_to_string(const EventKind kind) {
  switch (kind) {
  case EventKind::RunStarted:
    return "run_started";
  case EventKind::TurnStarted:
    return "turn_started";
  case EventKind::TextDelta:
    return "text_delta";
  case EventKind::ToolCallDecided:
    return "tool_call_decided";
  case EventKind::ToolStarted:
    return "tool_started";
  case EventKind::ToolFinished:
    return "tool_finished";
  case EventKind::ApprovalRequested:
    return "approval_requested";
  case EventKind::ApprovalResolved:
    return "approval_resolved";
  case EventKind::UsageUpdated:
    return "usage_updated";
  case EventKind::TurnCompleted:
    return "turn_completed";
  case EventKind::WatchdogHint:
    return "watchdog_hint";
  case EventKind::VerdictIssued:
    return "verdict_issued";
  case EventKind::RunCompleted:
    return "run_completed";
  case EventKind::RunFailed:
    return "run_failed";
  }
  return "unknown";
}

std::string describe(const Event &event) {
  return std::visit(
      [](auto &&e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, RunStarted>) {
          return std::string(e.resumed ? "resumed" : "started") + " at turn " +
                 std::to_string(e.next_turn);
        } else if constexpr (std::is_same_v<T, TurnStarted>) {
          return "turn " + std::to_string(e.turn);
        } else if constexpr (std::is_same_v<T, TextDelta>) {
          return e.text;
        } else if constexpr (std::is_same_v<T, ToolCallDecided>) {
          std::string line = e.tool + " " + security::tier_to_string(e.base_tier) + "->" +
                             security::tier_to_string(e.effective_tier) + " " +
                             security::gate_outcome_to_string(e.outcome);
          if (e.matched_pattern.has_value()) {
            line += " (" + *e.matched_pattern + ")";
          }
          return line;
        } else if constexpr (std::is_same_v<T, ToolStarted>) {
          return e.tool + " " + e.arguments_json;
        } else if constexpr (std::is_same_v<T, ToolFinished>) {
          return e.tool + (e.success ? " ok" : " failed") + " in " +
                 std::to_string(e.duration_ms) + "ms";
        } else if constexpr (std::is_same_v<T, ApprovalRequested>) {
          return "approval " + e.request_id + " for " + e.tool + " " + e.arguments_json;
        } else if constexpr (std::is_same_v<T, ApprovalResolved>) {
          return "approval " + e.request_id + " " + security::approval_status_to_string(e.status);
        } else if constexpr (std::is_same_v<T, UsageUpdated>) {
          return "tokens " + std::to_string(e.total_tokens);
        } else if constexpr (std::is_same_v<T, TurnCompleted>) {
          return "turn " + std::to_string(e.turn) + " completed with " +
                 std::to_string(e.tool_calls) + " tool calls";
        } else if constexpr (std::is_same_v<T, WatchdogHint>) {
          return e.kind + ": " + e.message;
        } else if constexpr (std::is_same_v<T, VerdictIssued>) {
          return goal::verdict_kind_to_string(e.verdict.kind) + " " + e.verdict.reason;
        } else if constexpr (std::is_same_v<T, RunCompleted>) {
          return std::string(e.escalated ? "escalated" : "completed") + " after " +
                 std::to_string(e.turns) + " turns";
        } else if constexpr (std::is_same_v<T, RunFailed>) {
          return std::string(common::error_kind_to_string(e.kind)) + ": " + e.reason;
        }
      },
      event.payload);
}

} // namespace warden::events
