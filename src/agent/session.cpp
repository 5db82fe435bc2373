#include "warden/agent/session.hpp"

#include "warden/common/json_util.hpp"

#include <cstdlib>

namespace warden::agent {

namespace {

using common::ErrorKind;

common::Status corrupt(const std::string &message) {
  return common::Status::error(ErrorKind::CorruptCheckpoint, "corrupt session: " + message);
}

bool read_string(const std::string &raw, std::string &out) {
  if (common::json_value_type(raw) != common::JsonType::String) {
    return false;
  }
  out = common::json_unescape(raw.substr(1, raw.size() - 2));
  return true;
}

bool read_uint(const std::string &raw, std::uint64_t &out) {
  if (common::json_value_type(raw) != common::JsonType::Number || raw.front() == '-') {
    return false;
  }
  char *end = nullptr;
  const unsigned long long value = std::strtoull(raw.c_str(), &end, 10);
  if (end == raw.c_str() || *end != '\0') {
    return false;
  }
  out = value;
  return true;
}

bool read_bool(const std::string &raw, bool &out) {
  if (raw == "true" || raw == "false") {
    out = raw == "true";
    return true;
  }
  return false;
}

std::string encode_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ",";
    }
    out += common::json_quote(values[i]);
  }
  return out + "]";
}

std::string encode_call(const tools::ToolCall &call) {
  return "{\"id\":" + common::json_quote(call.id) + ",\"name\":" + common::json_quote(call.name) +
         ",\"arguments\":" + common::json_quote(call.arguments_json) +
         ",\"depends_on\":" + encode_string_array(call.depends_on) + "}";
}

std::string encode_outcome(const ToolOutcome &outcome) {
  return "{\"call_id\":" + common::json_quote(outcome.call_id) +
         ",\"tool\":" + common::json_quote(outcome.tool) +
         ",\"success\":" + (outcome.success ? "true" : "false") +
         ",\"output\":" + common::json_quote(outcome.output) + ",\"error_kind\":" +
         common::json_quote(std::string(common::error_kind_to_string(outcome.error_kind))) +
         ",\"decision\":" + common::json_quote(security::gate_outcome_to_string(outcome.decision)) +
         ",\"effective_tier\":" +
         common::json_quote(security::tier_to_string(outcome.effective_tier)) +
         ",\"attempts\":" + std::to_string(outcome.attempts) + "}";
}

std::string encode_turn(const Turn &turn) {
  std::string out = "{\"index\":" + std::to_string(turn.index) +
                    ",\"notes\":" + encode_string_array(turn.notes) +
                    ",\"model_output\":" + common::json_quote(turn.model_output) +
                    ",\"tool_calls\":[";
  for (std::size_t i = 0; i < turn.tool_calls.size(); ++i) {
    out += (i > 0 ? "," : "") + encode_call(turn.tool_calls[i]);
  }
  out += "],\"tool_results\":[";
  for (std::size_t i = 0; i < turn.tool_results.size(); ++i) {
    out += (i > 0 ? "," : "") + encode_outcome(turn.tool_results[i]);
  }
  out += "],\"input_tokens\":" + std::to_string(turn.input_tokens) +
         ",\"output_tokens\":" + std::to_string(turn.output_tokens) + "}";
  return out;
}

common::Result<tools::ToolCall> decode_call(const std::string &json) {
  auto members = common::json_object_members(json);
  if (!members.ok()) {
    return common::Result<tools::ToolCall>::failure(corrupt("tool call: " + members.error()));
  }
  tools::ToolCall call;
  for (const auto &[key, raw] : members.value()) {
    bool ok = true;
    if (key == "id") {
      ok = read_string(raw, call.id);
    } else if (key == "name") {
      ok = read_string(raw, call.name);
    } else if (key == "arguments") {
      ok = read_string(raw, call.arguments_json);
    } else if (key == "depends_on") {
      call.depends_on = common::json_parse_string_array(raw);
    }
    if (!ok) {
      return common::Result<tools::ToolCall>::failure(corrupt("tool call field " + key));
    }
  }
  return common::Result<tools::ToolCall>::success(std::move(call));
}

common::Result<ToolOutcome> decode_outcome(const std::string &json) {
  auto members = common::json_object_members(json);
  if (!members.ok()) {
    return common::Result<ToolOutcome>::failure(corrupt("tool result: " + members.error()));
  }
  ToolOutcome outcome;
  for (const auto &[key, raw] : members.value()) {
    bool ok = true;
    std::string text;
    if (key == "call_id") {
      ok = read_string(raw, outcome.call_id);
    } else if (key == "tool") {
      ok = read_string(raw, outcome.tool);
    } else if (key == "success") {
      ok = read_bool(raw, outcome.success);
    } else if (key == "output") {
      ok = read_string(raw, outcome.output);
    } else if (key == "error_kind") {
      ok = read_string(raw, text);
      outcome.error_kind = common::error_kind_from_string(text);
    } else if (key == "decision") {
      ok = read_string(raw, text);
      outcome.decision = security::gate_outcome_from_string(text);
    } else if (key == "effective_tier") {
      ok = read_string(raw, text);
      if (ok) {
        auto tier = security::tier_from_string(text);
        ok = tier.ok();
        if (ok) {
          outcome.effective_tier = tier.value();
        }
      }
    } else if (key == "attempts") {
      std::uint64_t attempts = 0;
      ok = read_uint(raw, attempts);
      outcome.attempts = static_cast<std::uint32_t>(attempts);
    }
    if (!ok) {
      return common::Result<ToolOutcome>::failure(corrupt("tool result field " + key));
    }
  }
  return common::Result<ToolOutcome>::success(std::move(outcome));
}

common::Result<Turn> decode_turn(const std::string &json) {
  auto members = common::json_object_members(json);
  if (!members.ok()) {
    return common::Result<Turn>::failure(corrupt("turn: " + members.error()));
  }
  Turn turn;
  for (const auto &[key, raw] : members.value()) {
    bool ok = true;
    if (key == "index") {
      std::uint64_t index = 0;
      ok = read_uint(raw, index);
      turn.index = static_cast<std::size_t>(index);
    } else if (key == "notes") {
      turn.notes = common::json_parse_string_array(raw);
    } else if (key == "model_output") {
      ok = read_string(raw, turn.model_output);
    } else if (key == "tool_calls") {
      for (const auto &item : common::json_split_top_level_objects(raw)) {
        auto call = decode_call(item);
        if (!call.ok()) {
          return common::Result<Turn>::failure(call.status());
        }
        turn.tool_calls.push_back(std::move(call.value()));
      }
    } else if (key == "tool_results") {
      for (const auto &item : common::json_split_top_level_objects(raw)) {
        auto outcome = decode_outcome(item);
        if (!outcome.ok()) {
          return common::Result<Turn>::failure(outcome.status());
        }
        turn.tool_results.push_back(std::move(outcome.value()));
      }
    } else if (key == "input_tokens") {
      ok = read_uint(raw, turn.input_tokens);
    } else if (key == "output_tokens") {
      ok = read_uint(raw, turn.output_tokens);
    }
    if (!ok) {
      return common::Result<Turn>::failure(corrupt("turn field " + key));
    }
  }
  return common::Result<Turn>::success(std::move(turn));
}

} // namespace

std::string session_status_to_string(const SessionStatus status) {
  switch (status) {
  case SessionStatus::Running:
    return "running";
  case SessionStatus::Completed:
    return "completed";
  case SessionStatus::Failed:
    return "failed";
  case SessionStatus::Cancelled:
    return "cancelled";
  }
  return "failed";
}

common::Result<SessionStatus> session_status_from_string(const std::string &value) {
  if (value == "running") {
    return common::Result<SessionStatus>::success(SessionStatus::Running);
  }
  if (value == "completed") {
    return common::Result<SessionStatus>::success(SessionStatus::Completed);
  }
  if (value == "failed") {
    return common::Result<SessionStatus>::success(SessionStatus::Failed);
  }
  if (value == "cancelled") {
    return common::Result<SessionStatus>::success(SessionStatus::Cancelled);
  }
  return common::Result<SessionStatus>::failure(ErrorKind::Schema,
                                                "unknown session status: " + value);
}

std::uint64_t Session::tokens_used() const {
  std::uint64_t total = 0;
  for (const auto &turn : turns) {
    total += turn.input_tokens + turn.output_tokens;
  }
  return total;
}

std::string Session::latest_output() const {
  return turns.empty() ? std::string() : turns.back().model_output;
}

std::string encode_session(const Session &session) {
  std::string out = "{\"id\":" + common::json_quote(session.id) +
                    ",\"prompt\":" + common::json_quote(session.prompt) +
                    ",\"status\":" + common::json_quote(session_status_to_string(session.status)) +
                    ",\"failure_reason\":" + common::json_quote(session.failure_reason) +
                    ",\"created_at\":" + common::json_quote(session.created_at) +
                    ",\"escalated\":" + (session.escalated ? "true" : "false") + ",\"goal\":" +
                    (session.goal.has_value() ? goal::encode_goal(*session.goal) : "null") +
                    ",\"turns\":[";
  for (std::size_t i = 0; i < session.turns.size(); ++i) {
    out += (i > 0 ? "," : "") + encode_turn(session.turns[i]);
  }
  out += "]}";
  return out;
}

common::Result<Session> decode_session(const std::string &json) {
  auto members = common::json_object_members(json);
  if (!members.ok()) {
    return common::Result<Session>::failure(corrupt(members.error()));
  }
  Session session;
  bool saw_id = false;
  for (const auto &[key, raw] : members.value()) {
    bool ok = true;
    if (key == "id") {
      ok = read_string(raw, session.id);
      saw_id = ok;
    } else if (key == "prompt") {
      ok = read_string(raw, session.prompt);
    } else if (key == "status") {
      std::string text;
      ok = read_string(raw, text);
      if (ok) {
        auto status = session_status_from_string(text);
        ok = status.ok();
        if (ok) {
          session.status = status.value();
        }
      }
    } else if (key == "failure_reason") {
      ok = read_string(raw, session.failure_reason);
    } else if (key == "created_at") {
      ok = read_string(raw, session.created_at);
    } else if (key == "escalated") {
      ok = read_bool(raw, session.escalated);
    } else if (key == "goal") {
      if (raw != "null") {
        auto decoded = goal::decode_goal(raw);
        if (!decoded.ok()) {
          return common::Result<Session>::failure(corrupt("goal: " + decoded.error()));
        }
        session.goal = std::move(decoded.value());
      }
    } else if (key == "turns") {
      if (common::json_value_type(raw) != common::JsonType::Array) {
        ok = false;
      } else {
        for (const auto &item : common::json_split_top_level_objects(raw)) {
          auto turn = decode_turn(item);
          if (!turn.ok()) {
            return common::Result<Session>::failure(turn.status());
          }
          session.turns.push_back(std::move(turn.value()));
        }
      }
    }
    if (!ok) {
      return common::Result<Session>::failure(corrupt("field " + key));
    }
  }
  if (!saw_id || session.id.empty()) {
    return common::Result<Session>::failure(corrupt("missing id"));
  }
  for (std::size_t i = 0; i < session.turns.size(); ++i) {
    if (session.turns[i].index != i) {
      return common::Result<Session>::failure(corrupt("turn indices out of order"));
    }
  }
  return common::Result<Session>::success(std::move(session));
}

} // namespace warden::agent
