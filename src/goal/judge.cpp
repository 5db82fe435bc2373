#include "warden/goal/judge.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"

#include <algorithm>
#include <cstdlib>
#include <sstream>

namespace warden::goal {

namespace {

constexpr const char *kDefaultHint = "Try a different approach.";

std::string percent(const double value) {
  std::ostringstream out;
  out.setf(std::ios::fixed);
  out.precision(0);
  out << value * 100.0;
  return out.str();
}

} // namespace

std::string extract_json_block(const std::string &text) {
  const std::string trimmed = common::trim(text);
  if (const auto start = trimmed.find("```json"); start != std::string::npos) {
    const auto body = start + 7;
    if (const auto end = trimmed.find("```", body); end != std::string::npos) {
      return common::trim(trimmed.substr(body, end - body));
    }
  }
  if (const auto start = trimmed.find("```"); start != std::string::npos) {
    const auto body = start + 3;
    if (const auto end = trimmed.find("```", body); end != std::string::npos) {
      return common::trim(trimmed.substr(body, end - body));
    }
  }
  const auto open = trimmed.find('{');
  const auto close = trimmed.rfind('}');
  if (open != std::string::npos && close != std::string::npos && close > open) {
    return trimmed.substr(open, close - open + 1);
  }
  return trimmed;
}

Verdict parse_judge_reply(const std::string &reply) {
  const std::string json = extract_json_block(reply);
  if (!common::json_validate(json).ok() ||
      common::json_value_type(json) != common::JsonType::Object) {
    return Verdict::proceed("unparseable judge reply");
  }
  const auto fields = common::json_parse_flat(json);
  const auto get = [&fields](const std::string &key) {
    const auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
  };

  double confidence = 0.0;
  if (const std::string raw = get("confidence"); !raw.empty()) {
    char *end = nullptr;
    const double parsed = std::strtod(raw.c_str(), &end);
    if (end != nullptr && *end == '\0') {
      confidence = std::clamp(parsed, 0.0, 1.0);
    }
  }

  const auto kind = verdict_kind_from_string(get("verdict"));
  if (!kind.ok()) {
    return Verdict::proceed("unknown judge verdict: " + get("verdict"));
  }
  switch (kind.value()) {
  case VerdictKind::Accept:
    return Verdict::accept(confidence, get("reason"));
  case VerdictKind::Retry: {
    std::string hint = get("hint");
    return Verdict::retry(get("reason"), hint.empty() ? kDefaultHint : std::move(hint), confidence);
  }
  case VerdictKind::Escalate:
    return Verdict::escalate(get("reason"));
  case VerdictKind::Continue:
    break;
  }
  return Verdict::proceed(get("reason"));
}

std::string build_judge_prompt(const Goal &goal, const std::string &conversation) {
  std::ostringstream out;
  out << "You are a judge evaluating whether an AI agent achieved its goal.\n\n"
      << "Goal: " << goal.description << "\n\nSuccess criteria:\n";
  for (const auto &criterion : goal.criteria) {
    out << "- " << (criterion.description.empty() ? criterion.id : criterion.description)
        << " (weight: " << criterion.weight << ")";
    if (const auto *judge = std::get_if<LlmJudge>(&criterion.check);
        judge != nullptr && !judge->prompt.empty()) {
      out << ": " << judge->prompt;
    }
    out << "\n";
  }
  if (!goal.constraints.empty()) {
    out << "\nConstraints:\n";
    for (const auto &constraint : goal.constraints) {
      out << "- [" << (constraint.kind == ConstraintKind::Hard ? "hard" : "soft") << " "
          << constraint_category_to_string(constraint.category) << "] "
          << constraint.description << "\n";
    }
  }
  out << "\nSuccess threshold: " << percent(goal.success_threshold) << "%\n\n"
      << "Conversation:\n"
      << conversation << "\n\n"
      << "Evaluate the agent's output against the goal and criteria. Respond with ONLY valid "
         "JSON:\n"
      << "{\n"
      << "  \"verdict\": \"accept\" | \"retry\" | \"escalate\" | \"continue\",\n"
      << "  \"confidence\": 0.0-1.0,\n"
      << "  \"reason\": \"brief explanation\",\n"
      << "  \"hint\": \"actionable suggestion for retry (only if verdict is retry)\"\n"
      << "}";
  return out.str();
}

ModelJudge::ModelJudge(std::shared_ptr<providers::IModelClient> client,
                       providers::GenerationOptions options)
    : client_(std::move(client)), options_(std::move(options)) {}

common::Result<Verdict> ModelJudge::judge(const Goal &goal, const std::string &conversation,
                                          const common::CancellationToken &cancel) const {
  if (client_ == nullptr) {
    return common::Result<Verdict>::failure("judge model unavailable");
  }
  providers::ModelRequest request;
  request.options = options_;
  request.messages.push_back(providers::ChatMessage::user(build_judge_prompt(goal, conversation)));

  auto reply = providers::complete_text(*client_, request, cancel);
  if (!reply.ok()) {
    return common::Result<Verdict>::failure(reply.error_kind(),
                                            "judge call failed: " + reply.error());
  }
  return common::Result<Verdict>::success(parse_judge_reply(reply.value()));
}

} // namespace warden::goal
