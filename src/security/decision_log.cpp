#include "warden/security/decision_log.hpp"

#include "warden/common/json_util.hpp"
#include "warden/common/time.hpp"
#include "warden/observability/global.hpp"

#include <fstream>
#include <sstream>

namespace warden::security {

namespace {

common::Result<GateOutcome> outcome_from_string(const std::string &value) {
  for (const auto outcome : {GateOutcome::Allow, GateOutcome::NeedsApproval, GateOutcome::Deny}) {
    if (gate_outcome_to_string(outcome) == value) {
      return common::Result<GateOutcome>::success(outcome);
    }
  }
  return common::Result<GateOutcome>::failure("unknown gate outcome: " + value);
}

} // namespace

std::string encode_decision_jsonl(const DecisionRecord &record) {
  std::ostringstream out;
  out << "{\"timestamp\":" << common::json_quote(record.timestamp)
      << ",\"session_id\":" << common::json_quote(record.session_id)
      << ",\"turn\":" << record.turn << ",\"call_id\":" << common::json_quote(record.call_id)
      << ",\"tool\":" << common::json_quote(record.tool)
      << ",\"base_tier\":" << common::json_quote(tier_to_string(record.base_tier))
      << ",\"effective_tier\":" << common::json_quote(tier_to_string(record.effective_tier))
      << ",\"outcome\":" << common::json_quote(gate_outcome_to_string(record.outcome));
  if (record.matched_pattern.has_value()) {
    out << ",\"matched_pattern\":" << common::json_quote(*record.matched_pattern);
  }
  out << ",\"reason\":" << common::json_quote(record.reason)
      << ",\"sub_agent\":" << (record.sub_agent ? "true" : "false") << "}";
  return out.str();
}

common::Result<DecisionRecord> parse_decision_jsonl(const std::string &line) {
  const auto fields = common::json_parse_flat(line);
  if (fields.empty()) {
    return common::Result<DecisionRecord>::failure("invalid decision record");
  }
  const auto get = [&fields](const std::string &key) {
    const auto it = fields.find(key);
    return it == fields.end() ? std::string() : it->second;
  };

  DecisionRecord record;
  record.timestamp = get("timestamp");
  record.session_id = get("session_id");
  record.call_id = get("call_id");
  record.tool = get("tool");
  record.reason = get("reason");
  record.sub_agent = get("sub_agent") == "true";
  try {
    record.turn = static_cast<std::size_t>(std::stoull(get("turn")));
  } catch (const std::exception &) {
    return common::Result<DecisionRecord>::failure("invalid turn in decision record");
  }

  auto base = tier_from_string(get("base_tier"));
  auto effective = tier_from_string(get("effective_tier"));
  auto outcome = outcome_from_string(get("outcome"));
  if (!base.ok() || !effective.ok() || !outcome.ok()) {
    return common::Result<DecisionRecord>::failure("invalid tier or outcome in decision record");
  }
  record.base_tier = base.value();
  record.effective_tier = effective.value();
  record.outcome = outcome.value();
  if (fields.contains("matched_pattern")) {
    record.matched_pattern = get("matched_pattern");
  }
  return common::Result<DecisionRecord>::success(std::move(record));
}

DecisionLog::DecisionLog(const std::size_t capacity,
                         std::optional<std::filesystem::path> jsonl_path)
    : capacity_(capacity == 0 ? 1 : capacity), jsonl_path_(std::move(jsonl_path)) {
  if (jsonl_path_.has_value() && jsonl_path_->has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(jsonl_path_->parent_path(), ec);
  }
}

void DecisionLog::record(DecisionRecord record) {
  if (record.timestamp.empty()) {
    record.timestamp = common::now_rfc3339();
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (jsonl_path_.has_value()) {
    std::ofstream out(*jsonl_path_, std::ios::app);
    if (out) {
      out << encode_decision_jsonl(record) << "\n";
    }
    if (!out) {
      observability::record_error("decision_log",
                                  "failed appending to " + jsonl_path_->string());
    }
  }
  records_.push_back(std::move(record));
  while (records_.size() > capacity_) {
    records_.pop_front();
  }
}

std::vector<DecisionRecord> DecisionLog::records() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return {records_.begin(), records_.end()};
}

std::vector<DecisionRecord> DecisionLog::records_for(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DecisionRecord> out;
  for (const auto &record : records_) {
    if (record.session_id == session_id) {
      out.push_back(record);
    }
  }
  return out;
}

std::size_t DecisionLog::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

common::Result<std::vector<DecisionRecord>>
DecisionLog::read_jsonl(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    return common::Result<std::vector<DecisionRecord>>::failure("Unable to open decision log: " +
                                                                path.string());
  }
  std::vector<DecisionRecord> out;
  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    auto parsed = parse_decision_jsonl(line);
    if (parsed.ok()) {
      out.push_back(std::move(parsed.value()));
    }
  }
  return common::Result<std::vector<DecisionRecord>>::success(std::move(out));
}

} // namespace warden::security
