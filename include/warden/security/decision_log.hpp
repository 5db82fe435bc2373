#pragma once

#include "warden/common/result.hpp"
#include "warden/security/policy.hpp"

#include <cstddef>
#include <deque>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace warden::security {

struct DecisionRecord {
  std::string timestamp;
  std::string session_id;
  std::size_t turn = 0;
  std::string call_id;
  std::string tool;
  SecurityTier base_tier = SecurityTier::T4;
  SecurityTier effective_tier = SecurityTier::T4;
  GateOutcome outcome = GateOutcome::Deny;
  std::optional<std::string> matched_pattern;
  std::string reason;
  bool sub_agent = false;
};

[[nodiscard]] std::string encode_decision_jsonl(const DecisionRecord &record);
[[nodiscard]] common::Result<DecisionRecord> parse_decision_jsonl(const std::string &line);

/// Audit trail of every gate decision. Keeps the most recent records in memory and,
/// when given a path, appends each record to a JSONL file.
class DecisionLog {
public:
  explicit DecisionLog(std::size_t capacity = 10'000,
                       std::optional<std::filesystem::path> jsonl_path = std::nullopt);

  void record(DecisionRecord record);

  [[nodiscard]] std::vector<DecisionRecord> records() const;
  [[nodiscard]] std::vector<DecisionRecord> records_for(const std::string &session_id) const;
  [[nodiscard]] std::size_t size() const;

  [[nodiscard]] static common::Result<std::vector<DecisionRecord>>
  read_jsonl(const std::filesystem::path &path);

private:
  std::size_t capacity_;
  std::optional<std::filesystem::path> jsonl_path_;
  mutable std::mutex mutex_;
  std::deque<DecisionRecord> records_;
};

} // namespace warden::security
