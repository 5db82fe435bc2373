#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace warden::config {

struct AgentConfig {
  /// Empty keeps the built-in system prompt.
  std::string system_prompt;
  std::size_t max_turns = 20;
  std::uint64_t max_duration_secs = 900;
  /// "fail" or "complete".
  std::string on_limit = "fail";
  /// Empty means the current directory.
  std::string workspace;
  std::size_t spawn_max_turns = 8;
  std::size_t spawn_max_depth = 2;
  /// Estimated tokens; older history is pruned past this. 0 disables pruning.
  std::size_t max_context_tokens = 80'000;
  std::size_t max_tool_output_tokens = 4'000;
  /// Consecutive failures of one tool before a hint is injected. 0 disables it.
  std::size_t reflexion_failure_threshold = 3;
};

struct ModelConfig {
  std::string provider = "openai-compatible";
  std::string model = "gpt-4o-mini";
  std::string base_url = "https://api.openai.com/v1";
  std::optional<std::string> api_key;
  std::uint32_t max_tokens = 0;
  double temperature = 0.2;
  std::string reasoning_effort;
  std::uint64_t timeout_secs = 120;
};

struct ReliabilityConfig {
  std::uint32_t max_retries = 3;
  std::uint64_t backoff_ms = 200;
  std::uint64_t max_backoff_ms = 10'000;
  std::uint32_t turn_retries = 1;
  std::uint32_t tool_max_retries = 2;
};

struct DangerousPatternConfig {
  std::string pattern;
  std::string label;
};

struct SubAgentPolicyConfig {
  bool enabled = true;
  std::string auto_approve_up_to = "t0";
  std::string deny_above = "t2";
};

struct SecurityConfig {
  std::string auto_approve_up_to = "t1";
  /// Empty leaves tier-based denial off.
  std::string deny_above;
  std::uint64_t approval_timeout_secs = 60;
  std::map<std::string, std::string> tool_overrides;
  SubAgentPolicyConfig sub_agent;
  /// Empty keeps the built-in list.
  std::vector<DangerousPatternConfig> dangerous_patterns;
  std::string decision_log_path;
  std::size_t decision_log_capacity = 10'000;
};

struct GuardianSettings {
  bool enabled = true;
  std::uint64_t stall_timeout_secs = 120;
  std::size_t doom_loop_threshold = 5;
  std::uint64_t budget_tokens = 0;
  std::uint32_t budget_warn_pct = 80;
};

struct JudgeSettings {
  bool enabled = true;
  double confidence_floor = 0.6;
  std::uint32_t max_tokens = 1024;
  /// Empty uses model.model.
  std::string model;
  std::string reasoning_effort = "low";
};

struct CheckpointConfig {
  bool enabled = true;
  std::string path = "~/.warden/checkpoints.db";
};

struct SandboxSettings {
  bool enabled = false;
  std::string image = "warden-sandbox:bookworm-slim";
  bool network_enabled = false;
  bool read_only_root = true;
  std::string memory_limit = "512m";
  double cpu_limit = 1.0;
  std::uint32_t pids_limit = 256;
  std::uint64_t timeout_secs = 60;
};

struct ObservabilityConfig {
  /// "log", "none" or a comma separated list.
  std::string backend = "log";
  std::string log_level = "info";
};

struct EventsConfig {
  std::size_t subscriber_capacity = 1024;
  /// Print every event to stderr in the CLI.
  bool trace = false;
};

struct Config {
  AgentConfig agent;
  ModelConfig model;
  ReliabilityConfig reliability;
  SecurityConfig security;
  GuardianSettings guardian;
  JudgeSettings judge;
  CheckpointConfig checkpoint;
  SandboxSettings sandbox;
  ObservabilityConfig observability;
  EventsConfig events;
};

} // namespace warden::config
