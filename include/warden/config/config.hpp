#pragma once

#include "warden/agent/loop.hpp"
#include "warden/common/result.hpp"
#include "warden/config/schema.hpp"
#include "warden/goal/evaluator.hpp"
#include "warden/guardian/watchdog.hpp"
#include "warden/sandbox/sandbox.hpp"
#include "warden/security/policy.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] std::string render_config(const Config &config);

/// Hard errors fail; soft issues come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] common::Result<security::SecurityPolicy> to_security_policy(const Config &config);
[[nodiscard]] guardian::GuardianConfig to_guardian_config(const Config &config);
[[nodiscard]] sandbox::SandboxConfig to_sandbox_config(const Config &config);
[[nodiscard]] goal::JudgeConfig to_judge_config(const Config &config);
[[nodiscard]] agent::LoopOptions to_loop_options(const Config &config);

} // namespace warden::config
