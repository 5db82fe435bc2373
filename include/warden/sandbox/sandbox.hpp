#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace warden::sandbox {

/// Resource bounds for container-isolated command execution.
struct SandboxConfig {
  bool enabled = false;
  std::string image = "warden-sandbox:bookworm-slim";
  std::string container_prefix = "warden-sbx-";
  std::string workdir = "/workspace";
  bool network_enabled = false;
  bool read_only_root = true;
  std::vector<std::string> tmpfs = {"/tmp"};
  std::optional<std::string> memory_limit = "512m";
  std::optional<double> cpu_limit = 1.0;
  std::optional<std::uint32_t> pids_limit = 256;
};

/// `docker run` arguments (without the leading "docker") for running command inside
/// a throwaway container with the workspace mounted at config.workdir.
[[nodiscard]] std::vector<std::string> build_docker_run_args(const SandboxConfig &config,
                                                             const std::string &container_name,
                                                             const std::filesystem::path &workspace,
                                                             const std::string &command);

/// Container name unique to one tool call.
[[nodiscard]] std::string container_name_for(const SandboxConfig &config,
                                             const std::string &session_id,
                                             const std::string &call_id);

} // namespace warden::sandbox
