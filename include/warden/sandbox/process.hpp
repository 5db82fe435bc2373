#pragma once

#include "warden/common/cancellation.hpp"
#include "warden/common/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace warden::sandbox {

struct ProcessRequest {
  std::vector<std::string> argv;
  std::filesystem::path working_dir;
  std::chrono::milliseconds timeout{60'000};
  std::size_t max_output_bytes = 1024 * 1024;
  std::shared_ptr<const common::CancellationToken> cancel;
  /// Set when argv starts a named container; the container is killed along with the
  /// local process group.
  std::optional<std::string> container_name;
};

struct ProcessResult {
  int exit_code = -1;
  bool signaled = false;
  std::string output;
  bool truncated = false;
  bool timed_out = false;
  bool cancelled = false;
};

/// Runs argv in its own process group with stdout and stderr merged. On timeout or
/// cancellation the whole group gets SIGKILL before the call returns.
[[nodiscard]] common::Result<ProcessResult> run_process(const ProcessRequest &request);

} // namespace warden::sandbox
