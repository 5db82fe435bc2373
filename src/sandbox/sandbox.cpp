#include "warden/sandbox/sandbox.hpp"

#include "warden/common/crypto.hpp"
#include "warden/common/fs.hpp"

#include <cctype>
#include <sstream>

namespace warden::sandbox {

namespace {

std::string slug(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (const char ch : value) {
    const auto uch = static_cast<unsigned char>(ch);
    out.push_back(std::isalnum(uch) != 0 || ch == '-' ? static_cast<char>(std::tolower(uch)) : '-');
  }
  return out.substr(0, 24);
}

} // namespace

std::vector<std::string> build_docker_run_args(const SandboxConfig &config,
                                               const std::string &container_name,
                                               const std::filesystem::path &workspace,
                                               const std::string &command) {
  std::vector<std::string> args = {"run", "--rm", "--name", container_name};
  args.push_back("--label");
  args.push_back("warden.sandbox=1");

  if (config.read_only_root) {
    args.push_back("--read-only");
  }
  for (const auto &entry : config.tmpfs) {
    if (common::trim(entry).empty()) {
      continue;
    }
    args.push_back("--tmpfs");
    args.push_back(entry);
  }

  args.push_back("--network");
  args.push_back(config.network_enabled ? "bridge" : "none");
  args.push_back("--cap-drop");
  args.push_back("ALL");
  args.push_back("--security-opt");
  args.push_back("no-new-privileges");

  if (config.pids_limit.has_value() && *config.pids_limit > 0) {
    args.push_back("--pids-limit");
    args.push_back(std::to_string(*config.pids_limit));
  }
  if (config.memory_limit.has_value() && !common::trim(*config.memory_limit).empty()) {
    args.push_back("--memory");
    args.push_back(*config.memory_limit);
  }
  if (config.cpu_limit.has_value() && *config.cpu_limit > 0.0) {
    std::ostringstream cpus;
    cpus << *config.cpu_limit;
    args.push_back("--cpus");
    args.push_back(cpus.str());
  }

  if (!workspace.empty()) {
    args.push_back("-v");
    args.push_back(workspace.string() + ":" + config.workdir);
  }
  args.push_back("-w");
  args.push_back(config.workdir);
  args.push_back(config.image);
  args.push_back("/bin/sh");
  args.push_back("-c");
  args.push_back(command);
  return args;
}

std::string container_name_for(const SandboxConfig &config, const std::string &session_id,
                               const std::string &call_id) {
  return config.container_prefix + slug(session_id) + "-" + slug(call_id) + "-" +
         common::random_hex(4);
}

} // namespace warden::sandbox
