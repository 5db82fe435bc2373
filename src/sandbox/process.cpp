#include "warden/sandbox/process.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

namespace warden::sandbox {

namespace {

void set_non_blocking(const int fd) {
  const int flags = fcntl(fd, F_GETFL, 0);
  if (flags >= 0) {
    (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  }
}

/// Reads whatever is available. Returns false once the write end is closed.
bool read_available(const int fd, ProcessResult &result, const std::size_t limit) {
  std::array<char, 4096> chunk{};
  while (true) {
    const ssize_t bytes = read(fd, chunk.data(), chunk.size());
    if (bytes > 0) {
      const std::size_t remaining = limit > result.output.size() ? limit - result.output.size() : 0;
      const std::size_t to_copy = std::min<std::size_t>(remaining, static_cast<std::size_t>(bytes));
      result.output.append(chunk.data(), to_copy);
      if (to_copy < static_cast<std::size_t>(bytes)) {
        result.truncated = true;
      }
      continue;
    }
    if (bytes == 0) {
      return false;
    }
    if (errno == EINTR) {
      continue;
    }
    return errno == EAGAIN || errno == EWOULDBLOCK;
  }
}

void kill_container(const std::string &name) {
  ProcessRequest kill_request;
  kill_request.argv = {"docker", "kill", name};
  kill_request.timeout = std::chrono::milliseconds(10'000);
  kill_request.max_output_bytes = 4096;
  (void)run_process(kill_request);
}

} // namespace

common::Result<ProcessResult> run_process(const ProcessRequest &request) {
  if (request.argv.empty()) {
    return common::Result<ProcessResult>::failure(common::ErrorKind::ToolExecution,
                                                  "process command is empty");
  }

  // The child may only make async-signal-safe calls, so argv is built before fork.
  std::vector<char *> argv;
  argv.reserve(request.argv.size() + 1);
  for (const auto &arg : request.argv) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);
  const char *working_dir = request.working_dir.empty() ? nullptr : request.working_dir.c_str();

  // Close-on-exec keeps concurrent children from inheriting each other's pipes.
  int pipefd[2] = {-1, -1};
  if (pipe2(pipefd, O_CLOEXEC) != 0) {
    return common::Result<ProcessResult>::failure(common::ErrorKind::TransientInfra,
                                                  "failed to create pipe");
  }

  const pid_t pid = fork();
  if (pid < 0) {
    close(pipefd[0]);
    close(pipefd[1]);
    return common::Result<ProcessResult>::failure(common::ErrorKind::TransientInfra,
                                                  "failed to fork");
  }

  if (pid == 0) {
    (void)setpgid(0, 0);
    close(pipefd[0]);
    (void)dup2(pipefd[1], STDOUT_FILENO);
    (void)dup2(pipefd[1], STDERR_FILENO);
    close(pipefd[1]);

    if (working_dir != nullptr && chdir(working_dir) != 0) {
      _exit(126);
    }
    execvp(argv[0], argv.data());
    _exit(127);
  }

  // Both sides call setpgid so the group exists before any kill below.
  (void)setpgid(pid, pid);
  close(pipefd[1]);
  set_non_blocking(pipefd[0]);

  ProcessResult result;
  int status = 0;
  bool exited = false;
  bool pipe_open = true;
  const auto started = std::chrono::steady_clock::now();

  while (!exited) {
    if (pipe_open) {
      pipe_open = read_available(pipefd[0], result, request.max_output_bytes);
    }

    const pid_t waited = waitpid(pid, &status, WNOHANG);
    if (waited == pid) {
      exited = true;
      break;
    }

    const bool cancelled = request.cancel != nullptr && request.cancel->is_cancelled();
    const bool timed_out = std::chrono::steady_clock::now() - started > request.timeout;
    if (cancelled || timed_out) {
      result.cancelled = cancelled && !timed_out;
      result.timed_out = timed_out;
      (void)kill(-pid, SIGKILL);
      if (request.container_name.has_value()) {
        kill_container(*request.container_name);
      }
      (void)waitpid(pid, &status, 0);
      exited = true;
      break;
    }

    struct pollfd pfd {
      .fd = pipefd[0], .events = POLLIN, .revents = 0,
    };
    (void)poll(&pfd, pipe_open ? 1 : 0, 50);
  }

  if (pipe_open) {
    (void)read_available(pipefd[0], result, request.max_output_bytes);
  }
  close(pipefd[0]);

  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.signaled = true;
    result.exit_code = 128 + WTERMSIG(status);
  }
  return common::Result<ProcessResult>::success(std::move(result));
}

} // namespace warden::sandbox
