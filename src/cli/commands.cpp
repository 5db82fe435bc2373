#include "warden/cli/commands.hpp"

#include "warden/cli/console_approver.hpp"
#include "warden/cli/options.hpp"
#include "warden/common/fs.hpp"
#include "warden/config/config.hpp"
#include "warden/providers/http.hpp"
#include "warden/providers/openai_compatible.hpp"
#include "warden/runtime/app.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <unistd.h>

namespace warden::cli {

namespace {

std::atomic<bool> g_interrupted{false};

void on_interrupt(int) { g_interrupted = true; }

std::string version_string() {
#ifdef WARDEN_VERSION
  std::string version = WARDEN_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef WARDEN_GIT_COMMIT
  const std::string commit = WARDEN_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "warden " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

common::Result<std::shared_ptr<providers::IModelClient>>
create_model_client(const config::Config &config) {
  using R = common::Result<std::shared_ptr<providers::IModelClient>>;
  if (config.model.provider != "openai-compatible") {
    return R::failure(common::ErrorKind::Schema,
                      "unsupported model provider: " + config.model.provider);
  }
  if (!config.model.api_key.has_value() || common::trim(*config.model.api_key).empty()) {
    return R::failure(common::ErrorKind::Schema,
                      "no API key configured (set model.api_key or WARDEN_API_KEY)");
  }
  providers::OpenAiConfig openai{
      .base_url = config.model.base_url,
      .api_key = *config.model.api_key,
      .timeout_ms = config.model.timeout_secs * 1000,
  };
  return R::success(std::make_shared<providers::OpenAiCompatibleClient>(
      std::move(openai), std::make_shared<providers::CurlHttpClient>()));
}

bool is_sub_agent_session(const std::string &session_id) {
  return session_id.find(".sub-") != std::string::npos;
}

/// Streams model text and tool activity of a run to the terminal.
class ConsoleReporter {
public:
  explicit ConsoleReporter(const std::shared_ptr<events::EventBus> &bus) {
    subscription_ = bus->subscribe(events::EventFilter{
        .session_id = std::nullopt,
        .kinds = {events::EventKind::TextDelta, events::EventKind::ToolStarted,
                  events::EventKind::ToolFinished, events::EventKind::WatchdogHint,
                  events::EventKind::VerdictIssued},
    });
    thread_ = std::thread([this]() { run(); });
  }

  ~ConsoleReporter() {
    subscription_->close();
    if (thread_.joinable()) {
      thread_.join();
    }
  }

  ConsoleReporter(const ConsoleReporter &) = delete;
  ConsoleReporter &operator=(const ConsoleReporter &) = delete;

private:
  void run() {
    while (true) {
      auto envelope = subscription_->next(std::chrono::milliseconds(100));
      if (!envelope.has_value()) {
        if (subscription_->closed()) {
          return;
        }
        continue;
      }
      print(envelope->event);
    }
  }

  static void print(const events::Event &event) {
    constexpr const char *DIM = "\033[2m";
    constexpr const char *RESET = "\033[0m";
    const bool sub_agent = is_sub_agent_session(event.session_id);
    if (const auto *delta = std::get_if<events::TextDelta>(&event.payload)) {
      if (!sub_agent) {
        std::cout << delta->text << std::flush;
      }
    } else if (const auto *started = std::get_if<events::ToolStarted>(&event.payload)) {
      std::cout << "\n" << DIM << (sub_agent ? "  [sub] " : "") << "-> " << started->tool;
      if (started->attempt > 1) {
        std::cout << " (attempt " << started->attempt << ")";
      }
      std::cout << RESET << "\n" << std::flush;
    } else if (const auto *finished = std::get_if<events::ToolFinished>(&event.payload)) {
      std::cout << DIM << (sub_agent ? "  [sub] " : "") << "<- " << finished->tool << " "
                << (finished->success ? std::string_view("ok")
                                    : common::error_kind_to_string(finished->error_kind))
                << " " << finished->duration_ms << "ms" << RESET << "\n"
                << std::flush;
    } else if (const auto *hint = std::get_if<events::WatchdogHint>(&event.payload)) {
      std::cout << "\n" << DIM << "[watchdog " << hint->kind << "] " << hint->message << RESET
                << "\n";
    } else if (const auto *verdict = std::get_if<events::VerdictIssued>(&event.payload)) {
      if (!sub_agent) {
        std::cout << "\n" << DIM << "[verdict] " << goal::verdict_kind_to_string(verdict->verdict.kind)
                  << " score " << static_cast<int>(verdict->evaluation.score * 100.0) << "%";
        if (!verdict->verdict.reason.empty()) {
          std::cout << ": " << verdict->verdict.reason;
        }
        std::cout << RESET << "\n";
      }
    }
  }

  events::SubscriptionPtr subscription_;
  std::thread thread_;
};

/// Cancels the loop when SIGINT arrives. The handler only sets a flag; the watcher
/// thread turns it into AgentLoop::cancel().
class InterruptWatcher {
public:
  explicit InterruptWatcher(agent::AgentLoop &loop) : loop_(loop) {
    g_interrupted = false;
    previous_ = std::signal(SIGINT, on_interrupt);
    thread_ = std::thread([this]() {
      while (running_) {
        if (g_interrupted.exchange(false)) {
          std::cerr << "\ninterrupted, cancelling run...\n";
          loop_.cancel();
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
      }
    });
  }

  ~InterruptWatcher() {
    running_ = false;
    if (thread_.joinable()) {
      thread_.join();
    }
    std::signal(SIGINT, previous_);
  }

  InterruptWatcher(const InterruptWatcher &) = delete;
  InterruptWatcher &operator=(const InterruptWatcher &) = delete;

private:
  agent::AgentLoop &loop_;
  std::atomic<bool> running_{true};
  void (*previous_)(int) = SIG_DFL;
  std::thread thread_;
};

int report_outcome(const common::Result<agent::RunOutcome> &outcome) {
  if (!outcome.ok()) {
    std::cerr << outcome.error() << "\n";
    return 1;
  }
  const auto &run = outcome.value();
  std::cout << "\n";
  if (run.completed()) {
    if (run.session.escalated) {
      std::cerr << "escalated: " << run.reason << "\n";
    }
    std::cerr << "session " << run.session.id << " completed after " << run.session.turns.size()
              << " turn(s)\n";
    return 0;
  }
  std::cerr << "session " << run.session.id << " "
            << agent::session_status_to_string(run.session.status) << " ["
            << common::error_kind_to_string(run.error_kind) << "]: " << run.reason << "\n";
  return run.session.status == agent::SessionStatus::Cancelled ? 130 : 1;
}

template <typename Fn> int with_runtime(runtime::RuntimeContext &context, Fn &&body) {
  auto model = create_model_client(context.config());
  if (!model.ok()) {
    std::cerr << model.error() << "\n";
    return 1;
  }
  auto runtime = context.create_runtime(model.value());
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto loop = runtime.value().factory->create();
  ConsoleApprover approver(runtime.value().broker, runtime.value().bus, std::cin, std::cout,
                           STDIN_FILENO);
  approver.start();
  int code = 0;
  {
    ConsoleReporter reporter(runtime.value().bus);
    InterruptWatcher watcher(*loop);
    code = report_outcome(body(*loop));
  }
  approver.stop();
  return code;
}

int run_run(std::vector<std::string> args) {
  auto options = parse_run_options(std::move(args));
  if (!options.ok()) {
    std::cerr << options.error() << "\n";
    std::cerr << "usage: warden run [--session ID] [--goal TEXT] [--expect TEXT]... "
                 "[--threshold N] [--max-turns N] <prompt>\n";
    return 1;
  }
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  if (options.value().max_turns.has_value()) {
    context.value().mutable_config().agent.max_turns = *options.value().max_turns;
  }
  const agent::RunRequest request{
      .prompt = options.value().prompt,
      .session_id = options.value().session_id,
      .goal = build_goal(options.value()),
  };
  return with_runtime(context.value(),
                      [&request](agent::AgentLoop &loop) { return loop.run(request); });
}

int run_resume(std::vector<std::string> args) {
  if (args.size() != 1) {
    std::cerr << "usage: warden resume <session-id>\n";
    return 1;
  }
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  if (!context.value().config().checkpoint.enabled) {
    std::cerr << "checkpoints are disabled; nothing to resume\n";
    return 1;
  }
  const std::string session_id = args[0];
  return with_runtime(context.value(),
                      [&session_id](agent::AgentLoop &loop) { return loop.resume(session_id); });
}

int run_sessions(std::vector<std::string> args) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    std::cerr << context.error() << "\n";
    return 1;
  }
  auto store = context.value().open_checkpoints();
  if (!store.ok()) {
    std::cerr << store.error() << "\n";
    return 1;
  }
  if (store.value() == nullptr) {
    std::cerr << "checkpoints are disabled\n";
    return 1;
  }

  if (args.empty() || args[0] == "list") {
    auto sessions = store.value()->list_sessions();
    if (!sessions.ok()) {
      std::cerr << sessions.error() << "\n";
      return 1;
    }
    if (sessions.value().empty()) {
      std::cout << "No checkpointed sessions.\n";
      return 0;
    }
    for (const auto &summary : sessions.value()) {
      std::cout << summary.session_id << "  "
                << checkpoint::checkpoint_status_to_string(summary.status) << "  turn "
                << summary.turn_index << "  " << summary.updated_at;
      if (!summary.reason.empty()) {
        std::cout << "  " << summary.reason;
      }
      std::cout << "\n";
    }
    return 0;
  }

  if (args[0] == "rm" || args[0] == "remove") {
    if (args.size() < 2) {
      std::cerr << "usage: warden sessions rm <session-id>\n";
      return 1;
    }
    auto removed = store.value()->remove(args[1]);
    if (!removed.ok()) {
      std::cerr << removed.error() << "\n";
      return 1;
    }
    if (!removed.value()) {
      std::cerr << "no checkpoint for session " << args[1] << "\n";
      return 1;
    }
    std::cout << "Removed " << args[1] << "\n";
    return 0;
  }

  std::cerr << "unknown sessions command\n";
  return 1;
}

int run_config(std::vector<std::string> args) {
  if (!args.empty() && args[0] == "path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (args.empty() || args[0] == "show") {
    auto shown = cfg.value();
    if (shown.model.api_key.has_value()) {
      shown.model.api_key = "***";
    }
    std::cout << config::render_config(shown);
    return 0;
  }

  if (args[0] == "check") {
    auto validated = config::validate_config(cfg.value());
    if (!validated.ok()) {
      std::cerr << "invalid: " << validated.error() << "\n";
      return 1;
    }
    for (const auto &warning : validated.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "ok\n";
    return 0;
  }

  if (args[0] == "init") {
    if (config::config_exists()) {
      std::cerr << "config already exists\n";
      return 1;
    }
    auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    auto path_result = config::config_path();
    std::cout << "Wrote " << (path_result.ok() ? path_result.value().string() : "config") << "\n";
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

} // namespace

void print_help() {
  constexpr const char *RESET = "\033[0m";
  constexpr const char *BOLD = "\033[1m";
  constexpr const char *DIM = "\033[2m";
  constexpr const char *CYAN = "\033[36m";
  constexpr const char *GREEN = "\033[32m";

  std::cout << "\n";
  std::cout << BOLD << CYAN << "  warden" << RESET << DIM
            << "  tool-using agent runtime with gated tools and checkpoints" << RESET << "\n";
  std::cout << DIM << "  " << version_string() << RESET << "\n\n";

  std::cout << BOLD << "  USAGE" << RESET << "\n";
  std::cout << DIM << "  $ " << RESET << "warden [--config PATH] <command> [options]\n\n";

  std::cout << BOLD << "  RUNS" << RESET << "\n";
  std::cout << "  " << GREEN << "run" << RESET << " PROMPT" << DIM << "           Run an agent on a prompt" << RESET << "\n";
  std::cout << "    " << DIM << "--session ID  --goal TEXT  --expect TEXT  --threshold N  --max-turns N" << RESET << "\n";
  std::cout << "  " << GREEN << "resume" << RESET << " ID" << DIM << "            Continue a checkpointed session" << RESET << "\n";
  std::cout << "  " << GREEN << "sessions" << RESET << DIM << "             List checkpointed sessions" << RESET << "\n";
  std::cout << "  " << GREEN << "sessions rm" << RESET << " ID" << DIM << "       Delete a checkpoint" << RESET << "\n\n";

  std::cout << BOLD << "  CONFIGURATION" << RESET << "\n";
  std::cout << "  " << GREEN << "config show" << RESET << DIM << "          Display current configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config check" << RESET << DIM << "         Validate configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config init" << RESET << DIM << "          Write a default configuration" << RESET << "\n";
  std::cout << "  " << GREEN << "config path" << RESET << DIM << "          Print the configuration path" << RESET << "\n";
  std::cout << "  " << GREEN << "version" << RESET << DIM << "              Show version" << RESET << "\n\n";
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help();
    return 0;
  }

  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "run") {
    return run_run(std::move(args));
  }
  if (subcommand == "resume") {
    return run_resume(std::move(args));
  }
  if (subcommand == "sessions") {
    return run_sessions(std::move(args));
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace warden::cli
