#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "warden/agent/tool_executor.hpp"
#include "warden/sandbox/process.hpp"
#include "warden/sandbox/sandbox.hpp"
#include "warden/tools/builtin/file_read.hpp"
#include "warden/tools/builtin/file_write.hpp"
#include "warden/tools/builtin/shell.hpp"
#include "warden/tools/tool_registry.hpp"

#include <algorithm>
#include <atomic>
#include <thread>

namespace {

namespace agent = warden::agent;
namespace common = warden::common;
namespace security = warden::security;
namespace tools = warden::tools;
namespace wt = warden::testing;

using ToolResultOr = common::Result<tools::ToolResult>;

ToolResultOr ok_output(const std::string &output) {
  tools::ToolResult result;
  result.output = output;
  return ToolResultOr::success(std::move(result));
}

tools::ToolContext workspace_context(const std::filesystem::path &workspace) {
  return tools::ToolContext{.workspace_path = workspace,
                            .session_id = "ses-test",
                            .call_id = "call-1",
                            .cancel = std::make_shared<common::CancellationToken>()};
}

struct ExecutorHarness {
  std::shared_ptr<tools::ToolRegistry> registry = std::make_shared<tools::ToolRegistry>();
  std::shared_ptr<warden::events::EventBus> bus = std::make_shared<warden::events::EventBus>();
  std::shared_ptr<security::ApprovalBroker> broker =
      std::make_shared<security::ApprovalBroker>(bus);
  std::shared_ptr<common::CancellationToken> cancel =
      std::make_shared<common::CancellationToken>();
  security::SecurityPolicy policy = [] {
    security::SecurityPolicy p;
    p.deny_above = security::SecurityTier::T3;
    return p;
  }();

  [[nodiscard]] agent::ToolExecutor executor(bool with_broker = true) const {
    return agent::ToolExecutor(
        agent::ToolExecutor::Dependencies{.registry = registry,
                                          .gate = std::make_shared<security::SecurityGate>(registry),
                                          .broker = with_broker ? broker : nullptr,
                                          .bus = bus},
        common::RetryPolicy{.max_retries = 2, .backoff_ms = 1, .max_backoff_ms = 5});
  }

  [[nodiscard]] agent::ExecutionContext context() const {
    return agent::ExecutionContext{.session_id = "ses-exec", .turn = 1, .cancel = cancel};
  }
};

/// Resolves the first pending approval once it shows up.
std::thread answer_first_approval(const std::shared_ptr<security::ApprovalBroker> &broker,
                                  security::ApprovalResolution resolution) {
  return std::thread([broker, resolution] {
    if (wt::wait_until([&broker] { return !broker->pending().empty(); })) {
      (void)broker->resolve(broker->pending().front().id, resolution);
    }
  });
}

} // namespace

void register_tools_tests(std::vector<warden::tests::TestCase> &tests) {
  using warden::tests::require;

  tests.push_back({"registry_lookup_is_case_insensitive_and_ordered", [] {
                     tools::ToolRegistry registry;
                     std::vector<std::string> changes;
                     registry.add_listener([&changes](tools::RegistryChange change,
                                                      const std::string &name) {
                       changes.push_back(
                           (change == tools::RegistryChange::Registered ? "+" : "-") + name);
                     });

                     registry.register_tool(wt::echo_tool("Echo"));
                     registry.register_tool(wt::echo_tool("grep", {.tier = security::SecurityTier::T1}));
                     registry.register_tool(wt::echo_tool("echo", {.tier = security::SecurityTier::T2}));

                     require(registry.size() == 2, "re-registration replaces");
                     require(registry.get_tool("ECHO") != nullptr, "case-insensitive lookup");
                     require(registry.declared_tier("echo") == security::SecurityTier::T2,
                             "replacement wins");
                     const auto specs = registry.all_specs();
                     require(specs.size() == 2 && specs[0].name == "echo" && specs[1].name == "grep",
                             "registration order kept");
                     require(!registry.schema("missing").has_value(), "no schema for unknown");

                     require(registry.unregister_tool("grep"), "unregistered");
                     require(!registry.unregister_tool("grep"), "already gone");
                     require(changes == std::vector<std::string>{"+echo", "+grep", "+echo", "-grep"},
                             "listener saw every change");
                   }});

  tests.push_back({"default_registry_holds_builtin_tools", [] {
                     const auto registry = tools::ToolRegistry::create_default({}, 1000);
                     require(registry->size() == 3, "three tools");
                     require(registry->declared_tier("file_read") == security::SecurityTier::T0,
                             "file_read is T0");
                     require(registry->declared_tier("file_write") == security::SecurityTier::T2,
                             "file_write is T2");
                     require(registry->declared_tier("shell") == security::SecurityTier::T3,
                             "shell is T3");
                     require(registry->get_tool("shell")->timeout_ms() == 1000, "shell timeout");
                     require(!registry->get_tool("file_write")->parallel_safe(),
                             "writes are serialized");
                   }});

  tests.push_back({"validate_arguments_enforces_schema", [] {
                     const std::string schema =
                         R"({"type":"object","required":["path"],"properties":{"path":{"type":"string"},"count":{"type":"integer"}},"additionalProperties":false})";
                     require(tools::validate_arguments(schema, R"({"path":"a","count":2})").ok(),
                             "valid arguments");

                     const auto missing = tools::validate_arguments(schema, R"({"count":2})");
                     require(!missing.ok() && missing.error() == "missing required argument: path",
                             missing.error());
                     require(missing.error_kind() == common::ErrorKind::Schema, "schema kind");

                     const auto extra = tools::validate_arguments(schema, R"({"path":"a","x":1})");
                     require(extra.error() == "unexpected argument: x", extra.error());

                     const auto fractional =
                         tools::validate_arguments(schema, R"({"path":"a","count":2.5})");
                     require(fractional.error() == "argument 'count' must be integer, got number",
                             fractional.error());

                     const auto duplicate =
                         tools::validate_arguments(schema, R"({"path":"a","path":"b"})");
                     require(duplicate.error() == "duplicate argument: path", duplicate.error());

                     require(!tools::validate_arguments(schema, "[1]").ok(), "array rejected");
                     require(!tools::validate_arguments(schema, "{").ok(), "truncated rejected");
                   }});

  tests.push_back({"resolve_in_workspace_rejects_escapes", [] {
                     wt::TempWorkspace workspace;
                     auto inside = tools::resolve_in_workspace(workspace.path(), "notes/a.txt");
                     require(inside.ok(), inside.error());
                     require(inside.value().filename() == "a.txt", "resolved inside");

                     auto parent = tools::resolve_in_workspace(workspace.path(), "../outside.txt");
                     require(!parent.ok(), "parent escape rejected");
                     require(parent.error_kind() == common::ErrorKind::PolicyViolation,
                             "policy violation");

                     auto absolute = tools::resolve_in_workspace(workspace.path(), "/etc/passwd");
                     require(!absolute.ok(), "absolute path outside rejected");

                     auto sneaky =
                         tools::resolve_in_workspace(workspace.path(), "notes/../../etc/passwd");
                     require(!sneaky.ok(), "normalized escape rejected");

                     auto empty = tools::resolve_in_workspace(workspace.path(), "  ");
                     require(!empty.ok() && empty.error_kind() == common::ErrorKind::ToolExecution,
                             "empty path");
                   }});

  tests.push_back({"file_write_then_read_through_registry", [] {
                     wt::TempWorkspace workspace;
                     const auto registry = tools::ToolRegistry::create_default({});
                     const auto ctx = workspace_context(workspace.path());

                     auto written = registry->invoke(
                         "file_write", R"({"path":"out/report.md","content":"line\nnext"})", ctx);
                     require(written.ok(), written.error());
                     require(written.value().metadata.at("bytes") == "9", "byte count");
                     require(workspace.read_file("out/report.md") == "line\nnext", "on disk");

                     auto read = registry->invoke("file_read", R"({"path":"out/report.md"})", ctx);
                     require(read.ok(), read.error());
                     require(read.value().output == "line\nnext", "content read back");

                     auto escape =
                         registry->invoke("file_write", R"({"path":"../x","content":"y"})", ctx);
                     require(!escape.ok() &&
                                 escape.error_kind() == common::ErrorKind::PolicyViolation,
                             "write outside workspace rejected");

                     auto bad_args = registry->invoke("file_read", R"({"file":"x"})", ctx);
                     require(!bad_args.ok() && bad_args.error_kind() == common::ErrorKind::Schema,
                             "schema checked before execute");
                   }});

  tests.push_back({"file_read_refuses_binary_and_truncates_large_files", [] {
                     wt::TempWorkspace workspace;
                     workspace.create_file("blob.bin", std::string("ab\0cd", 5));
                     workspace.create_file("big.txt", std::string(70 * 1024, 'x'));
                     tools::FileReadTool tool;
                     const auto ctx = workspace_context(workspace.path());

                     auto binary = tool.execute({{"path", "blob.bin"}}, ctx);
                     require(!binary.ok(), "binary rejected");
                     require(binary.error() == "Binary file read is not allowed", binary.error());

                     auto big = tool.execute({{"path", "big.txt"}}, ctx);
                     require(big.ok(), big.error());
                     require(big.value().truncated, "truncated flag");
                     require(big.value().output.size() == 64 * 1024, "capped at 64 KiB");

                     auto missing = tool.execute({{"path", "nope.txt"}}, ctx);
                     require(!missing.ok(), "missing file fails");
                   }});

  tests.push_back({"shell_runs_commands_in_workspace", [] {
                     wt::TempWorkspace workspace;
                     workspace.create_file("marker.txt", "here");
                     tools::ShellTool shell({}, 5000);
                     const auto ctx = workspace_context(workspace.path());

                     auto listed = shell.execute({{"command", "cat marker.txt"}}, ctx);
                     require(listed.ok(), listed.error());
                     require(listed.value().success, "exit 0 succeeds");
                     require(listed.value().output == "here", listed.value().output);
                     require(listed.value().metadata.at("exit_code") == "0", "exit code");

                     auto failing = shell.execute({{"command", "echo oops >&2; exit 3"}}, ctx);
                     require(failing.ok(), failing.error());
                     require(!failing.value().success, "non-zero exit fails");
                     require(failing.value().output.find("oops") != std::string::npos,
                             "stderr merged");
                     require(failing.value().metadata.at("exit_code") == "3", "exit code 3");

                     auto missing = shell.execute({}, ctx);
                     require(!missing.ok() &&
                                 missing.error_kind() == common::ErrorKind::ToolExecution,
                             "command required");
                   }});

  tests.push_back({"shell_timeout_is_transient", [] {
                     wt::TempWorkspace workspace;
                     tools::ShellTool shell({}, 200);
                     const auto started = std::chrono::steady_clock::now();
                     auto slow = shell.execute({{"command", "sleep 5"}},
                                               workspace_context(workspace.path()));
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(!slow.ok(), "timed out");
                     require(slow.error_kind() == common::ErrorKind::TransientInfra, "transient");
                     require(slow.error() == "command timed out after 200ms", slow.error());
                     require(elapsed < std::chrono::seconds(3), "process group killed promptly");
                   }});

  tests.push_back({"shell_stops_when_cancelled", [] {
                     wt::TempWorkspace workspace;
                     tools::ShellTool shell({}, 10'000);
                     auto ctx = workspace_context(workspace.path());
                     auto token = std::make_shared<common::CancellationToken>();
                     ctx.cancel = token;
                     std::thread canceller([token] {
                       std::this_thread::sleep_for(std::chrono::milliseconds(100));
                       token->cancel();
                     });
                     auto result = shell.execute({{"command", "sleep 5"}}, ctx);
                     canceller.join();
                     require(!result.ok() && result.error_kind() == common::ErrorKind::Cancelled,
                             "cancelled");
                   }});

  tests.push_back({"concurrent_processes_do_not_inherit_each_others_pipes", [] {
                     warden::sandbox::ProcessRequest long_running;
                     long_running.argv = {"sh", "-c", "readlink /proc/$$/fd/1; sleep 2"};
                     long_running.timeout = std::chrono::milliseconds(10'000);
                     common::Result<warden::sandbox::ProcessResult> held =
                         common::Result<warden::sandbox::ProcessResult>::failure("not run");
                     std::thread background([&] { held = warden::sandbox::run_process(long_running); });
                     std::this_thread::sleep_for(std::chrono::milliseconds(300));

                     std::vector<std::thread> workers;
                     std::vector<std::string> outputs(6);
                     for (std::size_t i = 0; i < outputs.size(); ++i) {
                       workers.emplace_back([&outputs, i] {
                         warden::sandbox::ProcessRequest echo;
                         echo.argv = {"sh", "-c", "echo worker-" + std::to_string(i)};
                         echo.timeout = std::chrono::milliseconds(10'000);
                         auto ran = warden::sandbox::run_process(echo);
                         outputs[i] = ran.ok() ? ran.value().output : ran.error();
                       });
                     }
                     warden::sandbox::ProcessRequest listing;
                     listing.argv = {"sh", "-c",
                                     "for fd in /proc/$$/fd/*; do readlink \"$fd\"; done 2>/dev/null"};
                     listing.timeout = std::chrono::milliseconds(10'000);
                     auto listed = warden::sandbox::run_process(listing);
                     for (auto &worker : workers) {
                       worker.join();
                     }
                     background.join();

                     for (std::size_t i = 0; i < outputs.size(); ++i) {
                       require(outputs[i] == "worker-" + std::to_string(i) + "\n", outputs[i]);
                     }
                     require(held.ok() && held.value().exit_code == 0, "long child finished");
                     const auto &held_output = held.value().output;
                     const std::string held_pipe = held_output.substr(0, held_output.find('\n'));
                     require(held_pipe.starts_with("pipe:"), held_output);
                     require(listed.ok(), listed.ok() ? "" : listed.error());
                     require(listed.value().output.find(held_pipe) == std::string::npos,
                             "other child's pipe leaked: " + listed.value().output);
                   }});

  tests.push_back({"docker_arguments_apply_sandbox_limits", [] {
                     warden::sandbox::SandboxConfig config;
                     config.enabled = true;
                     const auto args = warden::sandbox::build_docker_run_args(
                         config, "warden-sbx-x", "/work/repo", "make test");
                     const auto has = [&args](const std::string &a, const std::string &b) {
                       for (std::size_t i = 0; i + 1 < args.size(); ++i) {
                         if (args[i] == a && args[i + 1] == b) {
                           return true;
                         }
                       }
                       return false;
                     };
                     require(args[0] == "run" && args[1] == "--rm", "throwaway container");
                     require(has("--network", "none"), "network disabled");
                     require(has("--cap-drop", "ALL"), "capabilities dropped");
                     require(has("--memory", "512m"), "memory limit");
                     require(has("--pids-limit", "256"), "pids limit");
                     require(has("-v", "/work/repo:/workspace"), "workspace mounted");
                     require(std::find(args.begin(), args.end(), "--read-only") != args.end(),
                             "read-only root");
                     require(args.back() == "make test" && args[args.size() - 2] == "-c",
                             "command passed to sh -c");

                     const auto name =
                         warden::sandbox::container_name_for(config, "ses-AB_1", "call.9");
                     require(name.starts_with("warden-sbx-ses-ab-1-call-9-"), name);
                   }});

  tests.push_back({"executor_orders_results_by_call_id_and_honours_dependencies", [] {
                     ExecutorHarness h;
                     std::atomic<bool> first_done{false};
                     h.registry->register_tool(std::make_shared<wt::FakeTool>(
                         "slow", [&first_done](const tools::ToolArgs &, const tools::ToolContext &) {
                           std::this_thread::sleep_for(std::chrono::milliseconds(50));
                           first_done = true;
                           return ok_output("slow done");
                         }));
                     h.registry->register_tool(std::make_shared<wt::FakeTool>(
                         "after", [&first_done](const tools::ToolArgs &, const tools::ToolContext &) {
                           return ok_output(first_done ? "saw slow" : "ran early");
                         }));
                     h.registry->register_tool(wt::echo_tool());

                     const auto outcomes = h.executor().execute(
                         {wt::make_call("call_c", "slow"),
                          wt::make_call("call_b", "after", "{}", {"call_c"}),
                          wt::make_call("call_a", "echo", R"({"value":"hi"})")},
                         h.policy, h.context());
                     require(outcomes.size() == 3, "one outcome per call");
                     require(outcomes[0].call_id == "call_a" && outcomes[1].call_id == "call_b" &&
                                 outcomes[2].call_id == "call_c",
                             "sorted by call id, not by proposal or completion");
                     require(outcomes[0].output == "hi" && outcomes[0].attempts == 1, "echo");
                     require(outcomes[1].output == "saw slow", "dependency waited");
                     require(outcomes[2].output == "slow done", "slow finished last");
                   }});

  tests.push_back({"executor_serializes_tools_that_are_not_parallel_safe", [] {
                     ExecutorHarness h;
                     std::atomic<int> active{0};
                     std::atomic<int> peak{0};
                     const auto handler = [&active, &peak](const tools::ToolArgs &,
                                                           const tools::ToolContext &) {
                       const int now = ++active;
                       int seen = peak.load();
                       while (now > seen && !peak.compare_exchange_weak(seen, now)) {
                       }
                       std::this_thread::sleep_for(std::chrono::milliseconds(30));
                       --active;
                       return ok_output("ok");
                     };
                     h.registry->register_tool(
                         std::make_shared<wt::FakeTool>("writer", handler,
                                                        wt::FakeToolOptions{.parallel_safe = false}));

                     const auto outcomes = h.executor().execute(
                         {wt::make_call("1", "writer"), wt::make_call("2", "writer"),
                          wt::make_call("3", "writer")},
                         h.policy, h.context());
                     require(outcomes.size() == 3, "three outcomes");
                     for (const auto &outcome : outcomes) {
                       require(outcome.success, outcome.output);
                     }
                     require(peak == 1, "never more than one writer at a time");
                   }});

  tests.push_back({"executor_denied_call_never_runs_and_siblings_continue", [] {
                     ExecutorHarness h;
                     auto echo = wt::echo_tool();
                     h.registry->register_tool(echo);
                     auto events = h.bus->subscribe();

                     const auto outcomes = h.executor().execute(
                         {wt::make_call("bad", "echo", R"({"value":"rm -rf /"})"),
                          wt::make_call("good", "echo", R"({"value":"fine"})"),
                          wt::make_call("missing", "teleport")},
                         h.policy, h.context());

                     require(!outcomes[0].success, "dangerous call denied");
                     require(outcomes[0].error_kind == common::ErrorKind::PolicyViolation,
                             "policy violation");
                     require(outcomes[0].output.starts_with("Denied: matched dangerous pattern"),
                             outcomes[0].output);
                     require(outcomes[0].attempts == 0, "never attempted");
                     require(outcomes[1].success && outcomes[1].output == "fine", "sibling ran");
                     require(outcomes[2].error_kind == common::ErrorKind::Schema,
                             "unknown tool is a schema failure");
                     require(echo->invocations() == 1, "only the safe call executed");

                     const auto published = wt::drain(*events);
                     const auto decided =
                         wt::payloads_of<warden::events::ToolCallDecided>(published);
                     require(decided.size() == 3, "every call decided");
                     require(decided[0].call_id == "bad" && decided[2].call_id == "missing",
                             "decisions in proposal order");
                     require(wt::payloads_of<warden::events::ToolStarted>(published).size() == 1,
                             "one start");
                   }});

  tests.push_back({"executor_retries_tool_failures_up_to_tool_limit", [] {
                     ExecutorHarness h;
                     std::atomic<int> calls{0};
                     h.registry->register_tool(std::make_shared<wt::FakeTool>(
                         "flaky",
                         [&calls](const tools::ToolArgs &, const tools::ToolContext &) {
                           if (++calls < 3) {
                             return ToolResultOr::failure(common::ErrorKind::ToolExecution,
                                                          "not yet");
                           }
                           return ok_output("third time");
                         },
                         wt::FakeToolOptions{.max_retries = 2}));
                     h.registry->register_tool(std::make_shared<wt::FakeTool>(
                         "stubborn",
                         [](const tools::ToolArgs &, const tools::ToolContext &) {
                           tools::ToolResult result;
                           result.success = false;
                           result.output = "exit 1";
                           return ToolResultOr::success(std::move(result));
                         }));

                     const auto outcomes = h.executor().execute(
                         {wt::make_call("f", "flaky"), wt::make_call("s", "stubborn")}, h.policy,
                         h.context());
                     require(outcomes[0].success && outcomes[0].attempts == 3, "retried twice");
                     require(outcomes[0].output == "third time", "final output");
                     require(!outcomes[1].success && outcomes[1].attempts == 1,
                             "no retries without a tool budget");
                     require(outcomes[1].error_kind == common::ErrorKind::ToolExecution,
                             "unsuccessful result is a tool failure");
                     require(outcomes[1].output == "exit 1", "tool output kept");
                   }});

  tests.push_back({"executor_retries_transient_failures_then_gives_up", [] {
                     ExecutorHarness h;
                     auto tool = std::make_shared<wt::FakeTool>(
                         "network", [](const tools::ToolArgs &, const tools::ToolContext &) {
                           return ToolResultOr::failure(common::ErrorKind::TransientInfra, "503");
                         });
                     h.registry->register_tool(tool);
                     const auto outcomes =
                         h.executor().execute({wt::make_call("n", "network")}, h.policy, h.context());
                     require(outcomes[0].error_kind == common::ErrorKind::TransientInfra,
                             "transient");
                     require(outcomes[0].attempts == 3, "initial attempt plus two retries");
                     require(tool->invocations() == 3, "three invocations");
                   }});

  tests.push_back({"executor_times_out_slow_tools", [] {
                     ExecutorHarness h;
                     h.registry->register_tool(std::make_shared<wt::FakeTool>(
                         "hang",
                         [](const tools::ToolArgs &, const tools::ToolContext &ctx) {
                           while (!ctx.cancelled()) {
                             std::this_thread::sleep_for(std::chrono::milliseconds(5));
                           }
                           return ToolResultOr::failure(common::ErrorKind::ToolExecution,
                                                        "interrupted");
                         },
                         wt::FakeToolOptions{.timeout_ms = 50}));
                     const auto outcomes =
                         h.executor().execute({wt::make_call("h", "hang")}, h.policy, h.context());
                     require(outcomes[0].error_kind == common::ErrorKind::TransientInfra,
                             "timeout is transient");
                     require(outcomes[0].output == "hang timed out after 50ms", outcomes[0].output);
                     require(!h.cancel->is_cancelled(), "run token untouched");
                   }});

  tests.push_back({"executor_waits_for_approval", [] {
                     ExecutorHarness h;
                     h.registry->register_tool(
                         wt::echo_tool("deploy", {.tier = security::SecurityTier::T3}));
                     auto approver =
                         answer_first_approval(h.broker, security::ApprovalResolution::Approve);
                     const auto approved = h.executor().execute(
                         {wt::make_call("d1", "deploy", R"({"value":"v2"})")}, h.policy, h.context());
                     approver.join();
                     require(approved[0].success && approved[0].output == "v2", "ran after approval");
                     require(approved[0].decision == security::GateOutcome::NeedsApproval,
                             "decision recorded");

                     auto denier = answer_first_approval(h.broker, security::ApprovalResolution::Deny);
                     const auto denied = h.executor().execute(
                         {wt::make_call("d2", "deploy")}, h.policy, h.context());
                     denier.join();
                     require(!denied[0].success, "denied");
                     require(denied[0].error_kind == common::ErrorKind::PolicyViolation, "policy");
                     require(denied[0].output == "Approval denied for deploy", denied[0].output);

                     const auto no_broker = h.executor(false).execute(
                         {wt::make_call("d3", "deploy")}, h.policy, h.context());
                     require(no_broker[0].error_kind == common::ErrorKind::PolicyViolation,
                             "no approver means no execution");
                   }});

  tests.push_back({"executor_approval_timeout_and_cancel", [] {
                     ExecutorHarness h;
                     h.registry->register_tool(
                         wt::echo_tool("deploy", {.tier = security::SecurityTier::T3}));
                     h.policy.approval_timeout_secs = 0;
                     const auto timed_out = h.executor().execute(
                         {wt::make_call("d1", "deploy")}, h.policy, h.context());
                     require(timed_out[0].output == "Approval timed out for deploy",
                             timed_out[0].output);

                     h.policy.approval_timeout_secs = 30;
                     std::thread canceller([cancel = h.cancel, broker = h.broker] {
                       (void)wt::wait_until([&broker] { return !broker->pending().empty(); });
                       cancel->cancel();
                     });
                     const auto cancelled = h.executor().execute(
                         {wt::make_call("d2", "deploy")}, h.policy, h.context());
                     canceller.join();
                     require(cancelled[0].error_kind == common::ErrorKind::Cancelled,
                             "cancel while waiting");
                   }});
}
