#include "warden/runtime/app.hpp"

#include "warden/agent/spawn_tool.hpp"
#include "warden/common/fs.hpp"
#include "warden/config/config.hpp"
#include "warden/goal/judge.hpp"
#include "warden/observability/factory.hpp"
#include "warden/observability/global.hpp"
#include "warden/security/gate.hpp"

namespace warden::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.status());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

common::Result<std::shared_ptr<checkpoint::ICheckpointStore>>
RuntimeContext::open_checkpoints() const {
  using R = common::Result<std::shared_ptr<checkpoint::ICheckpointStore>>;
  if (!config_.checkpoint.enabled) {
    return R::success(nullptr);
  }
  auto store = std::make_shared<checkpoint::SqliteCheckpointStore>(
      common::expand_path(config_.checkpoint.path));
  if (!store->is_open()) {
    return R::failure(common::ErrorKind::TransientInfra,
                      "unable to open checkpoint database: " + store->path().string());
  }
  return R::success(std::move(store));
}

common::Result<AgentRuntime>
RuntimeContext::create_runtime(std::shared_ptr<providers::IModelClient> model) const {
  using R = common::Result<AgentRuntime>;
  observability::set_global_observer(observability::create_observer(config_.observability));

  auto validated = config::validate_config(config_);
  if (!validated.ok()) {
    return R::failure(validated.status());
  }
  auto policy = config::to_security_policy(config_);
  if (!policy.ok()) {
    return R::failure(policy.status());
  }
  auto checkpoints = open_checkpoints();
  if (!checkpoints.ok()) {
    return R::failure(checkpoints.status());
  }

  AgentRuntime runtime;
  runtime.bus = std::make_shared<events::EventBus>(config_.events.subscriber_capacity);
  runtime.broker = std::make_shared<security::ApprovalBroker>(runtime.bus);
  runtime.registry = tools::ToolRegistry::create_default(
      config::to_sandbox_config(config_),
      static_cast<std::uint32_t>(config_.sandbox.timeout_secs * 1000));
  std::optional<std::filesystem::path> decision_log_path;
  if (!config_.security.decision_log_path.empty()) {
    decision_log_path = common::expand_path(config_.security.decision_log_path);
  }
  runtime.decisions = std::make_shared<security::DecisionLog>(
      config_.security.decision_log_capacity, decision_log_path);
  runtime.checkpoints = checkpoints.value();

  runtime.predicates = std::make_shared<goal::PredicateRegistry>();
  runtime.predicates->register_predicate(
      "non_empty", [](const std::string &output) { return !common::trim(output).empty(); });

  providers::GenerationOptions judge_options;
  judge_options.model = config_.judge.model.empty() ? config_.model.model : config_.judge.model;
  judge_options.max_tokens = config_.judge.max_tokens;
  judge_options.reasoning_effort = config_.judge.reasoning_effort;
  judge_options.temperature = 0.0;
  auto judge = std::make_shared<goal::ModelJudge>(model, judge_options);
  auto evaluator = std::make_shared<goal::GoalEvaluator>(config::to_judge_config(config_), judge,
                                                         runtime.predicates);

  agent::AgentDependencies deps{
      .model = std::move(model),
      .registry = runtime.registry,
      .gate = std::make_shared<security::SecurityGate>(runtime.registry, runtime.decisions),
      .broker = runtime.broker,
      .bus = runtime.bus,
      .checkpoints = runtime.checkpoints,
      .evaluator = evaluator,
  };
  runtime.factory = std::make_shared<agent::AgentFactory>(std::move(deps),
                                                          config::to_loop_options(config_),
                                                          std::move(policy.value()));
  runtime.registry->register_tool(std::make_shared<agent::SpawnAgentTool>(
      runtime.factory, agent::SpawnOptions{.max_turns = config_.agent.spawn_max_turns,
                                           .max_depth = config_.agent.spawn_max_depth}));

  for (const auto &warning : validated.value()) {
    observability::record_error("config", warning);
  }
  return R::success(std::move(runtime));
}

} // namespace warden::runtime
