#include "warden/config/config.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/toml.hpp"
#include "warden/security/patterns.hpp"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace warden::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".warden";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("WARDEN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  return value != nullptr && *value != '\0' ? value : nullptr;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

common::Result<std::vector<std::string>> fail(const std::string &message) {
  return common::Result<std::vector<std::string>>::failure(common::ErrorKind::Schema, message);
}

std::optional<security::SecurityTier> parse_optional_tier(const std::string &value) {
  if (common::trim(value).empty()) {
    return std::nullopt;
  }
  auto tier = security::tier_from_string(value);
  if (!tier.ok()) {
    return std::nullopt;
  }
  return tier.value();
}

void load_security(Config &config, const common::TomlDocument &doc) {
  auto &security = config.security;
  security.auto_approve_up_to =
      doc.get_string("security.auto_approve_up_to", security.auto_approve_up_to);
  security.deny_above = doc.get_string("security.deny_above", security.deny_above);
  security.approval_timeout_secs =
      doc.get_u64("security.approval_timeout_secs", security.approval_timeout_secs);
  security.decision_log_path =
      expand_config_value(doc.get_string("security.decision_log_path", security.decision_log_path));
  security.decision_log_capacity = static_cast<std::size_t>(
      doc.get_u64("security.decision_log_capacity", security.decision_log_capacity));

  for (const auto &tool : doc.keys_in("security.tool_overrides")) {
    security.tool_overrides[common::to_lower(tool)] =
        doc.get_string("security.tool_overrides." + tool);
  }

  security.sub_agent.enabled = doc.get_bool("security.sub_agent.enabled", security.sub_agent.enabled);
  security.sub_agent.auto_approve_up_to =
      doc.get_string("security.sub_agent.auto_approve_up_to", security.sub_agent.auto_approve_up_to);
  security.sub_agent.deny_above =
      doc.get_string("security.sub_agent.deny_above", security.sub_agent.deny_above);

  const std::size_t patterns = doc.table_array_size("security.dangerous_patterns");
  for (std::size_t i = 0; i < patterns; ++i) {
    const std::string prefix = "security.dangerous_patterns." + std::to_string(i) + ".";
    DangerousPatternConfig pattern;
    pattern.pattern = doc.get_string(prefix + "pattern");
    pattern.label = doc.get_string(prefix + "label", pattern.pattern);
    security.dangerous_patterns.push_back(std::move(pattern));
  }
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

void apply_env_overrides(Config &config) {
  if (const char *model = env_value("WARDEN_MODEL"); model != nullptr) {
    config.model.model = model;
  }
  if (const char *base_url = env_value("WARDEN_BASE_URL"); base_url != nullptr) {
    config.model.base_url = base_url;
  }
  if (const char *api_key = env_value("WARDEN_API_KEY"); api_key != nullptr) {
    config.model.api_key = std::string(api_key);
    return;
  }
  if (config.model.api_key.has_value() && !common::trim(*config.model.api_key).empty()) {
    return;
  }
  if (const char *openai_key = env_value("OPENAI_API_KEY"); openai_key != nullptr) {
    config.model.api_key = std::string(openai_key);
  }
}

common::Result<Config> parse_config(const std::string &toml) {
  const auto parsed = common::parse_toml(toml);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(common::ErrorKind::Schema, parsed.error());
  }
  const auto &doc = parsed.value();
  Config config;

  auto &agent = config.agent;
  agent.system_prompt = doc.get_string("agent.system_prompt", agent.system_prompt);
  agent.max_turns = static_cast<std::size_t>(doc.get_u64("agent.max_turns", agent.max_turns));
  agent.max_duration_secs = doc.get_u64("agent.max_duration_secs", agent.max_duration_secs);
  agent.on_limit = common::to_lower(doc.get_string("agent.on_limit", agent.on_limit));
  agent.workspace = expand_config_value(doc.get_string("agent.workspace", agent.workspace));
  agent.spawn_max_turns =
      static_cast<std::size_t>(doc.get_u64("agent.spawn_max_turns", agent.spawn_max_turns));
  agent.spawn_max_depth =
      static_cast<std::size_t>(doc.get_u64("agent.spawn_max_depth", agent.spawn_max_depth));
  agent.max_context_tokens =
      static_cast<std::size_t>(doc.get_u64("agent.max_context_tokens", agent.max_context_tokens));
  agent.max_tool_output_tokens = static_cast<std::size_t>(
      doc.get_u64("agent.max_tool_output_tokens", agent.max_tool_output_tokens));
  agent.reflexion_failure_threshold = static_cast<std::size_t>(
      doc.get_u64("agent.reflexion_failure_threshold", agent.reflexion_failure_threshold));

  auto &model = config.model;
  model.provider = doc.get_string("model.provider", model.provider);
  model.model = doc.get_string("model.model", model.model);
  model.base_url = doc.get_string("model.base_url", model.base_url);
  if (doc.has("model.api_key")) {
    model.api_key = expand_config_value(doc.get_string("model.api_key"));
  }
  model.max_tokens = static_cast<std::uint32_t>(doc.get_u64("model.max_tokens", model.max_tokens));
  model.temperature = doc.get_double("model.temperature", model.temperature);
  model.reasoning_effort =
      common::to_lower(doc.get_string("model.reasoning_effort", model.reasoning_effort));
  model.timeout_secs = doc.get_u64("model.timeout_secs", model.timeout_secs);

  auto &reliability = config.reliability;
  reliability.max_retries =
      static_cast<std::uint32_t>(doc.get_u64("reliability.max_retries", reliability.max_retries));
  reliability.backoff_ms = doc.get_u64("reliability.backoff_ms", reliability.backoff_ms);
  reliability.max_backoff_ms = doc.get_u64("reliability.max_backoff_ms", reliability.max_backoff_ms);
  reliability.turn_retries =
      static_cast<std::uint32_t>(doc.get_u64("reliability.turn_retries", reliability.turn_retries));
  reliability.tool_max_retries = static_cast<std::uint32_t>(
      doc.get_u64("reliability.tool_max_retries", reliability.tool_max_retries));

  load_security(config, doc);

  auto &guardian = config.guardian;
  guardian.enabled = doc.get_bool("guardian.enabled", guardian.enabled);
  guardian.stall_timeout_secs = doc.get_u64("guardian.stall_timeout_secs", guardian.stall_timeout_secs);
  guardian.doom_loop_threshold = static_cast<std::size_t>(
      doc.get_u64("guardian.doom_loop_threshold", guardian.doom_loop_threshold));
  guardian.budget_tokens = doc.get_u64("guardian.budget_tokens", guardian.budget_tokens);
  guardian.budget_warn_pct =
      static_cast<std::uint32_t>(doc.get_u64("guardian.budget_warn_pct", guardian.budget_warn_pct));

  auto &judge = config.judge;
  judge.enabled = doc.get_bool("judge.enabled", judge.enabled);
  judge.confidence_floor = doc.get_double("judge.confidence_floor", judge.confidence_floor);
  judge.max_tokens = static_cast<std::uint32_t>(doc.get_u64("judge.max_tokens", judge.max_tokens));
  judge.model = doc.get_string("judge.model", judge.model);
  judge.reasoning_effort = common::to_lower(doc.get_string("judge.reasoning_effort", judge.reasoning_effort));

  config.checkpoint.enabled = doc.get_bool("checkpoint.enabled", config.checkpoint.enabled);
  config.checkpoint.path = expand_config_value(doc.get_string("checkpoint.path", config.checkpoint.path));

  auto &sandbox = config.sandbox;
  sandbox.enabled = doc.get_bool("sandbox.enabled", sandbox.enabled);
  sandbox.image = doc.get_string("sandbox.image", sandbox.image);
  sandbox.network_enabled = doc.get_bool("sandbox.network_enabled", sandbox.network_enabled);
  sandbox.read_only_root = doc.get_bool("sandbox.read_only_root", sandbox.read_only_root);
  sandbox.memory_limit = doc.get_string("sandbox.memory_limit", sandbox.memory_limit);
  sandbox.cpu_limit = doc.get_double("sandbox.cpu_limit", sandbox.cpu_limit);
  sandbox.pids_limit = static_cast<std::uint32_t>(doc.get_u64("sandbox.pids_limit", sandbox.pids_limit));
  sandbox.timeout_secs = doc.get_u64("sandbox.timeout_secs", sandbox.timeout_secs);

  config.observability.backend = doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  config.events.subscriber_capacity = static_cast<std::size_t>(
      doc.get_u64("events.subscriber_capacity", config.events.subscriber_capacity));
  config.events.trace = doc.get_bool("events.trace", config.events.trace);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }
  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    config.checkpoint.path = expand_config_value(config.checkpoint.path);
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }
  auto parsed = parse_config(content.value());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error_kind(),
                                           path.string() + ": " + parsed.error());
  }
  Config config = std::move(parsed.value());
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

std::string render_config(const Config &config) {
  std::ostringstream file;
  file << "[agent]\n";
  if (!config.agent.system_prompt.empty()) {
    file << "system_prompt = " << common::quote_toml_string(config.agent.system_prompt) << "\n";
  }
  file << "max_turns = " << config.agent.max_turns << "\n";
  file << "max_duration_secs = " << config.agent.max_duration_secs << "\n";
  file << "on_limit = " << common::quote_toml_string(config.agent.on_limit) << "\n";
  if (!config.agent.workspace.empty()) {
    file << "workspace = " << common::quote_toml_string(config.agent.workspace) << "\n";
  }
  file << "spawn_max_turns = " << config.agent.spawn_max_turns << "\n";
  file << "spawn_max_depth = " << config.agent.spawn_max_depth << "\n";
  file << "max_context_tokens = " << config.agent.max_context_tokens << "\n";
  file << "max_tool_output_tokens = " << config.agent.max_tool_output_tokens << "\n";
  file << "reflexion_failure_threshold = " << config.agent.reflexion_failure_threshold << "\n";

  file << "\n[model]\n";
  file << "provider = " << common::quote_toml_string(config.model.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.model.model) << "\n";
  file << "base_url = " << common::quote_toml_string(config.model.base_url) << "\n";
  if (config.model.api_key.has_value()) {
    file << "api_key = " << common::quote_toml_string(*config.model.api_key) << "\n";
  }
  file << "max_tokens = " << config.model.max_tokens << "\n";
  file << "temperature = " << config.model.temperature << "\n";
  if (!config.model.reasoning_effort.empty()) {
    file << "reasoning_effort = " << common::quote_toml_string(config.model.reasoning_effort)
         << "\n";
  }
  file << "timeout_secs = " << config.model.timeout_secs << "\n";

  file << "\n[reliability]\n";
  file << "max_retries = " << config.reliability.max_retries << "\n";
  file << "backoff_ms = " << config.reliability.backoff_ms << "\n";
  file << "max_backoff_ms = " << config.reliability.max_backoff_ms << "\n";
  file << "turn_retries = " << config.reliability.turn_retries << "\n";
  file << "tool_max_retries = " << config.reliability.tool_max_retries << "\n";

  const auto &security = config.security;
  file << "\n[security]\n";
  file << "auto_approve_up_to = " << common::quote_toml_string(security.auto_approve_up_to) << "\n";
  if (!security.deny_above.empty()) {
    file << "deny_above = " << common::quote_toml_string(security.deny_above) << "\n";
  }
  file << "approval_timeout_secs = " << security.approval_timeout_secs << "\n";
  if (!security.decision_log_path.empty()) {
    file << "decision_log_path = " << common::quote_toml_string(security.decision_log_path) << "\n";
  }
  file << "decision_log_capacity = " << security.decision_log_capacity << "\n";
  if (!security.tool_overrides.empty()) {
    file << "\n[security.tool_overrides]\n";
    for (const auto &[tool, tier] : security.tool_overrides) {
      file << tool << " = " << common::quote_toml_string(tier) << "\n";
    }
  }
  file << "\n[security.sub_agent]\n";
  file << "enabled = " << bool_to_toml(security.sub_agent.enabled) << "\n";
  file << "auto_approve_up_to = " << common::quote_toml_string(security.sub_agent.auto_approve_up_to)
       << "\n";
  file << "deny_above = " << common::quote_toml_string(security.sub_agent.deny_above) << "\n";
  for (const auto &pattern : security.dangerous_patterns) {
    file << "\n[[security.dangerous_patterns]]\n";
    file << "pattern = " << common::quote_toml_string(pattern.pattern) << "\n";
    file << "label = " << common::quote_toml_string(pattern.label) << "\n";
  }

  file << "\n[guardian]\n";
  file << "enabled = " << bool_to_toml(config.guardian.enabled) << "\n";
  file << "stall_timeout_secs = " << config.guardian.stall_timeout_secs << "\n";
  file << "doom_loop_threshold = " << config.guardian.doom_loop_threshold << "\n";
  file << "budget_tokens = " << config.guardian.budget_tokens << "\n";
  file << "budget_warn_pct = " << config.guardian.budget_warn_pct << "\n";

  file << "\n[judge]\n";
  file << "enabled = " << bool_to_toml(config.judge.enabled) << "\n";
  file << "confidence_floor = " << config.judge.confidence_floor << "\n";
  file << "max_tokens = " << config.judge.max_tokens << "\n";
  if (!config.judge.model.empty()) {
    file << "model = " << common::quote_toml_string(config.judge.model) << "\n";
  }
  file << "reasoning_effort = " << common::quote_toml_string(config.judge.reasoning_effort) << "\n";

  file << "\n[checkpoint]\n";
  file << "enabled = " << bool_to_toml(config.checkpoint.enabled) << "\n";
  file << "path = " << common::quote_toml_string(config.checkpoint.path) << "\n";

  file << "\n[sandbox]\n";
  file << "enabled = " << bool_to_toml(config.sandbox.enabled) << "\n";
  file << "image = " << common::quote_toml_string(config.sandbox.image) << "\n";
  file << "network_enabled = " << bool_to_toml(config.sandbox.network_enabled) << "\n";
  file << "read_only_root = " << bool_to_toml(config.sandbox.read_only_root) << "\n";
  file << "memory_limit = " << common::quote_toml_string(config.sandbox.memory_limit) << "\n";
  file << "cpu_limit = " << config.sandbox.cpu_limit << "\n";
  file << "pids_limit = " << config.sandbox.pids_limit << "\n";
  file << "timeout_secs = " << config.sandbox.timeout_secs << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";

  file << "\n[events]\n";
  file << "subscriber_capacity = " << config.events.subscriber_capacity << "\n";
  file << "trace = " << bool_to_toml(config.events.trace) << "\n";
  return file.str();
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }
  file << render_config(config);
  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.agent.max_turns == 0) {
    return fail("agent.max_turns must be > 0");
  }
  if (config.agent.max_duration_secs == 0) {
    return fail("agent.max_duration_secs must be > 0");
  }
  if (config.agent.on_limit != "fail" && config.agent.on_limit != "complete") {
    return fail("Invalid agent.on_limit (expected fail|complete): " + config.agent.on_limit);
  }
  if (config.agent.max_context_tokens > 0 &&
      config.agent.max_tool_output_tokens > config.agent.max_context_tokens) {
    warnings.push_back("agent.max_tool_output_tokens exceeds agent.max_context_tokens; large tool "
                       "results will push older history out of the request");
  }

  if (common::to_lower(config.model.provider) != "openai-compatible" &&
      common::to_lower(config.model.provider) != "openai") {
    return fail("Unsupported model.provider: " + config.model.provider);
  }
  if (common::trim(config.model.model).empty()) {
    return fail("model.model must not be empty");
  }
  if (config.model.temperature < 0.0 || config.model.temperature > 2.0) {
    return fail("model.temperature must be between 0.0 and 2.0");
  }
  for (const auto *effort : {&config.model.reasoning_effort, &config.judge.reasoning_effort}) {
    if (!effort->empty() && *effort != "low" && *effort != "medium" && *effort != "high") {
      return fail("Invalid reasoning_effort (expected low|medium|high): " + *effort);
    }
  }

  const auto &security = config.security;
  const auto auto_approve = security::tier_from_string(security.auto_approve_up_to);
  if (!auto_approve.ok()) {
    return fail("Invalid security.auto_approve_up_to: " + security.auto_approve_up_to);
  }
  if (!security.deny_above.empty()) {
    const auto deny = security::tier_from_string(security.deny_above);
    if (!deny.ok()) {
      return fail("Invalid security.deny_above: " + security.deny_above);
    }
    if (static_cast<int>(deny.value()) < static_cast<int>(auto_approve.value())) {
      warnings.push_back("security.deny_above is below security.auto_approve_up_to; tiers above "
                         "deny_above are denied regardless");
    }
  }
  if (security.approval_timeout_secs == 0) {
    return fail("security.approval_timeout_secs must be > 0");
  }
  for (const auto &[tool, tier] : security.tool_overrides) {
    if (!security::tier_from_string(tier).ok()) {
      return fail("Invalid tier for security.tool_overrides." + tool + ": " + tier);
    }
  }
  if (security.sub_agent.enabled) {
    if (!security::tier_from_string(security.sub_agent.auto_approve_up_to).ok()) {
      return fail("Invalid security.sub_agent.auto_approve_up_to: " +
                  security.sub_agent.auto_approve_up_to);
    }
    if (!security.sub_agent.deny_above.empty() &&
        !security::tier_from_string(security.sub_agent.deny_above).ok()) {
      return fail("Invalid security.sub_agent.deny_above: " + security.sub_agent.deny_above);
    }
  }
  std::vector<security::DangerousPattern> patterns;
  for (const auto &pattern : security.dangerous_patterns) {
    if (pattern.pattern.empty()) {
      return fail("security.dangerous_patterns entries need a pattern");
    }
    patterns.push_back(security::DangerousPattern{pattern.pattern, pattern.label});
  }
  const auto matcher = security::PatternMatcher::compile(patterns);
  for (const auto &warning : matcher.warnings()) {
    warnings.push_back(warning);
  }

  if (config.guardian.budget_warn_pct > 100) {
    return fail("guardian.budget_warn_pct must be between 0 and 100");
  }
  if (config.judge.confidence_floor < 0.0 || config.judge.confidence_floor > 1.0) {
    return fail("judge.confidence_floor must be between 0.0 and 1.0");
  }

  if (config.checkpoint.enabled && common::trim(config.checkpoint.path).empty()) {
    return fail("checkpoint.path is required when checkpoints are enabled");
  }
  if (config.sandbox.enabled && common::trim(config.sandbox.image).empty()) {
    return fail("sandbox.image is required when the sandbox is enabled");
  }
  if (config.sandbox.cpu_limit < 0.0) {
    return fail("sandbox.cpu_limit must not be negative");
  }

  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  std::stringstream backends(backend);
  std::string part;
  while (std::getline(backends, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty() && name != "log" && name != "none" && name != "noop") {
      warnings.push_back("Unknown observability backend '" + name + "' is ignored");
    }
  }
  const std::string level = common::to_lower(config.observability.log_level);
  if (level != "debug" && level != "info" && level != "warn" && level != "error") {
    warnings.push_back("Unknown observability.log_level '" + config.observability.log_level +
                       "', using info");
  }
  if (config.events.subscriber_capacity == 0) {
    return fail("events.subscriber_capacity must be > 0");
  }

  bool api_key_missing =
      !config.model.api_key.has_value() || common::trim(*config.model.api_key).empty();
  if (api_key_missing &&
      (env_value("WARDEN_API_KEY") != nullptr || env_value("OPENAI_API_KEY") != nullptr)) {
    api_key_missing = false;
  }
  if (api_key_missing) {
    warnings.push_back("API key is missing (model.api_key, WARDEN_API_KEY or OPENAI_API_KEY)");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

common::Result<security::SecurityPolicy> to_security_policy(const Config &config) {
  using R = common::Result<security::SecurityPolicy>;
  const auto &settings = config.security;
  security::SecurityPolicy policy;

  auto auto_approve = security::tier_from_string(settings.auto_approve_up_to);
  if (!auto_approve.ok()) {
    return R::failure(common::ErrorKind::Schema,
                      "Invalid security.auto_approve_up_to: " + settings.auto_approve_up_to);
  }
  policy.auto_approve_up_to = auto_approve.value();
  if (!settings.deny_above.empty()) {
    auto deny = security::tier_from_string(settings.deny_above);
    if (!deny.ok()) {
      return R::failure(common::ErrorKind::Schema,
                        "Invalid security.deny_above: " + settings.deny_above);
    }
    policy.deny_above = deny.value();
  }
  policy.approval_timeout_secs = settings.approval_timeout_secs;

  for (const auto &[tool, tier_name] : settings.tool_overrides) {
    auto tier = security::tier_from_string(tier_name);
    if (!tier.ok()) {
      return R::failure(common::ErrorKind::Schema,
                        "Invalid tier for security.tool_overrides." + tool + ": " + tier_name);
    }
    policy.tool_overrides[common::to_lower(tool)] = tier.value();
  }

  if (!settings.dangerous_patterns.empty()) {
    policy.dangerous_patterns.clear();
    for (const auto &pattern : settings.dangerous_patterns) {
      policy.dangerous_patterns.push_back(security::DangerousPattern{pattern.pattern, pattern.label});
    }
  }

  if (settings.sub_agent.enabled) {
    security::SubAgentOverlay overlay;
    auto sub_auto = security::tier_from_string(settings.sub_agent.auto_approve_up_to);
    if (!sub_auto.ok()) {
      return R::failure(common::ErrorKind::Schema, "Invalid security.sub_agent.auto_approve_up_to: " +
                                                       settings.sub_agent.auto_approve_up_to);
    }
    overlay.auto_approve_up_to = sub_auto.value();
    overlay.deny_above = parse_optional_tier(settings.sub_agent.deny_above);
    if (!settings.sub_agent.deny_above.empty() && !overlay.deny_above.has_value()) {
      return R::failure(common::ErrorKind::Schema,
                        "Invalid security.sub_agent.deny_above: " + settings.sub_agent.deny_above);
    }
    policy.sub_agent = overlay;
  }
  return R::success(std::move(policy));
}

guardian::GuardianConfig to_guardian_config(const Config &config) {
  return guardian::GuardianConfig{
      .enabled = config.guardian.enabled,
      .stall_timeout_secs = config.guardian.stall_timeout_secs,
      .doom_loop_threshold = config.guardian.doom_loop_threshold,
      .budget_tokens = config.guardian.budget_tokens,
      .budget_warn_pct = config.guardian.budget_warn_pct,
  };
}

sandbox::SandboxConfig to_sandbox_config(const Config &config) {
  sandbox::SandboxConfig out;
  out.enabled = config.sandbox.enabled;
  out.image = config.sandbox.image;
  out.network_enabled = config.sandbox.network_enabled;
  out.read_only_root = config.sandbox.read_only_root;
  out.memory_limit = config.sandbox.memory_limit.empty()
                         ? std::nullopt
                         : std::optional<std::string>(config.sandbox.memory_limit);
  out.cpu_limit = config.sandbox.cpu_limit > 0.0 ? std::optional<double>(config.sandbox.cpu_limit)
                                                 : std::nullopt;
  out.pids_limit = config.sandbox.pids_limit > 0
                       ? std::optional<std::uint32_t>(config.sandbox.pids_limit)
                       : std::nullopt;
  return out;
}

goal::JudgeConfig to_judge_config(const Config &config) {
  return goal::JudgeConfig{.llm_enabled = config.judge.enabled,
                           .confidence_floor = config.judge.confidence_floor};
}

agent::LoopOptions to_loop_options(const Config &config) {
  agent::LoopOptions options;
  if (!config.agent.system_prompt.empty()) {
    options.system_prompt = config.agent.system_prompt;
  }
  options.max_turns = config.agent.max_turns;
  options.max_duration = std::chrono::seconds(config.agent.max_duration_secs);
  options.on_limit = config.agent.on_limit == "complete" ? agent::LimitBehavior::Complete
                                                         : agent::LimitBehavior::Fail;
  options.turn_retries = config.reliability.turn_retries;
  options.model_retry = common::RetryPolicy{.max_retries = config.reliability.max_retries,
                                            .backoff_ms = config.reliability.backoff_ms,
                                            .max_backoff_ms = config.reliability.max_backoff_ms};
  options.tool_retry = common::RetryPolicy{.max_retries = config.reliability.tool_max_retries,
                                           .backoff_ms = config.reliability.backoff_ms,
                                           .max_backoff_ms = config.reliability.max_backoff_ms};
  options.generation.model = config.model.model;
  if (config.model.max_tokens > 0) {
    options.generation.max_tokens = config.model.max_tokens;
  }
  options.generation.reasoning_effort = config.model.reasoning_effort;
  options.generation.temperature = config.model.temperature;
  if (config.agent.workspace.empty()) {
    std::error_code ec;
    options.workspace = std::filesystem::current_path(ec);
  } else {
    options.workspace = config.agent.workspace;
  }
  options.guardian = to_guardian_config(config);
  options.context.max_context_tokens = config.agent.max_context_tokens;
  options.context.max_tool_output_tokens = config.agent.max_tool_output_tokens;
  options.reflexion_threshold = config.agent.reflexion_failure_threshold;
  return options;
}

} // namespace warden::config
