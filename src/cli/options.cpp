#include "warden/cli/options.hpp"

#include "warden/common/fs.hpp"

#include <sstream>
#include <stdexcept>

namespace warden::cli {

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

namespace {

bool has_dangling(const std::vector<std::string> &args, const std::string &name) {
  return !args.empty() && args.back() == name;
}

} // namespace

common::Result<RunOptions> parse_run_options(std::vector<std::string> args) {
  using R = common::Result<RunOptions>;
  RunOptions options;

  for (const char *name : {"--session", "--goal", "--expect", "--threshold", "--max-turns"}) {
    if (has_dangling(args, name)) {
      return R::failure(common::ErrorKind::Schema, std::string("missing value for ") + name);
    }
  }

  std::string value;
  if (take_option(args, "--session", "-s", value)) {
    if (common::trim(value).empty()) {
      return R::failure(common::ErrorKind::Schema, "session id must not be empty");
    }
    options.session_id = value;
  }
  if (take_option(args, "--goal", "-g", value)) {
    options.goal = value;
  }
  while (take_option(args, "--expect", "-e", value)) {
    options.expect.push_back(value);
  }
  if (take_option(args, "--threshold", "", value)) {
    try {
      const double threshold = std::stod(value);
      if (threshold < 0.0 || threshold > 1.0) {
        return R::failure(common::ErrorKind::Schema, "threshold must be within [0, 1]");
      }
      options.threshold = threshold;
    } catch (const std::exception &) {
      return R::failure(common::ErrorKind::Schema, "invalid threshold: " + value);
    }
  }
  if (take_option(args, "--max-turns", "", value)) {
    try {
      const long long turns = std::stoll(value);
      if (turns <= 0) {
        return R::failure(common::ErrorKind::Schema, "max turns must be positive");
      }
      options.max_turns = static_cast<std::size_t>(turns);
    } catch (const std::exception &) {
      return R::failure(common::ErrorKind::Schema, "invalid max turns: " + value);
    }
  }

  for (const auto &arg : args) {
    if (common::starts_with(arg, "--")) {
      return R::failure(common::ErrorKind::Schema, "unknown option: " + arg);
    }
  }
  options.prompt = common::trim(join_tokens(args));
  if (options.prompt.empty()) {
    return R::failure(common::ErrorKind::Schema, "prompt must not be empty");
  }
  return R::success(std::move(options));
}

std::optional<goal::Goal> build_goal(const RunOptions &options) {
  if (!options.goal.has_value() && options.expect.empty()) {
    return std::nullopt;
  }
  goal::Goal out;
  out.description = options.goal.value_or(options.prompt);
  if (options.threshold.has_value()) {
    out.success_threshold = *options.threshold;
  }
  for (std::size_t i = 0; i < options.expect.size(); ++i) {
    out.criteria.push_back(goal::Criterion{
        .id = "expect-" + std::to_string(i + 1),
        .description = "Output mentions '" + options.expect[i] + "'",
        .weight = 1.0,
        .check = goal::OutputContains{.pattern = options.expect[i]},
    });
  }
  if (out.criteria.empty()) {
    out.criteria.push_back(goal::Criterion{
        .id = "judge",
        .description = out.description,
        .weight = 1.0,
        .check = goal::LlmJudge{.prompt = out.description},
    });
  }
  return out;
}

} // namespace warden::cli
