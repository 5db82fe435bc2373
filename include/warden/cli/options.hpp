#pragma once

#include "warden/common/result.hpp"
#include "warden/goal/goal.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace warden::cli {

/// Removes `name VALUE` from args. Returns false when absent or missing its value.
bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value);
bool take_flag(std::vector<std::string> &args, const std::string &name);
[[nodiscard]] std::string join_tokens(const std::vector<std::string> &args, std::size_t begin = 0);

struct RunOptions {
  std::string prompt;
  std::optional<std::string> session_id;
  std::optional<std::string> goal;
  std::vector<std::string> expect;
  std::optional<double> threshold;
  std::optional<std::size_t> max_turns;
};

/// Parses `run` arguments; whatever is left after the options is the prompt.
[[nodiscard]] common::Result<RunOptions> parse_run_options(std::vector<std::string> args);

/// Goal for a run: each --expect becomes an OutputContains criterion; a goal
/// without expectations is left to the judge.
[[nodiscard]] std::optional<goal::Goal> build_goal(const RunOptions &options);

} // namespace warden::cli
