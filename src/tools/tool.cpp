#include "warden/tools/tool.hpp"

#include "warden/common/fs.hpp"
#include "warden/common/json_util.hpp"

#include <algorithm>
#include <unordered_set>

namespace warden::tools {

namespace {

bool type_matches(const std::string &expected, const common::JsonType actual,
                  const std::string &raw) {
  if (expected.empty()) {
    return true;
  }
  switch (actual) {
  case common::JsonType::String:
    return expected == "string";
  case common::JsonType::Boolean:
    return expected == "boolean";
  case common::JsonType::Null:
    return expected == "null";
  case common::JsonType::Array:
    return expected == "array";
  case common::JsonType::Object:
    return expected == "object";
  case common::JsonType::Number:
    if (expected == "number") {
      return true;
    }
    return expected == "integer" && raw.find_first_of(".eE") == std::string::npos;
  case common::JsonType::Invalid:
    break;
  }
  return false;
}

} // namespace

ToolSpec ITool::spec() const {
  return ToolSpec{.name = std::string(name()),
                  .description = std::string(description()),
                  .parameters_json = parameters_schema(),
                  .tier = tier()};
}

common::Status validate_arguments(const std::string &schema_json,
                                  const std::string &arguments_json) {
  if (const auto syntax = common::json_validate(arguments_json); !syntax.ok()) {
    return common::Status::error(common::ErrorKind::Schema,
                                 "arguments are not valid JSON: " + syntax.error());
  }
  auto members = common::json_object_members(arguments_json);
  if (!members.ok()) {
    return common::Status::error(common::ErrorKind::Schema,
                                 "arguments must be a JSON object: " + members.error());
  }

  if (const auto schema_syntax = common::json_validate(schema_json); !schema_syntax.ok()) {
    return common::Status::error(common::ErrorKind::Schema,
                                 "tool schema is not valid JSON: " + schema_syntax.error());
  }
  const auto schema = common::json_parse_flat(schema_json);

  std::unordered_set<std::string> present;
  for (const auto &[key, raw] : members.value()) {
    if (!present.insert(key).second) {
      return common::Status::error(common::ErrorKind::Schema, "duplicate argument: " + key);
    }
  }

  if (const auto it = schema.find("required"); it != schema.end()) {
    for (const auto &name : common::json_parse_string_array(it->second)) {
      if (!present.contains(name)) {
        return common::Status::error(common::ErrorKind::Schema,
                                     "missing required argument: " + name);
      }
    }
  }

  common::JsonFlatMap properties;
  if (const auto it = schema.find("properties"); it != schema.end()) {
    properties = common::json_parse_flat(it->second);
  }
  const auto additional = schema.find("additionalProperties");
  const bool closed = additional != schema.end() && additional->second == "false";

  for (const auto &[key, raw] : members.value()) {
    const auto prop = properties.find(key);
    if (prop == properties.end()) {
      if (closed) {
        return common::Status::error(common::ErrorKind::Schema, "unexpected argument: " + key);
      }
      continue;
    }
    const auto prop_schema = common::json_parse_flat(prop->second);
    const auto type_it = prop_schema.find("type");
    const std::string expected = type_it == prop_schema.end() ? "" : type_it->second;
    const auto actual = common::json_value_type(raw);
    if (!type_matches(expected, actual, raw)) {
      return common::Status::error(common::ErrorKind::Schema,
                                   "argument '" + key + "' must be " + expected + ", got " +
                                       common::json_type_name(actual));
    }
  }
  return common::Status::success();
}

ToolArgs decode_arguments(const std::string &arguments_json) {
  return common::json_parse_flat(arguments_json);
}

common::Result<std::filesystem::path> resolve_in_workspace(const std::filesystem::path &workspace,
                                                          const std::string &path) {
  using PathResult = common::Result<std::filesystem::path>;
  if (common::trim(path).empty()) {
    return PathResult::failure(common::ErrorKind::ToolExecution, "path is empty");
  }
  std::error_code ec;
  const auto root_input = workspace.empty() ? std::filesystem::current_path(ec) : workspace;
  if (ec) {
    return PathResult::failure(common::ErrorKind::ToolExecution, "workspace unavailable");
  }
  const auto root = std::filesystem::weakly_canonical(root_input, ec);
  if (ec) {
    return PathResult::failure(common::ErrorKind::ToolExecution,
                               "invalid workspace: " + root_input.string());
  }
  const std::filesystem::path requested(common::expand_path(path));
  const auto joined = requested.is_absolute() ? requested : root / requested;
  const auto resolved = std::filesystem::weakly_canonical(joined, ec);
  if (ec) {
    return PathResult::failure(common::ErrorKind::ToolExecution, "invalid path: " + path);
  }
  if (!common::is_subpath(resolved, root)) {
    return PathResult::failure(common::ErrorKind::PolicyViolation,
                               "path escapes the workspace: " + path);
  }
  return PathResult::success(resolved);
}

common::Result<std::string> required_arg(const ToolArgs &args, const std::string &name) {
  const auto it = args.find(name);
  if (it == args.end() || it->second.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::ToolExecution,
                                                "Missing argument: " + name);
  }
  return common::Result<std::string>::success(it->second);
}

} // namespace warden::tools
