#pragma once

#include "warden/common/result.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden::common {

/// Flattened TOML document. `[a.b]` sections prefix keys with "a.b."; the n-th
/// `[[a.b]]` table prefixes its keys with "a.b.<n>.".
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;
  std::unordered_map<std::string, std::size_t> table_arrays;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback) const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;

  /// Direct child keys of a section, e.g. keys_in("security.tool_overrides").
  [[nodiscard]] std::vector<std::string> keys_in(const std::string &section) const;
  [[nodiscard]] std::size_t table_array_size(const std::string &name) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::string quote_toml_string(const std::string &value);

} // namespace warden::common
