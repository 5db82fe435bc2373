#pragma once

#include "warden/common/result.hpp"

#include <cstddef>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace warden::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Escape and wrap in double quotes.
[[nodiscard]] std::string json_quote(const std::string &value);

/// Unescape a JSON-encoded string body (standard escapes and \uXXXX).
[[nodiscard]] std::string json_unescape(const std::string &raw);

[[nodiscard]] std::size_t json_find_key(const std::string &json, const std::string &key,
                                        std::size_t from = 0);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// First occurrence of a string field anywhere in the document.
[[nodiscard]] std::string json_get_string(const std::string &json, const std::string &field);

/// First occurrence of a numeric field (as text) anywhere in the document.
[[nodiscard]] std::string json_get_number(const std::string &json, const std::string &field);

[[nodiscard]] std::string json_get_object(const std::string &json, const std::string &field);
[[nodiscard]] std::string json_get_array(const std::string &json, const std::string &field);

/// Parse a JSON object's top-level members into key -> value. String values are
/// unescaped; objects, arrays, numbers and literals are kept as raw JSON text.
using JsonFlatMap = std::unordered_map<std::string, std::string>;
[[nodiscard]] JsonFlatMap json_parse_flat(const std::string &json);

/// Top-level members of a JSON object with every value kept as raw JSON text,
/// in document order.
using JsonMembers = std::vector<std::pair<std::string, std::string>>;
[[nodiscard]] Result<JsonMembers> json_object_members(const std::string &json);

/// Split a JSON array of objects into individual object strings.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

/// Elements of a JSON array as raw JSON text, in order.
[[nodiscard]] std::vector<std::string> json_array_elements(const std::string &array_json);

/// Decode a JSON array of strings such as ["a","b"]. Non-string elements are skipped.
[[nodiscard]] std::vector<std::string> json_parse_string_array(const std::string &array_json);

/// Strict syntax check of a complete JSON document.
[[nodiscard]] Status json_validate(const std::string &text);

enum class JsonType { Null, Boolean, Number, String, Array, Object, Invalid };

/// Classify a raw JSON value by its leading token.
[[nodiscard]] JsonType json_value_type(const std::string &raw);
[[nodiscard]] std::string json_type_name(JsonType type);

} // namespace warden::common
