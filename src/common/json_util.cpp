#include "warden/common/json_util.hpp"

#include <cctype>
#include <cstdio>

namespace warden::common {

namespace {

constexpr std::size_t kMaxDepth = 128;

void append_utf8(std::string &out, unsigned code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

bool parse_hex4(const std::string &text, std::size_t pos, unsigned &out) {
  if (pos + 4 > text.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = text[i];
    out <<= 4U;
    if (ch >= '0' && ch <= '9') {
      out |= static_cast<unsigned>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      out |= static_cast<unsigned>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      out |= static_cast<unsigned>(ch - 'A' + 10);
    } else {
      return false;
    }
  }
  return true;
}

/// Recursive-descent validator over the RFC 8259 grammar.
class Validator {
public:
  explicit Validator(const std::string &text) : text_(text) {}

  Status run() {
    pos_ = json_skip_ws(text_, 0);
    if (!value(0)) {
      return fail();
    }
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ != text_.size()) {
      error_ = "trailing characters";
      return fail();
    }
    return Status::success();
  }

private:
  Status fail() const {
    return Status::error(ErrorKind::Schema,
                         "invalid JSON at offset " + std::to_string(pos_) + ": " + error_);
  }

  bool value(const std::size_t depth) {
    if (depth > kMaxDepth) {
      error_ = "nesting too deep";
      return false;
    }
    if (pos_ >= text_.size()) {
      error_ = "unexpected end of input";
      return false;
    }
    switch (text_[pos_]) {
    case '{':
      return object(depth);
    case '[':
      return array(depth);
    case '"':
      return string();
    case 't':
      return literal("true");
    case 'f':
      return literal("false");
    case 'n':
      return literal("null");
    default:
      return number();
    }
  }

  bool object(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == '}') {
      ++pos_;
      return true;
    }
    while (true) {
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != '"') {
        error_ = "expected object key";
        return false;
      }
      if (!string()) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size() || text_[pos_] != ':') {
        error_ = "expected ':'";
        return false;
      }
      ++pos_;
      pos_ = json_skip_ws(text_, pos_);
      if (!value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        error_ = "unterminated object";
        return false;
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == '}') {
        ++pos_;
        return true;
      }
      error_ = "expected ',' or '}'";
      return false;
    }
  }

  bool array(const std::size_t depth) {
    ++pos_;
    pos_ = json_skip_ws(text_, pos_);
    if (pos_ < text_.size() && text_[pos_] == ']') {
      ++pos_;
      return true;
    }
    while (true) {
      pos_ = json_skip_ws(text_, pos_);
      if (!value(depth + 1)) {
        return false;
      }
      pos_ = json_skip_ws(text_, pos_);
      if (pos_ >= text_.size()) {
        error_ = "unterminated array";
        return false;
      }
      if (text_[pos_] == ',') {
        ++pos_;
        continue;
      }
      if (text_[pos_] == ']') {
        ++pos_;
        return true;
      }
      error_ = "expected ',' or ']'";
      return false;
    }
  }

  bool string() {
    ++pos_;
    while (pos_ < text_.size()) {
      const auto ch = static_cast<unsigned char>(text_[pos_]);
      if (ch == '"') {
        ++pos_;
        return true;
      }
      if (ch < 0x20) {
        error_ = "control character in string";
        return false;
      }
      if (ch == '\\') {
        ++pos_;
        if (pos_ >= text_.size()) {
          break;
        }
        const char esc = text_[pos_];
        if (esc == 'u') {
          unsigned code = 0;
          if (!parse_hex4(text_, pos_ + 1, code)) {
            error_ = "bad unicode escape";
            return false;
          }
          pos_ += 5;
          continue;
        }
        if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' && esc != 'n' &&
            esc != 'r' && esc != 't') {
          error_ = "bad escape";
          return false;
        }
      }
      ++pos_;
    }
    error_ = "unterminated string";
    return false;
  }

  bool literal(const std::string &word) {
    if (text_.compare(pos_, word.size(), word) != 0) {
      error_ = "unexpected token";
      return false;
    }
    pos_ += word.size();
    return true;
  }

  bool digits() {
    const std::size_t start = pos_;
    while (pos_ < text_.size() && std::isdigit(static_cast<unsigned char>(text_[pos_])) != 0) {
      ++pos_;
    }
    return pos_ > start;
  }

  bool number() {
    if (pos_ < text_.size() && text_[pos_] == '-') {
      ++pos_;
    }
    if (pos_ < text_.size() && text_[pos_] == '0') {
      ++pos_;
    } else if (!digits()) {
      error_ = "unexpected token";
      return false;
    }
    if (pos_ < text_.size() && text_[pos_] == '.') {
      ++pos_;
      if (!digits()) {
        error_ = "bad fraction";
        return false;
      }
    }
    if (pos_ < text_.size() && (text_[pos_] == 'e' || text_[pos_] == 'E')) {
      ++pos_;
      if (pos_ < text_.size() && (text_[pos_] == '+' || text_[pos_] == '-')) {
        ++pos_;
      }
      if (!digits()) {
        error_ = "bad exponent";
        return false;
      }
    }
    return true;
  }

  const std::string &text_;
  std::size_t pos_ = 0;
  std::string error_;
};

/// End (exclusive) of the raw value starting at pos, or npos.
std::size_t raw_value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned code = 0;
      if (!parse_hex4(raw, i + 1, code)) {
        out.push_back(esc);
        break;
      }
      i += 4;
      // Surrogate pair.
      if (code >= 0xD800 && code <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        unsigned low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(esc);
      break;
    }
  }
  return out;
}

std::size_t json_find_key(const std::string &json, const std::string &key, std::size_t from) {
  const std::string quoted = "\"" + key + "\"";
  return json.find(quoted, from);
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  const std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const auto end = json_find_string_end(json, pos);
  if (end == std::string::npos || end <= pos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  const std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] == '"' || json[pos] == '{' || json[pos] == '[') {
    return "";
  }
  const auto end = raw_value_end(json, pos);
  if (end == std::string::npos || end <= pos) {
    return "";
  }
  return json.substr(pos, end - pos);
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  const std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '{') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '{', '}');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto key_pos = json_find_key(json, field);
  if (key_pos == std::string::npos) {
    return "";
  }
  const auto colon = json.find(':', key_pos + field.size() + 2);
  if (colon == std::string::npos) {
    return "";
  }
  const std::size_t pos = json_skip_ws(json, colon + 1);
  if (pos >= json.size() || json[pos] != '[') {
    return "";
  }
  const auto end = json_find_matching_token(json, pos, '[', ']');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

Result<JsonMembers> json_object_members(const std::string &json) {
  JsonMembers members;
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return Result<JsonMembers>::failure(ErrorKind::Schema, "expected a JSON object");
  }
  ++pos;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size()) {
      return Result<JsonMembers>::failure(ErrorKind::Schema, "unterminated JSON object");
    }
    if (json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      return Result<JsonMembers>::failure(ErrorKind::Schema, "expected object key");
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return Result<JsonMembers>::failure(ErrorKind::Schema, "unterminated object key");
    }
    std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return Result<JsonMembers>::failure(ErrorKind::Schema, "expected ':' after " + key);
    }
    pos = json_skip_ws(json, pos + 1);
    const auto end = raw_value_end(json, pos);
    if (end == std::string::npos || end <= pos) {
      return Result<JsonMembers>::failure(ErrorKind::Schema, "bad value for " + key);
    }
    members.emplace_back(std::move(key), json.substr(pos, end - pos));
    pos = end;
  }
  return Result<JsonMembers>::success(std::move(members));
}

JsonFlatMap json_parse_flat(const std::string &json) {
  JsonFlatMap result;
  auto members = json_object_members(json);
  if (!members.ok()) {
    return result;
  }
  for (auto &[key, raw] : members.value()) {
    if (!raw.empty() && raw.front() == '"' && raw.size() >= 2) {
      result[key] = json_unescape(raw.substr(1, raw.size() - 2));
    } else {
      result[key] = raw;
    }
  }
  return result;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

std::vector<std::string> json_array_elements(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = raw_value_end(array_json, pos);
    if (end == std::string::npos || end <= pos) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos));
    pos = end;
  }
  return out;
}

std::vector<std::string> json_parse_string_array(const std::string &array_json) {
  std::vector<std::string> out;
  for (const auto &raw : json_array_elements(array_json)) {
    if (raw.size() >= 2 && raw.front() == '"') {
      out.push_back(json_unescape(raw.substr(1, raw.size() - 2)));
    }
  }
  return out;
}

Status json_validate(const std::string &text) { return Validator(text).run(); }

JsonType json_value_type(const std::string &raw) {
  const std::size_t pos = json_skip_ws(raw, 0);
  if (pos >= raw.size()) {
    return JsonType::Invalid;
  }
  const char ch = raw[pos];
  switch (ch) {
  case '{':
    return JsonType::Object;
  case '[':
    return JsonType::Array;
  case '"':
    return JsonType::String;
  case 't':
  case 'f':
    return JsonType::Boolean;
  case 'n':
    return JsonType::Null;
  default:
    if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch)) != 0) {
      return JsonType::Number;
    }
    return JsonType::Invalid;
  }
}

std::string json_type_name(const JsonType type) {
  switch (type) {
  case JsonType::Null:
    return "null";
  case JsonType::Boolean:
    return "boolean";
  case JsonType::Number:
    return "number";
  case JsonType::String:
    return "string";
  case JsonType::Array:
    return "array";
  case JsonType::Object:
    return "object";
  case JsonType::Invalid:
    break;
  }
  return "invalid";
}

} // namespace warden::common
