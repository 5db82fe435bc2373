#include "warden/security/patterns.hpp"

#include "warden/common/fs.hpp"

namespace warden::security {

std::vector<DangerousPattern> default_dangerous_patterns() {
  return {
      {R"(\brm\s+(-[A-Za-z]*[rR][A-Za-z]*|--recursive)\b)", "recursive delete"},
      {R"(\bgit\s+push\b.*(--force|\s-f\b))", "force push"},
      {R"(\bgit\s+reset\s+--hard\b)", "hard reset"},
      {R"((?i)\b(drop\s+(table|database|schema)|truncate\s+table)\b)", "SQL drop"},
      {R"(\bchmod\s+(-R\s+)?0?777\b)", "wide-open permissions"},
      {R"(\bmkfs(\.\w+)?\b)", "format filesystem"},
      {R"(\bdd\s+(.*\s)?(if|of)=)", "raw disk write"},
      {R"(>\s*/dev/(?!null\b|stdout\b|stderr\b|tty\b))", "write to device"},
      {R"(\b(curl|wget)\b.*\|\s*(sudo\s+)?(ba|z|k|da)?sh\b)", "pipe to shell"},
      {R"(\b(sudo|doas)\b|\bsu\s+(-|root\b))", "privilege escalation"},
      {R"(:\(\)\s*\{\s*:\s*\|\s*:\s*&\s*\}\s*;\s*:)", "fork bomb"},
  };
}

PatternMatcher PatternMatcher::compile(const std::vector<DangerousPattern> &patterns) {
  PatternMatcher matcher;
  matcher.entries_.reserve(patterns.size());
  for (const auto &pattern : patterns) {
    std::string source = pattern.pattern;
    auto flags = std::regex::ECMAScript;
    if (common::starts_with(source, "(?i)")) {
      source = source.substr(4);
      flags |= std::regex::icase;
    }
    try {
      matcher.entries_.push_back(Entry{pattern.label, std::regex(source, flags)});
    } catch (const std::regex_error &ex) {
      matcher.warnings_.push_back("skipping invalid dangerous pattern '" + pattern.pattern +
                                  "' (" + pattern.label + "): " + ex.what());
    }
  }
  return matcher;
}

std::optional<std::string> PatternMatcher::match(const std::string &text) const {
  for (const auto &entry : entries_) {
    if (std::regex_search(text, entry.regex)) {
      return entry.label;
    }
  }
  return std::nullopt;
}

} // namespace warden::security
