#pragma once

#include <optional>
#include <regex>
#include <string>
#include <vector>

namespace warden::security {

/// A configurable matcher over serialized tool arguments. A leading "(?i)" makes the
/// pattern case-insensitive.
struct DangerousPattern {
  std::string pattern;
  std::string label;
};

[[nodiscard]] std::vector<DangerousPattern> default_dangerous_patterns();

class PatternMatcher {
public:
  PatternMatcher() = default;

  /// Compiles every pattern; invalid ones are skipped and reported in warnings().
  [[nodiscard]] static PatternMatcher compile(const std::vector<DangerousPattern> &patterns);

  /// Label of the first pattern matching text.
  [[nodiscard]] std::optional<std::string> match(const std::string &text) const;

  [[nodiscard]] std::size_t size() const { return entries_.size(); }
  [[nodiscard]] const std::vector<std::string> &warnings() const { return warnings_; }

private:
  struct Entry {
    std::string label;
    std::regex regex;
  };

  std::vector<Entry> entries_;
  std::vector<std::string> warnings_;
};

} // namespace warden::security
