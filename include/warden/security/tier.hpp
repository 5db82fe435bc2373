#pragma once

#include "warden/common/result.hpp"

#include <string>

namespace warden::security {

/// Ordinal risk classification. T0 is read-only and harmless, T4 is critical.
enum class SecurityTier { T0 = 0, T1 = 1, T2 = 2, T3 = 3, T4 = 4 };

[[nodiscard]] std::string tier_to_string(SecurityTier tier);
[[nodiscard]] common::Result<SecurityTier> tier_from_string(const std::string &value);

[[nodiscard]] constexpr SecurityTier max_tier(const SecurityTier a, const SecurityTier b) {
  return static_cast<int>(a) >= static_cast<int>(b) ? a : b;
}

[[nodiscard]] constexpr SecurityTier min_tier(const SecurityTier a, const SecurityTier b) {
  return static_cast<int>(a) <= static_cast<int>(b) ? a : b;
}

} // namespace warden::security
