#include "warden/security/tier.hpp"

#include "warden/common/fs.hpp"

namespace warden::security {

std::string tier_to_string(const SecurityTier tier) {
  return "T" + std::to_string(static_cast<int>(tier));
}

common::Result<SecurityTier> tier_from_string(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized.size() == 2 && normalized[0] == 't' && normalized[1] >= '0' &&
      normalized[1] <= '4') {
    return common::Result<SecurityTier>::success(static_cast<SecurityTier>(normalized[1] - '0'));
  }
  return common::Result<SecurityTier>::failure("invalid security tier: " + value +
                                               " (expected t0..t4)");
}

} // namespace warden::security
