#pragma once

#include <cstddef>
#include <string>

namespace warden::common {

/// Lowercase hex SHA-256 digest of text.
[[nodiscard]] std::string sha256_hex(const std::string &text);

/// Hex string of `bytes` cryptographically random bytes.
[[nodiscard]] std::string random_hex(std::size_t bytes = 8);

} // namespace warden::common
