#pragma once

#include <cstdint>
#include <string>

namespace warden::common {

[[nodiscard]] std::string now_rfc3339();
[[nodiscard]] std::int64_t unix_millis();

} // namespace warden::common
