#include "warden/common/result.hpp"

namespace warden::common {

std::string_view error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::PolicyViolation:
    return "policy_violation";
  case ErrorKind::ToolExecution:
    return "tool_execution";
  case ErrorKind::TransientInfra:
    return "transient_infra";
  case ErrorKind::Schema:
    return "schema";
  case ErrorKind::ConstraintViolation:
    return "constraint_violation";
  case ErrorKind::CorruptCheckpoint:
    return "corrupt_checkpoint";
  case ErrorKind::Cancelled:
    return "cancelled";
  case ErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

ErrorKind error_kind_from_string(const std::string_view value) {
  for (const auto kind :
       {ErrorKind::None, ErrorKind::PolicyViolation, ErrorKind::ToolExecution,
        ErrorKind::TransientInfra, ErrorKind::Schema, ErrorKind::ConstraintViolation,
        ErrorKind::CorruptCheckpoint, ErrorKind::Cancelled}) {
    if (error_kind_to_string(kind) == value) {
      return kind;
    }
  }
  return ErrorKind::Internal;
}

} // namespace warden::common
