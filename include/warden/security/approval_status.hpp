#pragma once

#include <string>

namespace warden::security {

enum class ApprovalStatus { Pending, Approved, Denied, TimedOut };

/// Answer an approver gives to a pending request.
enum class ApprovalResolution { Approve, Deny };

[[nodiscard]] inline std::string approval_status_to_string(const ApprovalStatus status) {
  switch (status) {
  case ApprovalStatus::Pending:
    return "pending";
  case ApprovalStatus::Approved:
    return "approved";
  case ApprovalStatus::Denied:
    return "denied";
  case ApprovalStatus::TimedOut:
    return "timed_out";
  }
  return "pending";
}

} // namespace warden::security
