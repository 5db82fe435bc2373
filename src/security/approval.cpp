#include "warden/security/approval.hpp"

#include "warden/common/crypto.hpp"
#include "warden/common/fs.hpp"
#include "warden/common/time.hpp"
#include "warden/observability/global.hpp"

#include <algorithm>

namespace warden::security {

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(50);

} // namespace

ApprovalBroker::ApprovalBroker(std::shared_ptr<events::EventBus> bus, const std::size_t history_limit)
    : bus_(std::move(bus)), history_limit_(std::max<std::size_t>(history_limit, 1)) {}

ApprovalTicket ApprovalBroker::request_approval(const tools::ToolCall &call,
                                                const SecurityDecision &decision,
                                                const std::chrono::milliseconds timeout,
                                                const std::string &session_id) {
  ApprovalRequest request{.id = "apr-" + common::random_hex(6),
                          .session_id = session_id,
                          .call = call,
                          .decision = decision,
                          .created_at = common::now_rfc3339(),
                          .deadline = std::chrono::steady_clock::now() + timeout,
                          .status = ApprovalStatus::Pending};

  ApprovalTicket ticket{.request_id = request.id, .deadline = request.deadline};
  std::size_t pending_count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Entry entry{.request = request};
    ticket.outcome = entry.promise.get_future().share();
    pending_.emplace(request.id, std::move(entry));
    pending_count = pending_.size();
  }

  observability::record_approval(request.id, call.name, "pending");
  observability::record_metric(observability::PendingApprovalsMetric{.count = pending_count});
  if (bus_ != nullptr) {
    const auto timeout_secs = std::chrono::duration_cast<std::chrono::seconds>(timeout).count();
    bus_->publish(session_id, events::ApprovalRequested{
                                  .request_id = request.id,
                                  .call_id = call.id,
                                  .tool = call.name,
                                  .arguments_json = call.arguments_json,
                                  .tier = decision.effective_tier,
                                  .reason = decision.reason,
                                  .timeout_secs = static_cast<std::uint64_t>(timeout_secs)});
  }
  return ticket;
}

ApprovalStatus ApprovalBroker::await_outcome(const ApprovalTicket &ticket,
                                             const common::CancellationToken *cancel) {
  while (true) {
    if (ticket.outcome.wait_for(kWaitSlice) == std::future_status::ready) {
      return ticket.outcome.get();
    }
    if (cancel != nullptr && cancel->is_cancelled()) {
      (void)transition(ticket.request_id, ApprovalStatus::Denied);
      break;
    }
    if (std::chrono::steady_clock::now() >= ticket.deadline) {
      (void)transition(ticket.request_id, ApprovalStatus::TimedOut);
      break;
    }
  }
  // Whichever transition won has set the promise by now.
  return ticket.outcome.get();
}

bool ApprovalBroker::resolve(const std::string &request_id, const ApprovalResolution resolution) {
  return transition(request_id, resolution == ApprovalResolution::Approve
                                    ? ApprovalStatus::Approved
                                    : ApprovalStatus::Denied);
}

bool ApprovalBroker::transition(const std::string &request_id, const ApprovalStatus to) {
  ApprovalRequest request;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = pending_.find(request_id);
    if (it == pending_.end()) {
      return false;
    }
    it->second.request.status = to;
    it->second.promise.set_value(to);
    request = std::move(it->second.request);
    pending_.erase(it);

    resolved_[request_id] = to;
    resolved_order_.push_back(request_id);
    while (resolved_order_.size() > history_limit_) {
      resolved_.erase(resolved_order_.front());
      resolved_order_.pop_front();
    }
  }

  observability::record_approval(request.id, request.call.name, approval_status_to_string(to));
  if (bus_ != nullptr) {
    bus_->publish(request.session_id, events::ApprovalResolved{.request_id = request.id,
                                                               .call_id = request.call.id,
                                                               .tool = request.call.name,
                                                               .status = to});
  }
  return true;
}

std::vector<ApprovalRequest> ApprovalBroker::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<ApprovalRequest> out;
  out.reserve(pending_.size());
  for (const auto &[id, entry] : pending_) {
    out.push_back(entry.request);
  }
  std::sort(out.begin(), out.end(), [](const ApprovalRequest &a, const ApprovalRequest &b) {
    return a.deadline < b.deadline;
  });
  return out;
}

std::optional<ApprovalRequest> ApprovalBroker::find_by_prefix(const std::string &prefix) const {
  if (prefix.empty()) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  std::optional<ApprovalRequest> found;
  for (const auto &[id, entry] : pending_) {
    if (common::starts_with(id, prefix)) {
      if (found.has_value()) {
        return std::nullopt;
      }
      found = entry.request;
    }
  }
  return found;
}

std::optional<ApprovalStatus> ApprovalBroker::status(const std::string &request_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_.contains(request_id)) {
    return ApprovalStatus::Pending;
  }
  if (const auto it = resolved_.find(request_id); it != resolved_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::size_t ApprovalBroker::cancel_session(const std::string &session_id) {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[id, entry] : pending_) {
      if (entry.request.session_id == session_id) {
        ids.push_back(id);
      }
    }
  }
  std::size_t resolved = 0;
  for (const auto &id : ids) {
    if (transition(id, ApprovalStatus::Denied)) {
      ++resolved;
    }
  }
  return resolved;
}

} // namespace warden::security
