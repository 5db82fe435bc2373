#pragma once

#include "warden/common/cancellation.hpp"
#include "warden/events/event_bus.hpp"
#include "warden/security/approval_status.hpp"
#include "warden/security/gate.hpp"
#include "warden/tools/tool.hpp"

#include <chrono>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace warden::security {

struct ApprovalRequest {
  std::string id;
  std::string session_id;
  tools::ToolCall call;
  SecurityDecision decision;
  std::string created_at;
  std::chrono::steady_clock::time_point deadline;
  ApprovalStatus status = ApprovalStatus::Pending;
};

struct ApprovalTicket {
  std::string request_id;
  std::shared_future<ApprovalStatus> outcome;
  std::chrono::steady_clock::time_point deadline;
};

/// Turns "needs a human" into an awaited answer with a deadline. Each request moves
/// out of Pending exactly once; the first resolver wins.
class ApprovalBroker {
public:
  explicit ApprovalBroker(std::shared_ptr<events::EventBus> bus = nullptr,
                          std::size_t history_limit = 1024);

  ApprovalBroker(const ApprovalBroker &) = delete;
  ApprovalBroker &operator=(const ApprovalBroker &) = delete;

  [[nodiscard]] ApprovalTicket request_approval(const tools::ToolCall &call,
                                                const SecurityDecision &decision,
                                                std::chrono::milliseconds timeout,
                                                const std::string &session_id);

  /// Blocks until the request is resolved, the deadline passes (TimedOut) or cancel
  /// fires (Denied).
  [[nodiscard]] ApprovalStatus await_outcome(const ApprovalTicket &ticket,
                                             const common::CancellationToken *cancel = nullptr);

  /// Returns false when the request is unknown or already resolved.
  bool resolve(const std::string &request_id, ApprovalResolution resolution);

  [[nodiscard]] std::vector<ApprovalRequest> pending() const;
  /// Unique pending request whose id starts with prefix.
  [[nodiscard]] std::optional<ApprovalRequest> find_by_prefix(const std::string &prefix) const;
  [[nodiscard]] std::optional<ApprovalStatus> status(const std::string &request_id) const;

  /// Denies every pending request of a session. Returns how many were resolved.
  std::size_t cancel_session(const std::string &session_id);

private:
  struct Entry {
    ApprovalRequest request;
    std::promise<ApprovalStatus> promise;
  };

  bool transition(const std::string &request_id, ApprovalStatus to);

  std::shared_ptr<events::EventBus> bus_;
  std::size_t history_limit_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, Entry> pending_;
  std::unordered_map<std::string, ApprovalStatus> resolved_;
  std::deque<std::string> resolved_order_;
};

} // namespace warden::security
