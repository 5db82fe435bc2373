#pragma once

#include "warden/events/event_bus.hpp"
#include "warden/security/approval.hpp"

#include <atomic>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace warden::cli {

/// Answers approval requests from a terminal. Each ApprovalRequested event is shown
/// on out and resolved from one line of input: "y" or "yes" approves, anything else
/// denies.
class ConsoleApprover {
public:
  /// With input_fd >= 0 the line is read from that descriptor with poll() so a
  /// request that times out or a stop() never leaves the reader blocked; otherwise
  /// it is read from in.
  ConsoleApprover(std::shared_ptr<security::ApprovalBroker> broker,
                  std::shared_ptr<events::EventBus> bus, std::istream &in, std::ostream &out,
                  int input_fd = -1);
  ~ConsoleApprover();

  ConsoleApprover(const ConsoleApprover &) = delete;
  ConsoleApprover &operator=(const ConsoleApprover &) = delete;

  void start();
  void stop();

  /// Prompts for one request. Returns false when it was no longer pending.
  bool handle(const events::ApprovalRequested &request);

private:
  void run();
  [[nodiscard]] std::optional<std::string> read_answer(const std::string &request_id);

  std::shared_ptr<security::ApprovalBroker> broker_;
  std::shared_ptr<events::EventBus> bus_;
  std::istream &in_;
  std::ostream &out_;
  int input_fd_;
  events::SubscriptionPtr subscription_;
  std::atomic<bool> running_{false};
  std::thread thread_;
};

} // namespace warden::cli
