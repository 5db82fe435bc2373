#include "warden/cli/console_approver.hpp"

#include "warden/common/fs.hpp"
#include "warden/security/tier.hpp"

#include <array>
#include <chrono>
#include <istream>
#include <ostream>

#include <poll.h>
#include <unistd.h>

namespace warden::cli {

namespace {

constexpr std::size_t kArgumentPreview = 200;

bool still_pending(const security::ApprovalBroker &broker, const std::string &request_id) {
  const auto status = broker.status(request_id);
  return status.has_value() && *status == security::ApprovalStatus::Pending;
}

} // namespace

ConsoleApprover::ConsoleApprover(std::shared_ptr<security::ApprovalBroker> broker,
                                 std::shared_ptr<events::EventBus> bus, std::istream &in,
                                 std::ostream &out, const int input_fd)
    : broker_(std::move(broker)), bus_(std::move(bus)), in_(in), out_(out), input_fd_(input_fd) {}

ConsoleApprover::~ConsoleApprover() { stop(); }

void ConsoleApprover::start() {
  if (running_ || !bus_ || !broker_) {
    return;
  }
  subscription_ = bus_->subscribe(events::EventFilter{
      .session_id = std::nullopt,
      .kinds = {events::EventKind::ApprovalRequested},
  });
  running_ = true;
  thread_ = std::thread([this]() { run(); });
}

void ConsoleApprover::stop() {
  running_ = false;
  if (subscription_) {
    subscription_->close();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  subscription_.reset();
}

void ConsoleApprover::run() {
  while (running_) {
    auto envelope = subscription_->next(std::chrono::milliseconds(100));
    if (!envelope.has_value()) {
      if (subscription_->closed()) {
        break;
      }
      continue;
    }
    if (const auto *request = std::get_if<events::ApprovalRequested>(&envelope->event.payload)) {
      (void)handle(*request);
    }
  }
}

bool ConsoleApprover::handle(const events::ApprovalRequested &request) {
  if (!still_pending(*broker_, request.request_id)) {
    return false;
  }
  std::string arguments = request.arguments_json;
  if (arguments.size() > kArgumentPreview) {
    arguments = arguments.substr(0, kArgumentPreview) + "...";
  }
  out_ << "\n[approval " << request.request_id.substr(0, 8) << "] " << request.tool << " ("
       << security::tier_to_string(request.tier) << ")\n"
       << "  reason: " << request.reason << "\n"
       << "  arguments: " << arguments << "\n"
       << "  allow? [y/N] (" << request.timeout_secs << "s) " << std::flush;

  const auto answer = read_answer(request.request_id);
  if (!answer.has_value()) {
    out_ << "\n";
    return false;
  }
  const std::string normalized = common::to_lower(common::trim(*answer));
  const auto resolution = (normalized == "y" || normalized == "yes")
                              ? security::ApprovalResolution::Approve
                              : security::ApprovalResolution::Deny;
  if (!broker_->resolve(request.request_id, resolution)) {
    out_ << "request already resolved\n";
    return false;
  }
  return true;
}

std::optional<std::string> ConsoleApprover::read_answer(const std::string &request_id) {
  if (input_fd_ < 0) {
    std::string line;
    if (!std::getline(in_, line)) {
      return std::nullopt;
    }
    return line;
  }

  std::string line;
  while (running_ && still_pending(*broker_, request_id)) {
    struct pollfd pfd {
      .fd = input_fd_,
      .events = POLLIN,
      .revents = 0,
    };
    if (poll(&pfd, 1, 100) <= 0) {
      continue;
    }
    std::array<char, 256> chunk{};
    const ssize_t bytes = ::read(input_fd_, chunk.data(), chunk.size());
    if (bytes <= 0) {
      return std::nullopt;
    }
    line.append(chunk.data(), static_cast<std::size_t>(bytes));
    const auto newline = line.find('\n');
    if (newline != std::string::npos) {
      return line.substr(0, newline);
    }
  }
  return std::nullopt;
}

} // namespace warden::cli
