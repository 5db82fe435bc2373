#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace warden::observability {

struct RunStartEvent {
  std::string session_id;
  std::string model;
  bool resumed = false;
};

struct RunEndEvent {
  std::string session_id;
  std::string status;
  std::chrono::milliseconds duration{0};
  std::optional<std::uint64_t> tokens_used;
};

struct ToolCallEvent {
  std::string tool;
  std::chrono::milliseconds duration{0};
  bool success = false;
};

struct GateDecisionEvent {
  std::string tool;
  std::string effective_tier;
  std::string outcome;
  std::optional<std::string> matched_pattern;
};

struct ApprovalEvent {
  std::string request_id;
  std::string tool;
  std::string status;
};

struct WatchdogHintEvent {
  std::string session_id;
  std::string kind;
  std::string message;
};

struct VerdictEvent {
  std::string session_id;
  std::string verdict;
  double confidence = 0.0;
};

struct ContextPrunedEvent {
  std::string session_id;
  std::size_t messages_removed = 0;
  std::size_t estimated_tokens = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<RunStartEvent, RunEndEvent, ToolCallEvent, GateDecisionEvent,
                                   ApprovalEvent, WatchdogHintEvent, VerdictEvent,
                                   ContextPrunedEvent, ErrorEvent>;

struct ModelLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct TokensUsedMetric {
  std::uint64_t tokens = 0;
};

struct PendingApprovalsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ModelLatencyMetric, TokensUsedMetric, PendingApprovalsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace warden::observability
