#pragma once

#include "warden/observability/observer.hpp"

#include <memory>

namespace warden::observability {

void set_global_observer(std::shared_ptr<IObserver> observer);
std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_run_start(const std::string &session_id, const std::string &model, bool resumed);
void record_run_end(const std::string &session_id, const std::string &status,
                    std::chrono::milliseconds duration,
                    std::optional<std::uint64_t> tokens = std::nullopt);
void record_tool_call(const std::string &tool, std::chrono::milliseconds duration, bool success);
void record_gate_decision(const std::string &tool, const std::string &effective_tier,
                          const std::string &outcome,
                          const std::optional<std::string> &matched_pattern);
void record_approval(const std::string &request_id, const std::string &tool,
                     const std::string &status);
void record_watchdog_hint(const std::string &session_id, const std::string &kind,
                          const std::string &message);
void record_verdict(const std::string &session_id, const std::string &verdict, double confidence);
void record_context_pruned(const std::string &session_id, std::size_t messages_removed,
                           std::size_t estimated_tokens);
void record_error(const std::string &component, const std::string &message);

} // namespace warden::observability
