#include "warden/observability/global.hpp"

#include <mutex>

namespace warden::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_run_start(const std::string &session_id, const std::string &model, const bool resumed) {
  record_event(RunStartEvent{.session_id = session_id, .model = model, .resumed = resumed});
}

void record_run_end(const std::string &session_id, const std::string &status,
                    const std::chrono::milliseconds duration,
                    const std::optional<std::uint64_t> tokens) {
  record_event(RunEndEvent{
      .session_id = session_id, .status = status, .duration = duration, .tokens_used = tokens});
}

void record_tool_call(const std::string &tool, const std::chrono::milliseconds duration,
                      const bool success) {
  record_event(ToolCallEvent{.tool = tool, .duration = duration, .success = success});
}

void record_gate_decision(const std::string &tool, const std::string &effective_tier,
                          const std::string &outcome,
                          const std::optional<std::string> &matched_pattern) {
  record_event(GateDecisionEvent{.tool = tool,
                                 .effective_tier = effective_tier,
                                 .outcome = outcome,
                                 .matched_pattern = matched_pattern});
}

void record_approval(const std::string &request_id, const std::string &tool,
                     const std::string &status) {
  record_event(ApprovalEvent{.request_id = request_id, .tool = tool, .status = status});
}

void record_watchdog_hint(const std::string &session_id, const std::string &kind,
                          const std::string &message) {
  record_event(WatchdogHintEvent{.session_id = session_id, .kind = kind, .message = message});
}

void record_context_pruned(const std::string &session_id, const std::size_t messages_removed,
                           const std::size_t estimated_tokens) {
  record_event(ContextPrunedEvent{.session_id = session_id,
                                  .messages_removed = messages_removed,
                                  .estimated_tokens = estimated_tokens});
}

void record_verdict(const std::string &session_id, const std::string &verdict,
                    const double confidence) {
  record_event(VerdictEvent{.session_id = session_id, .verdict = verdict, .confidence = confidence});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace warden::observability
