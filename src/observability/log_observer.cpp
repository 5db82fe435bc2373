#include "warden/observability/log_observer.hpp"

#include "warden/common/fs.hpp"

#include <iostream>
#include <mutex>
#include <type_traits>

namespace warden::observability {

namespace {

std::mutex g_log_mutex;

const char *level_name(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

std::string bool_text(const bool value) { return value ? "true" : "false"; }

} // namespace

LogLevel log_level_from_string(const std::string &value) {
  const std::string lowered = common::to_lower(common::trim(value));
  if (lowered == "debug") {
    return LogLevel::Debug;
  }
  if (lowered == "warn" || lowered == "warning") {
    return LogLevel::Warn;
  }
  if (lowered == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver(const LogLevel min_level, std::ostream *out)
    : min_level_(min_level), out_(out != nullptr ? out : &std::cerr) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(g_log_mutex);
  *out_ << "[" << level_name(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, RunStartEvent>) {
          log_line(LogLevel::Info, "run.start session=" + evt.session_id + " model=" + evt.model +
                                       " resumed=" + bool_text(evt.resumed));
        } else if constexpr (std::is_same_v<T, RunEndEvent>) {
          std::string line = "run.end session=" + evt.session_id + " status=" + evt.status +
                             " duration_ms=" + std::to_string(evt.duration.count());
          if (evt.tokens_used.has_value()) {
            line += " tokens=" + std::to_string(*evt.tokens_used);
          }
          log_line(LogLevel::Info, line);
        } else if constexpr (std::is_same_v<T, ToolCallEvent>) {
          log_line(LogLevel::Info, "tool.call name=" + evt.tool + " success=" +
                                       bool_text(evt.success) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, GateDecisionEvent>) {
          std::string line = "gate.decision tool=" + evt.tool + " tier=" + evt.effective_tier +
                             " outcome=" + evt.outcome;
          if (evt.matched_pattern.has_value()) {
            line += " pattern=\"" + *evt.matched_pattern + "\"";
          }
          log_line(evt.outcome == "deny" ? LogLevel::Warn : LogLevel::Debug, line);
        } else if constexpr (std::is_same_v<T, ApprovalEvent>) {
          log_line(LogLevel::Info, "approval id=" + evt.request_id + " tool=" + evt.tool +
                                       " status=" + evt.status);
        } else if constexpr (std::is_same_v<T, WatchdogHintEvent>) {
          log_line(LogLevel::Warn, "watchdog." + evt.kind + " session=" + evt.session_id + ": " +
                                       evt.message);
        } else if constexpr (std::is_same_v<T, VerdictEvent>) {
          log_line(LogLevel::Debug, "verdict session=" + evt.session_id + " kind=" + evt.verdict +
                                        " confidence=" + std::to_string(evt.confidence));
        } else if constexpr (std::is_same_v<T, ContextPrunedEvent>) {
          log_line(LogLevel::Info, "context.pruned session=" + evt.session_id +
                                       " removed=" + std::to_string(evt.messages_removed) +
                                       " estimated_tokens=" + std::to_string(evt.estimated_tokens));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ModelLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.model_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, TokensUsedMetric>) {
          log_line(LogLevel::Debug, "metric.tokens_used=" + std::to_string(m.tokens));
        } else if constexpr (std::is_same_v<T, PendingApprovalsMetric>) {
          log_line(LogLevel::Debug, "metric.pending_approvals=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(g_log_mutex);
  out_->flush();
}

} // namespace warden::observability
