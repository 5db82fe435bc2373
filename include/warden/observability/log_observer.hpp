#pragma once

#include "warden/observability/observer.hpp"

#include <ostream>

namespace warden::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

[[nodiscard]] LogLevel log_level_from_string(const std::string &value);

class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info, std::ostream *out = nullptr);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream *out_;
};

} // namespace warden::observability
