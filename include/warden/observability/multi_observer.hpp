#pragma once

#include "warden/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace warden::observability {

/// Fans every event and metric out to its members, in the order they were added.
class MultiObserver final : public IObserver {
public:
  /// Null observers are ignored. Returns whether the observer was added.
  bool add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  /// "multi(" followed by the member names joined with '+', e.g. "multi(log+noop)".
  [[nodiscard]] std::string_view name() const override { return name_; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
  std::string name_ = "multi()";
};

} // namespace warden::observability
