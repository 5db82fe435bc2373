#include "warden/observability/multi_observer.hpp"

namespace warden::observability {

bool MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr) {
    return false;
  }
  std::string members = name_.substr(6, name_.size() - 7);
  if (!members.empty()) {
    members.push_back('+');
  }
  members += observer->name();
  name_ = "multi(" + members + ")";
  observers_.push_back(std::move(observer));
  return true;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace warden::observability
