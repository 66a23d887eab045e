#include "notegraph/observability/multi_observer.hpp"

namespace notegraph::observability {

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer == nullptr || observer->name() == "noop") {
    return;
  }
  observers_.push_back(std::move(observer));
}

std::string MultiObserver::describe() const {
  std::string out;
  for (const auto &observer : observers_) {
    if (!out.empty()) {
      out += ',';
    }
    out += observer->name();
  }
  return out;
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (const auto &observer : observers_) {
    observer->record_event(event);
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (const auto &observer : observers_) {
    observer->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (const auto &observer : observers_) {
    observer->flush();
  }
}

} // namespace notegraph::observability
