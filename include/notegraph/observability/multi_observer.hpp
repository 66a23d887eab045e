#pragma once

#include "notegraph/observability/observer.hpp"

#include <memory>
#include <vector>

namespace notegraph::observability {

/// Fans every event and metric out to its children in insertion order.
/// Null and no-op children are not kept.
class MultiObserver final : public IObserver {
public:
  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return observers_.size(); }
  /// Child names joined with ','.
  [[nodiscard]] std::string describe() const;

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> observers_;
};

} // namespace notegraph::observability
