#pragma once

#include "notegraph/observability/observer.hpp"

#include <iosfwd>
#include <mutex>
#include <optional>

namespace notegraph::observability {

enum class LogLevel { Debug, Info, Error };

/// "debug", "info" or "error"; anything else is nullopt.
[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &name);

/// Writes one "[LEVEL] message" line per event at or above `min_level`.
/// Encoder calls and metrics are DEBUG, domain events INFO, failures ERROR.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(std::ostream &out, LogLevel min_level = LogLevel::Info);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }
  [[nodiscard]] LogLevel min_level() const { return min_level_; }

private:
  void log_line(LogLevel level, const std::string &message);

  std::ostream *out_;
  LogLevel min_level_;
  std::mutex mutex_;
};

} // namespace notegraph::observability
