#include "notegraph/observability/factory.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/observability/log_observer.hpp"
#include "notegraph/observability/multi_observer.hpp"

#include <sstream>

namespace notegraph::observability {

namespace {

/// One backend entry: "none", "noop", "log" or "log:<level>". Unknown names
/// fall back to an INFO log so misconfiguration stays visible.
std::unique_ptr<IObserver> create_single(const std::string &entry) {
  if (entry.empty() || entry == "none" || entry == "noop") {
    return std::make_unique<NoopObserver>();
  }

  const auto colon = entry.find(':');
  if (colon != std::string::npos && entry.substr(0, colon) == "log") {
    const auto level = parse_log_level(entry.substr(colon + 1));
    return std::make_unique<LogObserver>(level.value_or(LogLevel::Info));
  }
  return std::make_unique<LogObserver>();
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend.find(',') == std::string::npos) {
    return create_single(backend);
  }

  auto multi = std::make_unique<MultiObserver>();
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string entry = common::trim(part);
    if (!entry.empty()) {
      multi->add(create_single(entry));
    }
  }
  if (multi->size() == 0) {
    return std::make_unique<NoopObserver>();
  }
  return multi;
}

} // namespace notegraph::observability
