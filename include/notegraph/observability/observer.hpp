#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace notegraph::observability {

struct NoteStoredEvent {
  std::string key;
  std::vector<std::string> tags;
  std::vector<std::string> auto_tags;
};

struct NoteDeletedEvent {
  std::string key;
};

struct SearchEvent {
  std::string mode;
  std::size_t results = 0;
  std::chrono::milliseconds duration{0};
};

struct GraphBuiltEvent {
  std::size_t nodes = 0;
  std::size_t edges = 0;
  std::chrono::milliseconds duration{0};
};

struct EncoderCallEvent {
  std::string encoder;
  std::chrono::milliseconds duration{0};
  bool success = false;
  bool cached = false;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<NoteStoredEvent, NoteDeletedEvent, SearchEvent,
                                   GraphBuiltEvent, EncoderCallEvent, ErrorEvent>;

struct CorpusSizeMetric {
  std::uint64_t records = 0;
};

struct CentroidCacheMetric {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
};

using ObserverMetric = std::variant<CorpusSizeMetric, CentroidCacheMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

class NoopObserver final : public IObserver {
public:
  void record_event(const ObserverEvent &) override {}
  void record_metric(const ObserverMetric &) override {}
  [[nodiscard]] std::string_view name() const override { return "noop"; }
};

} // namespace notegraph::observability
