#include "notegraph/observability/log_observer.hpp"

#include "notegraph/common/fs.hpp"

#include <iostream>
#include <sstream>
#include <type_traits>

namespace notegraph::observability {

namespace {

std::string join(const std::vector<std::string> &values) {
  std::string out;
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ',';
    }
    out += values[i];
  }
  return out;
}

const char *level_label(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

} // namespace

std::optional<LogLevel> parse_log_level(const std::string &name) {
  const std::string level = common::to_lower(common::trim(name));
  if (level == "debug") {
    return LogLevel::Debug;
  }
  if (level == "info") {
    return LogLevel::Info;
  }
  if (level == "error") {
    return LogLevel::Error;
  }
  return std::nullopt;
}

LogObserver::LogObserver(const LogLevel min_level) : out_(&std::cerr), min_level_(min_level) {}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(&out), min_level_(min_level) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << level_label(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, NoteStoredEvent>) {
          log_line(LogLevel::Info, "note.stored key=" + evt.key + " tags=" + join(evt.tags) +
                                       " auto_tags=" + join(evt.auto_tags));
        } else if constexpr (std::is_same_v<T, NoteDeletedEvent>) {
          log_line(LogLevel::Info, "note.deleted key=" + evt.key);
        } else if constexpr (std::is_same_v<T, SearchEvent>) {
          log_line(LogLevel::Info, "search mode=" + evt.mode +
                                       " results=" + std::to_string(evt.results) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, GraphBuiltEvent>) {
          log_line(LogLevel::Info, "graph.built nodes=" + std::to_string(evt.nodes) +
                                       " edges=" + std::to_string(evt.edges) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, EncoderCallEvent>) {
          if (min_level_ > LogLevel::Debug) {
            return;
          }
          log_line(LogLevel::Debug, "encoder.call name=" + evt.encoder +
                                        " success=" + (evt.success ? "true" : "false") +
                                        " cached=" + (evt.cached ? "true" : "false") +
                                        " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  if (min_level_ > LogLevel::Debug) {
    return;
  }
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, CorpusSizeMetric>) {
          log_line(LogLevel::Debug, "metric.corpus_records=" + std::to_string(m.records));
        } else if constexpr (std::is_same_v<T, CentroidCacheMetric>) {
          log_line(LogLevel::Debug, "metric.centroid_cache hits=" + std::to_string(m.hits) +
                                        " misses=" + std::to_string(m.misses));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace notegraph::observability
