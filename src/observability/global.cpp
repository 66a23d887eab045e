#include "notegraph/observability/global.hpp"

#include <mutex>

namespace notegraph::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_note_stored(const std::string &key, const std::vector<std::string> &tags,
                        const std::vector<std::string> &auto_tags) {
  record_event(NoteStoredEvent{.key = key, .tags = tags, .auto_tags = auto_tags});
}

void record_note_deleted(const std::string &key) { record_event(NoteDeletedEvent{.key = key}); }

void record_search(const std::string &mode, const std::size_t results,
                   const std::chrono::milliseconds duration) {
  record_event(SearchEvent{.mode = mode, .results = results, .duration = duration});
}

void record_graph_built(const std::size_t nodes, const std::size_t edges,
                        const std::chrono::milliseconds duration) {
  record_event(GraphBuiltEvent{.nodes = nodes, .edges = edges, .duration = duration});
}

void record_encoder_call(const std::string &encoder, const std::chrono::milliseconds duration,
                         const bool success, const bool cached) {
  record_event(EncoderCallEvent{
      .encoder = encoder, .duration = duration, .success = success, .cached = cached});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace notegraph::observability
