#pragma once

#include "notegraph/observability/observer.hpp"

#include <memory>

namespace notegraph::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_note_stored(const std::string &key, const std::vector<std::string> &tags,
                        const std::vector<std::string> &auto_tags);
void record_note_deleted(const std::string &key);
void record_search(const std::string &mode, std::size_t results,
                   std::chrono::milliseconds duration);
void record_graph_built(std::size_t nodes, std::size_t edges, std::chrono::milliseconds duration);
void record_encoder_call(const std::string &encoder, std::chrono::milliseconds duration,
                         bool success, bool cached);
void record_error(const std::string &component, const std::string &message);

} // namespace notegraph::observability
