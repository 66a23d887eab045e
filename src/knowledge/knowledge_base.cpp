#include "notegraph/knowledge/knowledge_base.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/config/config.hpp"
#include "notegraph/observability/global.hpp"
#include "notegraph/store/tags.hpp"
#include "notegraph/vector/neighbor_graph.hpp"
#include "notegraph/vector/ranker.hpp"

#include <chrono>

namespace notegraph::knowledge {

namespace {

using Clock = std::chrono::steady_clock;

std::chrono::milliseconds elapsed_since(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

template <typename T> common::Result<T> fail(const std::string &component, common::Result<T> result) {
  observability::record_error(component, result.error());
  return result;
}

common::Status fail(const std::string &component, common::Status status) {
  observability::record_error(component, status.error());
  return status;
}

} // namespace

KnowledgeBase::KnowledgeBase(config::Config config, std::unique_ptr<encoder::IEncoder> encoder,
                             std::unique_ptr<store::SqliteStore> store)
    : config_(std::move(config)), encoder_(std::move(encoder)), store_(std::move(store)),
      files_(config::data_dir(config_) / "files", *store_),
      skip_tags_(config_.autotag.skip_tags.begin(), config_.autotag.skip_tags.end()) {}

common::Result<std::unique_ptr<KnowledgeBase>>
KnowledgeBase::open(const config::Config &config, std::unique_ptr<encoder::IEncoder> encoder) {
  if (encoder == nullptr) {
    return common::Result<std::unique_ptr<KnowledgeBase>>::failure(
        "no encoder configured", common::ErrorCode::InvalidArgument);
  }
  const auto dir = config::data_dir(config);
  auto ensured = common::ensure_dir(dir / "files");
  if (!ensured.ok()) {
    return common::Result<std::unique_ptr<KnowledgeBase>>::failure_from(ensured);
  }

  auto opened = store::SqliteStore::open(dir / "db.sqlite", config.encoder.cache_size);
  if (!opened.ok()) {
    return fail("store", common::Result<std::unique_ptr<KnowledgeBase>>::failure_from(opened));
  }
  return common::Result<std::unique_ptr<KnowledgeBase>>::success(std::make_unique<KnowledgeBase>(
      config, std::move(encoder), std::move(opened.value())));
}

common::Result<vector::Vector> KnowledgeBase::embedding_for_text(const std::string &text) {
  const std::string cache_key =
      encoder_->cache_id() + ":" + std::to_string(encoder_->dimensions()) + ":" + text;

  auto cached = store_->cached_embedding(cache_key);
  if (!cached.ok()) {
    return fail("store", common::Result<vector::Vector>::failure_from(cached));
  }
  if (cached.value().has_value()) {
    observability::record_encoder_call(std::string(encoder_->name()),
                                       std::chrono::milliseconds(0), true, true);
    return common::Result<vector::Vector>::success(std::move(*cached.value()));
  }

  const auto start = Clock::now();
  auto encoded = encoder_->encode(text);
  observability::record_encoder_call(std::string(encoder_->name()), elapsed_since(start),
                                     encoded.ok(), false);
  if (!encoded.ok()) {
    return fail("encoder", common::Result<vector::Vector>::failure(encoded.error(),
                                                                   common::ErrorCode::EncodingFailed));
  }

  auto cache_status = store_->cache_embedding(cache_key, encoded.value());
  if (!cache_status.ok()) {
    return fail("store", common::Result<vector::Vector>::failure_from(cache_status));
  }
  return encoded;
}

common::Result<vector::CentroidMap> KnowledgeBase::centroids() {
  auto load = [this]() { return store::collect_tag_vectors(*store_); };

  if (!config_.autotag.cache_centroids) {
    auto tagged = load();
    if (!tagged.ok()) {
      return common::Result<vector::CentroidMap>::failure_from(tagged);
    }
    return common::Result<vector::CentroidMap>::success(
        vector::compute_centroids(tagged.value(), skip_tags_));
  }

  auto result = centroid_cache_.get(store_->membership_generation(), skip_tags_, load);
  observability::record_metric(
      observability::CentroidCacheMetric{.hits = centroid_cache_.hits(),
                                         .misses = centroid_cache_.misses()});
  return result;
}

common::Result<std::vector<vector::ScoredTag>>
KnowledgeBase::suggest_for_vector(const vector::Vector &values) {
  auto centroid_map = centroids();
  if (!centroid_map.ok()) {
    return fail("autotag",
                common::Result<std::vector<vector::ScoredTag>>::failure_from(centroid_map));
  }
  return common::Result<std::vector<vector::ScoredTag>>::success(
      vector::scored_tags(values, centroid_map.value(),
                          static_cast<float>(config_.autotag.threshold),
                          config_.autotag.max_tags));
}

void KnowledgeBase::report_corpus_size() {
  auto counted = store_->count_notes();
  if (counted.ok()) {
    observability::record_metric(observability::CorpusSizeMetric{.records = counted.value()});
  }
}

common::Result<StoredNote> KnowledgeBase::store_note(const std::string &key,
                                                     const std::string &body,
                                                     const std::vector<std::string> &tags,
                                                     const NoteOptions options) {
  const std::string clean_key = common::trim(key);
  if (clean_key.empty()) {
    return common::Result<StoredNote>::failure("note key is empty",
                                               common::ErrorCode::InvalidArgument);
  }

  StoredNote stored;
  stored.note.key = clean_key;
  stored.note.body = body;
  stored.note.tags = store::normalize_tags(tags);

  // A blank body has nothing to embed; the note is kept without a vector.
  std::optional<vector::Vector> embedding;
  if (!common::trim(body).empty()) {
    auto encoded = embedding_for_text(body);
    if (!encoded.ok()) {
      return common::Result<StoredNote>::failure_from(encoded);
    }
    embedding = std::move(encoded.value());
  }

  if (embedding.has_value() && options.autotag && config_.autotag.enabled) {
    auto suggested = suggest_for_vector(*embedding);
    if (!suggested.ok()) {
      return common::Result<StoredNote>::failure_from(suggested);
    }
    for (const auto &entry : suggested.value()) {
      if (skip_tags_.contains(entry.tag) || store::has_tag(stored.note.tags, entry.tag)) {
        continue;
      }
      stored.note.tags.push_back(entry.tag);
      stored.auto_tags.push_back(entry.tag);
    }
  }

  auto status = store_->put_note(clean_key, body, stored.note.tags, embedding);
  if (!status.ok()) {
    return fail("store", common::Result<StoredNote>::failure_from(status));
  }

  auto reloaded = store_->get_note(clean_key);
  if (reloaded.ok() && reloaded.value().has_value()) {
    stored.note = std::move(*reloaded.value());
  }

  observability::record_note_stored(clean_key, stored.note.tags, stored.auto_tags);
  report_corpus_size();
  return common::Result<StoredNote>::success(std::move(stored));
}

common::Result<std::optional<store::Note>> KnowledgeBase::get_note(const std::string &key) {
  auto note = store_->get_note(common::trim(key));
  if (!note.ok()) {
    return fail("store", std::move(note));
  }
  return note;
}

common::Result<std::vector<store::Note>>
KnowledgeBase::list_notes(const std::optional<std::string> &tag) {
  auto notes = store_->list_notes(tag);
  if (!notes.ok()) {
    return fail("store", std::move(notes));
  }
  return notes;
}

common::Result<bool> KnowledgeBase::delete_note(const std::string &key) {
  const std::string clean_key = common::trim(key);
  auto removed = store_->delete_note(clean_key);
  if (!removed.ok()) {
    return fail("store", std::move(removed));
  }
  if (removed.value()) {
    observability::record_note_deleted(clean_key);
    report_corpus_size();
  }
  return removed;
}

common::Result<std::vector<SearchHit>> KnowledgeBase::search(const std::string &query,
                                                             const std::size_t limit) {
  const auto start = Clock::now();
  if (common::trim(query).empty() || limit == 0) {
    observability::record_search("semantic", 0, elapsed_since(start));
    return common::Result<std::vector<SearchHit>>::success({});
  }

  auto query_vector = embedding_for_text(query);
  if (!query_vector.ok()) {
    return common::Result<std::vector<SearchHit>>::failure_from(query_vector);
  }

  auto candidates = store_->embeddings();
  if (!candidates.ok()) {
    return fail("search", common::Result<std::vector<SearchHit>>::failure_from(candidates));
  }

  const auto ranked = vector::rank_top(query_vector.value(), candidates.value(), limit);
  std::vector<std::string> keys;
  keys.reserve(ranked.size());
  for (const auto &entry : ranked) {
    keys.push_back(entry.key);
  }

  auto notes = store_->notes_by_keys(keys);
  if (!notes.ok()) {
    return fail("search", common::Result<std::vector<SearchHit>>::failure_from(notes));
  }

  std::vector<SearchHit> hits;
  hits.reserve(ranked.size());
  for (const auto &entry : ranked) {
    auto it = notes.value().find(entry.key);
    if (it == notes.value().end()) {
      continue;
    }
    hits.push_back(SearchHit{.note = std::move(it->second), .score = entry.score});
  }

  observability::record_search("semantic", hits.size(), elapsed_since(start));
  return common::Result<std::vector<SearchHit>>::success(std::move(hits));
}

common::Result<std::vector<store::Note>>
KnowledgeBase::keyword_search(const std::string &query, const std::optional<std::size_t> limit) {
  const auto start = Clock::now();
  auto notes = store_->keyword_search(common::trim(query), limit);
  if (!notes.ok()) {
    return fail("search", std::move(notes));
  }
  observability::record_search("keyword", notes.value().size(), elapsed_since(start));
  return notes;
}

common::Result<std::vector<vector::ScoredTag>>
KnowledgeBase::suggest_tags_for(const std::string &key) {
  const std::string clean_key = common::trim(key);
  auto note = store_->get_note(clean_key);
  if (!note.ok()) {
    return fail("store", common::Result<std::vector<vector::ScoredTag>>::failure_from(note));
  }
  if (!note.value().has_value()) {
    return common::Result<std::vector<vector::ScoredTag>>::failure(
        "note not found: " + clean_key, common::ErrorCode::NotFound);
  }

  auto stored = store_->embedding(clean_key);
  if (!stored.ok()) {
    return fail("store", common::Result<std::vector<vector::ScoredTag>>::failure_from(stored));
  }
  vector::Vector values;
  if (stored.value().has_value()) {
    values = std::move(*stored.value());
  } else if (!common::trim(note.value()->body).empty()) {
    auto encoded = embedding_for_text(note.value()->body);
    if (!encoded.ok()) {
      return common::Result<std::vector<vector::ScoredTag>>::failure_from(encoded);
    }
    values = std::move(encoded.value());
  } else {
    return common::Result<std::vector<vector::ScoredTag>>::success({});
  }

  auto suggested = suggest_for_vector(values);
  if (!suggested.ok()) {
    return suggested;
  }
  std::erase_if(suggested.value(), [&](const vector::ScoredTag &entry) {
    return store::has_tag(note.value()->tags, entry.tag);
  });
  return suggested;
}

common::Result<std::vector<vector::ScoredTag>>
KnowledgeBase::suggest_tags_for_text(const std::string &text) {
  if (common::trim(text).empty()) {
    return common::Result<std::vector<vector::ScoredTag>>::success({});
  }
  auto encoded = embedding_for_text(text);
  if (!encoded.ok()) {
    return common::Result<std::vector<vector::ScoredTag>>::failure_from(encoded);
  }
  return suggest_for_vector(encoded.value());
}

common::Result<std::size_t> KnowledgeBase::backfill() {
  auto keys = store_->keys_without_embedding();
  if (!keys.ok()) {
    return fail("store", common::Result<std::size_t>::failure_from(keys));
  }

  std::size_t added = 0;
  for (const auto &key : keys.value()) {
    auto note = store_->get_note(key);
    if (!note.ok()) {
      return fail("store", common::Result<std::size_t>::failure_from(note));
    }
    if (!note.value().has_value() || common::trim(note.value()->body).empty()) {
      continue;
    }

    auto encoded = embedding_for_text(note.value()->body);
    if (!encoded.ok()) {
      return common::Result<std::size_t>::failure("backfill stopped at '" + key + "' after " +
                                                       std::to_string(added) +
                                                       " notes: " + encoded.error(),
                                                   encoded.code());
    }
    auto status = store_->put_embedding(key, encoded.value());
    if (!status.ok()) {
      return fail("store", common::Result<std::size_t>::failure_from(status));
    }
    ++added;
  }
  return common::Result<std::size_t>::success(added);
}

common::Result<GraphView> KnowledgeBase::graph(const std::size_t k) {
  const auto start = Clock::now();
  auto rows = store_->graph_rows();
  if (!rows.ok()) {
    return fail("graph", common::Result<GraphView>::failure_from(rows));
  }

  std::vector<vector::KeyedVector> records;
  records.reserve(rows.value().size());
  for (const auto &row : rows.value()) {
    records.push_back(vector::KeyedVector{row.key, row.embedding});
  }

  const auto built = vector::build_graph(records, k);
  auto view = make_graph_view(built, rows.value(), config_.graph.snippet_chars);
  observability::record_graph_built(view.nodes.size(), view.edges.size(), elapsed_since(start));
  return common::Result<GraphView>::success(std::move(view));
}

} // namespace notegraph::knowledge
