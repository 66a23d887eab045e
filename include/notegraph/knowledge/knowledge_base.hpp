#pragma once

#include "notegraph/config/schema.hpp"
#include "notegraph/encoder/encoder.hpp"
#include "notegraph/knowledge/graph_view.hpp"
#include "notegraph/store/file_store.hpp"
#include "notegraph/store/sqlite_store.hpp"
#include "notegraph/vector/centroids.hpp"

#include <memory>

namespace notegraph::knowledge {

struct StoredNote {
  store::Note note;
  /// Tags added by centroid suggestion, already merged into note.tags.
  std::vector<std::string> auto_tags;
};

struct SearchHit {
  store::Note note;
  float score = 0.0F;
};

struct NoteOptions {
  bool autotag = true;
};

/// Note store with semantic search, tag inference and the similarity graph.
/// Owns the encoder and the database.
class KnowledgeBase {
public:
  KnowledgeBase(config::Config config, std::unique_ptr<encoder::IEncoder> encoder,
                std::unique_ptr<store::SqliteStore> store);

  /// Opens `<data_dir>/db.sqlite` and `<data_dir>/files/`.
  [[nodiscard]] static common::Result<std::unique_ptr<KnowledgeBase>>
  open(const config::Config &config, std::unique_ptr<encoder::IEncoder> encoder);

  /// Encodes the body, merges suggested tags after `tags` when auto-tagging
  /// is on, and persists note and embedding together. On an encoder failure
  /// nothing is written.
  [[nodiscard]] common::Result<StoredNote> store_note(const std::string &key,
                                                      const std::string &body,
                                                      const std::vector<std::string> &tags,
                                                      NoteOptions options = {});
  [[nodiscard]] common::Result<std::optional<store::Note>> get_note(const std::string &key);
  [[nodiscard]] common::Result<std::vector<store::Note>>
  list_notes(const std::optional<std::string> &tag = std::nullopt);
  [[nodiscard]] common::Result<bool> delete_note(const std::string &key);

  /// Notes ranked by similarity to `query`, best first. A blank query
  /// returns nothing without calling the encoder.
  [[nodiscard]] common::Result<std::vector<SearchHit>> search(const std::string &query,
                                                              std::size_t limit);
  /// Every substring match unless `limit` is given.
  [[nodiscard]] common::Result<std::vector<store::Note>>
  keyword_search(const std::string &query, std::optional<std::size_t> limit = std::nullopt);

  /// Suggestions for a stored note, excluding tags it already carries.
  [[nodiscard]] common::Result<std::vector<vector::ScoredTag>>
  suggest_tags_for(const std::string &key);
  [[nodiscard]] common::Result<std::vector<vector::ScoredTag>>
  suggest_tags_for_text(const std::string &text);

  /// Embeds every note that has no vector yet. Returns how many were added.
  [[nodiscard]] common::Result<std::size_t> backfill();

  [[nodiscard]] common::Result<GraphView> graph(std::size_t k);

  [[nodiscard]] store::SqliteStore &store() { return *store_; }
  [[nodiscard]] store::FileStore &files() { return files_; }
  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] const vector::CentroidCache &centroid_cache() const { return centroid_cache_; }

private:
  [[nodiscard]] common::Result<vector::Vector> embedding_for_text(const std::string &text);
  [[nodiscard]] common::Result<vector::CentroidMap> centroids();
  [[nodiscard]] common::Result<std::vector<vector::ScoredTag>>
  suggest_for_vector(const vector::Vector &values);
  void report_corpus_size();

  config::Config config_;
  std::unique_ptr<encoder::IEncoder> encoder_;
  std::unique_ptr<store::SqliteStore> store_;
  store::FileStore files_;
  vector::TagSet skip_tags_;
  vector::CentroidCache centroid_cache_;
};

} // namespace notegraph::knowledge
