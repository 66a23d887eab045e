#pragma once

#include "notegraph/store/note.hpp"
#include "notegraph/store/repository.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <sqlite3.h>
#include <unordered_map>

namespace notegraph::store {

/// Notes, their embeddings, file metadata and the embedding cache in one
/// SQLite database (WAL journal). All methods are thread-safe.
class SqliteStore final : public IRecordRepository {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteStore>>
  open(const std::filesystem::path &db_path, std::size_t embedding_cache_size = 10'000);

  ~SqliteStore() override;
  SqliteStore(const SqliteStore &) = delete;
  SqliteStore &operator=(const SqliteStore &) = delete;

  // IRecordRepository
  [[nodiscard]] common::Result<std::vector<vector::KeyedVector>> embeddings() override;
  [[nodiscard]] common::Result<TagMembership> tag_membership() override;
  [[nodiscard]] common::Result<std::optional<vector::Vector>>
  embedding(const std::string &key) override;
  [[nodiscard]] std::uint64_t membership_generation() const override;

  /// Upserts the note and, when given, its embedding in a single
  /// transaction. `created_at` survives an overwrite. Without an embedding
  /// any stale vector for the key is removed.
  [[nodiscard]] common::Status put_note(const std::string &key, const std::string &body,
                                        const std::vector<std::string> &tags,
                                        const std::optional<vector::Vector> &embedding);
  [[nodiscard]] common::Result<std::optional<Note>> get_note(const std::string &key);
  [[nodiscard]] common::Result<std::vector<Note>>
  list_notes(const std::optional<std::string> &tag = std::nullopt);
  /// True when a note was removed. Its embedding goes with it.
  [[nodiscard]] common::Result<bool> delete_note(const std::string &key);
  /// Case-insensitive substring match over key, body and tags, most recently
  /// updated first. Every match is returned unless `limit` is given.
  [[nodiscard]] common::Result<std::vector<Note>>
  keyword_search(const std::string &query, std::optional<std::size_t> limit = std::nullopt);
  [[nodiscard]] common::Result<std::unordered_map<std::string, Note>>
  notes_by_keys(const std::vector<std::string> &keys);
  [[nodiscard]] common::Result<std::size_t> count_notes();

  [[nodiscard]] common::Result<std::vector<std::string>> keys_without_embedding();
  [[nodiscard]] common::Status put_embedding(const std::string &key,
                                             const vector::Vector &embedding);
  [[nodiscard]] common::Result<std::vector<GraphRow>> graph_rows();

  [[nodiscard]] common::Result<std::optional<vector::Vector>>
  cached_embedding(const std::string &cache_key);
  [[nodiscard]] common::Status cache_embedding(const std::string &cache_key,
                                               const vector::Vector &embedding);
  [[nodiscard]] common::Result<std::size_t> cache_size();

  [[nodiscard]] common::Status put_file_meta(const FileMeta &meta);
  [[nodiscard]] common::Result<std::optional<FileMeta>> get_file_meta(const std::string &name);
  [[nodiscard]] common::Result<std::vector<FileMeta>>
  list_file_meta(const std::optional<std::string> &tag = std::nullopt);
  [[nodiscard]] common::Result<bool> delete_file_meta(const std::string &name);

private:
  SqliteStore(sqlite3 *db, std::size_t embedding_cache_size);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status upsert_embedding(const std::string &key,
                                                const vector::Vector &embedding);
  [[nodiscard]] common::Result<Note> row_to_note(sqlite3_stmt *stmt) const;
  [[nodiscard]] common::Result<FileMeta> row_to_file_meta(sqlite3_stmt *stmt) const;
  [[nodiscard]] std::optional<sqlite3_int64> data_version() const;

  sqlite3 *db_ = nullptr;
  std::size_t embedding_cache_size_;
  mutable std::mutex mutex_;
  mutable std::atomic<std::uint64_t> generation_{0};
  // Last `PRAGMA data_version` seen; guarded by mutex_.
  mutable sqlite3_int64 last_data_version_ = 0;
};

/// SHA-256 of `text`, lowercase hex.
[[nodiscard]] std::string sha256_hex(const std::string &text);

} // namespace notegraph::store
