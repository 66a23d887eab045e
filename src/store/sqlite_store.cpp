#include "notegraph/store/sqlite_store.hpp"

#include "notegraph/store/tags.hpp"
#include "notegraph/vector/codec.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace notegraph::store {

namespace {

constexpr const char *kNoteColumns = "key, body, tags, created_at, updated_at";
constexpr const char *kFileColumns = "name, mime_type, tags, size_bytes, created_at";

std::string column_string(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

common::Result<vector::Vector> column_vector(sqlite3_stmt *stmt, const int column) {
  const void *blob = sqlite3_column_blob(stmt, column);
  const int bytes = sqlite3_column_bytes(stmt, column);
  return vector::decode_blob(blob, static_cast<std::size_t>(bytes));
}

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(msg, common::ErrorCode::Storage);
  }
  return common::Status::success();
}

common::Status storage_error(sqlite3 *db) {
  return common::Status::error(sqlite3_errmsg(db), common::ErrorCode::Storage);
}

template <typename T> common::Result<T> storage_failure(sqlite3 *db) {
  return common::Result<T>::failure(sqlite3_errmsg(db), common::ErrorCode::Storage);
}

/// Escapes LIKE wildcards so the query matches literally. Pairs with
/// `ESCAPE '\'` in the statement.
std::string like_pattern(const std::string &query) {
  std::string out = "%";
  for (const char ch : query) {
    if (ch == '%' || ch == '_' || ch == '\\') {
      out.push_back('\\');
    }
    out.push_back(ch);
  }
  out.push_back('%');
  return out;
}

/// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() succeeded.
class Transaction {
public:
  explicit Transaction(sqlite3 *db) : db_(db) {}
  ~Transaction() {
    if (active_) {
      (void)exec_sql(db_, "ROLLBACK;");
    }
  }
  Transaction(const Transaction &) = delete;
  Transaction &operator=(const Transaction &) = delete;

  [[nodiscard]] common::Status begin() {
    auto status = exec_sql(db_, "BEGIN IMMEDIATE;");
    active_ = status.ok();
    return status;
  }

  [[nodiscard]] common::Status commit() {
    auto status = exec_sql(db_, "COMMIT;");
    if (status.ok()) {
      active_ = false;
    }
    return status;
  }

private:
  sqlite3 *db_;
  bool active_ = false;
};

} // namespace

std::string sha256_hex(const std::string &text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

common::Result<std::unique_ptr<SqliteStore>>
SqliteStore::open(const std::filesystem::path &db_path, const std::size_t embedding_cache_size) {
  if (db_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(db_path.parent_path(), ec);
    if (ec) {
      return common::Result<std::unique_ptr<SqliteStore>>::failure(
          "failed to create " + db_path.parent_path().string() + ": " + ec.message(),
          common::ErrorCode::Io);
    }
  }

  sqlite3 *db = nullptr;
  if (sqlite3_open(db_path.string().c_str(), &db) != SQLITE_OK) {
    const std::string msg = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    if (db != nullptr) {
      sqlite3_close(db);
    }
    return common::Result<std::unique_ptr<SqliteStore>>::failure(
        "failed to open " + db_path.string() + ": " + msg, common::ErrorCode::Storage);
  }
  sqlite3_busy_timeout(db, 5000);

  std::unique_ptr<SqliteStore> store(new SqliteStore(db, embedding_cache_size));
  auto status = store->init_schema();
  if (!status.ok()) {
    return common::Result<std::unique_ptr<SqliteStore>>::failure_from(status);
  }
  store->last_data_version_ = store->data_version().value_or(0);
  return common::Result<std::unique_ptr<SqliteStore>>::success(std::move(store));
}

SqliteStore::SqliteStore(sqlite3 *db, const std::size_t embedding_cache_size)
    : db_(db), embedding_cache_size_(embedding_cache_size) {}

SqliteStore::~SqliteStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteStore::init_schema() {
  auto status = exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS notes (
  key TEXT PRIMARY KEY,
  body TEXT NOT NULL,
  tags TEXT NOT NULL DEFAULT '[]',
  created_at TEXT NOT NULL,
  updated_at TEXT NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS note_embeddings (
  key TEXT PRIMARY KEY,
  embedding BLOB NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  status = exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS files (
  name TEXT PRIMARY KEY,
  mime_type TEXT NOT NULL,
  tags TEXT NOT NULL DEFAULT '[]',
  size_bytes INTEGER NOT NULL DEFAULT 0,
  created_at TEXT NOT NULL
);
)");
  if (!status.ok()) {
    return status;
  }

  return exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS embedding_cache (
  text_hash TEXT PRIMARY KEY,
  embedding BLOB NOT NULL,
  created_at TEXT NOT NULL
);
)");
}

common::Result<std::vector<vector::KeyedVector>> SqliteStore::embeddings() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT key, embedding FROM note_embeddings ORDER BY key", -1,
                         &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<vector::KeyedVector>>(db_);
  }

  std::vector<vector::KeyedVector> out;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    std::string key = column_string(stmt, 0);
    auto decoded = column_vector(stmt, 1);
    if (!decoded.ok()) {
      sqlite3_finalize(stmt);
      return common::Result<std::vector<vector::KeyedVector>>::failure(
          "embedding for '" + key + "': " + decoded.error(), decoded.code());
    }
    out.push_back(vector::KeyedVector{std::move(key), std::move(decoded.value())});
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<vector::KeyedVector>>::success(std::move(out));
}

common::Result<TagMembership> SqliteStore::tag_membership() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT key, tags FROM notes ORDER BY key", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return storage_failure<TagMembership>(db_);
  }

  TagMembership membership;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    const std::string key = column_string(stmt, 0);
    auto tags = tags_from_json(column_string(stmt, 1));
    if (!tags.ok()) {
      sqlite3_finalize(stmt);
      return common::Result<TagMembership>::failure("tags for '" + key + "': " + tags.error(),
                                                    common::ErrorCode::Storage);
    }
    for (const auto &tag : tags.value()) {
      membership[tag].insert(key);
    }
  }
  sqlite3_finalize(stmt);
  return common::Result<TagMembership>::success(std::move(membership));
}

common::Result<std::optional<vector::Vector>> SqliteStore::embedding(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT embedding FROM note_embeddings WHERE key = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return storage_failure<std::optional<vector::Vector>>(db_);
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt) == SQLITE_ROW) {
    auto decoded = column_vector(stmt, 0);
    sqlite3_finalize(stmt);
    if (!decoded.ok()) {
      return common::Result<std::optional<vector::Vector>>::failure_from(decoded);
    }
    return common::Result<std::optional<vector::Vector>>::success(std::move(decoded.value()));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::optional<vector::Vector>>::success(std::nullopt);
}

std::optional<sqlite3_int64> SqliteStore::data_version() const {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "PRAGMA data_version", -1, &stmt, nullptr) != SQLITE_OK) {
    return std::nullopt;
  }
  std::optional<sqlite3_int64> version;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    version = sqlite3_column_int64(stmt, 0);
  }
  sqlite3_finalize(stmt);
  return version;
}

std::uint64_t SqliteStore::membership_generation() const {
  std::lock_guard<std::mutex> lock(mutex_);
  // data_version only moves when another connection commits.
  const auto version = data_version();
  if (!version.has_value() || *version != last_data_version_) {
    last_data_version_ = version.value_or(last_data_version_);
    ++generation_;
  }
  return generation_.load();
}

common::Status SqliteStore::upsert_embedding(const std::string &key,
                                             const vector::Vector &embedding) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO note_embeddings(key, embedding) VALUES(?1, ?2)
ON CONFLICT(key) DO UPDATE SET embedding=excluded.embedding
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_error(db_);
  }
  const auto blob = vector::encode_blob(embedding);
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_error(db_);
  }
  return common::Status::success();
}

common::Status SqliteStore::put_note(const std::string &key, const std::string &body,
                                     const std::vector<std::string> &tags,
                                     const std::optional<vector::Vector> &embedding) {
  if (key.empty()) {
    return common::Status::error("note key is empty", common::ErrorCode::InvalidArgument);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  auto status = tx.begin();
  if (!status.ok()) {
    return status;
  }

  const std::string now = now_rfc3339();
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO notes(key, body, tags, created_at, updated_at)
VALUES(?1, ?2, ?3, ?4, ?4)
ON CONFLICT(key) DO UPDATE SET
  body=excluded.body,
  tags=excluded.tags,
  updated_at=excluded.updated_at
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_error(db_);
  }
  const std::string tags_json = tags_to_json(tags);
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, body.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, tags_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 4, now.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_error(db_);
  }

  if (embedding.has_value()) {
    status = upsert_embedding(key, *embedding);
  } else {
    sqlite3_stmt *drop = nullptr;
    if (sqlite3_prepare_v2(db_, "DELETE FROM note_embeddings WHERE key = ?1", -1, &drop,
                           nullptr) != SQLITE_OK) {
      return storage_error(db_);
    }
    sqlite3_bind_text(drop, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    const int drop_rc = sqlite3_step(drop);
    sqlite3_finalize(drop);
    status = drop_rc == SQLITE_DONE ? common::Status::success() : storage_error(db_);
  }
  if (!status.ok()) {
    return status;
  }

  status = tx.commit();
  if (status.ok()) {
    ++generation_;
  }
  return status;
}

common::Result<Note> SqliteStore::row_to_note(sqlite3_stmt *stmt) const {
  Note note;
  note.key = column_string(stmt, 0);
  note.body = column_string(stmt, 1);
  auto tags = tags_from_json(column_string(stmt, 2));
  if (!tags.ok()) {
    return common::Result<Note>::failure("tags for '" + note.key + "': " + tags.error(),
                                         common::ErrorCode::Storage);
  }
  note.tags = std::move(tags.value());
  note.created_at = column_string(stmt, 3);
  note.updated_at = column_string(stmt, 4);
  return common::Result<Note>::success(std::move(note));
}

common::Result<std::optional<Note>> SqliteStore::get_note(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kNoteColumns + " FROM notes WHERE key = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::optional<Note>>(db_);
  }
  sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt) == SQLITE_ROW) {
    auto row = row_to_note(stmt);
    sqlite3_finalize(stmt);
    if (!row.ok()) {
      return common::Result<std::optional<Note>>::failure_from(row);
    }
    return common::Result<std::optional<Note>>::success(std::move(row.value()));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::optional<Note>>::success(std::nullopt);
}

common::Result<std::vector<Note>> SqliteStore::list_notes(const std::optional<std::string> &tag) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kNoteColumns + " FROM notes ORDER BY key";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<Note>>(db_);
  }

  // Tags live in a JSON column, so the filter runs here rather than in SQL.
  std::vector<Note> notes;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    auto row = row_to_note(stmt);
    if (!row.ok()) {
      sqlite3_finalize(stmt);
      return common::Result<std::vector<Note>>::failure_from(row);
    }
    if (!tag.has_value() || has_tag(row.value().tags, *tag)) {
      notes.push_back(std::move(row.value()));
    }
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<Note>>::success(std::move(notes));
}

common::Result<bool> SqliteStore::delete_note(const std::string &key) {
  std::lock_guard<std::mutex> lock(mutex_);
  Transaction tx(db_);
  auto status = tx.begin();
  if (!status.ok()) {
    return common::Result<bool>::failure_from(status);
  }

  bool removed = false;
  bool first = true;
  for (const char *sql : {"DELETE FROM notes WHERE key = ?1",
                          "DELETE FROM note_embeddings WHERE key = ?1"}) {
    sqlite3_stmt *stmt = nullptr;
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      return storage_failure<bool>(db_);
    }
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);
    if (rc != SQLITE_DONE) {
      return storage_failure<bool>(db_);
    }
    if (first) {
      removed = sqlite3_changes(db_) > 0;
      first = false;
    }
  }

  status = tx.commit();
  if (!status.ok()) {
    return common::Result<bool>::failure_from(status);
  }
  if (removed) {
    ++generation_;
  }
  return common::Result<bool>::success(removed);
}

common::Result<std::vector<Note>>
SqliteStore::keyword_search(const std::string &query, const std::optional<std::size_t> limit) {
  if (query.empty() || limit == std::optional<std::size_t>(0)) {
    return common::Result<std::vector<Note>>::success({});
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kNoteColumns +
                          " FROM notes WHERE key LIKE ?1 ESCAPE '\\' OR body LIKE ?1 ESCAPE '\\'"
                          " OR tags LIKE ?1 ESCAPE '\\'"
                          " ORDER BY updated_at DESC, key ASC LIMIT ?2";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<Note>>(db_);
  }
  const std::string pattern = like_pattern(query);
  sqlite3_bind_text(stmt, 1, pattern.c_str(), -1, SQLITE_TRANSIENT);
  // A negative LIMIT means no limit.
  sqlite3_bind_int64(stmt, 2, limit.has_value() ? static_cast<sqlite3_int64>(*limit) : -1);

  std::vector<Note> notes;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    auto row = row_to_note(stmt);
    if (!row.ok()) {
      sqlite3_finalize(stmt);
      return common::Result<std::vector<Note>>::failure_from(row);
    }
    notes.push_back(std::move(row.value()));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<Note>>::success(std::move(notes));
}

common::Result<std::unordered_map<std::string, Note>>
SqliteStore::notes_by_keys(const std::vector<std::string> &keys) {
  std::unordered_map<std::string, Note> map;
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kNoteColumns + " FROM notes WHERE key = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::unordered_map<std::string, Note>>(db_);
  }

  for (const auto &key : keys) {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_text(stmt, 1, key.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
      auto row = row_to_note(stmt);
      if (!row.ok()) {
        sqlite3_finalize(stmt);
        return common::Result<std::unordered_map<std::string, Note>>::failure_from(row);
      }
      map[row.value().key] = std::move(row.value());
    }
  }

  sqlite3_finalize(stmt);
  return common::Result<std::unordered_map<std::string, Note>>::success(std::move(map));
}

common::Result<std::size_t> SqliteStore::count_notes() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM notes", -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::size_t>(db_);
  }

  std::size_t value = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    value = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(value);
}

common::Result<std::vector<std::string>> SqliteStore::keys_without_embedding() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
SELECT n.key FROM notes n
LEFT JOIN note_embeddings e ON e.key = n.key
WHERE e.key IS NULL
ORDER BY n.key
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<std::string>>(db_);
  }

  std::vector<std::string> keys;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    keys.push_back(column_string(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<std::string>>::success(std::move(keys));
}

common::Status SqliteStore::put_embedding(const std::string &key, const vector::Vector &embedding) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto status = upsert_embedding(key, embedding);
  if (status.ok()) {
    ++generation_;
  }
  return status;
}

common::Result<std::vector<GraphRow>> SqliteStore::graph_rows() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
SELECT n.key, n.body, n.tags, e.embedding FROM notes n
JOIN note_embeddings e ON e.key = n.key
ORDER BY n.key
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<GraphRow>>(db_);
  }

  std::vector<GraphRow> rows;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    GraphRow row;
    row.key = column_string(stmt, 0);
    row.body = column_string(stmt, 1);
    auto tags = tags_from_json(column_string(stmt, 2));
    auto decoded = column_vector(stmt, 3);
    if (!tags.ok() || !decoded.ok()) {
      sqlite3_finalize(stmt);
      if (!decoded.ok()) {
        return common::Result<std::vector<GraphRow>>::failure(
            "embedding for '" + row.key + "': " + decoded.error(), decoded.code());
      }
      return common::Result<std::vector<GraphRow>>::failure(
          "tags for '" + row.key + "': " + tags.error(), common::ErrorCode::Storage);
    }
    row.tags = std::move(tags.value());
    row.embedding = std::move(decoded.value());
    rows.push_back(std::move(row));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<GraphRow>>::success(std::move(rows));
}

common::Result<std::optional<vector::Vector>>
SqliteStore::cached_embedding(const std::string &cache_key) {
  const std::string hash = sha256_hex(cache_key);
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  const char *sql = "SELECT embedding FROM embedding_cache WHERE text_hash = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::optional<vector::Vector>>(db_);
  }
  sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt) == SQLITE_ROW) {
    auto decoded = column_vector(stmt, 0);
    sqlite3_finalize(stmt);
    // A corrupt cache row is treated as a miss; the caller re-encodes and overwrites it.
    if (!decoded.ok() || decoded.value().empty()) {
      return common::Result<std::optional<vector::Vector>>::success(std::nullopt);
    }
    return common::Result<std::optional<vector::Vector>>::success(std::move(decoded.value()));
  }

  sqlite3_finalize(stmt);
  return common::Result<std::optional<vector::Vector>>::success(std::nullopt);
}

common::Status SqliteStore::cache_embedding(const std::string &cache_key,
                                            const vector::Vector &embedding) {
  if (embedding_cache_size_ == 0) {
    return common::Status::success();
  }
  const std::string hash = sha256_hex(cache_key);
  const auto blob = vector::encode_blob(embedding);
  std::lock_guard<std::mutex> lock(mutex_);

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "INSERT OR REPLACE INTO embedding_cache(text_hash, embedding, created_at) VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_error(db_);
  }

  sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  const std::string now = now_rfc3339();
  sqlite3_bind_text(stmt, 3, now.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_error(db_);
  }

  std::size_t cached = 0;
  sqlite3_stmt *count_stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &count_stmt, nullptr) !=
      SQLITE_OK) {
    return storage_error(db_);
  }
  if (sqlite3_step(count_stmt) == SQLITE_ROW) {
    cached = static_cast<std::size_t>(sqlite3_column_int64(count_stmt, 0));
  }
  sqlite3_finalize(count_stmt);

  if (cached > embedding_cache_size_) {
    const std::size_t overflow = cached - embedding_cache_size_;
    std::ostringstream trim_sql;
    trim_sql << "DELETE FROM embedding_cache WHERE text_hash IN ("
             << "SELECT text_hash FROM embedding_cache ORDER BY created_at ASC, rowid ASC LIMIT "
             << overflow << ")";
    return exec_sql(db_, trim_sql.str());
  }
  return common::Status::success();
}

common::Result<std::size_t> SqliteStore::cache_size() {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return storage_failure<std::size_t>(db_);
  }
  std::size_t value = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    value = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(value);
}

common::Result<FileMeta> SqliteStore::row_to_file_meta(sqlite3_stmt *stmt) const {
  FileMeta meta;
  meta.name = column_string(stmt, 0);
  meta.mime_type = column_string(stmt, 1);
  auto tags = tags_from_json(column_string(stmt, 2));
  if (!tags.ok()) {
    return common::Result<FileMeta>::failure("tags for file '" + meta.name + "': " + tags.error(),
                                             common::ErrorCode::Storage);
  }
  meta.tags = std::move(tags.value());
  meta.size_bytes = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 3));
  meta.created_at = column_string(stmt, 4);
  return common::Result<FileMeta>::success(std::move(meta));
}

common::Status SqliteStore::put_file_meta(const FileMeta &meta) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const char *sql = R"(
INSERT INTO files(name, mime_type, tags, size_bytes, created_at)
VALUES(?1, ?2, ?3, ?4, ?5)
ON CONFLICT(name) DO UPDATE SET
  mime_type=excluded.mime_type,
  tags=excluded.tags,
  size_bytes=excluded.size_bytes
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_error(db_);
  }
  const std::string tags_json = tags_to_json(meta.tags);
  const std::string created_at = meta.created_at.empty() ? now_rfc3339() : meta.created_at;
  sqlite3_bind_text(stmt, 1, meta.name.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, meta.mime_type.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, tags_json.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(meta.size_bytes));
  sqlite3_bind_text(stmt, 5, created_at.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_error(db_);
  }
  return common::Status::success();
}

common::Result<std::optional<FileMeta>> SqliteStore::get_file_meta(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kFileColumns + " FROM files WHERE name = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::optional<FileMeta>>(db_);
  }
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);

  if (sqlite3_step(stmt) == SQLITE_ROW) {
    auto row = row_to_file_meta(stmt);
    sqlite3_finalize(stmt);
    if (!row.ok()) {
      return common::Result<std::optional<FileMeta>>::failure_from(row);
    }
    return common::Result<std::optional<FileMeta>>::success(std::move(row.value()));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::optional<FileMeta>>::success(std::nullopt);
}

common::Result<std::vector<FileMeta>>
SqliteStore::list_file_meta(const std::optional<std::string> &tag) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kFileColumns + " FROM files ORDER BY name";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return storage_failure<std::vector<FileMeta>>(db_);
  }

  std::vector<FileMeta> files;
  while (sqlite3_step(stmt) == SQLITE_ROW) {
    auto row = row_to_file_meta(stmt);
    if (!row.ok()) {
      sqlite3_finalize(stmt);
      return common::Result<std::vector<FileMeta>>::failure_from(row);
    }
    if (!tag.has_value() || has_tag(row.value().tags, *tag)) {
      files.push_back(std::move(row.value()));
    }
  }
  sqlite3_finalize(stmt);
  return common::Result<std::vector<FileMeta>>::success(std::move(files));
}

common::Result<bool> SqliteStore::delete_file_meta(const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM files WHERE name = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return storage_failure<bool>(db_);
  }
  sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage_failure<bool>(db_);
  }
  return common::Result<bool>::success(sqlite3_changes(db_) > 0);
}

} // namespace notegraph::store
