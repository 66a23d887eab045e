#include "notegraph/store/file_store.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/store/tags.hpp"

namespace notegraph::store {

FileStore::FileStore(std::filesystem::path root, SqliteStore &store)
    : root_(std::move(root)), store_(store) {}

common::Result<std::filesystem::path> FileStore::resolve(const std::string &name) const {
  const std::string trimmed = common::trim(name);
  if (trimmed.empty()) {
    return common::Result<std::filesystem::path>::failure("file name is empty",
                                                          common::ErrorCode::InvalidArgument);
  }
  const std::filesystem::path relative(trimmed);
  if (relative.is_absolute()) {
    return common::Result<std::filesystem::path>::failure("file name must be relative: " + name,
                                                          common::ErrorCode::InvalidArgument);
  }
  const auto candidate = (root_ / relative).lexically_normal();
  if (!common::is_subpath(candidate, root_) || candidate.filename().empty() ||
      candidate == root_.lexically_normal()) {
    return common::Result<std::filesystem::path>::failure("file name escapes storage: " + name,
                                                          common::ErrorCode::InvalidArgument);
  }
  return common::Result<std::filesystem::path>::success(candidate);
}

common::Result<FileMeta> FileStore::put(const std::string &name,
                                        const std::vector<std::uint8_t> &bytes,
                                        const std::string &mime_type,
                                        const std::vector<std::string> &tags) {
  auto path = resolve(name);
  if (!path.ok()) {
    return common::Result<FileMeta>::failure_from(path);
  }

  FileMeta meta;
  meta.name = common::trim(name);
  meta.mime_type = mime_type.empty() ? "application/octet-stream" : mime_type;
  meta.tags = normalize_tags(tags);
  meta.size_bytes = bytes.size();
  auto existing = store_.get_file_meta(meta.name);
  if (!existing.ok()) {
    return common::Result<FileMeta>::failure_from(existing);
  }
  meta.created_at =
      existing.value().has_value() ? existing.value()->created_at : now_rfc3339();

  // Bytes only reach the target path after the metadata row is committed.
  std::filesystem::path staged = path.value();
  staged += ".partial";
  auto written = common::write_binary(staged, bytes);
  std::error_code ec;
  if (!written.ok()) {
    std::filesystem::remove(staged, ec);
    return common::Result<FileMeta>::failure_from(written);
  }

  auto saved = store_.put_file_meta(meta);
  if (!saved.ok()) {
    std::filesystem::remove(staged, ec);
    return common::Result<FileMeta>::failure_from(saved);
  }

  std::filesystem::rename(staged, path.value(), ec);
  if (ec) {
    std::error_code ignored;
    std::filesystem::remove(staged, ignored);
    return common::Result<FileMeta>::failure("failed to move " + staged.string() + " into place: " +
                                                 ec.message(),
                                             common::ErrorCode::Io);
  }
  return common::Result<FileMeta>::success(std::move(meta));
}

common::Result<std::optional<StoredFile>> FileStore::get(const std::string &name) {
  auto meta = store_.get_file_meta(common::trim(name));
  if (!meta.ok()) {
    return common::Result<std::optional<StoredFile>>::failure_from(meta);
  }
  if (!meta.value().has_value()) {
    return common::Result<std::optional<StoredFile>>::success(std::nullopt);
  }

  auto path = resolve(name);
  if (!path.ok()) {
    return common::Result<std::optional<StoredFile>>::failure_from(path);
  }
  auto bytes = common::read_binary(path.value());
  if (!bytes.ok()) {
    return common::Result<std::optional<StoredFile>>::failure_from(bytes);
  }
  return common::Result<std::optional<StoredFile>>::success(
      StoredFile{std::move(*meta.value()), std::move(bytes.value())});
}

common::Result<std::vector<FileMeta>> FileStore::list(const std::optional<std::string> &tag) {
  return store_.list_file_meta(tag);
}

common::Result<bool> FileStore::remove(const std::string &name) {
  auto path = resolve(name);
  if (!path.ok()) {
    return common::Result<bool>::failure_from(path);
  }

  auto removed = store_.delete_file_meta(common::trim(name));
  if (!removed.ok()) {
    return removed;
  }

  std::error_code ec;
  const bool had_bytes = std::filesystem::remove(path.value(), ec);
  if (ec) {
    return common::Result<bool>::failure("failed to remove " + path.value().string() + ": " +
                                             ec.message(),
                                         common::ErrorCode::Io);
  }
  return common::Result<bool>::success(removed.value() || had_bytes);
}

} // namespace notegraph::store
