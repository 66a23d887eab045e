#pragma once

#include "notegraph/store/sqlite_store.hpp"

#include <cstdint>
#include <filesystem>

namespace notegraph::store {

struct StoredFile {
  FileMeta meta;
  std::vector<std::uint8_t> bytes;
};

/// File attachments: bytes under `<root>/<name>`, metadata in the `files`
/// table. Names may contain subdirectories but must stay inside `root`.
class FileStore {
public:
  FileStore(std::filesystem::path root, SqliteStore &store);

  [[nodiscard]] common::Result<FileMeta> put(const std::string &name,
                                             const std::vector<std::uint8_t> &bytes,
                                             const std::string &mime_type,
                                             const std::vector<std::string> &tags);
  [[nodiscard]] common::Result<std::optional<StoredFile>> get(const std::string &name);
  [[nodiscard]] common::Result<std::vector<FileMeta>>
  list(const std::optional<std::string> &tag = std::nullopt);
  [[nodiscard]] common::Result<bool> remove(const std::string &name);

  [[nodiscard]] const std::filesystem::path &root() const { return root_; }

private:
  [[nodiscard]] common::Result<std::filesystem::path> resolve(const std::string &name) const;

  std::filesystem::path root_;
  SqliteStore &store_;
};

} // namespace notegraph::store
