#pragma once

#include "notegraph/vector/types.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace notegraph::store {

struct Note {
  std::string key;
  std::string body;
  std::vector<std::string> tags;
  std::string created_at;
  std::string updated_at;
};

struct FileMeta {
  std::string name;
  std::string mime_type;
  std::vector<std::string> tags;
  std::uint64_t size_bytes = 0;
  std::string created_at;
};

/// A note that has an embedding, as needed to lay out the similarity graph.
struct GraphRow {
  std::string key;
  std::string body;
  std::vector<std::string> tags;
  vector::Vector embedding;
};

/// UTC timestamp with millisecond precision, e.g. 2024-05-01T12:00:00.125Z.
/// Lexicographic order matches chronological order.
[[nodiscard]] std::string now_rfc3339();

} // namespace notegraph::store
