#pragma once

#include "notegraph/common/result.hpp"

#include <string>
#include <vector>

namespace notegraph::store {

/// Splits a comma-separated tag list, trimming blanks and dropping empty and
/// repeated entries. "a, b,,a " -> {"a", "b"}.
[[nodiscard]] std::vector<std::string> parse_tags(const std::string &csv);

/// Same cleanup for an already split list.
[[nodiscard]] std::vector<std::string> normalize_tags(const std::vector<std::string> &tags);

/// Tags column encoding: a JSON array of strings.
[[nodiscard]] std::string tags_to_json(const std::vector<std::string> &tags);
[[nodiscard]] common::Result<std::vector<std::string>> tags_from_json(const std::string &json);

[[nodiscard]] bool has_tag(const std::vector<std::string> &tags, const std::string &tag);

} // namespace notegraph::store
