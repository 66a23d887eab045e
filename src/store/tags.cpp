#include "notegraph/store/tags.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/common/json_util.hpp"

#include <algorithm>
#include <sstream>

namespace notegraph::store {

std::vector<std::string> parse_tags(const std::string &csv) {
  std::vector<std::string> parts;
  std::stringstream stream(csv);
  std::string part;
  while (std::getline(stream, part, ',')) {
    parts.push_back(part);
  }
  return normalize_tags(parts);
}

std::vector<std::string> normalize_tags(const std::vector<std::string> &tags) {
  std::vector<std::string> out;
  for (const auto &tag : tags) {
    std::string cleaned = common::trim(tag);
    if (!cleaned.empty() && !has_tag(out, cleaned)) {
      out.push_back(std::move(cleaned));
    }
  }
  return out;
}

std::string tags_to_json(const std::vector<std::string> &tags) {
  return common::json_string_array(tags);
}

common::Result<std::vector<std::string>> tags_from_json(const std::string &json) {
  if (common::trim(json).empty()) {
    return common::Result<std::vector<std::string>>::success({});
  }
  return common::json_parse_string_array(json);
}

bool has_tag(const std::vector<std::string> &tags, const std::string &tag) {
  return std::find(tags.begin(), tags.end(), tag) != tags.end();
}

} // namespace notegraph::store
