#include "notegraph/store/repository.hpp"

#include <unordered_map>

namespace notegraph::store {

common::Result<vector::TagVectors> collect_tag_vectors(IRecordRepository &repository) {
  auto membership = repository.tag_membership();
  if (!membership.ok()) {
    return common::Result<vector::TagVectors>::failure_from(membership);
  }
  auto embeddings = repository.embeddings();
  if (!embeddings.ok()) {
    return common::Result<vector::TagVectors>::failure_from(embeddings);
  }

  std::unordered_map<std::string, const vector::Vector *> by_key;
  by_key.reserve(embeddings.value().size());
  for (const auto &record : embeddings.value()) {
    by_key.emplace(record.key, &record.vector);
  }

  vector::TagVectors tagged;
  for (const auto &[tag, keys] : membership.value()) {
    std::vector<vector::Vector> members;
    for (const auto &key : keys) {
      if (const auto it = by_key.find(key); it != by_key.end()) {
        members.push_back(*it->second);
      }
    }
    if (!members.empty()) {
      tagged.emplace(tag, std::move(members));
    }
  }
  return common::Result<vector::TagVectors>::success(std::move(tagged));
}

} // namespace notegraph::store
