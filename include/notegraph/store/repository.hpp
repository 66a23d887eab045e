#pragma once

#include "notegraph/common/result.hpp"
#include "notegraph/vector/types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace notegraph::store {

/// tag -> keys of the records carrying it.
using TagMembership = std::map<std::string, std::set<std::string>>;

/// Read access to the embedding and tag projections of the record store.
/// Implementations own concurrency control; results are consistent snapshots.
class IRecordRepository {
public:
  virtual ~IRecordRepository() = default;

  /// All (key, vector) pairs, ordered by key.
  [[nodiscard]] virtual common::Result<std::vector<vector::KeyedVector>> embeddings() = 0;
  [[nodiscard]] virtual common::Result<TagMembership> tag_membership() = 0;
  [[nodiscard]] virtual common::Result<std::optional<vector::Vector>>
  embedding(const std::string &key) = 0;

  /// Bumped by every write that changes tags or embeddings, including writes
  /// made through another connection to the same database.
  [[nodiscard]] virtual std::uint64_t membership_generation() const = 0;
};

/// Joins tag membership with embeddings. Records without a vector contribute
/// nothing; tags left with no vectors are dropped.
[[nodiscard]] common::Result<vector::TagVectors> collect_tag_vectors(IRecordRepository &repository);

} // namespace notegraph::store
