#pragma once

#include "notegraph/common/result.hpp"
#include "notegraph/vector/types.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <utility>

namespace notegraph::vector {

inline constexpr float kDefaultSuggestThreshold = 0.45F;
inline constexpr std::size_t kDefaultMaxSuggestedTags = 5;

struct ScoredTag {
  std::string tag;
  float score = 0.0F;
};

/// Mean of each tag's member vectors, L2-normalized. Tags in `skip_tags` and
/// tags without members are omitted. A zero-norm mean is emitted as-is.
[[nodiscard]] CentroidMap compute_centroids(const TagVectors &tagged_vectors,
                                            const TagSet &skip_tags);

/// Centroids scoring at least `threshold` against `values`, best first, ties
/// broken by tag name, at most `max_tags` of them.
[[nodiscard]] std::vector<ScoredTag> scored_tags(const Vector &values,
                                                 const CentroidMap &centroids,
                                                 float threshold = kDefaultSuggestThreshold,
                                                 std::size_t max_tags = kDefaultMaxSuggestedTags);

/// Tag names of scored_tags(), same order.
[[nodiscard]] std::vector<std::string>
suggest_tags(const Vector &values, const CentroidMap &centroids,
             float threshold = kDefaultSuggestThreshold,
             std::size_t max_tags = kDefaultMaxSuggestedTags);

/// Holds the last computed centroid map together with the membership
/// generation it was computed from. A different generation is a miss.
class CentroidCache {
public:
  using Loader = std::function<common::Result<TagVectors>()>;

  [[nodiscard]] common::Result<CentroidMap> get(std::uint64_t generation, const TagSet &skip_tags,
                                                const Loader &load);
  void invalidate();

  [[nodiscard]] std::size_t hits() const;
  [[nodiscard]] std::size_t misses() const;

private:
  mutable std::mutex mutex_;
  std::optional<std::pair<std::uint64_t, TagSet>> stamp_;
  CentroidMap centroids_;
  std::size_t hits_ = 0;
  std::size_t misses_ = 0;
};

} // namespace notegraph::vector
