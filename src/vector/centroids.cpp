#include "notegraph/vector/centroids.hpp"

#include "notegraph/vector/ranker.hpp"

#include <algorithm>
#include <cmath>

namespace notegraph::vector {

CentroidMap compute_centroids(const TagVectors &tagged_vectors, const TagSet &skip_tags) {
  CentroidMap centroids;

  for (const auto &[tag, members] : tagged_vectors) {
    if (members.empty() || skip_tags.contains(tag)) {
      continue;
    }

    std::size_t dimensions = 0;
    for (const auto &member : members) {
      dimensions = std::max(dimensions, member.size());
    }

    std::vector<double> sum(dimensions, 0.0);
    for (const auto &member : members) {
      for (std::size_t i = 0; i < member.size(); ++i) {
        sum[i] += static_cast<double>(member[i]);
      }
    }

    const auto count = static_cast<double>(members.size());
    double norm = 0.0;
    for (double &component : sum) {
      component /= count;
      norm += component * component;
    }
    norm = std::sqrt(norm);

    Vector centroid(dimensions, 0.0F);
    for (std::size_t i = 0; i < dimensions; ++i) {
      centroid[i] = static_cast<float>(norm > 0.0 ? sum[i] / norm : sum[i]);
    }
    centroids.emplace(tag, std::move(centroid));
  }

  return centroids;
}

std::vector<ScoredTag> scored_tags(const Vector &values, const CentroidMap &centroids,
                                   const float threshold, const std::size_t max_tags) {
  std::vector<ScoredTag> scored;
  for (const auto &[tag, centroid] : centroids) {
    const float score = dot(values, centroid);
    if (score >= threshold) {
      scored.push_back(ScoredTag{.tag = tag, .score = score});
    }
  }

  std::sort(scored.begin(), scored.end(), [](const auto &lhs, const auto &rhs) {
    if (lhs.score != rhs.score) {
      return lhs.score > rhs.score;
    }
    return lhs.tag < rhs.tag;
  });

  if (scored.size() > max_tags) {
    scored.resize(max_tags);
  }
  return scored;
}

std::vector<std::string> suggest_tags(const Vector &values, const CentroidMap &centroids,
                                      const float threshold, const std::size_t max_tags) {
  std::vector<std::string> tags;
  for (auto &entry : scored_tags(values, centroids, threshold, max_tags)) {
    tags.push_back(std::move(entry.tag));
  }
  return tags;
}

common::Result<CentroidMap> CentroidCache::get(const std::uint64_t generation,
                                               const TagSet &skip_tags, const Loader &load) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (stamp_.has_value() && stamp_->first == generation && stamp_->second == skip_tags) {
    ++hits_;
    return common::Result<CentroidMap>::success(centroids_);
  }

  ++misses_;
  auto tagged = load();
  if (!tagged.ok()) {
    return common::Result<CentroidMap>::failure_from(tagged);
  }
  centroids_ = compute_centroids(tagged.value(), skip_tags);
  stamp_ = std::make_pair(generation, skip_tags);
  return common::Result<CentroidMap>::success(centroids_);
}

void CentroidCache::invalidate() {
  std::lock_guard<std::mutex> lock(mutex_);
  stamp_.reset();
  centroids_.clear();
}

std::size_t CentroidCache::hits() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return hits_;
}

std::size_t CentroidCache::misses() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return misses_;
}

} // namespace notegraph::vector
