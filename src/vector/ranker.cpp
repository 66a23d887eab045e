#include "notegraph/vector/ranker.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace notegraph::vector {

namespace {

// NaN sorts last so the comparator stays a strict weak ordering.
float sort_key(const float score) {
  return std::isnan(score) ? -std::numeric_limits<float>::infinity() : score;
}

} // namespace

float dot(const Vector &a, const Vector &b) {
  const std::size_t n = std::min(a.size(), b.size());
  double sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return static_cast<float>(sum);
}

double l2_norm(const Vector &values) {
  double sum = 0.0;
  for (const float v : values) {
    sum += static_cast<double>(v) * static_cast<double>(v);
  }
  return std::sqrt(sum);
}

void normalize(Vector &values) {
  const double norm = l2_norm(values);
  if (norm == 0.0) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

std::vector<ScoredKey> rank(const Vector &query, const std::vector<KeyedVector> &candidates) {
  std::vector<ScoredKey> results;
  results.reserve(candidates.size());
  for (const auto &candidate : candidates) {
    results.push_back(ScoredKey{.key = candidate.key, .score = dot(query, candidate.vector)});
  }

  std::stable_sort(results.begin(), results.end(),
                   [](const auto &lhs, const auto &rhs) {
                     return sort_key(lhs.score) > sort_key(rhs.score);
                   });
  return results;
}

std::vector<ScoredKey> rank_top(const Vector &query, const std::vector<KeyedVector> &candidates,
                                const std::size_t limit) {
  auto results = rank(query, candidates);
  if (results.size() > limit) {
    results.resize(limit);
  }
  return results;
}

} // namespace notegraph::vector
