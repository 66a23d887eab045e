#pragma once

#include "notegraph/vector/types.hpp"

#include <cstddef>

namespace notegraph::vector {

/// Dot product over the shared prefix of both vectors, accumulated in double.
/// Equals cosine similarity only when both inputs are unit-normalized.
[[nodiscard]] float dot(const Vector &a, const Vector &b);

/// Euclidean norm.
[[nodiscard]] double l2_norm(const Vector &values);

/// Scales to unit length in place; a zero vector is left untouched.
void normalize(Vector &values);

/// Scores every candidate against `query` and returns them by descending
/// score. Equal scores keep candidate order.
[[nodiscard]] std::vector<ScoredKey> rank(const Vector &query,
                                          const std::vector<KeyedVector> &candidates);

/// First `limit` entries of rank().
[[nodiscard]] std::vector<ScoredKey> rank_top(const Vector &query,
                                              const std::vector<KeyedVector> &candidates,
                                              std::size_t limit);

} // namespace notegraph::vector
