#pragma once

#include "notegraph/vector/types.hpp"

#include <cstddef>

namespace notegraph::vector {

inline constexpr std::size_t kDefaultGraphNeighbors = 3;

/// Undirected edge between two node indices, `source < target`.
struct SimilarityEdge {
  std::size_t source = 0;
  std::size_t target = 0;
  float score = 0.0F;
};

struct NeighborGraph {
  std::vector<std::string> nodes;
  std::vector<SimilarityEdge> edges;
};

/// Links every record to its `k` most similar peers and collapses the
/// result into an undirected edge list.
///
/// Nodes are processed in input order; each node's peers are visited by
/// descending score, equal scores by lower index. The first time a pair is
/// produced it is kept with that score, later duplicates are dropped. Edges
/// come out in that generation order. Fewer than two records yields an
/// empty graph.
[[nodiscard]] NeighborGraph build_graph(const std::vector<KeyedVector> &records,
                                        std::size_t k = kDefaultGraphNeighbors);

} // namespace notegraph::vector
