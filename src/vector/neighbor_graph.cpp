#include "notegraph/vector/neighbor_graph.hpp"

#include "notegraph/vector/ranker.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <set>
#include <utility>

namespace notegraph::vector {

namespace {

float sort_key(const float score) {
  return std::isnan(score) ? -std::numeric_limits<float>::infinity() : score;
}

} // namespace

NeighborGraph build_graph(const std::vector<KeyedVector> &records, const std::size_t k) {
  NeighborGraph graph;
  const std::size_t n = records.size();
  if (n < 2) {
    return graph;
  }

  graph.nodes.reserve(n);
  for (const auto &record : records) {
    graph.nodes.push_back(record.key);
  }

  // Symmetric, so only the upper triangle is computed.
  std::vector<float> similarity(n * n, 0.0F);
  for (std::size_t i = 0; i < n; ++i) {
    for (std::size_t j = i + 1; j < n; ++j) {
      const float score = dot(records[i].vector, records[j].vector);
      similarity[i * n + j] = score;
      similarity[j * n + i] = score;
    }
  }

  std::set<std::pair<std::size_t, std::size_t>> seen;
  std::vector<std::size_t> peers;
  peers.reserve(n - 1);

  for (std::size_t i = 0; i < n; ++i) {
    peers.clear();
    for (std::size_t j = 0; j < n; ++j) {
      if (j != i) {
        peers.push_back(j);
      }
    }

    const float *row = similarity.data() + i * n;
    std::stable_sort(peers.begin(), peers.end(), [row](const std::size_t lhs, const std::size_t rhs) {
      return sort_key(row[lhs]) > sort_key(row[rhs]);
    });

    const std::size_t take = std::min(k, peers.size());
    for (std::size_t rank = 0; rank < take; ++rank) {
      const std::size_t j = peers[rank];
      const auto edge = std::make_pair(std::min(i, j), std::max(i, j));
      if (seen.insert(edge).second) {
        graph.edges.push_back(
            SimilarityEdge{.source = edge.first, .target = edge.second, .score = row[j]});
      }
    }
  }

  return graph;
}

} // namespace notegraph::vector
