#pragma once

#include "notegraph/store/note.hpp"
#include "notegraph/vector/neighbor_graph.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace notegraph::knowledge {

struct GraphNode {
  std::string key;
  std::string title;
  std::vector<std::string> tags;
  std::string snippet;
  std::size_t body_length = 0;
};

struct GraphView {
  std::vector<GraphNode> nodes;
  std::vector<vector::SimilarityEdge> edges;
};

/// Display title from the first line of a note body:
///   "## Session: Foo"                      -> "Foo"
///   "Session on 2024-01-01 in project: X"  -> "X"
///   "session: bar"                         -> "bar"
/// Anything else yields the trimmed first line.
[[nodiscard]] std::string extract_title(const std::string &body);

/// First `max_chars` code points of `body` with newlines turned into spaces.
[[nodiscard]] std::string make_snippet(const std::string &body, std::size_t max_chars);

/// Number of UTF-8 code points.
[[nodiscard]] std::size_t utf8_length(const std::string &text);

/// Attaches display fields to a similarity graph. `rows[i]` must describe
/// `graph.nodes[i]`.
[[nodiscard]] GraphView make_graph_view(const vector::NeighborGraph &graph,
                                        const std::vector<store::GraphRow> &rows,
                                        std::size_t snippet_chars);

/// {"nodes":[{key,title,tags,snippet,body_length}],"links":[{source,target,similarity}]}
[[nodiscard]] std::string graph_to_json(const GraphView &view);

} // namespace notegraph::knowledge
