#include "notegraph/knowledge/graph_view.hpp"

#include "notegraph/common/fs.hpp"
#include "notegraph/common/json_util.hpp"

#include <sstream>

namespace notegraph::knowledge {

namespace {

bool is_continuation_byte(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

std::string first_line(const std::string &body) {
  const auto newline = body.find('\n');
  return common::trim(newline == std::string::npos ? body : body.substr(0, newline));
}

} // namespace

std::string extract_title(const std::string &body) {
  const std::string line = first_line(body);

  if (common::starts_with(line, "#")) {
    const auto start = line.find_first_not_of('#');
    std::string title = start == std::string::npos ? "" : common::trim(line.substr(start));
    for (const std::string prefix : {"Session: ", "Session - "}) {
      if (common::starts_with(title, prefix)) {
        title = title.substr(prefix.size());
      }
    }
    return title;
  }

  const std::string marker = "in project:";
  if (const auto pos = line.rfind(marker); pos != std::string::npos) {
    return common::trim(line.substr(pos + marker.size()));
  }

  if (common::starts_with(common::to_lower(line), "session:")) {
    return common::trim(line.substr(line.find(':') + 1));
  }
  return line;
}

std::string make_snippet(const std::string &body, const std::size_t max_chars) {
  std::string out;
  std::size_t chars = 0;
  for (const char ch : body) {
    if (!is_continuation_byte(ch)) {
      if (chars == max_chars) {
        break;
      }
      ++chars;
    }
    out.push_back(ch == '\n' ? ' ' : ch);
  }
  return out;
}

std::size_t utf8_length(const std::string &text) {
  std::size_t count = 0;
  for (const char ch : text) {
    if (!is_continuation_byte(ch)) {
      ++count;
    }
  }
  return count;
}

GraphView make_graph_view(const vector::NeighborGraph &graph,
                          const std::vector<store::GraphRow> &rows,
                          const std::size_t snippet_chars) {
  GraphView view;
  view.nodes.reserve(graph.nodes.size());
  for (std::size_t i = 0; i < graph.nodes.size() && i < rows.size(); ++i) {
    const auto &row = rows[i];
    view.nodes.push_back(GraphNode{.key = graph.nodes[i],
                                   .title = extract_title(row.body),
                                   .tags = row.tags,
                                   .snippet = make_snippet(row.body, snippet_chars),
                                   .body_length = utf8_length(row.body)});
  }
  view.edges = graph.edges;
  return view;
}

std::string graph_to_json(const GraphView &view) {
  std::ostringstream out;
  out << "{\"nodes\":[";
  for (std::size_t i = 0; i < view.nodes.size(); ++i) {
    const auto &node = view.nodes[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"key\":\"" << common::json_escape(node.key) << "\",\"title\":\""
        << common::json_escape(node.title) << "\",\"tags\":" << common::json_string_array(node.tags)
        << ",\"snippet\":\"" << common::json_escape(node.snippet)
        << "\",\"body_length\":" << node.body_length << "}";
  }
  out << "],\"links\":[";
  for (std::size_t i = 0; i < view.edges.size(); ++i) {
    const auto &edge = view.edges[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"source\":" << edge.source << ",\"target\":" << edge.target
        << ",\"similarity\":" << common::json_number(edge.score) << "}";
  }
  out << "]}";
  return out.str();
}

} // namespace notegraph::knowledge
