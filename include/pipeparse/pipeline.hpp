#pragma once
#include <boost/json/object.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace pipeparse {

struct Position {
  double x = 0.0;
  double y = 0.0;
};

struct Node {
  std::string id;
  std::string type;
  Position position;
  boost::json::object data; // opaque, editor-defined
};

struct Edge {
  std::string id;
  std::string source;
  std::string target;
  std::optional<std::string> source_handle;
  std::optional<std::string> target_handle;
};

struct Pipeline {
  std::vector<Node> nodes;
  std::vector<Edge> edges;
};

struct PipelineSummary {
  std::size_t num_nodes = 0;
  std::size_t num_edges = 0;
  bool is_dag = true;
};

inline bool operator==(const PipelineSummary &a, const PipelineSummary &b) {
  return a.num_nodes == b.num_nodes && a.num_edges == b.num_edges &&
         a.is_dag == b.is_dag;
}

} // namespace pipeparse
