#include <pipeparse/graph.hpp>

namespace pipeparse {

bool Adjacency::contains(const std::string &id) const {
  return index_.find(id) != index_.end();
}

std::size_t Adjacency::index_of(const std::string &id) const {
  return index_.at(id);
}

std::vector<std::string> Adjacency::successor_ids(const std::string &id) const {
  std::vector<std::string> out;
  for (auto s : succ_.at(index_of(id)))
    out.push_back(ids_[s]);
  return out;
}

Adjacency build_adjacency(const std::vector<Node> &nodes,
                          const std::vector<Edge> &edges) {
  Adjacency adj;
  adj.ids_.reserve(nodes.size());
  for (const auto &n : nodes) {
    if (adj.index_.try_emplace(n.id, adj.ids_.size()).second) {
      adj.ids_.push_back(n.id);
      adj.succ_.emplace_back();
    }
  }

  for (const auto &e : edges) {
    auto s = adj.index_.find(e.source);
    auto t = adj.index_.find(e.target);
    if (s == adj.index_.end() || t == adj.index_.end())
      continue;
    adj.succ_[s->second].push_back(t->second);
    ++adj.edge_count_;
  }
  return adj;
}

bool is_acyclic(const std::vector<Node> &nodes, const Adjacency &adj) {
  if (nodes.empty() || adj.edge_count() == 0)
    return true;

  std::vector<Color> color(adj.size(), Color::Unvisited);

  // (node, next successor to look at)
  struct Frame {
    std::size_t node;
    std::size_t next;
  };
  std::vector<Frame> stack;

  for (const auto &n : nodes) {
    std::size_t root = adj.index_of(n.id);
    if (color[root] != Color::Unvisited)
      continue;

    color[root] = Color::InProgress;
    stack.push_back({root, 0});
    while (!stack.empty()) {
      Frame &top = stack.back();
      const auto &succ = adj.successors(top.node);
      if (top.next == succ.size()) {
        color[top.node] = Color::Done;
        stack.pop_back();
        continue;
      }
      std::size_t v = succ[top.next++];
      if (color[v] == Color::InProgress)
        return false; // back-edge
      if (color[v] == Color::Unvisited) {
        color[v] = Color::InProgress;
        stack.push_back({v, 0});
      }
    }
  }
  return true;
}

} // namespace pipeparse
