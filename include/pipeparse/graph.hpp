#pragma once
#include <pipeparse/pipeline.hpp>

#include <cstddef>
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace pipeparse {

enum class Color : std::uint8_t { Unvisited, InProgress, Done };

// Successor lists keyed by node id. Slots follow the first appearance of each
// id in the node list; successors follow edge input order.
class Adjacency {
public:
  std::size_t size() const { return ids_.size(); }
  std::size_t edge_count() const { return edge_count_; }

  bool contains(const std::string &id) const;
  // throws std::out_of_range for an id that was not among the nodes
  std::size_t index_of(const std::string &id) const;
  const std::string &id_at(std::size_t slot) const { return ids_.at(slot); }

  const std::vector<std::size_t> &successors(std::size_t slot) const {
    return succ_.at(slot);
  }
  std::vector<std::string> successor_ids(const std::string &id) const;

private:
  friend Adjacency build_adjacency(const std::vector<Node> &nodes,
                                   const std::vector<Edge> &edges);

  std::vector<std::string> ids_;
  std::unordered_map<std::string, std::size_t> index_;
  std::vector<std::vector<std::size_t>> succ_;
  std::size_t edge_count_ = 0;
};

// Edges whose source or target is not a node are left out.
Adjacency build_adjacency(const std::vector<Node> &nodes,
                          const std::vector<Edge> &edges);

// Three-color DFS over every component, seeded in node order.
bool is_acyclic(const std::vector<Node> &nodes, const Adjacency &adj);

} // namespace pipeparse
