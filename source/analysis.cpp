#include <pipeparse/analysis.hpp>
#include <pipeparse/graph.hpp>

#include <spdlog/spdlog.h>

#include <unordered_set>

namespace pipeparse {

static void log_pipeline(const Pipeline &p, const Adjacency &adj) {
  if (!spdlog::default_logger_raw()->should_log(spdlog::level::debug))
    return;
  spdlog::debug("pipeline: {} nodes, {} edges", p.nodes.size(),
                p.edges.size());
  for (std::size_t i = 0; i < p.nodes.size(); ++i) {
    const auto &n = p.nodes[i];
    spdlog::debug("  node {}: id={} type={} pos=({}, {}) data_keys={}", i + 1,
                  n.id, n.type, n.position.x, n.position.y, n.data.size());
  }
  for (std::size_t i = 0; i < p.edges.size(); ++i) {
    const auto &e = p.edges[i];
    spdlog::debug("  edge {}: {} -> {} (handles {} / {})", i + 1, e.source,
                  e.target, e.source_handle.value_or("-"),
                  e.target_handle.value_or("-"));
    if (!adj.contains(e.source) || !adj.contains(e.target))
      spdlog::debug("  edge {} dropped: unknown endpoint", e.id);
  }
}

static void warn_duplicate_ids(const Pipeline &p) {
  std::unordered_set<std::string> seen;
  for (const auto &n : p.nodes) {
    if (!seen.insert(n.id).second)
      spdlog::warn("duplicate node id '{}': later node wins", n.id);
  }
}

PipelineSummary parse_pipeline(const Pipeline &p) {
  Adjacency adj = build_adjacency(p.nodes, p.edges);
  if (adj.size() != p.nodes.size())
    warn_duplicate_ids(p);
  log_pipeline(p, adj);

  PipelineSummary s;
  s.num_nodes = p.nodes.size();
  s.num_edges = p.edges.size();
  s.is_dag = is_acyclic(p.nodes, adj);

  spdlog::info("pipeline parsed: nodes={} edges={} is_dag={}", s.num_nodes,
               s.num_edges, s.is_dag);
  return s;
}

} // namespace pipeparse
