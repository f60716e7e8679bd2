#include <pipeparse/codec.hpp>
#include <pipeparse/util.hpp>

#include <boost/json/parse.hpp>
#include <fmt/format.h>

namespace json = boost::json;

namespace pipeparse {

// node data is free-form and may nest well past Boost.JSON's default of 32
constexpr std::size_t kMaxJsonDepth = 512;

static const json::value &require(const json::object &o, const char *key,
                                  const std::string &where) {
  const json::value *v = o.if_contains(key);
  if (!v)
    throw DecodeError(fmt::format("{}.{}: field required", where, key));
  return *v;
}

static std::string as_string(const json::value &v, const std::string &where) {
  if (!v.is_string())
    throw DecodeError(fmt::format("{}: expected string", where));
  const json::string &js = v.get_string();
  return std::string(js.data(), js.size());
}

static const json::object &as_object(const json::value &v,
                                     const std::string &where) {
  if (!v.is_object())
    throw DecodeError(fmt::format("{}: expected object", where));
  return v.get_object();
}

static const json::array &as_array(const json::value &v,
                                   const std::string &where) {
  if (!v.is_array())
    throw DecodeError(fmt::format("{}: expected array", where));
  return v.get_array();
}

static std::optional<std::string> as_opt_string(const json::object &o,
                                                const char *key,
                                                const std::string &where) {
  const json::value *v = o.if_contains(key);
  if (!v || v->is_null())
    return std::nullopt;
  return as_string(*v, where + "." + key);
}

static Position decode_position(const json::value &v, const std::string &where) {
  Position p;
  for (const auto &kv : as_object(v, where)) {
    std::string key(kv.key().data(), kv.key().size());
    if (!kv.value().is_number())
      throw DecodeError(fmt::format("{}.{}: expected number", where, key));
    double d = kv.value().to_number<double>();
    if (key == "x")
      p.x = d;
    else if (key == "y")
      p.y = d;
  }
  return p;
}

static Node decode_node(const json::value &v, const std::string &where) {
  const auto &o = as_object(v, where);
  Node n;
  n.id = as_string(require(o, "id", where), where + ".id");
  n.type = as_string(require(o, "type", where), where + ".type");
  n.position = decode_position(require(o, "position", where), where + ".position");
  if (const json::value *d = o.if_contains("data"))
    n.data = as_object(*d, where + ".data");
  return n;
}

static Edge decode_edge(const json::value &v, const std::string &where) {
  const auto &o = as_object(v, where);
  Edge e;
  e.id = as_string(require(o, "id", where), where + ".id");
  e.source = as_string(require(o, "source", where), where + ".source");
  e.target = as_string(require(o, "target", where), where + ".target");
  e.source_handle = as_opt_string(o, "sourceHandle", where);
  e.target_handle = as_opt_string(o, "targetHandle", where);
  return e;
}

Pipeline pipeline_from_json(const json::value &v) {
  const auto &o = as_object(v, "body");
  Pipeline p;

  const auto &nodes = as_array(require(o, "nodes", "body"), "nodes");
  p.nodes.reserve(nodes.size());
  for (std::size_t i = 0; i < nodes.size(); ++i)
    p.nodes.push_back(decode_node(nodes[i], fmt::format("nodes[{}]", i)));

  const auto &edges = as_array(require(o, "edges", "body"), "edges");
  p.edges.reserve(edges.size());
  for (std::size_t i = 0; i < edges.size(); ++i)
    p.edges.push_back(decode_edge(edges[i], fmt::format("edges[{}]", i)));

  return p;
}

Pipeline decode_pipeline(std::string_view body) {
  json::parse_options opt;
  opt.max_depth = kMaxJsonDepth;
  json::error_code ec;
  json::value v = json::parse(json::string_view(body.data(), body.size()), ec,
                              json::storage_ptr(), opt);
  if (ec)
    throw DecodeError(fmt::format("body: invalid JSON: {}", ec.message()));
  return pipeline_from_json(v);
}

std::string encode_summary(const PipelineSummary &s) {
  return fmt::format(R"({{"num_nodes":{},"num_edges":{},"is_dag":{}}})",
                     s.num_nodes, s.num_edges, s.is_dag ? "true" : "false");
}

std::string encode_detail(const std::string &detail) {
  return fmt::format(R"({{"detail":"{}"}})", util::json_escape(detail));
}

} // namespace pipeparse
