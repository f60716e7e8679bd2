#include <catch2/catch_all.hpp>
#include <pipeparse/codec.hpp>

#include <string>

using namespace pipeparse;
using Catch::Matchers::ContainsSubstring;

static const char *kEditorBody = R"({
  "nodes": [
    {"id": "customInput-1", "type": "customInput", "position": {"x": 100, "y": 50.5},
     "data": {"id": "customInput-1", "nodeType": "customInput", "inputName": "q"},
     "width": 220, "selected": false},
    {"id": "llm-1", "type": "llm", "position": {"x": 400, "y": 60}}
  ],
  "edges": [
    {"id": "reactflow__edge-customInput-1-llm-1", "source": "customInput-1",
     "target": "llm-1", "sourceHandle": "customInput-1-value",
     "targetHandle": null, "animated": true}
  ]
})";

TEST_CASE("decodes an editor pipeline") {
  auto p = decode_pipeline(kEditorBody);
  REQUIRE(p.nodes.size() == 2);
  REQUIRE(p.edges.size() == 1);

  REQUIRE(p.nodes[0].id == "customInput-1");
  REQUIRE(p.nodes[0].type == "customInput");
  REQUIRE(p.nodes[0].position.x == 100.0);
  REQUIRE(p.nodes[0].position.y == 50.5);
  REQUIRE(p.nodes[0].data.size() == 3);
  REQUIRE(p.nodes[1].data.empty());

  const auto &e = p.edges[0];
  REQUIRE(e.source == "customInput-1");
  REQUIRE(e.target == "llm-1");
  REQUIRE(e.source_handle == std::optional<std::string>("customInput-1-value"));
  REQUIRE_FALSE(e.target_handle.has_value());
}

TEST_CASE("empty node and edge lists are valid") {
  auto p = decode_pipeline(R"({"nodes":[],"edges":[]})");
  REQUIRE(p.nodes.empty());
  REQUIRE(p.edges.empty());
}

TEST_CASE("malformed bodies are rejected with a location") {
  REQUIRE_THROWS_WITH(decode_pipeline("{\"nodes\": ["),
                      ContainsSubstring("invalid JSON"));
  REQUIRE_THROWS_WITH(decode_pipeline("[]"), ContainsSubstring("body: expected object"));
  REQUIRE_THROWS_WITH(decode_pipeline(R"({"edges":[]})"),
                      ContainsSubstring("body.nodes: field required"));
  REQUIRE_THROWS_WITH(decode_pipeline(R"({"nodes":{},"edges":[]})"),
                      ContainsSubstring("nodes: expected array"));
  REQUIRE_THROWS_WITH(
      decode_pipeline(R"({"nodes":[{"id":1,"type":"t","position":{}}],"edges":[]})"),
      ContainsSubstring("nodes[0].id: expected string"));
  REQUIRE_THROWS_WITH(
      decode_pipeline(R"({"nodes":[{"id":"a","type":"t"}],"edges":[]})"),
      ContainsSubstring("nodes[0].position: field required"));
  REQUIRE_THROWS_WITH(
      decode_pipeline(R"({"nodes":[{"id":"a","type":"t","position":{"x":"1"}}],"edges":[]})"),
      ContainsSubstring("nodes[0].position.x: expected number"));
  REQUIRE_THROWS_WITH(
      decode_pipeline(R"({"nodes":[],"edges":[{"id":"e","source":"a"}]})"),
      ContainsSubstring("edges[0].target: field required"));
  REQUIRE_THROWS_WITH(
      decode_pipeline(R"({"nodes":[],"edges":[{"id":"e","source":"a","target":"b","sourceHandle":3}]})"),
      ContainsSubstring("edges[0].sourceHandle: expected string"));
  REQUIRE_THROWS_AS(decode_pipeline(""), DecodeError);
}

TEST_CASE("deeply nested node data is accepted") {
  std::string data;
  for (int i = 0; i < 100; ++i)
    data += R"({"child":)";
  data += "null";
  data += std::string(100, '}');
  std::string body = R"({"nodes":[{"id":"a","type":"t","position":{"x":0,"y":0},"data":)" +
                     data + R"(}],"edges":[]})";
  auto p = decode_pipeline(body);
  REQUIRE(p.nodes.size() == 1);
  REQUIRE(p.nodes[0].data.contains("child"));

  // runaway nesting is still refused
  std::string deep = std::string(2000, '[') + std::string(2000, ']');
  REQUIRE_THROWS_AS(decode_pipeline(deep), DecodeError);
}

TEST_CASE("summary and detail encoding") {
  REQUIRE(encode_summary({3, 2, true}) ==
          R"({"num_nodes":3,"num_edges":2,"is_dag":true})");
  REQUIRE(encode_summary({0, 0, false}) ==
          R"({"num_nodes":0,"num_edges":0,"is_dag":false})");
  REQUIRE(encode_detail("nodes[0].id: \"x\"\n") ==
          R"({"detail":"nodes[0].id: \"x\"\n"})");
}
