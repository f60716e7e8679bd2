#include <catch2/catch_all.hpp>
#include <pipeparse/router.hpp>

#include <string>

using namespace pipeparse;
using Catch::Matchers::ContainsSubstring;

static http::Request req(const char *method, const char *path,
                         std::string body = {}) {
  http::Request r;
  r.method = method;
  r.path = path;
  r.body = std::move(body);
  return r;
}

static http::Request cross_origin(http::Request r,
                                  const char *origin = "http://localhost:3000") {
  r.headers["origin"] = origin;
  return r;
}

static http::Request preflight(const char *path) {
  auto r = cross_origin(req("OPTIONS", path));
  r.headers["access-control-request-method"] = "POST";
  return r;
}

TEST_CASE("ping") {
  Router router(RouterConfig{});
  auto resp = router.handle(req("GET", "/"));
  REQUIRE(resp.status == 200);
  REQUIRE(resp.body == R"({"Ping":"Pong"})");
  REQUIRE(resp.headers["Content-Type"] == "application/json");
  REQUIRE(resp.headers.count("Access-Control-Allow-Origin") == 0);

  auto cors = router.handle(cross_origin(req("GET", "/")));
  REQUIRE(cors.status == 200);
  REQUIRE(cors.headers["Access-Control-Allow-Origin"] == "*");
  REQUIRE(cors.headers.count("Vary") == 0);
}

TEST_CASE("parse reports counts and verdict") {
  Router router(RouterConfig{});
  auto cyclic = req("POST", "/pipelines/parse", R"({
    "nodes":[{"id":"A","type":"t","position":{"x":0,"y":0}},
             {"id":"B","type":"t","position":{"x":0,"y":0}},
             {"id":"C","type":"t","position":{"x":0,"y":0}}],
    "edges":[{"id":"1","source":"A","target":"B"},
             {"id":"2","source":"B","target":"C"},
             {"id":"3","source":"C","target":"A"},
             {"id":"4","source":"C","target":"Z"}]})");
  auto resp = router.handle(cyclic);
  REQUIRE(resp.status == 200);
  REQUIRE(resp.body == R"({"num_nodes":3,"num_edges":4,"is_dag":false})");

  auto empty = router.handle(req("POST", "/pipelines/parse", R"({"nodes":[],"edges":[]})"));
  REQUIRE(empty.status == 200);
  REQUIRE(empty.body == R"({"num_nodes":0,"num_edges":0,"is_dag":true})");
}

TEST_CASE("shape errors answer 422") {
  Router router(RouterConfig{});
  auto resp = router.handle(req("POST", "/pipelines/parse", R"({"nodes":[]})"));
  REQUIRE(resp.status == 422);
  REQUIRE_THAT(resp.body, ContainsSubstring("\"detail\":\"body.edges: field required\""));

  auto garbage = router.handle(req("POST", "/pipelines/parse", "not json"));
  REQUIRE(garbage.status == 422);
}

TEST_CASE("unknown path and wrong method") {
  Router router(RouterConfig{});
  auto nf = router.handle(req("GET", "/nope"));
  REQUIRE(nf.status == 404);
  REQUIRE(nf.body == R"({"detail":"Not Found"})");

  auto na = router.handle(req("GET", "/pipelines/parse"));
  REQUIRE(na.status == 405);
  REQUIRE(na.headers["Allow"] == "POST");
  REQUIRE(router.handle(req("DELETE", "/")).status == 405);
}

TEST_CASE("preflight and CORS configuration") {
  Router router(RouterConfig{"http://localhost:3000"});
  auto pre = preflight("/pipelines/parse");
  pre.headers["access-control-request-headers"] = "content-type";
  auto resp = router.handle(pre);
  REQUIRE(resp.status == 200);
  REQUIRE(resp.headers["Access-Control-Allow-Origin"] == "http://localhost:3000");
  REQUIRE(resp.headers["Vary"] == "Origin");
  REQUIRE(resp.headers["Access-Control-Allow-Headers"] == "content-type");
  REQUIRE(resp.headers["Access-Control-Max-Age"] == "600");
  REQUIRE_THAT(resp.headers["Access-Control-Allow-Methods"], ContainsSubstring("POST"));

  auto simple = router.handle(cross_origin(req("GET", "/")));
  REQUIRE(simple.headers["Access-Control-Allow-Origin"] == "http://localhost:3000");

  auto other = router.handle(cross_origin(req("GET", "/"), "http://evil.example"));
  REQUIRE(other.status == 200);
  REQUIRE(other.headers.count("Access-Control-Allow-Origin") == 0);

  auto denied = router.handle(cross_origin(preflight("/"), "http://evil.example"));
  REQUIRE(denied.status == 400);
  REQUIRE(denied.body == "Disallowed CORS origin");
  REQUIRE(denied.headers.count("Access-Control-Allow-Origin") == 0);

  Router closed(RouterConfig{""});
  auto r2 = closed.handle(cross_origin(req("GET", "/")));
  REQUIRE(r2.headers.count("Access-Control-Allow-Origin") == 0);
  auto r3 = closed.handle(pre);
  REQUIRE(r3.status == 405);
  REQUIRE(r3.headers.count("Access-Control-Allow-Methods") == 0);
}

TEST_CASE("OPTIONS that is not a preflight is routed normally") {
  Router router(RouterConfig{});
  REQUIRE(router.handle(req("OPTIONS", "/nope")).status == 404);
  REQUIRE(router.handle(cross_origin(req("OPTIONS", "/nope"))).status == 404);

  auto plain = router.handle(req("OPTIONS", "/pipelines/parse"));
  REQUIRE(plain.status == 405);
  REQUIRE(plain.headers["Allow"] == "POST");

  // preflights are answered before routing
  REQUIRE(router.handle(preflight("/nope")).status == 200);
}
