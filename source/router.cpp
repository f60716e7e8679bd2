#include <pipeparse/analysis.hpp>
#include <pipeparse/codec.hpp>
#include <pipeparse/router.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <string>

namespace pipeparse {

namespace {

struct Route {
  const char *path;
  const char *methods; // Allow header value
};

constexpr Route kRoutes[] = {
    {"/", "GET"},
    {"/pipelines/parse", "POST"},
};

const Route *find_route(const std::string &path) {
  for (const auto &r : kRoutes)
    if (path == r.path)
      return &r;
  return nullptr;
}

} // namespace

Router::Router(RouterConfig cfg) : cfg_(std::move(cfg)) {}

http::Response Router::handle(const http::Request &r) const {
  spdlog::debug("{} {}", r.method, r.path);

  http::Response resp;
  const Route *route = find_route(r.path);
  if (is_preflight(r)) {
    resp = handle_preflight(r);
  } else if (!route) {
    resp = http::json_response(404, encode_detail("Not Found"));
  } else if (r.method != route->methods) {
    resp = http::json_response(405, encode_detail("Method Not Allowed"));
    resp.headers["Allow"] = route->methods;
  } else if (r.path == "/") {
    resp = handle_root();
  } else {
    resp = handle_parse(r.body);
  }
  apply_cors(r, resp);
  return resp;
}

bool Router::origin_allowed(const std::string &origin) const {
  return cfg_.cors_origin == "*" || origin == cfg_.cors_origin;
}

// Only a cross-origin OPTIONS that names the method it wants is a preflight;
// any other OPTIONS is routed like a normal request.
bool Router::is_preflight(const http::Request &r) const {
  return r.method == "OPTIONS" && !cfg_.cors_origin.empty() &&
         !r.header("origin").empty() &&
         !r.header("access-control-request-method").empty();
}

http::Response Router::handle_root() const {
  return http::json_response(200, R"({"Ping":"Pong"})");
}

http::Response Router::handle_parse(const std::string &body) const {
  Pipeline p;
  try {
    p = decode_pipeline(body);
  } catch (const DecodeError &e) {
    spdlog::warn("rejecting pipeline: {}", e.what());
    return http::json_response(422, encode_detail(e.what()));
  }

  try {
    return http::json_response(200, encode_summary(parse_pipeline(p)));
  } catch (const std::exception &e) {
    spdlog::error("error processing pipeline: {}", e.what());
    return http::json_response(
        500, encode_detail(std::string("Error processing pipeline: ") + e.what()));
  }
}

http::Response Router::handle_preflight(const http::Request &r) const {
  http::Response resp;
  resp.headers["Content-Type"] = "text/plain";
  if (!origin_allowed(r.header("origin"))) {
    spdlog::warn("preflight from disallowed origin {}", r.header("origin"));
    resp.status = 400;
    resp.body = "Disallowed CORS origin";
    return resp;
  }
  resp.body = "OK";
  resp.headers["Access-Control-Allow-Methods"] = "DELETE, GET, HEAD, OPTIONS, PATCH, POST, PUT";
  std::string req_headers = r.header("access-control-request-headers");
  resp.headers["Access-Control-Allow-Headers"] = req_headers.empty() ? "*" : req_headers;
  resp.headers["Access-Control-Max-Age"] = "600";
  return resp;
}

void Router::apply_cors(const http::Request &r, http::Response &resp) const {
  std::string origin = r.header("origin");
  if (cfg_.cors_origin.empty() || origin.empty() || !origin_allowed(origin))
    return;
  resp.headers["Access-Control-Allow-Origin"] = cfg_.cors_origin;
  if (cfg_.cors_origin != "*")
    resp.headers["Vary"] = "Origin";
}

} // namespace pipeparse
