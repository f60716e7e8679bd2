#pragma once
#include <pipeparse/http.hpp>

#include <string>

namespace pipeparse {

struct RouterConfig {
  // "*" or the single origin allowed to call cross-origin; empty disables
  // CORS headers. Requests without an Origin header never get them.
  std::string cors_origin = "*";
};

class Router {
public:
  explicit Router(RouterConfig cfg);
  http::Response handle(const http::Request &r) const;

private:
  RouterConfig cfg_;

  http::Response handle_root() const;
  http::Response handle_parse(const std::string &body) const;
  bool origin_allowed(const std::string &origin) const;
  bool is_preflight(const http::Request &r) const;
  http::Response handle_preflight(const http::Request &r) const;
  void apply_cors(const http::Request &r, http::Response &resp) const;
};

} // namespace pipeparse
