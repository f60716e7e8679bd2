#pragma once
#include <pipeparse/http.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <string>

namespace pipeparse {

struct ServerOptions {
  std::string addr = "0.0.0.0";
  unsigned short port = 8000; // 0 picks an ephemeral port
  std::size_t threads = 0;    // 0 = hardware concurrency
  std::size_t max_body_bytes = 8u << 20;
  // a connection that has not delivered its full request by then is closed
  std::chrono::milliseconds read_timeout{10000};
};

class Server {
public:
  using Handler = std::function<http::Response(const http::Request &)>;

  // Binds and listens; throws asio::system_error if the address is taken.
  Server(ServerOptions opts, Handler h);
  ~Server();

  unsigned short port() const;

  // Accepts until stop(). Connections still reading their request are closed,
  // requests already being handled finish before this returns.
  void run();
  void stop();

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace pipeparse
