#include <pipeparse/server.hpp>
#include <pipeparse/util.hpp>

#include <asio.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <unordered_map>

namespace pipeparse {

using asio::ip::tcp;

namespace {

constexpr std::size_t kMaxHeaderBytes = 64 * 1024;

std::size_t pool_size(std::size_t requested) {
  if (requested > 0)
    return requested;
  return std::max(1u, std::thread::hardware_concurrency());
}

http::Response error_response(int status) {
  http::Response r;
  r.status = status;
  r.headers["Content-Type"] = "text/plain";
  r.body = http::reason_phrase(status);
  return r;
}

// Returns false when no request could be read. If err.status is non-zero the
// peer should get that response, otherwise the connection is just dropped.
bool read_request(tcp::socket &sock, std::size_t max_body, http::Request &req,
                  http::Response &err) {
  err.status = 0;
  asio::streambuf buf(kMaxHeaderBytes);
  asio::error_code ec;
  std::size_t head_len = asio::read_until(sock, buf, "\r\n\r\n", ec);
  if (ec == asio::error::not_found) {
    err = error_response(431);
    return false;
  }
  if (ec)
    return false;

  std::string data(asio::buffers_begin(buf.data()),
                   asio::buffers_end(buf.data()));
  std::istringstream head(data.substr(0, head_len));
  std::string line;

  std::getline(head, line);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  std::istringstream rl(line);
  std::string url, proto;
  rl >> req.method >> url >> proto;
  if (req.method.empty() || url.empty() || proto.rfind("HTTP/", 0) != 0) {
    err = error_response(400);
    return false;
  }
  size_t qpos = url.find('?');
  if (qpos == std::string::npos) {
    req.path = url;
  } else {
    req.path = url.substr(0, qpos);
    req.query = url.substr(qpos + 1);
  }

  while (std::getline(head, line)) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (line.empty())
      break;
    size_t col = line.find(':');
    if (col == std::string::npos)
      continue;
    req.headers[util::to_lower(util::trim(line.substr(0, col)))] =
        util::trim(line.substr(col + 1));
  }

  std::size_t len = 0;
  std::string cl = req.header("content-length");
  if (!cl.empty()) {
    try {
      len = static_cast<std::size_t>(std::stoull(cl));
    } catch (const std::logic_error &) {
      err = error_response(400);
      return false;
    }
  }
  if (len > max_body) {
    err = error_response(413);
    return false;
  }

  std::string body = data.substr(head_len);
  if (body.size() < len) {
    std::string rest(len - body.size(), '\0');
    asio::read(sock, asio::buffer(rest), ec);
    if (ec)
      return false;
    body += rest;
  }
  body.resize(len);
  req.body = std::move(body);
  return true;
}

void write_response(tcp::socket &sock, const http::Response &resp) {
  std::ostringstream ss;
  ss << "HTTP/1.1 " << resp.status << " " << http::reason_phrase(resp.status)
     << "\r\n";
  for (auto &kv : resp.headers) {
    if (kv.first == "Content-Length" || kv.first == "Connection")
      continue;
    ss << kv.first << ": " << kv.second << "\r\n";
  }
  ss << "Content-Length: " << resp.body.size() << "\r\n";
  ss << "Connection: close\r\n\r\n";
  ss << resp.body;
  auto s = ss.str();
  asio::error_code ec;
  asio::write(sock, asio::buffer(s.data(), s.size()), ec);
  if (ec)
    spdlog::warn("write failed: {}", ec.message());
}

} // namespace

struct Server::Impl {
  ServerOptions opts;
  asio::io_context io;
  tcp::acceptor acc;
  asio::thread_pool pool;
  Handler handler;
  std::atomic<bool> stopping{false};

  // sockets still reading a request, with their deadlines
  std::mutex mu;
  std::condition_variable cv;
  std::unordered_map<tcp::socket *, std::chrono::steady_clock::time_point> reading;

  Impl(ServerOptions o, Handler h)
      : opts(std::move(o)), io(),
        acc(io, tcp::endpoint(asio::ip::make_address(opts.addr), opts.port)),
        pool(pool_size(opts.threads)), handler(std::move(h)) {}

  bool track(tcp::socket &sock) {
    std::lock_guard<std::mutex> lk(mu);
    if (stopping.load())
      return false;
    reading[&sock] = std::chrono::steady_clock::now() + opts.read_timeout;
    return true;
  }

  void untrack(tcp::socket &sock) {
    std::lock_guard<std::mutex> lk(mu);
    reading.erase(&sock);
  }

  // Shutting a socket down makes its blocked read return.
  void close_reading(bool all) {
    std::lock_guard<std::mutex> lk(mu);
    auto now = std::chrono::steady_clock::now();
    for (auto it = reading.begin(); it != reading.end();) {
      if (!all && it->second > now) {
        ++it;
        continue;
      }
      if (!all)
        spdlog::debug("closing connection: no request within {}ms",
                      opts.read_timeout.count());
      asio::error_code ec;
      it->first->shutdown(tcp::socket::shutdown_both, ec);
      it = reading.erase(it);
    }
  }

  void reap_loop() {
    auto tick = std::clamp(opts.read_timeout / 4,
                           std::chrono::milliseconds(10),
                           std::chrono::milliseconds(500));
    std::unique_lock<std::mutex> lk(mu);
    while (!stopping.load()) {
      cv.wait_for(lk, tick);
      lk.unlock();
      close_reading(false);
      lk.lock();
    }
  }

  void serve(tcp::socket &sock) {
    http::Request req;
    http::Response resp;
    if (!track(sock))
      return;
    bool ok = read_request(sock, opts.max_body_bytes, req, resp);
    untrack(sock);
    if (!ok) {
      if (resp.status == 0)
        return;
      spdlog::warn("rejected request: {} {}", resp.status,
                   http::reason_phrase(resp.status));
    } else {
      try {
        resp = handler(req);
      } catch (const std::exception &e) {
        spdlog::error("handler failed for {} {}: {}", req.method, req.path,
                      e.what());
        resp = error_response(500);
      }
      spdlog::debug("{} {} -> {}", req.method, req.path, resp.status);
    }
    write_response(sock, resp);
    asio::error_code ec;
    sock.shutdown(tcp::socket::shutdown_both, ec);
  }
};

Server::Server(ServerOptions opts, Handler h)
    : impl_(std::make_unique<Impl>(std::move(opts), std::move(h))) {}

Server::~Server() = default;

unsigned short Server::port() const {
  return impl_->acc.local_endpoint().port();
}

void Server::run() {
  spdlog::info("listening on {}:{}", impl_->opts.addr, port());
  std::thread reaper([impl = impl_.get()]() { impl->reap_loop(); });
  while (!impl_->stopping.load()) {
    auto sock = std::make_shared<tcp::socket>(impl_->io);
    asio::error_code ec;
    impl_->acc.accept(*sock, ec);
    if (impl_->stopping.load())
      break;
    if (ec) {
      spdlog::error("accept: {}", ec.message());
      continue;
    }
    Impl *impl = impl_.get();
    asio::post(impl->pool, [impl, sock]() { impl->serve(*sock); });
  }
  asio::error_code ec;
  impl_->acc.close(ec);
  impl_->cv.notify_all();
  reaper.join();
  impl_->close_reading(true);
  impl_->pool.join();
  spdlog::info("server stopped");
}

void Server::stop() {
  {
    std::lock_guard<std::mutex> lk(impl_->mu);
    if (impl_->stopping.exchange(true))
      return;
  }
  impl_->cv.notify_all();
  // a blocking accept() does not notice close(); poke it with a connection
  asio::error_code ec;
  tcp::endpoint ep = impl_->acc.local_endpoint(ec);
  if (ec)
    return;
  if (ep.address().is_unspecified())
    ep.address(ep.address().is_v6() ? asio::ip::address(asio::ip::address_v6::loopback())
                                    : asio::ip::address(asio::ip::address_v4::loopback()));
  tcp::socket wake(impl_->io);
  wake.connect(ep, ec);
  if (ec)
    spdlog::warn("could not wake acceptor: {}", ec.message());
}

} // namespace pipeparse
