#include <pipeparse/analysis.hpp>
#include <pipeparse/app.hpp>
#include <pipeparse/cli.hpp>
#include <pipeparse/codec.hpp>
#include <pipeparse/router.hpp>
#include <pipeparse/server.hpp>

#include <asio.hpp>
#include <fmt/format.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <variant>

#ifndef PIPEPARSE_VERSION
#define PIPEPARSE_VERSION "unknown"
#endif

namespace pipeparse {

static void print_help() {
  std::cout <<
      R"(pipeparse - pipeline graph analysis service

Usage:
  pipeparse serve [--addr 0.0.0.0] [--port 8000] [--threads N]
                  [--cors-origin '*'] [--max-body BYTES]
                  [--read-timeout-ms 10000]
  pipeparse check <file|->
  pipeparse help | version

Logging (serve, check):
  --log-level trace|debug|info|warn|error|critical|off   (default info)
  --verbose | -v                                          same as --log-level debug
  --log-file PATH [--log-rotate-max BYTES] [--log-rotate-files N]
)";
}

// stdout is reserved for command output (check prints its summary there)
static void log_to_stderr() {
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  spdlog::set_default_logger(std::make_shared<spdlog::logger>("pipeparse", sink));
  spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
}

static void setup_logging(const LogOptions &log) {
  log_to_stderr();
  if (log.file) {
    try {
      auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
          *log.file, log.rotate_max, log.rotate_files);
      auto logger = std::make_shared<spdlog::logger>("pipeparse", sink);
      spdlog::set_default_logger(logger);
      spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
    } catch (const spdlog::spdlog_ex &e) {
      spdlog::warn("cannot open log file {}: {}; logging to stderr", *log.file,
                   e.what());
    }
  }
  spdlog::set_level(log.verbose ? spdlog::level::debug
                                : spdlog::level::from_str(log.level));
}

static int serve(const CmdServe &c) {
  Router router(RouterConfig{c.cors_origin});

  ServerOptions opts;
  opts.addr = c.addr;
  opts.port = c.port;
  opts.threads = c.threads;
  opts.max_body_bytes = c.max_body;
  opts.read_timeout = std::chrono::milliseconds(c.read_timeout_ms);

  std::unique_ptr<Server> srv;
  try {
    srv = std::make_unique<Server>(
        opts, [&router](const http::Request &r) { return router.handle(r); });
  } catch (const std::system_error &e) {
    spdlog::error("cannot listen on {}:{}: {}", c.addr, c.port, e.what());
    return 1;
  }

  asio::io_context sig_io;
  asio::signal_set signals(sig_io, SIGINT, SIGTERM);
  signals.async_wait([&](const asio::error_code &ec, int sig) {
    if (ec)
      return;
    spdlog::info("signal {} received, shutting down", sig);
    srv->stop();
  });
  std::thread sig_thread([&sig_io]() { sig_io.run(); });

  srv->run();

  sig_io.stop();
  sig_thread.join();
  return 0;
}

static int check(const CmdCheck &c) {
  std::string body;
  if (c.input == "-") {
    body.assign(std::istreambuf_iterator<char>(std::cin),
                std::istreambuf_iterator<char>());
  } else {
    std::ifstream in(c.input, std::ios::binary);
    if (!in) {
      spdlog::error("cannot open {}", c.input);
      return 1;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    body = ss.str();
  }

  try {
    auto summary = parse_pipeline(decode_pipeline(body));
    std::cout << encode_summary(summary) << "\n";
  } catch (const DecodeError &e) {
    spdlog::error("invalid pipeline: {}", e.what());
    return 1;
  } catch (const std::exception &e) {
    spdlog::error("error processing pipeline: {}", e.what());
    return 1;
  }
  return 0;
}

int App::run(int argc, char **argv) {
  log_to_stderr();

  auto pr = parse_cli(argc, argv);
  if (!pr.cmd) {
    if (!pr.error.empty())
      spdlog::error("{}", pr.error);
    print_help();
    return pr.error.empty() ? 0 : 2;
  }

  return std::visit(
      [&](auto &&c) -> int {
        using T = std::decay_t<decltype(c)>;

        if constexpr (std::is_same_v<T, CmdHelp>) {
          print_help();
          return 0;

        } else if constexpr (std::is_same_v<T, CmdVersion>) {
          std::cout << fmt::format("pipeparse {}\n", PIPEPARSE_VERSION);
          return 0;

        } else if constexpr (std::is_same_v<T, CmdServe>) {
          setup_logging(c.log);
          return serve(c);

        } else {
          setup_logging(c.log);
          return check(c);
        }
      },
      *pr.cmd);
}

} // namespace pipeparse
