#pragma once
#include <cstddef>
#include <optional>
#include <string>
#include <variant>

namespace pipeparse {

struct LogOptions {
  std::string level = "info";
  bool verbose = false;
  std::optional<std::string> file;
  std::size_t rotate_max = 10 * 1024 * 1024;
  std::size_t rotate_files = 3;
};

struct CmdServe {
  std::string addr = "0.0.0.0";
  unsigned short port = 8000;
  std::size_t threads = 0;
  std::string cors_origin = "*";
  std::size_t max_body = 8u << 20;
  std::size_t read_timeout_ms = 10000;
  LogOptions log;
};

// Analyze a pipeline document offline; "-" reads stdin.
struct CmdCheck {
  std::string input;
  LogOptions log;
};

struct CmdHelp {};
struct CmdVersion {};

using Command = std::variant<CmdServe, CmdCheck, CmdHelp, CmdVersion>;

struct ParseResult {
  std::optional<Command> cmd;
  std::string error;
};

ParseResult parse_cli(int argc, char **argv);

} // namespace pipeparse
