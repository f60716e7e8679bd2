#include <pipeparse/cli.hpp>

#include <fmt/format.h>

#include <limits>
#include <stdexcept>
#include <string_view>

namespace pipeparse {

static bool has_arg(int i, int argc) { return i + 1 < argc; }

static bool valid_level(std::string_view l) {
  return l == "trace" || l == "debug" || l == "info" || l == "warn" ||
         l == "error" || l == "critical" || l == "off";
}

static unsigned long long parse_number(const std::string &flag,
                                       const char *value) {
  std::string s = value;
  if (s.empty() || s[0] == '-')
    throw std::invalid_argument(fmt::format("{}: expected a non-negative number, got '{}'", flag, s));
  size_t pos = 0;
  unsigned long long v = 0;
  try {
    v = std::stoull(s, &pos);
  } catch (const std::logic_error &) {
    throw std::invalid_argument(fmt::format("{}: expected a non-negative number, got '{}'", flag, s));
  }
  if (pos != s.size())
    throw std::invalid_argument(fmt::format("{}: expected a non-negative number, got '{}'", flag, s));
  return v;
}

// Consumes one logging flag at argv[i]; returns false if argv[i] is not one.
static bool parse_log_flag(int &i, int argc, char **argv, LogOptions &log) {
  std::string_view a = argv[i];
  if (a == "--log-level" && has_arg(i, argc)) {
    log.level = argv[++i];
    if (!valid_level(log.level))
      throw std::invalid_argument(fmt::format("--log-level: unknown level '{}'", log.level));
  } else if (a == "--log-file" && has_arg(i, argc)) {
    log.file = argv[++i];
  } else if (a == "--log-rotate-max" && has_arg(i, argc)) {
    log.rotate_max = parse_number("--log-rotate-max", argv[++i]);
  } else if (a == "--log-rotate-files" && has_arg(i, argc)) {
    log.rotate_files = parse_number("--log-rotate-files", argv[++i]);
  } else if (a == "--verbose" || a == "-v") {
    log.verbose = true;
  } else {
    return false;
  }
  return true;
}

static CmdServe parse_serve(int argc, char **argv) {
  CmdServe c;
  for (int i = 2; i < argc; ++i) {
    std::string_view a = argv[i];
    if (a == "--addr" && has_arg(i, argc)) {
      c.addr = argv[++i];
    } else if (a == "--port" && has_arg(i, argc)) {
      auto p = parse_number("--port", argv[++i]);
      if (p > std::numeric_limits<unsigned short>::max())
        throw std::invalid_argument(fmt::format("--port: {} is out of range", p));
      c.port = static_cast<unsigned short>(p);
    } else if (a == "--threads" && has_arg(i, argc)) {
      c.threads = parse_number("--threads", argv[++i]);
    } else if (a == "--cors-origin" && has_arg(i, argc)) {
      c.cors_origin = argv[++i];
    } else if (a == "--max-body" && has_arg(i, argc)) {
      c.max_body = parse_number("--max-body", argv[++i]);
    } else if (a == "--read-timeout-ms" && has_arg(i, argc)) {
      c.read_timeout_ms = parse_number("--read-timeout-ms", argv[++i]);
      if (c.read_timeout_ms == 0)
        throw std::invalid_argument("--read-timeout-ms: must be positive");
    } else if (!parse_log_flag(i, argc, argv, c.log)) {
      throw std::invalid_argument(fmt::format("serve: unknown argument '{}'", a));
    }
  }
  return c;
}

static CmdCheck parse_check(int argc, char **argv) {
  CmdCheck c;
  for (int i = 2; i < argc; ++i) {
    std::string_view a = argv[i];
    if (parse_log_flag(i, argc, argv, c.log))
      continue;
    if (!c.input.empty() || (a.size() > 1 && a[0] == '-'))
      throw std::invalid_argument(fmt::format("check: unexpected argument '{}'", a));
    c.input = std::string(a);
  }
  if (c.input.empty())
    throw std::invalid_argument("check: input file required (use - for stdin)");
  return c;
}

ParseResult parse_cli(int argc, char **argv) {
  ParseResult r{};
  if (argc < 2) {
    r.cmd = CmdHelp{};
    return r;
  }

  std::string_view cmd = argv[1];
  try {
    if (cmd == "--help" || cmd == "-h" || cmd == "help")
      r.cmd = CmdHelp{};
    else if (cmd == "--version" || cmd == "version")
      r.cmd = CmdVersion{};
    else if (cmd == "serve")
      r.cmd = parse_serve(argc, argv);
    else if (cmd == "check")
      r.cmd = parse_check(argc, argv);
    else
      r.error = fmt::format("unknown command '{}'", cmd);
  } catch (const std::invalid_argument &e) {
    r.cmd.reset();
    r.error = e.what();
  }
  return r;
}

} // namespace pipeparse
