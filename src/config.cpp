#include "config.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include "errors.hpp"
#include "log.hpp"

static long parse_long(const std::string& flag, const std::string& s, long def,
                       long lo, long hi) {
  try {
    size_t used = 0;
    long v = std::stol(s, &used);
    if (used != s.size() || v < lo || v > hi) {
      log_warn("ignoring " + flag + " " + s + " (expected " +
               std::to_string(lo) + ".." + std::to_string(hi) + ")");
      return def;
    }
    return v;
  } catch (const std::logic_error&) {
    log_warn("ignoring " + flag + " " + s + " (not a number)");
    return def;
  }
}

static std::pair<std::string, std::string> parse_route(const std::string& s) {
  auto eq = s.find('=');
  if (eq == std::string::npos || eq == 0 || eq + 1 == s.size()) {
    throw ConfigError("--route expects PATH=FILE, got '" + s + "'");
  }
  std::string path = s.substr(0, eq);
  if (path.front() != '/') {
    throw ConfigError("--route path must start with '/', got '" + path + "'");
  }
  return {path, s.substr(eq + 1)};
}

ServerConfig parse_args(int argc, const char* const* argv) {
  ServerConfig cfg;
  bool custom_routes = false;

  for (int i = 1; i < argc; i++) {
    std::string a = argv[i];
    auto need = [&]() -> std::string {
      if (i + 1 >= argc) throw ConfigError("missing value for " + a);
      return argv[++i];
    };

    if (a == "--ip") {
      cfg.bind_ip = need();
    } else if (a == "--port") {
      cfg.port = static_cast<uint16_t>(parse_long(a, need(), cfg.port, 0, 65535));
    } else if (a == "--threads") {
      // Values below 1 are passed through: the pool rejects them at startup.
      long t = parse_long(a, need(), cfg.threads,
                          std::numeric_limits<long>::min(), 1024);
      cfg.threads = static_cast<int>(
          std::max<long>(t, std::numeric_limits<int>::min()));
    } else if (a == "--queue-cap") {
      cfg.queue_cap = static_cast<size_t>(
          parse_long(a, need(), static_cast<long>(cfg.queue_cap), 0, 2000000));
    } else if (a == "--backlog") {
      cfg.backlog = static_cast<int>(parse_long(a, need(), cfg.backlog, 1, 65535));
    } else if (a == "--io-timeout-ms") {
      cfg.io_timeout_ms = static_cast<unsigned>(
          parse_long(a, need(), cfg.io_timeout_ms, 0, 3600000));
    } else if (a == "--route") {
      if (!custom_routes) {
        cfg.routes.clear();
        custom_routes = true;
      }
      cfg.routes.push_back(parse_route(need()));
    } else if (a == "--fallback") {
      cfg.fallback_file = need();
    } else if (a == "--strict-404") {
      cfg.strict_not_found = true;
    } else if (a == "--quiet") {
      cfg.quiet = true;
    } else if (a == "--help") {
      cfg.show_help = true;
    } else {
      throw ConfigError("unknown option " + a);
    }
  }

  return cfg;
}

std::string usage() {
  return "Usage: route_server [--ip A.B.C.D] [--port N] [--threads N]\n"
         "                    [--queue-cap N] [--backlog N] "
         "[--io-timeout-ms N]\n"
         "                    [--route PATH=FILE]... [--fallback FILE]\n"
         "                    [--strict-404] [--quiet]\n"
         "Serves each PATH with the contents of FILE, read once at startup.\n"
         "Unmatched paths get the fallback file (200, or 404 with "
         "--strict-404).\n";
}
