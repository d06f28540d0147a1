#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

struct ServerConfig {
  std::string bind_ip = "127.0.0.1";
  uint16_t port = 7878;
  int threads = 4;
  size_t queue_cap = 4096;  // 0 = unbounded
  int backlog = 256;
  unsigned io_timeout_ms = 0;  // 0 = block forever
  bool strict_not_found = false;
  bool quiet = false;
  bool show_help = false;

  std::string fallback_file = "www/unknown.html";
  // path -> file name, registered in order
  std::vector<std::pair<std::string, std::string>> routes = {
      {"/", "www/main.html"},
      {"/makena", "www/makena.html"},
  };
};

// Parses "--flag value" style arguments on top of the defaults above.
// Out-of-range numbers keep the default (with a warning); a missing value,
// an unknown flag or a malformed --route throws ConfigError.
ServerConfig parse_args(int argc, const char* const* argv);

std::string usage();
