#include <iostream>

#include "app.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "log.hpp"

int main(int argc, char** argv) {
  ServerConfig cfg;
  try {
    cfg = parse_args(argc, argv);
  } catch (const ConfigError& e) {
    std::cerr << e.what() << "\n" << usage();
    return 1;
  }

  if (cfg.show_help) {
    std::cout << usage();
    return 0;
  }
  if (cfg.quiet) set_log_level(LogLevel::Warn);

  return run_server(cfg);
}
