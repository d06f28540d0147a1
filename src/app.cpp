#include "app.hpp"

#include <signal.h>

#include <atomic>
#include <exception>
#include <string>

#include "log.hpp"
#include "server.hpp"

static std::atomic<Server*> g_server{nullptr};

static void on_signal(int) {
  Server* s = g_server.load();
  if (s) s->stop();
}

static bool install_signal_handlers() {
  struct sigaction sa {};
  sa.sa_handler = on_signal;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;  // no SA_RESTART: accept() must return EINTR
  if (sigaction(SIGINT, &sa, nullptr) < 0) return false;
  if (sigaction(SIGTERM, &sa, nullptr) < 0) return false;
  return true;
}

// Clears the signal target before the server it points at is destroyed.
struct SignalTarget {
  explicit SignalTarget(Server* s) { g_server.store(s); }
  ~SignalTarget() { g_server.store(nullptr); }
};

std::shared_ptr<const RouteTable> build_routes(const ServerConfig& cfg) {
  auto table = std::make_shared<RouteTable>(cfg.fallback_file);
  for (const auto& r : cfg.routes) {
    table->register_get(r.first, r.second);
    log_info("route " + r.first + " -> " + r.second);
  }
  table->set_not_found_for_unmatched(cfg.strict_not_found);
  return table;
}

int run_server(const ServerConfig& cfg) {
  try {
    // Routes are frozen before the listener exists; workers only read them.
    auto routes = build_routes(cfg);

    Server server(cfg, routes);
    server.bind_listener();

    SignalTarget target(&server);
    if (!install_signal_handlers()) log_errno("sigaction");
    log_info("Press Ctrl+C to stop gracefully.");

    server.run();
  } catch (const std::exception& e) {
    // FileReadError, PoolConfigurationError, BindError, or std::system_error
    // from a worker thread that failed to spawn.
    log_error(std::string("startup failed: ") + e.what());
    return 1;
  }
  return 0;
}
