#pragma once
#include <atomic>
#include <cstdint>
#include <memory>

#include "config.hpp"
#include "dispatcher.hpp"
#include "route_table.hpp"
#include "thread_pool.hpp"

// Accept loop in front of a ThreadPool. The route table must be complete
// before construction; it is only read from here on.
class Server {
 public:
  // Starts the worker pool. Throws PoolConfigurationError if cfg.threads < 1.
  Server(ServerConfig cfg, std::shared_ptr<const RouteTable> routes);
  ~Server();

  Server(const Server&) = delete;
  Server& operator=(const Server&) = delete;

  // socket + bind + listen. Throws BindError.
  void bind_listener();

  // Accepts until stop(). Returns after every accepted connection has been
  // served and all workers joined.
  void run();

  // Breaks a blocked accept(). Async-signal-safe.
  void stop();

  // Bound port (useful with port 0). 0 before bind_listener().
  uint16_t port() const { return bound_port_; }

 private:
  ServerConfig cfg_;
  Dispatcher dispatcher_;
  ThreadPool pool_;
  uint16_t bound_port_ = 0;

  std::atomic<int> listen_fd_{-1};
  std::atomic<bool> running_{false};
};
