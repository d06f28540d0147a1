#include "server.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>
#include <utility>

#include "errors.hpp"
#include "log.hpp"
#include "protocol.hpp"

static constexpr std::chrono::milliseconds kAcceptBackoff{10};

Server::Server(ServerConfig cfg, std::shared_ptr<const RouteTable> routes)
    : cfg_(std::move(cfg)),
      dispatcher_(std::move(routes)),
      pool_(cfg_.threads, cfg_.queue_cap) {}

Server::~Server() {
  pool_.shutdown();
  int fd = listen_fd_.exchange(-1);
  if (fd != -1) ::close(fd);
}

void Server::bind_listener() {
  std::string address = cfg_.bind_ip + ":" + std::to_string(cfg_.port);

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(cfg_.port);
  if (inet_pton(AF_INET, cfg_.bind_ip.c_str(), &addr.sin_addr) != 1) {
    throw BindError("invalid bind address " + address);
  }

  ScopedFd fd(::socket(AF_INET, SOCK_STREAM, 0));
  if (!fd.valid()) {
    throw BindError(std::string("socket: ") + std::strerror(errno));
  }

  int yes = 1;
  if (setsockopt(fd.get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes)) < 0) {
    throw BindError(std::string("setsockopt: ") + std::strerror(errno));
  }

  if (::bind(fd.get(), (sockaddr*)&addr, sizeof(addr)) < 0) {
    throw BindError("bind " + address + ": " + std::strerror(errno));
  }

  if (::listen(fd.get(), cfg_.backlog) < 0) {
    throw BindError("listen " + address + ": " + std::strerror(errno));
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  if (getsockname(fd.get(), (sockaddr*)&bound, &len) < 0) {
    throw BindError(std::string("getsockname: ") + std::strerror(errno));
  }
  bound_port_ = ntohs(bound.sin_port);

  int old = listen_fd_.exchange(fd.release());
  if (old != -1) ::close(old);
  running_.store(true);
}

void Server::run() {
  if (listen_fd_.load() < 0) {
    log_warn("run(): listener not bound or already stopped");
    pool_.shutdown();
    return;
  }

  log_info("Listening on " + cfg_.bind_ip + ":" + std::to_string(bound_port_) +
           " with " + std::to_string(cfg_.threads) + " threads");

  while (running_.load()) {
    int listen_fd = listen_fd_.load();
    if (listen_fd < 0) break;

    sockaddr_in client_addr{};
    socklen_t client_len = sizeof(client_addr);
    int client_fd = ::accept(listen_fd, (sockaddr*)&client_addr, &client_len);

    if (client_fd < 0) {
      // stop() shut the socket down under us
      if (!running_.load()) break;
      int err = errno;
      if (err == EINTR) continue;
      log_errno("accept");
      // Out of descriptors: the pending connection stays queued, so retrying
      // at once would only spin.
      if (err == EMFILE || err == ENFILE) {
        std::this_thread::sleep_for(kAcceptBackoff);
      }
      continue;
    }

    if (!set_io_timeout(client_fd, cfg_.io_timeout_ms)) {
      log_errno("setting connection timeout");
    }

    // shared_ptr keeps the job copyable for std::function; the fd is closed
    // when the job (or a rejected submit) releases it.
    auto conn = std::make_shared<ScopedFd>(client_fd);
    const Dispatcher& dispatcher = dispatcher_;
    bool ok = pool_.submit([conn, &dispatcher]() {
      if (!dispatcher.serve(conn->get())) {
        log_debug("connection dropped without a response");
      }
    });

    if (!ok) {
      log_warn("worker pool closed, dropping connection");
      break;
    }
  }

  // Drain everything already accepted, then join.
  pool_.shutdown();

  int fd = listen_fd_.exchange(-1);
  if (fd != -1) ::close(fd);

  log_info("Server stopped.");
}

void Server::stop() {
  running_.store(false);

  int fd = listen_fd_.exchange(-1);
  if (fd != -1) {
    ::shutdown(fd, SHUT_RDWR);
    ::close(fd);
  }
}
