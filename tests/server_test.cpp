#include "server.hpp"

#include <gtest/gtest.h>
#include <sys/resource.h>

#include <atomic>
#include <cerrno>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "errors.hpp"
#include "protocol.hpp"
#include "test_util.hpp"

namespace {

class ServerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto table = std::make_shared<RouteTable>(dir_.write("unknown.html", "unknown"));
    table->register_get("/", dir_.write("main.html", "Hello"));
    table->register_get("/makena", dir_.write("makena.html", "makena page"));
    routes_ = table;

    cfg_.port = 0;
    cfg_.threads = 2;
  }

  void start(ServerConfig cfg) {
    server_ = std::make_unique<Server>(cfg, routes_);
    server_->bind_listener();
    runner_ = std::thread([this] { server_->run(); });
  }

  void TearDown() override {
    if (server_) server_->stop();
    if (runner_.joinable()) runner_.join();
  }

  TempDir dir_;
  std::shared_ptr<const RouteTable> routes_;
  ServerConfig cfg_;
  std::unique_ptr<Server> server_;
  std::thread runner_;
};

}  // namespace

TEST_F(ServerTest, AnswersRootWithExactBytes) {
  start(cfg_);
  EXPECT_EQ(http_exchange(server_->port(), "GET / HTTP/1.1\r\n\r\n"),
            "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nHello");
}

TEST_F(ServerTest, UnknownPathsGetFallback) {
  start(cfg_);
  for (const char* p : {"/x", "/y", "/makena/extra"}) {
    EXPECT_EQ(http_exchange(server_->port(), std::string("GET ") + p + " HTTP/1.1\r\n\r\n"),
              "HTTP/1.1 200 OK\r\nContent-Length: 7\r\n\r\nunknown")
        << p;
  }
}

TEST_F(ServerTest, StrictModeAnswers404) {
  auto table = std::make_shared<RouteTable>(dir_.path("unknown.html"));
  table->register_get("/", dir_.path("main.html"));
  table->set_not_found_for_unmatched(true);
  routes_ = table;

  start(cfg_);
  EXPECT_EQ(http_exchange(server_->port(), "GET /x HTTP/1.1\r\n\r\n"),
            "HTTP/1.1 404 Not Found\r\nContent-Length: 7\r\n\r\nunknown");
}

TEST_F(ServerTest, ServesFrozenContentAfterFileChanges) {
  start(cfg_);
  const std::string expected = "HTTP/1.1 200 OK\r\nContent-Length: 11\r\n\r\nmakena page";
  EXPECT_EQ(http_exchange(server_->port(), "GET /makena HTTP/1.1\r\n\r\n"), expected);

  dir_.write("makena.html", "rewritten");
  EXPECT_EQ(http_exchange(server_->port(), "GET /makena HTTP/1.1\r\n\r\n"), expected);
}

TEST_F(ServerTest, ManyConcurrentClientsAllServed) {
  start(cfg_);
  const int kClients = 32;
  std::atomic<int> good{0};

  std::vector<std::thread> clients;
  for (int i = 0; i < kClients; i++) {
    clients.emplace_back([&, i] {
      std::string path = (i % 2) ? "/" : "/makena";
      std::string out = http_exchange(server_->port(), "GET " + path + " HTTP/1.1\r\n\r\n");
      std::string body = (i % 2) ? "Hello" : "makena page";
      if (out == "HTTP/1.1 200 OK\r\nContent-Length: " + std::to_string(body.size()) +
                     "\r\n\r\n" + body)
        good.fetch_add(1);
    });
  }
  for (auto& t : clients) t.join();
  EXPECT_EQ(good.load(), kClients);
}

TEST_F(ServerTest, SilentClientDoesNotStopOthers) {
  start(cfg_);
  int idle = connect_local(server_->port());
  ASSERT_GE(idle, 0);

  // One worker is stuck on the idle client; the other still serves.
  EXPECT_EQ(http_exchange(server_->port(), "GET / HTTP/1.1\r\n\r\n"),
            "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nHello");
  ::close(idle);
}

TEST_F(ServerTest, IoTimeoutReleasesSilentClient) {
  cfg_.threads = 1;
  cfg_.io_timeout_ms = 100;
  start(cfg_);

  int idle = connect_local(server_->port());
  ASSERT_GE(idle, 0);
  // The single worker is freed once the idle read times out.
  EXPECT_EQ(http_exchange(server_->port(), "GET / HTTP/1.1\r\n\r\n"),
            "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nHello");
  ::close(idle);
}

TEST_F(ServerTest, KeepsAcceptingAfterDescriptorExhaustion) {
  start(cfg_);
  // let the accept loop block first
  std::this_thread::sleep_for(std::chrono::milliseconds(20));

  ScopedFd first(::socket(AF_INET, SOCK_STREAM, 0));
  ScopedFd second(::socket(AF_INET, SOCK_STREAM, 0));
  ASSERT_TRUE(first.valid());
  ASSERT_TRUE(second.valid());

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(server_->port());
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  rlimit saved{};
  ASSERT_EQ(::getrlimit(RLIMIT_NOFILE, &saved), 0);
  rlimit none = saved;
  none.rlim_cur = 0;
  ASSERT_EQ(::setrlimit(RLIMIT_NOFILE, &none), 0);

  // connect() needs no new descriptor; accept() now fails with EMFILE.
  bool connected =
      ::connect(first.get(), (sockaddr*)&addr, sizeof(addr)) == 0 &&
      ::connect(second.get(), (sockaddr*)&addr, sizeof(addr)) == 0;
  const std::string req = "GET / HTTP/1.1\r\n\r\n";
  send_str(first.get(), req);
  send_str(second.get(), req);
  std::this_thread::sleep_for(std::chrono::milliseconds(100));

  char c;
  ssize_t n = ::recv(second.get(), &c, 1, MSG_DONTWAIT | MSG_PEEK);
  int recv_err = errno;

  ASSERT_EQ(::setrlimit(RLIMIT_NOFILE, &saved), 0);
  ASSERT_TRUE(connected);
  EXPECT_LT(n, 0);
  EXPECT_TRUE(recv_err == EAGAIN || recv_err == EWOULDBLOCK);

  const std::string expected = "HTTP/1.1 200 OK\r\nContent-Length: 5\r\n\r\nHello";
  EXPECT_EQ(read_until_eof(first.get()), expected);
  EXPECT_EQ(read_until_eof(second.get()), expected);
  EXPECT_EQ(http_exchange(server_->port(), req), expected);
}

TEST_F(ServerTest, StopEndsRunAndJoinsWorkers) {
  start(cfg_);
  EXPECT_FALSE(http_exchange(server_->port(), "GET / HTTP/1.1\r\n\r\n").empty());
  server_->stop();
  runner_.join();
  SUCCEED();
}

TEST_F(ServerTest, ZeroThreadsFailsBeforeBinding) {
  cfg_.threads = 0;
  EXPECT_THROW(Server s(cfg_, routes_), PoolConfigurationError);
}

TEST_F(ServerTest, BindFailuresThrow) {
  cfg_.bind_ip = "not-an-ip";
  Server bad_ip(cfg_, routes_);
  EXPECT_THROW(bad_ip.bind_listener(), BindError);

  cfg_.bind_ip = "127.0.0.1";
  Server first(cfg_, routes_);
  first.bind_listener();

  ServerConfig taken = cfg_;
  taken.port = first.port();
  Server second(taken, routes_);
  EXPECT_THROW(second.bind_listener(), BindError);
}
