#pragma once
#include <cstddef>
#include <memory>
#include <string>

#include "http_message.hpp"
#include "route_table.hpp"

// Per-connection pipeline: read the request line, parse it, look up the
// route and write the response. One instance is shared by all workers.
class Dispatcher {
 public:
  explicit Dispatcher(std::shared_ptr<const RouteTable> routes,
                      size_t max_line = 8192);

  // Handles one request on fd. Returns true if a complete response was
  // written; false if the peer went away before sending anything or the
  // write failed. Never closes fd.
  bool serve(int fd) const;

  // The bytes serve() would write for this request line.
  std::string respond(const std::string& request_line) const;

  const Response& route(const Request& req) const;

 private:
  std::shared_ptr<const RouteTable> routes_;
  size_t max_line_;
};
