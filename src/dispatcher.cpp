#include "dispatcher.hpp"

#include <cstring>
#include <utility>

#include "log.hpp"
#include "protocol.hpp"

Dispatcher::Dispatcher(std::shared_ptr<const RouteTable> routes,
                       size_t max_line)
    : routes_(std::move(routes)), max_line_(max_line) {}

const Response& Dispatcher::route(const Request& req) const {
  if (!routes_->find(req.path)) {
    log_warn(std::string("no handler found for path ") + req.path + " (" +
             method_name(req.method) + ")");
  }
  return routes_->lookup(req.path);
}

std::string Dispatcher::respond(const std::string& request_line) const {
  Request req = parse_request_line(request_line);
  return format_response(route(req));
}

bool Dispatcher::serve(int fd) const {
  LineReader lr(max_line_);
  ReadResult rr = lr.read_line(fd);

  switch (rr.status) {
    case ReadStatus::Line:
      break;
    case ReadStatus::Partial:
      log_warn("connection closed mid request line, answering anyway");
      break;
    case ReadStatus::TooLong:
      log_warn("request line longer than " + std::to_string(max_line_) +
               " bytes, truncated");
      break;
    case ReadStatus::Closed:
      log_debug("connection closed before request line");
      return false;
    case ReadStatus::Error:
      log_error(std::string("reading request line: ") + std::strerror(rr.err));
      return false;
  }

  log_debug("request: " + rr.line);

  std::string out = respond(rr.line);
  if (!send_str(fd, out)) {
    log_errno("writing response");
    return false;
  }
  return true;
}
