#include "http_message.hpp"

#include <sstream>

#include "log.hpp"

const char* method_name(Method m) {
  switch (m) {
    case Method::Get:
      return "GET";
    case Method::Post:
      return "POST";
    case Method::Put:
      return "PUT";
    case Method::Delete:
      return "DELETE";
  }
  return "GET";
}

int status_number(StatusCode s) { return static_cast<int>(s); }

const char* reason_phrase(StatusCode s) {
  switch (s) {
    case StatusCode::Ok:
      return "OK";
    case StatusCode::BadRequest:
      return "Bad Request";
    case StatusCode::NotFound:
      return "Not Found";
    case StatusCode::InternalServerError:
      return "Internal Server Error";
  }
  return "Internal Server Error";
}

std::string status_text(StatusCode s) {
  return std::to_string(status_number(s)) + " " + reason_phrase(s);
}

static bool parse_method(const std::string& token, Method& out) {
  // case-sensitive, as HTTP method tokens are
  if (token == "GET") {
    out = Method::Get;
  } else if (token == "POST") {
    out = Method::Post;
  } else if (token == "PUT") {
    out = Method::Put;
  } else if (token == "DELETE") {
    out = Method::Delete;
  } else {
    return false;
  }
  return true;
}

Request parse_request_line(const std::string& line) {
  std::istringstream iss(line);
  std::string method, path, protocol;
  iss >> method >> path >> protocol;

  Request req;

  if (method.empty()) {
    log_warn("request line has no method, assuming GET");
  } else if (!parse_method(method, req.method)) {
    log_warn("unknown method '" + method + "', assuming GET");
  }

  if (path.empty()) {
    log_warn("request line has no path, assuming /");
  } else {
    req.path = path;
  }

  if (protocol.empty()) {
    log_warn("request line has no protocol, assuming HTTP/1.1");
  } else {
    req.protocol = protocol;
  }

  return req;
}

std::string format_response(const Response& resp) {
  std::string out;
  out.reserve(resp.protocol.size() + resp.body.size() + 64);
  out += resp.protocol;
  out += ' ';
  out += status_text(resp.status);
  out += "\r\nContent-Length: ";
  out += std::to_string(resp.body.size());
  out += "\r\n\r\n";
  out += resp.body;
  return out;
}
