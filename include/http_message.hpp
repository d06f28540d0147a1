#pragma once

#include <string>

enum class Method { Get, Post, Put, Delete };

enum class StatusCode {
  Ok = 200,
  BadRequest = 400,
  NotFound = 404,
  InternalServerError = 500,
};

// Only the request line is parsed; body is never populated.
struct Request {
  Method method = Method::Get;
  std::string path = "/";
  std::string protocol = "HTTP/1.1";
  std::string body;
};

struct Response {
  std::string protocol = "HTTP/1.1";
  StatusCode status = StatusCode::Ok;
  std::string body;
};

const char* method_name(Method m);
int status_number(StatusCode s);
const char* reason_phrase(StatusCode s);

// "200 OK", "404 Not Found", ...
std::string status_text(StatusCode s);

// Splits "<METHOD> <PATH> <PROTOCOL>" on whitespace. Never fails: a missing
// or unrecognised method becomes GET, a missing path "/", a missing protocol
// "HTTP/1.1", each with a warning logged.
Request parse_request_line(const std::string& line);

// "<protocol> <status>\r\nContent-Length: <bytes>\r\n\r\n<body>"
std::string format_response(const Response& resp);
