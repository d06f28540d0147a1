#include "route_table.hpp"

#include <utility>

#include "errors.hpp"
#include "file_io.hpp"
#include "log.hpp"

RouteTable::RouteTable(std::string fallback_file)
    : RouteTable(std::move(fallback_file), read_file) {}

RouteTable::RouteTable(std::string fallback_file, FileReader reader)
    : fallback_file_(std::move(fallback_file)), reader_(std::move(reader)) {
  fallback_.body = read_fallback_or_throw();
}

std::string RouteTable::read_fallback_or_throw() const {
  auto body = reader_(fallback_file_);
  if (!body) {
    throw FileReadError("cannot read fallback file " + fallback_file_);
  }
  return *body;
}

void RouteTable::register_get(const std::string& path,
                              const std::string& file_name) {
  auto body = reader_(file_name);
  if (!body) {
    log_warn("route " + path + ": cannot read " + file_name + ", serving " +
             fallback_file_ + " instead");
    body = read_fallback_or_throw();
  }

  Response resp;
  resp.status = StatusCode::Ok;
  resp.body = std::move(*body);
  add_route(path, std::move(resp));
}

void RouteTable::add_route(const std::string& path, Response resp) {
  routes_[path] = std::move(resp);
}

void RouteTable::set_not_found_for_unmatched(bool enabled) {
  fallback_.status = enabled ? StatusCode::NotFound : StatusCode::Ok;
}

const Response& RouteTable::lookup(const std::string& path) const {
  const Response* hit = find(path);
  return hit ? *hit : fallback_;
}

const Response* RouteTable::find(const std::string& path) const {
  auto it = routes_.find(path);
  if (it == routes_.end()) return nullptr;
  return &it->second;
}
