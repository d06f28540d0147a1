#pragma once
#include <memory>

#include "config.hpp"
#include "route_table.hpp"

// Reads every configured route file once and freezes the result.
// Throws FileReadError if the fallback file cannot be read.
std::shared_ptr<const RouteTable> build_routes(const ServerConfig& cfg);

// Builds the route table, binds, installs SIGINT/SIGTERM handlers and serves
// until stopped. Any startup failure is logged and reported as exit code 1.
int run_server(const ServerConfig& cfg);
