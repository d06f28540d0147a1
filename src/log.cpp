#include "log.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>
#include <system_error>

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
static std::mutex g_log_mu;

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

static const char* level_tag(LogLevel level) {
  switch (level) {
    case LogLevel::Debug:
      return "DEBUG";
    case LogLevel::Info:
      return "INFO";
    case LogLevel::Warn:
      return "WARN";
    case LogLevel::Error:
      return "ERROR";
  }
  return "?";
}

void log_line(LogLevel level, const std::string& msg) {
  if (static_cast<int>(level) < g_level.load()) return;
  try {
    std::lock_guard<std::mutex> lk(g_log_mu);
    std::cerr << "[" << level_tag(level) << "] " << msg << "\n";
  } catch (const std::system_error&) {
    // mutex failure: drop the line, logging is best-effort
  }
}

void log_errno(const std::string& what) {
  int err = errno;
  log_error(what + ": " + std::strerror(err));
}
