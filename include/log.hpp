#pragma once
#include <string>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_log_level(LogLevel level);

// One line per call on stderr. Safe to call from any worker.
void log_line(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { log_line(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg) { log_line(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg) { log_line(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { log_line(LogLevel::Error, msg); }

// Like perror(): "<what>: <strerror(errno)>" at error level.
void log_errno(const std::string& what);
