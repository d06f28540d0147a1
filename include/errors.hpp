#pragma once
#include <stdexcept>
#include <string>

// Startup-time failures. Everything that can go wrong on a live connection is
// reported through return values instead and never reaches these.

class BindError : public std::runtime_error {
 public:
  explicit BindError(const std::string& what) : std::runtime_error(what) {}
};

class PoolConfigurationError : public std::runtime_error {
 public:
  explicit PoolConfigurationError(const std::string& what)
      : std::runtime_error(what) {}
};

// Thrown only when the fallback content itself cannot be read.
class FileReadError : public std::runtime_error {
 public:
  explicit FileReadError(const std::string& what) : std::runtime_error(what) {}
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};
