#pragma once
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <unordered_map>

#include "http_message.hpp"

// Static path -> response map, filled during setup and read-only afterwards.
//
// Responses are read from disk once at registration and frozen; later changes
// to the files are never seen. Once serving starts the table is shared between
// workers as shared_ptr<const RouteTable>, so lookups take no lock. Adding
// routes after that point would need a fresh table swapped in whole.
class RouteTable {
 public:
  using FileReader =
      std::function<std::optional<std::string>(const std::string&)>;

  // Loads the fallback content right away; throws FileReadError if it cannot
  // be read.
  explicit RouteTable(std::string fallback_file);
  RouteTable(std::string fallback_file, FileReader reader);

  // Reads file_name once. If that fails the fallback file is read instead;
  // if that fails too, throws FileReadError. Re-registering a path replaces
  // the previous entry.
  void register_get(const std::string& path, const std::string& file_name);

  void add_route(const std::string& path, Response resp);

  // Unmatched paths answer 404 instead of 200 with the fallback body.
  void set_not_found_for_unmatched(bool enabled);

  // Exact match; returns the fallback response on a miss.
  const Response& lookup(const std::string& path) const;

  // Exact match; nullptr on a miss.
  const Response* find(const std::string& path) const;

  const Response& fallback() const { return fallback_; }
  size_t size() const { return routes_.size(); }

 private:
  std::string read_fallback_or_throw() const;

  std::string fallback_file_;
  FileReader reader_;
  Response fallback_;
  std::unordered_map<std::string, Response> routes_;
};
