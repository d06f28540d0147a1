#include "file_io.hpp"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>

#include "log.hpp"

std::optional<std::string> read_file(const std::string& path) {
  std::ifstream in(path, std::ios::in | std::ios::binary);
  if (!in) {
    log_error("cannot open " + path + ": " + std::strerror(errno));
    return std::nullopt;
  }

  std::string contents((std::istreambuf_iterator<char>(in)),
                       std::istreambuf_iterator<char>());
  if (in.bad()) {
    log_error("error reading " + path);
    return std::nullopt;
  }
  return contents;
}
