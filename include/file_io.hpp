#pragma once
#include <optional>
#include <string>

// Reads a whole file as raw bytes. On failure logs the path and reason and
// returns nullopt.
std::optional<std::string> read_file(const std::string& path);
