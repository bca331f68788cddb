#pragma once

#include <filesystem>
#include <string>

namespace grounded_core {

// Hex-encoded SHA-256 of an in-memory buffer.
std::string sha256_hex(const std::string &content);

// Hex-encoded SHA-256 of a file, streamed from disk.
std::string sha256_file_hex(const std::filesystem::path &file_path);

}  // namespace grounded_core
