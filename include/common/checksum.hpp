#pragma once

#include <filesystem>
#include <string>

// Hex-encoded SHA-256 of the file contents. Returns an empty string (and logs)
// when the file cannot be read or the digest fails.
std::string sha256File(const std::filesystem::path& filePath);

std::string sha256Hex(const std::string& data);
