#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>

namespace utils {

std::string hostname();

// "linux", "windows", "macos" or "unknown"
std::string platformName();

// ISO-8601 local time with seconds, e.g. 2024-05-01T13:45:10
std::string isoTimestamp(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

std::string formatSize(uint64_t bytes);

// Short random identifier (8 lowercase hex digits by default).
std::string randomHex(size_t digits = 8);

// Seconds since the Unix epoch with sub-second precision, as reported by stat().
// Returns 0 when the file cannot be stat'ed.
double modificationTime(const std::filesystem::path& path);

// Shell-quotes a single argument for /bin/sh.
std::string shellQuote(const std::string& argument);

} // namespace utils
