#include "common/utils.hpp"
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <climits>

namespace utils {

std::string hostname() {
    char buffer[HOST_NAME_MAX + 1] = {0};
    if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "localhost";
    }
    return buffer;
}

std::string platformName() {
#if defined(_WIN32)
    return "windows";
#elif defined(__APPLE__)
    return "macos";
#elif defined(__linux__)
    return "linux";
#else
    return "unknown";
#endif
}

std::string isoTimestamp(std::chrono::system_clock::time_point when) {
    auto time = std::chrono::system_clock::to_time_t(when);
    std::tm localTime{};
    localtime_r(&time, &localTime);

    std::stringstream ss;
    ss << std::put_time(&localTime, "%Y-%m-%dT%H:%M:%S");
    return ss.str();
}

std::string formatSize(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    double size = static_cast<double>(bytes);
    size_t unit = 0;
    while (size >= 1024.0 && unit < 5) {
        size /= 1024.0;
        ++unit;
    }

    std::stringstream ss;
    ss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return ss.str();
}

std::string randomHex(size_t digits) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(0, 15);
    const char* hex = "0123456789abcdef";

    std::string result;
    result.reserve(digits);
    for (size_t i = 0; i < digits; ++i) {
        result.push_back(hex[dis(gen)]);
    }
    return result;
}

double modificationTime(const std::filesystem::path& path) {
    struct stat st;
    if (stat(path.c_str(), &st) != 0) {
        return 0.0;
    }
    return static_cast<double>(st.st_mtim.tv_sec) +
           static_cast<double>(st.st_mtim.tv_nsec) / 1e9;
}

std::string shellQuote(const std::string& argument) {
    std::string quoted = "'";
    for (char c : argument) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

} // namespace utils
