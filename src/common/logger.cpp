#include "common/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <iostream>

std::mutex Logger::mutex_;
std::ofstream Logger::file_;
LogLevel Logger::threshold_ = LogLevel::INFO;
bool Logger::console_ = true;

namespace {

std::string timestamp() {
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

} // namespace

LogLevel parseLogLevel(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") return LogLevel::DEBUG;
    if (lower == "warning" || lower == "warn") return LogLevel::WARNING;
    if (lower == "error") return LogLevel::ERROR;
    if (lower == "fatal") return LogLevel::FATAL;
    return LogLevel::INFO;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG:   return "DEBUG";
        case LogLevel::INFO:    return "INFO";
        case LogLevel::WARNING: return "WARNING";
        case LogLevel::ERROR:   return "ERROR";
        case LogLevel::FATAL:   return "FATAL";
    }
    return "UNKNOWN";
}

bool Logger::initialize(const std::string& logPath, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    std::filesystem::path parent = std::filesystem::path(logPath).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Cannot create log directory " << parent << ": " << ec.message() << std::endl;
            return false;
        }
    }

    if (file_.is_open()) {
        file_.close();
    }
    file_.open(logPath, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Cannot open log file " << logPath << std::endl;
        return false;
    }
    threshold_ = level;
    return true;
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::setLogLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    threshold_ = level;
}

void Logger::setConsoleOutput(bool enabled) {
    std::lock_guard<std::mutex> lock(mutex_);
    console_ = enabled;
}

bool Logger::isInitialized() {
    std::lock_guard<std::mutex> lock(mutex_);
    return file_.is_open();
}

void Logger::write(LogLevel level, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!file_.is_open() || level < threshold_) {
        return;
    }

    std::string line = timestamp() + " [" + logLevelName(level) + "] " + message + "\n";
    file_ << line;
    file_.flush();

    if (console_) {
        std::ostream& out = level >= LogLevel::ERROR ? std::cerr : std::cout;
        out << line;
        out.flush();
    }
}

void Logger::debug(const std::string& message) { write(LogLevel::DEBUG, message); }
void Logger::info(const std::string& message) { write(LogLevel::INFO, message); }
void Logger::warning(const std::string& message) { write(LogLevel::WARNING, message); }
void Logger::error(const std::string& message) { write(LogLevel::ERROR, message); }
void Logger::fatal(const std::string& message) { write(LogLevel::FATAL, message); }
