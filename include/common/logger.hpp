#pragma once

#include <fstream>
#include <mutex>
#include <string>

enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    FATAL
};

// Maps "debug", "info", "warning"/"warn", "error", "fatal" (any case); unknown names yield INFO.
LogLevel parseLogLevel(const std::string& name);
const char* logLevelName(LogLevel level);

// Process-wide log sink. Messages logged before initialize() are dropped.
class Logger {
public:
    static bool initialize(const std::string& logPath, LogLevel level = LogLevel::INFO);
    static void shutdown();
    static void setLogLevel(LogLevel level);
    static void setConsoleOutput(bool enabled);
    static bool isInitialized();

    static void debug(const std::string& message);
    static void info(const std::string& message);
    static void warning(const std::string& message);
    static void error(const std::string& message);
    static void fatal(const std::string& message);

private:
    static void write(LogLevel level, const std::string& message);

    static std::mutex mutex_;
    static std::ofstream file_;
    static LogLevel threshold_;
    static bool console_;
};
