#pragma once

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

enum class BackupMode {
    HOT,            // live copy, service untouched
    COLD,           // service stopped for the whole copy
    SMART,          // live copy, then a short cold pass over the critical files
    INCREMENTAL,    // only files whose size or mtime moved since the last manifest
    DATABASE_ONLY   // databases and preferences with the service stopped
};

enum class BackupStatus {
    IDLE,
    PREPARING,
    STOPPING_SERVICE,
    COPYING,
    VERIFYING,
    COMPRESSING,
    STARTING_SERVICE,
    COMPLETED,
    FAILED,
    CANCELLED
};

std::string backupModeToString(BackupMode mode);
std::optional<BackupMode> parseBackupMode(const std::string& name);
std::string backupStatusToString(BackupStatus status);
bool isTerminal(BackupStatus status);

struct BackupProgress {
    BackupStatus status = BackupStatus::IDLE;
    std::string phase;
    std::string currentFile;
    uint64_t filesTotal = 0;
    uint64_t filesDone = 0;
    uint64_t bytesTotal = 0;
    uint64_t bytesDone = 0;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
    std::chrono::system_clock::time_point startTime{};
    std::optional<std::chrono::system_clock::time_point> endTime;

    double percent() const;
    double elapsedSeconds() const;
    double speedBytesPerSecond() const;
    double etaSeconds() const;

    nlohmann::json toJson() const;
};
