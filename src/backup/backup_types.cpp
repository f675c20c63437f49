#include "backup/backup_types.hpp"
#include "common/utils.hpp"

std::string backupModeToString(BackupMode mode) {
    switch (mode) {
        case BackupMode::HOT: return "hot";
        case BackupMode::COLD: return "cold";
        case BackupMode::SMART: return "smart";
        case BackupMode::INCREMENTAL: return "incremental";
        case BackupMode::DATABASE_ONLY: return "database_only";
    }
    return "hot";
}

std::optional<BackupMode> parseBackupMode(const std::string& name) {
    if (name == "hot") return BackupMode::HOT;
    if (name == "cold") return BackupMode::COLD;
    if (name == "smart") return BackupMode::SMART;
    if (name == "incremental") return BackupMode::INCREMENTAL;
    if (name == "database_only") return BackupMode::DATABASE_ONLY;
    return std::nullopt;
}

std::string backupStatusToString(BackupStatus status) {
    switch (status) {
        case BackupStatus::IDLE: return "idle";
        case BackupStatus::PREPARING: return "preparing";
        case BackupStatus::STOPPING_SERVICE: return "stopping_service";
        case BackupStatus::COPYING: return "copying";
        case BackupStatus::VERIFYING: return "verifying";
        case BackupStatus::COMPRESSING: return "compressing";
        case BackupStatus::STARTING_SERVICE: return "starting_service";
        case BackupStatus::COMPLETED: return "completed";
        case BackupStatus::FAILED: return "failed";
        case BackupStatus::CANCELLED: return "cancelled";
    }
    return "idle";
}

bool isTerminal(BackupStatus status) {
    return status == BackupStatus::COMPLETED ||
           status == BackupStatus::FAILED ||
           status == BackupStatus::CANCELLED;
}

double BackupProgress::percent() const {
    if (bytesTotal == 0) {
        return status == BackupStatus::COMPLETED ? 100.0 : 0.0;
    }
    return static_cast<double>(bytesDone) / static_cast<double>(bytesTotal) * 100.0;
}

double BackupProgress::elapsedSeconds() const {
    if (startTime.time_since_epoch().count() == 0) {
        return 0.0;
    }
    auto end = endTime.value_or(std::chrono::system_clock::now());
    return std::chrono::duration<double>(end - startTime).count();
}

double BackupProgress::speedBytesPerSecond() const {
    double elapsed = elapsedSeconds();
    if (elapsed <= 0.0) {
        return 0.0;
    }
    return static_cast<double>(bytesDone) / elapsed;
}

double BackupProgress::etaSeconds() const {
    double speed = speedBytesPerSecond();
    if (speed <= 0.0 || bytesDone >= bytesTotal) {
        return 0.0;
    }
    return static_cast<double>(bytesTotal - bytesDone) / speed;
}

nlohmann::json BackupProgress::toJson() const {
    return {
        {"status", backupStatusToString(status)},
        {"phase", phase},
        {"current_file", currentFile},
        {"files_total", filesTotal},
        {"files_done", filesDone},
        {"bytes_total", bytesTotal},
        {"bytes_done", bytesDone},
        {"percent", percent()},
        {"elapsed_seconds", elapsedSeconds()},
        {"started_at", utils::isoTimestamp(startTime)},
        {"errors", errors},
        {"warnings", warnings}
    };
}
