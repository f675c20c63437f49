#pragma once

#include "common/settings.hpp"
#include "common/subprocess.hpp"
#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

enum class MirrorKind {
    NONE,
    RSYNC,
    ROBOCOPY
};

// Bulk directory mirroring through a platform tool, retried with linear backoff.
// Callers keep a portable copy as the fallback.
class MirrorTool {
public:
    MirrorTool(const BackupSettings& settings, std::vector<std::string> excludePatterns);

    // "auto" picks robocopy on Windows and nothing elsewhere.
    static MirrorKind select(const std::string& name);

    MirrorKind kind() const { return kind_; }
    bool available() const;

    std::vector<std::string> commandLine(const std::filesystem::path& source,
                                         const std::filesystem::path& destination) const;
    bool isSuccessCode(int exitCode) const;

    // Waits out a retry delay in short slices, polling shouldStop on each one.
    // Returns false as soon as shouldStop asks to stop.
    static bool backoff(std::chrono::milliseconds wait, const Subprocess::StopPredicate& shouldStop);

    // The stop predicate doubles as a heartbeat while the tool runs and between retries.
    bool mirror(const std::filesystem::path& source,
                const std::filesystem::path& destination,
                const Subprocess::StopPredicate& shouldStop,
                std::string& error) const;

private:
    static constexpr std::chrono::milliseconds kBackoffSlice{250};

    BackupSettings settings_;
    std::vector<std::string> excludePatterns_;
    MirrorKind kind_;
};
