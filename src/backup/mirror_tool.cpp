#include "backup/mirror_tool.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <chrono>
#include <thread>

MirrorTool::MirrorTool(const BackupSettings& settings, std::vector<std::string> excludePatterns)
    : settings_(settings)
    , excludePatterns_(std::move(excludePatterns))
    , kind_(select(settings.mirrorTool)) {
}

MirrorKind MirrorTool::select(const std::string& name) {
    if (name == "rsync") {
        return MirrorKind::RSYNC;
    }
    if (name == "robocopy") {
        return MirrorKind::ROBOCOPY;
    }
#if defined(_WIN32)
    if (name == "auto") {
        return MirrorKind::ROBOCOPY;
    }
#endif
    return MirrorKind::NONE;
}

bool MirrorTool::available() const {
    switch (kind_) {
        case MirrorKind::RSYNC: return Subprocess::existsInPath("rsync");
        case MirrorKind::ROBOCOPY: return Subprocess::existsInPath("robocopy");
        case MirrorKind::NONE: return false;
    }
    return false;
}

std::vector<std::string> MirrorTool::commandLine(const std::filesystem::path& source,
                                                 const std::filesystem::path& destination) const {
    std::vector<std::string> argv;
    if (kind_ == MirrorKind::ROBOCOPY) {
        argv = {"robocopy", source.string(), destination.string(), "/MIR",
                "/MT:" + std::to_string(settings_.mirrorThreads),
                "/R:" + std::to_string(settings_.mirrorRetries),
                "/W:" + std::to_string(settings_.mirrorRetryWaitSeconds),
                "/NP", "/NDL", "/NFL", "/NJH", "/NJS"};
        std::vector<std::string> dirs, files;
        for (const auto& pattern : excludePatterns_) {
            (pattern.find('*') != std::string::npos || pattern.find('.') != std::string::npos ? files : dirs)
                .push_back(pattern);
        }
        if (!dirs.empty()) {
            argv.push_back("/XD");
            argv.insert(argv.end(), dirs.begin(), dirs.end());
        }
        if (!files.empty()) {
            argv.push_back("/XF");
            argv.insert(argv.end(), files.begin(), files.end());
        }
    } else if (kind_ == MirrorKind::RSYNC) {
        argv = {"rsync", "-a", "--delete"};
        for (const auto& pattern : excludePatterns_) {
            argv.push_back("--exclude=" + pattern);
        }
        // Trailing slash: copy the contents, not the directory itself
        argv.push_back(source.string() + "/");
        argv.push_back(destination.string() + "/");
    }
    return argv;
}

bool MirrorTool::isSuccessCode(int exitCode) const {
    switch (kind_) {
        case MirrorKind::ROBOCOPY: return exitCode >= 0 && exitCode < 8;
        case MirrorKind::RSYNC: return exitCode == 0 || exitCode == 24;  // 24: files vanished mid-run
        case MirrorKind::NONE: return false;
    }
    return false;
}

bool MirrorTool::backoff(std::chrono::milliseconds wait, const Subprocess::StopPredicate& shouldStop) {
    auto deadline = std::chrono::steady_clock::now() + wait;
    while (true) {
        if (shouldStop && shouldStop()) {
            return false;
        }
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(kBackoffSlice, deadline - now));
    }
}

bool MirrorTool::mirror(const std::filesystem::path& source,
                        const std::filesystem::path& destination,
                        const Subprocess::StopPredicate& shouldStop,
                        std::string& error) const {
    if (!available()) {
        error = "no mirroring tool available";
        return false;
    }

    auto argv = commandLine(source, destination);
    int attempts = std::max(1, settings_.mirrorRetries);
    for (int attempt = 1; attempt <= attempts; ++attempt) {
        Logger::info("Mirroring " + source.string() + " with " + argv.front() +
                     " (attempt " + std::to_string(attempt) + ")");
        SubprocessResult result = Subprocess::run(argv, std::chrono::milliseconds(0), shouldStop);
        if (result.interrupted) {
            error = "mirroring interrupted";
            return false;
        }
        if (isSuccessCode(result.exitCode)) {
            return true;
        }

        error = argv.front() + " exited with code " + std::to_string(result.exitCode);
        Logger::warning(error);
        if (attempt < attempts &&
            !backoff(std::chrono::seconds(settings_.mirrorRetryWaitSeconds * attempt), shouldStop)) {
            error = "mirroring interrupted";
            return false;
        }
    }
    return false;
}
