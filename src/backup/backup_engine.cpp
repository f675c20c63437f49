#include "backup/backup_engine.hpp"
#include "adapters/compression_adapter.hpp"
#include "adapters/service_controller.hpp"
#include "backup/backup_verifier.hpp"
#include "backup/mirror_tool.hpp"
#include "common/checksum.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"

namespace fs = std::filesystem;

BackupEngine::BackupEngine(std::shared_ptr<AppContext> context)
    : context_(std::move(context))
    , copier_(ExclusionFilter(context_->settings.layout.excludePatterns)) {
}

BackupEngine::~BackupEngine() {
    stopWorker();
}

uint64_t BackupEngine::estimateSize(const std::vector<std::string>& paths) const {
    return copier_.measure(paths);
}

bool BackupEngine::start(const BackupOptions& options) {
    return launch([this, options]() { run(options); });
}

BackupProgress BackupEngine::getProgress() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return snapshot_;
}

void BackupEngine::addProgressObserver(ProgressObserver observer) {
    observers_.add(std::move(observer));
}

std::optional<BackupManifest> BackupEngine::getManifest() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return manifest_;
}

std::string BackupEngine::backupRoot() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return backupRoot_;
}

std::string BackupEngine::archivePath() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return archivePath_;
}

void BackupEngine::run(const BackupOptions& options) {
    working_ = BackupProgress();
    working_.startTime = std::chrono::system_clock::now();
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        manifest_.reset();
        backupRoot_.clear();
        archivePath_.clear();
    }

    try {
        setStatus(BackupStatus::PREPARING, "Preparing backup");

        auto location = context_->pathResolver ? context_->pathResolver->locate() : std::nullopt;
        if (!location) {
            throw SourceNotFoundError("Application data directory not found");
        }
        if (options.destination.empty()) {
            throw ConfigurationError("No backup destination given");
        }

        fs::path root = fs::path(options.destination) / context_->settings.layout.backupDirName;
        fs::create_directories(root);
        {
            std::lock_guard<std::mutex> lock(snapshotMutex_);
            backupRoot_ = root.string();
        }

        working_.bytesTotal = estimateSize({location->appDirectory});
        publish();
        checkCancelled();

        Logger::info("Starting " + backupModeToString(options.mode) + " backup of " +
                     location->appDirectory + " to " + root.string());

        switch (options.mode) {
            case BackupMode::HOT:
                hotBackup(*location, root);
                break;
            case BackupMode::COLD:
                coldBackup(*location, root);
                break;
            case BackupMode::SMART:
                smartBackup(*location, root);
                break;
            case BackupMode::INCREMENTAL:
                incrementalBackup(*location, root);
                break;
            case BackupMode::DATABASE_ONLY:
                databaseBackup(*location, root);
                break;
        }
        checkCancelled();

        if (options.verify) {
            setStatus(BackupStatus::VERIFYING, "Verifying backup");
            verify(root);
            checkCancelled();
        }

        // Written before compression so the archive carries it
        writeManifest(*location, root, options.mode);

        if (options.compress) {
            setStatus(BackupStatus::COMPRESSING, "Compressing backup");
            compress(root, options.format);
        }

        finish(BackupStatus::COMPLETED, "Backup completed successfully");
    } catch (const CancelledError&) {
        finish(BackupStatus::CANCELLED, "Backup cancelled");
    } catch (const std::exception& e) {
        working_.errors.push_back(e.what());
        finish(BackupStatus::FAILED, std::string("Backup failed: ") + e.what());
    }
}

void BackupEngine::hotBackup(const DataLocation& location, const fs::path& root) {
    setStatus(BackupStatus::COPYING, "Copying files (hot)");
    bulkCopy(location.appDirectory, root);
}

void BackupEngine::coldBackup(const DataLocation& location, const fs::path& root) {
    auto guard = stopService();
    setStatus(BackupStatus::COPYING, "Copying files (cold)");
    bulkCopy(location.appDirectory, root);
}

void BackupEngine::smartBackup(const DataLocation& location, const fs::path& root) {
    setStatus(BackupStatus::COPYING, "Hot copy phase");
    bulkCopy(location.appDirectory, root);
    checkCancelled();

    auto guard = stopService();
    if (!guard->stoppedService()) {
        // Nothing could have changed underneath the hot copy
        return;
    }

    setStatus(BackupStatus::COPYING, "Cold sync phase");
    fs::path source = location.appDirectory;
    CopyPlan plan;
    std::error_code ec;
    for (const auto& critical : context_->settings.layout.criticalFiles) {
        for (const char* suffix : {"", "-wal", "-shm"}) {
            fs::path file = source / (critical + suffix);
            if (!fs::is_regular_file(file, ec)) {
                continue;
            }
            CopyItem item;
            item.source = file;
            item.destination = root / (critical + suffix);
            item.relativePath = critical + suffix;
            item.size = fs::file_size(file, ec);
            plan.add(std::move(item));
        }
    }
    acceptPlan(plan, false);
    copyPlanned(plan);
}

void BackupEngine::incrementalBackup(const DataLocation& location, const fs::path& root) {
    auto previous = BackupManifest::load(root / BackupManifest::kFileName);
    if (previous) {
        Logger::info("Incremental backup against manifest from " + previous->createdAt);
    } else {
        Logger::info("No previous manifest, incremental backup copies everything");
    }

    setStatus(BackupStatus::COPYING, "Copying changed files");
    CopyPlan plan = copier_.plan(location.appDirectory, root, previous ? &*previous : nullptr);
    Logger::info(std::to_string(plan.skipped) + " files unchanged since the last backup");
    acceptPlan(plan, true);
    copyPlanned(plan);
}

void BackupEngine::databaseBackup(const DataLocation& location, const fs::path& root) {
    auto guard = stopService();
    setStatus(BackupStatus::COPYING, "Copying databases");

    fs::path databases = location.databasesDirectory;
    fs::path relativeDatabases = context_->settings.layout.databasesDir;
    CopyPlan plan;
    std::error_code ec;

    if (fs::is_directory(databases, ec)) {
        for (const auto& entry : fs::directory_iterator(databases, ec)) {
            std::string name = entry.path().filename().string();
            bool isDatabase = name.size() > 3 &&
                (name.compare(name.size() - 3, 3, ".db") == 0 ||
                 name.find(".db-wal") != std::string::npos ||
                 name.find(".db-shm") != std::string::npos);
            if (!isDatabase || !entry.is_regular_file(ec)) {
                continue;
            }
            CopyItem item;
            item.source = entry.path();
            item.destination = root / relativeDatabases / name;
            item.relativePath = (relativeDatabases / name).generic_string();
            item.size = entry.file_size(ec);
            plan.add(std::move(item));
        }
    } else {
        addWarning("Database directory not found: " + databases.string());
    }

    if (fs::is_regular_file(location.preferencesFile, ec)) {
        CopyItem item;
        item.source = location.preferencesFile;
        item.relativePath = context_->settings.layout.preferencesFile;
        item.destination = root / item.relativePath;
        item.size = fs::file_size(item.source, ec);
        plan.add(std::move(item));
    }

    acceptPlan(plan, true);
    copyPlanned(plan);
}

void BackupEngine::bulkCopy(const fs::path& source, const fs::path& root) {
    CopyPlan plan = copier_.plan(source, root);
    acceptPlan(plan, true);

    MirrorTool mirror(context_->settings.backup, context_->settings.layout.excludePatterns);
    if (mirror.available()) {
        std::string error;
        auto heartbeat = [this]() {
            publishIfDue();
            return isCancelled();
        };
        if (mirror.mirror(source, root, heartbeat, error)) {
            working_.filesDone += plan.items.size();
            working_.bytesDone += plan.totalBytes;
            publish();
            return;
        }
        checkCancelled();
        Logger::warning("Bulk mirroring failed (" + error + "), falling back to file copy");
    }

    copyPlanned(plan);
}

void BackupEngine::copyPlanned(const CopyPlan& plan) {
    for (const auto& item : plan.items) {
        checkCancelled();
        working_.currentFile = item.relativePath;

        std::string error;
        if (FileCopier::copyFile(item, error)) {
            working_.filesDone++;
            working_.bytesDone += item.size;
            publish();
        } else {
            addWarning(error);
        }
    }
    working_.currentFile.clear();
}

void BackupEngine::acceptPlan(const CopyPlan& plan, bool replaceTotals) {
    // Totals track the exact copy set so bytesDone never overtakes bytesTotal
    if (replaceTotals) {
        working_.filesTotal = working_.filesDone + plan.items.size();
        working_.bytesTotal = working_.bytesDone + plan.totalBytes;
    } else {
        working_.filesTotal += plan.items.size();
        working_.bytesTotal += plan.totalBytes;
    }
    publish();
}

std::unique_ptr<ServiceStopGuard> BackupEngine::stopService() {
    if (!context_->serviceController) {
        throw ServiceControlError("No service controller configured");
    }

    auto guard = std::make_unique<ServiceStopGuard>(
        *context_->serviceController,
        [this](const std::string& warning) { addWarning(warning); },
        [this]() { setStatus(BackupStatus::STARTING_SERVICE, "Starting service"); });

    if (context_->serviceController->isRunning()) {
        setStatus(BackupStatus::STOPPING_SERVICE, "Stopping service");
        if (!guard->stopIfRunning()) {
            Logger::warning("Copying while the service is still running");
        }
    }
    return guard;
}

void BackupEngine::verify(const fs::path& root) {
    const auto& layout = context_->settings.layout;
    BackupVerifier verifier(context_->database.get(), layout.criticalFiles,
                            (fs::path(layout.databasesDir) / layout.mainDatabase).string());

    VerificationResult result = verifier.verify(root);
    if (!result.success) {
        addWarning(result.errorMessage);
    }
    for (const auto& warning : result.warnings) {
        addWarning(warning);
    }
}

void BackupEngine::writeManifest(const DataLocation& location, const fs::path& root, BackupMode mode) {
    BackupManifest manifest;
    manifest.createdAt = utils::isoTimestamp();
    manifest.sourcePlatform = context_->platform;
    manifest.sourceHostname = context_->hostname;
    manifest.machineIdentifier = location.machineIdentifier;
    manifest.serverName = location.serverName;
    manifest.backupMode = backupModeToString(mode);
    manifest.catalog(root);

    std::error_code ec;
    for (const auto& critical : context_->settings.layout.criticalFiles) {
        fs::path file = root / critical;
        if (fs::is_regular_file(file, ec)) {
            std::string digest = sha256File(file);
            if (!digest.empty()) {
                manifest.checksums[fs::path(critical).generic_string()] = digest;
            }
        }
    }

    if (!manifest.save(root / BackupManifest::kFileName)) {
        throw ShiftError("Failed to write backup manifest in " + root.string());
    }
    Logger::info("Manifest written: " + std::to_string(manifest.fileCount) + " files, " +
                 utils::formatSize(manifest.totalSize));

    std::lock_guard<std::mutex> lock(snapshotMutex_);
    manifest_ = std::move(manifest);
}

void BackupEngine::compress(const fs::path& root, ArchiveFormat format) {
    if (!context_->compression) {
        addWarning("Compression requested but no compression adapter is configured");
        return;
    }

    std::string archive = root.string() + archiveExtension(format);
    if (!context_->compression->compress(root.string(), archive, format)) {
        throw ShiftError("Compression failed: " + context_->compression->getLastError());
    }

    std::lock_guard<std::mutex> lock(snapshotMutex_);
    archivePath_ = archive;
}

void BackupEngine::setStatus(BackupStatus status, const std::string& phase) {
    working_.status = status;
    working_.phase = phase;
    Logger::info("Backup " + getId() + ": " + backupStatusToString(status) +
                 (phase.empty() ? "" : " - " + phase));
    publish();
}

void BackupEngine::addWarning(const std::string& warning) {
    Logger::warning(warning);
    working_.warnings.push_back(warning);
}

void BackupEngine::finish(BackupStatus status, const std::string& phase) {
    working_.endTime = std::chrono::system_clock::now();
    working_.currentFile.clear();

    switch (status) {
        case BackupStatus::COMPLETED:
            setState(State::COMPLETED);
            break;
        case BackupStatus::CANCELLED:
            setState(State::CANCELLED);
            break;
        default:
            setError(working_.errors.empty() ? phase : working_.errors.back());
            setState(State::FAILED);
            break;
    }
    setStatus(status, phase);
}

void BackupEngine::publish() {
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        snapshot_ = working_;
    }
    lastPublish_ = std::chrono::steady_clock::now();
    observers_.notify(working_);
}

void BackupEngine::publishIfDue() {
    auto interval = std::chrono::milliseconds(context_->settings.backup.progressIntervalMs);
    if (std::chrono::steady_clock::now() - lastPublish_ >= interval) {
        publish();
    }
}
