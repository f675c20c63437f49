#include "migration/migration_coordinator.hpp"
#include "adapters/compression_adapter.hpp"
#include "adapters/database_adapter.hpp"
#include "adapters/preferences_adapter.hpp"
#include "adapters/service_controller.hpp"
#include "backup/backup_config.hpp"
#include "backup/file_copier.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include "migration/scratch_directory.hpp"
#include <algorithm>
#include <fstream>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr auto kEnginePollInterval = std::chrono::milliseconds(250);
constexpr const char* kLibrarySummaryFile = "library_info.json";

bool needsLocalData(MigrationMode mode) {
    return mode == MigrationMode::LOCAL_BACKUP || mode == MigrationMode::NETWORK_PUSH ||
           mode == MigrationMode::FULL_MIGRATION;
}

} // namespace

MigrationCoordinator::MigrationCoordinator(std::shared_ptr<AppContext> context)
    : context_(std::move(context))
    , engine_(context_) {
}

MigrationCoordinator::~MigrationCoordinator() {
    stopWorker();
}

std::vector<std::string> MigrationCoordinator::validate(const MigrationConfig& config) const {
    std::vector<std::string> errors;
    std::error_code ec;

    if (needsLocalData(config.mode)) {
        auto location = context_->pathResolver ? context_->pathResolver->locate() : std::nullopt;
        if (!location) {
            errors.push_back("Application data not found on this machine");
        }
    }

    switch (config.mode) {
        case MigrationMode::LOCAL_BACKUP: {
            if (config.targetPath.empty()) {
                errors.push_back("Target path not specified");
                break;
            }
            fs::path target(config.targetPath);
            if (!target.has_filename()) {
                target = target.parent_path();
            }
            fs::path parent = fs::absolute(target, ec).parent_path();
            if (ec || !fs::is_directory(parent, ec)) {
                errors.push_back("Target directory does not exist: " + parent.string());
            }
            break;
        }
        case MigrationMode::LOCAL_RESTORE: {
            if (config.sourcePath.empty()) {
                errors.push_back("Backup path not specified");
            } else if (!fs::exists(config.sourcePath, ec)) {
                errors.push_back("Backup not found: " + config.sourcePath);
            }
            if (config.targetPath.empty() && !restoreTarget("")) {
                errors.push_back("Target directory not specified and no application data found");
            }
            break;
        }
        case MigrationMode::NETWORK_PUSH:
        case MigrationMode::FULL_MIGRATION:
            if (config.targetHost.empty()) {
                errors.push_back("Target host not specified");
            }
            if (config.targetPort <= 0 || config.targetPort > 65535) {
                errors.push_back("Invalid target port: " + std::to_string(config.targetPort));
            }
            break;
        case MigrationMode::NETWORK_PULL:
            if (config.targetPath.empty()) {
                errors.push_back("Receive directory not specified");
            }
            if (config.targetPort < 0 || config.targetPort > 65535) {
                errors.push_back("Invalid listening port: " + std::to_string(config.targetPort));
            }
            break;
    }

    for (const auto& mapping : config.pathMappings) {
        if (mapping.first.empty()) {
            errors.push_back("Path mapping with an empty source prefix");
        }
    }
    return errors;
}

bool MigrationCoordinator::start(const MigrationConfig& config) {
    auto errors = validate(config);
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        validationErrors_ = errors;
    }

    if (!errors.empty()) {
        for (const auto& error : errors) {
            Logger::error("Invalid migration configuration: " + error);
        }
        return false;
    }

    return launch([this, config]() { run(config); });
}

void MigrationCoordinator::cancel() {
    Job::cancel();
    engine_.cancel();
}

MigrationProgress MigrationCoordinator::getProgress() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return snapshot_;
}

MigrationResult MigrationCoordinator::getResult() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return resultSnapshot_;
}

std::vector<std::string> MigrationCoordinator::lastValidationErrors() const {
    std::lock_guard<std::mutex> lock(snapshotMutex_);
    return validationErrors_;
}

void MigrationCoordinator::addProgressObserver(ProgressObserver observer) {
    observers_.add(std::move(observer));
}

bool MigrationCoordinator::saveReport(const std::string& path) const {
    json report;
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        report = {
            {"timestamp", utils::isoTimestamp()},
            {"config", configSnapshot_.toJson()},
            {"result", resultSnapshot_.toJson()},
            {"progress", snapshot_.toJson()}
        };
    }

    std::error_code ec;
    fs::path file(path);
    if (file.has_parent_path()) {
        fs::create_directories(file.parent_path(), ec);
    }

    std::ofstream output(file);
    if (!output.is_open()) {
        Logger::error("Cannot write migration report to " + path);
        return false;
    }
    output << report.dump(2);
    output.close();
    if (!output) {
        Logger::error("Failed writing migration report to " + path);
        return false;
    }

    Logger::info("Migration report saved to " + path);
    return true;
}

void MigrationCoordinator::run(const MigrationConfig& config) {
    tracker_ = std::make_unique<PhaseProgress>(config.mode);
    working_ = MigrationProgress();
    working_.startTime = std::chrono::system_clock::now();
    result_ = MigrationResult();
    listeningPort_.store(0);
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        configSnapshot_ = config;
        resultSnapshot_ = MigrationResult();
    }
    publish();

    Logger::info("Migration " + getId() + " started: " + migrationModeToString(config.mode));

    try {
        switch (config.mode) {
            case MigrationMode::LOCAL_BACKUP:
                localBackup(config, config.targetPath);
                break;
            case MigrationMode::LOCAL_RESTORE:
                localRestore(config);
                break;
            case MigrationMode::NETWORK_PUSH:
            case MigrationMode::FULL_MIGRATION:
                networkPush(config);
                break;
            case MigrationMode::NETWORK_PULL:
                networkPull(config);
                break;
        }
        finish(MigrationPhase::COMPLETED, config);
    } catch (const CancelledError&) {
        finish(MigrationPhase::CANCELLED, config);
    } catch (const std::exception& e) {
        Logger::error(std::string("Migration failed: ") + e.what());
        working_.errors.push_back(e.what());
        finish(MigrationPhase::FAILED, config);
    }
}

void MigrationCoordinator::localBackup(const MigrationConfig& config, const fs::path& destination) {
    enterPhase(MigrationPhase::INITIALIZING, "Locating application data");
    auto location = context_->pathResolver ? context_->pathResolver->locate() : std::nullopt;
    if (!location) {
        throw SourceNotFoundError("Application data not found on this machine");
    }
    result_.sourceInfo = location->summary();
    result_.sourceInfo["hostname"] = context_->hostname;
    result_.sourceInfo["platform"] = context_->platform;
    updatePhase(100.0);

    fs::path root = runBackupEngine(config, destination);
    result_.backupPath = root.string();

    enterPhase(MigrationPhase::UPDATING_PREFERENCES, "Saving preferences");
    if (context_->preferences && !context_->preferences->backup(root.string())) {
        addWarning("Preferences not saved: " + context_->preferences->getLastError());
    }
    checkCancelled();

    enterPhase(MigrationPhase::VERIFYING, "Exporting library summary");
    std::error_code ec;
    if (context_->database && fs::is_regular_file(location->mainDatabase, ec)) {
        if (!context_->database->exportSummary(location->mainDatabase, (root / kLibrarySummaryFile).string())) {
            addWarning("Library summary not exported: " + context_->database->getLastError());
        }
    }

    // Last, so the archive carries the preferences snapshot and the summary
    if (config.compress) {
        updatePhase(50.0, "Compressing backup");
        std::string archive = compressBackup(root, config.compressionFormat);
        if (!archive.empty()) {
            result_.backupPath = archive;
        }
    }
    updatePhase(100.0);
}

std::string MigrationCoordinator::compressBackup(const fs::path& root, ArchiveFormat format) {
    if (!context_->compression) {
        addWarning("Compression requested but no compression adapter is configured");
        return "";
    }

    std::string archive = root.string() + archiveExtension(format);
    if (!context_->compression->compress(root.string(), archive, format)) {
        throw ShiftError("Compression failed: " + context_->compression->getLastError());
    }
    Logger::info("Backup archived to " + archive);
    return archive;
}

fs::path MigrationCoordinator::runBackupEngine(const MigrationConfig& config, const fs::path& destination) {
    enterPhase(MigrationPhase::BACKING_UP, "Running " + backupModeToString(config.backupMode) + " backup");

    BackupOptions options;
    options.destination = destination.string();
    options.mode = config.backupMode;
    // Compressed by localBackup once every file is in the tree
    options.compress = false;
    options.verify = config.verifyBackup;

    if (!engine_.start(options)) {
        throw ShiftError("A backup is already running");
    }

    const Counters base = counters();
    auto absorb = [this, &base](const BackupProgress& progress) {
        setCounters(base, {progress.bytesTotal, progress.bytesDone, progress.filesTotal, progress.filesDone});
    };

    while (engine_.isRunning()) {
        if (isCancelled()) {
            engine_.cancel();
            // The engine restarts the service before it returns
            engine_.wait();
            throw CancelledError();
        }

        BackupProgress progress = engine_.getProgress();
        absorb(progress);
        updatePhase(progress.percent(), progress.currentFile.empty() ? progress.phase : progress.currentFile);

        sleepUnlessCancelled(kEnginePollInterval);
    }
    engine_.wait();

    BackupProgress progress = engine_.getProgress();
    absorb(progress);
    for (const auto& warning : progress.warnings) {
        addWarning(warning);
    }

    switch (engine_.getState()) {
        case Job::State::CANCELLED:
            throw CancelledError();
        case Job::State::FAILED:
            throw ShiftError("Backup failed: " + engine_.getError());
        default:
            break;
    }
    checkCancelled();

    updatePhase(100.0, progress.phase);
    return engine_.backupRoot();
}

void MigrationCoordinator::localRestore(const MigrationConfig& config) {
    enterPhase(MigrationPhase::INITIALIZING, "Checking backup " + config.sourcePath);
    auto target = restoreTarget(config.targetPath);
    if (!target) {
        throw SourceNotFoundError("No restore target and no application data found");
    }
    result_.sourceInfo = {{"backup_path", config.sourcePath}};
    result_.targetInfo = target->summary();
    result_.backupPath = config.sourcePath;

    fs::path backupDir = config.sourcePath;
    std::unique_ptr<ScratchDirectory> extracted;
    std::error_code ec;

    if (fs::is_regular_file(backupDir, ec)) {
        enterPhase(MigrationPhase::EXTRACTING, "Extracting " + backupDir.filename().string());
        if (!context_->compression) {
            throw ConfigurationError("Backup is an archive but no compression adapter is configured");
        }
        if (context_->compression->detectFormat(backupDir.string()) == ArchiveFormat::NONE) {
            throw ConfigurationError("Unrecognised backup archive: " + backupDir.string());
        }

        extracted = std::make_unique<ScratchDirectory>(context_->settings.migration.scratchDirectory, "restore");
        if (!context_->compression->decompress(backupDir.string(), extracted->path().string())) {
            throw ShiftError("Extraction failed: " + context_->compression->getLastError());
        }
        backupDir = extracted->path();
        updatePhase(100.0);
    }
    checkCancelled();

    RestoreRequest request;
    request.pathMappings = config.pathMappings;
    request.preserveMachineId = config.preserveMachineId;
    request.stopService = config.stopService;
    restoreTree(backupDir, *target, request);
}

std::optional<DataLocation> MigrationCoordinator::restoreTarget(const std::string& targetPath) const {
    const auto& layout = context_->settings.layout;
    if (!targetPath.empty()) {
        fs::path app(targetPath);
        DataLocation location;
        location.appDirectory = app.string();
        location.dataDirectory = app.parent_path().string();
        location.databasesDirectory = (app / layout.databasesDir).string();
        location.mainDatabase = (app / layout.databasesDir / layout.mainDatabase).string();
        location.preferencesFile = (app / layout.preferencesFile).string();
        return location;
    }

    if (context_->pathResolver) {
        if (auto located = context_->pathResolver->locate()) {
            return located;
        }
    }
    // A fresh installation may not have created its directory yet
    if (!layout.dataDirectory.empty()) {
        return FixedPathResolver::describe(layout.dataDirectory, layout);
    }
    return std::nullopt;
}

void MigrationCoordinator::restoreTree(const fs::path& backupDir, const DataLocation& target,
                                       const RestoreRequest& request) {
    std::error_code ec;
    fs::path source = backupDir;
    if (fs::is_directory(backupDir / context_->settings.layout.backupDirName, ec)) {
        source = backupDir / context_->settings.layout.backupDirName;
    }

    std::unique_ptr<ServiceStopGuard> guard;
    if (request.stopService) {
        enterPhase(MigrationPhase::STOPPING_TARGET, "Stopping service");
        if (context_->serviceController) {
            guard = std::make_unique<ServiceStopGuard>(
                *context_->serviceController,
                [this](const std::string& warning) { addWarning(warning); });
            if (!guard->stopIfRunning()) {
                Logger::info("Service was not stopped before restore");
            }
        } else {
            addWarning("No service controller configured, restoring with the service untouched");
        }
        updatePhase(100.0);
    }
    checkCancelled();

    enterPhase(MigrationPhase::RESTORING, "Restoring into " + target.appDirectory);
    copyTree(source, target.appDirectory);

    if (!request.pathMappings.empty()) {
        enterPhase(MigrationPhase::REMAPPING_PATHS, "Remapping media paths");
        if (!context_->database) {
            throw DatabaseError("No database adapter configured for path remapping");
        }
        if (!fs::is_regular_file(target.mainDatabase, ec)) {
            addWarning("Database not found for path remapping: " + target.mainDatabase);
        } else if (!context_->database->remapPaths(target.mainDatabase, request.pathMappings)) {
            throw DatabaseError("Path remapping failed: " + context_->database->getLastError());
        }
        updatePhase(100.0);
    }
    checkCancelled();

    enterPhase(MigrationPhase::UPDATING_PREFERENCES,
               request.preserveMachineId ? "Keeping machine identity" : "Regenerating machine identity");
    if (!request.preserveMachineId && context_->preferences &&
        fs::is_regular_file(target.preferencesFile, ec)) {
        if (!context_->preferences->regenerateIdentity(target.preferencesFile)) {
            addWarning("Machine identity not regenerated: " + context_->preferences->getLastError());
        }
    }
    updatePhase(100.0);

    if (guard) {
        enterPhase(MigrationPhase::STARTING_TARGET, "Starting service");
        guard->restart();
        updatePhase(100.0);
    }
}

void MigrationCoordinator::copyTree(const fs::path& source, const fs::path& target) {
    FileCopier copier;
    CopyPlan plan = copier.plan(source, target);
    plan.items.erase(std::remove_if(plan.items.begin(), plan.items.end(),
                                    [](const CopyItem& item) {
                                        return item.relativePath == BackupManifest::kFileName ||
                                               item.relativePath == kLibrarySummaryFile;
                                    }),
                     plan.items.end());

    // Directories are replaced wholesale, loose files are overwritten
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(source)) {
        if (entry.is_directory(ec)) {
            fs::remove_all(target / entry.path().filename(), ec);
            if (ec) {
                throw ShiftError("Cannot replace " + (target / entry.path().filename()).string() +
                                 ": " + ec.message());
            }
        }
    }
    fs::create_directories(target);

    const Counters base = counters();
    Counters step;
    step.filesTotal = plan.items.size();
    for (const auto& item : plan.items) {
        step.bytesTotal += item.size;
    }
    setCounters(base, step);

    for (const auto& item : plan.items) {
        checkCancelled();

        std::string error;
        if (FileCopier::copyFile(item, error)) {
            step.filesDone++;
            step.bytesDone += item.size;
        } else {
            addWarning(error);
        }
        setCounters(base, step);
        double percent = step.bytesTotal == 0 ? 100.0
                                              : static_cast<double>(step.bytesDone) / step.bytesTotal * 100.0;
        updatePhase(percent, item.relativePath);
    }

    Logger::info("Restored " + std::to_string(step.filesDone) + " files (" +
                 utils::formatSize(step.bytesDone) + ") into " + target.string());
}

MigrationCoordinator::Counters MigrationCoordinator::counters() const {
    return {working_.bytesTotal, working_.bytesDone, working_.filesTotal, working_.filesDone};
}

void MigrationCoordinator::setCounters(const Counters& base, const Counters& step) {
    working_.bytesTotal = base.bytesTotal + step.bytesTotal;
    working_.bytesDone = base.bytesDone + step.bytesDone;
    working_.filesTotal = base.filesTotal + step.filesTotal;
    working_.filesDone = base.filesDone + step.filesDone;
}

void MigrationCoordinator::enterPhase(MigrationPhase phase, const std::string& description) {
    working_.overallPercent = tracker_->enter(phase);
    working_.phase = phase;
    working_.phaseDescription = description;
    working_.phasePercent = 0.0;
    working_.currentOperation = description;
    result_.phaseReached = phase;

    Logger::info("Migration " + getId() + ": " + migrationPhaseToString(phase) + " - " + description);
    publish();
}

void MigrationCoordinator::updatePhase(double phasePercent, const std::string& operation) {
    working_.phasePercent = std::clamp(phasePercent, 0.0, 100.0);
    working_.overallPercent = tracker_->update(phasePercent);
    if (!operation.empty()) {
        working_.currentOperation = operation;
    }
    publish();
}

void MigrationCoordinator::addWarning(const std::string& warning) {
    Logger::warning(warning);
    working_.warnings.push_back(warning);
}

void MigrationCoordinator::finish(MigrationPhase outcome, const MigrationConfig& config) {
    working_.endTime = std::chrono::system_clock::now();
    if (outcome == MigrationPhase::COMPLETED) {
        working_.overallPercent = tracker_->complete();
        working_.phasePercent = 100.0;
    }
    working_.phase = outcome;
    working_.phaseDescription = migrationPhaseToString(outcome);

    result_.success = outcome == MigrationPhase::COMPLETED;
    result_.outcome = outcome;
    result_.phaseReached = tracker_->current();
    result_.phases = tracker_->visited();
    result_.durationSeconds = working_.elapsedSeconds();
    result_.errors = working_.errors;
    result_.warnings = working_.warnings;
    if (result_.bytesTransferred == 0) {
        result_.bytesTransferred = working_.bytesDone;
        result_.filesTransferred = working_.filesDone;
    }

    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        resultSnapshot_ = result_;
    }
    publish();

    if (!config.reportPath.empty() && !saveReport(config.reportPath)) {
        Logger::warning("Migration report not written to " + config.reportPath);
    }

    Logger::info("Migration " + getId() + " finished: " + migrationPhaseToString(outcome) +
                 " after " + std::to_string(static_cast<int>(result_.durationSeconds)) + "s");

    switch (outcome) {
        case MigrationPhase::COMPLETED:
            setState(State::COMPLETED);
            break;
        case MigrationPhase::CANCELLED:
            setState(State::CANCELLED);
            break;
        default:
            setError(working_.errors.empty() ? "Migration failed" : working_.errors.back());
            setState(State::FAILED);
            break;
    }
}

void MigrationCoordinator::publish() {
    {
        std::lock_guard<std::mutex> lock(snapshotMutex_);
        snapshot_ = working_;
    }
    observers_.notify(working_);
}
