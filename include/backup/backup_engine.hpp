#pragma once

#include "adapters/path_resolver.hpp"
#include "backup/backup_config.hpp"
#include "backup/backup_manifest.hpp"
#include "backup/backup_types.hpp"
#include "backup/file_copier.hpp"
#include "common/app_context.hpp"
#include "common/job.hpp"
#include "common/observer_list.hpp"
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class ServiceStopGuard;

// Runs one backup strategy at a time against the managed application's data tree.
class BackupEngine : public Job {
public:
    using ProgressObserver = ObserverList<BackupProgress>::Observer;

    explicit BackupEngine(std::shared_ptr<AppContext> context);
    ~BackupEngine() override;

    // Bytes the exclusion filter would keep under the given paths.
    uint64_t estimateSize(const std::vector<std::string>& paths) const;

    // Returns false if a run is in progress. Everything else is reported through progress.
    bool start(const BackupOptions& options);

    BackupProgress getProgress() const;
    void addProgressObserver(ProgressObserver observer);

    std::optional<BackupManifest> getManifest() const;
    // Backup tree of the most recent run; archivePath() is set when it was compressed.
    std::string backupRoot() const;
    std::string archivePath() const;

private:
    void run(const BackupOptions& options);

    void hotBackup(const DataLocation& location, const std::filesystem::path& root);
    void coldBackup(const DataLocation& location, const std::filesystem::path& root);
    void smartBackup(const DataLocation& location, const std::filesystem::path& root);
    void incrementalBackup(const DataLocation& location, const std::filesystem::path& root);
    void databaseBackup(const DataLocation& location, const std::filesystem::path& root);

    // Mirrors with the bulk tool when one is configured, otherwise copies the plan.
    void bulkCopy(const std::filesystem::path& source, const std::filesystem::path& root);
    void copyPlanned(const CopyPlan& plan);
    void acceptPlan(const CopyPlan& plan, bool replaceTotals);

    std::unique_ptr<ServiceStopGuard> stopService();
    void verify(const std::filesystem::path& root);
    void writeManifest(const DataLocation& location, const std::filesystem::path& root, BackupMode mode);
    void compress(const std::filesystem::path& root, ArchiveFormat format);

    void setStatus(BackupStatus status, const std::string& phase);
    void addWarning(const std::string& warning);
    void finish(BackupStatus status, const std::string& phase);
    void publish();
    void publishIfDue();

    std::shared_ptr<AppContext> context_;
    FileCopier copier_;
    ObserverList<BackupProgress> observers_;

    // Owned by the worker; copied into snapshot_ on every publish
    BackupProgress working_;
    std::chrono::steady_clock::time_point lastPublish_{};

    mutable std::mutex snapshotMutex_;
    BackupProgress snapshot_;
    std::optional<BackupManifest> manifest_;
    std::string backupRoot_;
    std::string archivePath_;
};
