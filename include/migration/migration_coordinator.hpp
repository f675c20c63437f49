#pragma once

#include "adapters/path_resolver.hpp"
#include "backup/backup_engine.hpp"
#include "common/app_context.hpp"
#include "common/job.hpp"
#include "common/observer_list.hpp"
#include "migration/migration_types.hpp"
#include "migration/phase_plan.hpp"
#include <atomic>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

class Socket;
class TransferChannel;

// What a restore does once the backup tree is on this machine.
struct RestoreRequest {
    std::map<std::string, std::string> pathMappings;
    bool preserveMachineId = false;
    bool stopService = true;
};

// Drives one migration end to end: local backup and restore, or a backup streamed
// to another instance, optionally restored there.
class MigrationCoordinator : public Job {
public:
    using ProgressObserver = ObserverList<MigrationProgress>::Observer;

    explicit MigrationCoordinator(std::shared_ptr<AppContext> context);
    ~MigrationCoordinator() override;

    // Empty when the configuration can run. Performs no side effects.
    std::vector<std::string> validate(const MigrationConfig& config) const;

    // Returns false when validation fails or a run is in progress.
    bool start(const MigrationConfig& config);
    // Also cancels a backup the coordinator is waiting on.
    void cancel() override;

    MigrationProgress getProgress() const;
    MigrationResult getResult() const;
    std::vector<std::string> lastValidationErrors() const;
    void addProgressObserver(ProgressObserver observer);

    // Transfer port a NETWORK_PULL is accepting on, 0 before it is bound.
    int listeningPort() const { return listeningPort_.load(); }

    bool saveReport(const std::string& path) const;

private:
    void run(const MigrationConfig& config);

    void localBackup(const MigrationConfig& config, const std::filesystem::path& destination);
    void localRestore(const MigrationConfig& config);
    void networkPush(const MigrationConfig& config);
    void networkPull(const MigrationConfig& config);

    // Runs the engine and mirrors its progress into BACKING_UP. Returns the backup tree.
    std::filesystem::path runBackupEngine(const MigrationConfig& config, const std::filesystem::path& destination);
    // Archives the finished tree beside itself; returns the archive path.
    std::string compressBackup(const std::filesystem::path& root, ArchiveFormat format);
    // STOPPING_TARGET through STARTING_TARGET for a tree already on disk.
    void restoreTree(const std::filesystem::path& backupDir, const DataLocation& target,
                     const RestoreRequest& request);
    void copyTree(const std::filesystem::path& source, const std::filesystem::path& target);

    void sendBackup(const MigrationConfig& config, const std::filesystem::path& root);
    void serveCommands(Socket& socket, TransferChannel& channel, const std::filesystem::path& receiveDir);
    nlohmann::json awaitAck(Socket& socket, TransferChannel& channel, const std::string& stage,
                            std::chrono::seconds timeout);
    std::optional<DataLocation> restoreTarget(const std::string& targetPath) const;

    // Byte and file counters of one step, added on top of what earlier steps moved.
    struct Counters {
        uint64_t bytesTotal = 0;
        uint64_t bytesDone = 0;
        uint64_t filesTotal = 0;
        uint64_t filesDone = 0;
    };
    Counters counters() const;
    void setCounters(const Counters& base, const Counters& step);

    void enterPhase(MigrationPhase phase, const std::string& description);
    void updatePhase(double phasePercent, const std::string& operation = std::string());
    void addWarning(const std::string& warning);
    void finish(MigrationPhase outcome, const MigrationConfig& config);
    void publish();

    std::shared_ptr<AppContext> context_;
    BackupEngine engine_;
    ObserverList<MigrationProgress> observers_;
    std::atomic<int> listeningPort_{0};

    // Owned by the worker
    std::unique_ptr<PhaseProgress> tracker_;
    MigrationProgress working_;
    MigrationResult result_;

    mutable std::mutex snapshotMutex_;
    MigrationProgress snapshot_;
    MigrationResult resultSnapshot_;
    MigrationConfig configSnapshot_;
    std::vector<std::string> validationErrors_;
};
