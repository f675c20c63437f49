#include "migration/migration_coordinator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "migration/scratch_directory.hpp"
#include "network/discovery_service.hpp"
#include "network/socket.hpp"
#include "network/transfer_protocol.hpp"

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

constexpr auto kNetworkPollInterval = std::chrono::milliseconds(250);

} // namespace

void MigrationCoordinator::networkPush(const MigrationConfig& config) {
    ScratchDirectory scratch(context_->settings.migration.scratchDirectory, "push");

    // The tree itself goes over the wire
    MigrationConfig backupConfig = config;
    backupConfig.compress = false;
    localBackup(backupConfig, scratch.path());
    result_.backupPath.clear();

    sendBackup(config, engine_.backupRoot());
}

void MigrationCoordinator::sendBackup(const MigrationConfig& config, const fs::path& root) {
    const auto& migration = context_->settings.migration;
    const std::string endpoint = config.targetHost + ":" + std::to_string(config.targetPort);

    enterPhase(MigrationPhase::CONNECTING, "Connecting to " + endpoint);
    if (context_->settings.network.enableBroadcast) {
        DiscoveryService announcer(context_);
        announcer.announceAs(PeerRole::SOURCE);
    }

    Socket socket = Socket::connectTo(config.targetHost, config.targetPort,
                                      std::chrono::seconds(migration.connectTimeoutSeconds));
    result_.targetInfo = {
        {"host", config.targetHost},
        {"port", config.targetPort},
        {"address", socket.peerAddress()}
    };
    updatePhase(100.0);
    checkCancelled();

    enterPhase(MigrationPhase::TRANSFERRING, "Sending backup to " + endpoint);
    TransferChannel channel(socket);
    const Counters base = counters();
    channel.addProgressObserver([this, base](const TransferProgress& progress) {
        setCounters(base, {progress.totalBytes, progress.transferredBytes, progress.filesTotal, progress.filesDone});
        updatePhase(progress.percent(), progress.currentFile);
    });

    DirectoryStats stats = channel.sendDirectory(root, [this]() { checkCancelled(); });
    result_.bytesTransferred = stats.bytes;
    result_.filesTransferred = stats.files;

    awaitAck(socket, channel, "received", std::chrono::seconds(migration.connectTimeoutSeconds));
    updatePhase(100.0);
    Logger::info("Target " + endpoint + " confirmed " + std::to_string(stats.files) + " files");

    if (config.mode != MigrationMode::FULL_MIGRATION) {
        return;
    }

    enterPhase(MigrationPhase::RESTORING, "Restoring on " + config.targetHost);
    channel.sendMessage({
        {"type", "command"},
        {"action", "restore"},
        {"path_mappings", config.pathMappings},
        {"preserve_machine_id", config.preserveMachineId},
        {"stop_service", config.stopService}
    });

    json ack = awaitAck(socket, channel, "restore", std::chrono::seconds(migration.remoteRestoreTimeoutSeconds));
    for (const auto& warning : ack.value("warnings", std::vector<std::string>())) {
        addWarning("Target: " + warning);
    }
    updatePhase(100.0);
}

json MigrationCoordinator::awaitAck(Socket& socket, TransferChannel& channel, const std::string& stage,
                                    std::chrono::seconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!socket.waitReadable(kNetworkPollInterval)) {
        checkCancelled();
        if (std::chrono::steady_clock::now() >= deadline) {
            throw TransferError("Timed out waiting for the target to confirm " + stage);
        }
    }

    json header = channel.readHeader();
    if (header.at("type") != "ack" || header.value("stage", "") != stage) {
        throw TransferError("Unexpected reply while waiting for " + stage + ": " + header.dump());
    }
    if (!header.value("success", false)) {
        throw ShiftError("Target reported failure during " + stage + ": " + header.value("message", ""));
    }
    return header;
}

void MigrationCoordinator::networkPull(const MigrationConfig& config) {
    const auto& migration = context_->settings.migration;
    fs::path receiveDir = config.targetPath;

    // Bound before announcing so a source never sees a closed port
    TcpListener listener(config.targetPort);
    listeningPort_.store(listener.port());

    enterPhase(MigrationPhase::DISCOVERING, "Waiting for a source on port " + std::to_string(listener.port()));
    DiscoveryService discovery(context_, listener.port());
    if (!discovery.start()) {
        addWarning("Discovery unavailable, waiting for a direct connection only");
    }
    discovery.announceAs(PeerRole::TARGET);

    std::optional<Socket> connection;
    std::optional<NetworkPeer> partner;
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(migration.discoveryTimeoutSeconds);

    while (!connection) {
        checkCancelled();
        connection = listener.accept(kNetworkPollInterval);
        if (connection) {
            break;
        }

        if (!partner) {
            partner = discovery.findPartner();
            if (partner) {
                enterPhase(MigrationPhase::CONNECTING, "Waiting for " + partner->hostname + " to connect");
                deadline = std::chrono::steady_clock::now() + std::chrono::seconds(migration.connectTimeoutSeconds);
            }
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            throw ShiftError(partner ? "Partner " + partner->ip + " did not connect" : "No partner found on network");
        }
    }
    discovery.stop();

    if (tracker_->current() != MigrationPhase::CONNECTING) {
        enterPhase(MigrationPhase::CONNECTING, "Accepted connection from " + connection->peerAddress());
    }
    result_.sourceInfo = {{"address", connection->peerAddress()}};
    if (partner) {
        result_.sourceInfo["hostname"] = partner->hostname;
        result_.sourceInfo["instance_id"] = partner->instanceId;
    }
    updatePhase(100.0);

    enterPhase(MigrationPhase::TRANSFERRING, "Receiving backup into " + receiveDir.string());
    TransferChannel channel(*connection);
    const Counters base = counters();
    channel.addProgressObserver([this, base](const TransferProgress& progress) {
        setCounters(base, {progress.totalBytes, progress.transferredBytes, progress.filesTotal, progress.filesDone});
        updatePhase(progress.percent(), progress.currentFile);
    });

    DirectoryStats stats = channel.receiveDirectory(receiveDir, [this]() { checkCancelled(); });
    result_.backupPath = receiveDir.string();
    result_.bytesTransferred = stats.bytes;
    result_.filesTransferred = stats.files;

    channel.sendMessage({
        {"type", "ack"},
        {"stage", "received"},
        {"success", true},
        {"message", "Received " + std::to_string(stats.files) + " files"},
        {"warnings", json::array()}
    });
    updatePhase(100.0);

    serveCommands(*connection, channel, receiveDir);
}

void MigrationCoordinator::serveCommands(Socket& socket, TransferChannel& channel, const fs::path& receiveDir) {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::seconds(context_->settings.migration.remoteRestoreTimeoutSeconds);

    while (true) {
        checkCancelled();
        if (!socket.waitReadable(kNetworkPollInterval)) {
            if (std::chrono::steady_clock::now() >= deadline) {
                Logger::warning("Source sent nothing further, closing the connection");
                return;
            }
            continue;
        }

        auto header = channel.tryReadHeader();
        if (!header) {
            Logger::info("Source closed the connection");
            return;
        }

        const std::string type = header->at("type").get<std::string>();
        const std::string action = header->value("action", "");
        if (type != "command" || action != "restore") {
            Logger::warning("Ignoring unsupported request: " + header->dump());
            channel.sendMessage({
                {"type", "ack"},
                {"stage", action.empty() ? type : action},
                {"success", false},
                {"message", "Unsupported request"},
                {"warnings", json::array()}
            });
            continue;
        }

        RestoreRequest request;
        request.pathMappings = header->value("path_mappings", std::map<std::string, std::string>());
        request.preserveMachineId = header->value("preserve_machine_id", false);
        request.stopService = header->value("stop_service", true);

        size_t firstWarning = working_.warnings.size();
        json ack = {{"type", "ack"}, {"stage", "restore"}};
        try {
            auto target = restoreTarget("");
            if (!target) {
                throw SourceNotFoundError("No application data directory configured on the target");
            }
            result_.targetInfo = target->summary();
            restoreTree(receiveDir, *target, request);

            ack["success"] = true;
            ack["message"] = "Restore completed";
            ack["warnings"] = std::vector<std::string>(working_.warnings.begin() + firstWarning,
                                                       working_.warnings.end());
            channel.sendMessage(ack);
        } catch (const std::exception& e) {
            ack["success"] = false;
            ack["message"] = e.what();
            ack["warnings"] = std::vector<std::string>(working_.warnings.begin() + firstWarning,
                                                       working_.warnings.end());
            try {
                channel.sendMessage(ack);
            } catch (const TransferError& sendError) {
                Logger::warning(std::string("Could not report the restore failure: ") + sendError.what());
            }
            throw;
        }
        deadline = std::chrono::steady_clock::now() +
                   std::chrono::seconds(context_->settings.migration.remoteRestoreTimeoutSeconds);
    }
}
