#pragma once

#include "common/app_context.hpp"
#include "network/peer.hpp"
#include "network/peer_registry.hpp"
#include "network/socket.hpp"
#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <thread>

// Finds other instances without a directory server. One worker runs a tick every
// tick interval: service records, self-announcement, announcement listening,
// subnet probe, stale-peer purge. Every network failure is absorbed and logged.
class DiscoveryService {
public:
    static constexpr const char* kAnnounceType = "toolkit_announce";
    static constexpr const char* kProtocolVersion = "2.0.0";

    // advertisedPort 0 advertises the configured transfer port.
    explicit DiscoveryService(std::shared_ptr<AppContext> context, int advertisedPort = 0);
    ~DiscoveryService();

    DiscoveryService(const DiscoveryService&) = delete;
    DiscoveryService& operator=(const DiscoveryService&) = delete;

    // Binds the announcement listener. start() calls it; tests driving runTick() may too.
    bool open();
    bool start();
    void stop();
    bool isRunning() const { return running_.load(); }

    // One full discovery pass on the calling thread.
    void runTick();

    void setRole(PeerRole role) { role_.store(role); }
    PeerRole role() const { return role_.load(); }
    // Sets the role and announces it right away.
    void announceAs(PeerRole role);

    std::optional<NetworkPeer> findPartner() const;
    // Registers a peer given by address, bypassing discovery.
    NetworkPeer addManualPeer(const std::string& ip, int port);

    PeerRegistry& registry() { return registry_; }
    const PeerRegistry& registry() const { return registry_; }

    const std::string& instanceId() const { return instanceId_; }
    int advertisedPort() const { return advertisedPort_; }

    nlohmann::json buildAnnouncement() const;
    // Returns nothing for foreign datagrams, malformed JSON and our own announcements.
    static std::optional<NetworkPeer> parseAnnouncement(const std::string& payload,
                                                        const std::string& senderIp,
                                                        const std::string& selfInstanceId);

private:
    void loop();
    void browseServiceRecords();
    void broadcastAnnouncement();
    void listenForAnnouncements(std::chrono::milliseconds window);
    void probeSubnet();

    std::shared_ptr<AppContext> context_;
    NetworkSettings settings_;
    std::string instanceId_;
    std::string localIp_;
    int advertisedPort_;
    std::atomic<PeerRole> role_{PeerRole::STANDALONE};
    PeerRegistry registry_;

    Socket listenSocket_;
    std::mutex socketMutex_;

    std::thread worker_;
    std::atomic<bool> running_{false};
    std::mutex stopMutex_;
    std::condition_variable stopCondition_;
};
