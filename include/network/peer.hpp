#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <string>

enum class PeerRole {
    STANDALONE,
    SOURCE,   // sends its data
    TARGET    // receives data
};

std::string peerRoleToString(PeerRole role);
// Unknown names map to STANDALONE.
PeerRole parsePeerRole(const std::string& name);

enum class PeerSource {
    SERVICE_RECORD,
    BROADCAST,
    SUBNET_PROBE,
    MANUAL
};

std::string peerSourceToString(PeerSource source);

struct NetworkPeer {
    std::string ip;
    std::string hostname;
    int port = 0;          // managed application port
    int toolkitPort = 0;   // transfer port of a peer instance of this tool
    std::string instanceId;
    std::string machineId;
    std::string serverName;
    std::string version;
    std::string platform;
    bool isManagedApp = false;
    bool confirmed = false;
    PeerRole role = PeerRole::STANDALONE;
    PeerSource source = PeerSource::BROADCAST;
    std::chrono::steady_clock::time_point lastSeen{};

    int effectivePort() const;
    // Registry key, "ip:effectivePort"
    std::string key() const;

    nlohmann::json toJson() const;
};
