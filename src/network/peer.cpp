#include "network/peer.hpp"

std::string peerRoleToString(PeerRole role) {
    switch (role) {
        case PeerRole::SOURCE: return "source";
        case PeerRole::TARGET: return "target";
        case PeerRole::STANDALONE: return "standalone";
    }
    return "standalone";
}

PeerRole parsePeerRole(const std::string& name) {
    if (name == "source") return PeerRole::SOURCE;
    if (name == "target") return PeerRole::TARGET;
    return PeerRole::STANDALONE;
}

std::string peerSourceToString(PeerSource source) {
    switch (source) {
        case PeerSource::SERVICE_RECORD: return "service_record";
        case PeerSource::BROADCAST: return "broadcast";
        case PeerSource::SUBNET_PROBE: return "subnet_probe";
        case PeerSource::MANUAL: return "manual";
    }
    return "broadcast";
}

int NetworkPeer::effectivePort() const {
    if (port > 0) {
        return port;
    }
    if (toolkitPort > 0) {
        return toolkitPort;
    }
    return 32400;
}

std::string NetworkPeer::key() const {
    return ip + ":" + std::to_string(effectivePort());
}

nlohmann::json NetworkPeer::toJson() const {
    return {
        {"ip", ip},
        {"hostname", hostname},
        {"port", port},
        {"toolkit_port", toolkitPort},
        {"instance_id", instanceId},
        {"machine_id", machineId},
        {"server_name", serverName},
        {"version", version},
        {"platform", platform},
        {"is_managed_app", isManagedApp},
        {"confirmed", confirmed},
        {"role", peerRoleToString(role)},
        {"source", peerSourceToString(source)}
    };
}
