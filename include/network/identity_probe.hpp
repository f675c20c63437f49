#pragma once

#include "network/peer.hpp"
#include <chrono>
#include <string>

struct IdentityInfo {
    std::string machineIdentifier;
    std::string version;
    std::string friendlyName;
};

// Asks a candidate managed-application server who it is over HTTP.
class IdentityProbe {
public:
    explicit IdentityProbe(std::chrono::milliseconds timeout);

    // GET http://ip:port/identity with Accept: application/json.
    bool probe(const std::string& ip, int port, IdentityInfo& info) const;

    // Parses {"MediaContainer": {"machineIdentifier", "version", ...}}.
    static bool parseIdentity(const std::string& body, IdentityInfo& info);

    // Fills identifiers and marks the peer confirmed on success.
    bool confirm(NetworkPeer& peer) const;

private:
    std::chrono::milliseconds timeout_;
};
