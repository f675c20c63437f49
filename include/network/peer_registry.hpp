#pragma once

#include "common/observer_list.hpp"
#include "network/peer.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <vector>

// Live set of peers keyed by (ip, effective port). Written by the discovery worker,
// read from anywhere through snapshots.
class PeerRegistry {
public:
    using Clock = std::chrono::steady_clock;

    explicit PeerRegistry(std::chrono::seconds ttl = std::chrono::seconds(60));

    // Fires once per new peer, never on refresh.
    void addDiscoveredObserver(ObserverList<NetworkPeer>::Observer observer);

    // Adds the peer or merges it into the known entry. Known values are never
    // replaced by empty ones. Returns true for a new peer.
    bool observe(const NetworkPeer& peer, Clock::time_point now = Clock::now());

    // Drops peers unseen for longer than the TTL. Returns how many went.
    size_t purgeStale(Clock::time_point now = Clock::now());

    std::vector<NetworkPeer> peers() const;
    std::vector<NetworkPeer> managedServers() const;
    std::vector<NetworkPeer> toolInstances() const;
    std::optional<NetworkPeer> find(const std::string& key) const;

    // First tool instance whose role is set and differs from selfRole.
    std::optional<NetworkPeer> findPartner(PeerRole selfRole) const;

    size_t size() const;
    void clear();

private:
    static void merge(NetworkPeer& existing, const NetworkPeer& update);

    std::chrono::seconds ttl_;
    ObserverList<NetworkPeer> discovered_;
    mutable std::mutex mutex_;
    std::vector<NetworkPeer> peers_;  // discovery order
};
