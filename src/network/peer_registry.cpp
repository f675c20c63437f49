#include "network/peer_registry.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <iterator>

PeerRegistry::PeerRegistry(std::chrono::seconds ttl)
    : ttl_(ttl) {
}

void PeerRegistry::addDiscoveredObserver(ObserverList<NetworkPeer>::Observer observer) {
    discovered_.add(std::move(observer));
}

void PeerRegistry::merge(NetworkPeer& existing, const NetworkPeer& update) {
    auto keep = [](std::string& target, const std::string& value) {
        if (!value.empty()) {
            target = value;
        }
    };

    keep(existing.hostname, update.hostname);
    keep(existing.instanceId, update.instanceId);
    keep(existing.machineId, update.machineId);
    keep(existing.serverName, update.serverName);
    keep(existing.version, update.version);
    keep(existing.platform, update.platform);
    if (update.toolkitPort > 0) {
        existing.toolkitPort = update.toolkitPort;
    }
    if (update.role != PeerRole::STANDALONE) {
        existing.role = update.role;
    }
    existing.isManagedApp = existing.isManagedApp || update.isManagedApp;
    existing.confirmed = existing.confirmed || update.confirmed;
}

bool PeerRegistry::observe(const NetworkPeer& peer, Clock::time_point now) {
    NetworkPeer added;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        std::string key = peer.key();
        auto it = std::find_if(peers_.begin(), peers_.end(),
                               [&key](const NetworkPeer& known) { return known.key() == key; });
        if (it != peers_.end()) {
            merge(*it, peer);
            it->lastSeen = now;
            return false;
        }

        added = peer;
        added.lastSeen = now;
        peers_.push_back(added);
    }

    Logger::info("Discovered peer " + added.key() + " (" + added.hostname + ", " +
                 peerRoleToString(added.role) + ", via " + peerSourceToString(added.source) + ")");
    discovered_.notify(added);
    return true;
}

size_t PeerRegistry::purgeStale(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto stale = [this, now](const NetworkPeer& peer) { return now - peer.lastSeen > ttl_; };
    auto it = std::remove_if(peers_.begin(), peers_.end(), stale);
    size_t removed = static_cast<size_t>(std::distance(it, peers_.end()));
    peers_.erase(it, peers_.end());
    if (removed > 0) {
        Logger::debug("Purged " + std::to_string(removed) + " stale peers");
    }
    return removed;
}

std::vector<NetworkPeer> PeerRegistry::peers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_;
}

std::vector<NetworkPeer> PeerRegistry::managedServers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NetworkPeer> result;
    std::copy_if(peers_.begin(), peers_.end(), std::back_inserter(result),
                 [](const NetworkPeer& peer) { return peer.isManagedApp; });
    return result;
}

std::vector<NetworkPeer> PeerRegistry::toolInstances() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<NetworkPeer> result;
    std::copy_if(peers_.begin(), peers_.end(), std::back_inserter(result),
                 [](const NetworkPeer& peer) { return peer.toolkitPort > 0; });
    return result;
}

std::optional<NetworkPeer> PeerRegistry::find(const std::string& key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& peer : peers_) {
        if (peer.key() == key) {
            return peer;
        }
    }
    return std::nullopt;
}

std::optional<NetworkPeer> PeerRegistry::findPartner(PeerRole selfRole) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& peer : peers_) {
        if (peer.toolkitPort > 0 && peer.role != selfRole && peer.role != PeerRole::STANDALONE) {
            return peer;
        }
    }
    return std::nullopt;
}

size_t PeerRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return peers_.size();
}

void PeerRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    peers_.clear();
}
