#include "network/discovery_service.hpp"
#include "common/logger.hpp"
#include "network/identity_probe.hpp"
#include "network/mdns_browser.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

using json = nlohmann::json;

DiscoveryService::DiscoveryService(std::shared_ptr<AppContext> context, int advertisedPort)
    : context_(std::move(context))
    , settings_(context_->settings.network)
    , instanceId_(context_->instanceId)
    , localIp_(localIPv4Address())
    , advertisedPort_(advertisedPort > 0 ? advertisedPort : context_->settings.network.transferPort)
    , registry_(std::chrono::seconds(context_->settings.network.peerTtlSeconds)) {
}

DiscoveryService::~DiscoveryService() {
    stop();
}

bool DiscoveryService::open() {
    std::lock_guard<std::mutex> lock(socketMutex_);
    if (listenSocket_.valid()) {
        return true;
    }

    Socket sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) {
        Logger::warning("Discovery: cannot create announcement socket");
        return false;
    }

    int reuse = 1;
    setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#ifdef SO_REUSEPORT
    setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse));
#endif

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_port = htons(static_cast<uint16_t>(settings_.listenPort));
    address.sin_addr.s_addr = htonl(INADDR_ANY);
    if (bind(sock.fd(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) != 0) {
        Logger::warning("Discovery: cannot bind announcement port " + std::to_string(settings_.listenPort));
        return false;
    }

    listenSocket_ = std::move(sock);
    return true;
}

bool DiscoveryService::start() {
    if (running_.exchange(true)) {
        return false;
    }

    // Announcements still go out when the listener port is taken
    open();

    Logger::info("Discovery started, instance " + instanceId_ + " advertising port " +
                 std::to_string(advertisedPort_));
    worker_ = std::thread(&DiscoveryService::loop, this);
    return true;
}

void DiscoveryService::stop() {
    {
        std::lock_guard<std::mutex> lock(stopMutex_);
        if (!running_.exchange(false)) {
            return;
        }
    }
    stopCondition_.notify_all();

    if (worker_.joinable()) {
        worker_.join();
    }

    std::lock_guard<std::mutex> lock(socketMutex_);
    listenSocket_.close();
    Logger::info("Discovery stopped");
}

void DiscoveryService::loop() {
    while (running_.load()) {
        runTick();

        std::unique_lock<std::mutex> lock(stopMutex_);
        stopCondition_.wait_for(lock, std::chrono::milliseconds(settings_.tickIntervalMs),
                                [this]() { return !running_.load(); });
    }
}

void DiscoveryService::runTick() {
    if (settings_.enableServiceRecords) {
        try {
            browseServiceRecords();
        } catch (const std::exception& e) {
            Logger::debug(std::string("Discovery: service record browse failed: ") + e.what());
        }
    }

    if (settings_.enableBroadcast) {
        try {
            broadcastAnnouncement();
        } catch (const std::exception& e) {
            Logger::debug(std::string("Discovery: announcement failed: ") + e.what());
        }
    }

    try {
        listenForAnnouncements(std::chrono::milliseconds(settings_.listenWindowMs));
    } catch (const std::exception& e) {
        Logger::debug(std::string("Discovery: listening failed: ") + e.what());
    }

    if (settings_.enableSubnetProbe) {
        try {
            probeSubnet();
        } catch (const std::exception& e) {
            Logger::debug(std::string("Discovery: subnet probe failed: ") + e.what());
        }
    }

    registry_.purgeStale();
}

void DiscoveryService::announceAs(PeerRole role) {
    setRole(role);
    Logger::info("Announcing as " + peerRoleToString(role));
    try {
        broadcastAnnouncement();
    } catch (const std::exception& e) {
        Logger::debug(std::string("Discovery: announcement failed: ") + e.what());
    }
}

std::optional<NetworkPeer> DiscoveryService::findPartner() const {
    return registry_.findPartner(role_.load());
}

NetworkPeer DiscoveryService::addManualPeer(const std::string& ip, int port) {
    NetworkPeer peer;
    peer.ip = ip;
    peer.hostname = ip;
    peer.toolkitPort = port;
    peer.source = PeerSource::MANUAL;
    registry_.observe(peer);
    return peer;
}

json DiscoveryService::buildAnnouncement() const {
    return {
        {"type", kAnnounceType},
        {"protocol_version", kProtocolVersion},
        {"instance_id", instanceId_},
        {"hostname", context_->hostname},
        {"ip", localIp_},
        {"port", advertisedPort_},
        {"role", peerRoleToString(role_.load())}
    };
}

std::optional<NetworkPeer> DiscoveryService::parseAnnouncement(const std::string& payload,
                                                               const std::string& senderIp,
                                                               const std::string& selfInstanceId) {
    json message = json::parse(payload, nullptr, false);
    if (message.is_discarded() || !message.is_object()) {
        return std::nullopt;
    }
    if (message.value("type", "") != kAnnounceType) {
        return std::nullopt;
    }

    std::string instanceId = message.value("instance_id", "");
    if (instanceId.empty() || instanceId == selfInstanceId) {
        return std::nullopt;
    }

    NetworkPeer peer;
    peer.ip = message.value("ip", "");
    if (peer.ip.empty()) {
        peer.ip = senderIp;
    }
    peer.hostname = message.value("hostname", peer.ip);
    peer.instanceId = instanceId;
    peer.version = message.value("protocol_version", "");
    peer.role = parsePeerRole(message.value("role", "standalone"));
    peer.source = PeerSource::BROADCAST;

    const auto port = message.find("port");
    if (port != message.end() && port->is_number_integer()) {
        peer.toolkitPort = port->get<int>();
    }
    if (peer.toolkitPort <= 0) {
        return std::nullopt;
    }
    return peer;
}

void DiscoveryService::browseServiceRecords() {
    MdnsBrowser browser(settings_.serviceTypes);
    for (const auto& record : browser.browse(std::chrono::milliseconds(settings_.serviceRecordWindowMs))) {
        NetworkPeer peer = MdnsBrowser::toPeer(record);
        if (peer.ip.empty() || (!peer.instanceId.empty() && peer.instanceId == instanceId_)) {
            continue;
        }
        registry_.observe(peer);
    }
}

void DiscoveryService::broadcastAnnouncement() {
    Socket sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) {
        Logger::debug("Discovery: cannot create broadcast socket");
        return;
    }

    int enable = 1;
    setsockopt(sock.fd(), SOL_SOCKET, SO_BROADCAST, &enable, sizeof(enable));

    sockaddr_in destination{};
    destination.sin_family = AF_INET;
    destination.sin_port = htons(static_cast<uint16_t>(settings_.broadcastPort));
    if (inet_pton(AF_INET, settings_.broadcastAddress.c_str(), &destination.sin_addr) != 1) {
        Logger::debug("Discovery: invalid broadcast address " + settings_.broadcastAddress);
        return;
    }

    std::string payload = buildAnnouncement().dump();
    if (sendto(sock.fd(), payload.data(), payload.size(), 0,
               reinterpret_cast<sockaddr*>(&destination), sizeof(destination)) < 0) {
        Logger::debug("Discovery: announcement not sent to " + settings_.broadcastAddress);
    }
}

void DiscoveryService::listenForAnnouncements(std::chrono::milliseconds window) {
    std::lock_guard<std::mutex> lock(socketMutex_);
    if (!listenSocket_.valid()) {
        return;
    }

    auto deadline = std::chrono::steady_clock::now() + window;
    char buffer[2048];
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0 || !listenSocket_.waitReadable(remaining)) {
            break;
        }

        sockaddr_in from{};
        socklen_t fromLength = sizeof(from);
        ssize_t n = recvfrom(listenSocket_.fd(), buffer, sizeof(buffer), 0,
                             reinterpret_cast<sockaddr*>(&from), &fromLength);
        if (n <= 0) {
            break;
        }

        char senderIp[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &from.sin_addr, senderIp, sizeof(senderIp));
        auto peer = parseAnnouncement(std::string(buffer, static_cast<size_t>(n)), senderIp, instanceId_);
        if (peer) {
            registry_.observe(*peer);
        }
    }
}

void DiscoveryService::probeSubnet() {
    if (localIp_ == "127.0.0.1") {
        return;
    }

    auto lastDot = localIp_.rfind('.');
    if (lastDot == std::string::npos) {
        return;
    }
    std::string prefix = localIp_.substr(0, lastDot + 1);

    // A fixed-stride sample of the /24, not a scan
    std::vector<std::string> candidates;
    for (int host = 1; host < 255; host += settings_.probeStride) {
        std::string ip = prefix + std::to_string(host);
        if (ip != localIp_) {
            candidates.push_back(ip);
        }
    }

    auto accepted = probeTcpPorts(candidates, settings_.managedServicePort,
                                  std::chrono::milliseconds(settings_.probeTimeoutMs));
    IdentityProbe identity(std::chrono::milliseconds(settings_.probeTimeoutMs * 2));

    for (const auto& ip : accepted) {
        if (!running_.load() && worker_.joinable()) {
            break;
        }

        NetworkPeer peer;
        peer.ip = ip;
        peer.hostname = ip;
        peer.port = settings_.managedServicePort;
        peer.isManagedApp = true;
        peer.source = PeerSource::SUBNET_PROBE;
        if (settings_.probeIdentity) {
            identity.confirm(peer);
        }
        registry_.observe(peer);
    }
}
