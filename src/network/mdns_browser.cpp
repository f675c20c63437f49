#include "network/mdns_browser.hpp"
#include "common/logger.hpp"
#include "network/socket.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cctype>
#include <netinet/in.h>
#include <sstream>
#include <sys/socket.h>

namespace {

constexpr const char* kMulticastAddress = "224.0.0.251";
constexpr int kMdnsPort = 5353;

constexpr uint16_t kTypeA = 1;
constexpr uint16_t kTypePtr = 12;
constexpr uint16_t kTypeTxt = 16;
constexpr uint16_t kTypeSrv = 33;
constexpr uint16_t kClassInUnicast = 0x8001;  // IN with the QU bit

std::string normalize(std::string name) {
    while (!name.empty() && name.back() == '.') {
        name.pop_back();
    }
    std::transform(name.begin(), name.end(), name.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return name;
}

uint16_t read16(const uint8_t* data) {
    return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

void write16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xff));
}

// Reads a possibly compressed name starting at offset. On success offset points past
// the name as it appears in place.
bool readName(const uint8_t* data, size_t length, size_t& offset, std::string& name) {
    name.clear();
    size_t cursor = offset;
    bool jumped = false;
    int jumps = 0;

    while (true) {
        if (cursor >= length) {
            return false;
        }
        uint8_t labelLength = data[cursor];
        if ((labelLength & 0xC0) == 0xC0) {
            if (cursor + 1 >= length || ++jumps > 16) {
                return false;
            }
            size_t pointer = static_cast<size_t>(((labelLength & 0x3F) << 8) | data[cursor + 1]);
            if (!jumped) {
                offset = cursor + 2;
            }
            jumped = true;
            cursor = pointer;
            continue;
        }
        if (labelLength == 0) {
            if (!jumped) {
                offset = cursor + 1;
            }
            return true;
        }
        if (cursor + 1 + labelLength > length) {
            return false;
        }
        if (!name.empty()) {
            name += '.';
        }
        name.append(reinterpret_cast<const char*>(data + cursor + 1), labelLength);
        cursor += 1 + labelLength;
    }
}

} // namespace

MdnsBrowser::MdnsBrowser(std::vector<std::string> serviceTypes)
    : serviceTypes_(std::move(serviceTypes)) {
}

std::vector<uint8_t> MdnsBrowser::buildQuery(const std::vector<std::string>& serviceTypes) {
    std::vector<uint8_t> packet;
    write16(packet, 0);  // id
    write16(packet, 0);  // flags: standard query
    write16(packet, static_cast<uint16_t>(serviceTypes.size()));
    write16(packet, 0);
    write16(packet, 0);
    write16(packet, 0);

    for (const auto& type : serviceTypes) {
        std::stringstream ss(normalize(type));
        std::string label;
        while (std::getline(ss, label, '.')) {
            if (label.empty()) {
                continue;
            }
            packet.push_back(static_cast<uint8_t>(std::min<size_t>(label.size(), 63)));
            packet.insert(packet.end(), label.begin(), label.begin() + std::min<size_t>(label.size(), 63));
        }
        packet.push_back(0);
        write16(packet, kTypePtr);
        write16(packet, kClassInUnicast);
    }
    return packet;
}

std::vector<ServiceRecord> MdnsBrowser::parseResponse(const uint8_t* data, size_t length,
                                                      const std::vector<std::string>& serviceTypes,
                                                      const std::string& sourceIp) {
    std::vector<ServiceRecord> records;
    if (length < 12) {
        return records;
    }

    uint16_t questions = read16(data + 4);
    size_t total = static_cast<size_t>(read16(data + 6)) + read16(data + 8) + read16(data + 10);
    size_t offset = 12;
    std::string name;

    for (uint16_t i = 0; i < questions; ++i) {
        if (!readName(data, length, offset, name) || offset + 4 > length) {
            return records;
        }
        offset += 4;
    }

    std::vector<std::string> wanted;
    for (const auto& type : serviceTypes) {
        wanted.push_back(normalize(type));
    }

    std::map<std::string, std::string> instances;  // instance -> service type
    std::map<std::string, std::pair<std::string, int>> services;  // instance -> (target, port)
    std::map<std::string, std::map<std::string, std::string>> texts;
    std::map<std::string, std::string> addresses;  // host -> ip

    for (size_t i = 0; i < total; ++i) {
        if (!readName(data, length, offset, name) || offset + 10 > length) {
            break;
        }
        uint16_t type = read16(data + offset);
        uint16_t rdLength = read16(data + offset + 8);
        offset += 10;
        if (offset + rdLength > length) {
            break;
        }
        size_t rdata = offset;
        std::string owner = normalize(name);

        if (type == kTypePtr) {
            size_t cursor = rdata;
            std::string instance;
            if (readName(data, length, cursor, instance) &&
                std::find(wanted.begin(), wanted.end(), owner) != wanted.end()) {
                instances[normalize(instance)] = owner;
            }
        } else if (type == kTypeSrv && rdLength >= 7) {
            size_t cursor = rdata + 6;
            std::string target;
            if (readName(data, length, cursor, target)) {
                services[owner] = {normalize(target), read16(data + rdata + 4)};
            }
        } else if (type == kTypeTxt) {
            size_t cursor = rdata;
            auto& entries = texts[owner];
            while (cursor < rdata + rdLength) {
                uint8_t entryLength = data[cursor++];
                if (cursor + entryLength > rdata + rdLength) {
                    break;
                }
                std::string entry(reinterpret_cast<const char*>(data + cursor), entryLength);
                cursor += entryLength;
                auto equals = entry.find('=');
                if (equals != std::string::npos) {
                    entries[entry.substr(0, equals)] = entry.substr(equals + 1);
                }
            }
        } else if (type == kTypeA && rdLength == 4) {
            char buffer[INET_ADDRSTRLEN] = {0};
            inet_ntop(AF_INET, data + rdata, buffer, sizeof(buffer));
            addresses[owner] = buffer;
        }

        offset += rdLength;
    }

    for (const auto& [instance, serviceType] : instances) {
        ServiceRecord record;
        record.serviceType = serviceType;
        record.instanceName = instance;
        record.ip = sourceIp;

        auto srv = services.find(instance);
        if (srv != services.end()) {
            record.target = srv->second.first;
            record.port = srv->second.second;
            auto address = addresses.find(record.target);
            if (address != addresses.end()) {
                record.ip = address->second;
            }
        }
        auto txt = texts.find(instance);
        if (txt != texts.end()) {
            record.txt = txt->second;
        }
        records.push_back(std::move(record));
    }
    return records;
}

std::vector<ServiceRecord> MdnsBrowser::browse(std::chrono::milliseconds window) const {
    std::vector<ServiceRecord> records;
    if (serviceTypes_.empty()) {
        return records;
    }

    Socket sock(::socket(AF_INET, SOCK_DGRAM, 0));
    if (!sock.valid()) {
        Logger::debug("mDNS: cannot create socket");
        return records;
    }

    int ttl = 255;
    setsockopt(sock.fd(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    sockaddr_in destination{};
    destination.sin_family = AF_INET;
    destination.sin_port = htons(kMdnsPort);
    inet_pton(AF_INET, kMulticastAddress, &destination.sin_addr);

    std::vector<uint8_t> query = buildQuery(serviceTypes_);
    if (sendto(sock.fd(), query.data(), query.size(), 0,
               reinterpret_cast<sockaddr*>(&destination), sizeof(destination)) < 0) {
        Logger::debug("mDNS: query not sent");
        return records;
    }

    auto deadline = std::chrono::steady_clock::now() + window;
    uint8_t buffer[9000];
    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0 || !sock.waitReadable(remaining)) {
            break;
        }

        sockaddr_in from{};
        socklen_t fromLength = sizeof(from);
        ssize_t n = recvfrom(sock.fd(), buffer, sizeof(buffer), 0,
                             reinterpret_cast<sockaddr*>(&from), &fromLength);
        if (n <= 0) {
            break;
        }

        char fromIp[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &from.sin_addr, fromIp, sizeof(fromIp));
        auto parsed = parseResponse(buffer, static_cast<size_t>(n), serviceTypes_, fromIp);
        records.insert(records.end(), parsed.begin(), parsed.end());
    }
    return records;
}

NetworkPeer MdnsBrowser::toPeer(const ServiceRecord& record) {
    NetworkPeer peer;
    peer.ip = record.ip;
    peer.hostname = record.target.empty() ? record.ip : record.target;
    peer.source = PeerSource::SERVICE_RECORD;

    auto txt = [&record](const char* key) {
        auto it = record.txt.find(key);
        return it == record.txt.end() ? std::string() : it->second;
    };
    peer.machineId = txt("Resource-Identifier");
    peer.serverName = txt("Name");
    peer.version = txt("Version");
    peer.platform = txt("Platform");

    if (record.serviceType == normalize(kToolServiceType)) {
        peer.toolkitPort = record.port;
        peer.instanceId = txt("instance_id");
        peer.role = parsePeerRole(txt("role"));
    } else {
        peer.port = record.port;
        peer.isManagedApp = true;
        peer.confirmed = true;
    }
    return peer;
}
