#pragma once

#include "network/peer.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// One DNS-SD service instance assembled from PTR, SRV, TXT and A answers.
struct ServiceRecord {
    std::string serviceType;   // e.g. _plexmediasvr._tcp.local
    std::string instanceName;
    std::string target;        // SRV host name
    std::string ip;
    int port = 0;
    std::map<std::string, std::string> txt;
};

// DNS-SD browsing over multicast DNS (224.0.0.251:5353) with unicast-response queries.
class MdnsBrowser {
public:
    static constexpr const char* kToolServiceType = "_servershift._tcp.local";

    explicit MdnsBrowser(std::vector<std::string> serviceTypes);

    // Sends one query and collects answers for `window`. Network errors yield no records.
    std::vector<ServiceRecord> browse(std::chrono::milliseconds window) const;

    const std::vector<std::string>& serviceTypes() const { return serviceTypes_; }

    static std::vector<uint8_t> buildQuery(const std::vector<std::string>& serviceTypes);
    // sourceIp fills records that arrive without an A answer.
    static std::vector<ServiceRecord> parseResponse(const uint8_t* data, size_t length,
                                                    const std::vector<std::string>& serviceTypes,
                                                    const std::string& sourceIp);

    static NetworkPeer toPeer(const ServiceRecord& record);

private:
    std::vector<std::string> serviceTypes_;
};
