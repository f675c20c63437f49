#include <gtest/gtest.h>
#include "network/mdns_browser.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace {

class PacketBuilder {
public:
    void u16(uint16_t value) {
        bytes.push_back(static_cast<uint8_t>(value >> 8));
        bytes.push_back(static_cast<uint8_t>(value & 0xff));
    }
    void u32(uint32_t value) {
        u16(static_cast<uint16_t>(value >> 16));
        u16(static_cast<uint16_t>(value & 0xffff));
    }
    void label(const std::string& text) {
        bytes.push_back(static_cast<uint8_t>(text.size()));
        bytes.insert(bytes.end(), text.begin(), text.end());
    }
    void end() { bytes.push_back(0); }
    void pointer(size_t offset) {
        bytes.push_back(static_cast<uint8_t>(0xC0 | (offset >> 8)));
        bytes.push_back(static_cast<uint8_t>(offset & 0xff));
    }
    // type, class IN, ttl; returns where the rdata length goes
    size_t recordHeader(uint16_t type) {
        u16(type);
        u16(1);
        u32(120);
        size_t lengthAt = bytes.size();
        u16(0);
        return lengthAt;
    }
    void patchLength(size_t lengthAt) {
        size_t length = bytes.size() - lengthAt - 2;
        bytes[lengthAt] = static_cast<uint8_t>(length >> 8);
        bytes[lengthAt + 1] = static_cast<uint8_t>(length & 0xff);
    }

    std::vector<uint8_t> bytes;
};

std::vector<uint8_t> serverResponse() {
    PacketBuilder p;
    p.u16(0);
    p.u16(0x8400);
    p.u16(0);
    p.u16(4);
    p.u16(0);
    p.u16(0);

    size_t serviceName = p.bytes.size();
    p.label("_plexmediasvr");
    p.label("_tcp");
    p.label("local");
    p.end();
    size_t at = p.recordHeader(12);
    size_t instanceName = p.bytes.size();
    p.label("Living Room");
    p.pointer(serviceName);
    p.patchLength(at);

    p.pointer(instanceName);
    at = p.recordHeader(33);
    p.u16(0);
    p.u16(0);
    p.u16(32400);
    size_t hostName = p.bytes.size();
    p.label("nas");
    p.label("local");
    p.end();
    p.patchLength(at);

    p.pointer(instanceName);
    at = p.recordHeader(16);
    p.label("Resource-Identifier=abc123");
    p.label("Name=Living Room");
    p.label("Version=1.40.0");
    p.label("Platform=Linux");
    p.patchLength(at);

    p.pointer(hostName);
    at = p.recordHeader(1);
    for (uint8_t octet : {192, 168, 1, 50}) {
        p.bytes.push_back(octet);
    }
    p.patchLength(at);
    return p.bytes;
}

} // namespace

TEST(MdnsBrowserTest, QueryAsksForPointerRecordsWithUnicastResponse) {
    auto query = MdnsBrowser::buildQuery({"_plexmediasvr._tcp.local"});

    ASSERT_GE(query.size(), 12u);
    EXPECT_EQ(query[5], 1);  // one question
    EXPECT_EQ(query[12], 13);
    EXPECT_EQ(std::string(query.begin() + 13, query.begin() + 26), "_plexmediasvr");
    size_t tail = query.size() - 4;
    EXPECT_EQ(query[tail], 0x00);
    EXPECT_EQ(query[tail + 1], 12);
    EXPECT_EQ(query[tail + 2], 0x80);
    EXPECT_EQ(query[tail + 3], 0x01);
}

TEST(MdnsBrowserTest, AssemblesCompressedAnswersIntoOneRecord) {
    auto packet = serverResponse();
    auto records = MdnsBrowser::parseResponse(packet.data(), packet.size(),
                                              {"_plexmediasvr._tcp.local", "_servershift._tcp.local"},
                                              "192.168.1.99");

    ASSERT_EQ(records.size(), 1u);
    const auto& record = records[0];
    EXPECT_EQ(record.serviceType, "_plexmediasvr._tcp.local");
    EXPECT_EQ(record.instanceName, "living room._plexmediasvr._tcp.local");
    EXPECT_EQ(record.target, "nas.local");
    EXPECT_EQ(record.port, 32400);
    EXPECT_EQ(record.ip, "192.168.1.50");
    EXPECT_EQ(record.txt.at("Resource-Identifier"), "abc123");

    NetworkPeer peer = MdnsBrowser::toPeer(record);
    EXPECT_TRUE(peer.isManagedApp);
    EXPECT_TRUE(peer.confirmed);
    EXPECT_EQ(peer.port, 32400);
    EXPECT_EQ(peer.machineId, "abc123");
    EXPECT_EQ(peer.serverName, "Living Room");
    EXPECT_EQ(peer.version, "1.40.0");
    EXPECT_EQ(peer.platform, "Linux");
    EXPECT_EQ(peer.source, PeerSource::SERVICE_RECORD);
}

TEST(MdnsBrowserTest, RecordCountsAboveSixteenBitsStillParse) {
    auto packet = serverResponse();
    // 0xffff answers plus one authority record
    packet[6] = 0xff;
    packet[7] = 0xff;
    packet[8] = 0x00;
    packet[9] = 0x01;

    auto records = MdnsBrowser::parseResponse(packet.data(), packet.size(),
                                              {"_plexmediasvr._tcp.local"}, "192.168.1.99");
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].port, 32400);
    EXPECT_EQ(records[0].ip, "192.168.1.50");
}

TEST(MdnsBrowserTest, UnwantedServiceTypesAreIgnored) {
    auto packet = serverResponse();
    auto records = MdnsBrowser::parseResponse(packet.data(), packet.size(),
                                              {"_servershift._tcp.local"}, "192.168.1.99");
    EXPECT_TRUE(records.empty());
}

TEST(MdnsBrowserTest, TruncatedPacketYieldsNothing) {
    auto packet = serverResponse();
    auto records = MdnsBrowser::parseResponse(packet.data(), 20, {"_plexmediasvr._tcp.local"}, "1.2.3.4");
    EXPECT_TRUE(records.empty());
    EXPECT_TRUE(MdnsBrowser::parseResponse(packet.data(), 5, {"_plexmediasvr._tcp.local"}, "1.2.3.4").empty());
}

TEST(MdnsBrowserTest, ToolRecordsBecomeToolPeers) {
    ServiceRecord record;
    record.serviceType = "_servershift._tcp.local";
    record.ip = "10.0.0.8";
    record.port = 52400;
    record.txt = {{"instance_id", "feedbeef"}, {"role", "target"}};

    NetworkPeer peer = MdnsBrowser::toPeer(record);
    EXPECT_FALSE(peer.isManagedApp);
    EXPECT_EQ(peer.toolkitPort, 52400);
    EXPECT_EQ(peer.instanceId, "feedbeef");
    EXPECT_EQ(peer.role, PeerRole::TARGET);
}
