#include <gtest/gtest.h>
#include "network/discovery_service.hpp"
#include "test_helpers.hpp"
#include <thread>

using namespace testing_support;
using json = nlohmann::json;

namespace {

// Two instances on loopback, each broadcasting to the other's listener.
std::shared_ptr<AppContext> loopbackContext(const TempDir& dir, int listenPort, int peerPort) {
    auto test = makeTestContext(dir.path());
    auto& network = test.context->settings.network;
    network.enableBroadcast = true;
    network.broadcastAddress = "127.0.0.1";
    network.listenPort = listenPort;
    network.broadcastPort = peerPort;
    network.listenWindowMs = 300;
    return test.context;
}

} // namespace

TEST(DiscoveryServiceTest, AnnouncementCarriesIdentity) {
    TempDir dir;
    auto context = makeTestContext(dir.path()).context;
    DiscoveryService discovery(context, 6123);
    discovery.setRole(PeerRole::SOURCE);

    json announcement = discovery.buildAnnouncement();
    EXPECT_EQ(announcement["type"], "toolkit_announce");
    EXPECT_EQ(announcement["protocol_version"], "2.0.0");
    EXPECT_EQ(announcement["instance_id"], context->instanceId);
    EXPECT_EQ(announcement["hostname"], "test-host");
    EXPECT_EQ(announcement["port"], 6123);
    EXPECT_EQ(announcement["role"], "source");
}

TEST(DiscoveryServiceTest, ParseIgnoresSelfForeignAndMalformed) {
    json valid = {
        {"type", "toolkit_announce"}, {"protocol_version", "2.0.0"}, {"instance_id", "aaaa1111"},
        {"hostname", "nas"}, {"ip", "192.168.1.20"}, {"port", 52400}, {"role", "target"}
    };

    auto peer = DiscoveryService::parseAnnouncement(valid.dump(), "192.168.1.20", "bbbb2222");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->instanceId, "aaaa1111");
    EXPECT_EQ(peer->toolkitPort, 52400);
    EXPECT_EQ(peer->role, PeerRole::TARGET);
    EXPECT_EQ(peer->key(), "192.168.1.20:52400");

    EXPECT_FALSE(DiscoveryService::parseAnnouncement(valid.dump(), "192.168.1.20", "aaaa1111").has_value());
    EXPECT_FALSE(DiscoveryService::parseAnnouncement("{not json", "192.168.1.20", "x").has_value());

    json foreign = valid;
    foreign["type"] = "something_else";
    EXPECT_FALSE(DiscoveryService::parseAnnouncement(foreign.dump(), "192.168.1.20", "x").has_value());

    json portless = valid;
    portless.erase("port");
    EXPECT_FALSE(DiscoveryService::parseAnnouncement(portless.dump(), "192.168.1.20", "x").has_value());
}

TEST(DiscoveryServiceTest, SenderAddressFillsMissingIp) {
    json announcement = {
        {"type", "toolkit_announce"}, {"instance_id", "cccc3333"}, {"port", 52400}
    };
    auto peer = DiscoveryService::parseAnnouncement(announcement.dump(), "10.1.1.1", "x");
    ASSERT_TRUE(peer.has_value());
    EXPECT_EQ(peer->ip, "10.1.1.1");
    EXPECT_EQ(peer->role, PeerRole::STANDALONE);
}

TEST(DiscoveryServiceTest, TwoInstancesFindEachOtherByTicks) {
    TempDir dirA;
    TempDir dirB;
    DiscoveryService a(loopbackContext(dirA, 47611, 47612), 50001);
    DiscoveryService b(loopbackContext(dirB, 47612, 47611), 50002);
    ASSERT_TRUE(a.open());
    ASSERT_TRUE(b.open());
    a.setRole(PeerRole::SOURCE);
    b.setRole(PeerRole::TARGET);

    a.runTick();
    b.runTick();
    a.runTick();

    auto partnerOfA = a.findPartner();
    auto partnerOfB = b.findPartner();
    ASSERT_TRUE(partnerOfA.has_value());
    ASSERT_TRUE(partnerOfB.has_value());
    EXPECT_EQ(partnerOfA->instanceId, b.instanceId());
    EXPECT_EQ(partnerOfA->toolkitPort, 50002);
    EXPECT_EQ(partnerOfB->instanceId, a.instanceId());
    EXPECT_EQ(partnerOfB->toolkitPort, 50001);
}

TEST(DiscoveryServiceTest, RunningInstancesRegisterEachOther) {
    TempDir dirA;
    TempDir dirB;
    auto contextA = loopbackContext(dirA, 47621, 47622);
    auto contextB = loopbackContext(dirB, 47622, 47621);
    contextA->settings.network.tickIntervalMs = 5000;
    contextB->settings.network.tickIntervalMs = 5000;

    DiscoveryService a(contextA, 50011);
    DiscoveryService b(contextB, 50012);
    ASSERT_TRUE(a.start());
    ASSERT_TRUE(b.start());
    EXPECT_FALSE(a.start());

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(12);
    while (std::chrono::steady_clock::now() < deadline &&
           (a.registry().size() == 0 || b.registry().size() == 0)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    EXPECT_EQ(a.registry().size(), 1u);
    EXPECT_EQ(b.registry().size(), 1u);
    a.stop();
    b.stop();
    EXPECT_FALSE(a.isRunning());
}

TEST(DiscoveryServiceTest, ManualPeerIsRegistered) {
    TempDir dir;
    DiscoveryService discovery(makeTestContext(dir.path()).context);
    NetworkPeer peer = discovery.addManualPeer("10.9.9.9", 52400);

    EXPECT_EQ(peer.source, PeerSource::MANUAL);
    auto known = discovery.registry().find("10.9.9.9:52400");
    ASSERT_TRUE(known.has_value());
    EXPECT_EQ(known->toolkitPort, 52400);
}
