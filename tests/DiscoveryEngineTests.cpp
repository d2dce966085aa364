// DiscoveryEngineTests.cpp
// Multicast round, dedup/sort, socket failure and the port-scan fallback.

#include <gtest/gtest.h>
#include <algorithm>

#include "mocks/ScriptedDiscoveryNetwork.hpp"
#include "wam_discovery.h"

namespace {

const char* kMediaRenderer = "urn:schemas-upnp-org:device:MediaRenderer:1";
const char* kWamSpeaker = "urn:samsung.com:device:WAMSpeaker:1";
const char* kSsdpAll = "ssdp:all";

std::string reply(const std::string& location, const std::string& name) {
    return "HTTP/1.1 200 OK\r\n"
           "LOCATION: " + location + "\r\n"
           "ST: urn:samsung.com:device:WAMSpeaker:1\r\n"
           "FRIENDLYNAME: " + name + "\r\n\r\n";
}

} // namespace

TEST(DiscoveryEngineTests, SearchesEveryServiceTypeInOrder) {
    ScriptedDiscoveryNetwork network;
    DiscoveryEngine engine(network);
    std::vector<DeviceDescriptor> found;
    network.addReply(kWamSpeaker, "10.0.0.5", reply("http://10.0.0.5:55001/", "Den"));

    ASSERT_TRUE(engine.discover(3, found).ok());
    std::vector<std::string> expected = {
        "urn:schemas-upnp-org:device:MediaRenderer:1",
        "urn:samsung.com:device:WAMSpeaker:1",
        "urn:schemas-upnp-org:service:WAM:1",
        "ssdp:all"};
    EXPECT_EQ(network.searches(), expected);
    EXPECT_EQ(network.lastTimeoutMs(), 3000);
}

TEST(DiscoveryEngineTests, DeduplicatesAndSortsByIp) {
    ScriptedDiscoveryNetwork network;
    DiscoveryEngine engine(network);

    network.addReply(kMediaRenderer, "10.0.0.9", reply("http://10.0.0.9:55001/", "Garage"));
    network.addReply(kMediaRenderer, "10.0.0.5", reply("http://10.0.0.5:55001/", "Den"));
    network.addReply(kWamSpeaker, "10.0.0.5", reply("http://10.0.0.5:55001/", "Den again"));
    network.addReply(kWamSpeaker, "10.0.0.5", reply("http://10.0.0.5:7676/", "Den http"));
    network.addReply(kSsdpAll, "10.0.0.7", "HTTP/1.1 200 OK\r\nST: upnp:rootdevice\r\n\r\n");

    std::vector<DeviceDescriptor> found;
    ASSERT_TRUE(engine.discover(3, found).ok());
    ASSERT_EQ(found.size(), 3u);

    EXPECT_EQ(found[0].ip, "10.0.0.5");
    EXPECT_EQ(found[0].port, 55001);
    EXPECT_EQ(found[0].advertisedName, "Den");     // first seen wins
    EXPECT_EQ(found[1].ip, "10.0.0.5");
    EXPECT_EQ(found[1].port, 7676);
    EXPECT_EQ(found[2].ip, "10.0.0.9");

    for (size_t i = 0; i < found.size(); i++) {
        for (size_t j = i + 1; j < found.size(); j++) {
            EXPECT_FALSE(found[i].ip == found[j].ip && found[i].port == found[j].port);
        }
    }
    EXPECT_TRUE(std::is_sorted(found.begin(), found.end(),
                               [](const DeviceDescriptor& a, const DeviceDescriptor& b) { return a.ip < b.ip; }));
    EXPECT_EQ(network.probeCount(), 0);
}

TEST(DiscoveryEngineTests, AllSocketsFailingIsAnError) {
    ScriptedDiscoveryNetwork network;
    network.failAllSockets();
    DiscoveryEngine engine(network);
    std::vector<DeviceDescriptor> found;
    EXPECT_EQ(engine.discover(3, found).code, WamErrorCode::DiscoverySocketError);
}

TEST(DiscoveryEngineTests, OneFailedSocketIsTolerated) {
    ScriptedDiscoveryNetwork network;
    network.failSocketFor(kMediaRenderer);
    network.addReply(kWamSpeaker, "10.0.0.5", reply("http://10.0.0.5:55001/", "Den"));
    DiscoveryEngine engine(network);

    std::vector<DeviceDescriptor> found;
    ASSERT_TRUE(engine.discover(3, found).ok());
    EXPECT_EQ(found.size(), 1u);
}

//==============================================================================
// Fallback scan
//==============================================================================

TEST(DiscoveryEngineTests, CandidatesStayInSlash24AndAreCapped) {
    ScriptedDiscoveryNetwork network;
    DiscoveryEngine engine(network);
    std::vector<std::string> hosts = engine.scanCandidates("192.168.4.77");
    ASSERT_EQ(hosts.size(), 50u);
    EXPECT_EQ(hosts.front(), "192.168.4.1");
    EXPECT_EQ(hosts.back(), "192.168.4.50");
}

TEST(DiscoveryEngineTests, FallbackScanWhenNoAdvertisements) {
    ScriptedDiscoveryNetwork network;
    network.setLocalIp("192.168.4.77");
    network.openPort("192.168.4.30", 55001);
    network.openPort("192.168.4.12", 8001, ProbeResult::Confirmed);
    DiscoveryEngine engine(network);

    std::vector<DeviceDescriptor> found;
    ASSERT_TRUE(engine.discover(1, found).ok());
    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].ip, "192.168.4.12");
    EXPECT_EQ(found[0].port, 8001);
    EXPECT_EQ(found[0].advertisedName, "Samsung WAM Speaker at 192.168.4.12");
    EXPECT_EQ(found[0].advertisedModel, "WAM on port 8001");
    EXPECT_EQ(found[1].ip, "192.168.4.30");
    EXPECT_EQ(found[1].advertisedModel, "WAM on port 55001");
}

TEST(DiscoveryEngineTests, FallbackProbesAtMostFiftyAddresses) {
    ScriptedDiscoveryNetwork network;
    network.setLocalIp("10.1.2.3");
    DiscoveryEngine engine(network);

    std::vector<DeviceDescriptor> found = engine.fallbackScan();
    EXPECT_TRUE(found.empty());
    EXPECT_LE(network.probedHosts().size(), 50u);
    EXPECT_EQ(network.probeCount(), 50 * 8);
}

TEST(DiscoveryEngineTests, HttpProbeOnlyOnBannerPorts) {
    ScriptedDiscoveryNetwork network;
    network.setLocalIp("10.1.2.3");
    DiscoveryEngine engine(network);
    engine.fallbackScan();

    std::set<uint16_t> expected = {7676, 8001, 8080, 19999, 52345};
    EXPECT_EQ(network.httpProbes(), expected);
}

TEST(DiscoveryEngineTests, NoLocalAddressMeansNoScan) {
    ScriptedDiscoveryNetwork network;
    DiscoveryEngine engine(network);
    std::vector<DeviceDescriptor> found;
    ASSERT_TRUE(engine.discover(1, found).ok());
    EXPECT_TRUE(found.empty());
    EXPECT_EQ(network.probeCount(), 0);
}
