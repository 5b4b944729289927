#include <gtest/gtest.h>

#include <set>
#include <thread>

#include "Fakes.hpp"
#include "scanner/ScanOrchestrator.hpp"
#include "server/DeviceRegistry.hpp"

using namespace lanwatch;
using lanwatch::testing::Exited;
using lanwatch::testing::FakeProcessRunner;
using lanwatch::testing::FakeResolver;

namespace
{
    // Pings succeed for the listed addresses; the neighbor table returns
    // the given `ip neigh` text.
    FakeProcessRunner::Handler Network(std::set<std::string> alive, std::string neighbors)
    {
        return [alive, neighbors](const std::vector<std::string> &argv)
        {
            if (argv.front() == "ping")
                return Exited(alive.count(argv.back()) ? 0 : 1);
            return Exited(0, neighbors);
        };
    }

    scanner::ScanOrchestrator::AddressSource Anchor(const std::string &ip)
    {
        return [ip]() -> std::optional<Tins::IPv4Address> { return Tins::IPv4Address(ip); };
    }

    const std::chrono::milliseconds kTimeout(100);
}

TEST(ScanOrchestratorTest, CandidatesExcludeNetworkAndBroadcast)
{
    std::vector<Tins::IPv4Address> candidates = scanner::BuildCandidates(Tins::IPv4Address("192.168.1.77"), 24);
    ASSERT_EQ(candidates.size(), 254u);
    EXPECT_EQ(candidates.front().to_string(), "192.168.1.1");
    EXPECT_EQ(candidates.back().to_string(), "192.168.1.254");

    std::vector<Tins::IPv4Address> small = scanner::BuildCandidates(Tins::IPv4Address("10.0.0.5"), 30);
    ASSERT_EQ(small.size(), 2u);
    EXPECT_EQ(small[0].to_string(), "10.0.0.5");
    EXPECT_EQ(small[1].to_string(), "10.0.0.6");
}

TEST(ScanOrchestratorTest, SnapshotCombinesPingAndNeighborTable)
{
    scanner::LinuxCommands commands;
    FakeProcessRunner runner(Network({"10.0.0.1", "10.0.0.5"},
                                     "10.0.0.1 dev eth0 lladdr 00:11:22:33:44:01 REACHABLE\n"
                                     "10.0.0.7 dev eth0 lladdr 00:11:22:33:44:07 STALE\n"
                                     "172.16.0.1 dev eth1 lladdr 00:11:22:33:44:99 REACHABLE\n"));
    FakeResolver resolver({{"10.0.0.5", "nas"}});

    scanner::ProbeExecutor probe(commands, runner, resolver, kTimeout, kTimeout);
    scanner::ArpTableReader arp(commands, runner);
    scanner::ScanOrchestrator orchestrator(probe, arp, Anchor("10.0.0.5"), 28, 4);

    common::ScanSnapshot snapshot = orchestrator.Scan();

    EXPECT_TRUE(snapshot.complete);
    EXPECT_EQ(snapshot.candidates, 14u);
    EXPECT_EQ(snapshot.reachable, 2u);
    ASSERT_EQ(snapshot.entries.size(), 3u);

    EXPECT_EQ(snapshot.entries[0].ip.to_string(), "10.0.0.1");
    ASSERT_TRUE(snapshot.entries[0].mac.has_value());
    EXPECT_EQ(snapshot.entries[0].mac->to_string(), "00:11:22:33:44:01");
    EXPECT_FALSE(snapshot.entries[0].hostname.has_value());

    EXPECT_EQ(snapshot.entries[1].ip.to_string(), "10.0.0.5");
    EXPECT_FALSE(snapshot.entries[1].mac.has_value());
    EXPECT_EQ(snapshot.entries[1].hostname, std::optional<std::string>("nas"));

    // Silent on ping but present in the neighbor table.
    EXPECT_EQ(snapshot.entries[2].ip.to_string(), "10.0.0.7");
    ASSERT_TRUE(snapshot.entries[2].mac.has_value());
    EXPECT_FALSE(snapshot.entries[2].hostname.has_value());
}

TEST(ScanOrchestratorTest, NeighborOnlyDeviceIsMergedOnline)
{
    scanner::LinuxCommands commands;
    FakeProcessRunner runner(Network({}, "10.0.0.5 dev eth0 lladdr AA:BB:CC:DD:EE:FF REACHABLE\n"));
    FakeResolver resolver({{"10.0.0.5", "laptop"}});

    scanner::ProbeExecutor probe(commands, runner, resolver, kTimeout, kTimeout);
    scanner::ArpTableReader arp(commands, runner);
    scanner::ScanOrchestrator orchestrator(probe, arp, Anchor("10.0.0.1"), 24, 8);

    server::DeviceRegistry registry;
    registry.Merge(orchestrator.Scan());

    auto devices = registry.SnapshotForRead();
    ASSERT_EQ(devices->size(), 1u);
    EXPECT_EQ(devices->front().ip.to_string(), "10.0.0.5");
    EXPECT_EQ(devices->front().status, common::DeviceStatus::Online);
    ASSERT_TRUE(devices->front().mac.has_value());
    EXPECT_EQ(devices->front().mac->to_string(), "aa:bb:cc:dd:ee:ff");
    EXPECT_EQ(devices->front().DisplayName(), "10.0.0.5");
    EXPECT_EQ(resolver.calls.load(), 0);
}

TEST(ScanOrchestratorTest, EveryCandidateIsProbedOnce)
{
    scanner::LinuxCommands commands;
    FakeProcessRunner runner(Network({}, ""));
    FakeResolver resolver;

    scanner::ProbeExecutor probe(commands, runner, resolver, kTimeout, kTimeout);
    scanner::ArpTableReader arp(commands, runner);
    scanner::ScanOrchestrator orchestrator(probe, arp, Anchor("192.168.7.20"), 26, 8);

    orchestrator.Scan();

    std::multiset<std::string> pinged;
    for (const auto &argv : runner.Commands())
    {
        if (argv.front() == "ping")
            pinged.insert(argv.back());
    }
    ASSERT_EQ(pinged.size(), 62u);
    for (const auto &ip : pinged)
        EXPECT_EQ(pinged.count(ip), 1u) << ip;
}

TEST(ScanOrchestratorTest, ConcurrencyIsBounded)
{
    scanner::LinuxCommands commands;
    FakeProcessRunner runner(Network({}, ""), std::chrono::milliseconds(5));
    FakeResolver resolver;

    scanner::ProbeExecutor probe(commands, runner, resolver, kTimeout, kTimeout);
    scanner::ArpTableReader arp(commands, runner);
    scanner::ScanOrchestrator orchestrator(probe, arp, Anchor("192.168.1.1"), 24, 4);

    common::ScanSnapshot snapshot = orchestrator.Scan();

    EXPECT_TRUE(snapshot.complete);
    EXPECT_EQ(snapshot.candidates, 254u);
    EXPECT_LE(runner.peak_in_flight.load(), 4);
    EXPECT_GE(runner.peak_in_flight.load(), 1);
}

TEST(ScanOrchestratorTest, NoLocalAddressYieldsEmptySnapshot)
{
    scanner::LinuxCommands commands;
    FakeProcessRunner runner(Network({}, ""));
    FakeResolver resolver;

    scanner::ProbeExecutor probe(commands, runner, resolver, kTimeout, kTimeout);
    scanner::ArpTableReader arp(commands, runner);
    scanner::ScanOrchestrator orchestrator(
        probe, arp, []() -> std::optional<Tins::IPv4Address> { return std::nullopt; }, 24, 4);

    common::ScanSnapshot snapshot = orchestrator.Scan();

    EXPECT_TRUE(snapshot.complete);
    EXPECT_TRUE(snapshot.entries.empty());
    EXPECT_EQ(runner.calls.load(), 0);
}

TEST(ScanOrchestratorTest, AbortedScanIsIncomplete)
{
    scanner::LinuxCommands commands;
    FakeProcessRunner runner(Network({"192.168.1.1"}, ""), std::chrono::milliseconds(20));
    FakeResolver resolver;

    scanner::ProbeExecutor probe(commands, runner, resolver, kTimeout, kTimeout);
    scanner::ArpTableReader arp(commands, runner);
    scanner::ScanOrchestrator orchestrator(probe, arp, Anchor("192.168.1.1"), 24, 2);

    std::thread aborter([&orchestrator]()
                        {
                            std::this_thread::sleep_for(std::chrono::milliseconds(60));
                            orchestrator.Abort();
                        });
    common::ScanSnapshot snapshot = orchestrator.Scan();
    aborter.join();

    EXPECT_FALSE(snapshot.complete);
    EXPECT_TRUE(snapshot.entries.empty());
    EXPECT_LT(runner.calls.load(), 254);

    // Abort is permanent.
    EXPECT_FALSE(orchestrator.Scan().complete);
}
