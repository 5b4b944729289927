#include "ScanOrchestrator.hpp"

#include <algorithm>
#include <iostream>
#include <map>
#include <mutex>
#include <set>
#include <system_error>
#include <thread>

#include "../common/ThreadSafeQueue.hpp"

namespace lanwatch::scanner
{
    ScanOrchestrator::ScanOrchestrator(ProbeExecutor &probe, ArpTableReader &arp, AddressSource address_source,
                                       int prefix_length, int concurrency)
        : m_probe(probe), m_arp(arp), m_address_source(std::move(address_source)),
          m_prefix_length(prefix_length), m_concurrency(std::max(1, concurrency)), m_abort(false)
    {
    }

    void ScanOrchestrator::Abort()
    {
        m_abort = true;
    }

    std::vector<ProbeResult> ScanOrchestrator::RunProbes(const std::vector<Tins::IPv4Address> &candidates)
    {
        common::ThreadSafeQueue<Tins::IPv4Address> queue;
        for (const auto &candidate : candidates)
            queue.Push(candidate);
        queue.Shutdown();

        std::vector<ProbeResult> results;
        results.reserve(candidates.size());
        std::mutex results_mutex;

        auto worker = [&]()
        {
            while (!m_abort)
            {
                std::optional<Tins::IPv4Address> next = queue.Pop();
                if (!next)
                    break;

                ProbeResult result = m_probe.Probe(*next);

                std::lock_guard<std::mutex> lock(results_mutex);
                results.push_back(std::move(result));
            }
        };

        size_t worker_count = std::min(static_cast<size_t>(m_concurrency), candidates.size());
        std::vector<std::thread> pool;
        pool.reserve(worker_count);

        for (size_t i = 0; i < worker_count; ++i)
        {
            try
            {
                pool.emplace_back(worker);
            }
            catch (const std::system_error &e)
            {
                std::cerr << "[Scanner] Started only " << pool.size() << " of " << worker_count
                          << " probe workers: " << e.what() << "\n";
                break;
            }
        }

        if (pool.empty() && worker_count > 0)
            worker();

        for (auto &thread : pool)
            thread.join();

        if (m_abort)
            queue.Drain();

        return results;
    }

    common::ScanSnapshot ScanOrchestrator::Scan()
    {
        common::ScanSnapshot snapshot;
        snapshot.started_at = common::Clock::now();

        std::optional<Tins::IPv4Address> anchor = m_address_source();
        if (!anchor)
        {
            std::cerr << "[Scanner] No local IPv4 address, nothing to scan this cycle\n";
            snapshot.finished_at = common::Clock::now();
            return snapshot;
        }

        std::vector<Tins::IPv4Address> candidates = BuildCandidates(*anchor, m_prefix_length);
        snapshot.candidates = candidates.size();

        std::cout << "[Scanner] Probing " << candidates.size() << " addresses around "
                  << anchor->to_string() << "/" << m_prefix_length << "\n";

        std::vector<ProbeResult> results = RunProbes(candidates);

        if (m_abort)
        {
            std::cout << "[Scanner] Scan aborted after " << results.size() << " probes\n";
            snapshot.complete = false;
            snapshot.finished_at = common::Clock::now();
            return snapshot;
        }

        ArpTable arp = m_arp.Read();
        snapshot.arp_entries = arp.size();

        std::map<Tins::IPv4Address, common::SnapshotEntry> seen;
        for (const auto &result : results)
        {
            if (!result.reachable)
                continue;
            ++snapshot.reachable;
            seen[result.ip] = common::SnapshotEntry{result.ip, std::nullopt, result.hostname};
        }

        // An ARP entry means traffic was exchanged recently, so an address the
        // ping missed still counts as present.
        std::set<Tins::IPv4Address> in_range(candidates.begin(), candidates.end());
        for (const auto &entry : arp)
        {
            if (in_range.count(entry.first) == 0)
                continue;

            common::SnapshotEntry &device = seen[entry.first];
            device.ip = entry.first;
            device.mac = entry.second;
        }

        snapshot.entries.reserve(seen.size());
        for (auto &entry : seen)
            snapshot.entries.push_back(std::move(entry.second));

        snapshot.finished_at = common::Clock::now();

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(snapshot.finished_at - snapshot.started_at);
        std::cout << "[Scanner] Cycle done in " << elapsed.count() << " ms: "
                  << snapshot.reachable << " answered ping, "
                  << snapshot.arp_entries << " ARP entries, "
                  << snapshot.entries.size() << " devices present\n";

        return snapshot;
    }
}
