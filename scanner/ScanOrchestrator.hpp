#pragma once

#include <atomic>
#include <functional>
#include <optional>
#include <vector>

#include <tins/ip_address.h>

#include "ArpTableReader.hpp"
#include "ProbeExecutor.hpp"
#include "Scanner.hpp"

namespace lanwatch::scanner
{
    class ScanOrchestrator : public Scanner
    {
    public:
        using AddressSource = std::function<std::optional<Tins::IPv4Address>()>;

        ScanOrchestrator(ProbeExecutor &probe, ArpTableReader &arp, AddressSource address_source,
                         int prefix_length, int concurrency);

        common::ScanSnapshot Scan() override;
        void Abort() override;

    private:
        std::vector<ProbeResult> RunProbes(const std::vector<Tins::IPv4Address> &candidates);

        ProbeExecutor &m_probe;
        ArpTableReader &m_arp;
        AddressSource m_address_source;
        int m_prefix_length;
        int m_concurrency;
        std::atomic<bool> m_abort;
    };
}
