#pragma once

#include <chrono>
#include <optional>
#include <string>

#include <tins/ip_address.h>

#include "HostnameResolver.hpp"
#include "PlatformCommands.hpp"
#include "ProcessRunner.hpp"

namespace lanwatch::scanner
{
    struct ProbeResult
    {
        Tins::IPv4Address ip;
        bool reachable = false;
        std::optional<std::string> hostname;
    };

    class ProbeExecutor
    {
    public:
        // Extra time the process deadline allows beyond the ping timeout, so
        // the utility's own timeout normally fires first.
        static constexpr std::chrono::milliseconds PROCESS_GRACE{500};

        ProbeExecutor(const PlatformCommands &commands, ProcessRunner &runner,
                      HostnameResolver &resolver,
                      std::chrono::milliseconds probe_timeout,
                      std::chrono::milliseconds lookup_timeout);

        // Never throws; every failure reports the address as unreachable.
        ProbeResult Probe(const Tins::IPv4Address &ip);

    private:
        const PlatformCommands &m_commands;
        ProcessRunner &m_runner;
        HostnameResolver &m_resolver;
        std::chrono::milliseconds m_probe_timeout;
        std::chrono::milliseconds m_lookup_timeout;
    };
}
