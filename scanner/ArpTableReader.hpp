#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include <tins/ip_address.h>

#include "PlatformCommands.hpp"
#include "ProcessRunner.hpp"
#include "../common/DeviceRecord.hpp"

namespace lanwatch::scanner
{
    using ArpTable = std::map<Tins::IPv4Address, common::MacAddress>;

    class ArpTableReader
    {
    public:
        ArpTableReader(const PlatformCommands &commands, ProcessRunner &runner,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000));

        // Best effort: an unavailable or unreadable table yields an empty map.
        ArpTable Read();

        // Accepts `ip neigh`, /proc/net/arp, BSD `arp -an` and Windows
        // `arp -a` layouts. Lines without both an IPv4 address and a unicast
        // MAC are skipped.
        static ArpTable Parse(const std::string &text);

        static std::optional<Tins::IPv4Address> ParseIpToken(std::string_view token);
        static std::optional<common::MacAddress> ParseMacToken(std::string_view token);

    private:
        ArpTable ReadFallbackFile(const std::string &path);

        const PlatformCommands &m_commands;
        ProcessRunner &m_runner;
        std::chrono::milliseconds m_timeout;
    };
}
