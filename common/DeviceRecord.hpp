#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <tins/hw_address.h>
#include <tins/ip_address.h>

namespace lanwatch::common
{
    using Clock = std::chrono::system_clock;
    using MacAddress = Tins::HWAddress<6>;

    enum class DeviceStatus
    {
        Online,
        Offline
    };

    struct DeviceRecord
    {
        Tins::IPv4Address ip;
        std::optional<MacAddress> mac;
        std::optional<std::string> hostname;
        DeviceStatus status = DeviceStatus::Offline;
        Clock::time_point last_seen;

        // Falls back to the dotted-quad when no name was ever resolved.
        std::string DisplayName() const { return hostname ? *hostname : ip.to_string(); }
    };

    // One device observed during a scan cycle.
    struct SnapshotEntry
    {
        Tins::IPv4Address ip;
        std::optional<MacAddress> mac;
        std::optional<std::string> hostname;
    };

    struct ScanSnapshot
    {
        // Ordered by IP ascending.
        std::vector<SnapshotEntry> entries;

        size_t candidates = 0;
        size_t reachable = 0;
        size_t arp_entries = 0;

        Clock::time_point started_at;
        Clock::time_point finished_at;

        // False when the cycle was aborted; such snapshots are never merged.
        bool complete = true;
    };

    inline const char *StatusName(DeviceStatus status)
    {
        return status == DeviceStatus::Online ? "online" : "offline";
    }

    std::string FormatTimestamp(Clock::time_point tp);
}
