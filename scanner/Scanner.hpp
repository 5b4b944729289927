#pragma once

#include <optional>
#include <string>
#include <vector>

#include <tins/ip_address.h>

#include "../common/DeviceRecord.hpp"

namespace lanwatch::scanner
{
    struct LocalAddress
    {
        std::string interface_name;
        Tins::IPv4Address ip;
        Tins::IPv4Address netmask;
    };

    // Primary IPv4 address of the named interface, or of the interface that
    // carries the default route when the name is empty.
    std::optional<LocalAddress> DetectLocalAddress(const std::string &interface_name);

    // Every host address of anchor/prefix_length, network and broadcast
    // excluded, in ascending order.
    std::vector<Tins::IPv4Address> BuildCandidates(const Tins::IPv4Address &anchor, int prefix_length);

    class Scanner
    {
    public:
        virtual ~Scanner() = default;

        virtual common::ScanSnapshot Scan() = 0;

        // Asks a running Scan() to wrap up early; its snapshot is then
        // flagged incomplete. Permanent for the lifetime of the scanner.
        virtual void Abort() {}
    };
}
