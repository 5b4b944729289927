#include "Scanner.hpp"

#include <iostream>

#include <tins/address_range.h>
#include <tins/network_interface.h>

namespace lanwatch::scanner
{
    std::optional<LocalAddress> DetectLocalAddress(const std::string &interface_name)
    {
        try
        {
            Tins::NetworkInterface iface = interface_name.empty()
                                               ? Tins::NetworkInterface::default_interface()
                                               : Tins::NetworkInterface(interface_name);
            Tins::NetworkInterface::Info info = iface.info();

            if (info.ip_addr == Tins::IPv4Address())
            {
                std::cerr << "[Scanner] Interface " << iface.name() << " has no IPv4 address\n";
                return std::nullopt;
            }

            return LocalAddress{iface.name(), info.ip_addr, info.netmask};
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Scanner] Could not determine local address: " << e.what() << "\n";
            return std::nullopt;
        }
    }

    std::vector<Tins::IPv4Address> BuildCandidates(const Tins::IPv4Address &anchor, int prefix_length)
    {
        std::vector<Tins::IPv4Address> candidates;

        // Host-only range: skips the network and broadcast addresses.
        Tins::IPv4Range range = anchor / prefix_length;
        for (const Tins::IPv4Address &address : range)
            candidates.push_back(address);

        return candidates;
    }
}
