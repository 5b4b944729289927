#include "PlatformCommands.hpp"

namespace lanwatch::scanner
{
    std::unique_ptr<PlatformCommands> PlatformCommands::Create(common::Platform platform)
    {
        switch (platform)
        {
        case common::Platform::MacOS:
            return std::make_unique<MacOSCommands>();
        case common::Platform::Windows:
            return std::make_unique<WindowsCommands>();
        case common::Platform::Linux:
            break;
        }
        return std::make_unique<LinuxCommands>();
    }

    // iputils ping only takes whole seconds for -W.
    std::vector<std::string> LinuxCommands::PingCommand(const std::string &ip,
                                                        std::chrono::milliseconds timeout) const
    {
        long long seconds = (timeout.count() + 999) / 1000;
        if (seconds < 1)
            seconds = 1;
        return {"ping", "-c", "1", "-W", std::to_string(seconds), ip};
    }

    std::vector<std::string> LinuxCommands::NeighborTableCommand() const
    {
        return {"ip", "neigh", "show"};
    }

    std::optional<std::string> LinuxCommands::NeighborTableFallbackFile() const
    {
        return std::string("/proc/net/arp");
    }

    std::vector<std::string> MacOSCommands::PingCommand(const std::string &ip,
                                                        std::chrono::milliseconds timeout) const
    {
        return {"ping", "-c", "1", "-W", std::to_string(timeout.count()), ip};
    }

    std::vector<std::string> MacOSCommands::NeighborTableCommand() const
    {
        return {"arp", "-an"};
    }

    std::vector<std::string> WindowsCommands::PingCommand(const std::string &ip,
                                                          std::chrono::milliseconds timeout) const
    {
        return {"ping", "-n", "1", "-w", std::to_string(timeout.count()), ip};
    }

    std::vector<std::string> WindowsCommands::NeighborTableCommand() const
    {
        return {"arp", "-a"};
    }

    bool WindowsCommands::IsReachable(const ProcessResult &result) const
    {
        return result.Succeeded() && result.output.find("TTL=") != std::string::npos;
    }
}
