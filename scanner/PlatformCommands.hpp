#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "ProcessRunner.hpp"
#include "../common/Config.hpp"

namespace lanwatch::scanner
{
    // Builds the OS-specific command lines used by the probe executor and the
    // ARP reader. One instance is chosen at startup.
    class PlatformCommands
    {
    public:
        virtual ~PlatformCommands() = default;

        virtual std::string Name() const = 0;

        virtual std::vector<std::string> PingCommand(const std::string &ip,
                                                     std::chrono::milliseconds timeout) const = 0;

        virtual std::vector<std::string> NeighborTableCommand() const = 0;

        // File to read when the neighbor utility is unavailable.
        virtual std::optional<std::string> NeighborTableFallbackFile() const { return std::nullopt; }

        virtual bool IsReachable(const ProcessResult &result) const { return result.Succeeded(); }

        static std::unique_ptr<PlatformCommands> Create(common::Platform platform);
    };

    class LinuxCommands : public PlatformCommands
    {
    public:
        std::string Name() const override { return "linux"; }
        std::vector<std::string> PingCommand(const std::string &ip,
                                             std::chrono::milliseconds timeout) const override;
        std::vector<std::string> NeighborTableCommand() const override;
        std::optional<std::string> NeighborTableFallbackFile() const override;
    };

    class MacOSCommands : public PlatformCommands
    {
    public:
        std::string Name() const override { return "macos"; }
        std::vector<std::string> PingCommand(const std::string &ip,
                                             std::chrono::milliseconds timeout) const override;
        std::vector<std::string> NeighborTableCommand() const override;
    };

    class WindowsCommands : public PlatformCommands
    {
    public:
        std::string Name() const override { return "windows"; }
        std::vector<std::string> PingCommand(const std::string &ip,
                                             std::chrono::milliseconds timeout) const override;
        std::vector<std::string> NeighborTableCommand() const override;

        // ping.exe exits 0 for "Destination host unreachable" relayed by the
        // gateway; only an echo reply carries a TTL.
        bool IsReachable(const ProcessResult &result) const override;
    };
}
