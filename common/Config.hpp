#pragma once

#include <chrono>
#include <string>
#include <vector>

namespace lanwatch::common
{
    enum class Platform
    {
        Linux,
        MacOS,
        Windows
    };

    struct Config
    {
        int http_port = 8000;
        int prefix_length = 24;
        std::chrono::seconds scan_interval{30};
        std::chrono::milliseconds probe_timeout{800};
        std::chrono::milliseconds lookup_timeout{1000};
        int probe_concurrency = 32;

        // Empty means "the interface carrying the default route".
        std::string interface_name;
        std::string frontend_dir = "frontend";
        Platform platform = BuildPlatform();

        std::string tls_cert_path;
        std::string tls_key_path;

        bool TlsEnabled() const { return !tls_cert_path.empty() && !tls_key_path.empty(); }

        static Platform BuildPlatform();
    };

    // Throws std::invalid_argument on unknown flags or out-of-range values.
    // Sets show_help instead of throwing when --help is present.
    Config ParseCommandLine(const std::vector<std::string> &args, bool &show_help);

    Platform ParsePlatform(const std::string &name);
    std::string PlatformName(Platform platform);

    std::string Usage(const std::string &program);
}
