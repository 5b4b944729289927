#include "Config.hpp"

#include <sstream>
#include <stdexcept>

namespace lanwatch::common
{
    namespace
    {
        int ParseInt(const std::string &flag, const std::string &value, int min, int max)
        {
            size_t consumed = 0;
            int parsed = 0;
            try
            {
                parsed = std::stoi(value, &consumed);
            }
            catch (const std::exception &)
            {
                throw std::invalid_argument(flag + " expects a number, got '" + value + "'");
            }

            if (consumed != value.size())
                throw std::invalid_argument(flag + " expects a number, got '" + value + "'");

            if (parsed < min || parsed > max)
            {
                throw std::invalid_argument(flag + " must be between " + std::to_string(min) +
                                            " and " + std::to_string(max));
            }
            return parsed;
        }
    }

    Platform Config::BuildPlatform()
    {
#if defined(_WIN32)
        return Platform::Windows;
#elif defined(__APPLE__)
        return Platform::MacOS;
#else
        return Platform::Linux;
#endif
    }

    Platform ParsePlatform(const std::string &name)
    {
        if (name == "linux")
            return Platform::Linux;
        if (name == "macos" || name == "darwin")
            return Platform::MacOS;
        if (name == "windows")
            return Platform::Windows;
        throw std::invalid_argument("Unknown platform '" + name + "' (expected linux, macos or windows)");
    }

    std::string PlatformName(Platform platform)
    {
        switch (platform)
        {
        case Platform::Linux:
            return "linux";
        case Platform::MacOS:
            return "macos";
        case Platform::Windows:
            return "windows";
        }
        return "unknown";
    }

    Config ParseCommandLine(const std::vector<std::string> &args, bool &show_help)
    {
        Config config;
        show_help = false;

        for (size_t i = 0; i < args.size(); ++i)
        {
            const std::string &flag = args[i];

            if (flag == "-h" || flag == "--help")
            {
                show_help = true;
                return config;
            }

            if (i + 1 >= args.size())
                throw std::invalid_argument("Missing value for " + flag);

            const std::string &value = args[++i];

            if (flag == "--port")
                config.http_port = ParseInt(flag, value, 1, 65535);
            else if (flag == "--prefix")
                config.prefix_length = ParseInt(flag, value, 16, 30);
            else if (flag == "--interval")
                config.scan_interval = std::chrono::seconds(ParseInt(flag, value, 1, 86400));
            else if (flag == "--probe-timeout-ms")
                config.probe_timeout = std::chrono::milliseconds(ParseInt(flag, value, 100, 10000));
            else if (flag == "--lookup-timeout-ms")
                config.lookup_timeout = std::chrono::milliseconds(ParseInt(flag, value, 100, 10000));
            else if (flag == "--concurrency")
                config.probe_concurrency = ParseInt(flag, value, 1, 256);
            else if (flag == "--interface")
                config.interface_name = value;
            else if (flag == "--frontend")
                config.frontend_dir = value;
            else if (flag == "--platform")
                config.platform = ParsePlatform(value);
            else if (flag == "--tls-cert")
                config.tls_cert_path = value;
            else if (flag == "--tls-key")
                config.tls_key_path = value;
            else
                throw std::invalid_argument("Unknown option " + flag);
        }

        if (config.tls_cert_path.empty() != config.tls_key_path.empty())
            throw std::invalid_argument("--tls-cert and --tls-key must be given together");

        return config;
    }

    std::string Usage(const std::string &program)
    {
        std::ostringstream ss;
        ss << "Usage: " << program << " [options]\n"
           << "  --port <n>               HTTP port (default 8000)\n"
           << "  --prefix <n>             subnet prefix length, 16-30 (default 24)\n"
           << "  --interval <s>           seconds between scans (default 30)\n"
           << "  --probe-timeout-ms <ms>  ping timeout (default 800)\n"
           << "  --lookup-timeout-ms <ms> reverse lookup timeout (default 1000)\n"
           << "  --concurrency <n>        probes in flight (default 32)\n"
           << "  --interface <name>       interface to anchor the scan (default route)\n"
           << "  --frontend <dir>         dashboard directory (default ./frontend)\n"
           << "  --platform <name>        linux, macos or windows command set\n"
           << "  --tls-cert <file>        PEM certificate, enables HTTPS with --tls-key\n"
           << "  --tls-key <file>         PEM private key\n";
        return ss.str();
    }
}
