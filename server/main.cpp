#include "NetworkCore.hpp"
#include "ApiRouter.hpp"
#include "DeviceRegistry.hpp"
#include "ScanScheduler.hpp"
#include "../common/Config.hpp"
#include "../scanner/ArpTableReader.hpp"
#include "../scanner/HostnameResolver.hpp"
#include "../scanner/PlatformCommands.hpp"
#include "../scanner/ProbeExecutor.hpp"
#include "../scanner/ProcessRunner.hpp"
#include "../scanner/ScanOrchestrator.hpp"

#include <csignal>
#include <memory>
#include <optional>
#include <iostream>
#include <string>
#include <vector>

namespace
{
    lanwatch::server::NetworkCore *g_server = nullptr;

    void HandleTerminate(int)
    {
        if (g_server)
            g_server->Stop();
    }
}

int main(int argc, char *argv[])
{
    using namespace lanwatch;

    const std::string program = argc > 0 ? argv[0] : "lanwatch";
    std::vector<std::string> args(argv + 1, argv + argc);

    common::Config parsed;
    try
    {
        bool show_help = false;
        parsed = common::ParseCommandLine(args, show_help);
        if (show_help)
        {
            std::cout << common::Usage(program);
            return 0;
        }
    }
    catch (const std::invalid_argument &e)
    {
        std::cerr << "[Main] " << e.what() << "\n\n"
                  << common::Usage(program);
        return 1;
    }
    const common::Config &config = parsed;

    std::unique_ptr<scanner::PlatformCommands> commands = scanner::PlatformCommands::Create(config.platform);
    scanner::PosixProcessRunner runner;
    scanner::SystemHostnameResolver resolver;
    scanner::ProbeExecutor probe(*commands, runner, resolver, config.probe_timeout, config.lookup_timeout);
    scanner::ArpTableReader arp(*commands, runner);

    const std::string interface_name = config.interface_name;
    scanner::ScanOrchestrator orchestrator(
        probe, arp,
        [interface_name]() -> std::optional<Tins::IPv4Address>
        {
            std::optional<scanner::LocalAddress> local = scanner::DetectLocalAddress(interface_name);
            if (!local)
                return std::nullopt;
            return local->ip;
        },
        config.prefix_length, config.probe_concurrency);

    server::DeviceRegistry registry;
    server::ScanScheduler scheduler(orchestrator, registry, config.scan_interval);
    server::ApiRouter router(registry, scheduler, config.frontend_dir);
    server::NetworkCore server(config.http_port, router);

    std::cout << "[Main] lanwatch starting: " << commands->Name() << " commands, /"
              << config.prefix_length << " range, " << config.probe_concurrency
              << " probes in flight, frontend " << config.frontend_dir << "\n";

    try
    {
        server.Init(config.tls_cert_path, config.tls_key_path);

        g_server = &server;
        std::signal(SIGINT, HandleTerminate);
        std::signal(SIGTERM, HandleTerminate);
        std::signal(SIGPIPE, SIG_IGN);

        scheduler.Start();
        server.Run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "Fatal Server Error: " << e.what() << '\n';
        g_server = nullptr;
        scheduler.Stop();
        return -1;
    }

    std::cout << "[Main] Shutting down..." << std::endl;
    g_server = nullptr;
    scheduler.Stop();
    return 0;
}
