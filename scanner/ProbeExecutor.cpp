#include "ProbeExecutor.hpp"

#include <exception>
#include <iostream>

namespace lanwatch::scanner
{
    ProbeExecutor::ProbeExecutor(const PlatformCommands &commands, ProcessRunner &runner,
                                 HostnameResolver &resolver,
                                 std::chrono::milliseconds probe_timeout,
                                 std::chrono::milliseconds lookup_timeout)
        : m_commands(commands), m_runner(runner), m_resolver(resolver),
          m_probe_timeout(probe_timeout), m_lookup_timeout(lookup_timeout)
    {
    }

    ProbeResult ProbeExecutor::Probe(const Tins::IPv4Address &ip)
    {
        ProbeResult result;
        result.ip = ip;

        try
        {
            const std::string ip_str = ip.to_string();
            ProcessResult ping = m_runner.Run(m_commands.PingCommand(ip_str, m_probe_timeout),
                                              m_probe_timeout + PROCESS_GRACE);

            if (!m_commands.IsReachable(ping))
                return result;

            result.reachable = true;
            result.hostname = m_resolver.Resolve(ip, m_lookup_timeout);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[Probe] " << ip.to_string() << " failed: " << e.what() << "\n";
            result.reachable = false;
            result.hostname.reset();
        }

        return result;
    }
}
