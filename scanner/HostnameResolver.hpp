#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <tins/ip_address.h>

namespace lanwatch::scanner
{
    class HostnameResolver
    {
    public:
        virtual ~HostnameResolver() = default;

        // Reverse lookup; std::nullopt when unresolved or slower than timeout.
        virtual std::optional<std::string> Resolve(const Tins::IPv4Address &address,
                                                   std::chrono::milliseconds timeout) = 0;
    };

    // getnameinfo() has no timeout of its own, so each lookup runs on a
    // detached thread and the caller stops waiting at the deadline. Lookups
    // still pending past their deadline count against max_pending; once the
    // cap is hit new lookups are skipped.
    class SystemHostnameResolver : public HostnameResolver
    {
    public:
        // Blocking name lookup for one dotted-quad; getnameinfo() by default.
        using LookupFunction = std::function<std::optional<std::string>(const std::string &)>;

        explicit SystemHostnameResolver(int max_pending = 64, LookupFunction lookup = nullptr);

        std::optional<std::string> Resolve(const Tins::IPv4Address &address,
                                           std::chrono::milliseconds timeout) override;

        int Pending() const { return m_pending->load(); }

    private:
        int m_max_pending;
        std::shared_ptr<std::atomic<int>> m_pending;
        LookupFunction m_lookup;
    };
}
