#include "HostnameResolver.hpp"

#include <condition_variable>
#include <cstring>
#include <iostream>
#include <mutex>
#include <system_error>
#include <thread>

#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace lanwatch::scanner
{
    namespace
    {
        struct LookupState
        {
            std::mutex mutex;
            std::condition_variable cv;
            bool done = false;
            std::optional<std::string> name;
        };

        std::optional<std::string> ReverseLookup(const std::string &ip)
        {
            struct sockaddr_in sa;
            std::memset(&sa, 0, sizeof(sa));
            sa.sin_family = AF_INET;
            if (inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1)
                return std::nullopt;

            char host[NI_MAXHOST];
            int rc = getnameinfo(reinterpret_cast<struct sockaddr *>(&sa), sizeof(sa),
                                 host, sizeof(host), nullptr, 0, NI_NAMEREQD);
            if (rc != 0)
                return std::nullopt;

            std::string name(host);
            if (name.empty() || name == ip)
                return std::nullopt;
            return name;
        }
    }

    SystemHostnameResolver::SystemHostnameResolver(int max_pending, LookupFunction lookup)
        : m_max_pending(max_pending), m_pending(std::make_shared<std::atomic<int>>(0)),
          m_lookup(lookup ? std::move(lookup) : LookupFunction(ReverseLookup))
    {
    }

    std::optional<std::string> SystemHostnameResolver::Resolve(const Tins::IPv4Address &address,
                                                               std::chrono::milliseconds timeout)
    {
        auto pending = m_pending;

        // Reserve a slot first so concurrent callers cannot overshoot the cap.
        if (pending->fetch_add(1) >= m_max_pending)
        {
            --(*pending);
            return std::nullopt;
        }

        auto state = std::make_shared<LookupState>();
        const std::string ip = address.to_string();
        LookupFunction lookup = m_lookup;

        try
        {
            std::thread([state, pending, ip, lookup]()
                        {
                            std::optional<std::string> name = lookup(ip);
                            {
                                std::lock_guard<std::mutex> lock(state->mutex);
                                state->name = std::move(name);
                                state->done = true;
                            }
                            state->cv.notify_all();
                            --(*pending); })
                .detach();
        }
        catch (const std::system_error &e)
        {
            --(*pending);
            std::cerr << "[Resolver] Could not start lookup for " << ip << ": " << e.what() << "\n";
            return std::nullopt;
        }

        std::unique_lock<std::mutex> lock(state->mutex);
        if (!state->cv.wait_for(lock, timeout, [&state]
                                { return state->done; }))
            return std::nullopt;

        return state->name;
    }
}
