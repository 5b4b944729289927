#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "scanner/HostnameResolver.hpp"
#include "scanner/ProcessRunner.hpp"
#include "scanner/Scanner.hpp"

namespace lanwatch::testing
{
    inline scanner::ProcessResult Exited(int code, const std::string &output = "")
    {
        scanner::ProcessResult result;
        result.launched = true;
        result.exit_code = code;
        result.output = output;
        return result;
    }

    inline scanner::ProcessResult NotLaunched()
    {
        return scanner::ProcessResult{};
    }

    // Answers each Run() through a handler and records concurrency.
    class FakeProcessRunner : public scanner::ProcessRunner
    {
    public:
        using Handler = std::function<scanner::ProcessResult(const std::vector<std::string> &)>;

        explicit FakeProcessRunner(Handler handler, std::chrono::milliseconds delay = std::chrono::milliseconds(0))
            : m_handler(std::move(handler)), m_delay(delay)
        {
        }

        scanner::ProcessResult Run(const std::vector<std::string> &argv,
                                   std::chrono::milliseconds timeout) override
        {
            ++calls;
            int now = ++in_flight;
            int peak = peak_in_flight.load();
            while (now > peak && !peak_in_flight.compare_exchange_weak(peak, now))
            {
            }

            {
                std::lock_guard<std::mutex> lock(m_mutex);
                commands.push_back(argv);
                last_timeout = timeout;
            }

            if (m_delay.count() > 0)
                std::this_thread::sleep_for(m_delay);

            scanner::ProcessResult result = m_handler(argv);
            --in_flight;
            return result;
        }

        std::vector<std::vector<std::string>> Commands()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return commands;
        }

        std::atomic<int> calls{0};
        std::atomic<int> in_flight{0};
        std::atomic<int> peak_in_flight{0};
        std::chrono::milliseconds last_timeout{0};

    private:
        Handler m_handler;
        std::chrono::milliseconds m_delay;
        std::mutex m_mutex;
        std::vector<std::vector<std::string>> commands;
    };

    class FakeResolver : public scanner::HostnameResolver
    {
    public:
        explicit FakeResolver(std::map<std::string, std::string> names = {})
            : m_names(std::move(names))
        {
        }

        std::optional<std::string> Resolve(const Tins::IPv4Address &address,
                                           std::chrono::milliseconds) override
        {
            ++calls;
            auto it = m_names.find(address.to_string());
            if (it == m_names.end())
                return std::nullopt;
            return it->second;
        }

        std::atomic<int> calls{0};

    private:
        std::map<std::string, std::string> m_names;
    };

    // Scanner that sleeps for a fixed time and tracks overlapping calls.
    class FakeScanner : public scanner::Scanner
    {
    public:
        using Producer = std::function<common::ScanSnapshot()>;

        explicit FakeScanner(std::chrono::milliseconds duration, Producer producer = nullptr)
            : m_duration(duration), m_producer(std::move(producer))
        {
        }

        common::ScanSnapshot Scan() override
        {
            int now = ++running;
            int peak = peak_running.load();
            while (now > peak && !peak_running.compare_exchange_weak(peak, now))
            {
            }

            std::this_thread::sleep_for(m_duration);
            ++scans;
            --running;

            if (m_producer)
                return m_producer();

            common::ScanSnapshot snapshot;
            snapshot.complete = !aborted;
            return snapshot;
        }

        void Abort() override { aborted = true; }

        std::atomic<int> scans{0};
        std::atomic<int> running{0};
        std::atomic<int> peak_running{0};
        std::atomic<bool> aborted{false};

    private:
        std::chrono::milliseconds m_duration;
        Producer m_producer;
    };
}
