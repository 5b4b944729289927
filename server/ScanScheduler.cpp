#include "ScanScheduler.hpp"

#include <iostream>

namespace lanwatch::server
{
    const char *StateName(SchedulerState state)
    {
        return state == SchedulerState::Scanning ? "scanning" : "idle";
    }

    ScanScheduler::ScanScheduler(scanner::Scanner &scanner, DeviceRegistry &registry, std::chrono::milliseconds interval)
        : m_scanner(scanner), m_registry(registry), m_interval(interval),
          m_running(false), m_scan_requested(false)
    {
    }

    ScanScheduler::~ScanScheduler()
    {
        Stop();
    }

    void ScanScheduler::Start()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_running)
                return;
            m_running = true;
        }

        m_scan_thread = std::thread(&ScanScheduler::ScanLoop, this);
        m_tick_thread = std::thread(&ScanScheduler::TickLoop, this);

        std::cout << "[Scheduler] Started, scanning every "
                  << std::chrono::duration_cast<std::chrono::seconds>(m_interval).count() << "s\n";
    }

    void ScanScheduler::Stop()
    {
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (!m_running && !m_tick_thread.joinable() && !m_scan_thread.joinable())
                return;
            m_running = false;
        }
        m_tick_cv.notify_all();
        m_scan_cv.notify_all();
        m_scanner.Abort();

        if (m_tick_thread.joinable())
            m_tick_thread.join();
        if (m_scan_thread.joinable())
            m_scan_thread.join();
    }

    SchedulerState ScanScheduler::State() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stats.state;
    }

    SchedulerStats ScanScheduler::Stats() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_stats;
    }

    // Caller holds m_mutex.
    void ScanScheduler::OnTick()
    {
        if (m_stats.state == SchedulerState::Scanning)
        {
            ++m_stats.ticks_skipped;
            std::cout << "[Scheduler] Previous scan still running, tick skipped\n";
            return;
        }

        m_stats.state = SchedulerState::Scanning;
        m_scan_requested = true;
        m_scan_cv.notify_one();
    }

    void ScanScheduler::TickLoop()
    {
        using SteadyClock = std::chrono::steady_clock;

        auto next_tick = SteadyClock::now();
        std::unique_lock<std::mutex> lock(m_mutex);

        while (m_running)
        {
            OnTick();

            next_tick += m_interval;
            auto now = SteadyClock::now();
            if (next_tick < now)
                next_tick = now;

            m_tick_cv.wait_until(lock, next_tick, [this]
                                 { return !m_running; });
        }
    }

    void ScanScheduler::ScanLoop()
    {
        while (true)
        {
            {
                std::unique_lock<std::mutex> lock(m_mutex);
                m_scan_cv.wait(lock, [this]
                               { return m_scan_requested || !m_running; });
                if (!m_running)
                    break;

                m_scan_requested = false;
                m_stats.last_scan_started = common::Clock::now();
            }

            RunCycle();
        }
    }

    void ScanScheduler::RunCycle()
    {
        const auto started = std::chrono::steady_clock::now();
        bool merged = false;
        bool failed = false;
        size_t snapshot_size = 0;

        try
        {
            common::ScanSnapshot snapshot = m_scanner.Scan();
            if (snapshot.complete)
            {
                m_registry.Merge(snapshot);
                merged = true;
                snapshot_size = snapshot.entries.size();
            }
            else
            {
                std::cout << "[Scheduler] Incomplete scan discarded\n";
            }
        }
        catch (const std::exception &e)
        {
            failed = true;
            std::cerr << "[Scheduler] Scan cycle failed: " << e.what() << "\n";
        }

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

        std::lock_guard<std::mutex> lock(m_mutex);
        m_stats.state = SchedulerState::Idle;
        m_stats.last_scan_finished = common::Clock::now();
        m_stats.last_scan_duration = elapsed;

        if (failed)
        {
            ++m_stats.scans_failed;
        }
        else if (merged)
        {
            ++m_stats.scans_completed;
            m_stats.last_snapshot_size = snapshot_size;
            std::cout << "[Scheduler] Registry updated: " << m_registry.OnlineCount() << " online / "
                      << m_registry.Size() << " known devices\n";
        }
    }
}
