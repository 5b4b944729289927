#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <thread>

#include "DeviceRegistry.hpp"
#include "../scanner/Scanner.hpp"

namespace lanwatch::server
{
    enum class SchedulerState
    {
        Idle,
        Scanning
    };

    struct SchedulerStats
    {
        SchedulerState state = SchedulerState::Idle;
        uint64_t scans_completed = 0;
        uint64_t scans_failed = 0;
        uint64_t ticks_skipped = 0;
        std::optional<common::Clock::time_point> last_scan_started;
        std::optional<common::Clock::time_point> last_scan_finished;
        std::chrono::milliseconds last_scan_duration{0};
        size_t last_snapshot_size = 0;
    };

    const char *StateName(SchedulerState state);

    // Fires a tick immediately on Start() and then every interval. A tick
    // that lands while a scan is still running is dropped, so scans never
    // overlap and overdue ticks never pile up.
    class ScanScheduler
    {
    public:
        ScanScheduler(scanner::Scanner &scanner, DeviceRegistry &registry, std::chrono::milliseconds interval);
        ~ScanScheduler();

        ScanScheduler(const ScanScheduler &) = delete;
        ScanScheduler &operator=(const ScanScheduler &) = delete;

        void Start();
        void Stop();

        SchedulerState State() const;
        SchedulerStats Stats() const;
        std::chrono::milliseconds Interval() const { return m_interval; }

    private:
        void TickLoop();
        void ScanLoop();
        void OnTick();
        void RunCycle();

        scanner::Scanner &m_scanner;
        DeviceRegistry &m_registry;
        std::chrono::milliseconds m_interval;

        std::thread m_tick_thread;
        std::thread m_scan_thread;

        mutable std::mutex m_mutex;
        std::condition_variable m_tick_cv;
        std::condition_variable m_scan_cv;
        bool m_running;
        bool m_scan_requested;
        SchedulerStats m_stats;
    };
}
