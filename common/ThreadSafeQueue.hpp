#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace lanwatch::common
{
    // Multi-producer, multi-consumer queue. After Shutdown() consumers keep
    // draining what is left and then receive std::nullopt.
    template <typename T>
    class ThreadSafeQueue
    {
    private:
        std::deque<T> m_queue;
        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        bool m_shutdown = false;

    public:
        void Push(T value)
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_queue.push_back(std::move(value));
            }
            m_cv.notify_one();
        }

        std::optional<T> Pop()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_cv.wait(lock, [this]
                      { return !m_queue.empty() || m_shutdown; });

            if (m_queue.empty())
                return std::nullopt;

            T value = std::move(m_queue.front());
            m_queue.pop_front();
            return value;
        }

        void Shutdown()
        {
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_shutdown = true;
            }
            m_cv.notify_all();
        }

        // Drops every queued item; returns how many were dropped.
        size_t Drain()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            size_t dropped = m_queue.size();
            m_queue.clear();
            return dropped;
        }

        size_t Size() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_queue.size();
        }
    };
}
