#pragma once

#include <algorithm>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>

namespace net_scan::engine
{
    // Counting semaphore with FIFO hand-off: a release gives the permit to the
    // longest waiter instead of returning it to the pool.
    class Semaphore
    {
    public:
        explicit Semaphore(std::size_t permits) : m_available(std::max<std::size_t>(permits, 1)) {}

        Semaphore(const Semaphore &) = delete;
        Semaphore &operator=(const Semaphore &) = delete;

        void Acquire()
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (m_available > 0 && m_waiters.empty())
            {
                --m_available;
                return;
            }

            Waiter self;
            m_waiters.push_back(&self);
            m_cv.wait(lock, [&self]
                      { return self.granted; });
        }

        bool TryAcquire()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_available == 0 || !m_waiters.empty())
                return false;
            --m_available;
            return true;
        }

        void Release()
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            if (m_waiters.empty())
            {
                ++m_available;
                return;
            }

            m_waiters.front()->granted = true;
            m_waiters.pop_front();
            m_cv.notify_all();
        }

        std::size_t Available() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_available;
        }

        std::size_t Waiting() const
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            return m_waiters.size();
        }

    private:
        struct Waiter
        {
            bool granted = false;
        };

        mutable std::mutex m_mutex;
        std::condition_variable m_cv;
        std::size_t m_available;
        std::deque<Waiter *> m_waiters;
    };

    class SemaphoreGuard
    {
    public:
        explicit SemaphoreGuard(Semaphore &semaphore) : m_semaphore(semaphore) { m_semaphore.Acquire(); }
        ~SemaphoreGuard() { m_semaphore.Release(); }

        SemaphoreGuard(const SemaphoreGuard &) = delete;
        SemaphoreGuard &operator=(const SemaphoreGuard &) = delete;

    private:
        Semaphore &m_semaphore;
    };
}
