#pragma once

#include "../common/Log.hpp"

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

namespace net_scan::engine
{
    // Runs work on a detached thread and lets the caller wait for it up to a
    // deadline. A result produced after the deadline is dropped; the thread keeps
    // the shared state alive until it finishes.
    template <typename T>
    class DeadlineTask
    {
    public:
        template <typename Fn, typename = std::enable_if_t<!std::is_same_v<std::decay_t<Fn>, DeadlineTask>>>
        explicit DeadlineTask(Fn fn) : m_state(std::make_shared<State>())
        {
            auto state = m_state;
            try
            {
                std::thread([state, work = std::move(fn)]() mutable
                            {
                                std::optional<T> value;
                                try
                                {
                                    value = work();
                                }
                                catch (const std::exception &e)
                                {
                                    common::Log(common::LogLevel::Debug, "Deadline") << "task failed: " << e.what();
                                }
                                {
                                    std::lock_guard<std::mutex> lock(state->mutex);
                                    state->value = std::move(value);
                                    state->done = true;
                                }
                                state->cv.notify_all(); })
                    .detach();
            }
            catch (const std::system_error &e)
            {
                common::Log(common::LogLevel::Warn, "Deadline") << "unable to start worker: " << e.what();
                std::lock_guard<std::mutex> lock(m_state->mutex);
                m_state->done = true;
            }
        }

        // nullopt when the deadline passes first or the work produced nothing.
        std::optional<T> WaitUntil(std::chrono::steady_clock::time_point deadline)
        {
            std::unique_lock<std::mutex> lock(m_state->mutex);
            if (!m_state->cv.wait_until(lock, deadline, [this]
                                        { return m_state->done; }))
                return std::nullopt;
            return std::move(m_state->value);
        }

        std::optional<T> WaitFor(std::chrono::milliseconds timeout)
        {
            return WaitUntil(std::chrono::steady_clock::now() + timeout);
        }

        bool Finished() const
        {
            std::lock_guard<std::mutex> lock(m_state->mutex);
            return m_state->done;
        }

    private:
        struct State
        {
            std::mutex mutex;
            std::condition_variable cv;
            bool done = false;
            std::optional<T> value;
        };

        std::shared_ptr<State> m_state;
    };

    // Time left until the deadline, zero once it has passed.
    inline std::chrono::milliseconds Remaining(std::chrono::steady_clock::time_point deadline)
    {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return std::max(left, std::chrono::milliseconds(0));
    }

    // Convenience for a single call: fn returns std::optional<T>.
    template <typename T, typename Fn>
    std::optional<T> RunWithDeadline(Fn fn, std::chrono::milliseconds timeout)
    {
        DeadlineTask<T> task(std::move(fn));
        return task.WaitFor(timeout);
    }
}
