#include "Probe.hpp"
#include "Semaphore.hpp"
#include "../common/Log.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <system_error>
#include <thread>

namespace net_scan::engine
{
    using common::Log;
    using common::LogLevel;

    Probe::BatchReporter::BatchReporter(const BatchCallbacks &callbacks, ProbeKind kind, std::size_t total)
        : m_callbacks(callbacks), m_kind(kind), m_total(std::max<std::size_t>(total, 1))
    {
    }

    void Probe::BatchReporter::Attempt(double latency_ms, bool success)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_callbacks.on_attempt)
            m_callbacks.on_attempt(m_kind, latency_ms, success);
    }

    void Probe::BatchReporter::Result(const ProbeResult &result)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_callbacks.on_result)
            m_callbacks.on_result(result);
    }

    void Probe::BatchReporter::Completed(const std::string &address)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_completed;
        double fraction = std::min(1.0, static_cast<double>(m_completed) / static_cast<double>(m_total));
        if (fraction < m_last_fraction)
            return;
        m_last_fraction = fraction;
        if (m_callbacks.on_progress)
            m_callbacks.on_progress(address, fraction);
    }

    void Probe::BatchReporter::Progress(const std::string &address, double fraction)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        fraction = std::min(1.0, fraction);
        if (fraction < m_last_fraction)
            return;
        m_last_fraction = fraction;
        if (m_callbacks.on_progress)
            m_callbacks.on_progress(address, fraction);
    }

    std::optional<ProbeResult> Probe::SafeProbeOne(const ScanTarget &target)
    {
        try
        {
            return ProbeOne(target);
        }
        catch (const std::exception &e)
        {
            Log(LogLevel::Debug, Name()) << target.address << ": " << e.what();
            return std::nullopt;
        }
    }

    void Probe::ForEachTarget(const std::vector<ScanTarget> &targets, const BatchCallbacks &callbacks,
                              const std::function<void(const ScanTarget &)> &fn)
    {
        if (targets.empty())
            return;

        Semaphore semaphore(m_config.max_concurrency);
        std::atomic<std::size_t> next{0};

        auto worker = [&]()
        {
            while (!callbacks.Aborted())
            {
                const std::size_t index = next.fetch_add(1);
                if (index >= targets.size())
                    return;

                SemaphoreGuard permit(semaphore);
                if (callbacks.Aborted())
                    return;
                if (m_config.request_delay.count() > 0)
                    std::this_thread::sleep_for(m_config.request_delay);

                fn(targets[index]);
            }
        };

        std::size_t worker_count = 1;
        if (m_config.parallel)
            worker_count = std::max<std::size_t>(1, std::min(targets.size(), m_config.max_concurrency));

        std::vector<std::thread> threads;
        threads.reserve(worker_count - 1);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            try
            {
                threads.emplace_back(worker);
            }
            catch (const std::system_error &e)
            {
                Log(LogLevel::Warn, Name()) << "running with " << threads.size() + 1 << " workers: " << e.what();
                break;
            }
        }

        worker();
        for (auto &t : threads)
            t.join();
    }

    std::vector<ProbeResult> Probe::ProbeBatch(const std::vector<ScanTarget> &targets, const BatchCallbacks &callbacks)
    {
        std::vector<ProbeResult> results;
        if (targets.empty())
            return results;

        BatchReporter reporter(callbacks, Kind(), targets.size());
        std::mutex results_mutex;

        ForEachTarget(targets, callbacks, [&](const ScanTarget &target)
                      {
                          const auto start = std::chrono::steady_clock::now();
                          auto result = SafeProbeOne(target);
                          const std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;

                          reporter.Attempt(elapsed.count(), result.has_value());
                          if (result)
                          {
                              {
                                  std::lock_guard<std::mutex> lock(results_mutex);
                                  results.push_back(*result);
                              }
                              reporter.Result(*result);
                          }
                          reporter.Completed(target.address); });

        return results;
    }

    std::vector<ScanTarget> MakeTargets(const std::vector<std::string> &addresses, const std::string &segment)
    {
        std::vector<ScanTarget> targets;
        targets.reserve(addresses.size());
        for (const auto &address : addresses)
            targets.push_back({address, segment});
        return targets;
    }
}
