#include "ScanOrchestrator.hpp"
#include "Deadline.hpp"
#include "PriorityTaskQueue.hpp"
#include "Semaphore.hpp"
#include "../common/AddressUtils.hpp"
#include "../common/Log.hpp"

#include <algorithm>
#include <atomic>
#include <functional>
#include <system_error>
#include <thread>

namespace net_scan::engine
{
    using common::Log;
    using common::LogLevel;

    namespace
    {
        using Clock = std::chrono::steady_clock;

        constexpr auto AVAILABILITY_BOUND = std::chrono::milliseconds(2500);
        constexpr auto ULTRA_FAST_MAX_TIMEOUT = std::chrono::milliseconds(500);
        constexpr int NEIGHBOR_RADIUS = 3;

        bool IsFastKind(ProbeKind kind)
        {
            return kind == ProbeKind::Icmp || kind == ProbeKind::Tcp;
        }

        // Runs fn on `count` threads (the caller's included) and joins them.
        void RunWorkers(std::size_t count, const std::function<void()> &fn)
        {
            std::vector<std::thread> threads;
            threads.reserve(count > 0 ? count - 1 : 0);
            for (std::size_t i = 1; i < count; ++i)
            {
                try
                {
                    threads.emplace_back(fn);
                }
                catch (const std::system_error &e)
                {
                    Log(LogLevel::Warn, "Orchestrator") << "running with " << threads.size() + 1
                                                        << " workers: " << e.what();
                    break;
                }
            }
            fn();
            for (auto &t : threads)
                t.join();
        }

        // Per-scan sink shared by the strategy threads.
        class ScanSession
        {
        public:
            ScanSession(const ScanCallbacks &callbacks, PerformanceTracker &tracker, const AbortSignal *abort)
                : m_callbacks(callbacks), m_tracker(tracker), m_abort(abort)
            {
            }

            bool Aborted() const { return m_abort && m_abort->IsRaised(); }

            void Progress(const std::string &address, double fraction)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                fraction = std::min(1.0, std::max(fraction, m_last_progress));
                m_last_progress = fraction;
                if (m_callbacks.on_progress)
                    m_callbacks.on_progress(address, fraction);
            }

            void Emit(const ProbeResult &result)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                if (m_callbacks.on_result)
                    m_callbacks.on_result(result);
            }

            void Collect(std::vector<ProbeResult> results)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                for (auto &r : results)
                    m_results.push_back(std::move(r));
            }

            void EmitAndCollect(const ProbeResult &result)
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                m_results.push_back(result);
                if (m_callbacks.on_result)
                    m_callbacks.on_result(result);
            }

            void Attempt(ProbeKind kind, double latency_ms, bool success)
            {
                m_tracker.Record(kind, latency_ms, success);
            }

            // Callbacks for one ProbeBatch call, with progress remapped by `map`.
            BatchCallbacks ForBatch(std::function<void(const std::string &, double)> map)
            {
                BatchCallbacks cb;
                cb.on_progress = std::move(map);
                cb.on_result = [this](const ProbeResult &r)
                { Emit(r); };
                cb.on_attempt = [this](ProbeKind kind, double latency_ms, bool success)
                { Attempt(kind, latency_ms, success); };
                cb.abort = m_abort;
                return cb;
            }

            std::vector<ProbeResult> TakeResults()
            {
                std::lock_guard<std::mutex> lock(m_mutex);
                std::vector<ProbeResult> out;
                out.swap(m_results);
                return out;
            }

        private:
            const ScanCallbacks &m_callbacks;
            PerformanceTracker &m_tracker;
            const AbortSignal *m_abort;
            std::mutex m_mutex;
            double m_last_progress = 0.0;
            std::vector<ProbeResult> m_results;
        };

        struct ProbeRun
        {
            ProbeKind kind;
            std::shared_ptr<Probe> probe;
        };

        // One ProbeOne call with the time it took on its own thread.
        struct TimedProbe
        {
            std::optional<ProbeResult> result;
            double latency_ms = 0.0;
        };

        DeadlineTask<TimedProbe> StartTimed(const ProbeRun &run, const ScanTarget &target)
        {
            auto probe = run.probe;
            return DeadlineTask<TimedProbe>([probe, target]() -> std::optional<TimedProbe>
                                            {
                                                const auto begin = Clock::now();
                                                TimedProbe timed;
                                                timed.result = probe->ProbeOne(target);
                                                const std::chrono::duration<double, std::milli> took = Clock::now() - begin;
                                                timed.latency_ms = took.count();
                                                return timed; });
        }

        double MillisecondsSince(Clock::time_point start)
        {
            const std::chrono::duration<double, std::milli> elapsed = Clock::now() - start;
            return elapsed.count();
        }

        std::vector<ProbeResult> RunBatch(const ProbeRun &run, const std::vector<ScanTarget> &targets,
                                          const BatchCallbacks &cb)
        {
            try
            {
                return run.probe->ProbeBatch(targets, cb);
            }
            catch (const std::exception &e)
            {
                Log(LogLevel::Warn, "Orchestrator") << run.probe->Name() << " batch failed: " << e.what();
                return {};
            }
        }

        // All probes concurrently over the same targets. Reported progress is
        // base + span * mean(per-probe progress).
        void RunProbesInParallel(ScanSession &session, const std::vector<ProbeRun> &runs,
                                 const std::vector<ScanTarget> &targets, double base, double span)
        {
            if (runs.empty() || targets.empty())
                return;

            std::mutex progress_mutex;
            std::vector<double> progress(runs.size(), 0.0);

            auto run_one = [&](std::size_t index)
            {
                auto cb = session.ForBatch([&, index](const std::string &address, double fraction)
                                           {
                                               double mean = 0.0;
                                               {
                                                   std::lock_guard<std::mutex> lock(progress_mutex);
                                                   progress[index] = std::max(progress[index], fraction);
                                                   for (double p : progress)
                                                       mean += p;
                                                   mean /= static_cast<double>(progress.size());
                                               }
                                               session.Progress(address, base + span * mean); });
                session.Collect(RunBatch(runs[index], targets, cb));
            };

            std::vector<std::thread> threads;
            for (std::size_t i = 1; i < runs.size(); ++i)
            {
                try
                {
                    threads.emplace_back(run_one, i);
                }
                catch (const std::system_error &e)
                {
                    Log(LogLevel::Warn, "Orchestrator") << "running " << runs[i].probe->Name()
                                                        << " inline: " << e.what();
                    run_one(i);
                }
            }
            run_one(0);
            for (auto &t : threads)
                t.join();
        }

        void RunSequential(ScanSession &session, std::vector<ProbeRun> runs, const std::vector<ScanTarget> &targets)
        {
            std::stable_sort(runs.begin(), runs.end(), [](const ProbeRun &a, const ProbeRun &b)
                             { return a.probe->Priority() < b.probe->Priority(); });

            const double n = static_cast<double>(runs.size());
            for (std::size_t i = 0; i < runs.size(); ++i)
            {
                if (session.Aborted())
                    break;
                Log(LogLevel::Debug, "Orchestrator") << "sequential: " << runs[i].probe->Name();
                auto cb = session.ForBatch([&session, i, n](const std::string &address, double fraction)
                                           { session.Progress(address, (static_cast<double>(i) + fraction) / n); });
                session.Collect(RunBatch(runs[i], targets, cb));
            }
        }

        void RunSmart(ScanSession &session, const std::vector<ProbeRun> &runs, const std::vector<ScanTarget> &targets)
        {
            std::vector<ProbeRun> fast;
            std::vector<ProbeRun> detailed;
            for (const auto &run : runs)
                (IsFastKind(run.kind) ? fast : detailed).push_back(run);

            if (fast.empty())
            {
                RunProbesInParallel(session, detailed, targets, 0.0, 1.0);
                return;
            }

            // The session holds only phase 1 results at this point.
            RunProbesInParallel(session, fast, targets, 0.0, 0.3);
            std::vector<ProbeResult> phase_one = session.TakeResults();

            std::vector<ScanTarget> active;
            std::set<std::string> seen;
            for (const auto &target : targets)
            {
                for (const auto &r : phase_one)
                {
                    if (r.address == target.address && seen.insert(target.address).second)
                    {
                        active.push_back(target);
                        break;
                    }
                }
            }
            session.Collect(std::move(phase_one));

            Log(LogLevel::Info, "Orchestrator") << "smart: " << active.size() << " of " << targets.size()
                                                << " targets active after phase 1";
            if (active.empty() || detailed.empty() || session.Aborted())
                return;

            RunProbesInParallel(session, detailed, active, 0.3, 0.7);
        }

        void RunUltraFast(ScanSession &session, const std::vector<ProbeRun> &runs,
                          const std::vector<ScanTarget> &targets, std::chrono::milliseconds bound,
                          std::size_t concurrency)
        {
            Semaphore semaphore(concurrency);
            std::atomic<std::size_t> next{0};
            std::atomic<std::size_t> done{0};
            const double total = static_cast<double>(targets.size());

            RunWorkers(std::min(targets.size(), std::max<std::size_t>(concurrency, 1)), [&]()
                       {
                           while (!session.Aborted())
                           {
                               const std::size_t index = next.fetch_add(1);
                               if (index >= targets.size())
                                   return;
                               const ScanTarget target = targets[index];

                               SemaphoreGuard permit(semaphore);
                               const auto start = Clock::now();
                               const auto deadline = start + bound;

                               std::vector<DeadlineTask<TimedProbe>> tasks;
                               tasks.reserve(runs.size());
                               for (const auto &run : runs)
                                   tasks.push_back(StartTimed(run, target));

                               for (std::size_t i = 0; i < tasks.size(); ++i)
                               {
                                   auto timed = tasks[i].WaitUntil(deadline);
                                   const bool hit = timed && timed->result;
                                   session.Attempt(runs[i].kind, timed ? timed->latency_ms : MillisecondsSince(start), hit);
                                   if (hit)
                                       session.EmitAndCollect(*timed->result);
                               }

                               session.Progress(target.address, static_cast<double>(done.fetch_add(1) + 1) / total);
                           } });
        }

        void RunBreadthFirst(ScanSession &session, const std::vector<ProbeRun> &runs,
                             const std::vector<ScanTarget> &targets, std::size_t workers,
                             std::chrono::milliseconds per_target)
        {
            BlockingTaskQueue queue;
            for (const auto &target : targets)
                queue.Push(target.address, target.segment, ClassifyPriority(target.address));

            std::mutex completed_mutex;
            std::set<std::string> completed;
            std::atomic<std::size_t> done{0};
            const double initial = static_cast<double>(targets.size());

            RunWorkers(std::max<std::size_t>(workers, 1), [&]()
                       {
                           while (auto task = queue.Pop())
                           {
                               if (session.Aborted())
                               {
                                   queue.Shutdown();
                                   queue.TaskDone();
                                   return;
                               }

                               {
                                   std::lock_guard<std::mutex> lock(completed_mutex);
                                   if (!completed.insert(task->address).second)
                                   {
                                       queue.TaskDone();
                                       continue;
                                   }
                               }

                               const ScanTarget target{task->address, task->segment};
                               const auto start = Clock::now();
                               const auto deadline = start + per_target;

                               std::vector<DeadlineTask<TimedProbe>> tasks;
                               tasks.reserve(runs.size());
                               for (const auto &run : runs)
                                   tasks.push_back(StartTimed(run, target));

                               std::vector<ProbeResult> found;
                               bool timed_out = false;
                               for (std::size_t i = 0; i < tasks.size(); ++i)
                               {
                                   auto timed = tasks[i].WaitUntil(deadline);
                                   if (!tasks[i].Finished())
                                       timed_out = true;
                                   const bool hit = timed && timed->result;
                                   session.Attempt(runs[i].kind, timed ? timed->latency_ms : MillisecondsSince(start), hit);
                                   if (hit)
                                       found.push_back(std::move(*timed->result));
                               }

                               // A target that hit the deadline counts as not detected this pass.
                               if (timed_out)
                               {
                                   Log(LogLevel::Debug, "Orchestrator") << target.address << " hit the per-target deadline";
                                   found.clear();
                               }

                               if (!found.empty())
                               {
                                   for (const auto &r : found)
                                       session.EmitAndCollect(r);

                                   std::vector<std::string> neighbors;
                                   {
                                       std::lock_guard<std::mutex> lock(completed_mutex);
                                       neighbors = NeighborsToEnqueue(target.address, completed);
                                   }
                                   for (const auto &n : neighbors)
                                       queue.Push(n, target.segment, ScanPriority::High);
                               }

                               session.Progress(target.address, static_cast<double>(done.fetch_add(1) + 1) / initial);
                               queue.TaskDone();
                           } });
        }
    }

    const char *ToString(ScanStrategy strategy)
    {
        switch (strategy)
        {
        case ScanStrategy::Sequential:
            return "sequential";
        case ScanStrategy::Parallel:
            return "parallel";
        case ScanStrategy::Smart:
            return "smart";
        case ScanStrategy::Turbo:
            return "turbo";
        case ScanStrategy::UltraFast:
            return "ultrafast";
        case ScanStrategy::BreadthFirst:
            return "bfs";
        }
        return "smart";
    }

    std::optional<ScanStrategy> ParseScanStrategy(std::string_view token)
    {
        for (auto strategy : {ScanStrategy::Sequential, ScanStrategy::Parallel, ScanStrategy::Smart,
                              ScanStrategy::Turbo, ScanStrategy::UltraFast, ScanStrategy::BreadthFirst})
        {
            if (token == ToString(strategy))
                return strategy;
        }
        if (token == "breadth-first")
            return ScanStrategy::BreadthFirst;
        if (token == "ultra-fast")
            return ScanStrategy::UltraFast;
        return std::nullopt;
    }

    const char *ToString(ScanStatus status)
    {
        return status == ScanStatus::Cancelled ? "cancelled" : "completed";
    }

    std::vector<std::string> NeighborsToEnqueue(const std::string &address, const std::set<std::string> &completed)
    {
        std::vector<std::string> out;
        for (auto &neighbor : common::NeighborAddresses(address, NEIGHBOR_RADIUS))
        {
            if (completed.find(neighbor) == completed.end())
                out.push_back(std::move(neighbor));
        }
        return out;
    }

    ScanOrchestrator::ScanOrchestrator()
    {
        const auto enabled = DefaultEnabled();
        for (const auto &info : AllProbeKinds())
        {
            ProbeConfig config = DefaultConfigFor(info.kind);
            config.enabled = enabled.at(info.kind);
            m_configs[info.kind] = config;
        }
    }

    void ScanOrchestrator::RegisterProbe(ProbeKind kind, ProbeFactory factory)
    {
        if (!factory)
            return;
        std::lock_guard<std::mutex> lock(m_mutex);
        m_factories[kind] = std::move(factory);
    }

    bool ScanOrchestrator::HasProbe(ProbeKind kind) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_factories.count(kind) > 0;
    }

    std::vector<ProbeKind> ScanOrchestrator::RegisteredKinds() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::vector<ProbeKind> kinds;
        for (const auto &entry : m_factories)
            kinds.push_back(entry.first);
        return kinds;
    }

    void ScanOrchestrator::SetProbeEnabled(ProbeKind kind, bool enabled)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configs[kind].enabled = enabled;
    }

    bool ScanOrchestrator::IsProbeEnabled(ProbeKind kind) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_configs.find(kind);
        return it != m_configs.end() && it->second.enabled;
    }

    EnabledMap ScanOrchestrator::EnabledProbes() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        EnabledMap map;
        for (const auto &[kind, config] : m_configs)
            map[kind] = config.enabled;
        return map;
    }

    void ScanOrchestrator::SetEnabledProbes(const EnabledMap &enabled)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto &[kind, on] : enabled)
            m_configs[kind].enabled = on;
    }

    void ScanOrchestrator::ApplyPreset(Preset preset, bool include_advanced)
    {
        Log(LogLevel::Debug, "Orchestrator") << "applying preset " << ToString(preset);
        SetEnabledProbes(MakePreset(preset, include_advanced));
    }

    ProbeConfig ScanOrchestrator::GetProbeConfig(ProbeKind kind) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_configs.find(kind);
        return it == m_configs.end() ? DefaultConfigFor(kind) : it->second;
    }

    void ScanOrchestrator::SetProbeConfig(ProbeKind kind, ProbeConfig config)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_configs[kind] = std::move(config);
    }

    void ScanOrchestrator::ResetProbeConfig()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (auto &entry : m_configs)
            entry.second.enabled = true;
    }

    std::map<ProbeKind, bool> ScanOrchestrator::CheckAvailability() const
    {
        std::map<ProbeKind, ProbeFactory> factories;
        std::map<ProbeKind, ProbeConfig> configs;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            factories = m_factories;
            configs = m_configs;
        }

        std::vector<std::pair<ProbeKind, DeadlineTask<bool>>> checks;
        for (const auto &[kind, factory] : factories)
        {
            auto probe = factory(configs[kind]);
            if (!probe)
                continue;
            checks.emplace_back(kind, DeadlineTask<bool>([probe]() -> std::optional<bool>
                                                         { return probe->IsAvailable(); }));
        }

        std::map<ProbeKind, bool> out;
        const auto deadline = Clock::now() + AVAILABILITY_BOUND;
        for (auto &[kind, check] : checks)
            out[kind] = check.WaitUntil(deadline).value_or(false);
        return out;
    }

    std::vector<ProbeDescription> ScanOrchestrator::DescribeProbes() const
    {
        std::map<ProbeKind, ProbeFactory> factories;
        std::map<ProbeKind, ProbeConfig> configs;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            factories = m_factories;
            configs = m_configs;
        }

        std::vector<ProbeDescription> out;
        for (const auto &[kind, factory] : factories)
        {
            auto probe = factory(configs[kind]);
            if (!probe)
                continue;
            ProbeDescription d;
            d.kind = kind;
            d.name = probe->Name();
            d.description = probe->Description();
            d.priority = probe->Priority();
            d.enabled = configs[kind].enabled;
            d.config = configs[kind];
            out.push_back(std::move(d));
        }
        return out;
    }

    std::map<ProbeKind, ProbeRecommendation> ScanOrchestrator::GetPerformanceRecommendations() const
    {
        return m_tracker.Recommendations();
    }

    NetworkAssessment ScanOrchestrator::AssessNetworkEnvironment() const
    {
        return m_tracker.Assess();
    }

    std::vector<ScanOrchestrator::BoundProbe> ScanOrchestrator::PrepareProbes(const ScanOptions &options,
                                                                             ScanReport &report) const
    {
        std::map<ProbeKind, ProbeFactory> factories;
        std::map<ProbeKind, ProbeConfig> configs;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            factories = m_factories;
            configs = m_configs;
        }

        for (const auto &[kind, config] : options.configs)
            configs[kind] = config;
        for (const auto &[kind, on] : options.enabled)
            configs[kind].enabled = on;

        std::vector<BoundProbe> bound;
        for (const auto &[kind, factory] : factories)
        {
            ProbeConfig config = configs.count(kind) ? configs[kind] : DefaultConfigFor(kind);
            if (!config.enabled)
                continue;
            if (options.strategy == ScanStrategy::UltraFast && !IsFastKind(kind))
                continue;

            if (options.strategy == ScanStrategy::Turbo)
            {
                config.request_delay = std::chrono::milliseconds(0);
            }
            else if (options.strategy == ScanStrategy::UltraFast)
            {
                auto bound_timeout = std::min(options.ultra_fast_timeout, std::chrono::milliseconds(ULTRA_FAST_MAX_TIMEOUT));
                config.timeout = std::min(config.timeout, bound_timeout);
                config.max_concurrency = options.ultra_fast_concurrency;
                config.request_delay = std::chrono::milliseconds(0);
            }

            auto probe = factory(config);
            if (!probe)
            {
                Log(LogLevel::Warn, "Orchestrator") << "factory for " << ToToken(kind) << " returned no probe";
                continue;
            }
            bound.push_back({kind, std::move(probe)});
        }

        if (bound.empty())
        {
            if (options.strategy == ScanStrategy::UltraFast)
                throw ScanConfigError("ultra-fast scanning needs the ICMP or TCP probe enabled");
            throw ScanConfigError("no probes are enabled");
        }

        if (!options.skip_unavailable)
            return bound;

        std::vector<DeadlineTask<bool>> checks;
        checks.reserve(bound.size());
        for (const auto &b : bound)
        {
            auto probe = b.probe;
            checks.emplace_back([probe]() -> std::optional<bool>
                                { return probe->IsAvailable(); });
        }

        std::vector<BoundProbe> usable;
        const auto deadline = Clock::now() + AVAILABILITY_BOUND;
        for (std::size_t i = 0; i < bound.size(); ++i)
        {
            if (checks[i].WaitUntil(deadline).value_or(false))
            {
                usable.push_back(bound[i]);
            }
            else
            {
                Log(LogLevel::Warn, "Orchestrator") << bound[i].probe->Name() << " is not available on this host, skipping";
                report.probes_skipped.push_back(bound[i].kind);
            }
        }

        if (usable.empty())
            throw ScanConfigError("none of the enabled probes is available on this host");
        return usable;
    }

    ScanReport ScanOrchestrator::Scan(const std::vector<std::string> &targets, const std::string &segment,
                                      const ScanOptions &options, const ScanCallbacks &callbacks)
    {
        const auto started = Clock::now();
        ScanReport report;
        report.strategy = options.strategy;

        if (targets.empty())
        {
            // Validate the configuration without touching the network.
            ScanOptions dry = options;
            dry.skip_unavailable = false;
            for (const auto &b : PrepareProbes(dry, report))
                report.probes_run.push_back(b.kind);
            return report;
        }

        auto bound = PrepareProbes(options, report);

        std::vector<ProbeRun> runs;
        for (const auto &b : bound)
        {
            runs.push_back({b.kind, b.probe});
            report.probes_run.push_back(b.kind);
        }

        const auto scan_targets = MakeTargets(targets, segment);
        ScanSession session(callbacks, m_tracker, options.abort);

        Log(LogLevel::Info, "Orchestrator") << ToString(options.strategy) << " scan of " << targets.size()
                                            << " targets with " << runs.size() << " probes";

        switch (options.strategy)
        {
        case ScanStrategy::Sequential:
            RunSequential(session, runs, scan_targets);
            break;
        case ScanStrategy::Parallel:
        case ScanStrategy::Turbo:
            RunProbesInParallel(session, runs, scan_targets, 0.0, 1.0);
            break;
        case ScanStrategy::Smart:
            RunSmart(session, runs, scan_targets);
            break;
        case ScanStrategy::UltraFast:
        {
            auto bound_timeout = std::min(options.ultra_fast_timeout, std::chrono::milliseconds(ULTRA_FAST_MAX_TIMEOUT));
            RunUltraFast(session, runs, scan_targets, bound_timeout, options.ultra_fast_concurrency);
            break;
        }
        case ScanStrategy::BreadthFirst:
            RunBreadthFirst(session, runs, scan_targets, options.bfs_workers, options.bfs_deadline);
            break;
        }

        // smart scans can end after phase 1 with progress still at 0.3
        if (!session.Aborted())
            session.Progress("", 1.0);

        report.results = session.TakeResults();
        report.status = session.Aborted() ? ScanStatus::Cancelled : ScanStatus::Completed;
        report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started);

        Log(LogLevel::Info, "Orchestrator") << "scan " << ToString(report.status) << ": " << report.results.size()
                                            << " results in " << report.elapsed.count() << " ms";
        return report;
    }
}
