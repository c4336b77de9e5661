#pragma once

#include "AbortSignal.hpp"
#include "ProbeTypes.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace net_scan::engine
{
    using ProgressCallback = std::function<void(const std::string &address, double fraction)>;
    using ResultCallback = std::function<void(const ProbeResult &result)>;
    using AttemptCallback = std::function<void(ProbeKind kind, double latency_ms, bool success)>;

    struct BatchCallbacks
    {
        ProgressCallback on_progress;
        ResultCallback on_result;
        AttemptCallback on_attempt;
        const AbortSignal *abort = nullptr;

        bool Aborted() const { return abort && abort->IsRaised(); }
    };

    // One network-discovery technique. A probe is bound to one ProbeConfig for
    // its lifetime; the orchestrator builds fresh instances for every scan.
    class Probe
    {
    public:
        explicit Probe(ProbeConfig config) : m_config(std::move(config)) {}
        virtual ~Probe() = default;

        Probe(const Probe &) = delete;
        Probe &operator=(const Probe &) = delete;

        virtual ProbeKind Kind() const = 0;
        virtual std::string Name() const = 0;
        virtual std::string Description() const = 0;

        // Smaller runs earlier in sequential scans.
        virtual int Priority() const = 0;

        // Advisory capability check. Must not throw and must return within ~2s.
        virtual bool IsAvailable() = 0;

        // Bounded by the configured timeout. Every failure degrades to nullopt.
        virtual std::optional<ProbeResult> ProbeOne(const ScanTarget &target) = 0;

        // Runs ProbeOne over the targets through a semaphore of max_concurrency,
        // sleeping request_delay before each request. Progress is completed/total.
        virtual std::vector<ProbeResult> ProbeBatch(const std::vector<ScanTarget> &targets,
                                                    const BatchCallbacks &callbacks);

        const ProbeConfig &Config() const { return m_config; }

    protected:
        // Serializes the caller's callbacks and keeps progress non-decreasing.
        class BatchReporter
        {
        public:
            BatchReporter(const BatchCallbacks &callbacks, ProbeKind kind, std::size_t total);

            void Attempt(double latency_ms, bool success);
            void Result(const ProbeResult &result);
            void Completed(const std::string &address);
            void Progress(const std::string &address, double fraction);

        private:
            const BatchCallbacks &m_callbacks;
            ProbeKind m_kind;
            std::size_t m_total;
            std::size_t m_completed = 0;
            double m_last_fraction = 0.0;
            std::mutex m_mutex;
        };

        // ProbeOne wrapped so that a stray exception becomes "no result".
        std::optional<ProbeResult> SafeProbeOne(const ScanTarget &target);

        // Calls fn for every target on up to max_concurrency workers (one when
        // `parallel` is off), admitting each call through a semaphore and sleeping
        // request_delay first. Stops admitting once the abort signal is raised.
        void ForEachTarget(const std::vector<ScanTarget> &targets, const BatchCallbacks &callbacks,
                           const std::function<void(const ScanTarget &)> &fn);

        ProbeConfig m_config;
    };

    using ProbeFactory = std::function<std::shared_ptr<Probe>(const ProbeConfig &config)>;

    std::vector<ScanTarget> MakeTargets(const std::vector<std::string> &addresses, const std::string &segment);
}
