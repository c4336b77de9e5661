#pragma once

#include "AbortSignal.hpp"
#include "PerformanceTracker.hpp"
#include "Probe.hpp"
#include "ProbeTypes.hpp"
#include "ScanPresets.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace net_scan::engine
{
    enum class ScanStrategy
    {
        Sequential,
        Parallel,
        Smart,
        Turbo,
        UltraFast,
        BreadthFirst
    };

    const char *ToString(ScanStrategy strategy);
    std::optional<ScanStrategy> ParseScanStrategy(std::string_view token);

    // A scan cannot start: nothing enabled, or nothing usable.
    class ScanConfigError : public std::runtime_error
    {
    public:
        using std::runtime_error::runtime_error;
    };

    struct ScanOptions
    {
        ScanStrategy strategy = ScanStrategy::Smart;

        // Per-scan overrides. Kinds absent from the map keep the orchestrator's setting.
        std::map<ProbeKind, bool> enabled;
        std::map<ProbeKind, ProbeConfig> configs;

        std::size_t bfs_workers = 8;
        std::chrono::milliseconds bfs_deadline{2000};

        std::chrono::milliseconds ultra_fast_timeout{500};
        std::size_t ultra_fast_concurrency = 200;

        bool skip_unavailable = true;
        const AbortSignal *abort = nullptr;
    };

    struct ScanCallbacks
    {
        ProgressCallback on_progress;
        ResultCallback on_result;
    };

    enum class ScanStatus
    {
        Completed,
        Cancelled
    };

    const char *ToString(ScanStatus status);

    struct ScanReport
    {
        ScanStatus status = ScanStatus::Completed;
        ScanStrategy strategy = ScanStrategy::Smart;
        std::vector<ProbeResult> results;
        std::vector<ProbeKind> probes_run;
        std::vector<ProbeKind> probes_skipped; // enabled but unavailable
        std::chrono::milliseconds elapsed{0};
    };

    struct ProbeDescription
    {
        ProbeKind kind = ProbeKind::Icmp;
        std::string name;
        std::string description;
        int priority = 0;
        bool enabled = false;
        ProbeConfig config;
    };

    // Valid 1..254 neighbours within +-3 of address that are not in completed.
    std::vector<std::string> NeighborsToEnqueue(const std::string &address, const std::set<std::string> &completed);

    // Holds the registered probe factories, their configuration and the rolling
    // performance statistics. Every Scan() works on a snapshot of the
    // configuration and its own probe instances, so concurrent scans share only
    // the performance tracker.
    class ScanOrchestrator
    {
    public:
        ScanOrchestrator();

        void RegisterProbe(ProbeKind kind, ProbeFactory factory);
        bool HasProbe(ProbeKind kind) const;
        std::vector<ProbeKind> RegisteredKinds() const;

        void SetProbeEnabled(ProbeKind kind, bool enabled);
        bool IsProbeEnabled(ProbeKind kind) const;
        EnabledMap EnabledProbes() const;
        void SetEnabledProbes(const EnabledMap &enabled);
        void ApplyPreset(Preset preset, bool include_advanced = false);

        ProbeConfig GetProbeConfig(ProbeKind kind) const;
        void SetProbeConfig(ProbeKind kind, ProbeConfig config);

        // Enables every probe; tuning is left as is.
        void ResetProbeConfig();

        std::map<ProbeKind, bool> CheckAvailability() const;
        std::vector<ProbeDescription> DescribeProbes() const;

        std::map<ProbeKind, ProbeRecommendation> GetPerformanceRecommendations() const;
        NetworkAssessment AssessNetworkEnvironment() const;
        PerformanceTracker &Performance() { return m_tracker; }

        // Throws ScanConfigError when no enabled probe can run.
        ScanReport Scan(const std::vector<std::string> &targets, const std::string &segment,
                        const ScanOptions &options = {}, const ScanCallbacks &callbacks = {});

    private:
        struct BoundProbe
        {
            ProbeKind kind;
            std::shared_ptr<Probe> probe;
        };

        std::vector<BoundProbe> PrepareProbes(const ScanOptions &options, ScanReport &report) const;

        mutable std::mutex m_mutex;
        std::map<ProbeKind, ProbeFactory> m_factories;
        std::map<ProbeKind, ProbeConfig> m_configs;
        PerformanceTracker m_tracker;
    };
}
