#pragma once

#include "ProbeTypes.hpp"

#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <vector>

namespace net_scan::engine
{
    struct PerformanceSample
    {
        double latency_ms = 0.0;
        bool success = false;
    };

    struct PerformanceStats
    {
        double mean_latency_ms = 0.0;
        double success_rate = 0.0; // 0..1
        std::size_t samples = 0;
    };

    enum class Recommendation
    {
        IncreaseConcurrency,
        DecreaseConcurrencyOrIncreaseTimeout,
        NoChange
    };

    const char *ToString(Recommendation recommendation);

    struct ProbeRecommendation
    {
        PerformanceStats stats;
        Recommendation recommendation = Recommendation::NoChange;
    };

    enum class NetworkQuality
    {
        Excellent,
        Good,
        Fair,
        Poor
    };

    const char *ToString(NetworkQuality quality);

    struct NetworkAssessment
    {
        NetworkQuality quality = NetworkQuality::Poor;
        double mean_latency_ms = 0.0;
        double success_rate = 0.0;
        std::size_t total_samples = 0;
        std::map<ProbeKind, ProbeRecommendation> per_probe;
    };

    Recommendation Recommend(const PerformanceStats &stats);
    NetworkQuality ClassifyQuality(double success_rate, double mean_latency_ms);

    // Sliding window of the last WINDOW_SIZE attempts per probe kind.
    class PerformanceTracker
    {
    public:
        static constexpr std::size_t WINDOW_SIZE = 100;

        void Record(ProbeKind kind, double latency_ms, bool success);

        PerformanceStats Stats(ProbeKind kind) const;

        // Oldest first.
        std::vector<PerformanceSample> Window(ProbeKind kind) const;

        // Only kinds with at least one sample are reported.
        std::map<ProbeKind, ProbeRecommendation> Recommendations() const;

        NetworkAssessment Assess() const;

        void Reset();

    private:
        static PerformanceStats Summarize(const std::deque<PerformanceSample> &window);

        mutable std::mutex m_mutex;
        std::map<ProbeKind, std::deque<PerformanceSample>> m_windows;
    };
}
