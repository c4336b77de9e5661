#include "PerformanceTracker.hpp"

namespace net_scan::engine
{
    const char *ToString(Recommendation recommendation)
    {
        switch (recommendation)
        {
        case Recommendation::IncreaseConcurrency:
            return "performing well, concurrency can be increased";
        case Recommendation::DecreaseConcurrencyOrIncreaseTimeout:
            return "performing poorly, decrease concurrency or increase timeout";
        case Recommendation::NoChange:
            return "performance normal, no change";
        }
        return "performance normal, no change";
    }

    const char *ToString(NetworkQuality quality)
    {
        switch (quality)
        {
        case NetworkQuality::Excellent:
            return "excellent";
        case NetworkQuality::Good:
            return "good";
        case NetworkQuality::Fair:
            return "fair";
        case NetworkQuality::Poor:
            return "poor";
        }
        return "poor";
    }

    Recommendation Recommend(const PerformanceStats &stats)
    {
        if (stats.success_rate > 0.9 && stats.mean_latency_ms < 300.0)
            return Recommendation::IncreaseConcurrency;
        if (stats.success_rate < 0.5 || stats.mean_latency_ms > 2000.0)
            return Recommendation::DecreaseConcurrencyOrIncreaseTimeout;
        return Recommendation::NoChange;
    }

    NetworkQuality ClassifyQuality(double success_rate, double mean_latency_ms)
    {
        if (success_rate > 0.9 && mean_latency_ms < 200.0)
            return NetworkQuality::Excellent;
        if (success_rate > 0.8 && mean_latency_ms < 500.0)
            return NetworkQuality::Good;
        if (success_rate > 0.6 && mean_latency_ms < 1000.0)
            return NetworkQuality::Fair;
        return NetworkQuality::Poor;
    }

    void PerformanceTracker::Record(ProbeKind kind, double latency_ms, bool success)
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto &window = m_windows[kind];
        window.push_back({latency_ms, success});
        while (window.size() > WINDOW_SIZE)
            window.pop_front();
    }

    PerformanceStats PerformanceTracker::Summarize(const std::deque<PerformanceSample> &window)
    {
        PerformanceStats stats;
        stats.samples = window.size();
        if (window.empty())
            return stats;

        double latency_sum = 0.0;
        std::size_t successes = 0;
        for (const auto &sample : window)
        {
            latency_sum += sample.latency_ms;
            if (sample.success)
                ++successes;
        }
        stats.mean_latency_ms = latency_sum / static_cast<double>(window.size());
        stats.success_rate = static_cast<double>(successes) / static_cast<double>(window.size());
        return stats;
    }

    PerformanceStats PerformanceTracker::Stats(ProbeKind kind) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_windows.find(kind);
        if (it == m_windows.end())
            return {};
        return Summarize(it->second);
    }

    std::vector<PerformanceSample> PerformanceTracker::Window(ProbeKind kind) const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = m_windows.find(kind);
        if (it == m_windows.end())
            return {};
        return {it->second.begin(), it->second.end()};
    }

    std::map<ProbeKind, ProbeRecommendation> PerformanceTracker::Recommendations() const
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        std::map<ProbeKind, ProbeRecommendation> out;
        for (const auto &[kind, window] : m_windows)
        {
            if (window.empty())
                continue;
            ProbeRecommendation rec;
            rec.stats = Summarize(window);
            rec.recommendation = Recommend(rec.stats);
            out[kind] = rec;
        }
        return out;
    }

    NetworkAssessment PerformanceTracker::Assess() const
    {
        NetworkAssessment assessment;
        assessment.per_probe = Recommendations();

        double latency = 0.0;
        double success = 0.0;
        std::size_t total = 0;
        for (const auto &[kind, rec] : assessment.per_probe)
        {
            const auto n = static_cast<double>(rec.stats.samples);
            latency += rec.stats.mean_latency_ms * n;
            success += rec.stats.success_rate * n;
            total += rec.stats.samples;
        }

        assessment.total_samples = total;
        if (total == 0)
        {
            assessment.quality = NetworkQuality::Poor;
            return assessment;
        }

        assessment.mean_latency_ms = latency / static_cast<double>(total);
        assessment.success_rate = success / static_cast<double>(total);
        assessment.quality = ClassifyQuality(assessment.success_rate, assessment.mean_latency_ms);
        return assessment;
    }

    void PerformanceTracker::Reset()
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_windows.clear();
    }
}
