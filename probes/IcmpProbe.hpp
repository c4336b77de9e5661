#pragma once

#include "../common/Subprocess.hpp"
#include "../engine/Probe.hpp"

#include <atomic>
#include <memory>

namespace net_scan::probes
{
    // ICMP echo. Raw socket through libtins first; once that fails for lack of
    // privilege the probe switches to the system ping utility for the rest of its life.
    class IcmpProbe : public engine::Probe
    {
    public:
        explicit IcmpProbe(engine::ProbeConfig config,
                           std::shared_ptr<common::CommandRunner> runner = common::DefaultCommandRunner());

        engine::ProbeKind Kind() const override { return engine::ProbeKind::Icmp; }
        std::string Name() const override { return "ICMP Ping"; }
        std::string Description() const override { return "ICMP echo request, falling back to the system ping utility"; }
        int Priority() const override { return 1; }

        bool IsAvailable() override;
        std::optional<engine::ProbeResult> ProbeOne(const engine::ScanTarget &target) override;

    private:
        std::shared_ptr<common::CommandRunner> m_runner;
        std::atomic<bool> m_raw_unavailable{false};
    };
}
