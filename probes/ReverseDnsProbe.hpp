#pragma once

#include "../common/Subprocess.hpp"
#include "../engine/Probe.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace net_scan::probes
{
    // "router.home.lan" -> "home.lan"; single-label names are returned unchanged.
    std::string ExtractDomain(const std::string &hostname);

    // Substring heuristics over the lowercased name; "Unknown Device" when nothing matches.
    std::string ClassifyHostname(const std::string &hostname);

    // .local .lan .home .internal .private .localdomain
    bool IsLocalDomain(const std::string &hostname);

    // PTR name of address: the system resolver first, then nslookup, then dig.
    // Every stage shares the timeout.
    std::optional<std::string> ResolveHostname(common::CommandRunner &runner, const std::string &address,
                                               std::chrono::milliseconds timeout);

    class ReverseDnsProbe : public engine::Probe
    {
    public:
        explicit ReverseDnsProbe(engine::ProbeConfig config,
                                 std::shared_ptr<common::CommandRunner> runner = common::DefaultCommandRunner());

        engine::ProbeKind Kind() const override { return engine::ProbeKind::ReverseDns; }
        std::string Name() const override { return "Reverse DNS"; }
        std::string Description() const override { return "Resolves PTR names and classifies devices by hostname"; }
        int Priority() const override { return 2; }

        bool IsAvailable() override;
        std::optional<engine::ProbeResult> ProbeOne(const engine::ScanTarget &target) override;

    private:
        std::shared_ptr<common::CommandRunner> m_runner;
    };
}
