#pragma once

#include "../engine/Probe.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace net_scan::probes
{
    // Well-known service ports, in sweep order.
    const std::vector<std::uint16_t> &DefaultTcpPorts();

    // "SSH", "HTTP", ... for the ports above.
    std::optional<std::string> TcpServiceName(std::uint16_t port);

    // "22,80, 443" -> {22, 80, 443}; malformed entries are dropped.
    std::vector<std::uint16_t> ParsePortList(const std::string &list);

    // Non-blocking connects to every port at once, polled together until the
    // deadline. Returns the ports that accepted.
    std::set<std::uint16_t> SweepPorts(const std::string &address, const std::vector<std::uint16_t> &ports,
                                       std::chrono::milliseconds timeout);

    // A target is active when any port accepts a connection. Ports 80 and 443
    // additionally get a GET / for the server banner.
    class TcpProbe : public engine::Probe
    {
    public:
        explicit TcpProbe(engine::ProbeConfig config);

        engine::ProbeKind Kind() const override { return engine::ProbeKind::Tcp; }
        std::string Name() const override { return "TCP Port Scan"; }
        std::string Description() const override { return "Connects to common service ports and captures HTTP banners"; }
        int Priority() const override { return 2; }

        bool IsAvailable() override;
        std::optional<engine::ProbeResult> ProbeOne(const engine::ScanTarget &target) override;

        const std::vector<std::uint16_t> &Ports() const { return m_ports; }

    private:
        std::vector<std::uint16_t> m_ports;
    };
}
