#pragma once

#include "../common/Subprocess.hpp"
#include "../common/TextParsers.hpp"
#include "../engine/Probe.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace net_scan::probes
{
    // An on-link /64 of this host, rendered with a trailing "::" ("2001:db8:1:2::").
    struct LocalPrefix
    {
        std::string prefix;
        std::string interface;
        bool link_local = false;
    };

    // Non-loopback IPv6 /64 prefixes from getifaddrs, deduplicated.
    std::vector<LocalPrefix> LocalIpv6Prefixes();

    // prefix::<hex last octet>, prefix::<o3>.<o4> and prefix::<a.b.c.d> for every prefix.
    // Link-local candidates carry the interface as zone ("fe80::a%eth0"). Only
    // syntactically valid addresses are returned.
    std::vector<std::string> PredictIpv6Candidates(const std::string &ipv4, const std::vector<LocalPrefix> &prefixes);

    // fe80:: + modified EUI-64 interface identifier of mac. nullopt for a malformed MAC.
    std::optional<std::string> Eui64LinkLocal(const std::string &mac);

    bool IsLinkLocalIpv6(const std::string &address);

    // Not link-local, not unique-local (fc00::/7), not loopback.
    bool IsGlobalUnicastIpv6(const std::string &address);

    // Finds the IPv6 addresses of an IPv4 host and checks a few services over them.
    //
    // params: "arp_table" path of the kernel ARP table used to learn the target's MAC
    class Ipv6Probe : public engine::Probe
    {
    public:
        explicit Ipv6Probe(engine::ProbeConfig config,
                           std::shared_ptr<common::CommandRunner> runner = common::DefaultCommandRunner());

        engine::ProbeKind Kind() const override { return engine::ProbeKind::Ipv6; }
        std::string Name() const override { return "IPv6 Discovery"; }
        std::string Description() const override { return "Discovers IPv6 addresses via neighbour tables, AAAA records and prefix prediction"; }
        int Priority() const override { return 2; }

        bool IsAvailable() override;
        std::optional<engine::ProbeResult> ProbeOne(const engine::ScanTarget &target) override;

    private:
        std::optional<common::parsers::ArpEntry> ArpEntryOf(const std::string &ipv4);
        std::vector<std::string> NeighborCandidates(const std::string &mac, std::chrono::steady_clock::time_point deadline);
        std::vector<std::string> Candidates(const engine::ScanTarget &target, std::chrono::steady_clock::time_point deadline,
                                            std::optional<std::string> &hostname);

        std::shared_ptr<common::CommandRunner> m_runner;
        std::string m_arp_table;
    };
}
