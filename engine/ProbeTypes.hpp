#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>

namespace net_scan::engine
{
    enum class ProbeKind
    {
        Icmp,
        Tcp,
        Arp,
        Mdns,
        Upnp,
        ReverseDns,
        Ipv6
    };

    struct ProbeKindInfo
    {
        ProbeKind kind;
        const char *token;        // stable CLI / log token
        const char *display_name;
    };

    const std::array<ProbeKindInfo, 7> &AllProbeKinds();

    const char *ToToken(ProbeKind kind);
    const char *DisplayName(ProbeKind kind);
    std::optional<ProbeKind> ParseProbeKind(std::string_view token);

    struct ScanTarget
    {
        std::string address;
        std::string segment;
    };

    // Produced only for a target the probe positively confirmed.
    struct ProbeResult
    {
        std::string address;
        std::string segment;
        bool is_active = true;
        double latency_ms = 0.0;
        ProbeKind kind = ProbeKind::Icmp;
        std::optional<std::string> hostname;
        std::optional<std::string> mac;
        std::set<std::uint16_t> open_ports;
        std::map<std::string, std::string> metadata;
    };

    ProbeResult MakeResult(const ScanTarget &target, ProbeKind kind, double latency_ms);

    struct ProbeConfig
    {
        std::chrono::milliseconds timeout{2000};
        std::size_t max_concurrency = 50;
        bool enabled = true;
        std::chrono::milliseconds request_delay{10};
        bool parallel = true;
        std::map<std::string, std::string> params;

        std::string Param(const std::string &key, const std::string &fallback = "") const;
    };

    enum class ConfigProfile
    {
        IcmpTurbo,
        TcpTurbo,
        HighPerformance,
        Standard,
        Conservative
    };

    const char *ToString(ConfigProfile profile);

    ProbeConfig MakeProfileConfig(ConfigProfile profile);
    ConfigProfile DefaultProfileFor(ProbeKind kind);
    ProbeConfig DefaultConfigFor(ProbeKind kind);
}
