#include "ProbeTypes.hpp"

#include <algorithm>
#include <cctype>

namespace net_scan::engine
{
    namespace
    {
        const std::array<ProbeKindInfo, 7> KIND_TABLE = {{
            {ProbeKind::Icmp, "icmp", "ICMP Ping"},
            {ProbeKind::Tcp, "tcp", "TCP Port Scan"},
            {ProbeKind::Arp, "arp", "ARP Table"},
            {ProbeKind::Mdns, "mdns", "mDNS/Bonjour"},
            {ProbeKind::Upnp, "upnp", "UPnP/SSDP"},
            {ProbeKind::ReverseDns, "dns", "Reverse DNS"},
            {ProbeKind::Ipv6, "ipv6", "IPv6 Discovery"},
        }};

        const ProbeKindInfo &Info(ProbeKind kind)
        {
            for (const auto &info : KIND_TABLE)
            {
                if (info.kind == kind)
                    return info;
            }
            return KIND_TABLE[0];
        }
    }

    const std::array<ProbeKindInfo, 7> &AllProbeKinds()
    {
        return KIND_TABLE;
    }

    const char *ToToken(ProbeKind kind)
    {
        return Info(kind).token;
    }

    const char *DisplayName(ProbeKind kind)
    {
        return Info(kind).display_name;
    }

    std::optional<ProbeKind> ParseProbeKind(std::string_view token)
    {
        std::string lowered(token);
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c)
                       { return static_cast<char>(std::tolower(c)); });

        for (const auto &info : KIND_TABLE)
        {
            if (lowered == info.token)
                return info.kind;
        }
        // accepted aliases
        if (lowered == "ping")
            return ProbeKind::Icmp;
        if (lowered == "bonjour")
            return ProbeKind::Mdns;
        if (lowered == "ssdp")
            return ProbeKind::Upnp;
        if (lowered == "rdns")
            return ProbeKind::ReverseDns;
        return std::nullopt;
    }

    ProbeResult MakeResult(const ScanTarget &target, ProbeKind kind, double latency_ms)
    {
        ProbeResult result;
        result.address = target.address;
        result.segment = target.segment;
        result.is_active = true;
        result.kind = kind;
        result.latency_ms = latency_ms;
        return result;
    }

    std::string ProbeConfig::Param(const std::string &key, const std::string &fallback) const
    {
        auto it = params.find(key);
        return it == params.end() ? fallback : it->second;
    }

    const char *ToString(ConfigProfile profile)
    {
        switch (profile)
        {
        case ConfigProfile::IcmpTurbo:
            return "icmp-turbo";
        case ConfigProfile::TcpTurbo:
            return "tcp-turbo";
        case ConfigProfile::HighPerformance:
            return "high-performance";
        case ConfigProfile::Standard:
            return "standard";
        case ConfigProfile::Conservative:
            return "conservative";
        }
        return "standard";
    }

    ProbeConfig MakeProfileConfig(ConfigProfile profile)
    {
        ProbeConfig config;
        switch (profile)
        {
        case ConfigProfile::IcmpTurbo:
            config.timeout = std::chrono::milliseconds(500);
            config.max_concurrency = 200;
            config.request_delay = std::chrono::milliseconds(0);
            break;
        case ConfigProfile::TcpTurbo:
            config.timeout = std::chrono::milliseconds(800);
            config.max_concurrency = 100;
            config.request_delay = std::chrono::milliseconds(0);
            break;
        case ConfigProfile::HighPerformance:
            config.timeout = std::chrono::milliseconds(1000);
            config.max_concurrency = 80;
            config.request_delay = std::chrono::milliseconds(5);
            break;
        case ConfigProfile::Standard:
            config.timeout = std::chrono::milliseconds(2000);
            config.max_concurrency = 50;
            config.request_delay = std::chrono::milliseconds(10);
            break;
        case ConfigProfile::Conservative:
            config.timeout = std::chrono::milliseconds(3000);
            config.max_concurrency = 30;
            config.request_delay = std::chrono::milliseconds(20);
            break;
        }
        return config;
    }

    ConfigProfile DefaultProfileFor(ProbeKind kind)
    {
        switch (kind)
        {
        case ProbeKind::Icmp:
            return ConfigProfile::IcmpTurbo;
        case ProbeKind::Tcp:
            return ConfigProfile::TcpTurbo;
        case ProbeKind::Arp:
        case ProbeKind::ReverseDns:
            return ConfigProfile::HighPerformance;
        case ProbeKind::Mdns:
            return ConfigProfile::Conservative;
        case ProbeKind::Upnp:
        case ProbeKind::Ipv6:
            return ConfigProfile::Standard;
        }
        return ConfigProfile::Standard;
    }

    ProbeConfig DefaultConfigFor(ProbeKind kind)
    {
        return MakeProfileConfig(DefaultProfileFor(kind));
    }
}
