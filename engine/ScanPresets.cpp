#include "ScanPresets.hpp"

#include <initializer_list>
#include <string>

namespace net_scan::engine
{
    namespace
    {
        EnabledMap Only(std::initializer_list<ProbeKind> kinds)
        {
            EnabledMap map;
            for (const auto &info : AllProbeKinds())
                map[info.kind] = false;
            for (auto kind : kinds)
                map[kind] = true;
            return map;
        }
    }

    const char *ToString(Preset preset)
    {
        switch (preset)
        {
        case Preset::Quick:
            return "quick";
        case Preset::Recommended:
            return "recommended";
        case Preset::Full:
            return "full";
        case Preset::Speed:
            return "speed";
        case Preset::Comprehensive:
            return "comprehensive";
        }
        return "recommended";
    }

    std::optional<Preset> ParsePreset(std::string_view token)
    {
        for (auto preset : {Preset::Quick, Preset::Recommended, Preset::Full, Preset::Speed, Preset::Comprehensive})
        {
            if (token == ToString(preset))
                return preset;
        }
        return std::nullopt;
    }

    EnabledMap QuickPreset()
    {
        return Only({ProbeKind::Icmp, ProbeKind::Tcp});
    }

    EnabledMap RecommendedPreset()
    {
        return Only({ProbeKind::Icmp, ProbeKind::Tcp, ProbeKind::Arp, ProbeKind::Mdns, ProbeKind::ReverseDns});
    }

    EnabledMap FullPreset()
    {
        return Only({ProbeKind::Icmp, ProbeKind::Tcp, ProbeKind::Arp, ProbeKind::Mdns, ProbeKind::Upnp,
                     ProbeKind::ReverseDns, ProbeKind::Ipv6});
    }

    EnabledMap SpeedPreset()
    {
        return Only({ProbeKind::Icmp, ProbeKind::Tcp, ProbeKind::Arp});
    }

    EnabledMap ComprehensivePreset(bool include_advanced)
    {
        auto map = Only({ProbeKind::Icmp, ProbeKind::Tcp, ProbeKind::Arp, ProbeKind::ReverseDns});
        map[ProbeKind::Mdns] = include_advanced;
        map[ProbeKind::Upnp] = include_advanced;
        map[ProbeKind::Ipv6] = include_advanced;
        return map;
    }

    EnabledMap MakePreset(Preset preset, bool include_advanced)
    {
        switch (preset)
        {
        case Preset::Quick:
            return QuickPreset();
        case Preset::Recommended:
            return RecommendedPreset();
        case Preset::Full:
            return FullPreset();
        case Preset::Speed:
            return SpeedPreset();
        case Preset::Comprehensive:
            return ComprehensivePreset(include_advanced);
        }
        return RecommendedPreset();
    }

    EnabledMap DefaultEnabled()
    {
        return Only({ProbeKind::Icmp, ProbeKind::Tcp, ProbeKind::Arp, ProbeKind::ReverseDns});
    }
}
