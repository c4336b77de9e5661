#pragma once

#include "ProbeTypes.hpp"

#include <map>
#include <optional>
#include <string_view>

namespace net_scan::engine
{
    using EnabledMap = std::map<ProbeKind, bool>;

    enum class Preset
    {
        Quick,
        Recommended,
        Full,
        Speed,
        Comprehensive
    };

    const char *ToString(Preset preset);
    std::optional<Preset> ParsePreset(std::string_view token);

    // Every kind appears in the returned map.
    EnabledMap QuickPreset();
    EnabledMap RecommendedPreset();
    EnabledMap FullPreset();
    EnabledMap SpeedPreset();
    EnabledMap ComprehensivePreset(bool include_advanced);

    EnabledMap MakePreset(Preset preset, bool include_advanced = false);

    // ICMP, TCP, ARP and reverse DNS.
    EnabledMap DefaultEnabled();
}
