#include "engine/ScanPresets.hpp"

#include <catch2/catch.hpp>

#include <set>

using namespace net_scan::engine;

namespace
{
    std::set<ProbeKind> EnabledKinds(const EnabledMap &map)
    {
        REQUIRE(map.size() == AllProbeKinds().size());
        std::set<ProbeKind> on;
        for (const auto &[kind, enabled] : map)
        {
            if (enabled)
                on.insert(kind);
        }
        return on;
    }
}

TEST_CASE("presets enable fixed probe sets", "[engine][presets]")
{
    REQUIRE(EnabledKinds(QuickPreset()) == std::set<ProbeKind>{ProbeKind::Icmp, ProbeKind::Tcp});
    REQUIRE(EnabledKinds(SpeedPreset()) == std::set<ProbeKind>{ProbeKind::Icmp, ProbeKind::Tcp, ProbeKind::Arp});
    REQUIRE(EnabledKinds(RecommendedPreset()) ==
            std::set<ProbeKind>{ProbeKind::Icmp, ProbeKind::Tcp, ProbeKind::Arp, ProbeKind::Mdns, ProbeKind::ReverseDns});
    REQUIRE(EnabledKinds(FullPreset()).size() == 7);
    REQUIRE(EnabledKinds(DefaultEnabled()) ==
            std::set<ProbeKind>{ProbeKind::Icmp, ProbeKind::Tcp, ProbeKind::Arp, ProbeKind::ReverseDns});
}

TEST_CASE("the comprehensive preset adds advanced probes on request", "[engine][presets]")
{
    auto basic = EnabledKinds(ComprehensivePreset(false));
    REQUIRE(basic == std::set<ProbeKind>{ProbeKind::Icmp, ProbeKind::Tcp, ProbeKind::Arp, ProbeKind::ReverseDns});

    auto advanced = EnabledKinds(ComprehensivePreset(true));
    REQUIRE(advanced.size() == 7);

    REQUIRE(EnabledKinds(MakePreset(Preset::Comprehensive, true)) == advanced);
}

TEST_CASE("preset names round-trip", "[engine][presets]")
{
    for (auto preset : {Preset::Quick, Preset::Recommended, Preset::Full, Preset::Speed, Preset::Comprehensive})
        REQUIRE(ParsePreset(ToString(preset)) == preset);
    REQUIRE_FALSE(ParsePreset("everything"));
}
