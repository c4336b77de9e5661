#include "engine/ProbeTypes.hpp"

#include <catch2/catch.hpp>

#include <set>

using namespace net_scan::engine;

TEST_CASE("every probe kind has a unique token", "[engine][types]")
{
    std::set<std::string> tokens;
    for (const auto &info : AllProbeKinds())
    {
        REQUIRE(tokens.insert(info.token).second);
        REQUIRE(ParseProbeKind(info.token) == info.kind);
        REQUIRE(std::string(DisplayName(info.kind)) == info.display_name);
    }
    REQUIRE(tokens.size() == 7);
}

TEST_CASE("probe tokens parse case-insensitively with aliases", "[engine][types]")
{
    REQUIRE(ParseProbeKind("ICMP") == ProbeKind::Icmp);
    REQUIRE(ParseProbeKind("ping") == ProbeKind::Icmp);
    REQUIRE(ParseProbeKind("bonjour") == ProbeKind::Mdns);
    REQUIRE(ParseProbeKind("ssdp") == ProbeKind::Upnp);
    REQUIRE(ParseProbeKind("dns") == ProbeKind::ReverseDns);
    REQUIRE(ParseProbeKind("rdns") == ProbeKind::ReverseDns);
    REQUIRE_FALSE(ParseProbeKind("snmp"));
    REQUIRE(std::string(ToToken(ProbeKind::Ipv6)) == "ipv6");
}

TEST_CASE("configuration profiles", "[engine][types]")
{
    auto icmp = MakeProfileConfig(ConfigProfile::IcmpTurbo);
    REQUIRE(icmp.timeout == std::chrono::milliseconds(500));
    REQUIRE(icmp.max_concurrency == 200);
    REQUIRE(icmp.request_delay.count() == 0);

    auto tcp = MakeProfileConfig(ConfigProfile::TcpTurbo);
    REQUIRE(tcp.timeout == std::chrono::milliseconds(800));
    REQUIRE(tcp.max_concurrency == 100);

    auto fast = MakeProfileConfig(ConfigProfile::HighPerformance);
    REQUIRE(fast.timeout == std::chrono::milliseconds(1000));
    REQUIRE(fast.max_concurrency == 80);
    REQUIRE(fast.request_delay == std::chrono::milliseconds(5));

    auto standard = MakeProfileConfig(ConfigProfile::Standard);
    REQUIRE(standard.timeout == std::chrono::milliseconds(2000));
    REQUIRE(standard.max_concurrency == 50);
    REQUIRE(standard.request_delay == std::chrono::milliseconds(10));

    auto conservative = MakeProfileConfig(ConfigProfile::Conservative);
    REQUIRE(conservative.timeout == std::chrono::milliseconds(3000));
    REQUIRE(conservative.max_concurrency == 30);
    REQUIRE(conservative.request_delay == std::chrono::milliseconds(20));
}

TEST_CASE("default profiles per probe kind", "[engine][types]")
{
    REQUIRE(DefaultProfileFor(ProbeKind::Icmp) == ConfigProfile::IcmpTurbo);
    REQUIRE(DefaultProfileFor(ProbeKind::Tcp) == ConfigProfile::TcpTurbo);
    REQUIRE(DefaultProfileFor(ProbeKind::Arp) == ConfigProfile::HighPerformance);
    REQUIRE(DefaultProfileFor(ProbeKind::ReverseDns) == ConfigProfile::HighPerformance);
    REQUIRE(DefaultProfileFor(ProbeKind::Mdns) == ConfigProfile::Conservative);
    REQUIRE(DefaultProfileFor(ProbeKind::Upnp) == ConfigProfile::Standard);
    REQUIRE(DefaultProfileFor(ProbeKind::Ipv6) == ConfigProfile::Standard);
    REQUIRE(DefaultConfigFor(ProbeKind::Mdns).timeout == std::chrono::milliseconds(3000));
}

TEST_CASE("results carry the target and probe", "[engine][types]")
{
    auto result = MakeResult({"10.0.0.4", "office"}, ProbeKind::Arp, 3.5);
    REQUIRE(result.address == "10.0.0.4");
    REQUIRE(result.segment == "office");
    REQUIRE(result.is_active);
    REQUIRE(result.kind == ProbeKind::Arp);
    REQUIRE(result.latency_ms == Approx(3.5));
    REQUIRE_FALSE(result.hostname);
    REQUIRE(result.open_ports.empty());

    ProbeConfig config;
    config.params["ports"] = "22,80";
    REQUIRE(config.Param("ports") == "22,80");
    REQUIRE(config.Param("missing", "x") == "x");
}
