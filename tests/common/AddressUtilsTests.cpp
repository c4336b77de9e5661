#include "common/AddressUtils.hpp"

#include <catch2/catch.hpp>

using namespace net_scan::common;

TEST_CASE("address literals are classified by family", "[common][address]")
{
    REQUIRE(IsIpv4("192.168.1.10"));
    REQUIRE_FALSE(IsIpv4("192.168.1.300"));
    REQUIRE_FALSE(IsIpv4("fe80::1"));

    REQUIRE(IsIpv6("fe80::1"));
    REQUIRE(IsIpv6("fe80::1%eth0"));
    REQUIRE(IsIpv6("2001:db8::10"));
    REQUIRE_FALSE(IsIpv6("10.0.0.1"));
    REQUIRE_FALSE(IsIpv6("printer.lan"));
}

TEST_CASE("IPv4 integer conversion keeps host order", "[common][address]")
{
    auto value = Ipv4ToInt("10.0.1.2");
    REQUIRE(value);
    REQUIRE(*value == 0x0A000102u);
    REQUIRE(IntToIpv4(0xC0A80101u) == "192.168.1.1");
    REQUIRE_FALSE(Ipv4ToInt("not-an-address"));
}

TEST_CASE("last octet and /24 prefix", "[common][address]")
{
    REQUIRE(LastOctet("172.16.5.42") == 42);
    REQUIRE(Ipv4Prefix24("172.16.5.42") == std::string("172.16.5"));
    REQUIRE_FALSE(LastOctet("fe80::1"));
    REQUIRE_FALSE(Ipv4Prefix24("fe80::1"));
}

TEST_CASE("neighbour addresses stay within 1..254", "[common][address]")
{
    auto middle = NeighborAddresses("192.168.1.10", 3);
    REQUIRE(middle == std::vector<std::string>{"192.168.1.7", "192.168.1.8", "192.168.1.9",
                                               "192.168.1.11", "192.168.1.12", "192.168.1.13"});

    auto low = NeighborAddresses("192.168.1.2", 3);
    REQUIRE(low == std::vector<std::string>{"192.168.1.1", "192.168.1.3", "192.168.1.4", "192.168.1.5"});

    auto high = NeighborAddresses("192.168.1.253", 3);
    REQUIRE(high == std::vector<std::string>{"192.168.1.250", "192.168.1.251", "192.168.1.252", "192.168.1.254"});

    REQUIRE(NeighborAddresses("fe80::1", 3).empty());
}

TEST_CASE("target specs expand to host addresses", "[common][address]")
{
    SECTION("plain addresses expand to themselves")
    {
        REQUIRE(ExpandTargetSpec("10.0.0.5") == std::vector<std::string>{"10.0.0.5"});
        REQUIRE(ExpandTargetSpec("fe80::1") == std::vector<std::string>{"fe80::1"});
    }

    SECTION("a /30 drops network and broadcast")
    {
        REQUIRE(ExpandTargetSpec("10.0.0.0/30") == std::vector<std::string>{"10.0.0.1", "10.0.0.2"});
    }

    SECTION("/31 and /32 keep every address")
    {
        REQUIRE(ExpandTargetSpec("10.0.0.4/31") == std::vector<std::string>{"10.0.0.4", "10.0.0.5"});
        REQUIRE(ExpandTargetSpec("10.0.0.9/32") == std::vector<std::string>{"10.0.0.9"});
    }

    SECTION("host bits in the base are masked off")
    {
        auto hosts = ExpandTargetSpec("192.168.7.77/24");
        REQUIRE(hosts);
        REQUIRE(hosts->size() == 254);
        REQUIRE(hosts->front() == "192.168.7.1");
        REQUIRE(hosts->back() == "192.168.7.254");
    }

    SECTION("malformed or oversized blocks are rejected")
    {
        REQUIRE_FALSE(ExpandTargetSpec("10.0.0.0/8"));
        REQUIRE_FALSE(ExpandTargetSpec("10.0.0.0/33"));
        REQUIRE_FALSE(ExpandTargetSpec("10.0.0.0/abc"));
        REQUIRE_FALSE(ExpandTargetSpec("router.lan"));
    }
}
