#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace net_scan::common
{
    bool IsIpv4(const std::string &address);
    bool IsIpv6(const std::string &address);

    std::optional<std::uint32_t> Ipv4ToInt(const std::string &address);
    std::string IntToIpv4(std::uint32_t value);

    // Last dotted octet of an IPv4 literal.
    std::optional<int> LastOctet(const std::string &address);

    // "a.b.c" prefix of an IPv4 literal.
    std::optional<std::string> Ipv4Prefix24(const std::string &address);

    // Addresses a.b.c.(o-radius .. o+radius) within 1..254, excluding the address itself.
    std::vector<std::string> NeighborAddresses(const std::string &address, int radius);

    // Expands "10.0.0.0/24" into its host addresses (network/broadcast excluded for prefixes < 31).
    // A plain address expands to itself. Prefixes shorter than /16 are rejected.
    std::optional<std::vector<std::string>> ExpandTargetSpec(const std::string &spec);
}
