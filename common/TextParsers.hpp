#pragma once

#include <optional>
#include <string>
#include <vector>

// Parsers for the text output of system utilities. They do no I/O.

namespace net_scan::common::parsers
{
    struct PingReply
    {
        std::optional<double> latency_ms;
        std::optional<int> ttl;
    };

    struct ArpEntry
    {
        std::string ip;
        std::string mac; // lowercase, zero-padded "aa:bb:cc:dd:ee:ff"
        std::string interface;
        std::string status; // "dynamic", "permanent", "static"
    };

    struct NeighborEntry
    {
        std::string address;
        std::string mac;
        std::string interface;
        std::string state;
    };

    // "64 bytes from 10.0.0.1: icmp_seq=1 ttl=64 time=0.512 ms"
    PingReply ParsePingOutput(const std::string &output);

    // /proc/net/arp; incomplete entries (flags 0x0 or all-zero MAC) are skipped.
    std::vector<ArpEntry> ParseProcNetArp(const std::string &text);

    // `arp -an` in either Linux net-tools or BSD/macOS form.
    std::vector<ArpEntry> ParseArpCommandOutput(const std::string &text);

    // Hostname from `nslookup <ip>`; trailing dot removed.
    std::optional<std::string> ParseNslookupOutput(const std::string &output);

    // First line of `dig -x <ip> +short`; trailing dot removed.
    std::optional<std::string> ParseDigShortOutput(const std::string &output);

    // `ip -6 neigh show`: "fe80::1 dev eth0 lladdr aa:bb:cc:dd:ee:ff router REACHABLE"
    std::vector<NeighborEntry> ParseIpNeighOutput(const std::string &text);

    // `ndp -an` (BSD/macOS): "fe80::1%en0  aa:bb:cc:dd:ee:ff en0 23h59m58s S R"
    std::vector<NeighborEntry> ParseNdpOutput(const std::string &text);

    // Normalizes "0:1b:63:a:b:c" or "00-1B-63-0A-0B-0C" to "00:1b:63:0a:0b:0c". nullopt if not a MAC.
    std::optional<std::string> NormalizeMac(const std::string &raw);
}
