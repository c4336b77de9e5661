#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace net_scan::common::dns
{
    inline constexpr std::uint16_t TYPE_A = 1;
    inline constexpr std::uint16_t TYPE_PTR = 12;
    inline constexpr std::uint16_t TYPE_TXT = 16;
    inline constexpr std::uint16_t TYPE_AAAA = 28;
    inline constexpr std::uint16_t TYPE_SRV = 33;
    inline constexpr std::uint16_t CLASS_IN = 1;
    inline constexpr std::uint16_t CLASS_UNICAST_RESPONSE = 0x8000;

    inline constexpr std::size_t HEADER_SIZE = 12;

    struct Question
    {
        std::string name;
        std::uint16_t type = 0;
        std::uint16_t klass = CLASS_IN;
    };

    // Decoded resource record. Only the rdata fields matching `type` are filled.
    struct ResourceRecord
    {
        std::string name;
        std::uint16_t type = 0;
        std::uint16_t klass = 0;
        std::uint32_t ttl = 0;

        std::string target;  // PTR domain, SRV target
        std::string address; // A / AAAA textual form
        std::uint16_t priority = 0;
        std::uint16_t weight = 0;
        std::uint16_t port = 0;
        std::vector<std::string> txt;
    };

    struct Message
    {
        std::uint16_t id = 0;
        std::uint16_t flags = 0;
        std::vector<Question> questions;
        std::vector<ResourceRecord> answers;
        std::vector<ResourceRecord> authorities;
        std::vector<ResourceRecord> additionals;

        bool IsResponse() const { return (flags & 0x8000) != 0; }

        // answers + authorities + additionals, in wire order
        std::vector<ResourceRecord> AllRecords() const;
    };

    // Builds a query message with one question per entry. Returns empty on an invalid name.
    std::vector<std::uint8_t> EncodeQuery(std::uint16_t id, const std::vector<Question> &questions,
                                          bool recursion_desired = false);

    // Parses a DNS message (RFC 1035) including compressed names. nullopt on any truncation.
    std::optional<Message> DecodeMessage(const std::vector<std::uint8_t> &packet);

    // Reads a possibly compressed name starting at offset; advances offset past it.
    std::optional<std::string> ReadName(const std::vector<std::uint8_t> &packet, std::size_t &offset);

    // Lowercase, no trailing dot.
    std::string CanonicalName(const std::string &name);

    // "192.168.1.10" -> "10.1.168.192.in-addr.arpa"
    std::string ReverseLookupName(const std::string &ipv4);
}
