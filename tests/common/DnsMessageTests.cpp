#include "common/DnsMessage.hpp"

#include <catch2/catch.hpp>

using namespace net_scan::common;

namespace
{
    void Append(std::vector<std::uint8_t> &out, std::initializer_list<int> bytes)
    {
        for (int b : bytes)
            out.push_back(static_cast<std::uint8_t>(b));
    }

    void AppendName(std::vector<std::uint8_t> &out, std::initializer_list<const char *> labels)
    {
        for (const char *label : labels)
        {
            std::string s(label);
            out.push_back(static_cast<std::uint8_t>(s.size()));
            out.insert(out.end(), s.begin(), s.end());
        }
        out.push_back(0);
    }
}

TEST_CASE("queries are encoded with the standard header", "[common][dns]")
{
    auto packet = dns::EncodeQuery(0x1234, {{"_http._tcp.local", dns::TYPE_PTR, dns::CLASS_IN}}, true);

    std::vector<std::uint8_t> expected;
    Append(expected, {0x12, 0x34, 0x01, 0x00, 0x00, 0x01, 0, 0, 0, 0, 0, 0});
    AppendName(expected, {"_http", "_tcp", "local"});
    Append(expected, {0x00, 0x0C, 0x00, 0x01});

    REQUIRE(packet == expected);
}

TEST_CASE("query without recursion has zero flags", "[common][dns]")
{
    auto packet = dns::EncodeQuery(7, {{"a.local", dns::TYPE_A, dns::CLASS_IN | dns::CLASS_UNICAST_RESPONSE}});
    REQUIRE(packet.size() > dns::HEADER_SIZE);
    REQUIRE(packet[2] == 0);
    REQUIRE(packet[3] == 0);
    // QU bit carried in the class field
    REQUIRE(packet[packet.size() - 2] == 0x80);
    REQUIRE(packet[packet.size() - 1] == 0x01);
}

TEST_CASE("an oversized label makes the query empty", "[common][dns]")
{
    std::string label(64, 'x');
    REQUIRE(dns::EncodeQuery(1, {{label + ".local", dns::TYPE_A, dns::CLASS_IN}}).empty());
}

TEST_CASE("responses decode with compressed names", "[common][dns]")
{
    std::vector<std::uint8_t> packet;
    // header: id 0, response + authoritative, 0 questions, 3 answers
    Append(packet, {0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x03, 0x00, 0x00, 0x00, 0x00});

    // PTR _http._tcp.local -> Printer._http._tcp.local
    const std::size_t service_offset = packet.size();
    AppendName(packet, {"_http", "_tcp", "local"});
    Append(packet, {0x00, 0x0C, 0x00, 0x01, 0x00, 0x00, 0x11, 0x94, 0x00, 0x0A});
    Append(packet, {7, 'P', 'r', 'i', 'n', 't', 'e', 'r', 0xC0, static_cast<int>(service_offset)});

    // SRV Printer._http._tcp.local -> port 631, target printer.local
    const std::size_t instance_offset = service_offset + 18 + 10;
    Append(packet, {0xC0, static_cast<int>(instance_offset)});
    Append(packet, {0x00, 0x21, 0x80, 0x01, 0x00, 0x00, 0x00, 0x78, 0x00, 0x15});
    Append(packet, {0x00, 0x00, 0x00, 0x00, 0x02, 0x77});
    AppendName(packet, {"printer", "local"});

    // A printer.local -> 192.168.1.40
    AppendName(packet, {"printer", "local"});
    Append(packet, {0x00, 0x01, 0x80, 0x01, 0x00, 0x00, 0x00, 0x78, 0x00, 0x04, 192, 168, 1, 40});

    auto message = dns::DecodeMessage(packet);
    REQUIRE(message);
    REQUIRE(message->IsResponse());
    REQUIRE(message->answers.size() == 3);

    const auto &ptr = message->answers[0];
    REQUIRE(ptr.type == dns::TYPE_PTR);
    REQUIRE(ptr.name == "_http._tcp.local");
    REQUIRE(ptr.target == "Printer._http._tcp.local");
    REQUIRE(ptr.ttl == 4500);

    const auto &srv = message->answers[1];
    REQUIRE(srv.type == dns::TYPE_SRV);
    REQUIRE(srv.name == "Printer._http._tcp.local");
    REQUIRE(srv.port == 631);
    REQUIRE(srv.target == "printer.local");
    REQUIRE(srv.klass == 0x8001);

    const auto &a = message->answers[2];
    REQUIRE(a.type == dns::TYPE_A);
    REQUIRE(a.address == "192.168.1.40");

    REQUIRE(message->AllRecords().size() == 3);
}

TEST_CASE("truncated packets are rejected", "[common][dns]")
{
    std::vector<std::uint8_t> packet;
    Append(packet, {0x00, 0x00, 0x84, 0x00, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00});
    AppendName(packet, {"host", "local"});
    Append(packet, {0x00, 0x01, 0x00, 0x01, 0x00, 0x00, 0x00, 0x78, 0x00, 0x04, 10, 0});

    REQUIRE_FALSE(dns::DecodeMessage(packet));
    REQUIRE_FALSE(dns::DecodeMessage({0x00, 0x01, 0x02}));
}

TEST_CASE("a pointer loop does not hang the name reader", "[common][dns]")
{
    std::vector<std::uint8_t> packet(dns::HEADER_SIZE, 0);
    Append(packet, {0xC0, static_cast<int>(dns::HEADER_SIZE)});
    std::size_t offset = dns::HEADER_SIZE;
    REQUIRE_FALSE(dns::ReadName(packet, offset));
}

TEST_CASE("name helpers", "[common][dns]")
{
    REQUIRE(dns::CanonicalName("Living-Room.Local.") == "living-room.local");
    REQUIRE(dns::CanonicalName("host") == "host");
    REQUIRE(dns::ReverseLookupName("192.168.1.10") == "10.1.168.192.in-addr.arpa");
}
