#include "probes/MdnsProbe.hpp"

#include <catch2/catch.hpp>

#include <thread>

using namespace net_scan;
using namespace std::chrono_literals;
namespace dns = net_scan::common::dns;

namespace
{
    dns::ResourceRecord Ptr(const std::string &name, const std::string &target)
    {
        dns::ResourceRecord rr;
        rr.name = name;
        rr.type = dns::TYPE_PTR;
        rr.target = target;
        return rr;
    }

    dns::ResourceRecord Srv(const std::string &name, const std::string &target, std::uint16_t port)
    {
        dns::ResourceRecord rr;
        rr.name = name;
        rr.type = dns::TYPE_SRV;
        rr.target = target;
        rr.port = port;
        return rr;
    }

    dns::ResourceRecord Addr(const std::string &name, const std::string &address, bool v6 = false)
    {
        dns::ResourceRecord rr;
        rr.name = name;
        rr.type = v6 ? dns::TYPE_AAAA : dns::TYPE_A;
        rr.address = address;
        return rr;
    }
}

TEST_CASE("the service catalog covers the common DNS-SD types", "[probes][mdns]")
{
    const auto &catalog = probes::MdnsServiceCatalog();
    REQUIRE(catalog.size() == 9);
    for (const auto &service : catalog)
    {
        REQUIRE(service.front() == '_');
        REQUIRE(service.size() > 11);
        REQUIRE(service.compare(service.size() - 11, 11, "._tcp.local") == 0);
    }
}

TEST_CASE("service types map to device classes", "[probes][mdns]")
{
    REQUIRE(probes::ClassifyMdnsService("_airplay._tcp.local") == "Apple TV/AirPlay Device");
    REQUIRE(probes::ClassifyMdnsService("_raop._tcp.local.") == "Apple TV/AirPlay Device");
    REQUIRE(probes::ClassifyMdnsService("_hap._tcp.local") == "HomeKit Device");
    REQUIRE(probes::ClassifyMdnsService("_homekit._tcp.local") == "HomeKit Device");
    REQUIRE(probes::ClassifyMdnsService("_apple-mobdev2._tcp.local") == "iOS Device");
    REQUIRE(probes::ClassifyMdnsService("_SSH._tcp.local") == "SSH Server");
    REQUIRE(probes::ClassifyMdnsService("_https._tcp.local") == "Web Server");
    REQUIRE(probes::ClassifyMdnsService("_printer._tcp.local") == "mDNS Device");
}

TEST_CASE("PTR, SRV and address records join into services", "[probes][mdns]")
{
    // addresses first, pointers last: order must not matter
    std::vector<dns::ResourceRecord> records = {
        Addr("living-room.local", "192.168.1.30"),
        Addr("living-room.local", "fe80::1c", true),
        Addr("living-room.local", "192.168.1.30"),
        Srv("Living Room._airplay._tcp.local", "living-room.local.", 7000),
        Ptr("_airplay._tcp.local", "Living Room._airplay._tcp.local"),
        Ptr("_services._dns-sd._udp.local", "_airplay._tcp.local"),
        Ptr("30.1.168.192.in-addr.arpa", "living-room.local"),
    };

    auto services = probes::AssembleServices(records);
    REQUIRE(services.size() == 1);

    const auto &tv = services[0];
    REQUIRE(tv.instance == "living room._airplay._tcp.local");
    REQUIRE(tv.service_type == "_airplay._tcp.local");
    REQUIRE(tv.host == "living-room.local");
    REQUIRE(tv.port == 7000);
    REQUIRE(tv.addresses == std::vector<std::string>{"192.168.1.30", "fe80::1c"});
}

TEST_CASE("an SRV record without its PTR still yields a service", "[probes][mdns]")
{
    auto services = probes::AssembleServices({
        Srv("nas._ssh._tcp.local", "nas.local", 22),
        Addr("nas.local", "192.168.1.40"),
    });

    REQUIRE(services.size() == 1);
    REQUIRE(services[0].service_type == "_ssh._tcp.local");
    REQUIRE(services[0].port == 22);
    REQUIRE(services[0].addresses == std::vector<std::string>{"192.168.1.40"});
}

TEST_CASE("a PTR without SRV has no location", "[probes][mdns]")
{
    auto services = probes::AssembleServices({
        Ptr("_http._tcp.local", "Printer._http._tcp.local"),
        Ptr("_http._tcp.local", "Printer._http._tcp.local"),
    });

    REQUIRE(services.size() == 1);
    REQUIRE(services[0].host.empty());
    REQUIRE(services[0].port == 0);
    REQUIRE(services[0].addresses.empty());
}

TEST_CASE("mDNS metadata", "[probes][mdns]")
{
    probes::MdnsProbe probe(engine::DefaultConfigFor(engine::ProbeKind::Mdns));
    REQUIRE(probe.Kind() == engine::ProbeKind::Mdns);
    REQUIRE(probe.Priority() == 4);
    REQUIRE(probe.Config().timeout == std::chrono::milliseconds(3000));
    REQUIRE(probe.IsAvailable());
}

TEST_CASE("host lookups run together and stop at the deadline", "[probes][mdns]")
{
    std::vector<std::string> hosts;
    for (int i = 0; i < 10; ++i)
        hosts.push_back("slow-" + std::to_string(i) + ".local");
    hosts.push_back("fast.local");
    hosts.push_back("fast.local");

    auto resolve = [](const std::string &host) -> std::vector<std::string>
    {
        if (host == "fast.local")
            return {"192.168.1.20"};
        std::this_thread::sleep_for(1s);
        return {"192.168.1.99"};
    };

    const auto start = std::chrono::steady_clock::now();
    auto resolved = probes::ResolveHostsUntil(hosts, start + 400ms, resolve);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    CHECK(elapsed < 700ms);
    REQUIRE(resolved.size() == 11);
    CHECK(resolved["fast.local"] == std::vector<std::string>{"192.168.1.20"});
    CHECK(resolved["slow-3.local"].empty());

    SECTION("a deadline already passed leaves every host unresolved")
    {
        auto late = probes::ResolveHostsUntil({"slow-0.local"}, std::chrono::steady_clock::now(), resolve);
        REQUIRE(late.size() == 1);
        REQUIRE(late["slow-0.local"].empty());
    }
}

TEST_CASE("a single mDNS lookup finishes within its timeout", "[probes][mdns][network]")
{
    auto config = engine::DefaultConfigFor(engine::ProbeKind::Mdns);
    config.timeout = 300ms;
    probes::MdnsProbe probe(config);

    const auto start = std::chrono::steady_clock::now();
    REQUIRE_FALSE(probe.ProbeOne(engine::ScanTarget{"192.0.2.1", "test"}));
    CHECK(std::chrono::steady_clock::now() - start < 800ms);
}
