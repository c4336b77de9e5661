#include "Ipv6Probe.hpp"
#include "IcmpEcho.hpp"
#include "ReverseDnsProbe.hpp"
#include "TcpProbe.hpp"
#include "../common/AddressUtils.hpp"
#include "../common/Log.hpp"
#include "../common/SocketUtils.hpp"
#include "../engine/Deadline.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cstdio>
#include <fstream>
#include <ifaddrs.h>
#include <net/if.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sstream>

namespace net_scan::probes
{
    using common::Log;
    using common::LogLevel;
    using engine::Remaining;

    namespace
    {
        using Clock = std::chrono::steady_clock;

        constexpr auto NEIGHBOR_COMMAND_TIMEOUT = std::chrono::milliseconds(2000);
        constexpr auto MAX_ECHO_TIMEOUT = std::chrono::milliseconds(1000);
        constexpr auto MAX_SERVICE_TIMEOUT = std::chrono::milliseconds(500);

        const std::vector<std::uint16_t> &ServicePorts()
        {
            static const std::vector<std::uint16_t> ports = {22, 80, 443, 5353, 8080};
            return ports;
        }

        const char *ServiceName(std::uint16_t port)
        {
            switch (port)
            {
            case 22:
                return "SSH";
            case 80:
                return "HTTP";
            case 443:
                return "HTTPS";
            case 5353:
                return "mDNS";
            case 8080:
                return "HTTP-Alt";
            default:
                return "Unknown";
            }
        }

        std::optional<in6_addr> ToIn6(const std::string &address)
        {
            std::string host = address.substr(0, address.find('%'));
            in6_addr addr{};
            if (inet_pton(AF_INET6, host.c_str(), &addr) != 1)
                return std::nullopt;
            return addr;
        }

        std::string Join(const std::vector<std::string> &items)
        {
            std::string out;
            for (const auto &item : items)
            {
                if (!out.empty())
                    out += ',';
                out += item;
            }
            return out;
        }

        // Runs on a detached worker, so it only holds shared state.
        bool Reachable(const std::shared_ptr<common::CommandRunner> &runner, const std::string &address,
                       std::chrono::milliseconds timeout)
        {
            if (address.find('%') == std::string::npos)
            {
                auto raw = RawEcho(address, timeout);
                if (raw.outcome != EchoOutcome::Unavailable)
                    return raw.outcome == EchoOutcome::Reply;
            }
            return SystemPing(*runner, address, timeout).outcome == EchoOutcome::Reply;
        }
    }

    std::vector<LocalPrefix> LocalIpv6Prefixes()
    {
        std::vector<LocalPrefix> prefixes;

        ifaddrs *list = nullptr;
        if (getifaddrs(&list) != 0)
        {
            Log(LogLevel::Debug, "Ipv6") << "getifaddrs failed";
            return prefixes;
        }

        for (ifaddrs *it = list; it; it = it->ifa_next)
        {
            if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET6 || (it->ifa_flags & IFF_LOOPBACK))
                continue;

            in6_addr addr = reinterpret_cast<const sockaddr_in6 *>(it->ifa_addr)->sin6_addr;
            if (IN6_IS_ADDR_LOOPBACK(&addr))
                continue;
            std::fill(addr.s6_addr + 8, addr.s6_addr + 16, 0);

            char text[INET6_ADDRSTRLEN] = {};
            if (!inet_ntop(AF_INET6, &addr, text, sizeof(text)))
                continue;

            LocalPrefix prefix;
            prefix.prefix = text;
            if (prefix.prefix.size() < 2 || prefix.prefix.compare(prefix.prefix.size() - 2, 2, "::") != 0)
                prefix.prefix += "::";
            prefix.interface = it->ifa_name ? it->ifa_name : "";
            prefix.link_local = IN6_IS_ADDR_LINKLOCAL(&addr);

            bool seen = std::any_of(prefixes.begin(), prefixes.end(), [&](const LocalPrefix &p)
                                    { return p.prefix == prefix.prefix && p.interface == prefix.interface; });
            if (!seen)
                prefixes.push_back(std::move(prefix));
        }
        freeifaddrs(list);
        return prefixes;
    }

    std::vector<std::string> PredictIpv6Candidates(const std::string &ipv4, const std::vector<LocalPrefix> &prefixes)
    {
        std::vector<std::string> candidates;
        auto value = common::Ipv4ToInt(ipv4);
        if (!value)
            return candidates;

        const unsigned o3 = (*value >> 8) & 0xff;
        const unsigned o4 = *value & 0xff;
        char hex[8];
        std::snprintf(hex, sizeof(hex), "%x", o4);

        for (const auto &prefix : prefixes)
        {
            const std::string zone = prefix.link_local && !prefix.interface.empty() ? "%" + prefix.interface : "";
            for (const std::string &suffix : {std::string(hex), std::to_string(o3) + "." + std::to_string(o4), ipv4})
            {
                std::string candidate = prefix.prefix + suffix;
                if (!common::IsIpv6(candidate))
                    continue;
                candidate += zone;
                if (std::find(candidates.begin(), candidates.end(), candidate) == candidates.end())
                    candidates.push_back(candidate);
            }
        }
        return candidates;
    }

    std::optional<std::string> Eui64LinkLocal(const std::string &mac)
    {
        auto normalized = common::parsers::NormalizeMac(mac);
        if (!normalized)
            return std::nullopt;

        unsigned b[6];
        if (std::sscanf(normalized->c_str(), "%02x:%02x:%02x:%02x:%02x:%02x", &b[0], &b[1], &b[2], &b[3], &b[4], &b[5]) != 6)
            return std::nullopt;

        char text[64];
        std::snprintf(text, sizeof(text), "fe80::%x:%x:%x:%x",
                      ((b[0] ^ 0x02) << 8) | b[1],
                      (b[2] << 8) | 0xff,
                      (0xfe << 8) | b[3],
                      (b[4] << 8) | b[5]);
        return std::string(text);
    }

    bool IsLinkLocalIpv6(const std::string &address)
    {
        auto addr = ToIn6(address);
        return addr && IN6_IS_ADDR_LINKLOCAL(&*addr);
    }

    bool IsGlobalUnicastIpv6(const std::string &address)
    {
        auto addr = ToIn6(address);
        if (!addr)
            return false;
        if (IN6_IS_ADDR_LINKLOCAL(&*addr) || IN6_IS_ADDR_LOOPBACK(&*addr) || IN6_IS_ADDR_UNSPECIFIED(&*addr) ||
            IN6_IS_ADDR_MULTICAST(&*addr))
            return false;
        return (addr->s6_addr[0] & 0xfe) != 0xfc;
    }

    Ipv6Probe::Ipv6Probe(engine::ProbeConfig config, std::shared_ptr<common::CommandRunner> runner)
        : Probe(std::move(config)), m_runner(std::move(runner))
    {
        m_arp_table = m_config.Param("arp_table", "/proc/net/arp");
    }

    bool Ipv6Probe::IsAvailable()
    {
        ifaddrs *list = nullptr;
        if (getifaddrs(&list) != 0)
            return false;

        bool found = false;
        for (ifaddrs *it = list; it && !found; it = it->ifa_next)
        {
            if (!it->ifa_addr || it->ifa_addr->sa_family != AF_INET6 || (it->ifa_flags & IFF_LOOPBACK))
                continue;
            const auto &addr = reinterpret_cast<const sockaddr_in6 *>(it->ifa_addr)->sin6_addr;
            found = !IN6_IS_ADDR_LOOPBACK(&addr);
        }
        freeifaddrs(list);
        return found;
    }

    std::optional<common::parsers::ArpEntry> Ipv6Probe::ArpEntryOf(const std::string &ipv4)
    {
        std::ifstream file(m_arp_table);
        if (!file.is_open())
            return std::nullopt;
        std::stringstream content;
        content << file.rdbuf();
        for (auto &entry : common::parsers::ParseProcNetArp(content.str()))
        {
            if (entry.ip == ipv4)
                return entry;
        }
        return std::nullopt;
    }

    std::vector<std::string> Ipv6Probe::NeighborCandidates(const std::string &mac, Clock::time_point deadline)
    {
        std::vector<common::parsers::NeighborEntry> neighbors;
        auto budget = std::min(Remaining(deadline), NEIGHBOR_COMMAND_TIMEOUT);
        if (budget.count() == 0)
            return {};
        auto ip = m_runner->Run({"ip", "-6", "neigh", "show"}, budget);
        if (ip.Succeeded())
        {
            neighbors = common::parsers::ParseIpNeighOutput(ip.output);
        }
        else if (!ip.launched)
        {
            budget = std::min(Remaining(deadline), NEIGHBOR_COMMAND_TIMEOUT);
            if (budget.count() == 0)
                return {};
            auto ndp = m_runner->Run({"ndp", "-an"}, budget);
            if (ndp.Succeeded())
                neighbors = common::parsers::ParseNdpOutput(ndp.output);
        }

        std::vector<std::string> candidates;
        for (const auto &neighbor : neighbors)
        {
            if (neighbor.mac != mac)
                continue;
            std::string address = neighbor.address;
            if (IsLinkLocalIpv6(address) && address.find('%') == std::string::npos && !neighbor.interface.empty())
                address += "%" + neighbor.interface;
            candidates.push_back(address);
        }
        return candidates;
    }

    std::vector<std::string> Ipv6Probe::Candidates(const engine::ScanTarget &target, Clock::time_point deadline,
                                                   std::optional<std::string> &hostname)
    {
        std::vector<std::string> candidates;
        auto add = [&](const std::string &address)
        {
            if (std::find(candidates.begin(), candidates.end(), address) == candidates.end())
                candidates.push_back(address);
        };

        if (common::IsIpv6(target.address))
        {
            add(target.address);
            return candidates;
        }

        if (auto entry = ArpEntryOf(target.address))
        {
            for (const auto &address : NeighborCandidates(entry->mac, deadline))
                add(address);
            if (auto eui64 = Eui64LinkLocal(entry->mac))
                add(entry->interface.empty() ? *eui64 : *eui64 + "%" + entry->interface);
        }

        if (Remaining(deadline).count() > 0)
            hostname = ResolveHostname(*m_runner, target.address, Remaining(deadline));
        if (hostname && Remaining(deadline).count() > 0)
        {
            const std::string host = *hostname;
            auto aaaa = engine::RunWithDeadline<std::vector<std::string>>(
                [host]() -> std::optional<std::vector<std::string>>
                {
                    addrinfo hints{};
                    hints.ai_family = AF_INET6;
                    hints.ai_socktype = SOCK_STREAM;
                    addrinfo *list = nullptr;
                    if (getaddrinfo(host.c_str(), nullptr, &hints, &list) != 0)
                        return std::nullopt;
                    std::vector<std::string> found;
                    for (addrinfo *it = list; it; it = it->ai_next)
                    {
                        sockaddr_storage storage{};
                        std::copy_n(reinterpret_cast<const std::uint8_t *>(it->ai_addr), it->ai_addrlen,
                                    reinterpret_cast<std::uint8_t *>(&storage));
                        found.push_back(common::SockAddrToString(storage));
                    }
                    freeaddrinfo(list);
                    return found;
                },
                Remaining(deadline));
            for (const auto &address : aaaa.value_or(std::vector<std::string>{}))
                add(address);
        }

        for (const auto &address : PredictIpv6Candidates(target.address, LocalIpv6Prefixes()))
            add(address);
        return candidates;
    }

    std::optional<engine::ProbeResult> Ipv6Probe::ProbeOne(const engine::ScanTarget &target)
    {
        const auto start = Clock::now();
        const auto deadline = start + m_config.timeout;

        // discovery gets the first quarter of the budget
        std::optional<std::string> hostname;
        auto candidates = Candidates(target, start + m_config.timeout / 4, hostname);
        if (candidates.empty())
            return std::nullopt;

        // validate concurrently, leaving a quarter of the budget for the service check
        const auto validation_deadline = std::max(Clock::now(), deadline - m_config.timeout / 4);
        const auto echo_timeout = std::min(Remaining(validation_deadline), MAX_ECHO_TIMEOUT);
        std::vector<std::pair<std::string, std::unique_ptr<engine::DeadlineTask<bool>>>> checks;
        for (const auto &candidate : candidates)
        {
            auto runner = m_runner;
            checks.emplace_back(candidate, std::make_unique<engine::DeadlineTask<bool>>(
                                               [runner, candidate, echo_timeout]() -> std::optional<bool>
                                               { return Reachable(runner, candidate, echo_timeout); }));
        }

        std::vector<std::string> valid;
        for (auto &[candidate, check] : checks)
        {
            if (check->WaitUntil(validation_deadline).value_or(false))
                valid.push_back(candidate);
        }
        if (valid.empty())
            return std::nullopt;

        std::vector<std::string> services;
        bool link_local = false;
        bool global_unicast = false;
        for (const auto &address : valid)
        {
            link_local = link_local || IsLinkLocalIpv6(address);
            global_unicast = global_unicast || IsGlobalUnicastIpv6(address);

            auto budget = std::min(Remaining(deadline), MAX_SERVICE_TIMEOUT);
            if (budget.count() == 0)
                continue;
            for (auto port : SweepPorts(address, ServicePorts(), budget))
            {
                std::string name = ServiceName(port);
                if (std::find(services.begin(), services.end(), name) == services.end())
                    services.push_back(name);
            }
        }

        std::chrono::duration<double, std::milli> elapsed = Clock::now() - start;
        auto result = engine::MakeResult(target, Kind(), elapsed.count());
        result.hostname = hostname;
        result.metadata["ipv6_available"] = "true";
        result.metadata["ipv6_addresses"] = Join(valid);
        result.metadata["ipv6_services"] = Join(services);
        result.metadata["link_local"] = link_local ? "true" : "false";
        result.metadata["global_unicast"] = global_unicast ? "true" : "false";
        return result;
    }
}
