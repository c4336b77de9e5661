#include "MdnsProbe.hpp"
#include "../common/Log.hpp"
#include "../engine/Deadline.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <map>
#include <netdb.h>
#include <netinet/in.h>
#include <iterator>
#include <set>

namespace net_scan::probes
{
    using common::Log;
    using common::LogLevel;
    namespace dns = common::dns;

    namespace
    {
        using Clock = std::chrono::steady_clock;

        constexpr const char *MDNS_GROUP = "224.0.0.251";
        constexpr std::uint16_t MDNS_PORT = 5353;
        constexpr auto RECEIVE_SLICE = std::chrono::milliseconds(100);
        constexpr auto HOST_LOOKUP_TIMEOUT = std::chrono::milliseconds(500);

        bool Contains(const std::string &haystack, const char *needle)
        {
            return haystack.find(needle) != std::string::npos;
        }

        // Binds to 5353 inside the multicast group when the port is shareable,
        // otherwise an ephemeral port that receives legacy unicast replies.
        common::ScopedFd OpenMdnsSocket(bool &multicast_bound)
        {
            multicast_bound = false;
            common::ScopedFd fd(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
            if (!fd.Valid())
                return fd;

            int yes = 1;
            setsockopt(fd.Get(), SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
#ifdef SO_REUSEPORT
            setsockopt(fd.Get(), SOL_SOCKET, SO_REUSEPORT, &yes, sizeof(yes));
#endif

            sockaddr_in local{};
            local.sin_family = AF_INET;
            local.sin_addr.s_addr = htonl(INADDR_ANY);
            local.sin_port = htons(MDNS_PORT);
            if (bind(fd.Get(), reinterpret_cast<sockaddr *>(&local), sizeof(local)) == 0)
            {
                ip_mreq membership{};
                inet_pton(AF_INET, MDNS_GROUP, &membership.imr_multiaddr);
                membership.imr_interface.s_addr = htonl(INADDR_ANY);
                multicast_bound = setsockopt(fd.Get(), IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) == 0;
            }
            else
            {
                Log(LogLevel::Debug, "Mdns") << "port 5353 busy, using an ephemeral port";
                local.sin_port = 0;
                if (bind(fd.Get(), reinterpret_cast<sockaddr *>(&local), sizeof(local)) != 0)
                    fd.Reset();
            }

            if (fd.Valid())
            {
                unsigned char ttl = 255;
                setsockopt(fd.Get(), IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));
            }
            return fd;
        }

        std::vector<std::string> LookupHost(const std::string &host)
        {
            addrinfo hints{};
            hints.ai_family = AF_UNSPEC;
            hints.ai_socktype = SOCK_DGRAM;
            addrinfo *list = nullptr;
            if (getaddrinfo(host.c_str(), nullptr, &hints, &list) != 0)
                return {};

            std::vector<std::string> addresses;
            for (addrinfo *it = list; it; it = it->ai_next)
            {
                sockaddr_storage storage{};
                std::copy_n(reinterpret_cast<const std::uint8_t *>(it->ai_addr), it->ai_addrlen,
                            reinterpret_cast<std::uint8_t *>(&storage));
                auto text = common::SockAddrToString(storage);
                if (!text.empty() && std::find(addresses.begin(), addresses.end(), text) == addresses.end())
                    addresses.push_back(text);
            }
            freeaddrinfo(list);
            return addresses;
        }
    }

    std::map<std::string, std::vector<std::string>> ResolveHostsUntil(const std::vector<std::string> &hosts,
                                                                      std::chrono::steady_clock::time_point deadline,
                                                                      const HostResolver &resolve)
    {
        std::map<std::string, std::vector<std::string>> resolved;
        std::vector<std::pair<std::string, engine::DeadlineTask<std::vector<std::string>>>> lookups;
        for (const auto &host : hosts)
        {
            if (!resolved.emplace(host, std::vector<std::string>{}).second)
                continue;
            lookups.emplace_back(host, engine::DeadlineTask<std::vector<std::string>>(
                                           [resolve, host]() -> std::optional<std::vector<std::string>>
                                           { return resolve(host); }));
        }

        const auto bound = std::min(deadline, Clock::now() + HOST_LOOKUP_TIMEOUT);
        for (auto &[host, lookup] : lookups)
        {
            auto addresses = lookup.WaitUntil(bound);
            if (addresses)
                resolved[host] = std::move(*addresses);
        }
        return resolved;
    }

    const std::vector<std::string> &MdnsServiceCatalog()
    {
        static const std::vector<std::string> services = {
            "_http._tcp.local",
            "_https._tcp.local",
            "_ssh._tcp.local",
            "_airplay._tcp.local",
            "_raop._tcp.local",
            "_device-info._tcp.local",
            "_apple-mobdev2._tcp.local",
            "_homekit._tcp.local",
            "_hap._tcp.local",
        };
        return services;
    }

    std::string ClassifyMdnsService(const std::string &service_type)
    {
        std::string s = dns::CanonicalName(service_type);
        if (Contains(s, "airplay") || Contains(s, "raop"))
            return "Apple TV/AirPlay Device";
        if (Contains(s, "homekit") || Contains(s, "hap"))
            return "HomeKit Device";
        if (Contains(s, "apple-mobdev"))
            return "iOS Device";
        if (Contains(s, "ssh"))
            return "SSH Server";
        if (Contains(s, "http"))
            return "Web Server";
        return "mDNS Device";
    }

    std::vector<MdnsService> AssembleServices(const std::vector<dns::ResourceRecord> &records)
    {
        std::vector<std::pair<std::string, std::string>> pointers; // service type, instance
        std::map<std::string, std::pair<std::string, std::uint16_t>> locations;
        std::map<std::string, std::vector<std::string>> addresses;

        for (const auto &record : records)
        {
            const std::string name = dns::CanonicalName(record.name);
            switch (record.type)
            {
            case dns::TYPE_PTR:
                if (name != "_services._dns-sd._udp.local" && !Contains(name, ".arpa"))
                {
                    std::pair<std::string, std::string> entry{name, dns::CanonicalName(record.target)};
                    if (std::find(pointers.begin(), pointers.end(), entry) == pointers.end())
                        pointers.push_back(entry);
                }
                break;
            case dns::TYPE_SRV:
                locations[name] = {dns::CanonicalName(record.target), record.port};
                break;
            case dns::TYPE_A:
            case dns::TYPE_AAAA:
            {
                auto &list = addresses[name];
                if (std::find(list.begin(), list.end(), record.address) == list.end())
                    list.push_back(record.address);
                break;
            }
            default:
                break;
            }
        }

        std::vector<MdnsService> services;
        std::set<std::string> seen;
        auto add = [&](const std::string &service_type, const std::string &instance)
        {
            if (!seen.insert(instance).second)
                return;
            MdnsService service;
            service.instance = instance;
            service.service_type = service_type;
            auto location = locations.find(instance);
            if (location != locations.end())
            {
                service.host = location->second.first;
                service.port = location->second.second;
                auto found = addresses.find(service.host);
                if (found != addresses.end())
                    service.addresses = found->second;
            }
            services.push_back(std::move(service));
        };

        for (const auto &[service_type, instance] : pointers)
            add(service_type, instance);

        // SRV answers that arrived without their PTR
        for (const auto &[instance, location] : locations)
        {
            auto dot = instance.find("._");
            if (dot != std::string::npos)
                add(instance.substr(dot + 1), instance);
        }
        return services;
    }

    bool MdnsProbe::IsAvailable()
    {
        common::ScopedFd fd(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0));
        return fd.Valid();
    }

    std::vector<common::Datagram> MdnsProbe::Query(Clock::time_point deadline, const engine::BatchCallbacks &callbacks)
    {
        std::vector<common::Datagram> replies;

        bool multicast_bound = false;
        common::ScopedFd fd = OpenMdnsSocket(multicast_bound);
        if (!fd.Valid())
        {
            Log(LogLevel::Debug, "Mdns") << "unable to open a UDP socket";
            return replies;
        }

        std::vector<dns::Question> questions;
        for (const auto &service : MdnsServiceCatalog())
        {
            dns::Question question;
            question.name = service;
            question.type = dns::TYPE_PTR;
            question.klass = multicast_bound ? dns::CLASS_IN : static_cast<std::uint16_t>(dns::CLASS_IN | dns::CLASS_UNICAST_RESPONSE);
            questions.push_back(question);
        }
        auto packet = dns::EncodeQuery(0, questions);

        sockaddr_in group{};
        group.sin_family = AF_INET;
        group.sin_port = htons(MDNS_PORT);
        inet_pton(AF_INET, MDNS_GROUP, &group.sin_addr);
        if (sendto(fd.Get(), packet.data(), packet.size(), 0, reinterpret_cast<sockaddr *>(&group), sizeof(group)) < 0)
        {
            Log(LogLevel::Debug, "Mdns") << "query send failed";
            return replies;
        }

        while (Clock::now() < deadline && !callbacks.Aborted())
        {
            auto slice = std::min(deadline, Clock::now() + RECEIVE_SLICE);
            auto batch = common::ReceiveUntil(fd.Get(), slice);
            std::move(batch.begin(), batch.end(), std::back_inserter(replies));
        }
        return replies;
    }

    std::vector<engine::ProbeResult> MdnsProbe::ProbeBatch(const std::vector<engine::ScanTarget> &targets,
                                                           const engine::BatchCallbacks &callbacks)
    {
        std::vector<engine::ProbeResult> results;
        if (targets.empty())
            return results;

        BatchReporter reporter(callbacks, Kind(), targets.size());
        // listening takes most of the timeout, the rest is left for host lookups
        const auto start = Clock::now();
        const auto deadline = start + m_config.timeout;
        auto replies = Query(deadline - m_config.timeout / 4, callbacks);
        reporter.Progress("", 0.8);

        std::vector<dns::ResourceRecord> records;
        std::map<std::string, std::string> host_sources;
        for (const auto &reply : replies)
        {
            auto message = dns::DecodeMessage(reply.payload);
            if (!message || !message->IsResponse())
                continue;
            for (auto &record : message->AllRecords())
            {
                if (record.type == dns::TYPE_SRV)
                    host_sources.emplace(dns::CanonicalName(record.target), reply.source);
                records.push_back(std::move(record));
            }
        }

        auto services = AssembleServices(records);
        Log(LogLevel::Debug, "Mdns") << replies.size() << " replies, " << services.size() << " services";

        std::map<std::string, const engine::ScanTarget *> wanted;
        for (const auto &target : targets)
            wanted.emplace(target.address, &target);

        std::vector<std::string> unresolved;
        for (const auto &service : services)
        {
            if (service.addresses.empty() && !service.host.empty())
                unresolved.push_back(service.host);
        }
        std::map<std::string, std::vector<std::string>> lookups;
        if (!unresolved.empty() && !callbacks.Aborted())
            lookups = ResolveHostsUntil(unresolved, deadline, LookupHost);

        std::chrono::duration<double, std::milli> elapsed = Clock::now() - start;
        std::map<std::string, engine::ProbeResult> found;
        for (auto &service : services)
        {
            if (callbacks.Aborted())
                break;
            if (service.addresses.empty() && !service.host.empty())
            {
                service.addresses = lookups[service.host];
                auto source = host_sources.find(service.host);
                if (service.addresses.empty() && source != host_sources.end())
                    service.addresses.push_back(source->second);
            }

            for (const auto &address : service.addresses)
            {
                auto target = wanted.find(address);
                if (target == wanted.end())
                    continue;

                auto existing = found.find(address);
                if (existing != found.end())
                {
                    existing->second.metadata["services"] += "," + service.service_type;
                    continue;
                }

                auto result = engine::MakeResult(*target->second, Kind(), elapsed.count());
                if (!service.host.empty())
                    result.hostname = service.host;
                result.metadata["service_name"] = service.instance;
                result.metadata["service_type"] = service.service_type;
                result.metadata["services"] = service.service_type;
                result.metadata["port"] = std::to_string(service.port);
                result.metadata["device_type"] = ClassifyMdnsService(service.service_type);
                found.emplace(address, std::move(result));
            }
        }

        for (const auto &target : targets)
        {
            auto it = found.find(target.address);
            reporter.Attempt(elapsed.count(), it != found.end());
            if (it != found.end())
            {
                reporter.Result(it->second);
                results.push_back(std::move(it->second));
            }
        }
        reporter.Progress("", 1.0);
        return results;
    }

    std::optional<engine::ProbeResult> MdnsProbe::ProbeOne(const engine::ScanTarget &target)
    {
        auto results = ProbeBatch({target}, {});
        if (results.empty())
            return std::nullopt;
        return results.front();
    }
}
