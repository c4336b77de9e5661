#pragma once

#include "../common/DnsMessage.hpp"
#include "../common/SocketUtils.hpp"
#include "../engine/Probe.hpp"

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

namespace net_scan::probes
{
    // A DNS-SD instance assembled from PTR -> SRV -> A/AAAA records.
    struct MdnsService
    {
        std::string instance;     // "Living Room._airplay._tcp.local"
        std::string service_type; // "_airplay._tcp.local"
        std::string host;         // "living-room.local"
        std::uint16_t port = 0;
        std::vector<std::string> addresses;
    };

    const std::vector<std::string> &MdnsServiceCatalog();

    std::string ClassifyMdnsService(const std::string &service_type);

    // Joins the records of one or more responses into services. Records may
    // arrive in any section and in any order.
    std::vector<MdnsService> AssembleServices(const std::vector<common::dns::ResourceRecord> &records);

    using HostResolver = std::function<std::vector<std::string>(const std::string &host)>;

    // Resolves the hosts concurrently, each bounded by the deadline. A host
    // still unresolved at that point maps to an empty list.
    std::map<std::string, std::vector<std::string>> ResolveHostsUntil(const std::vector<std::string> &hosts,
                                                                      std::chrono::steady_clock::time_point deadline,
                                                                      const HostResolver &resolve);

    // Multicast DNS-SD discovery. A single query round covers the whole batch.
    class MdnsProbe : public engine::Probe
    {
    public:
        explicit MdnsProbe(engine::ProbeConfig config) : Probe(std::move(config)) {}

        engine::ProbeKind Kind() const override { return engine::ProbeKind::Mdns; }
        std::string Name() const override { return "mDNS/Bonjour"; }
        std::string Description() const override { return "Discovers DNS-SD services announced over multicast DNS"; }
        int Priority() const override { return 4; }

        bool IsAvailable() override;
        std::optional<engine::ProbeResult> ProbeOne(const engine::ScanTarget &target) override;
        std::vector<engine::ProbeResult> ProbeBatch(const std::vector<engine::ScanTarget> &targets,
                                                    const engine::BatchCallbacks &callbacks) override;

    private:
        std::vector<common::Datagram> Query(std::chrono::steady_clock::time_point deadline,
                                            const engine::BatchCallbacks &callbacks);
    };
}
