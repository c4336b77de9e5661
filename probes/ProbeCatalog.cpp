#include "ProbeCatalog.hpp"
#include "ArpProbe.hpp"
#include "IcmpProbe.hpp"
#include "Ipv6Probe.hpp"
#include "MdnsProbe.hpp"
#include "ReverseDnsProbe.hpp"
#include "TcpProbe.hpp"
#include "UpnpProbe.hpp"

namespace net_scan::probes
{
    using engine::ProbeConfig;
    using engine::ProbeKind;

    void RegisterDefaultProbes(engine::ScanOrchestrator &orchestrator, std::shared_ptr<common::CommandRunner> runner)
    {
        orchestrator.RegisterProbe(ProbeKind::Icmp, [runner](const ProbeConfig &config)
                                   { return std::make_shared<IcmpProbe>(config, runner); });
        orchestrator.RegisterProbe(ProbeKind::Tcp, [](const ProbeConfig &config)
                                   { return std::make_shared<TcpProbe>(config); });
        orchestrator.RegisterProbe(ProbeKind::Arp, [runner](const ProbeConfig &config)
                                   { return std::make_shared<ArpProbe>(config, runner); });
        orchestrator.RegisterProbe(ProbeKind::Mdns, [](const ProbeConfig &config)
                                   { return std::make_shared<MdnsProbe>(config); });
        orchestrator.RegisterProbe(ProbeKind::Upnp, [](const ProbeConfig &config)
                                   { return std::make_shared<UpnpProbe>(config); });
        orchestrator.RegisterProbe(ProbeKind::ReverseDns, [runner](const ProbeConfig &config)
                                   { return std::make_shared<ReverseDnsProbe>(config, runner); });
        orchestrator.RegisterProbe(ProbeKind::Ipv6, [runner](const ProbeConfig &config)
                                   { return std::make_shared<Ipv6Probe>(config, runner); });
    }
}
