#pragma once

#include "../common/Subprocess.hpp"
#include "../common/TextParsers.hpp"
#include "../engine/Probe.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>

namespace net_scan::probes
{
    // Recovers MAC addresses from the OS neighbour cache. The batch pings every
    // target to populate the cache, reads the table once and reconciles locally.
    // A single lookup fits the warm-up, table read and direct request into the timeout.
    //
    // params: "arp_table"      path of the kernel table (default /proc/net/arp)
    //         "active_resolve" "false" disables direct ARP requests when running as root
    class ArpProbe : public engine::Probe
    {
    public:
        explicit ArpProbe(engine::ProbeConfig config,
                          std::shared_ptr<common::CommandRunner> runner = common::DefaultCommandRunner());

        engine::ProbeKind Kind() const override { return engine::ProbeKind::Arp; }
        std::string Name() const override { return "ARP Table"; }
        std::string Description() const override { return "Reads the system ARP cache for MAC addresses and vendors"; }
        int Priority() const override { return 3; }

        bool IsAvailable() override;
        std::optional<engine::ProbeResult> ProbeOne(const engine::ScanTarget &target) override;
        std::vector<engine::ProbeResult> ProbeBatch(const std::vector<engine::ScanTarget> &targets,
                                                    const engine::BatchCallbacks &callbacks) override;

        // ip -> entry; /proc/net/arp first, `arp -an` when that is missing or empty.
        // The command is skipped once command_timeout is zero.
        std::map<std::string, common::parsers::ArpEntry> ReadTable(std::chrono::milliseconds command_timeout);

    private:
        void WarmCache(const engine::ScanTarget &target, std::chrono::milliseconds timeout);
        std::optional<common::parsers::ArpEntry> ResolveDirect(const std::string &address,
                                                               std::chrono::milliseconds timeout);

        std::shared_ptr<common::CommandRunner> m_runner;
        std::string m_table_path;
        bool m_active_resolve;
    };
}
