#include "ArpProbe.hpp"
#include "IcmpEcho.hpp"
#include "OuiVendors.hpp"
#include "../common/AddressUtils.hpp"
#include "../common/Log.hpp"
#include "../common/SocketUtils.hpp"
#include "../engine/Deadline.hpp"

#include <tins/tins.h>

#include <fstream>
#include <mutex>
#include <sstream>

namespace net_scan::probes
{
    using common::Log;
    using common::LogLevel;
    using common::parsers::ArpEntry;

    namespace
    {
        constexpr auto WARM_UP_TIMEOUT = std::chrono::milliseconds(1000);
        constexpr auto TABLE_COMMAND_TIMEOUT = std::chrono::milliseconds(2000);

        engine::ProbeResult ToResult(const engine::ScanTarget &target, const ArpEntry &entry, double latency_ms)
        {
            auto result = engine::MakeResult(target, engine::ProbeKind::Arp, latency_ms);
            result.mac = entry.mac;
            result.metadata["arp_status"] = entry.status;
            result.metadata["interface"] = entry.interface;
            result.metadata["vendor"] = LookupVendor(entry.mac).value_or("Unknown");
            return result;
        }
    }

    ArpProbe::ArpProbe(engine::ProbeConfig config, std::shared_ptr<common::CommandRunner> runner)
        : Probe(std::move(config)), m_runner(std::move(runner))
    {
        m_table_path = m_config.Param("arp_table", "/proc/net/arp");
        m_active_resolve = m_config.Param("active_resolve", "true") != "false";
    }

    bool ArpProbe::IsAvailable()
    {
        std::ifstream table(m_table_path);
        if (table.is_open())
            return true;
        return m_runner->Run({"arp", "-an"}, TABLE_COMMAND_TIMEOUT).launched;
    }

    std::map<std::string, ArpEntry> ArpProbe::ReadTable(std::chrono::milliseconds command_timeout)
    {
        std::vector<ArpEntry> entries;

        std::ifstream file(m_table_path);
        if (file.is_open())
        {
            std::stringstream content;
            content << file.rdbuf();
            entries = common::parsers::ParseProcNetArp(content.str());
        }

        if (entries.empty() && command_timeout.count() > 0)
        {
            auto result = m_runner->Run({"arp", "-an"}, std::min(command_timeout, TABLE_COMMAND_TIMEOUT));
            if (result.Succeeded())
                entries = common::parsers::ParseArpCommandOutput(result.output);
            else
                Log(LogLevel::Debug, "Arp") << "arp -an unavailable (exit " << result.exit_code << ")";
        }

        std::map<std::string, ArpEntry> table;
        for (auto &entry : entries)
            table[entry.ip] = std::move(entry);
        return table;
    }

    void ArpProbe::WarmCache(const engine::ScanTarget &target, std::chrono::milliseconds timeout)
    {
        timeout = std::min(timeout, WARM_UP_TIMEOUT);
        if (timeout.count() > 0)
            SystemPing(*m_runner, target.address, timeout);
    }

    std::optional<ArpEntry> ArpProbe::ResolveDirect(const std::string &address, std::chrono::milliseconds timeout)
    {
        timeout = std::min(timeout, WARM_UP_TIMEOUT);
        if (!m_active_resolve || timeout.count() <= 0 || !common::IsRoot() || !common::IsIpv4(address))
            return std::nullopt;

        try
        {
            const auto ms = static_cast<std::uint32_t>(timeout.count());
            Tins::IPv4Address ip(address);
            Tins::NetworkInterface iface(ip);
            Tins::PacketSender sender(iface, ms / 1000, (ms % 1000) * 1000);
            Tins::HWAddress<6> hw = Tins::Utils::resolve_hwaddr(iface, ip, sender);

            auto mac = common::parsers::NormalizeMac(hw.to_string());
            if (!mac)
                return std::nullopt;
            ArpEntry entry;
            entry.ip = address;
            entry.mac = *mac;
            entry.interface = iface.name();
            entry.status = "resolved";
            return entry;
        }
        catch (const std::exception &e)
        {
            Log(LogLevel::Debug, "Arp") << "direct resolution of " << address << " failed: " << e.what();
            return std::nullopt;
        }
    }

    std::vector<engine::ProbeResult> ArpProbe::ProbeBatch(const std::vector<engine::ScanTarget> &targets,
                                                          const engine::BatchCallbacks &callbacks)
    {
        std::vector<engine::ProbeResult> results;
        if (targets.empty())
            return results;

        const auto start = std::chrono::steady_clock::now();
        BatchReporter reporter(callbacks, Kind(), targets.size());

        std::mutex progress_mutex;
        std::size_t warmed = 0;
        ForEachTarget(targets, callbacks, [&](const engine::ScanTarget &target)
                      {
                          WarmCache(target, m_config.timeout);
                          std::size_t done;
                          {
                              std::lock_guard<std::mutex> lock(progress_mutex);
                              done = ++warmed;
                          }
                          reporter.Progress(target.address, 0.5 * static_cast<double>(done) / static_cast<double>(targets.size())); });

        if (callbacks.Aborted())
            return results;

        auto table = ReadTable(TABLE_COMMAND_TIMEOUT);
        Log(LogLevel::Debug, "Arp") << "neighbour table holds " << table.size() << " entries";

        std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
        const double per_target = elapsed.count() / static_cast<double>(targets.size());

        std::size_t index = 0;
        for (const auto &target : targets)
        {
            ++index;
            std::optional<ArpEntry> entry;
            auto it = table.find(target.address);
            if (it != table.end())
                entry = it->second;
            else if (!callbacks.Aborted())
                entry = ResolveDirect(target.address, m_config.timeout);

            reporter.Attempt(per_target, entry.has_value());
            if (entry)
            {
                results.push_back(ToResult(target, *entry, per_target));
                reporter.Result(results.back());
            }
            reporter.Progress(target.address, 0.5 + 0.5 * static_cast<double>(index) / static_cast<double>(targets.size()));
        }
        return results;
    }

    std::optional<engine::ProbeResult> ArpProbe::ProbeOne(const engine::ScanTarget &target)
    {
        const auto start = std::chrono::steady_clock::now();
        const auto deadline = start + m_config.timeout;

        WarmCache(target, m_config.timeout / 2);

        std::optional<ArpEntry> entry;
        auto table = ReadTable(engine::Remaining(deadline));
        auto it = table.find(target.address);
        if (it != table.end())
            entry = it->second;
        else
            entry = ResolveDirect(target.address, engine::Remaining(deadline));

        if (!entry)
            return std::nullopt;
        std::chrono::duration<double, std::milli> elapsed = std::chrono::steady_clock::now() - start;
        return ToResult(target, *entry, elapsed.count());
    }
}
