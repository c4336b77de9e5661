#include "IcmpProbe.hpp"
#include "IcmpEcho.hpp"
#include "../common/Log.hpp"

#include <cstdio>

namespace net_scan::probes
{
    using common::Log;
    using common::LogLevel;

    IcmpProbe::IcmpProbe(engine::ProbeConfig config, std::shared_ptr<common::CommandRunner> runner)
        : Probe(std::move(config)), m_runner(std::move(runner))
    {
        if (m_config.Param("method") == "system")
            m_raw_unavailable = true;
    }

    bool IcmpProbe::IsAvailable()
    {
        if (!m_raw_unavailable && CanOpenRawSocket(false))
            return true;

        auto result = m_runner->Run({"ping", "-c", "1", "-W", "1", "127.0.0.1"}, std::chrono::milliseconds(2000));
        return result.Succeeded();
    }

    std::optional<engine::ProbeResult> IcmpProbe::ProbeOne(const engine::ScanTarget &target)
    {
        EchoResult echo;
        std::string method = "raw_icmp";

        if (!m_raw_unavailable)
        {
            echo = RawEcho(target.address, m_config.timeout);
            if (echo.outcome == EchoOutcome::Unavailable)
            {
                if (!m_raw_unavailable.exchange(true))
                    Log(LogLevel::Info, "Icmp") << "raw ICMP unavailable, using system ping";
            }
        }

        if (m_raw_unavailable && echo.outcome != EchoOutcome::Reply)
        {
            method = "system_ping";
            echo = SystemPing(*m_runner, target.address, m_config.timeout);
        }

        if (echo.outcome != EchoOutcome::Reply)
            return std::nullopt;

        auto result = engine::MakeResult(target, Kind(), echo.latency_ms);
        result.metadata["method"] = method;
        if (echo.ttl)
            result.metadata["ttl"] = std::to_string(*echo.ttl);

        char latency[32];
        std::snprintf(latency, sizeof(latency), "%.2f", echo.latency_ms);
        result.metadata["latency_ms"] = latency;
        return result;
    }
}
