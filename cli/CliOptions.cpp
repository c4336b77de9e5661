#include "CliOptions.hpp"
#include "../common/AddressUtils.hpp"

#include <getopt.h>
#include <iomanip>
#include <sstream>

namespace net_scan::cli
{
    namespace
    {
        enum LongOnly
        {
            OPT_SEGMENT = 1000,
            OPT_PRESET,
            OPT_WORKERS,
            OPT_DEADLINE,
            OPT_CHECK,
            OPT_LIST_PROBES,
            OPT_LOG_LEVEL,
        };

        bool ParseCount(const std::string &raw, std::size_t &value)
        {
            try
            {
                std::size_t used = 0;
                long long parsed = std::stoll(raw, &used);
                if (used != raw.size() || parsed <= 0)
                    return false;
                value = static_cast<std::size_t>(parsed);
                return true;
            }
            catch (const std::exception &)
            {
                return false;
            }
        }

        bool ParseProbeList(const std::string &raw, std::vector<engine::ProbeKind> &kinds, std::string &error)
        {
            std::stringstream ss(raw);
            std::string token;
            while (std::getline(ss, token, ','))
            {
                if (token.empty())
                    continue;
                auto kind = engine::ParseProbeKind(token);
                if (!kind)
                {
                    error = "unknown probe '" + token + "'";
                    return false;
                }
                kinds.push_back(*kind);
            }
            if (kinds.empty())
            {
                error = "--probes needs at least one probe";
                return false;
            }
            return true;
        }
    }

    bool ParseCliOptions(int argc, char *argv[], CliOptions &options, std::string &error)
    {
        static const option long_options[] = {
            {"segment", required_argument, nullptr, OPT_SEGMENT},
            {"strategy", required_argument, nullptr, 's'},
            {"probes", required_argument, nullptr, 'p'},
            {"preset", required_argument, nullptr, OPT_PRESET},
            {"timeout", required_argument, nullptr, 't'},
            {"concurrency", required_argument, nullptr, 'c'},
            {"workers", required_argument, nullptr, OPT_WORKERS},
            {"deadline", required_argument, nullptr, OPT_DEADLINE},
            {"check", no_argument, nullptr, OPT_CHECK},
            {"list-probes", no_argument, nullptr, OPT_LIST_PROBES},
            {"log-level", required_argument, nullptr, OPT_LOG_LEVEL},
            {"quiet", no_argument, nullptr, 'q'},
            {"help", no_argument, nullptr, 'h'},
            {nullptr, 0, nullptr, 0}};

        optind = 0; // restart the scan, glibc re-reads its state
        opterr = 0;

        int opt;
        while ((opt = getopt_long(argc, argv, "s:p:t:c:qh", long_options, nullptr)) != -1)
        {
            const std::string arg = optarg ? optarg : "";
            std::size_t count = 0;
            switch (opt)
            {
            case OPT_SEGMENT:
                options.segment = arg;
                break;
            case 's':
            {
                auto strategy = engine::ParseScanStrategy(arg);
                if (!strategy)
                {
                    error = "unknown strategy '" + arg + "'";
                    return false;
                }
                options.strategy = *strategy;
                break;
            }
            case 'p':
            {
                std::vector<engine::ProbeKind> kinds;
                if (!ParseProbeList(arg, kinds, error))
                    return false;
                options.probes = kinds;
                break;
            }
            case OPT_PRESET:
            {
                auto preset = engine::ParsePreset(arg);
                if (!preset)
                {
                    error = "unknown preset '" + arg + "'";
                    return false;
                }
                options.preset = *preset;
                break;
            }
            case 't':
                if (!ParseCount(arg, count))
                {
                    error = "--timeout expects a positive number of milliseconds";
                    return false;
                }
                options.timeout = std::chrono::milliseconds(count);
                break;
            case 'c':
                if (!ParseCount(arg, count))
                {
                    error = "--concurrency expects a positive integer";
                    return false;
                }
                options.concurrency = count;
                break;
            case OPT_WORKERS:
                if (!ParseCount(arg, options.workers))
                {
                    error = "--workers expects a positive integer";
                    return false;
                }
                break;
            case OPT_DEADLINE:
                if (!ParseCount(arg, count))
                {
                    error = "--deadline expects a positive number of milliseconds";
                    return false;
                }
                options.deadline = std::chrono::milliseconds(count);
                break;
            case OPT_CHECK:
                options.check = true;
                break;
            case OPT_LIST_PROBES:
                options.list_probes = true;
                break;
            case OPT_LOG_LEVEL:
                if (!common::ParseLogLevel(arg, options.log_level, error))
                    return false;
                break;
            case 'q':
                options.quiet = true;
                break;
            case 'h':
                options.help = true;
                break;
            default:
                error = "invalid option";
                if (optind > 0 && optind <= argc)
                    error += " '" + std::string(argv[optind - 1]) + "'";
                return false;
            }
        }

        for (int i = optind; i < argc; ++i)
        {
            auto expanded = common::ExpandTargetSpec(argv[i]);
            if (!expanded)
            {
                error = "invalid target '" + std::string(argv[i]) + "' (expected an address or a /16-/32 block)";
                return false;
            }
            options.targets.insert(options.targets.end(), expanded->begin(), expanded->end());
        }

        if (options.targets.empty() && !options.check && !options.list_probes && !options.help)
        {
            error = "no targets given";
            return false;
        }
        return true;
    }

    std::string Usage(const std::string &program)
    {
        std::ostringstream out;
        out << "Usage: " << program << " [options] <target>...\n"
            << "  target                 address or CIDR block (/16 to /32)\n"
            << "  --segment LABEL        segment label attached to results\n"
            << "  -s, --strategy NAME    sequential|parallel|smart|turbo|ultrafast|bfs (default smart)\n"
            << "  -p, --probes LIST      icmp,tcp,arp,mdns,upnp,dns,ipv6\n"
            << "      --preset NAME      quick|recommended|full|speed|comprehensive\n"
            << "  -t, --timeout MS       timeout for every selected probe\n"
            << "  -c, --concurrency N    concurrency for every selected probe\n"
            << "      --workers N        breadth-first workers (default 8)\n"
            << "      --deadline MS      breadth-first per-target deadline (default 2000)\n"
            << "      --check            print probe availability and exit\n"
            << "      --list-probes      print the registered probes and exit\n"
            << "      --log-level LEVEL  debug|info|warn|error (default warn)\n"
            << "  -q, --quiet            no progress output\n"
            << "  -h, --help             this text\n";
        return out.str();
    }

    engine::ScanOptions BuildScanOptions(const CliOptions &options, engine::ScanOrchestrator &orchestrator)
    {
        if (options.preset)
            orchestrator.ApplyPreset(*options.preset, true);

        if (options.probes)
        {
            engine::EnabledMap enabled;
            for (const auto &info : engine::AllProbeKinds())
                enabled[info.kind] = false;
            for (auto kind : *options.probes)
                enabled[kind] = true;
            orchestrator.SetEnabledProbes(enabled);
        }

        engine::ScanOptions scan;
        scan.strategy = options.strategy;
        scan.bfs_workers = options.workers;
        scan.bfs_deadline = options.deadline;

        if (options.timeout || options.concurrency)
        {
            for (auto kind : orchestrator.RegisteredKinds())
            {
                auto config = orchestrator.GetProbeConfig(kind);
                if (options.timeout)
                    config.timeout = *options.timeout;
                if (options.concurrency)
                    config.max_concurrency = *options.concurrency;
                scan.configs[kind] = config;
            }
        }
        return scan;
    }

    std::string FormatResult(const engine::ProbeResult &result)
    {
        std::ostringstream out;
        out << std::left << std::setw(16) << result.address << ' '
            << std::setw(5) << engine::ToToken(result.kind) << ' '
            << std::right << std::fixed << std::setprecision(1) << std::setw(8) << result.latency_ms << " ms";

        if (result.hostname)
            out << "  host=" << *result.hostname;
        if (result.mac)
            out << "  mac=" << *result.mac;
        if (!result.open_ports.empty())
        {
            out << "  ports=";
            bool first = true;
            for (auto port : result.open_ports)
            {
                out << (first ? "" : ",") << port;
                first = false;
            }
        }
        for (const auto &[key, value] : result.metadata)
            out << "  " << key << '=' << value;
        return out.str();
    }

    std::string FormatAssessment(const engine::NetworkAssessment &assessment)
    {
        std::ostringstream out;
        out << std::fixed << std::setprecision(1);
        out << "Network quality: " << engine::ToString(assessment.quality)
            << " (mean latency " << assessment.mean_latency_ms << " ms, success "
            << assessment.success_rate * 100.0 << "%, " << assessment.total_samples << " samples)\n";
        for (const auto &[kind, recommendation] : assessment.per_probe)
        {
            out << "  " << std::left << std::setw(16) << engine::DisplayName(kind)
                << ' ' << engine::ToString(recommendation.recommendation)
                << " (" << recommendation.stats.samples << " samples)\n";
        }
        return out.str();
    }
}
