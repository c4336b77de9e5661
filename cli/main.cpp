#include "CliOptions.hpp"
#include "../common/Log.hpp"
#include "../engine/AbortSignal.hpp"
#include "../engine/ScanOrchestrator.hpp"
#include "../probes/ProbeCatalog.hpp"

#include <csignal>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace
{
    net_scan::engine::AbortSignal g_abort;

    void HandleInterrupt(int)
    {
        g_abort.Raise();
    }

    void InstallInterruptHandler()
    {
        struct sigaction action{};
        action.sa_handler = HandleInterrupt;
        sigemptyset(&action.sa_mask);
        sigaction(SIGINT, &action, nullptr);
        sigaction(SIGTERM, &action, nullptr);
    }
}

int main(int argc, char *argv[])
{
    using namespace net_scan;

    cli::CliOptions options;
    std::string error;
    if (!cli::ParseCliOptions(argc, argv, options, error))
    {
        std::cerr << "netscan: " << error << "\n\n"
                  << cli::Usage(argv[0]);
        return 1;
    }
    if (options.help)
    {
        std::cout << cli::Usage(argv[0]);
        return 0;
    }

    common::SetLogLevel(options.log_level);

    engine::ScanOrchestrator orchestrator;
    probes::RegisterDefaultProbes(orchestrator);

    if (options.list_probes)
    {
        for (const auto &probe : orchestrator.DescribeProbes())
        {
            std::cout << std::left << std::setw(6) << engine::ToToken(probe.kind)
                      << std::setw(16) << probe.name
                      << " priority " << probe.priority
                      << (probe.enabled ? "  enabled " : "  disabled")
                      << "  timeout " << probe.config.timeout.count() << " ms"
                      << "  concurrency " << probe.config.max_concurrency
                      << "  " << probe.description << "\n";
        }
        return 0;
    }

    if (options.check)
    {
        for (const auto &[kind, available] : orchestrator.CheckAvailability())
            std::cout << std::left << std::setw(16) << engine::DisplayName(kind) << (available ? "available" : "unavailable") << "\n";
        return 0;
    }

    InstallInterruptHandler();

    auto scan_options = cli::BuildScanOptions(options, orchestrator);
    scan_options.abort = &g_abort;

    std::mutex output_mutex;
    int last_percent = -1;
    engine::ScanCallbacks callbacks;
    if (!options.quiet)
    {
        callbacks.on_progress = [&](const std::string &, double fraction)
        {
            std::lock_guard<std::mutex> lock(output_mutex);
            int percent = static_cast<int>(fraction * 100.0);
            if (percent == last_percent)
                return;
            last_percent = percent;
            std::cerr << "\r[Scan] " << std::setw(3) << percent << "%" << std::flush;
        };
    }

    std::cerr << "[Scan] " << options.targets.size() << " targets, strategy "
              << engine::ToString(options.strategy) << "\n";

    engine::ScanReport report;
    try
    {
        report = orchestrator.Scan(options.targets, options.segment, scan_options, callbacks);
    }
    catch (const engine::ScanConfigError &e)
    {
        std::cerr << "netscan: " << e.what() << "\n";
        return 1;
    }
    if (!options.quiet)
        std::cerr << "\n";

    for (const auto &result : report.results)
        std::cout << cli::FormatResult(result) << "\n";

    for (auto kind : report.probes_skipped)
        std::cerr << "[Scan] skipped unavailable probe " << engine::DisplayName(kind) << "\n";

    std::cout << "\n"
              << report.results.size() << " results in " << report.elapsed.count() << " ms ("
              << engine::ToString(report.status) << ")\n"
              << cli::FormatAssessment(orchestrator.AssessNetworkEnvironment());

    return report.status == engine::ScanStatus::Cancelled ? 2 : 0;
}
