#pragma once

#include "../common/Log.hpp"
#include "../engine/ScanOrchestrator.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace net_scan::cli
{
    struct CliOptions
    {
        std::vector<std::string> targets; // expanded host addresses
        std::string segment = "lan";
        engine::ScanStrategy strategy = engine::ScanStrategy::Smart;
        std::optional<std::vector<engine::ProbeKind>> probes;
        std::optional<engine::Preset> preset;
        std::optional<std::chrono::milliseconds> timeout;
        std::optional<std::size_t> concurrency;
        std::size_t workers = 8;
        std::chrono::milliseconds deadline{2000};
        common::LogLevel log_level = common::LogLevel::Warn;
        bool check = false;
        bool list_probes = false;
        bool quiet = false;
        bool help = false;
    };

    // Parses argv with getopt_long. Returns false with a message on any usage error.
    bool ParseCliOptions(int argc, char *argv[], CliOptions &options, std::string &error);

    std::string Usage(const std::string &program);

    // Applies --preset / --probes to the orchestrator and builds the per-scan options.
    engine::ScanOptions BuildScanOptions(const CliOptions &options, engine::ScanOrchestrator &orchestrator);

    // "192.168.1.10  tcp  12.3 ms  host=nas.lan  ports=22,80  service.22=SSH ..."
    std::string FormatResult(const engine::ProbeResult &result);

    std::string FormatAssessment(const engine::NetworkAssessment &assessment);
}
