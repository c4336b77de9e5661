#pragma once

#include "../common/Subprocess.hpp"
#include "../engine/ScanOrchestrator.hpp"

#include <memory>

namespace net_scan::probes
{
    // Registers a factory for every probe kind. Probes that shell out share runner.
    void RegisterDefaultProbes(engine::ScanOrchestrator &orchestrator,
                               std::shared_ptr<common::CommandRunner> runner = common::DefaultCommandRunner());
}
