#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace net_scan::common
{
    struct CommandResult
    {
        bool launched = false;  // false when the executable could not be started
        bool timed_out = false; // killed after the deadline
        int exit_code = -1;
        std::string output;     // stdout and stderr, interleaved

        bool Succeeded() const { return launched && !timed_out && exit_code == 0; }
    };

    // Seam between probes and the external utilities they shell out to (ping, arp, nslookup, dig, ip).
    // Tests substitute a canned implementation.
    class CommandRunner
    {
    public:
        virtual ~CommandRunner() = default;
        virtual CommandResult Run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) = 0;
    };

    // fork/execvpe with a pipe and LC_ALL=C; the child is killed once the timeout elapses.
    class SystemCommandRunner : public CommandRunner
    {
    public:
        CommandResult Run(const std::vector<std::string> &argv, std::chrono::milliseconds timeout) override;
    };

    std::shared_ptr<CommandRunner> DefaultCommandRunner();
}
