#pragma once

#include "../common/Subprocess.hpp"

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace net_scan::probes
{
    enum class EchoOutcome
    {
        Reply,
        NoReply,
        Unavailable // raw socket could not be opened or the utility could not run
    };

    struct EchoResult
    {
        EchoOutcome outcome = EchoOutcome::NoReply;
        double latency_ms = 0.0;
        std::optional<int> ttl; // hop limit for IPv6
    };

    // Raw ICMP / ICMPv6 echo through libtins. Unavailable without raw socket privilege.
    EchoResult RawEcho(const std::string &address, std::chrono::milliseconds timeout);

    // Runs one raw echo attempt. Only a socket that cannot be opened is Unavailable;
    // any other failure counts as NoReply for this address alone.
    EchoResult GuardEcho(const std::string &address, const std::function<EchoResult()> &echo);

    // `ping -c 1` (or `ping -6 -c 1`) through the runner, killed at the timeout.
    EchoResult SystemPing(common::CommandRunner &runner, const std::string &address,
                          std::chrono::milliseconds timeout);

    // True when this process may open a raw ICMP socket.
    bool CanOpenRawSocket(bool ipv6);
}
