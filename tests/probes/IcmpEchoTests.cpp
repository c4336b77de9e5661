#include "probes/IcmpEcho.hpp"
#include "support/FakeCommandRunner.hpp"

#include <catch2/catch.hpp>
#include <tins/exceptions.h>

#include <stdexcept>

using namespace net_scan::probes;
using net_scan::testing::FakeCommandRunner;
using namespace std::chrono_literals;

TEST_CASE("a ping reply reports the parsed latency", "[probes][icmp]")
{
    FakeCommandRunner runner;
    runner.Respond("ping -c 1 -W 1 10.0.0.1", "64 bytes from 10.0.0.1: icmp_seq=1 ttl=64 time=3.25 ms\n");

    auto echo = SystemPing(runner, "10.0.0.1", 500ms);
    REQUIRE(echo.outcome == EchoOutcome::Reply);
    REQUIRE(echo.latency_ms == Approx(3.25));
    REQUIRE(echo.ttl == 64);
}

TEST_CASE("ping wait is rounded up to whole seconds", "[probes][icmp]")
{
    FakeCommandRunner runner;
    SystemPing(runner, "10.0.0.1", 2500ms);
    REQUIRE(runner.Ran("ping -c 1 -W 3 10.0.0.1"));
}

TEST_CASE("IPv6 targets use ping -6", "[probes][icmp]")
{
    FakeCommandRunner runner;
    runner.Respond("ping -6", "16 bytes from fe80::1%eth0: icmp_seq=1 ttl=64 time=0.9 ms\n");

    auto echo = SystemPing(runner, "fe80::1%eth0", 1000ms);
    REQUIRE(echo.outcome == EchoOutcome::Reply);
    REQUIRE(runner.Ran("ping -6 -c 1 -W 1 fe80::1%eth0"));
}

TEST_CASE("a failed or missing ping", "[probes][icmp]")
{
    FakeCommandRunner runner;
    runner.Respond("ping -c 1 -W 1 10.0.0.2", "1 packets transmitted, 0 received\n", 1);

    REQUIRE(SystemPing(runner, "10.0.0.2", 1000ms).outcome == EchoOutcome::NoReply);
    REQUIRE(SystemPing(runner, "10.0.0.3", 1000ms).outcome == EchoOutcome::Unavailable);
}

TEST_CASE("only a socket that cannot be opened makes raw echo unavailable", "[probes][icmp]")
{
    auto denied = GuardEcho("10.0.0.1", []() -> EchoResult
                            { throw Tins::socket_open_error("Operation not permitted"); });
    REQUIRE(denied.outcome == EchoOutcome::Unavailable);

    auto send_failed = GuardEcho("10.0.0.1", []() -> EchoResult
                                 { throw std::runtime_error("Network is unreachable"); });
    REQUIRE(send_failed.outcome == EchoOutcome::NoReply);

    auto replied = GuardEcho("10.0.0.1", []
                             { return EchoResult{EchoOutcome::Reply, 1.5, 64}; });
    REQUIRE(replied.outcome == EchoOutcome::Reply);
    REQUIRE(replied.latency_ms == Approx(1.5));
}
