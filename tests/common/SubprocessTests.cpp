#include "common/Subprocess.hpp"

#include <catch2/catch.hpp>

#include <cstdlib>

using namespace net_scan::common;
using namespace std::chrono_literals;

TEST_CASE("a command's output and exit code are captured", "[common][subprocess]")
{
    SystemCommandRunner runner;

    auto ok = runner.Run({"sh", "-c", "echo hello; echo oops 1>&2"}, 2000ms);
    REQUIRE(ok.Succeeded());
    REQUIRE(ok.output.find("hello") != std::string::npos);
    REQUIRE(ok.output.find("oops") != std::string::npos);

    auto failed = runner.Run({"sh", "-c", "exit 3"}, 2000ms);
    REQUIRE(failed.launched);
    REQUIRE(failed.exit_code == 3);
    REQUIRE_FALSE(failed.Succeeded());
}

TEST_CASE("a missing executable is reported as not launched", "[common][subprocess]")
{
    SystemCommandRunner runner;
    auto result = runner.Run({"netscan-no-such-tool"}, 2000ms);
    REQUIRE_FALSE(result.launched);
    REQUIRE_FALSE(result.Succeeded());

    REQUIRE_FALSE(runner.Run({}, 100ms).launched);
}

TEST_CASE("a slow command is killed at the deadline", "[common][subprocess]")
{
    SystemCommandRunner runner;
    auto start = std::chrono::steady_clock::now();
    auto result = runner.Run({"sleep", "5"}, 200ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.timed_out);
    REQUIRE(result.launched);
    REQUIRE(elapsed < 2s);
}

TEST_CASE("commands run in the C locale with the rest of the environment", "[common][subprocess]")
{
    REQUIRE(setenv("LC_ALL", "de_DE.UTF-8", 1) == 0);
    REQUIRE(setenv("NETSCAN_SUBPROCESS_MARKER", "kept", 1) == 0);

    SystemCommandRunner runner;
    auto result = runner.Run({"sh", "-c", "echo \"$LC_ALL/$NETSCAN_SUBPROCESS_MARKER\""}, 2000ms);

    unsetenv("NETSCAN_SUBPROCESS_MARKER");
    unsetenv("LC_ALL");

    REQUIRE(result.Succeeded());
    REQUIRE(result.output == "C/kept\n");
}
