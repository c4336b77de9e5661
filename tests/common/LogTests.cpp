#include "common/Log.hpp"

#include <catch2/catch.hpp>

using namespace net_scan::common;

TEST_CASE("log levels parse case-insensitively", "[common][log]")
{
    LogLevel level = LogLevel::Info;
    std::string error;

    REQUIRE(ParseLogLevel("DEBUG", level, error));
    REQUIRE(level == LogLevel::Debug);
    REQUIRE(ParseLogLevel("warning", level, error));
    REQUIRE(level == LogLevel::Warn);
    REQUIRE(error.empty());

    REQUIRE_FALSE(ParseLogLevel("verbose", level, error));
    REQUIRE(error.find("verbose") != std::string::npos);
    REQUIRE_FALSE(ParseLogLevel("", level, error));
}

TEST_CASE("threshold filters lower levels", "[common][log]")
{
    const LogLevel saved = GetLogLevel();

    SetLogLevel(LogLevel::Warn);
    REQUIRE_FALSE(ShouldLog(LogLevel::Info));
    REQUIRE(ShouldLog(LogLevel::Warn));
    REQUIRE(ShouldLog(LogLevel::Error));

    SetLogLevel(LogLevel::Debug);
    REQUIRE(ShouldLog(LogLevel::Debug));

    SetLogLevel(saved);
    REQUIRE(std::string(ToString(LogLevel::Error)) == "ERROR");
}
