#include "engine/Probe.hpp"
#include "support/FakeProbe.hpp"

#include <catch2/catch.hpp>

#include <mutex>

using namespace net_scan::engine;
using net_scan::testing::FakeProbe;
using net_scan::testing::FakeProbeState;

namespace
{
    ProbeConfig FastConfig(std::size_t concurrency)
    {
        ProbeConfig config;
        config.timeout = std::chrono::milliseconds(100);
        config.max_concurrency = concurrency;
        config.request_delay = std::chrono::milliseconds(0);
        return config;
    }

    struct Recorder
    {
        std::mutex mutex;
        std::vector<double> progress;
        std::vector<std::string> results;
        int attempts = 0;
        int successes = 0;

        BatchCallbacks Callbacks()
        {
            BatchCallbacks cb;
            cb.on_progress = [this](const std::string &, double fraction)
            {
                std::lock_guard<std::mutex> lock(mutex);
                progress.push_back(fraction);
            };
            cb.on_result = [this](const ProbeResult &r)
            {
                std::lock_guard<std::mutex> lock(mutex);
                results.push_back(r.address);
            };
            cb.on_attempt = [this](ProbeKind, double, bool success)
            {
                std::lock_guard<std::mutex> lock(mutex);
                ++attempts;
                if (success)
                    ++successes;
            };
            return cb;
        }
    };
}

TEST_CASE("a batch returns only confirmed targets", "[engine][batch]")
{
    auto state = std::make_shared<FakeProbeState>();
    state->responsive = {"10.0.0.2", "10.0.0.7"};
    FakeProbe probe(FastConfig(4), ProbeKind::Icmp, state);

    Recorder recorder;
    auto cb = recorder.Callbacks();
    auto targets = MakeTargets({"10.0.0.1", "10.0.0.2", "10.0.0.3", "10.0.0.7", "10.0.0.9"}, "lan");
    auto results = probe.ProbeBatch(targets, cb);

    REQUIRE(results.size() == 2);
    for (const auto &r : results)
    {
        REQUIRE(state->responsive.count(r.address) == 1);
        REQUIRE(r.segment == "lan");
        REQUIRE(r.kind == ProbeKind::Icmp);
    }
    REQUIRE(state->calls.load() == 5);
    REQUIRE(recorder.attempts == 5);
    REQUIRE(recorder.successes == 2);
    REQUIRE(recorder.results.size() == 2);
}

TEST_CASE("batch progress is monotonic and ends at one", "[engine][batch]")
{
    auto state = std::make_shared<FakeProbeState>();
    state->delay = std::chrono::milliseconds(2);
    FakeProbe probe(FastConfig(8), ProbeKind::Tcp, state);

    Recorder recorder;
    auto cb = recorder.Callbacks();
    std::vector<std::string> addresses;
    for (int i = 1; i <= 40; ++i)
        addresses.push_back("10.0.0." + std::to_string(i));
    probe.ProbeBatch(MakeTargets(addresses, "lan"), cb);

    REQUIRE_FALSE(recorder.progress.empty());
    for (std::size_t i = 1; i < recorder.progress.size(); ++i)
        REQUIRE(recorder.progress[i] >= recorder.progress[i - 1]);
    REQUIRE(recorder.progress.back() == Approx(1.0));
}

TEST_CASE("batch concurrency is bounded by max_concurrency", "[engine][batch]")
{
    auto state = std::make_shared<FakeProbeState>();
    state->delay = std::chrono::milliseconds(10);
    FakeProbe probe(FastConfig(3), ProbeKind::Tcp, state);

    std::vector<std::string> addresses;
    for (int i = 1; i <= 20; ++i)
        addresses.push_back("10.0.0." + std::to_string(i));
    probe.ProbeBatch(MakeTargets(addresses, "lan"), {});

    REQUIRE(state->calls.load() == 20);
    REQUIRE(state->peak_in_flight.load() <= 3);
}

TEST_CASE("a non-parallel probe handles targets in order", "[engine][batch]")
{
    auto state = std::make_shared<FakeProbeState>();
    auto config = FastConfig(10);
    config.parallel = false;
    FakeProbe probe(config, ProbeKind::Arp, state);

    std::vector<std::string> addresses = {"10.0.0.5", "10.0.0.1", "10.0.0.3"};
    probe.ProbeBatch(MakeTargets(addresses, "lan"), {});

    REQUIRE(state->Probed() == addresses);
    REQUIRE(state->peak_in_flight.load() == 1);
}

TEST_CASE("an exception inside a probe is a miss", "[engine][batch]")
{
    auto state = std::make_shared<FakeProbeState>();
    state->responsive = {"10.0.0.1", "10.0.0.2"};
    state->failing = {"10.0.0.2"};
    FakeProbe probe(FastConfig(2), ProbeKind::Icmp, state);

    Recorder recorder;
    auto cb = recorder.Callbacks();
    auto results = probe.ProbeBatch(MakeTargets({"10.0.0.1", "10.0.0.2"}, "lan"), cb);

    REQUIRE(results.size() == 1);
    REQUIRE(results[0].address == "10.0.0.1");
    REQUIRE(recorder.attempts == 2);
}

TEST_CASE("a raised abort signal admits no work", "[engine][batch]")
{
    auto state = std::make_shared<FakeProbeState>();
    state->responsive = {"10.0.0.1"};
    FakeProbe probe(FastConfig(2), ProbeKind::Icmp, state);

    AbortSignal abort;
    abort.Raise();
    BatchCallbacks cb;
    cb.abort = &abort;

    REQUIRE(probe.ProbeBatch(MakeTargets({"10.0.0.1", "10.0.0.2"}, "lan"), cb).empty());
    REQUIRE(state->calls.load() == 0);
}

TEST_CASE("an empty batch does nothing", "[engine][batch]")
{
    auto state = std::make_shared<FakeProbeState>();
    FakeProbe probe(FastConfig(2), ProbeKind::Icmp, state);

    Recorder recorder;
    auto cb = recorder.Callbacks();
    REQUIRE(probe.ProbeBatch({}, cb).empty());
    REQUIRE(recorder.progress.empty());
    REQUIRE(state->calls.load() == 0);
}
