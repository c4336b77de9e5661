#include "engine/Semaphore.hpp"
#include "support/Eventually.hpp"

#include <catch2/catch.hpp>

#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

using namespace net_scan::engine;
using net_scan::testing::Eventually;

TEST_CASE("a semaphore never starts with zero permits", "[engine][semaphore]")
{
    Semaphore semaphore(0);
    REQUIRE(semaphore.Available() == 1);
    REQUIRE(semaphore.TryAcquire());
    REQUIRE_FALSE(semaphore.TryAcquire());
    semaphore.Release();
    REQUIRE(semaphore.Available() == 1);
}

TEST_CASE("released permits go to waiters in arrival order", "[engine][semaphore]")
{
    Semaphore semaphore(1);
    semaphore.Acquire();

    std::mutex order_mutex;
    std::vector<int> order;
    auto waiter = [&](int id)
    {
        semaphore.Acquire();
        {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(id);
        }
        semaphore.Release();
    };

    std::thread first(waiter, 1);
    REQUIRE(Eventually([&]
                       { return semaphore.Waiting() == 1; }));
    std::thread second(waiter, 2);
    REQUIRE(Eventually([&]
                       { return semaphore.Waiting() == 2; }));
    std::thread third(waiter, 3);
    REQUIRE(Eventually([&]
                       { return semaphore.Waiting() == 3; }));

    // a newcomer cannot jump the queue
    REQUIRE_FALSE(semaphore.TryAcquire());

    semaphore.Release();
    first.join();
    second.join();
    third.join();

    REQUIRE(order == std::vector<int>{1, 2, 3});
    REQUIRE(semaphore.Available() == 1);
    REQUIRE(semaphore.Waiting() == 0);
}

TEST_CASE("a release with waiters hands the permit over", "[engine][semaphore]")
{
    Semaphore semaphore(1);
    semaphore.Acquire();

    std::atomic<bool> acquired{false};
    std::thread waiter([&]
                       {
                           semaphore.Acquire();
                           acquired = true; });
    REQUIRE(Eventually([&]
                       { return semaphore.Waiting() == 1; }));

    semaphore.Release();
    REQUIRE(semaphore.Available() == 0);
    waiter.join();
    REQUIRE(acquired);

    semaphore.Release();
    REQUIRE(semaphore.Available() == 1);
}

TEST_CASE("concurrency never exceeds the permit count", "[engine][semaphore]")
{
    Semaphore semaphore(3);
    std::atomic<int> inside{0};
    std::atomic<int> peak{0};

    std::vector<std::thread> threads;
    for (int i = 0; i < 12; ++i)
    {
        threads.emplace_back([&]
                             {
                                 SemaphoreGuard permit(semaphore);
                                 int now = ++inside;
                                 int seen = peak.load();
                                 while (now > seen && !peak.compare_exchange_weak(seen, now))
                                 {
                                 }
                                 std::this_thread::sleep_for(std::chrono::milliseconds(5));
                                 --inside; });
    }
    for (auto &t : threads)
        t.join();

    REQUIRE(peak.load() <= 3);
    REQUIRE(peak.load() >= 1);
    REQUIRE(semaphore.Available() == 3);
}
