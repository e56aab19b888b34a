#include "memobuild/single_flight.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <barrier>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace memobuild;

TEST(SingleFlight, ConcurrentCallersShareOneComputation) {
    SingleFlight<std::string, int> flights;
    std::atomic<int> calls{0};
    std::atomic<bool> release{false};
    std::atomic<int> leaders{0};
    std::vector<int> results(8, 0);

    {
        std::vector<std::jthread> threads;
        for (int i = 0; i < 8; ++i) {
            threads.emplace_back([&, i] {
                auto out = flights.run("key", [&] {
                    calls++;
                    while (!release)
                        std::this_thread::sleep_for(std::chrono::milliseconds(1));
                    return 42;
                });
                results[i] = out.value;
                if (out.leader)
                    leaders++;
            });
        }
        // wait until the leader is inside and everyone else has had time to join it
        while (calls.load() == 0)
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        release = true;
    }

    EXPECT_EQ(leaders.load(), calls.load());
    for (int r : results)
        EXPECT_EQ(r, 42);
    EXPECT_EQ(flights.inflight(), 0u);
}

TEST(SingleFlight, DistinctKeysRunIndependently) {
    SingleFlight<int, int> flights;
    std::barrier sync(2);
    std::atomic<int> calls{0};
    {
        std::jthread a([&] {
            flights.run(1, [&] {
                calls++;
                sync.arrive_and_wait();
                return 1;
            });
        });
        std::jthread b([&] {
            flights.run(2, [&] {
                calls++;
                sync.arrive_and_wait();
                return 2;
            });
        });
    }
    EXPECT_EQ(calls.load(), 2);
}

TEST(SingleFlight, LaterCallsRunAgain) {
    SingleFlight<int, int> flights;
    int calls = 0;
    EXPECT_TRUE(flights.run(7, [&] { return ++calls; }).leader);
    EXPECT_EQ(flights.run(7, [&] { return ++calls; }).value, 2);
}

TEST(SingleFlight, ExceptionsReachTheLeaderAndClearTheEntry) {
    SingleFlight<int, int> flights;
    EXPECT_THROW(flights.run(1, []() -> int { throw std::runtime_error("boom"); }), std::runtime_error);
    EXPECT_EQ(flights.inflight(), 0u);
    EXPECT_EQ(flights.run(1, [] { return 5; }).value, 5);
}
