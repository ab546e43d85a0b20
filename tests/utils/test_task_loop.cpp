#include <catch2/catch_test_macros.hpp>

#include "utils/TaskLoop.hpp"

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using utils::TaskLoop;

TEST_CASE("Task loop", "[utils][tasks]") {
    TaskLoop loop;
    std::vector<std::string> ran;

    SECTION("Posted tasks run in order on the next turn") {
        loop.post([&] { ran.push_back("a"); });
        loop.post([&] { ran.push_back("b"); });
        REQUIRE(loop.pendingCount() == 2);
        REQUIRE(loop.runOnce(0ms) == 2);
        REQUIRE(ran == std::vector<std::string>{ "a", "b" });
        REQUIRE(loop.pendingCount() == 0);
    }

    SECTION("Delayed tasks wait for their time") {
        loop.postDelayed(50ms, [&] { ran.push_back("late"); });
        loop.post([&] { ran.push_back("now"); });

        REQUIRE(loop.runOnce(0ms) == 1);
        REQUIRE(ran == std::vector<std::string>{ "now" });

        auto start = std::chrono::steady_clock::now();
        std::size_t total = 0;
        while (total == 0 && std::chrono::steady_clock::now() - start < 2s) {
            total += loop.runOnce(100ms);
        }
        REQUIRE(ran == std::vector<std::string>{ "now", "late" });
        REQUIRE(std::chrono::steady_clock::now() - start >= 40ms);
    }

    SECTION("Tasks posted by a task run on a later turn") {
        loop.post([&] {
            ran.push_back("outer");
            loop.post([&] { ran.push_back("inner"); });
        });
        REQUIRE(loop.runOnce(0ms) == 1);
        REQUIRE(loop.pendingCount() == 1);
        REQUIRE(loop.runOnce(0ms) == 1);
        REQUIRE(ran == std::vector<std::string>{ "outer", "inner" });
    }

    SECTION("A post from another thread wakes the loop") {
        std::thread worker([&] {
            std::this_thread::sleep_for(20ms);
            loop.post([&] { ran.push_back("worker"); });
        });
        auto start = std::chrono::steady_clock::now();
        std::size_t total = 0;
        while (total == 0 && std::chrono::steady_clock::now() - start < 5s) {
            total += loop.runOnce(5s);
        }
        worker.join();
        REQUIRE(ran == std::vector<std::string>{ "worker" });
        REQUIRE(std::chrono::steady_clock::now() - start < 4s);
    }

    SECTION("Empty tasks are ignored") {
        loop.post(nullptr);
        REQUIRE(loop.pendingCount() == 0);
    }
}
