#include <catch2/catch_test_macros.hpp>

#include "platform/SingleInstanceGuard.hpp"

#include <cstdint>

#ifndef _WIN32
#include <csignal>
#include <sys/wait.h>
#include <unistd.h>
#endif

// Away from the production port so a running CrossTrans does not interfere
constexpr std::uint16_t kTestPort = 47899;

TEST_CASE("Single instance guard", "[platform][guard]") {
    bool alreadyRunning = true;
    auto first = SingleInstanceGuard::Acquire(kTestPort, &alreadyRunning);
    REQUIRE(first != nullptr);
    REQUIRE_FALSE(alreadyRunning);
    REQUIRE(first->port() == kTestPort);

    SECTION("Second acquire reports the running instance") {
        bool running = false;
        auto second = SingleInstanceGuard::Acquire(kTestPort, &running);
        REQUIRE(second == nullptr);
        REQUIRE(running);
    }

    SECTION("Lock is free again after release") {
        first.reset();
        bool running = true;
        auto again = SingleInstanceGuard::Acquire(kTestPort, &running);
        REQUIRE(again != nullptr);
        REQUIRE_FALSE(running);
    }

    SECTION("Other ports are independent") {
        auto other = SingleInstanceGuard::Acquire(kTestPort + 1);
        REQUIRE(other != nullptr);
    }
}

#ifndef _WIN32
TEST_CASE("Single instance guard survives a killed holder", "[platform][guard]") {
    const std::uint16_t port = kTestPort + 2;
    int ready[2];
    REQUIRE(::pipe(ready) == 0);

    pid_t child = ::fork();
    REQUIRE(child >= 0);
    if (child == 0) {
        ::close(ready[0]);
        auto held = SingleInstanceGuard::Acquire(port);
        char ok = held ? '1' : '0';
        (void)::write(ready[1], &ok, 1);
        // Die without running destructors, as a crash would
        held.release();
        ::raise(SIGKILL);
        ::_exit(1);
    }

    ::close(ready[1]);
    char ok = '0';
    REQUIRE(::read(ready[0], &ok, 1) == 1);
    ::close(ready[0]);
    REQUIRE(ok == '1');

    int status = 0;
    REQUIRE(::waitpid(child, &status, 0) == child);
    REQUIRE(WIFSIGNALED(status));

    bool running = true;
    auto guard = SingleInstanceGuard::Acquire(port, &running);
    REQUIRE(guard != nullptr);
    REQUIRE_FALSE(running);
}
#endif
