#pragma once

#include <cstdint>
#include <memory>

// Holds a listening loopback socket for the lifetime of the process.
// The bound port is the lock; the OS releases it on any exit, including a crash.
class SingleInstanceGuard
{
public:
    static constexpr std::uint16_t kDefaultPort = 47823;

    // nullptr when the port cannot be held; alreadyRunning tells another instance apart from a socket failure
    static std::unique_ptr<SingleInstanceGuard> Acquire(std::uint16_t port = kDefaultPort,
                                                        bool* alreadyRunning = nullptr);
    ~SingleInstanceGuard();

    SingleInstanceGuard(const SingleInstanceGuard&) = delete;
    SingleInstanceGuard& operator=(const SingleInstanceGuard&) = delete;

    std::uint16_t port() const { return port_; }

private:
#ifdef _WIN32
    using SocketHandle = std::uintptr_t;
#else
    using SocketHandle = int;
#endif

    SingleInstanceGuard(SocketHandle socket, std::uint16_t port);

    SocketHandle socket_;
    std::uint16_t port_;
};
