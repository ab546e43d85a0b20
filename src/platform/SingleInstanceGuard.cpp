#include "SingleInstanceGuard.hpp"

#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <cerrno>
#include <cstring>
#include <string>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace
{

#ifdef _WIN32
bool EnsureWinsock()
{
    static const bool initialized = []
    {
        WSADATA data;
        return WSAStartup(MAKEWORD(2, 2), &data) == 0;
    }();
    return initialized;
}

int LastSocketError() { return WSAGetLastError(); }

bool IsAddressInUse(int err) { return err == WSAEADDRINUSE || err == WSAEACCES; }

void CloseSocket(std::uintptr_t s) { closesocket(static_cast<SOCKET>(s)); }
#else
int LastSocketError() { return errno; }

bool IsAddressInUse(int err) { return err == EADDRINUSE; }

void CloseSocket(int s) { close(s); }
#endif

} // namespace

SingleInstanceGuard::SingleInstanceGuard(SocketHandle socket, std::uint16_t port)
    : socket_(socket)
    , port_(port)
{
}

SingleInstanceGuard::~SingleInstanceGuard()
{
    CloseSocket(socket_);
    PLOG_DEBUG << "Released single instance lock on port " << port_;
}

std::unique_ptr<SingleInstanceGuard> SingleInstanceGuard::Acquire(std::uint16_t port, bool* alreadyRunning)
{
    if (alreadyRunning)
        *alreadyRunning = false;

#ifdef _WIN32
    if (!EnsureWinsock())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                          "WSAStartup failed");
        return nullptr;
    }

    SOCKET s = socket(AF_INET, SOCK_STREAM, IPPROTO_TCP);
    if (s == INVALID_SOCKET)
    {
        int err = LastSocketError();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                          "socket() failed with error " + std::to_string(err));
        return nullptr;
    }

    // Without this another process could bind the same port with SO_REUSEADDR
    BOOL exclusive = TRUE;
    if (setsockopt(s, SOL_SOCKET, SO_EXCLUSIVEADDRUSE, reinterpret_cast<const char*>(&exclusive), sizeof(exclusive)) != 0)
        PLOG_WARNING << "SO_EXCLUSIVEADDRUSE not set, error " << LastSocketError();
    auto handle = static_cast<SocketHandle>(s);
#else
    int handle = socket(AF_INET, SOCK_STREAM, 0);
    if (handle < 0)
    {
        int err = LastSocketError();
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                          std::string("socket() failed: ") + std::strerror(err));
        return nullptr;
    }
    // Processes started later (installer, re-exec) must not inherit the lock
    if (fcntl(handle, F_SETFD, FD_CLOEXEC) != 0)
        PLOG_WARNING << "FD_CLOEXEC not set on instance lock: " << std::strerror(errno);
#endif

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

    if (bind(handle, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0 || listen(handle, 1) != 0)
    {
        int err = LastSocketError();
        CloseSocket(handle);

        if (IsAddressInUse(err))
        {
            if (alreadyRunning)
                *alreadyRunning = true;
            PLOG_WARNING << "Another CrossTrans instance is already running (port " << port << " in use).";
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Application already running",
                                                "Another CrossTrans instance is already active.");
        }
        else
        {
            PLOG_ERROR << "Failed to bind single instance port " << port << ": error " << err;
            utils::ErrorReporter::ReportError(utils::ErrorCategory::Initialization, "Single instance guard failure",
                                              "bind/listen on 127.0.0.1:" + std::to_string(port) +
                                                  " failed with error " + std::to_string(err));
        }
        return nullptr;
    }

    PLOG_INFO << "Acquired single instance lock on 127.0.0.1:" << port;
    return std::unique_ptr<SingleInstanceGuard>(new SingleInstanceGuard(handle, port));
}
