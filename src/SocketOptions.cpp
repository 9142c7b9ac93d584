#include "jframepp/SocketOptions.hpp"
#include "jframepp/SocketException.hpp"

using namespace jframepp;

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setFlag(const int level, const int option, const int value, const char* name)
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException(std::string("Cannot set ") + name + ": socket is not open.");

#ifdef _WIN32
    const auto* raw = reinterpret_cast<const char*>(&value);
#else
    const void* raw = &value;
#endif
    if (::setsockopt(_sockFd, level, option, raw, static_cast<socklen_t>(sizeof(value))) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SocketException(error, std::string("Cannot set ") + name + ": " + SocketErrorMessage(error));
    }
}

void SocketOptions::setReuseAddress(const bool on)
{
    setFlag(SOL_SOCKET, SO_REUSEADDR, on ? 1 : 0, "SO_REUSEADDR");
}

void SocketOptions::setTcpNoDelay(const bool on)
{
    setFlag(IPPROTO_TCP, TCP_NODELAY, on ? 1 : 0, "TCP_NODELAY");
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setNonBlocking(const bool nonBlocking)
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("Cannot change blocking mode: socket is not open.");

#ifdef _WIN32
    u_long mode = nonBlocking ? 1 : 0;
    if (::ioctlsocket(_sockFd, FIONBIO, &mode) != 0)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
#else
    const int flags = ::fcntl(_sockFd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(_sockFd, F_SETFL, nonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK)) < 0)
        throw SocketException(errno, "Cannot change blocking mode: " + SocketErrorMessage(errno));
#endif
}
