#include "jframepp/common.hpp"

#include <system_error>

using namespace jframepp;

std::string jframepp::SocketErrorMessage(int error, [[maybe_unused]] const bool gaiStrerror /* = false */)
{
    if (error == 0)
        return {};

    // Some APIs report negative errno-like values.
    if (error < 0)
        error = -error;

#ifdef _WIN32
    if (gaiStrerror)
    {
        if (const char* m = ::gai_strerrorA(error); m && *m)
            return {m}; // gai_strerrorA uses a static buffer
    }

    {
        LPSTR buffer = nullptr;
        constexpr DWORD flags =
            FORMAT_MESSAGE_ALLOCATE_BUFFER | FORMAT_MESSAGE_FROM_SYSTEM | FORMAT_MESSAGE_IGNORE_INSERTS;
        const DWORD size = ::FormatMessageA(flags, nullptr, static_cast<DWORD>(error),
                                            MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
                                            reinterpret_cast<LPSTR>(&buffer), 0, nullptr);
        if (size != 0 && buffer)
        {
            std::string msg(buffer, size);
            ::LocalFree(buffer);
            while (!msg.empty() && (msg.back() == '\r' || msg.back() == '\n' || msg.back() == ' ' || msg.back() == '.'))
                msg.pop_back();
            if (!msg.empty())
                return msg;
        }
    }
#else
    if (gaiStrerror)
    {
        if (const char* m = ::gai_strerror(error); m && *m)
            return {m};
    }
#endif

    try
    {
        if (std::string m = std::system_category().message(error); !m.empty())
            return m;
    }
    catch (const std::exception&)
    {
        // Fall through to the generic message below.
    }

    return "Unknown error " + std::to_string(error);
}

std::string jframepp::ipFromSockaddr(const sockaddr* addr, const bool convertIPv4Mapped)
{
    char buf[INET6_ADDRSTRLEN] = {};

    DIAGNOSTIC_PUSH()
    DIAGNOSTIC_IGNORE("-Wcast-align")
    if (addr->sa_family == AF_INET)
    {
        const auto* sa = reinterpret_cast<const sockaddr_in*>(addr);
        if (!inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf)))
        {
            const int error = GetSocketError();
            throw SocketException(error, SocketErrorMessage(error));
        }
    }
    else if (addr->sa_family == AF_INET6)
    {
        const auto* sa6 = reinterpret_cast<const sockaddr_in6*>(addr);

        if (convertIPv4Mapped && IN6_IS_ADDR_V4MAPPED(&sa6->sin6_addr))
        {
            const uint8_t* b = &sa6->sin6_addr.s6_addr[12];
            return std::to_string(b[0]) + '.' + std::to_string(b[1]) + '.' + std::to_string(b[2]) + '.' +
                   std::to_string(b[3]);
        }

        if (!inet_ntop(AF_INET6, &sa6->sin6_addr, buf, sizeof(buf)))
        {
            const int error = GetSocketError();
            throw SocketException(error, SocketErrorMessage(error));
        }
    }
    else
    {
        throw SocketException("Unsupported address family in ipFromSockaddr");
    }
    DIAGNOSTIC_POP()

    return {buf};
}

Port jframepp::portFromSockaddr(const sockaddr* addr)
{
    DIAGNOSTIC_PUSH()
    DIAGNOSTIC_IGNORE("-Wcast-align")
    switch (addr->sa_family)
    {
        case AF_INET:
            return ntohs(reinterpret_cast<const sockaddr_in*>(addr)->sin_port);

        case AF_INET6:
            return ntohs(reinterpret_cast<const sockaddr_in6*>(addr)->sin6_port);

        default:
            throw SocketException("Unsupported address family in portFromSockaddr");
    }
    DIAGNOSTIC_POP()
}

bool internal::waitReady(const SOCKET fd, const bool forWrite, const int timeoutMillis)
{
    if (fd == INVALID_SOCKET)
        throw SocketException("waitReady() failed: socket is not open.");

#ifdef _WIN32
    WSAPOLLFD pfd{};
    pfd.fd = fd;
    pfd.events = forWrite ? POLLWRNORM : POLLRDNORM;

    const int rc = ::WSAPoll(&pfd, 1, (timeoutMillis < 0) ? -1 : timeoutMillis);
    if (rc == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
    return rc > 0;
#else
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = forWrite ? POLLOUT : POLLIN;

    for (;;)
    {
        const int rc = ::poll(&pfd, 1, (timeoutMillis < 0) ? -1 : timeoutMillis);
        if (rc > 0)
        {
            if (pfd.revents & POLLNVAL)
                throw SocketException(EBADF, SocketErrorMessage(EBADF));
            // POLLHUP/POLLERR are reported as ready: the next recv()/send() surfaces the condition.
            return true;
        }
        if (rc == 0)
            return false;

        const int error = GetSocketError();
        if (error == EINTR)
            continue;
        throw SocketException(error, SocketErrorMessage(error));
    }
#endif
}
