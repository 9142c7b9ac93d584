#include "jframepp/Socket.hpp"

#include "jframepp/internal/ScopedBlockingMode.hpp"
#include "jframepp/Logging.hpp"
#include "jframepp/SocketTimeoutException.hpp"

#include <cstring> // std::memcpy
#include <optional>

using namespace jframepp;

Socket::Socket(const SOCKET client, const sockaddr_storage& addr, const socklen_t len)
    : SocketOptions(client), _remoteAddr(addr), _remoteAddrLen(len)
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("Socket(SOCKET): invalid socket descriptor.");

    _isConnected = true;
}

Socket::Socket(const std::string_view host, const Port port, const bool autoConnect, const int connectTimeoutMillis)
    : SocketOptions(INVALID_SOCKET)
{
    _cliAddrInfo = internal::resolveAddress(host, port, AF_UNSPEC, SOCK_STREAM, IPPROTO_TCP);

    for (addrinfo* p = _cliAddrInfo.get(); p != nullptr; p = p->ai_next)
    {
        setSocketFd(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
        if (getSocketFd() != INVALID_SOCKET)
        {
            _selectedAddrInfo = p;
            break;
        }
    }

    if (getSocketFd() == INVALID_SOCKET)
        cleanupAndThrow(GetSocketError());

    try
    {
        // Frames are usually small and latency matters more than segment count.
        setTcpNoDelay(true);

        if (autoConnect)
            connect(connectTimeoutMillis);
    }
    catch (const SocketException&)
    {
        cleanupAndRethrow();
    }
}

Socket::Socket(Socket&& rhs) noexcept
    : SocketOptions(rhs.getSocketFd()), _remoteAddr(rhs._remoteAddr), _remoteAddrLen(rhs._remoteAddrLen),
      _cliAddrInfo(std::move(rhs._cliAddrInfo)), _selectedAddrInfo(rhs._selectedAddrInfo),
      _isConnected(rhs._isConnected)
{
    rhs.setSocketFd(INVALID_SOCKET);
    rhs._selectedAddrInfo = nullptr;
    rhs._isConnected = false;
}

Socket& Socket::operator=(Socket&& rhs) noexcept
{
    if (this != &rhs)
    {
        cleanup();

        setSocketFd(rhs.getSocketFd());
        _remoteAddr = rhs._remoteAddr;
        _remoteAddrLen = rhs._remoteAddrLen;
        _cliAddrInfo = std::move(rhs._cliAddrInfo);
        _selectedAddrInfo = rhs._selectedAddrInfo;
        _isConnected = rhs._isConnected;

        rhs.setSocketFd(INVALID_SOCKET);
        rhs._selectedAddrInfo = nullptr;
        rhs._isConnected = false;
    }
    return *this;
}

void Socket::cleanup()
{
    if (!internal::tryCloseNoexcept(getSocketFd()))
        JFRAMEPP_TRANSPORT_DEBUG("Socket::cleanup(): close failed ({})", GetSocketError());
    setSocketFd(INVALID_SOCKET);
    _cliAddrInfo.reset();
    _selectedAddrInfo = nullptr;
    _isConnected = false;
}

void Socket::cleanupAndThrow(const int errorCode)
{
    cleanup();
    throw SocketException(errorCode, SocketErrorMessage(errorCode));
}

void Socket::cleanupAndRethrow()
{
    cleanup();
    throw;
}

void Socket::connect(const int timeoutMillis)
{
    if (_isConnected)
        throw SocketException("connect() called on an already-connected socket");

    if (_selectedAddrInfo == nullptr)
        throw SocketException("connect() failed: no resolved address to connect to");

    const bool useNonBlocking = (timeoutMillis >= 0);

    std::optional<internal::ScopedBlockingMode> blockingGuard;
    if (useNonBlocking)
        blockingGuard.emplace(getSocketFd(), true);

    const auto res = ::connect(getSocketFd(), _selectedAddrInfo->ai_addr,
#ifdef _WIN32
                               static_cast<int>(_selectedAddrInfo->ai_addrlen)
#else
                               _selectedAddrInfo->ai_addrlen
#endif
    );

    if (res == SOCKET_ERROR)
    {
        const int error = GetSocketError();
#ifdef _WIN32
        const bool wouldBlock = (error == WSAEINPROGRESS || error == WSAEWOULDBLOCK);
#else
        const bool wouldBlock = (error == EINPROGRESS || error == EWOULDBLOCK);
#endif

        if (!useNonBlocking || !wouldBlock)
            throw SocketException(error, SocketErrorMessage(error));

        if (!internal::waitReady(getSocketFd(), true, timeoutMillis))
            throw SocketTimeoutException(JFRAMEPP_TIMEOUT_CODE,
                                         "Connection timed out after " + std::to_string(timeoutMillis) + " ms");

        // Writability only says the attempt finished; SO_ERROR says how.
        int soError = 0;
        socklen_t len = sizeof(soError);
        if (::getsockopt(getSocketFd(), SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&soError), &len) < 0)
        {
            const int err = GetSocketError();
            throw SocketException(err, SocketErrorMessage(err));
        }
        if (soError != 0)
            throw SocketException(soError, SocketErrorMessage(soError));
    }

    std::memcpy(&_remoteAddr, _selectedAddrInfo->ai_addr, _selectedAddrInfo->ai_addrlen);
    _remoteAddrLen = static_cast<socklen_t>(_selectedAddrInfo->ai_addrlen);
    _isConnected = true;
}

Socket::~Socket() noexcept
{
    try
    {
        close();
    }
    catch (const SocketException& e)
    {
        JFRAMEPP_TRANSPORT_WARN("Socket destructor: {}", e.what());
    }
}

void Socket::close()
{
    internal::closeOrThrow(getSocketFd());
    setSocketFd(INVALID_SOCKET);
    _cliAddrInfo.reset();
    _selectedAddrInfo = nullptr;
    _isConnected = false;
}

void Socket::shutdown(const ShutdownMode how) const
{
    int shutdownType;
#ifdef _WIN32
    switch (how)
    {
        case ShutdownMode::Read:
            shutdownType = SD_RECEIVE;
            break;
        case ShutdownMode::Write:
            shutdownType = SD_SEND;
            break;
        case ShutdownMode::Both:
        default:
            shutdownType = SD_BOTH;
            break;
    }
#else
    switch (how)
    {
        case ShutdownMode::Read:
            shutdownType = SHUT_RD;
            break;
        case ShutdownMode::Write:
            shutdownType = SHUT_WR;
            break;
        case ShutdownMode::Both:
        default:
            shutdownType = SHUT_RDWR;
            break;
    }
#endif

    if (getSocketFd() == INVALID_SOCKET)
        return;

    if (::shutdown(getSocketFd(), shutdownType) != 0)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
}

std::string Socket::getRemoteIp(const bool convertIPv4Mapped) const
{
    if (_remoteAddrLen == 0)
        throw SocketException("getRemoteIp() failed: socket is not connected.");
    return ipFromSockaddr(reinterpret_cast<const sockaddr*>(&_remoteAddr), convertIPv4Mapped);
}

Port Socket::getRemotePort() const
{
    if (_remoteAddrLen == 0)
        throw SocketException("getRemotePort() failed: socket is not connected.");
    return portFromSockaddr(reinterpret_cast<const sockaddr*>(&_remoteAddr));
}

std::string Socket::getLocalIp(const bool convertIPv4Mapped) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("getLocalIp() failed: socket is not open.");

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(getSocketFd(), reinterpret_cast<sockaddr*>(&addr), &len) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
    return ipFromSockaddr(reinterpret_cast<const sockaddr*>(&addr), convertIPv4Mapped);
}

Port Socket::getLocalPort() const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("getLocalPort() failed: socket is not open.");

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(getSocketFd(), reinterpret_cast<sockaddr*>(&addr), &len) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
    return portFromSockaddr(reinterpret_cast<const sockaddr*>(&addr));
}

std::size_t Socket::readInto(void* buffer, const std::size_t len) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("readInto() failed: socket is not open.");

    if (buffer == nullptr || len == 0)
        return 0;

    for (;;)
    {
        const auto bytesRead = ::recv(getSocketFd(), static_cast<char*>(buffer),
#ifdef _WIN32
                                      static_cast<int>(len),
#else
                                      len,
#endif
                                      0);

        if (bytesRead == SOCKET_ERROR)
        {
            const int error = GetSocketError();
#ifndef _WIN32
            if (error == EINTR)
                continue;
#endif
            throw SocketException(error, SocketErrorMessage(error));
        }

        return static_cast<std::size_t>(bytesRead);
    }
}

std::size_t Socket::write(const std::string_view data) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("write() failed: socket is not open.");

    int flags = 0;
#ifndef _WIN32
    flags = MSG_NOSIGNAL;
#endif

    for (;;)
    {
        const auto len = ::send(getSocketFd(), data.data(),
#ifdef _WIN32
                                static_cast<int>(data.size()),
#else
                                data.size(),
#endif
                                flags);
        if (len == SOCKET_ERROR)
        {
            const int error = GetSocketError();
#ifndef _WIN32
            if (error == EINTR)
                continue;
#endif
            throw SocketException(error, SocketErrorMessage(error));
        }
        return static_cast<std::size_t>(len);
    }
}

std::size_t Socket::writeAll(const std::string_view data) const
{
    std::size_t totalSent = 0;
    while (totalSent < data.size())
    {
        const auto sent = write(data.substr(totalSent));
        if (sent == 0)
            throw SocketException("Connection closed during writeAll()");
        totalSent += sent;
    }
    return totalSent;
}

bool Socket::waitReady(const bool forWrite, const int timeoutMillis) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("waitReady() failed: socket is not open.");
    return internal::waitReady(getSocketFd(), forWrite, timeoutMillis);
}
