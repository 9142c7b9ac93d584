#include "jframepp/ServerSocket.hpp"
#include "jframepp/Logging.hpp"
#include "jframepp/internal/ScopedBlockingMode.hpp"

using namespace jframepp;

namespace
{

// Errors after which the listening socket is still healthy and the next readiness wait may succeed.
bool isRetryableAcceptError(const int error)
{
#ifdef _WIN32
    return error == WSAEWOULDBLOCK || error == WSAECONNRESET;
#else
    return error == EAGAIN || error == EWOULDBLOCK || error == ECONNABORTED || error == EPROTO;
#endif
}

} // namespace

ServerSocket::ServerSocket(const Port port, const std::string_view localAddress, const bool reuseAddress)
    : SocketOptions(INVALID_SOCKET)
{
    // AI_PASSIVE: an empty address resolves to the wildcard.
    _srvAddrInfo = internal::resolveAddress(localAddress, port, AF_UNSPEC, SOCK_STREAM, IPPROTO_TCP, AI_PASSIVE);

    // Prefer IPv4 so accepted peers report plain dotted-quad addresses; fall back to anything else.
    for (const int family : {AF_INET, AF_INET6})
    {
        for (addrinfo* p = _srvAddrInfo.get(); p != nullptr && getSocketFd() == INVALID_SOCKET; p = p->ai_next)
        {
            if (p->ai_family != family)
                continue;
            setSocketFd(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
            if (getSocketFd() != INVALID_SOCKET)
                _selectedAddrInfo = p;
        }
    }

    if (getSocketFd() == INVALID_SOCKET)
        cleanupAndThrow(GetSocketError());

    try
    {
        setReuseAddress(reuseAddress);
    }
    catch (const SocketException&)
    {
        cleanupAndRethrow();
    }
}

ServerSocket::ServerSocket(ServerSocket&& rhs) noexcept
    : SocketOptions(rhs.getSocketFd()), _srvAddrInfo(std::move(rhs._srvAddrInfo)),
      _selectedAddrInfo(rhs._selectedAddrInfo), _isBound(rhs._isBound), _isListening(rhs._isListening)
{
    rhs.setSocketFd(INVALID_SOCKET);
    rhs._selectedAddrInfo = nullptr;
    rhs._isBound = false;
    rhs._isListening = false;
}

ServerSocket& ServerSocket::operator=(ServerSocket&& rhs) noexcept
{
    if (this != &rhs)
    {
        cleanup();

        setSocketFd(rhs.getSocketFd());
        _srvAddrInfo = std::move(rhs._srvAddrInfo);
        _selectedAddrInfo = rhs._selectedAddrInfo;
        _isBound = rhs._isBound;
        _isListening = rhs._isListening;

        rhs.setSocketFd(INVALID_SOCKET);
        rhs._selectedAddrInfo = nullptr;
        rhs._isBound = false;
        rhs._isListening = false;
    }
    return *this;
}

ServerSocket::~ServerSocket() noexcept
{
    try
    {
        close();
    }
    catch (const SocketException& e)
    {
        JFRAMEPP_TRANSPORT_WARN("ServerSocket destructor: {}", e.what());
    }
}

void ServerSocket::cleanup()
{
    if (!internal::tryCloseNoexcept(getSocketFd()))
        JFRAMEPP_TRANSPORT_DEBUG("ServerSocket::cleanup(): close failed ({})", GetSocketError());
    setSocketFd(INVALID_SOCKET);
    _srvAddrInfo.reset();
    _selectedAddrInfo = nullptr;
    _isBound = false;
    _isListening = false;
}

void ServerSocket::cleanupAndThrow(const int errorCode)
{
    cleanup();
    throw SocketException(errorCode, SocketErrorMessage(errorCode));
}

void ServerSocket::cleanupAndRethrow()
{
    cleanup();
    throw;
}

void ServerSocket::bind()
{
    if (getSocketFd() == INVALID_SOCKET || _selectedAddrInfo == nullptr)
        throw SocketException("ServerSocket::bind(): socket is not open.");

    if (_isBound)
        throw SocketException("ServerSocket::bind(): socket is already bound.");

    if (::bind(getSocketFd(), _selectedAddrInfo->ai_addr,
#ifdef _WIN32
               static_cast<int>(_selectedAddrInfo->ai_addrlen)
#else
               _selectedAddrInfo->ai_addrlen
#endif
                   ) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }

    _isBound = true;
}

void ServerSocket::listen(const int backlog)
{
    if (!_isBound)
        throw SocketException("ServerSocket::listen(): socket is not bound.");

    if (::listen(getSocketFd(), backlog) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }

    _isListening = true;
}

Socket ServerSocket::accept() const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("Server socket is not initialized or already closed.");

    sockaddr_storage clientAddr{};
    socklen_t addrLen = sizeof(clientAddr);

    for (;;)
    {
        const SOCKET clientSocket = ::accept(getSocketFd(), reinterpret_cast<sockaddr*>(&clientAddr), &addrLen);
        if (clientSocket != INVALID_SOCKET)
            return Socket(clientSocket, clientAddr, addrLen);

        const int error = GetSocketError();
#ifndef _WIN32
        if (error == EINTR)
        {
            addrLen = sizeof(clientAddr);
            continue;
        }
#endif
        throw SocketException(error, SocketErrorMessage(error));
    }
}

std::optional<Socket> ServerSocket::tryAccept() const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("Server socket is not initialized or already closed.");

    internal::ScopedBlockingMode nonBlocking(getSocketFd(), true);

    sockaddr_storage clientAddr{};
    socklen_t addrLen = sizeof(clientAddr);

    for (;;)
    {
        const SOCKET clientSocket = ::accept(getSocketFd(), reinterpret_cast<sockaddr*>(&clientAddr), &addrLen);
        if (clientSocket != INVALID_SOCKET)
        {
            // BSD and Windows hand out the listener's non-blocking flag with the connection.
            Socket client(clientSocket, clientAddr, addrLen);
            client.setNonBlocking(false);
            return client;
        }

        const int error = GetSocketError();
#ifndef _WIN32
        if (error == EINTR)
        {
            addrLen = sizeof(clientAddr);
            continue;
        }
#endif
        if (isRetryableAcceptError(error))
        {
            JFRAMEPP_TRANSPORT_DEBUG("accept() found no connection: {}", SocketErrorMessage(error));
            return std::nullopt;
        }
        throw SocketException(error, SocketErrorMessage(error));
    }
}

bool ServerSocket::waitReady(const int timeoutMillis) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("Server socket is not initialized or already closed.");
    return internal::waitReady(getSocketFd(), false, timeoutMillis);
}

void ServerSocket::close()
{
    internal::closeOrThrow(getSocketFd());
    setSocketFd(INVALID_SOCKET);
    _srvAddrInfo.reset();
    _selectedAddrInfo = nullptr;
    _isBound = false;
    _isListening = false;
}

Port ServerSocket::getLocalPort() const
{
    if (getSocketFd() == INVALID_SOCKET)
        return 0;

    sockaddr_storage addr{};
    socklen_t addrLen = sizeof(addr);
    if (::getsockname(getSocketFd(), reinterpret_cast<sockaddr*>(&addr), &addrLen) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }

    return portFromSockaddr(reinterpret_cast<const sockaddr*>(&addr));
}

std::string ServerSocket::getLocalIp(const bool convertIPv4Mapped) const
{
    if (getSocketFd() == INVALID_SOCKET)
        return {};

    sockaddr_storage addr{};
    socklen_t addrLen = sizeof(addr);
    if (::getsockname(getSocketFd(), reinterpret_cast<sockaddr*>(&addr), &addrLen) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }

    return ipFromSockaddr(reinterpret_cast<const sockaddr*>(&addr), convertIPv4Mapped);
}
