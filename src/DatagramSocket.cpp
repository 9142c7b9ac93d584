#include "jframepp/DatagramSocket.hpp"
#include "jframepp/Logging.hpp"
#include "jframepp/SocketException.hpp"

#include <algorithm>

using namespace jframepp;

DatagramSocket::DatagramSocket(const Port localPort, const std::string_view localAddress)
    : SocketOptions(INVALID_SOCKET)
{
    _localAddrInfo = internal::resolveAddress(localAddress, localPort, AF_UNSPEC, SOCK_DGRAM, IPPROTO_UDP, AI_PASSIVE);

    for (const int family : {AF_INET, AF_INET6})
    {
        for (addrinfo* p = _localAddrInfo.get(); p != nullptr && getSocketFd() == INVALID_SOCKET; p = p->ai_next)
        {
            if (p->ai_family != family)
                continue;
            setSocketFd(::socket(p->ai_family, p->ai_socktype, p->ai_protocol));
            if (getSocketFd() != INVALID_SOCKET)
            {
                _selectedAddrInfo = p;
                _family = p->ai_family;
            }
        }
    }

    if (getSocketFd() == INVALID_SOCKET)
        cleanupAndThrow(GetSocketError());
}

DatagramSocket::DatagramSocket(DatagramSocket&& rhs) noexcept
    : SocketOptions(rhs.getSocketFd()), _localAddrInfo(std::move(rhs._localAddrInfo)),
      _selectedAddrInfo(rhs._selectedAddrInfo), _family(rhs._family), _isBound(rhs._isBound)
{
    rhs.setSocketFd(INVALID_SOCKET);
    rhs._selectedAddrInfo = nullptr;
    rhs._isBound = false;
}

DatagramSocket& DatagramSocket::operator=(DatagramSocket&& rhs) noexcept
{
    if (this != &rhs)
    {
        cleanup();

        setSocketFd(rhs.getSocketFd());
        _localAddrInfo = std::move(rhs._localAddrInfo);
        _selectedAddrInfo = rhs._selectedAddrInfo;
        _family = rhs._family;
        _isBound = rhs._isBound;

        rhs.setSocketFd(INVALID_SOCKET);
        rhs._selectedAddrInfo = nullptr;
        rhs._isBound = false;
    }
    return *this;
}

DatagramSocket::~DatagramSocket() noexcept
{
    try
    {
        close();
    }
    catch (const SocketException& e)
    {
        JFRAMEPP_TRANSPORT_WARN("DatagramSocket destructor: {}", e.what());
    }
}

void DatagramSocket::cleanup()
{
    if (!internal::tryCloseNoexcept(getSocketFd()))
        JFRAMEPP_TRANSPORT_DEBUG("DatagramSocket::cleanup(): close failed ({})", GetSocketError());
    setSocketFd(INVALID_SOCKET);
    _localAddrInfo.reset();
    _selectedAddrInfo = nullptr;
    _isBound = false;
}

void DatagramSocket::cleanupAndThrow(const int errorCode)
{
    cleanup();
    throw SocketException(errorCode, SocketErrorMessage(errorCode));
}

void DatagramSocket::close()
{
    internal::closeOrThrow(getSocketFd());
    setSocketFd(INVALID_SOCKET);
    _localAddrInfo.reset();
    _selectedAddrInfo = nullptr;
    _isBound = false;
}

void DatagramSocket::bind()
{
    if (getSocketFd() == INVALID_SOCKET || _selectedAddrInfo == nullptr)
        throw SocketException("DatagramSocket::bind(): socket is not open.");

    if (_isBound)
        throw SocketException("DatagramSocket::bind(): socket is already bound.");

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

DatagramReceiveResult DatagramSocket::receiveFrom(char* buf, const std::size_t len) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("DatagramSocket::receiveFrom(): socket is not open.");

    if (buf == nullptr || len == 0)
        throw SocketException("DatagramSocket::receiveFrom(): invalid buffer/length.");

    DatagramReceiveResult result;
    sockaddr_storage src{};

    for (;;)
    {
#ifdef _WIN32
        int srcLen = sizeof(src);
        const int n = ::recvfrom(getSocketFd(), buf, static_cast<int>(len), 0, reinterpret_cast<sockaddr*>(&src),
                                 &srcLen);
        if (n == SOCKET_ERROR)
        {
            const int err = GetSocketError();
            if (err != WSAEMSGSIZE)
                throw SocketException(err, SocketErrorMessage(err));
            // Windows fills the buffer, then reports the overflow as an error.
            result.bytes = len;
            result.datagramSize = len;
            result.truncated = true;
        }
        else
        {
            result.bytes = static_cast<std::size_t>(n);
            result.datagramSize = result.bytes;
        }
        break;
#else
        msghdr msg{};
        iovec iov{};
        iov.iov_base = buf;
        iov.iov_len = len;
        msg.msg_iov = &iov;
        msg.msg_iovlen = 1;
        msg.msg_name = &src;
        msg.msg_namelen = sizeof(src);

        int flags = 0;
#if defined(__linux__)
        // Linux: the return value becomes the full datagram size even when it exceeds the buffer.
        flags |= MSG_TRUNC;
#endif

        const ssize_t n = ::recvmsg(getSocketFd(), &msg, flags);
        if (n < 0)
        {
            const int err = GetSocketError();
            if (err == EINTR)
                continue;
            throw SocketException(err, SocketErrorMessage(err));
        }

        const auto reported = static_cast<std::size_t>(n);
        result.bytes = std::min(reported, len);
        result.datagramSize = reported;
        result.truncated = (msg.msg_flags & MSG_TRUNC) != 0;
        break;
#endif
    }

    result.senderIp = ipFromSockaddr(reinterpret_cast<const sockaddr*>(&src));
    result.senderPort = portFromSockaddr(reinterpret_cast<const sockaddr*>(&src));
    return result;
}

void DatagramSocket::sendTo(const std::string_view host, const Port port, const std::string_view data) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("DatagramSocket::sendTo(): socket is not open.");

    const auto addrInfo = internal::resolveAddress(host, port, _family, SOCK_DGRAM, IPPROTO_UDP);

    int lastErr = 0;
    for (const addrinfo* ai = addrInfo.get(); ai != nullptr; ai = ai->ai_next)
    {
        int flags = 0;
#ifndef _WIN32
        flags = MSG_NOSIGNAL;
#endif
        const auto sent = ::sendto(getSocketFd(), data.data(),
#ifdef _WIN32
                                   static_cast<int>(data.size()), flags, ai->ai_addr,
                                   static_cast<int>(ai->ai_addrlen)
#else
                                   data.size(), flags, ai->ai_addr, ai->ai_addrlen
#endif
        );

        if (sent == SOCKET_ERROR)
        {
            lastErr = GetSocketError();
            continue;
        }

        if (static_cast<std::size_t>(sent) != data.size())
            throw SocketException("DatagramSocket::sendTo(): partial datagram sent.");
        return;
    }

    throw SocketException(lastErr, SocketErrorMessage(lastErr));
}

bool DatagramSocket::waitReady(const int timeoutMillis) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("DatagramSocket::waitReady(): socket is not open.");
    return internal::waitReady(getSocketFd(), false, timeoutMillis);
}

Port DatagramSocket::getLocalPort() const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("DatagramSocket::getLocalPort(): socket is not open.");

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(getSocketFd(), reinterpret_cast<sockaddr*>(&addr), &len) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
    return portFromSockaddr(reinterpret_cast<const sockaddr*>(&addr));
}

std::string DatagramSocket::getLocalIp(const bool convertIPv4Mapped) const
{
    if (getSocketFd() == INVALID_SOCKET)
        throw SocketException("DatagramSocket::getLocalIp(): socket is not open.");

    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(getSocketFd(), reinterpret_cast<sockaddr*>(&addr), &len) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
    return ipFromSockaddr(reinterpret_cast<const sockaddr*>(&addr), convertIPv4Mapped);
}
