#include "jframepp/LocalAddress.hpp"

#include "jframepp/common.hpp"
#include "jframepp/Logging.hpp"

#include <array>

using namespace jframepp;

namespace
{

constexpr const char* ProbeHost = "8.8.8.8";
constexpr Port ProbePort = 80;
constexpr const char* LoopbackAddress = "127.0.0.1";

// Connecting a UDP socket only selects a route; no packet leaves the host.
std::string addressFromRoute()
{
    const auto target = internal::resolveAddress(ProbeHost, ProbePort, AF_INET, SOCK_DGRAM, IPPROTO_UDP,
                                                 AI_NUMERICHOST);

    const SOCKET fd = ::socket(target->ai_family, target->ai_socktype, target->ai_protocol);
    if (fd == INVALID_SOCKET)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }

    std::string result;
    int error = 0;
    if (::connect(fd, target->ai_addr,
#ifdef _WIN32
                  static_cast<int>(target->ai_addrlen)
#else
                  target->ai_addrlen
#endif
                      ) == SOCKET_ERROR)
    {
        error = GetSocketError();
    }
    else
    {
        sockaddr_storage local{};
        socklen_t len = sizeof(local);
        if (::getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == SOCKET_ERROR)
            error = GetSocketError();
        else
            result = ipFromSockaddr(reinterpret_cast<const sockaddr*>(&local));
    }

    internal::tryCloseNoexcept(fd);

    if (error != 0)
        throw SocketException(error, SocketErrorMessage(error));
    if (result.empty() || result == "0.0.0.0")
        throw SocketException("route lookup returned an unspecified address");
    return result;
}

std::string addressFromHostname()
{
    std::array<char, 256> name{};
    if (::gethostname(name.data(), static_cast<int>(name.size() - 1)) != 0)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }

    const auto info = internal::resolveAddress(name.data(), 0, AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    return ipFromSockaddr(info->ai_addr);
}

} // namespace

std::string jframepp::getLocalAddress() noexcept
{
    try
    {
        return addressFromRoute();
    }
    catch (const std::exception& e)
    {
        JFRAMEPP_TRANSPORT_DEBUG("getLocalAddress(): route probe failed: {}", e.what());
    }

    try
    {
        return addressFromHostname();
    }
    catch (const std::exception& e)
    {
        JFRAMEPP_TRANSPORT_DEBUG("getLocalAddress(): host name lookup failed: {}", e.what());
    }

    return LoopbackAddress;
}
