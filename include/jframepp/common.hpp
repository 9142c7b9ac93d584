/**
 * @file common.hpp
 * @brief Platform includes, socket type aliases, shared constants and address helpers for jframepp.
 */

#pragma once

#include "SocketException.hpp"

#include <cstddef> // std::size_t
#include <cstdint>
#include <cstring> // std::memset()
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

#ifdef __GNUC__
#define QUOTE(s) #s
#define DIAGNOSTIC_PUSH() _Pragma("GCC diagnostic push")
#define DIAGNOSTIC_IGNORE(warning) _Pragma(QUOTE(GCC diagnostic ignored warning))
#define DIAGNOSTIC_POP() _Pragma("GCC diagnostic pop")
#else
#define DIAGNOSTIC_PUSH()
#define DIAGNOSTIC_IGNORE(warning)
#define DIAGNOSTIC_POP()
#endif

#ifdef _WIN32

// Do not reorder includes here, because Windows headers have specific order requirements.
// clang-format off
#include <winsock2.h> // Must come first: socket, bind, listen, accept, etc.
#include <ws2tcpip.h> // TCP/IP functions: getaddrinfo, getnameinfo, inet_ntop, inet_pton
#include <windows.h>  // FormatMessageA
// clang-format on

#ifdef _MSC_VER
#pragma comment(lib, "Ws2_32.lib")
#endif

#else

#include <arpa/inet.h>   //inet_ntop, inet_pton
#include <cerrno>        //errno
#include <fcntl.h>       //fcntl
#include <netdb.h>       //addrinfo
#include <netinet/in.h>  //sockaddr_in, sockaddr_in6
#include <netinet/tcp.h> //TCP_NODELAY
#include <poll.h>        //poll
#include <sys/socket.h>  //socket
#include <sys/types.h>   //socket
#include <unistd.h>      //close, gethostname

#endif

/**
 * @defgroup jframepp jframepp: length-prefixed message exchange over TCP and UDP
 * @brief Framing, connection lifecycle and background message delivery on top of BSD sockets.
 *
 * @code
 * #include <jframepp/StreamServer.hpp>
 * #include <jframepp/StreamClient.hpp>
 * #include <jframepp/DatagramEndpoint.hpp>
 * @endcode
 */

/**
 * @defgroup core Core Utilities and Types
 * @ingroup jframepp
 * @brief Type aliases, constants and platform abstractions shared by every component.
 */

/**
 * @defgroup transport Socket Transport
 * @ingroup jframepp
 * @brief RAII wrappers over stream, listening and datagram sockets.
 */

/**
 * @defgroup messaging Messaging
 * @ingroup jframepp
 * @brief Frame codec, inbound queues, connections, servers, clients and datagram endpoints.
 */

/**
 * @defgroup exceptions Exception Classes
 * @ingroup jframepp
 * @brief Exception types used by jframepp for error reporting.
 */

/**
 * @defgroup internal Internal Helpers
 * @ingroup jframepp
 * @brief Implementation-only utilities. Not part of the public API.
 */

/**
 * @namespace jframepp
 * @brief Length-prefixed, asynchronous message exchange over stream and datagram sockets.
 *
 * - FrameCodec: length-prefix encoding and short-read-safe decoding
 * - PeerConnection: one stream socket with a background receive loop
 * - StreamServer: accept loop, peer registry and per-peer receive loops
 * - StreamClient: one outbound PeerConnection
 * - DatagramEndpoint: one UDP socket with a background receive loop
 *
 * @note Unless stated otherwise, objects are meant to be driven from a single application thread.
 *       The background loops they own communicate with that thread only through their inbound queues.
 */
namespace jframepp
{
#ifdef _WIN32

typedef long ssize_t;

inline int InitSockets()
{
    WSADATA WSAData;
    return WSAStartup(MAKEWORD(2, 2), &WSAData);
}

inline int CleanupSockets()
{
    return WSACleanup();
}

inline int GetSocketError()
{
    return WSAGetLastError();
}

// NOLINTNEXTLINE(misc-const-correctness) - changes socket state
inline int CloseSocket(SOCKET fd)
{
    return closesocket(fd);
}

#define JFRAMEPP_TIMEOUT_CODE WSAETIMEDOUT

#else

typedef int SOCKET;
constexpr SOCKET INVALID_SOCKET = -1;
constexpr SOCKET SOCKET_ERROR = -1;

#define JFRAMEPP_TIMEOUT_CODE ETIMEDOUT

constexpr int InitSockets()
{
    return 0;
}
constexpr int CleanupSockets()
{
    return 0;
}
inline int GetSocketError()
{
    return errno;
}
inline int CloseSocket(const SOCKET fd)
{
    return close(fd);
}

#endif

/**
 * @brief Convert a socket-related error code to a human-readable message.
 *
 * Pass `errno`/`WSAGetLastError()` values with @p gaiStrerror set to false, and the non-zero return value of
 * `getaddrinfo()`/`getnameinfo()` with @p gaiStrerror set to true. Never throws; unknown codes produce
 * `"Unknown error <code>"` and `0` produces an empty string.
 */
std::string SocketErrorMessage(int error, bool gaiStrerror = false);

/**
 * @brief Enum for socket shutdown modes.
 */
enum class ShutdownMode
{
    Read,  ///< Shutdown read operations (SHUT_RD or SD_RECEIVE)
    Write, ///< Shutdown write operations (SHUT_WR or SD_SEND)
    Both   ///< Shutdown both read and write operations (SHUT_RDWR or SD_BOTH)
};

/**
 * @typedef Port
 * @brief TCP or UDP port number.
 * @ingroup core
 */
using Port = std::uint16_t;

/**
 * @brief Port used by servers, clients and datagram endpoints when none is given.
 * @ingroup core
 */
inline constexpr Port DefaultPort = 1024;

/**
 * @brief Default width, in bytes, of the big-endian length header that precedes every stream frame.
 * @ingroup core
 *
 * A width of 4 allows payloads of up to 2^32 - 1 bytes. The width is not negotiated: both ends of a
 * connection must be configured with the same value.
 */
inline constexpr std::size_t DefaultHeaderWidth = 4;

/**
 * @brief Largest supported header width. Lengths are carried in a `std::uint64_t`.
 * @ingroup core
 */
inline constexpr std::size_t MaxHeaderWidth = 8;

/**
 * @brief Default readiness-poll timeout of every background loop, in milliseconds.
 * @ingroup core
 *
 * This is the cancellation granularity of the loops: a stop request is observed at most one interval
 * after it is made. Smaller values lower stop latency at the cost of more frequent wake-ups.
 */
inline constexpr int DefaultPollTimeoutMillis = 100;

/**
 * @brief Default listen backlog of a StreamServer.
 * @ingroup core
 */
inline constexpr int DefaultBacklog = 128;

/**
 * @brief Default ceiling on the payload length a decoder accepts from a frame header (16 MiB).
 * @ingroup core
 *
 * Protects receivers from a corrupt or hostile header that announces an enormous payload.
 */
inline constexpr std::size_t DefaultMaxFrameSize = 16 * 1024 * 1024;

/**
 * @brief Largest UDP payload that is portable across IPv4 paths: 65535 - 8 (UDP header) - 20 (IPv4 header).
 * @ingroup core
 */
inline constexpr std::size_t MaxDatagramPayloadSafe = 65507;

/**
 * @brief Receive buffer used for datagrams. One byte larger than any legal UDP payload so truncation is detectable.
 * @ingroup core
 */
inline constexpr std::size_t DatagramReceiveBufferSize = 65536;

/**
 * @brief Extract the numeric IP string from an IPv4 or IPv6 socket address.
 * @ingroup core
 *
 * @param addr              Address to convert.
 * @param convertIPv4Mapped Render `::ffff:a.b.c.d` as `a.b.c.d`.
 * @throws SocketException on an unsupported address family.
 */
std::string ipFromSockaddr(const sockaddr* addr, bool convertIPv4Mapped = true);

/**
 * @brief Extract the port (host byte order) from an IPv4 or IPv6 socket address.
 * @ingroup core
 * @throws SocketException on an unsupported address family.
 */
Port portFromSockaddr(const sockaddr* addr);

} // namespace jframepp

namespace jframepp::internal
{

/**
 * @brief Deleter for `addrinfo` lists returned by `getaddrinfo()`.
 * @ingroup internal
 */
struct AddrinfoDeleter
{
    void operator()(addrinfo* p) const noexcept
    {
        if (p)
            freeaddrinfo(p);
    }
};

/**
 * @brief Owning pointer to an `addrinfo` list.
 * @ingroup internal
 */
using AddrinfoPtr = std::unique_ptr<addrinfo, AddrinfoDeleter>;

/**
 * @brief Resolve a host/port pair with `getaddrinfo()`.
 * @ingroup internal
 *
 * An empty @p host resolves to the wildcard address when @p flags contains `AI_PASSIVE`.
 *
 * @throws SocketException carrying the `EAI_*` code when resolution fails.
 */
[[nodiscard]] inline AddrinfoPtr resolveAddress(const std::string_view host, const Port port, const int family,
                                                const int socktype, const int protocol, const int flags = 0)
{
    addrinfo hints{};
    hints.ai_family = family;
    hints.ai_socktype = socktype;
    hints.ai_protocol = protocol;
    hints.ai_flags = flags;

    const std::string hostStr(host);
    const std::string portStr = std::to_string(port);
    addrinfo* raw = nullptr;
    if (const int ret = ::getaddrinfo(hostStr.empty() ? nullptr : hostStr.c_str(), portStr.c_str(), &hints, &raw);
        ret != 0)
    {
        throw SocketException(ret, SocketErrorMessage(ret, true));
    }
    return AddrinfoPtr{raw};
}

/**
 * @brief Close a descriptor, reporting failure through the return value instead of throwing.
 * @ingroup internal
 */
inline bool tryCloseNoexcept(const SOCKET fd) noexcept
{
    if (fd == INVALID_SOCKET)
        return true;
    return CloseSocket(fd) == 0;
}

/**
 * @brief Close a descriptor, throwing on failure.
 * @ingroup internal
 */
inline void closeOrThrow(const SOCKET fd)
{
    if (fd == INVALID_SOCKET)
        return;
    if (CloseSocket(fd) != 0)
    {
        const int error = GetSocketError();
        throw SocketException(error, SocketErrorMessage(error));
    }
}

/**
 * @brief Wait until @p fd is readable (or writable when @p forWrite is set).
 * @ingroup internal
 *
 * Hang-up and error conditions count as "ready" so that the following read observes them (a zero-length
 * read or an error code). Interrupted waits are retried.
 *
 * @param fd            Descriptor to watch.
 * @param forWrite      Watch for writability instead of readability.
 * @param timeoutMillis `< 0` waits indefinitely, `0` polls, `> 0` waits up to that many milliseconds.
 * @return `true` when the descriptor is ready, `false` on timeout.
 * @throws SocketException when `poll()` fails.
 */
bool waitReady(SOCKET fd, bool forWrite, int timeoutMillis);

} // namespace jframepp::internal
