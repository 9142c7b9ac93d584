/**
 * @file ServerSocket.hpp
 * @brief Listening TCP socket that hands out connected Socket objects.
 */

#pragma once

#include "common.hpp"
#include "Socket.hpp"
#include "SocketOptions.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace jframepp
{

/**
 * @class ServerSocket
 * @ingroup transport
 * @brief Passive TCP socket: resolve, bind, listen, accept.
 *
 * Construction resolves the local address and creates the descriptor; bind() and listen() are separate
 * steps so callers can tell an unresolvable address apart from an address that is already in use.
 *
 * The accept loop pattern used by StreamServer is:
 *
 * @code
 * ServerSocket server(0, "127.0.0.1");
 * server.bind();
 * server.listen(128);
 * while (running)
 * {
 *     if (!server.waitReady(100))
 *         continue;
 *     if (auto client = server.tryAccept())
 *         handle(std::move(*client));
 * }
 * @endcode
 *
 * Thread-safety: waitReady() and accept() may be called from one thread while another thread queries
 * getLocalPort(). close() must not race with accept().
 */
class ServerSocket : public SocketOptions
{
  public:
    /**
     * @brief Resolve @p localAddress and create an unbound stream socket for it.
     *
     * @param port          Local port, `0` for an ephemeral port.
     * @param localAddress  Address to bind; empty for the wildcard address.
     * @param reuseAddress  Set `SO_REUSEADDR` so restarts are not blocked by `TIME_WAIT`.
     *
     * @throws SocketException if resolution or socket creation fails. A resolver failure carries the
     *         `EAI_*` code.
     */
    explicit ServerSocket(Port port, std::string_view localAddress = "", bool reuseAddress = true);

    ~ServerSocket() noexcept override;

    ServerSocket(const ServerSocket& rhs) = delete;
    ServerSocket& operator=(const ServerSocket& rhs) = delete;

    ServerSocket(ServerSocket&& rhs) noexcept;
    ServerSocket& operator=(ServerSocket&& rhs) noexcept;

    /**
     * @brief Bind to the address resolved at construction.
     * @throws SocketException (typically `EADDRINUSE` or `EADDRNOTAVAIL`).
     */
    void bind();

    /**
     * @brief Start listening with the given backlog.
     * @throws SocketException if the socket is not bound or `listen()` fails.
     */
    void listen(int backlog = DefaultBacklog);

    /**
     * @brief Accept one connection, blocking until one is available.
     *
     * Interrupted calls are retried. Pair with waitReady() to avoid blocking.
     *
     * @throws SocketException on failure.
     */
    [[nodiscard]] Socket accept() const;

    /**
     * @brief Accept one connection without blocking.
     *
     * A readiness report does not guarantee a connection: the peer may reset it before the call, and some
     * platforms then remove it from the queue. That case, like an empty queue, yields `std::nullopt`. The
     * returned socket is always in blocking mode.
     *
     * @throws SocketException on any other failure.
     */
    [[nodiscard]] std::optional<Socket> tryAccept() const;

    /**
     * @brief Wait up to @p timeoutMillis for a pending connection.
     * @return `true` if accept() will not block.
     */
    [[nodiscard]] bool waitReady(int timeoutMillis) const;

    /**
     * @brief Close the listening descriptor. Already-accepted sockets are unaffected.
     * @throws SocketException if `close()` fails.
     */
    void close();

    [[nodiscard]] bool isBound() const noexcept { return _isBound; }
    [[nodiscard]] bool isListening() const noexcept { return _isListening; }
    [[nodiscard]] bool isValid() const noexcept { return getSocketFd() != INVALID_SOCKET; }

    /**
     * @brief Bound port; `0` when closed.
     * @throws SocketException if `getsockname()` fails.
     */
    [[nodiscard]] Port getLocalPort() const;

    /**
     * @brief Bound IP address; empty when closed.
     * @throws SocketException if `getsockname()` fails.
     */
    [[nodiscard]] std::string getLocalIp(bool convertIPv4Mapped = true) const;

  private:
    void cleanup();
    [[noreturn]] void cleanupAndThrow(int errorCode);
    [[noreturn]] void cleanupAndRethrow();

    internal::AddrinfoPtr _srvAddrInfo;    ///< Resolved local address candidates.
    addrinfo* _selectedAddrInfo = nullptr; ///< Candidate the descriptor was created for.
    bool _isBound = false;
    bool _isListening = false;
};

} // namespace jframepp
