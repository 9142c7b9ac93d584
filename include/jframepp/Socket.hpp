/**
 * @file Socket.hpp
 * @brief Move-only RAII wrapper around a connected TCP socket.
 */

#pragma once

#include "common.hpp"
#include "SocketOptions.hpp"

#include <string>
#include <string_view>

namespace jframepp
{

class ServerSocket;

/**
 * @class Socket
 * @ingroup transport
 * @brief TCP client socket: connect, read, write, shut down and close.
 *
 * A Socket is either created by the caller with a remote host/port (client side) or handed out by
 * ServerSocket::accept() (server side). It owns its descriptor exclusively; copying is disabled and moves
 * transfer ownership.
 *
 * Reads and writes use independent directions of the connection, so one thread may block in readInto()
 * while another calls writeAll(). Closing the socket while another thread uses it is undefined; callers
 * must stop readers first.
 *
 * @code
 * jframepp::SocketInitializer init;
 * jframepp::Socket sock("127.0.0.1", 9000); // connects immediately
 * sock.writeAll("hello");
 * char buf[64];
 * const auto n = sock.readInto(buf, sizeof(buf));
 * @endcode
 */
class Socket : public SocketOptions
{
    friend class ServerSocket;

  protected:
    /**
     * @brief Wrap a descriptor returned by `accept()`.
     * @throws SocketException if @p client is invalid.
     */
    Socket(SOCKET client, const sockaddr_storage& addr, socklen_t len);

  public:
    /**
     * @brief Resolve @p host and create a TCP socket for it, optionally connecting right away.
     *
     * @param host                 Remote host name or numeric address.
     * @param port                 Remote port.
     * @param autoConnect          Connect before returning.
     * @param connectTimeoutMillis Passed to connect() when @p autoConnect is set.
     *
     * @throws SocketException if resolution, socket creation or the connection fails.
     * @throws SocketTimeoutException if the connection does not complete within the timeout.
     */
    explicit Socket(std::string_view host, Port port, bool autoConnect = true, int connectTimeoutMillis = -1);

    /**
     * @brief Closes the descriptor. Errors are logged and suppressed.
     */
    ~Socket() noexcept override;

    Socket(const Socket& rhs) = delete;
    Socket& operator=(const Socket& rhs) = delete;

    Socket(Socket&& rhs) noexcept;
    Socket& operator=(Socket&& rhs) noexcept;

    /**
     * @brief Connect to the address resolved at construction.
     *
     * With @p timeoutMillis `>= 0` the connect runs in non-blocking mode and waits for writability, after
     * which the original blocking mode is restored.
     *
     * @throws SocketException if already connected or the connection is refused.
     * @throws SocketTimeoutException on timeout.
     */
    void connect(int timeoutMillis = -1);

    /**
     * @brief Close the descriptor. Safe to call more than once.
     * @throws SocketException if `close()` fails.
     */
    void close();

    /**
     * @brief Shut down one or both directions without releasing the descriptor.
     * @throws SocketException on failure.
     */
    void shutdown(ShutdownMode how) const;

    [[nodiscard]] bool isConnected() const noexcept { return _isConnected; }

    [[nodiscard]] bool isValid() const noexcept { return getSocketFd() != INVALID_SOCKET; }

    /**
     * @brief Remote IP address, from the address recorded at accept/connect time.
     */
    [[nodiscard]] std::string getRemoteIp(bool convertIPv4Mapped = true) const;

    [[nodiscard]] Port getRemotePort() const;

    [[nodiscard]] std::string getLocalIp(bool convertIPv4Mapped = true) const;

    /**
     * @brief Local port, as reported by `getsockname()`.
     * @throws SocketException if the socket is closed or the query fails.
     */
    [[nodiscard]] Port getLocalPort() const;

    /**
     * @brief Perform one `recv()` of at most @p len bytes.
     *
     * Interrupted calls are retried. Short reads are normal on a stream socket.
     *
     * @return Bytes read; `0` means the peer closed the connection.
     * @throws SocketException on any other error.
     */
    std::size_t readInto(void* buffer, std::size_t len) const;

    /**
     * @brief Perform one `send()`. May write fewer bytes than requested.
     * @throws SocketException on error. `SIGPIPE` is suppressed on POSIX.
     */
    std::size_t write(std::string_view data) const;

    /**
     * @brief Write all of @p data, retrying short writes.
     * @throws SocketException on error.
     */
    std::size_t writeAll(std::string_view data) const;

    /**
     * @brief Wait until the socket is readable (or writable when @p forWrite is set).
     * @see internal::waitReady()
     */
    [[nodiscard]] bool waitReady(bool forWrite, int timeoutMillis) const;

  private:
    void cleanup();
    [[noreturn]] void cleanupAndThrow(int errorCode);
    [[noreturn]] void cleanupAndRethrow();

    sockaddr_storage _remoteAddr{};          ///< Peer address (accepted or connected).
    socklen_t _remoteAddrLen = 0;            ///< Valid length of @ref _remoteAddr.
    internal::AddrinfoPtr _cliAddrInfo;      ///< Resolved candidates (client side only).
    addrinfo* _selectedAddrInfo = nullptr;   ///< Candidate the descriptor was created for.
    bool _isConnected = false;               ///< Set after a successful connect or accept.
};

} // namespace jframepp
