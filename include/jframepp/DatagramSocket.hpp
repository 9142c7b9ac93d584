/**
 * @file DatagramSocket.hpp
 * @brief Unconnected UDP socket with sender-aware receive and truncation detection.
 */

#pragma once

#include "common.hpp"
#include "SocketOptions.hpp"

#include <string>
#include <string_view>

namespace jframepp
{

/**
 * @struct DatagramReceiveResult
 * @ingroup transport
 * @brief Outcome of one DatagramSocket::receiveFrom() call.
 */
struct DatagramReceiveResult
{
    /**
     * @brief Bytes copied into the caller's buffer.
     */
    std::size_t bytes = 0;

    /**
     * @brief Full size of the datagram on the wire when the platform reports it, otherwise equal to @ref bytes.
     */
    std::size_t datagramSize = 0;

    /**
     * @brief The datagram did not fit in the buffer and its tail was discarded by the kernel.
     */
    bool truncated = false;

    std::string senderIp; ///< Numeric sender address (IPv4-mapped addresses converted).
    Port senderPort = 0;  ///< Sender port.
};

/**
 * @class DatagramSocket
 * @ingroup transport
 * @brief Bound UDP socket used by DatagramEndpoint.
 *
 * The socket is never connected: every send names its destination and every receive reports its
 * sender. Like ServerSocket, construction only resolves and creates the descriptor; bind() is a separate
 * step.
 */
class DatagramSocket : public SocketOptions
{
  public:
    /**
     * @param localPort    Port to bind, `0` for ephemeral.
     * @param localAddress Address to bind; empty for the wildcard address.
     * @throws SocketException if resolution or socket creation fails.
     */
    explicit DatagramSocket(Port localPort, std::string_view localAddress = "");

    ~DatagramSocket() noexcept override;

    DatagramSocket(const DatagramSocket& rhs) = delete;
    DatagramSocket& operator=(const DatagramSocket& rhs) = delete;

    DatagramSocket(DatagramSocket&& rhs) noexcept;
    DatagramSocket& operator=(DatagramSocket&& rhs) noexcept;

    /**
     * @brief Bind to the address resolved at construction.
     * @throws SocketException on failure.
     */
    void bind();

    /**
     * @brief Receive exactly one datagram into @p buf.
     *
     * Blocks until a datagram arrives; pair with waitReady() in loops. Interrupted calls are retried.
     * A datagram larger than @p len is reported with `truncated == true` rather than silently cut.
     *
     * @throws SocketException on failure.
     */
    DatagramReceiveResult receiveFrom(char* buf, std::size_t len) const;

    /**
     * @brief Send @p data as a single datagram to @p host:@p port.
     *
     * Every resolved candidate of the socket's address family is tried until one succeeds.
     *
     * @throws SocketException if resolution fails or no candidate accepts the datagram.
     */
    void sendTo(std::string_view host, Port port, std::string_view data) const;

    [[nodiscard]] bool waitReady(int timeoutMillis) const;

    /**
     * @brief Release the descriptor. Safe to call more than once.
     */
    void close();

    [[nodiscard]] bool isBound() const noexcept { return _isBound; }
    [[nodiscard]] bool isValid() const noexcept { return getSocketFd() != INVALID_SOCKET; }

    [[nodiscard]] Port getLocalPort() const;
    [[nodiscard]] std::string getLocalIp(bool convertIPv4Mapped = true) const;

  private:
    void cleanup();
    [[noreturn]] void cleanupAndThrow(int errorCode);

    internal::AddrinfoPtr _localAddrInfo;  ///< Resolved bind candidates.
    addrinfo* _selectedAddrInfo = nullptr; ///< Candidate the descriptor was created for.
    int _family = AF_UNSPEC;               ///< Address family of the descriptor.
    bool _isBound = false;
};

} // namespace jframepp
