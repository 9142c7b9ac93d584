/**
 * @file StreamClient.hpp
 * @brief Framed TCP client: one outbound PeerConnection.
 */

#pragma once

#include "common.hpp"
#include "Peer.hpp"
#include "PeerConnection.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace jframepp
{

/**
 * @class StreamClient
 * @ingroup messaging
 * @brief Connects to a StreamServer (or any peer speaking the same framing) and exchanges messages.
 *
 * All messaging members forward to the underlying PeerConnection and share its contracts.
 *
 * @code
 * jframepp::SocketInitializer init;
 * jframepp::StreamClient client("127.0.0.1", 9000);
 * client.startReceiving();
 * client.send("hello");
 * for (const auto& reply : client.waitForMessages(std::chrono::seconds(1)))
 *     std::cout << reply << '\n';
 * @endcode
 */
class StreamClient
{
  public:
    /**
     * @param host                 Remote host name or numeric address.
     * @param port                 Remote port, 1..65535.
     * @param headerWidth          Frame header width, 1..8; must match the server.
     * @param pollTimeoutMillis    Receive loop poll slice, > 0.
     * @param connectTimeoutMillis `-1` blocks; `>= 0` bounds connect().
     * @param autoConnect          Connect before returning. Otherwise the client stays Idle until connect().
     * @param maxFrameSize         Largest incoming payload accepted.
     *
     * @throws ConfigurationException for invalid parameters or an unresolvable host.
     * @throws SocketTimeoutException, SocketException from the automatic connect.
     */
    explicit StreamClient(const std::string& host, Port port = DefaultPort, std::size_t headerWidth = DefaultHeaderWidth,
                          int pollTimeoutMillis = DefaultPollTimeoutMillis, int connectTimeoutMillis = -1,
                          bool autoConnect = true, std::size_t maxFrameSize = DefaultMaxFrameSize);

    StreamClient(const StreamClient&) = delete;
    StreamClient& operator=(const StreamClient&) = delete;

    /**
     * @brief Connect an Idle client using the configured connect timeout.
     * @see PeerConnection::connect()
     */
    void connect();

    void startReceiving() { _connection->startReceiving(); }
    void stopReceiving() { _connection->stopReceiving(); }
    [[nodiscard]] bool isReceiving() const noexcept { return _connection->isReceiving(); }

    void send(const std::string_view message) { _connection->send(message); }

    [[nodiscard]] std::vector<std::string> getMessages() { return _connection->getMessages(); }

    [[nodiscard]] std::vector<std::string> waitForMessages(const std::chrono::milliseconds timeout)
    {
        return _connection->waitForMessages(timeout);
    }

    [[nodiscard]] ConnectionState getState() const noexcept { return _connection->getState(); }

    /**
     * @brief Host and port as given before connecting; the resolved numeric address afterwards.
     */
    [[nodiscard]] const Peer& getPeer() const noexcept { return _connection->getPeer(); }

    [[nodiscard]] Port getLocalPort() const { return _connection->getLocalPort(); }

    [[nodiscard]] std::string getLastError() const { return _connection->getLastError(); }

    void shutdown(const ShutdownMode how) const { _connection->shutdown(how); }

    /**
     * @throws PreconditionException if the receive loop is still running.
     */
    void close() { _connection->close(); }

  private:
    std::unique_ptr<PeerConnection> _connection;
    int _connectTimeoutMillis;
};

} // namespace jframepp
