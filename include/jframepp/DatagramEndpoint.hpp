/**
 * @file DatagramEndpoint.hpp
 * @brief UDP endpoint with a background receive loop and sender-tagged messages.
 */

#pragma once

#include "common.hpp"
#include "DatagramSocket.hpp"
#include "InboundQueue.hpp"
#include "LocalAddress.hpp"
#include "Peer.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace jframepp
{

/**
 * @struct DatagramMessage
 * @ingroup messaging
 * @brief One received datagram and who sent it.
 */
struct DatagramMessage
{
    std::string message;
    Peer sender;

    friend bool operator==(const DatagramMessage& lhs, const DatagramMessage& rhs)
    {
        return lhs.message == rhs.message && lhs.sender == rhs.sender;
    }
};

/**
 * @class DatagramEndpoint
 * @ingroup messaging
 * @brief Bound UDP socket that both sends and, on a background thread, receives text datagrams.
 *
 * Datagrams carry raw UTF-8 with no length header; the transport preserves boundaries. A received datagram
 * that is larger than the receive buffer, or is not valid UTF-8, is logged and dropped. Nothing is ever
 * delivered truncated.
 *
 * @code
 * jframepp::SocketInitializer init;
 * jframepp::DatagramEndpoint a(0, "127.0.0.1");
 * jframepp::DatagramEndpoint b(0, "127.0.0.1");
 * b.listenForMessages();
 * a.send("ping", "127.0.0.1", b.getLocalPort());
 * for (const auto& [text, sender] : b.waitForMessages(std::chrono::seconds(1)))
 *     std::cout << sender << ": " << text << '\n';
 * b.shutdown();
 * @endcode
 *
 * Thread-safety: all public members may be called from any thread.
 */
class DatagramEndpoint
{
  public:
    /**
     * @param port              Local port; `0` selects an ephemeral port.
     * @param localAddress      Address to bind.
     * @param pollTimeoutMillis Receive loop poll slice, > 0.
     *
     * @throws ConfigurationException for an invalid timeout or an unresolvable address.
     * @throws BindException if the address cannot be bound.
     */
    explicit DatagramEndpoint(Port port = DefaultPort, const std::string& localAddress = ::jframepp::getLocalAddress(),
                              int pollTimeoutMillis = DefaultPollTimeoutMillis);

    /**
     * @brief Performs shutdown(). Never throws.
     */
    ~DatagramEndpoint() noexcept;

    DatagramEndpoint(const DatagramEndpoint&) = delete;
    DatagramEndpoint& operator=(const DatagramEndpoint&) = delete;
    DatagramEndpoint(DatagramEndpoint&&) = delete;
    DatagramEndpoint& operator=(DatagramEndpoint&&) = delete;

    /**
     * @brief Start the receive loop. No-op when it is running.
     * @throws PreconditionException after close().
     */
    void listenForMessages();

    /**
     * @brief Stop the receive loop and wait for it. No-op when none is running.
     */
    void stopListeningForMessages();

    [[nodiscard]] bool isListening() const noexcept { return _loopRunning.load(); }

    /**
     * @brief Remove and return every received datagram, oldest first. Never blocks.
     */
    [[nodiscard]] std::vector<DatagramMessage> getMessages() { return _inbound.drain(); }

    /**
     * @brief Like getMessages(), but waits up to @p timeout for the first datagram.
     */
    [[nodiscard]] std::vector<DatagramMessage> waitForMessages(const std::chrono::milliseconds timeout)
    {
        return _inbound.drainFor(timeout);
    }

    /**
     * @brief Send @p message as one datagram to @p host:@p port.
     *
     * @throws EncodingException if @p message is not valid UTF-8.
     * @throws MessageTooLargeException if @p message exceeds MaxDatagramPayloadSafe bytes.
     * @throws SendException if the endpoint is closed, the destination cannot be resolved, or the transport
     *         rejects the datagram.
     */
    void send(std::string_view message, const std::string& host, Port port);

    /**
     * @brief Release the socket. Idempotent.
     * @throws PreconditionException ("listener must be stopped first") while the receive loop runs.
     * @throws SocketException if closing the descriptor fails.
     */
    void close();

    /**
     * @brief stopListeningForMessages() followed by close().
     */
    void shutdown();

    [[nodiscard]] bool isClosed() const noexcept { return !_socket->isValid(); }

    /**
     * @throws SocketException if the endpoint is closed.
     */
    [[nodiscard]] Port getLocalPort() const { return _socket->getLocalPort(); }

    /**
     * @throws SocketException if the endpoint is closed.
     */
    [[nodiscard]] std::string getLocalAddress() const { return _socket->getLocalIp(); }

    /**
     * @brief Error that ended the last receive loop, empty if none.
     */
    [[nodiscard]] std::string getLastError() const;

  private:
    void receiveLoop();
    void recordError(const std::string& error);

    std::unique_ptr<DatagramSocket> _socket;
    int _pollTimeoutMillis;

    InboundQueue<DatagramMessage> _inbound;

    std::atomic<bool> _stopRequested{false};
    std::atomic<bool> _loopRunning{false};
    std::thread _loopThread;
    std::mutex _lifecycleMutex;

    mutable std::mutex _errorMutex;
    std::string _lastError;
};

} // namespace jframepp
