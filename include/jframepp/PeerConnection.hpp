/**
 * @file PeerConnection.hpp
 * @brief One framed stream connection with its own background receive loop.
 */

#pragma once

#include "common.hpp"
#include "FrameCodec.hpp"
#include "InboundQueue.hpp"
#include "Peer.hpp"
#include "Socket.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace jframepp
{

/**
 * @brief Lifecycle of a PeerConnection.
 * @ingroup messaging
 *
 * @code
 * Idle ──connect──► Active ──stopReceiving──► Closing ──loop exits──► Active
 *                     │                          │
 *                     └──── peer EOF / error / close() ──────────────► Closed
 * @endcode
 */
enum class ConnectionState
{
    Idle,    ///< Constructed, not yet connected.
    Active,  ///< Socket usable; the receive loop may run.
    Closing, ///< Stop requested; the loop is finishing its current poll or frame.
    Closed   ///< Peer disconnected, transport error, or released. Terminal.
};

/**
 * @brief Lower-case name of @p state, for logs and test output.
 */
[[nodiscard]] const char* toString(ConnectionState state) noexcept;

/**
 * @class PeerConnection
 * @ingroup messaging
 * @brief Owns a stream Socket, decodes incoming frames on a dedicated thread and sends frames synchronously.
 *
 * The receive loop waits for readability in slices of the poll timeout, which is also its cancellation
 * granularity. Each complete frame is pushed to an InboundQueue that the application drains with
 * getMessages() or waitForMessages().
 *
 * How the loop ends:
 * - stopReceiving(): the loop exits after the current poll slice; the connection stays Active and the loop
 *   can be started again. A stop that lands while a frame is only partly received drops the connection
 *   instead (Closed), since the stream can no longer be resynchronised.
 * - The peer closes the stream: the connection becomes Closed.
 * - A frame declares a payload above the size ceiling: the frame is logged, the socket is shut down and
 *   the connection becomes Closed.
 * - Any other transport error: the error is recorded (getLastError()) and the connection becomes Closed.
 *
 * A frame whose payload is not valid UTF-8 is logged and dropped; framing is intact so the loop continues.
 *
 * Thread-safety: all public members may be called from any thread. send() calls are serialised per
 * connection and run concurrently with the receive loop. Loop errors are never rethrown into other threads.
 */
class PeerConnection
{
  public:
    /**
     * @param socket            Connected socket (state Active) or an unconnected client socket (state Idle).
     * @param peer              Remote identity reported by getPeer().
     * @param headerWidth       Frame header width, 1..8.
     * @param pollTimeoutMillis Readiness poll slice, > 0.
     * @param maxFrameSize      Largest accepted incoming payload.
     * @throws ConfigurationException on invalid parameters.
     */
    PeerConnection(Socket socket, Peer peer, std::size_t headerWidth = DefaultHeaderWidth,
                   int pollTimeoutMillis = DefaultPollTimeoutMillis, std::size_t maxFrameSize = DefaultMaxFrameSize);

    /**
     * @brief Stops the loop and closes the socket. Never throws.
     */
    ~PeerConnection() noexcept;

    PeerConnection(const PeerConnection&) = delete;
    PeerConnection& operator=(const PeerConnection&) = delete;
    PeerConnection(PeerConnection&&) = delete;
    PeerConnection& operator=(PeerConnection&&) = delete;

    /**
     * @brief Connect an Idle connection. On success the state becomes Active and getPeer() reports the
     *        numeric remote address.
     *
     * @throws PreconditionException if the connection is not Idle.
     * @throws SocketTimeoutException if @p timeoutMillis `>= 0` elapses first.
     * @throws SocketException if the connection is refused.
     */
    void connect(int timeoutMillis = -1);

    /**
     * @brief Start the receive loop. No-op when it is already running.
     *
     * A loop that already ended on its own is joined first.
     *
     * @throws PreconditionException if the connection is Idle or Closed.
     */
    void startReceiving();

    /**
     * @brief Request the loop to stop and wait for it. No-op when no loop is attached.
     *
     * Returns within one poll interval plus the time to finish a frame in progress.
     */
    void stopReceiving();

    /**
     * @brief `true` while the receive loop thread is running.
     */
    [[nodiscard]] bool isReceiving() const noexcept { return _loopRunning.load(); }

    /**
     * @brief Encode @p message and write the whole frame, retrying short writes.
     *
     * @throws EncodingException if the message cannot be framed.
     * @throws SendException if the connection is not Active/Closing or the write fails. The write error is
     *         attached as the nested exception.
     */
    void send(std::string_view message);

    /**
     * @brief Remove and return all received messages, oldest first. Never blocks.
     */
    [[nodiscard]] std::vector<std::string> getMessages() { return _inbound.drain(); }

    /**
     * @brief Like getMessages(), but waits up to @p timeout for the first message.
     */
    [[nodiscard]] std::vector<std::string> waitForMessages(std::chrono::milliseconds timeout)
    {
        return _inbound.drainFor(timeout);
    }

    [[nodiscard]] ConnectionState getState() const noexcept { return _state.load(); }

    [[nodiscard]] const Peer& getPeer() const noexcept { return _peer; }

    /**
     * @brief Description of the error that ended the last receive or send, empty if none.
     */
    [[nodiscard]] std::string getLastError() const;

    /**
     * @throws SocketException if the socket is closed.
     */
    [[nodiscard]] Port getLocalPort() const { return _socket.getLocalPort(); }

    /**
     * @brief Shut down one or both directions of the socket. The state is not changed: the receive loop
     *        observes a read shutdown as end of stream.
     * @throws SocketException on failure.
     */
    void shutdown(ShutdownMode how) const { _socket.shutdown(how); }

    /**
     * @brief Release the socket and move to Closed. Idempotent.
     *
     * @throws PreconditionException if the receive loop is still running.
     * @throws SocketException if closing the descriptor fails.
     */
    void close();

  private:
    void receiveLoop();
    void markClosed(const std::string& reason);
    void abortStream(const std::string& reason);
    void recordError(const std::string& error);
    void reapLoopLocked();

    Socket _socket;
    Peer _peer;
    FrameCodec _codec;
    int _pollTimeoutMillis;

    InboundQueue<std::string> _inbound;

    std::atomic<ConnectionState> _state;
    std::atomic<bool> _stopRequested{false};
    std::atomic<bool> _loopRunning{false};
    std::thread _loopThread;

    std::mutex _lifecycleMutex; ///< Serialises connect/start/stop/close.
    std::mutex _sendMutex;      ///< One frame on the wire at a time.

    mutable std::mutex _errorMutex;
    std::string _lastError;
};

} // namespace jframepp
