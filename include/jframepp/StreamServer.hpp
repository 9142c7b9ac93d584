/**
 * @file StreamServer.hpp
 * @brief Framed TCP server: accept loop, peer registry and per-peer receive loops.
 */

#pragma once

#include "common.hpp"
#include "FrameCodec.hpp"
#include "InboundQueue.hpp"
#include "LocalAddress.hpp"
#include "Peer.hpp"
#include "PeerConnection.hpp"
#include "ServerSocket.hpp"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace jframepp
{

/**
 * @struct SendReport
 * @ingroup messaging
 * @brief Per-peer outcome of StreamServer::sendToAll().
 */
struct SendReport
{
    std::vector<Peer> delivered; ///< Peers the frame was fully written to.
    std::vector<Peer> failed;    ///< Peers whose send raised SendException.

    [[nodiscard]] bool ok() const noexcept { return failed.empty(); }
};

/**
 * @class StreamServer
 * @ingroup messaging
 * @brief Accepts framed stream connections and keeps one PeerConnection per remote peer.
 *
 * Three independent activities, each started and stopped explicitly and idempotently:
 *
 * 1. **Accept loop** (listenForConnections()): a background thread polls the listening socket and moves
 *    each accepted connection into a pending queue. It never touches the registry.
 * 2. **Admission** (drainNewConnections()): the application thread moves pending connections into the
 *    registry and learns their Peer identities.
 * 3. **Receive loops** (listenForMessages()): one background thread per registered peer decodes frames
 *    into that peer's inbound queue.
 *
 * @code
 * jframepp::SocketInitializer init;
 * jframepp::StreamServer server(9000, "0.0.0.0");
 * server.listenForConnections();
 *
 * for (;;)
 * {
 *     for (const auto& peer : server.drainNewConnections())
 *         server.sendTo(peer, "welcome");
 *     server.listenForMessages();
 *     for (auto& [peer, messages] : server.getAllMessages())
 *         for (auto& m : messages)
 *             handle(peer, m);
 *     server.dropClosedPeers();
 * }
 * @endcode
 *
 * Thread-safety: the registry is owned by the application thread. All members except the accept loop
 * itself are meant to be called from that one thread; only the pending queue is shared with the accept
 * loop.
 */
class StreamServer
{
  public:
    /**
     * @brief Bind and listen. Neither loop is started.
     *
     * @param port              Local port; `0` selects an ephemeral port (see getLocalPort()).
     * @param localAddress      Address to bind.
     * @param headerWidth       Frame header width, 1..8.
     * @param pollTimeoutMillis Poll slice of every loop, > 0.
     * @param backlog           `listen()` backlog, > 0.
     * @param maxFrameSize      Largest incoming payload accepted from any peer.
     *
     * @throws ConfigurationException for invalid parameters or an unresolvable address.
     * @throws BindException if the address cannot be bound or listened on.
     */
    explicit StreamServer(Port port = DefaultPort, const std::string& localAddress = ::jframepp::getLocalAddress(),
                          std::size_t headerWidth = DefaultHeaderWidth, int pollTimeoutMillis = DefaultPollTimeoutMillis,
                          int backlog = DefaultBacklog, std::size_t maxFrameSize = DefaultMaxFrameSize);

    /**
     * @brief Performs close(). Never throws.
     */
    ~StreamServer() noexcept;

    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;
    StreamServer(StreamServer&&) = delete;
    StreamServer& operator=(StreamServer&&) = delete;

    /**
     * @brief Start the accept loop. No-op if it is running.
     * @throws PreconditionException after close().
     */
    void listenForConnections();

    /**
     * @brief Stop the accept loop and wait for it. Accepted peers are unaffected.
     */
    void stopListeningForConnections();

    [[nodiscard]] bool isListeningForConnections() const noexcept { return _acceptRunning.load(); }

    /**
     * @brief Admit every pending connection into the registry.
     *
     * A connection whose Peer is already registered replaces the old entry, which is stopped and closed.
     *
     * @return Newly admitted peers in acceptance order.
     */
    std::vector<Peer> drainNewConnections();

    /**
     * @brief Start a receive loop for every registered peer that has none and is not Closed.
     */
    void listenForMessages();

    /**
     * @brief Stop every peer's receive loop and wait for all of them.
     */
    void stopListeningForMessages();

    /**
     * @brief `true` while at least one peer's receive loop is running.
     */
    [[nodiscard]] bool isListeningForMessages() const;

    /**
     * @brief Drain one peer's inbound queue.
     * @throws UnknownPeerException if @p peer is not registered.
     */
    [[nodiscard]] std::vector<std::string> getMessagesFrom(const Peer& peer);

    /**
     * @brief Drain every peer's queue. Every registered peer is present, possibly with an empty list.
     */
    [[nodiscard]] std::map<Peer, std::vector<std::string>> getAllMessages();

    /**
     * @throws UnknownPeerException if @p peer is not registered.
     * @throws SendException, EncodingException as PeerConnection::send().
     */
    void sendTo(const Peer& peer, std::string_view message);

    /**
     * @brief Send to every registered peer in turn. A failure on one peer never stops the others.
     * @throws EncodingException if @p message cannot be framed at all (nothing is sent).
     */
    SendReport sendToAll(std::string_view message);

    /**
     * @brief Stop the peer's loop, close its socket and forget it.
     * @throws UnknownPeerException if @p peer is not registered.
     */
    void dropPeer(const Peer& peer);

    /**
     * @brief Drop every peer whose connection is Closed.
     * @return The dropped peers.
     */
    std::vector<Peer> dropClosedPeers();

    [[nodiscard]] std::vector<Peer> getPeers() const;

    [[nodiscard]] bool hasPeer(const Peer& peer) const { return _registry.find(peer) != _registry.end(); }

    /**
     * @brief Direct access to a registered connection (state, last error, shutdown).
     * @throws UnknownPeerException if @p peer is not registered.
     */
    [[nodiscard]] PeerConnection& connection(const Peer& peer);

    /**
     * @brief Bound port; `0` after close().
     */
    [[nodiscard]] Port getLocalPort() const;

    /**
     * @brief Numeric bound address; empty after close().
     */
    [[nodiscard]] std::string getLocalAddress() const;

    /**
     * @brief Stop the accept loop, stop and drop every peer, release pending connections and close the
     *        listening socket. Idempotent.
     */
    void close();

  private:
    struct PendingConnection
    {
        std::unique_ptr<PeerConnection> connection;
        Peer peer;
    };

    void acceptLoop();
    PeerConnection& lookup(const Peer& peer) const;
    void releaseConnection(const Peer& peer, PeerConnection& conn) noexcept;

    std::unique_ptr<ServerSocket> _serverSocket;
    FrameCodec _codec;
    int _pollTimeoutMillis;

    InboundQueue<PendingConnection> _pending;
    std::map<Peer, std::unique_ptr<PeerConnection>> _registry;

    std::atomic<bool> _acceptStop{false};
    std::atomic<bool> _acceptRunning{false};
    std::thread _acceptThread;
    std::mutex _acceptMutex; ///< Serialises start/stop of the accept loop.
};

} // namespace jframepp
