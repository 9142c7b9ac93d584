#include "jframepp/StreamServer.hpp"

#include "jframepp/Logging.hpp"
#include "jframepp/MessageExceptions.hpp"

#include <chrono>
#include <optional>

using namespace jframepp;

StreamServer::StreamServer(const Port port, const std::string& localAddress, const std::size_t headerWidth,
                           const int pollTimeoutMillis, const int backlog, const std::size_t maxFrameSize)
    : _codec(headerWidth, maxFrameSize), _pollTimeoutMillis(pollTimeoutMillis)
{
    if (pollTimeoutMillis <= 0)
        throw ConfigurationException("Poll timeout must be positive, got " + std::to_string(pollTimeoutMillis));

    if (backlog <= 0)
        throw ConfigurationException("Backlog must be positive, got " + std::to_string(backlog));

    try
    {
        _serverSocket = std::make_unique<ServerSocket>(port, localAddress);
    }
    catch (const SocketException& e)
    {
        throw ConfigurationException("Cannot use local address '" + localAddress + "': " + e.what(),
                                     std::current_exception());
    }

    try
    {
        _serverSocket->bind();
        _serverSocket->listen(backlog);
    }
    catch (const SocketException& e)
    {
        throw BindException(e.getErrorCode(), "Cannot listen on " + Peer{localAddress, port}.toString() + ": " +
                                                  SocketErrorMessage(e.getErrorCode()));
    }

    JFRAMEPP_STREAM_INFO("Server bound to {}",
                         Peer{_serverSocket->getLocalIp(), _serverSocket->getLocalPort()}.toString());
}

StreamServer::~StreamServer() noexcept
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        JFRAMEPP_STREAM_WARN("StreamServer destructor: {}", e.what());
    }
}

void StreamServer::listenForConnections()
{
    std::lock_guard<std::mutex> lock(_acceptMutex);

    if (!_serverSocket || !_serverSocket->isListening())
        throw PreconditionException("listenForConnections() called on a closed server");

    if (_acceptThread.joinable())
    {
        if (_acceptRunning.load())
            return;
        _acceptThread.join();
    }

    _acceptStop.store(false);
    _acceptRunning.store(true);
    try
    {
        _acceptThread = std::thread(&StreamServer::acceptLoop, this);
    }
    catch (const std::system_error&)
    {
        _acceptRunning.store(false);
        throw;
    }

    JFRAMEPP_STREAM_INFO("Listening for connections on port {}", _serverSocket->getLocalPort());
}

void StreamServer::stopListeningForConnections()
{
    std::lock_guard<std::mutex> lock(_acceptMutex);

    if (!_acceptThread.joinable())
        return;

    _acceptStop.store(true);
    _acceptThread.join();
    _acceptStop.store(false);

    JFRAMEPP_STREAM_INFO("Stopped listening for connections");
}

void StreamServer::acceptLoop()
{
    while (!_acceptStop.load())
    {
        try
        {
            if (!_serverSocket->waitReady(_pollTimeoutMillis))
                continue;

            std::optional<Socket> client = _serverSocket->tryAccept();
            if (!client)
                continue;

            Peer peer{client->getRemoteIp(), client->getRemotePort()};
            client->setTcpNoDelay(true);

            auto conn = std::make_unique<PeerConnection>(std::move(*client), peer, _codec.getHeaderWidth(),
                                                         _pollTimeoutMillis, _codec.getMaxFrameSize());
            JFRAMEPP_STREAM_INFO("Accepted connection from {}", peer.toString());
            _pending.push(PendingConnection{std::move(conn), std::move(peer)});
        }
        catch (const SocketException& e)
        {
            // Descriptor exhaustion and similar failures are transient; back off for one slice.
            JFRAMEPP_STREAM_WARN("accept() failed: {}", e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(_pollTimeoutMillis));
        }
        catch (const std::exception& e)
        {
            JFRAMEPP_STREAM_ERROR("Could not admit a connection: {}", e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(_pollTimeoutMillis));
        }
    }

    _acceptRunning.store(false);
}

std::vector<Peer> StreamServer::drainNewConnections()
{
    std::vector<Peer> admitted;
    for (auto& pending : _pending.drain())
    {
        if (const auto it = _registry.find(pending.peer); it != _registry.end())
        {
            JFRAMEPP_STREAM_WARN("Peer {} reconnected; replacing its previous connection", pending.peer.toString());
            releaseConnection(it->first, *it->second);
            _registry.erase(it);
        }

        admitted.push_back(pending.peer);
        _registry.emplace(std::move(pending.peer), std::move(pending.connection));
    }
    return admitted;
}

void StreamServer::listenForMessages()
{
    for (auto& [peer, conn] : _registry)
    {
        if (conn->isReceiving() || conn->getState() == ConnectionState::Closed)
            continue;

        try
        {
            conn->startReceiving();
        }
        catch (const PreconditionException& e)
        {
            // The peer disconnected between the state check and the start.
            JFRAMEPP_STREAM_DEBUG("Not starting receive loop for {}: {}", peer.toString(), e.what());
        }
    }
}

void StreamServer::stopListeningForMessages()
{
    for (auto& [peer, conn] : _registry)
        conn->stopReceiving();
}

bool StreamServer::isListeningForMessages() const
{
    for (const auto& [peer, conn] : _registry)
    {
        if (conn->isReceiving())
            return true;
    }
    return false;
}

PeerConnection& StreamServer::lookup(const Peer& peer) const
{
    const auto it = _registry.find(peer);
    if (it == _registry.end())
        throw UnknownPeerException("Unknown peer " + peer.toString());
    return *it->second;
}

PeerConnection& StreamServer::connection(const Peer& peer)
{
    return lookup(peer);
}

std::vector<std::string> StreamServer::getMessagesFrom(const Peer& peer)
{
    return lookup(peer).getMessages();
}

std::map<Peer, std::vector<std::string>> StreamServer::getAllMessages()
{
    std::map<Peer, std::vector<std::string>> all;
    for (auto& [peer, conn] : _registry)
        all.emplace(peer, conn->getMessages());
    return all;
}

void StreamServer::sendTo(const Peer& peer, const std::string_view message)
{
    lookup(peer).send(message);
}

SendReport StreamServer::sendToAll(const std::string_view message)
{
    // Reject unframeable messages once instead of once per peer.
    static_cast<void>(_codec.encode(message));

    SendReport report;
    for (auto& [peer, conn] : _registry)
    {
        try
        {
            conn->send(message);
            report.delivered.push_back(peer);
        }
        catch (const SendException& e)
        {
            JFRAMEPP_STREAM_WARN("sendToAll: {}", e.what());
            report.failed.push_back(peer);
        }
    }
    return report;
}

void StreamServer::releaseConnection(const Peer& peer, PeerConnection& conn) noexcept
{
    try
    {
        conn.stopReceiving();
        conn.close();
    }
    catch (const std::exception& e)
    {
        JFRAMEPP_STREAM_WARN("Error while releasing {}: {}", peer.toString(), e.what());
    }
}

void StreamServer::dropPeer(const Peer& peer)
{
    const auto it = _registry.find(peer);
    if (it == _registry.end())
        throw UnknownPeerException("Unknown peer " + peer.toString());

    JFRAMEPP_STREAM_INFO("Dropping peer {}", peer.toString());
    releaseConnection(it->first, *it->second);
    _registry.erase(it);
}

std::vector<Peer> StreamServer::dropClosedPeers()
{
    std::vector<Peer> dropped;
    for (auto it = _registry.begin(); it != _registry.end();)
    {
        if (it->second->getState() != ConnectionState::Closed)
        {
            ++it;
            continue;
        }

        releaseConnection(it->first, *it->second);
        dropped.push_back(it->first);
        JFRAMEPP_STREAM_INFO("Dropped closed peer {}", it->first.toString());
        it = _registry.erase(it);
    }
    return dropped;
}

std::vector<Peer> StreamServer::getPeers() const
{
    std::vector<Peer> peers;
    peers.reserve(_registry.size());
    for (const auto& [peer, conn] : _registry)
        peers.push_back(peer);
    return peers;
}

Port StreamServer::getLocalPort() const
{
    return _serverSocket ? _serverSocket->getLocalPort() : 0;
}

std::string StreamServer::getLocalAddress() const
{
    return _serverSocket ? _serverSocket->getLocalIp() : std::string{};
}

void StreamServer::close()
{
    stopListeningForConnections();

    // Accepted but never admitted connections are released by their destructors.
    static_cast<void>(_pending.drain());

    for (auto& [peer, conn] : _registry)
        releaseConnection(peer, *conn);
    _registry.clear();

    if (_serverSocket && _serverSocket->isValid())
    {
        _serverSocket->close();
        JFRAMEPP_STREAM_INFO("Server closed");
    }
}
