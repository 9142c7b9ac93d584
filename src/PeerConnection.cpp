#include "jframepp/PeerConnection.hpp"

#include "jframepp/Logging.hpp"
#include "jframepp/MessageExceptions.hpp"

using namespace jframepp;

namespace
{

// Raised from inside decode() when a stop request arrives while a frame is only partly received.
class FrameInterruptedException : public SocketException
{
  public:
    using SocketException::SocketException;
};

} // namespace

const char* jframepp::toString(const ConnectionState state) noexcept
{
    switch (state)
    {
        case ConnectionState::Idle:
            return "idle";
        case ConnectionState::Active:
            return "active";
        case ConnectionState::Closing:
            return "closing";
        case ConnectionState::Closed:
            return "closed";
    }
    return "unknown";
}

PeerConnection::PeerConnection(Socket socket, Peer peer, const std::size_t headerWidth, const int pollTimeoutMillis,
                               const std::size_t maxFrameSize)
    : _socket(std::move(socket)), _peer(std::move(peer)), _codec(headerWidth, maxFrameSize),
      _pollTimeoutMillis(pollTimeoutMillis),
      _state(_socket.isConnected() ? ConnectionState::Active : ConnectionState::Idle)
{
    if (pollTimeoutMillis <= 0)
        throw ConfigurationException("Poll timeout must be positive, got " + std::to_string(pollTimeoutMillis));

    if (!_socket.isValid())
        throw ConfigurationException("PeerConnection requires an open socket");
}

PeerConnection::~PeerConnection() noexcept
{
    try
    {
        stopReceiving();
        close();
    }
    catch (const std::exception& e)
    {
        JFRAMEPP_STREAM_WARN("PeerConnection {}: error during destruction: {}", _peer.toString(), e.what());
    }
}

void PeerConnection::connect(const int timeoutMillis)
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    if (_state.load() != ConnectionState::Idle)
        throw PreconditionException(std::string("connect() requires an idle connection, state is ") +
                                    toString(_state.load()));

    _socket.connect(timeoutMillis);
    _peer = Peer{_socket.getRemoteIp(), _socket.getRemotePort()};
    _state.store(ConnectionState::Active);

    JFRAMEPP_STREAM_INFO("Connected to {} from local port {}", _peer.toString(), _socket.getLocalPort());
}

void PeerConnection::reapLoopLocked()
{
    if (_loopThread.joinable() && !_loopRunning.load())
        _loopThread.join();
}

void PeerConnection::startReceiving()
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    reapLoopLocked();
    if (_loopThread.joinable())
        return;

    const auto state = _state.load();
    if (state == ConnectionState::Idle || state == ConnectionState::Closed)
        throw PreconditionException(std::string("Cannot start receiving on a connection in state ") +
                                    toString(state));

    _stopRequested.store(false);
    _loopRunning.store(true);
    try
    {
        _loopThread = std::thread(&PeerConnection::receiveLoop, this);
    }
    catch (const std::system_error&)
    {
        _loopRunning.store(false);
        throw;
    }

    JFRAMEPP_STREAM_DEBUG("Receive loop started for {}", _peer.toString());
}

void PeerConnection::stopReceiving()
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    if (!_loopThread.joinable())
        return;

    _stopRequested.store(true);

    auto expected = ConnectionState::Active;
    _state.compare_exchange_strong(expected, ConnectionState::Closing);

    _loopThread.join();

    // The loop may have closed the connection on its own; only a clean stop returns to Active.
    expected = ConnectionState::Closing;
    _state.compare_exchange_strong(expected, ConnectionState::Active);
    _stopRequested.store(false);

    JFRAMEPP_STREAM_DEBUG("Receive loop stopped for {} ({})", _peer.toString(), toString(_state.load()));
}

void PeerConnection::send(const std::string_view message)
{
    if (const auto state = _state.load(); state != ConnectionState::Active && state != ConnectionState::Closing)
        throw SendException("Cannot send to " + _peer.toString() + ": connection is " + toString(state));

    const std::string frame = _codec.encode(message);

    std::lock_guard<std::mutex> lock(_sendMutex);
    try
    {
        _socket.writeAll(frame);
    }
    catch (const SocketException& e)
    {
        recordError(e.what());
        JFRAMEPP_STREAM_DEBUG("Send to {} failed: {}", _peer.toString(), e.what());
        throw SendException("Send to " + _peer.toString() + " failed", std::current_exception());
    }

    JFRAMEPP_STREAM_TRACE("Sent {} bytes to {}", frame.size(), _peer.toString());
}

std::string PeerConnection::getLastError() const
{
    std::lock_guard<std::mutex> lock(_errorMutex);
    return _lastError;
}

void PeerConnection::close()
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    reapLoopLocked();
    if (_loopThread.joinable())
        throw PreconditionException("Receive loop for " + _peer.toString() + " must be stopped before close()");

    if (!_socket.isValid())
    {
        _state.store(ConnectionState::Closed);
        return;
    }

    _state.store(ConnectionState::Closed);
    _socket.close();
    JFRAMEPP_STREAM_DEBUG("Connection to {} closed", _peer.toString());
}

void PeerConnection::recordError(const std::string& error)
{
    std::lock_guard<std::mutex> lock(_errorMutex);
    _lastError = error;
}

void PeerConnection::markClosed(const std::string& reason)
{
    _state.store(ConnectionState::Closed);
    JFRAMEPP_STREAM_INFO("Connection to {} closed: {}", _peer.toString(), reason);
}

void PeerConnection::abortStream(const std::string& reason)
{
    try
    {
        _socket.shutdown(ShutdownMode::Both);
    }
    catch (const SocketException& se)
    {
        JFRAMEPP_STREAM_DEBUG("shutdown() of {} failed: {}", _peer.toString(), se.what());
    }
    markClosed(reason);
}

void PeerConnection::receiveLoop()
{
    // Every read inside a frame waits in poll slices too, so a stalled peer cannot pin the thread in recv().
    const auto readSome = [this](char* buffer, const std::size_t n)
    {
        while (!_socket.waitReady(false, _pollTimeoutMillis))
        {
            if (_stopRequested.load())
                throw FrameInterruptedException("Receive stopped with a partial frame pending");
        }
        return _socket.readInto(buffer, n);
    };

    while (!_stopRequested.load())
    {
        try
        {
            if (!_socket.waitReady(false, _pollTimeoutMillis))
                continue;

            std::string message = _codec.decode(readSome);
            JFRAMEPP_STREAM_TRACE("Received {} bytes from {}", message.size(), _peer.toString());
            _inbound.push(std::move(message));
        }
        catch (const ConnectionClosedException& e)
        {
            markClosed(std::string("peer disconnected (") + e.what() + ")");
            break;
        }
        catch (const FrameTooLargeException& e)
        {
            // The rest of the oversized frame is still in the stream; there is no way to resync.
            recordError(e.what());
            JFRAMEPP_STREAM_WARN("Dropping connection to {}: {}", _peer.toString(), e.what());
            abortStream("oversized frame");
            break;
        }
        catch (const FrameInterruptedException& e)
        {
            // The partial frame is lost, so the stream is out of sync.
            recordError(e.what());
            JFRAMEPP_STREAM_WARN("Dropping connection to {}: {}", _peer.toString(), e.what());
            abortStream("stopped mid-frame");
            break;
        }
        catch (const EncodingException& e)
        {
            JFRAMEPP_STREAM_WARN("Dropped frame from {}: {}", _peer.toString(), e.what());
        }
        catch (const std::exception& e)
        {
            recordError(e.what());
            JFRAMEPP_STREAM_ERROR("Receive loop for {} failed: {}", _peer.toString(), e.what());
            markClosed("transport error");
            break;
        }
    }

    _loopRunning.store(false);
}
