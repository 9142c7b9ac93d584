#include "jframepp/DatagramEndpoint.hpp"

#include "jframepp/FrameCodec.hpp"
#include "jframepp/Logging.hpp"
#include "jframepp/MessageExceptions.hpp"

using namespace jframepp;

namespace
{

// ICMP port-unreachable from an earlier send surfaces on the next receive; it says nothing about this socket.
bool isTransientReceiveError(const int error)
{
#ifdef _WIN32
    return error == WSAECONNRESET || error == WSAENETRESET;
#else
    return error == ECONNREFUSED || error == EHOSTUNREACH || error == ENETUNREACH;
#endif
}

} // namespace

DatagramEndpoint::DatagramEndpoint(const Port port, const std::string& localAddress, const int pollTimeoutMillis)
    : _pollTimeoutMillis(pollTimeoutMillis)
{
    if (pollTimeoutMillis <= 0)
        throw ConfigurationException("Poll timeout must be positive, got " + std::to_string(pollTimeoutMillis));

    try
    {
        _socket = std::make_unique<DatagramSocket>(port, localAddress);
    }
    catch (const SocketException& e)
    {
        throw ConfigurationException("Cannot use local address '" + localAddress + "': " + e.what(),
                                     std::current_exception());
    }

    try
    {
        _socket->bind();
    }
    catch (const SocketException& e)
    {
        throw BindException(e.getErrorCode(), "Cannot bind " + Peer{localAddress, port}.toString() + ": " +
                                                  SocketErrorMessage(e.getErrorCode()));
    }

    JFRAMEPP_DGRAM_INFO("Datagram endpoint bound to {}",
                        Peer{_socket->getLocalIp(), _socket->getLocalPort()}.toString());
}

DatagramEndpoint::~DatagramEndpoint() noexcept
{
    try
    {
        shutdown();
    }
    catch (const std::exception& e)
    {
        JFRAMEPP_DGRAM_WARN("DatagramEndpoint destructor: {}", e.what());
    }
}

void DatagramEndpoint::listenForMessages()
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    if (!_socket->isValid())
        throw PreconditionException("listenForMessages() called on a closed endpoint");

    if (_loopThread.joinable())
    {
        if (_loopRunning.load())
            return;
        _loopThread.join();
    }

    _stopRequested.store(false);
    _loopRunning.store(true);
    try
    {
        _loopThread = std::thread(&DatagramEndpoint::receiveLoop, this);
    }
    catch (const std::system_error&)
    {
        _loopRunning.store(false);
        throw;
    }

    JFRAMEPP_DGRAM_INFO("Listening for datagrams on port {}", _socket->getLocalPort());
}

void DatagramEndpoint::stopListeningForMessages()
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    if (!_loopThread.joinable())
        return;

    _stopRequested.store(true);
    _loopThread.join();
    _stopRequested.store(false);

    JFRAMEPP_DGRAM_INFO("Stopped listening for datagrams");
}

void DatagramEndpoint::send(const std::string_view message, const std::string& host, const Port port)
{
    if (!isValidUtf8(message))
        throw EncodingException("Datagram payload is not valid UTF-8");

    if (message.size() > MaxDatagramPayloadSafe)
        throw MessageTooLargeException(message.size(), MaxDatagramPayloadSafe);

    const Peer destination{host, port};
    if (!_socket->isValid())
        throw SendException("Cannot send to " + destination.toString() + ": endpoint is closed");

    try
    {
        _socket->sendTo(host, port, message);
    }
    catch (const SocketException& e)
    {
        JFRAMEPP_DGRAM_DEBUG("Send to {} failed: {}", destination.toString(), e.what());
        throw SendException("Send to " + destination.toString() + " failed", std::current_exception());
    }

    JFRAMEPP_DGRAM_TRACE("Sent {} bytes to {}", message.size(), destination.toString());
}

void DatagramEndpoint::close()
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    if (_loopThread.joinable())
    {
        if (_loopRunning.load())
            throw PreconditionException("listener must be stopped first");
        _loopThread.join();
    }

    if (!_socket->isValid())
        return;

    _socket->close();
    JFRAMEPP_DGRAM_DEBUG("Datagram endpoint closed");
}

void DatagramEndpoint::shutdown()
{
    stopListeningForMessages();
    close();
}

std::string DatagramEndpoint::getLastError() const
{
    std::lock_guard<std::mutex> lock(_errorMutex);
    return _lastError;
}

void DatagramEndpoint::recordError(const std::string& error)
{
    std::lock_guard<std::mutex> lock(_errorMutex);
    _lastError = error;
}

void DatagramEndpoint::receiveLoop()
{
    std::vector<char> buffer(DatagramReceiveBufferSize);

    while (!_stopRequested.load())
    {
        try
        {
            if (!_socket->waitReady(_pollTimeoutMillis))
                continue;

            const auto result = _socket->receiveFrom(buffer.data(), buffer.size());
            Peer sender{result.senderIp, result.senderPort};

            if (result.truncated)
            {
                JFRAMEPP_DGRAM_WARN("Dropped datagram of {} bytes from {}: larger than the {}-byte receive buffer",
                                    result.datagramSize, sender.toString(), buffer.size());
                continue;
            }

            std::string message(buffer.data(), result.bytes);
            if (!isValidUtf8(message))
            {
                JFRAMEPP_DGRAM_WARN("Dropped datagram of {} bytes from {}: not valid UTF-8", result.bytes,
                                    sender.toString());
                continue;
            }

            JFRAMEPP_DGRAM_TRACE("Received {} bytes from {}", result.bytes, sender.toString());
            _inbound.push(DatagramMessage{std::move(message), std::move(sender)});
        }
        catch (const SocketException& e)
        {
            if (isTransientReceiveError(e.getErrorCode()))
            {
                JFRAMEPP_DGRAM_DEBUG("Ignoring receive error: {}", e.what());
                continue;
            }
            recordError(e.what());
            JFRAMEPP_DGRAM_ERROR("Datagram receive loop failed: {}", e.what());
            break;
        }
        catch (const std::exception& e)
        {
            recordError(e.what());
            JFRAMEPP_DGRAM_ERROR("Datagram receive loop failed: {}", e.what());
            break;
        }
    }

    _loopRunning.store(false);
}
