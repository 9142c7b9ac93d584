#include "jframepp/StreamClient.hpp"

#include "jframepp/MessageExceptions.hpp"

#include <optional>

using namespace jframepp;

StreamClient::StreamClient(const std::string& host, const Port port, const std::size_t headerWidth,
                           const int pollTimeoutMillis, const int connectTimeoutMillis, const bool autoConnect,
                           const std::size_t maxFrameSize)
    : _connectTimeoutMillis(connectTimeoutMillis)
{
    if (port == 0)
        throw ConfigurationException("Remote port must be between 1 and 65535");

    // Validate framing before touching the network.
    static_cast<void>(FrameCodec(headerWidth, maxFrameSize));

    std::optional<Socket> sock;
    try
    {
        sock.emplace(host, port, false);
    }
    catch (const SocketException& e)
    {
        throw ConfigurationException("Cannot resolve '" + host + "': " + e.what(), std::current_exception());
    }

    _connection = std::make_unique<PeerConnection>(std::move(*sock), Peer{host, port}, headerWidth,
                                                   pollTimeoutMillis, maxFrameSize);

    if (autoConnect)
        connect();
}

void StreamClient::connect()
{
    _connection->connect(_connectTimeoutMillis);
}
