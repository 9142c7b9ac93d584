// GoogleTest unit tests for StreamServer, StreamClient and PeerConnection
#include "jframepp/MessageExceptions.hpp"
#include "jframepp/Socket.hpp"
#include "jframepp/SocketInitializer.hpp"
#include "jframepp/StreamClient.hpp"
#include "jframepp/StreamServer.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <map>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace jframepp;
using jframepp::test::FastPollMillis;
using jframepp::test::Loopback;
using jframepp::test::waitUntil;

namespace
{

std::unique_ptr<StreamServer> makeServer(const std::size_t headerWidth = DefaultHeaderWidth,
                                         const std::size_t maxFrameSize = DefaultMaxFrameSize)
{
    auto server = std::make_unique<StreamServer>(0, Loopback, headerWidth, FastPollMillis, DefaultBacklog,
                                                 maxFrameSize);
    server->listenForConnections();
    return server;
}

std::unique_ptr<StreamClient> makeClient(const StreamServer& server,
                                         const std::size_t headerWidth = DefaultHeaderWidth)
{
    return std::make_unique<StreamClient>(Loopback, server.getLocalPort(), headerWidth, FastPollMillis, 2000);
}

// The server-side key of a client: the loopback address and the client's ephemeral port.
Peer peerOf(const StreamClient& client)
{
    return Peer{Loopback, client.getLocalPort()};
}

std::vector<Peer> admit(StreamServer& server, const std::size_t count)
{
    std::vector<Peer> admitted;
    waitUntil([&] {
        for (auto& peer : server.drainNewConnections())
            admitted.push_back(std::move(peer));
        return admitted.size() >= count;
    });
    return admitted;
}

std::vector<std::string> collectFrom(StreamServer& server, const Peer& peer, const std::size_t count)
{
    std::vector<std::string> received;
    waitUntil([&] {
        for (auto& message : server.getMessagesFrom(peer))
            received.push_back(std::move(message));
        return received.size() >= count;
    });
    return received;
}

std::vector<std::string> collectFrom(StreamClient& client, const std::size_t count)
{
    std::vector<std::string> received;
    waitUntil([&] {
        for (auto& message : client.waitForMessages(std::chrono::milliseconds(50)))
            received.push_back(std::move(message));
        return received.size() >= count;
    });
    return received;
}

} // namespace

TEST(StreamTest, ClientToServerPreservesOrder)
{
    SocketInitializer init;
    const auto server = makeServer();
    const auto client = makeClient(*server);
    EXPECT_EQ(client->getState(), ConnectionState::Active);

    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0], peerOf(*client));

    server->listenForMessages();
    EXPECT_TRUE(server->isListeningForMessages());

    client->send("m1");
    client->send("m2");
    client->send("m3");

    EXPECT_EQ(collectFrom(*server, peers[0], 3), (std::vector<std::string>{"m1", "m2", "m3"}));
}

TEST(StreamTest, ServerToClientPreservesOrder)
{
    SocketInitializer init;
    const auto server = makeServer(2);
    const auto client = makeClient(*server, 2);
    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);

    client->startReceiving();
    server->sendTo(peers[0], "m1");
    server->sendTo(peers[0], "héllo ✓");
    server->sendTo(peers[0], "");

    EXPECT_EQ(collectFrom(*client, 3), (std::vector<std::string>{"m1", "héllo ✓", ""}));
}

TEST(StreamTest, LargeMessageArrivesWhole)
{
    SocketInitializer init;
    const auto server = makeServer();
    const auto client = makeClient(*server);
    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);
    server->listenForMessages();

    const std::string big(1 << 20, 'b');
    client->send(big);

    const auto received = collectFrom(*server, peers[0], 1);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], big);
}

TEST(StreamTest, DisconnectIsDetected)
{
    SocketInitializer init;
    const auto server = makeServer();
    auto client = makeClient(*server);
    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);
    server->listenForMessages();

    client->close();
    EXPECT_EQ(client->getState(), ConnectionState::Closed);

    auto& conn = server->connection(peers[0]);
    EXPECT_TRUE(waitUntil([&] { return conn.getState() == ConnectionState::Closed; }));
    EXPECT_TRUE(waitUntil([&] { return !conn.isReceiving(); }));
    EXPECT_FALSE(server->isListeningForMessages());

    EXPECT_EQ(server->dropClosedPeers(), (std::vector<Peer>{peers[0]}));
    EXPECT_FALSE(server->hasPeer(peers[0]));
    EXPECT_TRUE(server->getPeers().empty());
}

TEST(StreamTest, StartAndStopAreIdempotent)
{
    SocketInitializer init;
    const auto server = makeServer();
    EXPECT_NO_THROW(server->listenForConnections());
    EXPECT_TRUE(server->isListeningForConnections());

    const auto client = makeClient(*server);
    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);

    server->listenForMessages();
    server->listenForMessages();
    client->startReceiving();
    client->startReceiving();
    EXPECT_TRUE(client->isReceiving());

    server->stopListeningForMessages();
    server->stopListeningForMessages();
    client->stopReceiving();
    client->stopReceiving();
    EXPECT_FALSE(server->isListeningForMessages());
    EXPECT_FALSE(client->isReceiving());
    EXPECT_EQ(client->getState(), ConnectionState::Active);
    EXPECT_EQ(server->connection(peers[0]).getState(), ConnectionState::Active);

    server->stopListeningForConnections();
    server->stopListeningForConnections();
    EXPECT_FALSE(server->isListeningForConnections());
}

TEST(StreamTest, ReceivingResumesAfterRestart)
{
    SocketInitializer init;
    const auto server = makeServer();
    const auto client = makeClient(*server);
    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);

    server->listenForMessages();
    client->send("before");
    EXPECT_EQ(collectFrom(*server, peers[0], 1), (std::vector<std::string>{"before"}));

    server->stopListeningForMessages();
    client->send("while stopped");
    server->listenForMessages();

    EXPECT_EQ(collectFrom(*server, peers[0], 1), (std::vector<std::string>{"while stopped"}));
}

TEST(StreamTest, ServesSeveralClients)
{
    SocketInitializer init;
    const auto server = makeServer();

    std::vector<std::unique_ptr<StreamClient>> clients;
    for (int i = 0; i < 3; ++i)
        clients.push_back(makeClient(*server));

    const auto peers = admit(*server, 3);
    ASSERT_EQ(peers.size(), 3u);
    for (const auto& client : clients)
        EXPECT_TRUE(server->hasPeer(peerOf(*client)));

    server->listenForMessages();
    for (std::size_t i = 0; i < clients.size(); ++i)
        clients[i]->send("hello from " + std::to_string(i));

    std::map<Peer, std::vector<std::string>> received;
    waitUntil([&] {
        for (auto& [peer, messages] : server->getAllMessages())
            for (auto& message : messages)
                received[peer].push_back(std::move(message));
        return received.size() == 3;
    });

    ASSERT_EQ(received.size(), 3u);
    for (std::size_t i = 0; i < clients.size(); ++i)
        EXPECT_EQ(received[peerOf(*clients[i])], (std::vector<std::string>{"hello from " + std::to_string(i)}));
}

TEST(StreamTest, SendToAllIsolatesFailures)
{
    SocketInitializer init;
    const auto server = makeServer();
    const auto broken = makeClient(*server);
    const auto healthy = makeClient(*server);
    ASSERT_EQ(admit(*server, 2).size(), 2u);

    healthy->startReceiving();
    server->connection(peerOf(*broken)).shutdown(ShutdownMode::Write);

    const SendReport report = server->sendToAll("broadcast");
    EXPECT_FALSE(report.ok());
    EXPECT_EQ(report.failed, (std::vector<Peer>{peerOf(*broken)}));
    EXPECT_EQ(report.delivered, (std::vector<Peer>{peerOf(*healthy)}));
    EXPECT_FALSE(server->connection(peerOf(*broken)).getLastError().empty());

    EXPECT_EQ(collectFrom(*healthy, 1), (std::vector<std::string>{"broadcast"}));
}

TEST(StreamTest, SendToAllRejectsUnframeableMessage)
{
    SocketInitializer init;
    const auto server = makeServer(1);
    const auto client = makeClient(*server, 1);
    ASSERT_EQ(admit(*server, 1).size(), 1u);

    EXPECT_THROW(static_cast<void>(server->sendToAll(std::string(256, 'x'))), EncodingException);
    EXPECT_THROW(client->send(std::string(256, 'x')), EncodingException);
    EXPECT_THROW(client->send("\xC3\x28"), EncodingException);
}

TEST(StreamTest, AcceptLoopSurvivesResetConnections)
{
    SocketInitializer init;
    const auto server = makeServer();

    for (int i = 0; i < 5; ++i)
    {
        Socket doomed(Loopback, server->getLocalPort());
        // Zero linger turns close() into a reset.
        linger opt{};
        opt.l_onoff = 1;
        opt.l_linger = 0;
        ASSERT_EQ(::setsockopt(doomed.getSocketFd(), SOL_SOCKET, SO_LINGER, reinterpret_cast<const char*>(&opt),
                               static_cast<socklen_t>(sizeof(opt))),
                  0);
        doomed.close();
    }

    const auto client = makeClient(*server);
    EXPECT_TRUE(waitUntil([&] {
        static_cast<void>(server->drainNewConnections());
        return server->hasPeer(peerOf(*client));
    }));

    auto stopped = std::async(std::launch::async, [&] { server->stopListeningForConnections(); });
    ASSERT_EQ(stopped.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    stopped.get();
    EXPECT_FALSE(server->isListeningForConnections());
}

TEST(StreamTest, UnknownPeerIsRejected)
{
    SocketInitializer init;
    const auto server = makeServer();
    const Peer stranger{Loopback, 1};

    EXPECT_THROW(server->sendTo(stranger, "hi"), UnknownPeerException);
    EXPECT_THROW(server->dropPeer(stranger), UnknownPeerException);
    EXPECT_THROW(static_cast<void>(server->getMessagesFrom(stranger)), UnknownPeerException);
    EXPECT_THROW(static_cast<void>(server->connection(stranger)), UnknownPeerException);
}

TEST(StreamTest, DropPeerClosesTheConnection)
{
    SocketInitializer init;
    const auto server = makeServer();
    const auto client = makeClient(*server);
    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);

    server->listenForMessages();
    client->startReceiving();
    server->dropPeer(peers[0]);
    EXPECT_FALSE(server->hasPeer(peers[0]));

    EXPECT_TRUE(waitUntil([&] { return client->getState() == ConnectionState::Closed; }));
}

TEST(StreamTest, DropPeerReturnsWhileFrameIsIncomplete)
{
    SocketInitializer init;
    const auto server = makeServer();
    const Socket raw(Loopback, server->getLocalPort());
    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);
    server->listenForMessages();

    // Two of the four header bytes, then silence.
    EXPECT_EQ(raw.writeAll(std::string("\0\0", 2)), 2u);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto dropped = std::async(std::launch::async, [&] { server->dropPeer(peers[0]); });
    ASSERT_EQ(dropped.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    dropped.get();
    EXPECT_FALSE(server->hasPeer(peers[0]));
}

TEST(StreamTest, StopDuringPartialFrameClosesTheConnection)
{
    SocketInitializer init;
    const auto server = makeServer();
    const Socket raw(Loopback, server->getLocalPort());
    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);
    server->listenForMessages();

    // Complete header announcing 10 bytes, followed by only 3 of them.
    EXPECT_EQ(raw.writeAll(std::string("\0\0\0\x0a" "abc", 7)), 7u);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    auto stopped = std::async(std::launch::async, [&] { server->stopListeningForMessages(); });
    ASSERT_EQ(stopped.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    stopped.get();

    auto& conn = server->connection(peers[0]);
    EXPECT_EQ(conn.getState(), ConnectionState::Closed);
    EXPECT_FALSE(conn.getLastError().empty());
    EXPECT_TRUE(server->getMessagesFrom(peers[0]).empty());
}

TEST(StreamTest, OversizedFrameClosesTheConnection)
{
    SocketInitializer init;
    const auto server = makeServer(DefaultHeaderWidth, 8);
    const auto client = makeClient(*server);
    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);
    server->listenForMessages();

    client->send("this payload is longer than eight bytes");

    auto& conn = server->connection(peers[0]);
    EXPECT_TRUE(waitUntil([&] { return conn.getState() == ConnectionState::Closed; }));
    EXPECT_FALSE(conn.getLastError().empty());
    EXPECT_TRUE(server->getMessagesFrom(peers[0]).empty());
}

TEST(StreamTest, CloseRequiresStoppedReceiver)
{
    SocketInitializer init;
    const auto server = makeServer();
    const auto client = makeClient(*server);
    ASSERT_EQ(admit(*server, 1).size(), 1u);

    client->startReceiving();
    EXPECT_THROW(client->close(), PreconditionException);
    EXPECT_EQ(client->getState(), ConnectionState::Active);

    client->stopReceiving();
    EXPECT_NO_THROW(client->close());
    EXPECT_NO_THROW(client->close());
    EXPECT_EQ(client->getState(), ConnectionState::Closed);

    EXPECT_THROW(client->send("late"), SendException);
    EXPECT_THROW(client->startReceiving(), PreconditionException);
}

TEST(StreamTest, ClientWithoutAutoConnectStartsIdle)
{
    SocketInitializer init;
    const auto server = makeServer();

    StreamClient client(Loopback, server->getLocalPort(), DefaultHeaderWidth, FastPollMillis, 2000, false);
    EXPECT_EQ(client.getState(), ConnectionState::Idle);
    EXPECT_THROW(client.send("too early"), SendException);
    EXPECT_THROW(client.startReceiving(), PreconditionException);

    client.connect();
    EXPECT_EQ(client.getState(), ConnectionState::Active);
    EXPECT_EQ(client.getPeer(), (Peer{Loopback, server->getLocalPort()}));
    EXPECT_THROW(client.connect(), PreconditionException);

    const auto peers = admit(*server, 1);
    ASSERT_EQ(peers.size(), 1u);
    EXPECT_EQ(peers[0], peerOf(client));
}

TEST(StreamTest, ConnectToClosedPortFails)
{
    SocketInitializer init;
    Port port;
    {
        const auto server = makeServer();
        port = server->getLocalPort();
    }
    EXPECT_THROW({ const StreamClient client(Loopback, port, DefaultHeaderWidth, FastPollMillis, 2000); },
                 SocketException);
}

TEST(StreamTest, InvalidConfigurationThrows)
{
    SocketInitializer init;
    EXPECT_THROW(StreamServer(0, Loopback, 0), ConfigurationException);
    EXPECT_THROW(StreamServer(0, Loopback, 9), ConfigurationException);
    EXPECT_THROW(StreamServer(0, Loopback, 4, 0), ConfigurationException);
    EXPECT_THROW(StreamServer(0, Loopback, 4, FastPollMillis, 0), ConfigurationException);
    EXPECT_THROW(StreamServer(0, "256.256.256.256"), ConfigurationException);

    EXPECT_THROW(StreamClient(Loopback, 0), ConfigurationException);
    EXPECT_THROW(StreamClient(Loopback, 1234, 9), ConfigurationException);
    EXPECT_THROW(StreamClient(Loopback, 1234, 4, 0, -1, false), ConfigurationException);
}

TEST(StreamTest, PortInUseThrowsBindException)
{
    SocketInitializer init;
    const auto first = makeServer();
    EXPECT_THROW(StreamServer(first->getLocalPort(), Loopback), BindException);
}

TEST(StreamTest, CloseReleasesEverything)
{
    SocketInitializer init;
    const auto server = makeServer();
    const auto client = makeClient(*server);
    ASSERT_EQ(admit(*server, 1).size(), 1u);
    server->listenForMessages();
    client->startReceiving();

    server->close();
    EXPECT_FALSE(server->isListeningForConnections());
    EXPECT_TRUE(server->getPeers().empty());
    EXPECT_EQ(server->getLocalPort(), 0);
    EXPECT_THROW(server->listenForConnections(), PreconditionException);
    EXPECT_NO_THROW(server->close());

    EXPECT_TRUE(waitUntil([&] { return client->getState() == ConnectionState::Closed; }));
}

TEST(StreamTest, ConnectionStateNames)
{
    EXPECT_STREQ(toString(ConnectionState::Idle), "idle");
    EXPECT_STREQ(toString(ConnectionState::Active), "active");
    EXPECT_STREQ(toString(ConnectionState::Closing), "closing");
    EXPECT_STREQ(toString(ConnectionState::Closed), "closed");
}
