// GoogleTest unit tests for DatagramEndpoint
#include "jframepp/DatagramEndpoint.hpp"
#include "jframepp/DatagramSocket.hpp"
#include "jframepp/MessageExceptions.hpp"
#include "jframepp/SocketInitializer.hpp"
#include "test_util.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace jframepp;
using jframepp::test::FastPollMillis;
using jframepp::test::Loopback;
using jframepp::test::waitUntil;

namespace
{

std::vector<DatagramMessage> collect(DatagramEndpoint& endpoint, const std::size_t count)
{
    std::vector<DatagramMessage> received;
    waitUntil([&] {
        for (auto& message : endpoint.waitForMessages(std::chrono::milliseconds(50)))
            received.push_back(std::move(message));
        return received.size() >= count;
    });
    return received;
}

} // namespace

TEST(DatagramTest, PingReachesListener)
{
    SocketInitializer init;
    DatagramEndpoint a(0, Loopback, FastPollMillis);
    DatagramEndpoint b(0, Loopback, FastPollMillis);
    b.listenForMessages();
    EXPECT_TRUE(b.isListening());

    a.send("ping", Loopback, b.getLocalPort());

    const auto received = collect(b, 1);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0], (DatagramMessage{"ping", Peer{Loopback, a.getLocalPort()}}));
}

TEST(DatagramTest, RepliesGoBackToTheSender)
{
    SocketInitializer init;
    DatagramEndpoint a(0, Loopback, FastPollMillis);
    DatagramEndpoint b(0, Loopback, FastPollMillis);
    a.listenForMessages();
    b.listenForMessages();

    a.send("ping", Loopback, b.getLocalPort());
    const auto atB = collect(b, 1);
    ASSERT_EQ(atB.size(), 1u);

    b.send("pong", atB[0].sender.host, atB[0].sender.port);
    const auto atA = collect(a, 1);
    ASSERT_EQ(atA.size(), 1u);
    EXPECT_EQ(atA[0].message, "pong");
    EXPECT_EQ(atA[0].sender.port, b.getLocalPort());
}

TEST(DatagramTest, MessagesFromOneSenderKeepTheirContent)
{
    SocketInitializer init;
    DatagramEndpoint a(0, Loopback, FastPollMillis);
    DatagramEndpoint b(0, Loopback, FastPollMillis);
    b.listenForMessages();

    const std::vector<std::string> sent = {"one", "héllo ✓", "", std::string(MaxDatagramPayloadSafe, 'x')};
    for (const auto& message : sent)
        a.send(message, Loopback, b.getLocalPort());

    const auto received = collect(b, sent.size());
    ASSERT_EQ(received.size(), sent.size());
    for (const auto& message : received)
        EXPECT_NE(std::find(sent.begin(), sent.end(), message.message), sent.end());
}

TEST(DatagramTest, InvalidUtf8DatagramIsDropped)
{
    SocketInitializer init;
    DatagramEndpoint b(0, Loopback, FastPollMillis);
    b.listenForMessages();

    DatagramSocket raw(0, Loopback);
    raw.bind();
    raw.sendTo(Loopback, b.getLocalPort(), "\xFF\xFE");
    raw.sendTo(Loopback, b.getLocalPort(), "valid");

    const auto received = collect(b, 1);
    ASSERT_EQ(received.size(), 1u);
    EXPECT_EQ(received[0].message, "valid");
    EXPECT_TRUE(b.isListening());
}

TEST(DatagramTest, ListenAndStopAreIdempotent)
{
    SocketInitializer init;
    DatagramEndpoint endpoint(0, Loopback, FastPollMillis);

    endpoint.stopListeningForMessages();
    endpoint.listenForMessages();
    endpoint.listenForMessages();
    EXPECT_TRUE(endpoint.isListening());

    endpoint.stopListeningForMessages();
    endpoint.stopListeningForMessages();
    EXPECT_FALSE(endpoint.isListening());

    endpoint.listenForMessages();
    EXPECT_TRUE(endpoint.isListening());
}

TEST(DatagramTest, CloseRequiresStoppedListener)
{
    SocketInitializer init;
    DatagramEndpoint endpoint(0, Loopback, FastPollMillis);
    endpoint.listenForMessages();

    EXPECT_THROW(endpoint.close(), PreconditionException);
    EXPECT_FALSE(endpoint.isClosed());

    endpoint.stopListeningForMessages();
    EXPECT_NO_THROW(endpoint.close());
    EXPECT_NO_THROW(endpoint.close());
    EXPECT_TRUE(endpoint.isClosed());
    EXPECT_THROW(endpoint.listenForMessages(), PreconditionException);
}

TEST(DatagramTest, ShutdownStopsAndCloses)
{
    SocketInitializer init;
    DatagramEndpoint endpoint(0, Loopback, FastPollMillis);
    endpoint.listenForMessages();

    endpoint.shutdown();
    EXPECT_FALSE(endpoint.isListening());
    EXPECT_TRUE(endpoint.isClosed());
    EXPECT_THROW(static_cast<void>(endpoint.getLocalPort()), SocketException);
    EXPECT_NO_THROW(endpoint.shutdown());
}

TEST(DatagramTest, SendValidatesMessage)
{
    SocketInitializer init;
    DatagramEndpoint endpoint(0, Loopback, FastPollMillis);

    try
    {
        endpoint.send(std::string(MaxDatagramPayloadSafe + 1, 'x'), Loopback, 9);
        FAIL() << "expected MessageTooLargeException";
    }
    catch (const MessageTooLargeException& e)
    {
        EXPECT_EQ(e.getSize(), MaxDatagramPayloadSafe + 1);
        EXPECT_EQ(e.getLimit(), MaxDatagramPayloadSafe);
    }

    EXPECT_THROW(endpoint.send("\xC3\x28", Loopback, 9), EncodingException);
}

TEST(DatagramTest, SendFailuresAreReported)
{
    SocketInitializer init;
    DatagramEndpoint endpoint(0, Loopback, FastPollMillis);

    EXPECT_THROW(endpoint.send("hi", "256.256.256.256", 9), SendException);

    endpoint.close();
    EXPECT_THROW(endpoint.send("hi", Loopback, 9), SendException);
}

TEST(DatagramTest, InvalidConfigurationThrows)
{
    SocketInitializer init;
    EXPECT_THROW(DatagramEndpoint(0, Loopback, 0), ConfigurationException);
    EXPECT_THROW(DatagramEndpoint(0, "256.256.256.256"), ConfigurationException);
}

TEST(DatagramTest, PortInUseThrowsBindException)
{
    SocketInitializer init;
    const DatagramEndpoint first(0, Loopback, FastPollMillis);
    EXPECT_THROW(DatagramEndpoint(first.getLocalPort(), Loopback, FastPollMillis), BindException);
}

TEST(DatagramTest, ReportsBoundAddress)
{
    SocketInitializer init;
    const DatagramEndpoint endpoint(0, Loopback, FastPollMillis);
    EXPECT_NE(endpoint.getLocalPort(), 0);
    EXPECT_EQ(endpoint.getLocalAddress(), Loopback);
    EXPECT_TRUE(endpoint.getLastError().empty());
}
