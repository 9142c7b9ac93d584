// GoogleTest unit tests for LogManager
#include "jframepp/Logging.hpp"

#include <gtest/gtest.h>

using namespace jframepp;

TEST(LoggingTest, ComponentLoggersAreNamed)
{
    EXPECT_EQ(LogManager::getLogger()->name(), "default");
    EXPECT_EQ(LogManager::getLogger("transport")->name(), "transport");
    EXPECT_EQ(LogManager::getLogger("stream")->name(), "stream");
    EXPECT_EQ(LogManager::getLogger("datagram")->name(), "datagram");
}

TEST(LoggingTest, UnknownComponentFallsBackToDefault)
{
    EXPECT_EQ(LogManager::getLogger("no-such-component"), LogManager::getLogger("default"));
}

TEST(LoggingTest, LevelsChangeAtRuntime)
{
    LogManager::setLogLevel("info");
    EXPECT_EQ(LogManager::getLogger("stream")->level(), spdlog::level::info);

    LogManager::setComponentLevel("datagram", "debug");
    EXPECT_EQ(LogManager::getLogger("datagram")->level(), spdlog::level::debug);
    EXPECT_EQ(LogManager::getLogger("stream")->level(), spdlog::level::info);

    LogManager::setLogLevel("warn");
    EXPECT_EQ(LogManager::getLogger("datagram")->level(), spdlog::level::warn);
}

TEST(LoggingTest, LoggersAreRebuiltAfterShutdown)
{
    LogManager::shutdown();

    const auto logger = LogManager::getLogger("transport");
    ASSERT_NE(logger, nullptr);
    EXPECT_EQ(logger->name(), "transport");
    EXPECT_NO_THROW(JFRAMEPP_TRANSPORT_WARN("logged after shutdown: {}", 1));
}
