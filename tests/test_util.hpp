// Shared helpers for the jframepp GoogleTest suites
#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace jframepp::test
{

/**
 * @brief Poll @p predicate every few milliseconds until it holds or @p timeout elapses.
 * @return The last value of @p predicate.
 */
inline bool waitUntil(const std::function<bool()>& predicate,
                      const std::chrono::milliseconds timeout = std::chrono::milliseconds(3000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

constexpr const char* Loopback = "127.0.0.1";

// Short poll slice so stop/disconnect tests finish quickly.
constexpr int FastPollMillis = 20;

} // namespace jframepp::test
