/**
 * @file InboundQueue.hpp
 * @brief Thread-safe FIFO that hands received messages from a network thread to the application.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <vector>

namespace jframepp
{

/**
 * @class InboundQueue
 * @ingroup messaging
 * @brief Unbounded, insertion-ordered queue with draining reads.
 *
 * One receive loop produces, the application consumes. Consumers never take single elements: they drain
 * everything queued so far, either immediately (drain()) or after waiting for at least one element
 * (drainFor()).
 *
 * @tparam T Entry type (`std::string` for stream traffic, DatagramMessage for datagrams).
 */
template <typename T> class InboundQueue
{
  public:
    InboundQueue() = default;

    InboundQueue(const InboundQueue&) = delete;
    InboundQueue& operator=(const InboundQueue&) = delete;

    /**
     * @brief Append @p value and wake one waiting consumer.
     */
    void push(T value)
    {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _items.push_back(std::move(value));
        }
        _cond.notify_one();
    }

    /**
     * @brief Remove and return everything queued, oldest first. Never blocks.
     */
    [[nodiscard]] std::vector<T> drain()
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return takeAll();
    }

    /**
     * @brief Wait up to @p timeout for at least one entry, then drain.
     * @return Possibly empty if the timeout elapsed first.
     */
    template <typename Rep, typename Period>
    [[nodiscard]] std::vector<T> drainFor(const std::chrono::duration<Rep, Period>& timeout)
    {
        std::unique_lock<std::mutex> lock(_mutex);
        _cond.wait_for(lock, timeout, [this] { return !_items.empty(); });
        return takeAll();
    }

    [[nodiscard]] std::size_t size() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.size();
    }

    [[nodiscard]] bool empty() const
    {
        std::lock_guard<std::mutex> lock(_mutex);
        return _items.empty();
    }

  private:
    // Caller holds _mutex.
    std::vector<T> takeAll()
    {
        std::vector<T> out;
        out.reserve(_items.size());
        for (auto& item : _items)
            out.push_back(std::move(item));
        _items.clear();
        return out;
    }

    mutable std::mutex _mutex;
    std::condition_variable _cond;
    std::deque<T> _items;
};

} // namespace jframepp
