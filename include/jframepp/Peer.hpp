/**
 * @file Peer.hpp
 * @brief Identity of a remote endpoint.
 */

#pragma once

#include "common.hpp"

#include <functional>
#include <ostream>
#include <string>

namespace jframepp
{

/**
 * @struct Peer
 * @ingroup messaging
 * @brief Remote endpoint identified by numeric host and port.
 *
 * Used as the registry key of StreamServer and as the sender tag of datagrams. Equality, ordering and
 * hashing consider both fields.
 */
struct Peer
{
    std::string host; ///< Numeric IP address.
    Port port = 0;    ///< Remote port.

    /**
     * @brief `host:port`, or `[host]:port` when @ref host is an IPv6 address.
     */
    [[nodiscard]] std::string toString() const;

    friend bool operator==(const Peer& lhs, const Peer& rhs) noexcept
    {
        return lhs.port == rhs.port && lhs.host == rhs.host;
    }

    friend bool operator!=(const Peer& lhs, const Peer& rhs) noexcept { return !(lhs == rhs); }

    friend bool operator<(const Peer& lhs, const Peer& rhs) noexcept
    {
        if (lhs.host != rhs.host)
            return lhs.host < rhs.host;
        return lhs.port < rhs.port;
    }
};

std::ostream& operator<<(std::ostream& os, const Peer& peer);

} // namespace jframepp

template <> struct std::hash<jframepp::Peer>
{
    std::size_t operator()(const jframepp::Peer& peer) const noexcept
    {
        const std::size_t h1 = std::hash<std::string>{}(peer.host);
        const std::size_t h2 = std::hash<jframepp::Port>{}(peer.port);
        return h1 ^ (h2 + 0x9e3779b97f4a7c15ULL + (h1 << 6) + (h1 >> 2));
    }
};
