/**
 * @file LocalAddress.hpp
 * @brief Discovery of this host's outward-facing IP address.
 */

#pragma once

#include <string>

namespace jframepp
{

/**
 * @brief Address this host would use to reach the public internet, used as the default bind address.
 * @ingroup core
 *
 * Strategy, first success wins:
 * 1. Connect a throw-away UDP socket toward `8.8.8.8:80` (nothing is sent) and read its local address.
 * 2. Resolve the host name returned by `gethostname()` and take the first IPv4 result.
 * 3. `127.0.0.1`.
 *
 * Each failed step is logged at debug level on the `transport` logger.
 *
 * @return A numeric IPv4 address. Never throws.
 */
std::string getLocalAddress() noexcept;

} // namespace jframepp
