/**
 * @file SocketInitializer.hpp
 * @brief RAII helper for socket subsystem initialization and cleanup in jframepp.
 */

#pragma once

#include "common.hpp"
#include "Logging.hpp"
#include "SocketException.hpp"

namespace jframepp
{
/**
 * @brief Initializes the socket subsystem for its lifetime (WSAStartup/WSACleanup on Windows, no-op elsewhere).
 *
 * Create one in `main()` (or per test) before constructing any server, client or endpoint.
 */
class SocketInitializer
{
  public:
    /**
     * @throws SocketException if initialization fails.
     */
    SocketInitializer()
    {
        if (InitSockets() != 0)
        {
            const int error = GetSocketError();
            throw SocketException(error, SocketErrorMessage(error));
        }
    }

    /**
     * @note Cleanup failures are logged, never thrown.
     */
    ~SocketInitializer() noexcept
    {
        if (CleanupSockets() != 0)
        {
            const int error = GetSocketError();
            JFRAMEPP_TRANSPORT_WARN("Socket cleanup failed: {} ({})", SocketErrorMessage(error), error);
        }
    }

    SocketInitializer(const SocketInitializer& rhs) = delete;
    SocketInitializer& operator=(const SocketInitializer& rhs) = delete;
};

} // namespace jframepp
