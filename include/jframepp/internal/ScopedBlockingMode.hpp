/**
 * @file ScopedBlockingMode.hpp
 * @brief RAII guard that switches a socket to non-blocking mode for the duration of a scope.
 */

#pragma once

#include "../common.hpp"
#include "../SocketException.hpp"

namespace jframepp::internal
{

/**
 * @class ScopedBlockingMode
 * @ingroup internal
 * @brief Overrides a socket's blocking mode and restores the original mode on destruction.
 *
 * Used by Socket::connect() when a connect timeout is requested (the connect is started in non-blocking
 * mode and completed with a readiness wait) and by ServerSocket::tryAccept().
 *
 * @code
 * {
 *     internal::ScopedBlockingMode guard(fd, true); // non-blocking inside this scope
 *     ::connect(fd, addr, len);
 * } // original mode restored
 * @endcode
 */
class ScopedBlockingMode
{
  public:
    /**
     * @param sock                 Descriptor to modify.
     * @param temporaryNonBlocking Mode to apply for the lifetime of the guard.
     * @throws SocketException if the current mode cannot be read or changed.
     */
    ScopedBlockingMode(const SOCKET sock, const bool temporaryNonBlocking) : _sock(sock)
    {
#ifdef _WIN32
        // Windows cannot query FIONBIO; sockets created by jframepp start out blocking.
        _wasBlocking = true;
        if (temporaryNonBlocking)
        {
            u_long newMode = 1;
            if (ioctlsocket(_sock, FIONBIO, &newMode) == SOCKET_ERROR)
            {
                const int error = GetSocketError();
                throw SocketException(error, SocketErrorMessage(error));
            }
        }
#else
        const int flags = fcntl(_sock, F_GETFL, 0);
        if (flags == -1)
            throw SocketException(errno, "ScopedBlockingMode: fcntl(F_GETFL) failed");

        _wasBlocking = !(flags & O_NONBLOCK);

        if (_wasBlocking == temporaryNonBlocking)
        {
            const int newFlags = temporaryNonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
            if (fcntl(_sock, F_SETFL, newFlags) == -1)
                throw SocketException(errno, "ScopedBlockingMode: fcntl(F_SETFL) failed");
        }
#endif
    }

    /**
     * @brief Restores the original mode. Failures are ignored.
     */
    ~ScopedBlockingMode() noexcept
    {
#ifdef _WIN32
        u_long mode = _wasBlocking ? 0 : 1;
        ioctlsocket(_sock, FIONBIO, &mode);
#else
        if (const int flags = fcntl(_sock, F_GETFL, 0); flags != -1)
        {
            const int newFlags = _wasBlocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
            fcntl(_sock, F_SETFL, newFlags);
        }
#endif
    }

    ScopedBlockingMode(const ScopedBlockingMode&) = delete;
    ScopedBlockingMode& operator=(const ScopedBlockingMode&) = delete;

  private:
    SOCKET _sock;        ///< Descriptor whose mode is overridden.
    bool _wasBlocking{}; ///< Mode to restore.
};

} // namespace jframepp::internal
