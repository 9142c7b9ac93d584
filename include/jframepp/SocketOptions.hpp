/**
 * @file SocketOptions.hpp
 * @brief Defines the SocketOptions base class shared by every jframepp socket wrapper.
 */

#pragma once

#include "common.hpp"

namespace jframepp
{

/**
 * @class SocketOptions
 * @ingroup transport
 * @brief Base class holding a socket descriptor and the few socket options jframepp changes.
 *
 * Inherited by Socket, ServerSocket and DatagramSocket. The class does not own the descriptor: derived classes
 * open and close it and must call setSocketFd() after every move or close so the base stays in sync.
 *
 * @note Not thread-safe. Option changes should be made by the thread that owns the socket.
 */
class SocketOptions
{
  public:
    /**
     * @param sock A socket descriptor, or `INVALID_SOCKET` when the derived object is not initialised yet.
     */
    explicit SocketOptions(const SOCKET sock) noexcept : _sockFd(sock) {}

    virtual ~SocketOptions() = default;

    /**
     * @brief Raw descriptor, without ownership transfer.
     *
     * Intended for readiness polling and diagnostics. Closing or reconfiguring the descriptor behind the
     * wrapper's back breaks its invariants.
     */
    [[nodiscard]] SOCKET getSocketFd() const noexcept { return _sockFd; }

    /**
     * @brief Enable or disable `SO_REUSEADDR`.
     *
     * Servers enable it so that a restarted process can bind a port still held by connections in `TIME_WAIT`.
     */
    void setReuseAddress(bool on);

    /**
     * @brief Enable or disable `TCP_NODELAY` (Nagle's algorithm off when enabled).
     */
    void setTcpNoDelay(bool on);

    /**
     * @brief Switch the descriptor between blocking and non-blocking mode for good.
     * @see internal::ScopedBlockingMode for a temporary switch.
     */
    void setNonBlocking(bool nonBlocking);

  protected:
    /**
     * @brief `setsockopt()` with an `int` value; @p name appears in the error message.
     * @throws SocketException if the socket is closed or the call fails.
     */
    void setFlag(int level, int option, int value, const char* name);

    /**
     * @brief Update the descriptor after a move, close or late socket creation.
     */
    void setSocketFd(const SOCKET sock) noexcept { _sockFd = sock; }

  private:
    SOCKET _sockFd = INVALID_SOCKET; ///< Descriptor owned by the derived class.
};

} // namespace jframepp
