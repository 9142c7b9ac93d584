/**
 * @file MessageExceptions.hpp
 * @brief Typed failures raised by the messaging layer (codec, connections, server, endpoints).
 */

#pragma once

#include "SocketException.hpp"

#include <cstddef>
#include <string>

namespace jframepp
{

/**
 * @class ConfigurationException
 * @ingroup exceptions
 * @brief Invalid construction parameter: bad port, header width, timeout, backlog or an unresolvable address.
 *
 * Always raised synchronously from a constructor. The resolver error, when there is one, is attached as the
 * nested exception.
 */
class ConfigurationException final : public SocketException
{
  public:
    using SocketException::SocketException;
};

/**
 * @class BindException
 * @ingroup exceptions
 * @brief The requested local address/port could not be bound (already in use, not local, ...).
 */
class BindException final : public SocketException
{
  public:
    using SocketException::SocketException;
};

/**
 * @class ConnectionClosedException
 * @ingroup exceptions
 * @brief The remote side closed the stream before a complete frame was read.
 *
 * Receive loops treat this as the normal end of a connection: the connection moves to
 * ConnectionState::Closed and the loop exits.
 */
class ConnectionClosedException final : public SocketException
{
  public:
    using SocketException::SocketException;
};

/**
 * @class FrameTooLargeException
 * @ingroup exceptions
 * @brief A frame header declared a payload larger than the configured safety ceiling.
 */
class FrameTooLargeException final : public SocketException
{
  public:
    FrameTooLargeException(const std::size_t declared, const std::size_t limit)
        : SocketException("Frame of " + std::to_string(declared) + " bytes exceeds the limit of " +
                          std::to_string(limit) + " bytes"),
          _declared(declared), _limit(limit)
    {
    }

    /// Payload length announced by the frame header.
    [[nodiscard]] std::size_t getDeclaredSize() const noexcept { return _declared; }

    /// Ceiling that was exceeded.
    [[nodiscard]] std::size_t getLimit() const noexcept { return _limit; }

  private:
    std::size_t _declared;
    std::size_t _limit;
};

/**
 * @class MessageTooLargeException
 * @ingroup exceptions
 * @brief A datagram payload does not fit in a single datagram of the transport.
 */
class MessageTooLargeException final : public SocketException
{
  public:
    MessageTooLargeException(const std::size_t size, const std::size_t limit)
        : SocketException("Message of " + std::to_string(size) + " bytes exceeds the datagram limit of " +
                          std::to_string(limit) + " bytes"),
          _size(size), _limit(limit)
    {
    }

    [[nodiscard]] std::size_t getSize() const noexcept { return _size; }
    [[nodiscard]] std::size_t getLimit() const noexcept { return _limit; }

  private:
    std::size_t _size;
    std::size_t _limit;
};

/**
 * @class EncodingException
 * @ingroup exceptions
 * @brief A message cannot be encoded: its length does not fit the header, or it is not valid UTF-8.
 */
class EncodingException final : public SocketException
{
  public:
    using SocketException::SocketException;
};

/**
 * @class SendException
 * @ingroup exceptions
 * @brief Writing a message to the transport failed. Affects only the connection it was raised for.
 */
class SendException final : public SocketException
{
  public:
    using SocketException::SocketException;
};

/**
 * @class UnknownPeerException
 * @ingroup exceptions
 * @brief An operation referenced a peer that is not in the server's registry.
 */
class UnknownPeerException final : public SocketException
{
  public:
    using SocketException::SocketException;
};

/**
 * @class PreconditionException
 * @ingroup exceptions
 * @brief A resource was used or released out of the required order.
 *
 * Typical case: closing a socket whose receive loop is still attached.
 */
class PreconditionException final : public SocketException
{
  public:
    using SocketException::SocketException;
};

} // namespace jframepp
