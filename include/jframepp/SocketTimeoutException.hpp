/**
 * @file SocketTimeoutException.hpp
 * @brief Exception class for socket operations that exceed their timeout.
 */

#pragma once

#include "common.hpp"
#include "SocketException.hpp"

namespace jframepp
{

/**
 * @class SocketTimeoutException
 * @ingroup exceptions
 * @brief Thrown when a bounded socket operation (e.g. a connect with a timeout) does not complete in time.
 *
 * The default error code is the platform timeout code (`ETIMEDOUT` or `WSAETIMEDOUT`) and the default
 * message is derived from it with @ref SocketErrorMessage.
 *
 * @code
 * try {
 *     StreamClient client("10.255.255.1", 9000, DefaultHeaderWidth, DefaultPollTimeoutMillis, 250);
 * } catch (const SocketTimeoutException& e) {
 *     std::cerr << "Timeout: " << e.what() << std::endl;
 * }
 * @endcode
 */
class SocketTimeoutException final : public SocketException
{
  public:
    /**
     * @param errorCode Platform timeout code (default: JFRAMEPP_TIMEOUT_CODE).
     * @param message   Optional message; generated from @p errorCode when empty.
     */
    explicit SocketTimeoutException(const int errorCode = JFRAMEPP_TIMEOUT_CODE, std::string message = "")
        : SocketException(errorCode, message.empty() ? SocketErrorMessage(errorCode) : std::move(message))
    {
    }
};

} // namespace jframepp
