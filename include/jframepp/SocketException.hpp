/**
 * @file SocketException.hpp
 * @brief Root exception type for every failure reported by jframepp.
 */

#pragma once

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>

namespace jframepp
{

/**
 * @class SocketException
 * @ingroup exceptions
 * @brief Base class of all jframepp errors.
 *
 * A SocketException carries a human-readable message, the platform error code that caused it
 * (`errno` on POSIX, `WSAGetLastError()` on Windows, or `0` when the failure is not tied to an OS
 * call) and, optionally, a nested exception describing the underlying cause.
 *
 * Every specialised error (configuration, bind, framing, send, registry and precondition
 * failures) derives from this class, so callers that do not care about the distinction can
 * catch `SocketException` alone.
 *
 * ### Example
 * @code
 * try {
 *     jframepp::StreamClient client("127.0.0.1", 9000);
 *     client.send("hello");
 * } catch (const jframepp::SocketException& ex) {
 *     std::cerr << "(" << ex.getErrorCode() << ") " << ex.what() << std::endl;
 *     try {
 *         std::rethrow_if_nested(ex.getNestedException());
 *     } catch (const std::exception& cause) {
 *         std::cerr << "Caused by: " << cause.what() << std::endl;
 *     }
 * }
 * @endcode
 */
class SocketException : public std::runtime_error
{
  public:
    /**
     * @brief Constructs an exception with a message and no OS error code.
     * @param message Description of the failure.
     */
    explicit SocketException(const std::string& message = "SocketException")
        : std::runtime_error(message), _errorCode(0)
    {
    }

    /**
     * @brief Constructs an exception from an OS error code.
     *
     * The final message has the form `"message (error code N)"`.
     *
     * @param code    Platform error code.
     * @param message Description of the failure.
     */
    explicit SocketException(int code, const std::string& message = "SocketException")
        : std::runtime_error(buildErrorMessage(message, code)), _errorCode(code)
    {
    }

    /**
     * @brief Constructs an exception that wraps a previously caught cause.
     *
     * @code
     * try {
     *     resolve();
     * } catch (const SocketException&) {
     *     throw ConfigurationException("invalid address", std::current_exception());
     * }
     * @endcode
     *
     * @param message Description of the higher-level failure.
     * @param nested  Exception pointer to the original cause.
     */
    SocketException(const std::string& message, std::exception_ptr nested)
        : std::runtime_error(message), _errorCode(0), _nested(std::move(nested))
    {
    }

    /**
     * @brief Platform error code captured at construction, or `0`.
     */
    [[nodiscard]] int getErrorCode() const noexcept { return _errorCode; }

    /**
     * @brief Nested cause, or a null pointer when none was attached.
     * @see std::rethrow_if_nested
     */
    [[nodiscard]] std::exception_ptr getNestedException() const noexcept { return _nested; }

    ~SocketException() override = default;

  private:
    int _errorCode;             ///< Platform-specific error code (errno, WSA error) or 0.
    std::exception_ptr _nested; ///< Optional chained cause.

    static std::string buildErrorMessage(const std::string& msg, const int code)
    {
        std::ostringstream oss;
        oss << msg << " (error code " << code << ")";
        return oss.str();
    }
};

} // namespace jframepp
