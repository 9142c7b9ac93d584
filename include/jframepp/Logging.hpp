/**
 * @file Logging.hpp
 * @brief spdlog-backed component loggers for jframepp.
 */

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace jframepp
{

/**
 * @class LogManager
 * @ingroup core
 * @brief Central owner of the library's spdlog loggers.
 *
 * Components log through named loggers that share one colour console sink:
 * - `default`   : anything without a more specific component
 * - `transport` : socket wrappers and address resolution
 * - `stream`    : PeerConnection, StreamServer, StreamClient
 * - `datagram`  : DatagramEndpoint
 *
 * Initialization happens lazily on first use and exactly once (`std::call_once`). The initial level is taken from
 * the `JFRAMEPP_LOG_LEVEL` environment variable when set (`trace`, `debug`, `info`, `warn`, `err`, `critical`,
 * `off`), otherwise `warn`.
 *
 * Thread-safety: all members are thread-safe.
 */
class LogManager
{
  public:
    /**
     * @brief Create the loggers at @p level. Later calls are ignored.
     */
    static void initialize(const std::string& level = "warn");

    /**
     * @brief Flush and drop every logger. Logging afterwards re-creates a console logger on demand.
     */
    static void shutdown();

    /**
     * @brief Logger for @p name, falling back to `default` for unknown components.
     */
    static std::shared_ptr<spdlog::logger> getLogger(const std::string& name = "default");

    /**
     * @brief Change the level of every component logger.
     */
    static void setLogLevel(const std::string& level);

    /**
     * @brief Change the level of a single component logger.
     */
    static void setComponentLevel(const std::string& component, const std::string& level);
};

} // namespace jframepp

#define JFRAMEPP_LOG_DEBUG(...) ::jframepp::LogManager::getLogger()->debug(__VA_ARGS__)
#define JFRAMEPP_LOG_INFO(...) ::jframepp::LogManager::getLogger()->info(__VA_ARGS__)
#define JFRAMEPP_LOG_WARN(...) ::jframepp::LogManager::getLogger()->warn(__VA_ARGS__)
#define JFRAMEPP_LOG_ERROR(...) ::jframepp::LogManager::getLogger()->error(__VA_ARGS__)

#define JFRAMEPP_TRANSPORT_DEBUG(...) ::jframepp::LogManager::getLogger("transport")->debug(__VA_ARGS__)
#define JFRAMEPP_TRANSPORT_WARN(...) ::jframepp::LogManager::getLogger("transport")->warn(__VA_ARGS__)

#define JFRAMEPP_STREAM_TRACE(...) ::jframepp::LogManager::getLogger("stream")->trace(__VA_ARGS__)
#define JFRAMEPP_STREAM_DEBUG(...) ::jframepp::LogManager::getLogger("stream")->debug(__VA_ARGS__)
#define JFRAMEPP_STREAM_INFO(...) ::jframepp::LogManager::getLogger("stream")->info(__VA_ARGS__)
#define JFRAMEPP_STREAM_WARN(...) ::jframepp::LogManager::getLogger("stream")->warn(__VA_ARGS__)
#define JFRAMEPP_STREAM_ERROR(...) ::jframepp::LogManager::getLogger("stream")->error(__VA_ARGS__)

#define JFRAMEPP_DGRAM_TRACE(...) ::jframepp::LogManager::getLogger("datagram")->trace(__VA_ARGS__)
#define JFRAMEPP_DGRAM_DEBUG(...) ::jframepp::LogManager::getLogger("datagram")->debug(__VA_ARGS__)
#define JFRAMEPP_DGRAM_INFO(...) ::jframepp::LogManager::getLogger("datagram")->info(__VA_ARGS__)
#define JFRAMEPP_DGRAM_WARN(...) ::jframepp::LogManager::getLogger("datagram")->warn(__VA_ARGS__)
#define JFRAMEPP_DGRAM_ERROR(...) ::jframepp::LogManager::getLogger("datagram")->error(__VA_ARGS__)
