#include "jframepp/Logging.hpp"

#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <vector>

namespace jframepp
{

namespace
{

std::once_flag s_initFlag;

struct LoggerRegistry
{
    std::mutex mutex; ///< Guards every access to loggers.
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers;
};

// Never destroyed: sockets with static storage duration still log from their destructors at exit.
LoggerRegistry& registry()
{
    static auto* instance = new LoggerRegistry();
    return *instance;
}

constexpr const char* LogPattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";

const std::vector<std::string>& components()
{
    static const std::vector<std::string> names = {"default", "transport", "stream", "datagram"};
    return names;
}

std::shared_ptr<spdlog::logger> makeLogger(const std::string& name, const spdlog::sink_ptr& sink,
                                           const spdlog::level::level_enum level)
{
    auto logger = std::make_shared<spdlog::logger>(name, sink);
    logger->set_level(level);
    logger->flush_on(spdlog::level::warn);
    return logger;
}

void initializeInternal(const std::string& requestedLevel)
{
    std::string level = requestedLevel;
    if (const char* env = std::getenv("JFRAMEPP_LOG_LEVEL"); env && *env)
        level = env;

    try
    {
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_pattern(LogPattern);

        const auto lvl = spdlog::level::from_str(level);

        auto& reg = registry();
        std::lock_guard<std::mutex> lock(reg.mutex);
        for (const auto& component : components())
            reg.loggers[component] = makeLogger(component, sink, lvl);
    }
    catch (const spdlog::spdlog_ex& ex)
    {
        // The registry stays empty; getLogger() installs a minimal fallback.
        std::cerr << "jframepp: log initialization failed: " << ex.what() << std::endl;
    }
}

} // namespace

void LogManager::initialize(const std::string& level)
{
    std::call_once(s_initFlag, initializeInternal, level);
}

void LogManager::shutdown()
{
    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    for (auto& [name, logger] : reg.loggers)
        logger->flush();
    reg.loggers.clear();
}

std::shared_ptr<spdlog::logger> LogManager::getLogger(const std::string& name)
{
    initialize();

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);

    if (const auto it = reg.loggers.find(name); it != reg.loggers.end())
        return it->second;

    if (reg.loggers.empty())
    {
        // Initialization failed or shutdown() ran: rebuild a warn-level console logger.
        auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        sink->set_pattern(LogPattern);
        for (const auto& component : components())
            reg.loggers[component] = makeLogger(component, sink, spdlog::level::warn);
        if (const auto it = reg.loggers.find(name); it != reg.loggers.end())
            return it->second;
    }

    return reg.loggers["default"];
}

void LogManager::setLogLevel(const std::string& level)
{
    initialize();

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    const auto lvl = spdlog::level::from_str(level);
    for (auto& [name, logger] : reg.loggers)
        logger->set_level(lvl);
}

void LogManager::setComponentLevel(const std::string& component, const std::string& level)
{
    initialize();

    auto& reg = registry();
    std::lock_guard<std::mutex> lock(reg.mutex);
    if (const auto it = reg.loggers.find(component); it != reg.loggers.end())
    {
        it->second->set_level(spdlog::level::from_str(level));
        return;
    }

    if (const auto def = reg.loggers.find("default"); def != reg.loggers.end())
        def->second->warn("Unknown log component: {}", component);
}

} // namespace jframepp
