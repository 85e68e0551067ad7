#pragma once

#include <memory>
#include <string>
#include <spdlog/spdlog.h>

namespace skyraid {

/// Process-wide loggers. The core logger is used by the simulation core, the
/// game logger by gameplay callbacks and the host driver.
class Log {
public:
    static void init(const std::string& logFile = "", const std::string& level = "debug");
    static void shutdown();

    /// Both accessors initialise default console logging on first use
    static std::shared_ptr<spdlog::logger>& getCoreLogger();
    static std::shared_ptr<spdlog::logger>& getGameLogger();

    /// Map a level name ("trace" .. "critical") to spdlog; unknown names give debug
    static spdlog::level::level_enum parseLevel(const std::string& level);

private:
    static void ensureInitialized();

    static std::shared_ptr<spdlog::logger> s_coreLogger;
    static std::shared_ptr<spdlog::logger> s_gameLogger;
};

} // namespace skyraid

// Core logging macros
#define LOG_TRACE(...)    ::skyraid::Log::getCoreLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)    ::skyraid::Log::getCoreLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)     ::skyraid::Log::getCoreLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)     ::skyraid::Log::getCoreLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)    ::skyraid::Log::getCoreLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...) ::skyraid::Log::getCoreLogger()->critical(__VA_ARGS__)

// Gameplay logging macros
#define GAME_LOG_TRACE(...)    ::skyraid::Log::getGameLogger()->trace(__VA_ARGS__)
#define GAME_LOG_DEBUG(...)    ::skyraid::Log::getGameLogger()->debug(__VA_ARGS__)
#define GAME_LOG_INFO(...)     ::skyraid::Log::getGameLogger()->info(__VA_ARGS__)
#define GAME_LOG_WARN(...)     ::skyraid::Log::getGameLogger()->warn(__VA_ARGS__)
#define GAME_LOG_ERROR(...)    ::skyraid::Log::getGameLogger()->error(__VA_ARGS__)
#define GAME_LOG_CRITICAL(...) ::skyraid::Log::getGameLogger()->critical(__VA_ARGS__)
