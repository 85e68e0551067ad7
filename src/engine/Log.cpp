#include "engine/Log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include <vector>

namespace skyraid {

std::shared_ptr<spdlog::logger> Log::s_coreLogger;
std::shared_ptr<spdlog::logger> Log::s_gameLogger;

void Log::init(const std::string& logFile, const std::string& level) {
    std::vector<spdlog::sink_ptr> sinks;

    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    consoleSink->set_pattern("[%H:%M:%S] [%n] [%^%l%$] %v");
    sinks.push_back(consoleSink);

    if (!logFile.empty()) {
        auto fileSink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logFile, true);
        fileSink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        sinks.push_back(fileSink);
    }

    // Re-initialising replaces any loggers registered under the same names
    spdlog::drop("CORE");
    spdlog::drop("GAME");

    s_coreLogger = std::make_shared<spdlog::logger>("CORE", sinks.begin(), sinks.end());
    s_gameLogger = std::make_shared<spdlog::logger>("GAME", sinks.begin(), sinks.end());

    auto spdLevel = parseLevel(level);
    s_coreLogger->set_level(spdLevel);
    s_gameLogger->set_level(spdLevel);

    spdlog::register_logger(s_coreLogger);
    spdlog::register_logger(s_gameLogger);
}

void Log::shutdown() {
    if (s_coreLogger) s_coreLogger->flush();
    if (s_gameLogger) s_gameLogger->flush();
    spdlog::shutdown();
    s_coreLogger.reset();
    s_gameLogger.reset();
}

spdlog::level::level_enum Log::parseLevel(const std::string& level) {
    if (level == "trace")    return spdlog::level::trace;
    if (level == "debug")    return spdlog::level::debug;
    if (level == "info")     return spdlog::level::info;
    if (level == "warn")     return spdlog::level::warn;
    if (level == "error")    return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    return spdlog::level::debug;
}

void Log::ensureInitialized() {
    if (!s_coreLogger || !s_gameLogger) {
        init();
    }
}

std::shared_ptr<spdlog::logger>& Log::getCoreLogger() {
    ensureInitialized();
    return s_coreLogger;
}

std::shared_ptr<spdlog::logger>& Log::getGameLogger() {
    ensureInitialized();
    return s_gameLogger;
}

} // namespace skyraid
