#pragma once

#include <log/level.hpp>
#include <log/logger.hpp>

#include <expected>
#include <filesystem>
#include <string>
#include <utility>

namespace Log
{
    namespace Detail
    {
        extern Logger logger;
    }

    /**
     * @brief Replaces the sinks: the console, plus logFile if it is not empty. Fails if the log file cannot be
     * opened, the previous configuration stays active then.
     */
    std::expected<void, std::string> setup(Level level, std::filesystem::path const& logFile = {});

    void flush();

    inline void setLevel(Level level)
    {
        Detail::logger.setLevel(level);
    }

    inline Level level()
    {
        return Detail::logger.level();
    }

    template <typename... Args>
    void log(Level level, spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        Detail::logger.log(level, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void trace(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        log(Level::Trace, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void debug(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        log(Level::Debug, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void info(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        log(Level::Info, fmt, std::forward<Args>(args)...);
    }

    /// Recoverable problems: refused channels, unreadable name maps, fallbacks.
    template <typename... Args>
    void warn(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        log(Level::Warning, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void error(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        log(Level::Error, fmt, std::forward<Args>(args)...);
    }

    template <typename... Args>
    void critical(spdlog::format_string_t<Args...> fmt, Args&&... args)
    {
        log(Level::Critical, fmt, std::forward<Args>(args)...);
    }
}
