#pragma once

#include <utility/string_util.hpp>

#include <spdlog/common.h>

#include <array>
#include <string>
#include <string_view>

namespace Log
{
    enum class Level
    {
        Trace,
        Debug,
        Info,
        Warning,
        Error,
        Critical,
        Off
    };

    namespace Detail
    {
        struct LevelInfo
        {
            Level level;
            spdlog::level::level_enum spdlogLevel;
            std::string_view name;
        };

        inline constexpr std::array<LevelInfo, 7> levelTable{{
            {Level::Trace, spdlog::level::trace, "trace"},
            {Level::Debug, spdlog::level::debug, "debug"},
            {Level::Info, spdlog::level::info, "info"},
            {Level::Warning, spdlog::level::warn, "warning"},
            {Level::Error, spdlog::level::err, "error"},
            {Level::Critical, spdlog::level::critical, "critical"},
            {Level::Off, spdlog::level::off, "off"},
        }};
    }

    inline spdlog::level::level_enum toSpdlogLevel(Level level)
    {
        for (auto const& entry : Detail::levelTable)
        {
            if (entry.level == level)
                return entry.spdlogLevel;
        }
        return spdlog::level::info;
    }

    inline Level fromSpdlogLevel(spdlog::level::level_enum level)
    {
        for (auto const& entry : Detail::levelTable)
        {
            if (entry.spdlogLevel == level)
                return entry.level;
        }
        return Level::Info;
    }

    /**
     * @brief Parses a level name case insensitively, "warn" is accepted for warning. Unknown names yield Info.
     */
    inline Level levelFromString(std::string_view name)
    {
        const auto lowered = Utility::toLowerCase(name);
        if (lowered == "warn")
            return Level::Warning;
        for (auto const& entry : Detail::levelTable)
        {
            if (entry.name == lowered)
                return entry.level;
        }
        return Level::Info;
    }

    inline std::string levelToString(Level level)
    {
        for (auto const& entry : Detail::levelTable)
        {
            if (entry.level == level)
                return std::string{entry.name};
        }
        return "info";
    }
}
