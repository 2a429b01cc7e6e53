#pragma once

#include <fmt/format.h>

#include <array>
#include <cstdint>
#include <string>

namespace Utility
{
    /**
     * @brief Human readable size with binary units and one decimal, e.g. "1.5 KB". Plain bytes have no decimal.
     */
    inline std::string formatBytes(std::uint64_t value)
    {
        constexpr std::array<char const*, 5> units{"B", "KB", "MB", "GB", "TB"};

        if (value < 1024)
            return fmt::format("{} {}", value, units[0]);

        auto scaled = static_cast<double>(value);
        std::size_t unit = 0;
        while (scaled >= 1024.0 && unit + 1 < units.size())
        {
            scaled /= 1024.0;
            ++unit;
        }
        return fmt::format("{:.1f} {}", scaled, units[unit]);
    }
}
