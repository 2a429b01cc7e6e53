#pragma once

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>
#include <vector>

namespace Utility
{
    inline std::string toLowerCase(std::string_view input)
    {
        std::string result(input.size(), '\0');
        std::transform(input.begin(), input.end(), result.begin(), [](unsigned char c) {
            return static_cast<char>(std::tolower(c));
        });
        return result;
    }

    /**
     * @brief Splits on every occurrence of the delimiter. Empty fields are kept.
     */
    inline std::vector<std::string_view> split(std::string_view input, char delimiter)
    {
        std::vector<std::string_view> parts;
        std::size_t position = 0;
        while (true)
        {
            auto const next = input.find(delimiter, position);
            if (next == std::string_view::npos)
            {
                parts.push_back(input.substr(position));
                break;
            }
            parts.push_back(input.substr(position, next - position));
            position = next + 1;
        }
        return parts;
    }

    /**
     * @brief Splits text into lines, accepting both "\n" and "\r\n". A trailing newline does not produce an
     * empty last line.
     */
    inline std::vector<std::string_view> splitLines(std::string_view text)
    {
        std::vector<std::string_view> lines;
        for (auto line : split(text, '\n'))
        {
            if (!line.empty() && line.back() == '\r')
                line.remove_suffix(1);
            lines.push_back(line);
        }
        if (!lines.empty() && lines.back().empty())
            lines.pop_back();
        return lines;
    }
}
