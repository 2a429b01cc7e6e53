#pragma once

#include <utility/describe.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace Utility
{
    /**
     * @brief Name of a described enumerator, or fallback for values without a description.
     */
    template <typename EnumType>
    std::string enumToString(EnumType value, char const* fallback)
    {
        return boost::describe::enum_to_string(value, fallback);
    }

    template <typename EnumType>
    std::optional<EnumType> enumFromString(std::string_view name)
    {
        EnumType value{};
        if (!boost::describe::enum_from_string(std::string{name}.c_str(), value))
            return std::nullopt;
        return value;
    }
}
