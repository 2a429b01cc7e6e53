#pragma once

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <type_traits>

namespace Persistence::Detail
{
    /**
     * @brief Reads and writes one optional option field. Absent json keys leave the field empty, empty fields are
     * not written, so a saved file only holds what the user set.
     */
    template <typename T>
    struct OptionalField;

    template <typename T>
    struct OptionalField<std::optional<T>>
    {
        static void read(nlohmann::json const& json, char const* name, std::optional<T>& field)
        {
            auto it = json.find(name);
            if (it == json.end() || it->is_null())
                field.reset();
            else
                field = it->template get<T>();
        }

        static void write(nlohmann::json& json, char const* name, std::optional<T> const& field)
        {
            if (field)
                json[name] = *field;
        }
    };

    // Durations are plain counts of their own unit: "progressInterval": 100 means 100ms.
    template <typename Rep, typename Period>
    struct OptionalField<std::optional<std::chrono::duration<Rep, Period>>>
    {
        using Duration = std::chrono::duration<Rep, Period>;

        static void read(nlohmann::json const& json, char const* name, std::optional<Duration>& field)
        {
            auto it = json.find(name);
            if (it == json.end() || it->is_null())
                field.reset();
            else
                field = Duration{it->template get<Rep>()};
        }

        static void write(nlohmann::json& json, char const* name, std::optional<Duration> const& field)
        {
            if (field)
                json[name] = field->count();
        }
    };
}

#define TO_JSON_OPTIONAL(JSON, CLASS, MEMBER) \
    Persistence::Detail::OptionalField<std::decay_t<decltype(CLASS.MEMBER)>>::write(JSON, #MEMBER, CLASS.MEMBER)

#define FROM_JSON_OPTIONAL(JSON, CLASS, MEMBER) \
    Persistence::Detail::OptionalField<std::decay_t<decltype(CLASS.MEMBER)>>::read(JSON, #MEMBER, CLASS.MEMBER)
