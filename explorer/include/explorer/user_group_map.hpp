#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace Explorer
{
    using IdNameMap = std::unordered_map<std::uint32_t, std::string>;

    /**
     * @brief Parses files in the /etc/passwd or /etc/group format ("name:x:id:..."). Comments, blank and malformed
     * lines are skipped.
     */
    IdNameMap parseIdNameMap(std::string_view content);

    struct UserGroupMap
    {
        IdNameMap users{};
        IdNameMap groups{};

        /// The user name, or the uid as text if it is unknown.
        std::string username(std::uint32_t uid) const;
        std::string groupname(std::uint32_t gid) const;

        /**
         * @brief "user:group", "-" if both ids are missing.
         */
        std::string formatOwner(std::optional<std::uint32_t> uid, std::optional<std::uint32_t> gid) const;
    };
}
