#include <explorer/user_group_map.hpp>
#include <utility/string_util.hpp>

#include <fmt/format.h>

#include <charconv>

namespace Explorer
{
    IdNameMap parseIdNameMap(std::string_view content)
    {
        IdNameMap result{};
        for (auto const& line : Utility::splitLines(content))
        {
            if (line.empty() || line.front() == '#')
                continue;

            const auto fields = Utility::split(line, ':');
            if (fields.size() < 3 || fields[0].empty())
                continue;

            std::uint32_t id = 0;
            const auto idField = std::string_view{fields[2]};
            const auto [end, ec] = std::from_chars(idField.data(), idField.data() + idField.size(), id);
            if (ec != std::errc{} || end != idField.data() + idField.size())
                continue;

            result.emplace(id, std::string{fields[0]});
        }
        return result;
    }

    std::string UserGroupMap::username(std::uint32_t uid) const
    {
        if (auto it = users.find(uid); it != users.end())
            return it->second;
        return std::to_string(uid);
    }

    std::string UserGroupMap::groupname(std::uint32_t gid) const
    {
        if (auto it = groups.find(gid); it != groups.end())
            return it->second;
        return std::to_string(gid);
    }

    std::string UserGroupMap::formatOwner(std::optional<std::uint32_t> uid, std::optional<std::uint32_t> gid) const
    {
        if (!uid && !gid)
            return "-";
        return fmt::format(
            "{}:{}", uid ? username(*uid) : std::string{"-"}, gid ? groupname(*gid) : std::string{"-"});
    }
}
