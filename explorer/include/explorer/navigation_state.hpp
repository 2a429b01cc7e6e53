#pragma once

#include <explorer/directory_cache.hpp>
#include <explorer/navigation_history.hpp>
#include <explorer/user_group_map.hpp>
#include <shared_data/file_entry.hpp>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace Explorer
{
    /**
     * @brief Everything a file browser view renders. Only mutated on the ui executor.
     * Views compare the revision counters to decide what to redraw.
     */
    struct NavigationState
    {
        std::string currentPath{"/"};
        std::string homeDirectory{"/"};
        NavigationHistory history{};
        std::set<std::string> expandedDirectories{};
        bool showHidden{false};
        bool loading{false};
        bool connectionLost{false};
        std::optional<std::string> error{std::nullopt};

        // The listing of currentPath, unfiltered.
        std::vector<SharedData::FileEntry> fileList{};
        DirectoryCache cache{};
        UserGroupMap userGroupMap{};

        std::uint64_t fileListRevision{0};
        std::uint64_t expandedDirsRevision{0};
        std::uint64_t userGroupMapRevision{0};

        std::uint64_t dirCacheRevision() const noexcept
        {
            return cache.revision();
        }

        bool canGoBack() const noexcept
        {
            return history.canGoBack();
        }
        bool canGoForward() const noexcept
        {
            return history.canGoForward();
        }
        bool canGoUp() const noexcept
        {
            return currentPath != "/";
        }
    };
}
