#pragma once

#include <explorer/directory_cache.hpp>

#include <set>
#include <string>
#include <vector>

namespace Explorer
{
    struct TreeRow
    {
        std::string path;
        std::string name;
        int depth;
        bool expanded;
        // A listing is cached, so expanding shows children without a round trip.
        bool loaded;

        friend bool operator==(TreeRow const&, TreeRow const&) = default;
    };

    /**
     * @brief Flattens the directory tree into rows, depth first, starting with "/".
     * Children are only emitted for expanded directories that have a cached listing.
     */
    std::vector<TreeRow>
    projectDirectoryTree(DirectoryCache const& cache, std::set<std::string> const& expanded, bool showHidden);
}
