#include <explorer/directory_tree.hpp>
#include <utility/remote_path.hpp>

namespace Explorer
{
    namespace
    {
        void appendChildren(
            DirectoryCache const& cache,
            std::set<std::string> const& expanded,
            bool showHidden,
            std::string const& path,
            int depth,
            std::vector<TreeRow>& rows)
        {
            auto const* entries = cache.find(path);
            if (entries == nullptr || !expanded.contains(path))
                return;

            for (auto const& entry : *entries)
            {
                if (!entry.isDirectory() || (!showHidden && entry.isHidden()))
                    continue;

                const auto childPath = Utility::normalizeRemotePath(entry.path);
                // A broken listing could name the directory itself.
                if (childPath.size() <= path.size())
                    continue;

                rows.push_back(TreeRow{
                    .path = childPath,
                    .name = entry.name,
                    .depth = depth,
                    .expanded = expanded.contains(childPath),
                    .loaded = cache.isValid(childPath),
                });
                appendChildren(cache, expanded, showHidden, childPath, depth + 1, rows);
            }
        }
    }

    std::vector<TreeRow>
    projectDirectoryTree(DirectoryCache const& cache, std::set<std::string> const& expanded, bool showHidden)
    {
        std::vector<TreeRow> rows{TreeRow{
            .path = "/",
            .name = "/",
            .depth = 0,
            .expanded = expanded.contains("/"),
            .loaded = cache.isValid("/"),
        }};
        appendChildren(cache, expanded, showHidden, "/", 1, rows);
        return rows;
    }
}
