#pragma once

#include <shared_data/file_entry.hpp>

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace Explorer
{
    /**
     * @brief What was last seen at every loaded remote path. An entry stays valid until it is invalidated, there is no
     * expiry. All paths are normalized on the way in.
     */
    class DirectoryCache
    {
      public:
        using Entries = std::vector<SharedData::FileEntry>;

        /**
         * @brief Stores a listing, replacing whatever was cached for path. Always bumps the revision.
         */
        void update(std::string const& path, Entries entries);

        /**
         * @brief Removes the listing of path. Bumps the revision only if there was one.
         *
         * @return true if an entry was removed.
         */
        bool invalidate(std::string const& path);

        /**
         * @brief Removes path and every cached path below it. Bumps the revision once if anything was removed.
         *
         * @return The number of removed entries.
         */
        std::size_t invalidateSubtree(std::string const& path);

        void clear();

        bool isValid(std::string const& path) const;

        /**
         * @brief The cached listing or nullptr. The pointer is invalidated by the next mutation.
         */
        Entries const* find(std::string const& path) const;

        std::uint64_t revision() const noexcept
        {
            return revision_;
        }

        std::size_t size() const noexcept
        {
            return entries_.size();
        }

      private:
        std::unordered_map<std::string, Entries> entries_{};
        std::uint64_t revision_{0};
    };
}
