#include <explorer/directory_cache.hpp>
#include <utility/remote_path.hpp>

#include <iterator>

namespace Explorer
{
    void DirectoryCache::update(std::string const& path, Entries entries)
    {
        entries_[Utility::normalizeRemotePath(path)] = std::move(entries);
        ++revision_;
    }

    bool DirectoryCache::invalidate(std::string const& path)
    {
        if (entries_.erase(Utility::normalizeRemotePath(path)) == 0)
            return false;
        ++revision_;
        return true;
    }

    std::size_t DirectoryCache::invalidateSubtree(std::string const& path)
    {
        const auto root = Utility::normalizeRemotePath(path);
        const auto removed = std::erase_if(entries_, [&root](auto const& item) {
            return Utility::isRemoteSubPath(root, item.first);
        });
        if (removed > 0)
            ++revision_;
        return removed;
    }

    void DirectoryCache::clear()
    {
        if (entries_.empty())
            return;
        entries_.clear();
        ++revision_;
    }

    bool DirectoryCache::isValid(std::string const& path) const
    {
        return entries_.contains(Utility::normalizeRemotePath(path));
    }

    DirectoryCache::Entries const* DirectoryCache::find(std::string const& path) const
    {
        if (auto it = entries_.find(Utility::normalizeRemotePath(path)); it != entries_.end())
            return &it->second;
        return nullptr;
    }
}
