#include <explorer/navigation_engine.hpp>
#include <explorer/async_result.hpp>
#include <explorer/remote_file_reader.hpp>
#include <log/log.hpp>
#include <utility/remote_path.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>

namespace Explorer
{
    std::shared_ptr<NavigationEngine>
    NavigationEngine::create(Executors executors, std::shared_ptr<SecureShell::ISftpClient> client, Options options)
    {
        return std::shared_ptr<NavigationEngine>(
            new NavigationEngine(std::move(executors), std::move(client), std::move(options)));
    }

    NavigationEngine::NavigationEngine(
        Executors executors,
        std::shared_ptr<SecureShell::ISftpClient> client,
        Options options)
        : executors_{std::move(executors)}
        , client_{std::move(client)}
        , options_{std::move(options)}
        , state_{}
        , pendingLoads_{0}
        , pendingRemovals_{}
    {
        state_.showHidden = options_.showHidden;
    }

    void NavigationEngine::initialize(std::string const& home)
    {
        state_.homeDirectory = Utility::normalizeRemotePath(home);
        enterPath(state_.homeDirectory, false);
    }

    void NavigationEngine::navigateTo(std::string const& path)
    {
        enterPath(Utility::normalizeRemotePath(path), true);
    }

    bool NavigationEngine::goBack()
    {
        auto previous = state_.history.goBack(state_.currentPath);
        if (!previous)
            return false;
        enterPath(std::move(*previous), false);
        return true;
    }

    bool NavigationEngine::goForward()
    {
        auto next = state_.history.goForward(state_.currentPath);
        if (!next)
            return false;
        enterPath(std::move(*next), false);
        return true;
    }

    bool NavigationEngine::goUp()
    {
        if (!state_.canGoUp())
            return false;
        navigateTo(Utility::remoteParentPath(state_.currentPath));
        return true;
    }

    void NavigationEngine::goHome()
    {
        navigateTo(state_.homeDirectory);
    }

    void NavigationEngine::refresh()
    {
        state_.error.reset();
        state_.cache.invalidate(state_.currentPath);
        load(state_.currentPath);
    }

    void NavigationEngine::toggleExpand(std::string const& path)
    {
        const auto normalized = Utility::normalizeRemotePath(path);
        ++state_.expandedDirsRevision;
        if (state_.expandedDirectories.erase(normalized) > 0)
            return;

        state_.expandedDirectories.insert(normalized);
        if (!state_.cache.isValid(normalized))
            load(normalized);
    }

    void NavigationEngine::toggleShowHidden()
    {
        state_.showHidden = !state_.showHidden;
        ++state_.fileListRevision;
        ++state_.expandedDirsRevision;
    }

    void NavigationEngine::preload(std::string const& path)
    {
        const auto normalized = Utility::normalizeRemotePath(path);
        if (!state_.cache.isValid(normalized))
            load(normalized);
    }

    void NavigationEngine::loadUserGroupMaps()
    {
        const auto loadMap = [this](std::string file, IdNameMap UserGroupMap::*target) {
            dispatch(
                executors_,
                [client = client_, file, timeout = options_.operationTimeout]() {
                    return readRemoteTextFile(*client, file, timeout);
                },
                [weak = weak_from_this(), file, target](std::expected<std::string, SharedData::ExplorerError> result) {
                    auto self = weak.lock();
                    if (!self)
                        return;
                    if (!result)
                    {
                        Log::warn("NavigationEngine: Cannot read '{}': {}", file, result.error().toString());
                        return;
                    }
                    self->state_.userGroupMap.*target = parseIdNameMap(*result);
                    ++self->state_.userGroupMapRevision;
                    Log::debug(
                        "NavigationEngine: Loaded {} names from '{}'.", (self->state_.userGroupMap.*target).size(), file);
                });
        };
        loadMap("/etc/passwd", &UserGroupMap::users);
        loadMap("/etc/group", &UserGroupMap::groups);
    }

    std::vector<SharedData::FileEntry> NavigationEngine::visibleFileList() const
    {
        if (state_.showHidden)
            return state_.fileList;

        std::vector<SharedData::FileEntry> visible{};
        std::copy_if(
            state_.fileList.begin(), state_.fileList.end(), std::back_inserter(visible), [](auto const& entry) {
                return !entry.isHidden();
            });
        return visible;
    }

    std::vector<TreeRow> NavigationEngine::directoryTree() const
    {
        return projectDirectoryTree(state_.cache, state_.expandedDirectories, state_.showHidden);
    }

    void NavigationEngine::clearError()
    {
        state_.error.reset();
    }

    void NavigationEngine::enterPath(std::string path, bool recordHistory)
    {
        const bool pathChanged = path != state_.currentPath;
        if (recordHistory && pathChanged)
            state_.history.push(state_.currentPath);

        state_.currentPath = std::move(path);
        state_.error.reset();
        expandToPath(state_.currentPath);

        if (auto const* cached = state_.cache.find(state_.currentPath); cached != nullptr)
        {
            if (pathChanged)
                replaceFileList(*cached);
        }
        else
        {
            if (pathChanged)
                replaceFileList({});
            load(state_.currentPath);
        }
    }

    void NavigationEngine::expandToPath(std::string const& path)
    {
        bool changed = false;
        for (auto& prefix : Utility::remotePathChain(path))
            changed = state_.expandedDirectories.insert(std::move(prefix)).second || changed;
        if (changed)
            ++state_.expandedDirsRevision;
    }

    void NavigationEngine::load(std::string const& path)
    {
        if (state_.connectionLost)
        {
            Log::warn("NavigationEngine: Not loading '{}', the connection is lost.", path);
            return;
        }

        ++pendingLoads_;
        state_.loading = true;
        Log::trace("NavigationEngine: Loading '{}'.", path);

        dispatch(
            executors_,
            [client = client_, path, timeout = options_.operationTimeout]() {
                return awaitResult(
                    client->listDirectory(path), timeout, fmt::format("Failed to list directory '{}'", path));
            },
            [weak = weak_from_this(), path](auto&& result) {
                if (auto self = weak.lock())
                    self->onDirectoryLoaded(path, std::move(result));
            });
    }

    void NavigationEngine::onDirectoryLoaded(
        std::string const& path,
        std::expected<std::vector<SharedData::FileEntry>, SharedData::ExplorerError> result)
    {
        --pendingLoads_;
        state_.loading = pendingLoads_ > 0;

        if (!result)
        {
            reportError(result.error());
            return;
        }

        state_.cache.update(path, *result);
        if (state_.currentPath == path)
            replaceFileList(std::move(*result));
    }

    void NavigationEngine::replaceFileList(std::vector<SharedData::FileEntry> entries)
    {
        state_.fileList = std::move(entries);
        pendingRemovals_.clear();
        ++state_.fileListRevision;
    }

    void NavigationEngine::reportError(SharedData::ExplorerError const& error)
    {
        Log::error("NavigationEngine: {}", error.toString());
        if (error.isConnectionLost())
            state_.connectionLost = true;
        state_.error = error.message();
    }

    std::optional<SharedData::FileEntry> NavigationEngine::takeFromFileList(std::string const& path)
    {
        auto it = std::find_if(state_.fileList.begin(), state_.fileList.end(), [&path](auto const& entry) {
            return entry.path == path;
        });
        if (it == state_.fileList.end())
            return std::nullopt;

        // Translate the index in the shown list to one in the list before any pending removal.
        auto position = static_cast<std::size_t>(std::distance(state_.fileList.begin(), it));
        std::sort(pendingRemovals_.begin(), pendingRemovals_.end(), [](auto const& lhs, auto const& rhs) {
            return lhs.position < rhs.position;
        });
        for (auto const& pending : pendingRemovals_)
        {
            if (pending.position <= position)
                ++position;
        }
        pendingRemovals_.push_back(PendingRemoval{.path = path, .position = position});

        auto removed = std::move(*it);
        state_.fileList.erase(it);
        ++state_.fileListRevision;
        return removed;
    }

    bool NavigationEngine::restoreToFileList(std::string const& directory, SharedData::FileEntry entry)
    {
        auto pending = std::find_if(pendingRemovals_.begin(), pendingRemovals_.end(), [&entry](auto const& removal) {
            return removal.path == entry.path;
        });
        if (pending == pendingRemovals_.end())
            return false;
        const auto original = pending->position;
        pendingRemovals_.erase(pending);

        if (state_.currentPath != directory)
            return false;

        const auto present =
            std::any_of(state_.fileList.begin(), state_.fileList.end(), [&entry](auto const& existing) {
                return existing.path == entry.path;
            });
        if (present)
            return false;

        const auto stillMissingBefore =
            std::count_if(pendingRemovals_.begin(), pendingRemovals_.end(), [original](auto const& removal) {
                return removal.position < original;
            });
        const auto position = std::min(original - static_cast<std::size_t>(stillMissingBefore), state_.fileList.size());
        state_.fileList.insert(state_.fileList.begin() + static_cast<std::ptrdiff_t>(position), std::move(entry));
        ++state_.fileListRevision;
        return true;
    }

    void NavigationEngine::forgetRemoval(std::string const& path)
    {
        auto pending = std::find_if(pendingRemovals_.begin(), pendingRemovals_.end(), [&path](auto const& removal) {
            return removal.path == path;
        });
        if (pending == pendingRemovals_.end())
            return;

        const auto position = pending->position;
        pendingRemovals_.erase(pending);
        for (auto& removal : pendingRemovals_)
        {
            if (removal.position > position)
                --removal.position;
        }
    }

    SharedData::FileEntry const* NavigationEngine::findEntry(std::string const& path) const
    {
        const auto matches = [&path](auto const& entry) {
            return entry.path == path;
        };

        if (auto it = std::find_if(state_.fileList.begin(), state_.fileList.end(), matches); it != state_.fileList.end())
            return &*it;

        if (auto const* siblings = state_.cache.find(Utility::remoteParentPath(path)); siblings != nullptr)
        {
            if (auto it = std::find_if(siblings->begin(), siblings->end(), matches); it != siblings->end())
                return &*it;
        }
        return nullptr;
    }

    void NavigationEngine::invalidate(std::string const& path)
    {
        state_.cache.invalidate(path);
    }

    void NavigationEngine::invalidateSubtree(std::string const& path)
    {
        state_.cache.invalidateSubtree(path);
    }

    void NavigationEngine::reloadIfCurrent(std::string const& path)
    {
        if (state_.currentPath == Utility::normalizeRemotePath(path))
            load(state_.currentPath);
    }

    void NavigationEngine::setError(std::string error)
    {
        state_.error = std::move(error);
    }
}
