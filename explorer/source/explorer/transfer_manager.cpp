#include <explorer/transfer_manager.hpp>
#include <explorer/async_result.hpp>
#include <log/log.hpp>
#include <utility/remote_path.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <utility>

namespace Explorer
{
    using SharedData::ExplorerError;
    using SharedData::ExplorerErrorType;
    using SharedData::TransferDirection;
    using SharedData::TransferStatus;

    namespace
    {
        using FileList = std::vector<std::pair<std::filesystem::path, std::string>>;

        std::string relativeRemotePath(std::string const& root, std::string const& path)
        {
            auto relative = path.substr(std::min(root.size(), path.size()));
            while (!relative.empty() && relative.front() == '/')
                relative.erase(relative.begin());
            return relative;
        }

        std::expected<FileList, ExplorerError> collectRemoteTree(
            SecureShell::ISftpClient& client,
            std::string const& remoteRoot,
            std::filesystem::path const& localRoot,
            std::chrono::milliseconds timeout)
        {
            FileList files{};
            std::vector<std::string> pending{remoteRoot};

            std::error_code ec{};
            std::filesystem::create_directories(localRoot, ec);
            if (ec)
            {
                return std::unexpected(ExplorerError{
                    .type = ExplorerErrorType::LocalIoError,
                    .extraInfo = fmt::format("Cannot create '{}': {}", localRoot.string(), ec.message()),
                });
            }

            while (!pending.empty())
            {
                const auto directory = std::move(pending.back());
                pending.pop_back();

                auto entries = awaitResult(
                    client.listDirectory(directory), timeout, fmt::format("Failed to list directory '{}'", directory));
                if (!entries)
                    return std::unexpected(std::move(entries).error());

                for (auto const& entry : *entries)
                {
                    const auto local = localRoot / relativeRemotePath(remoteRoot, entry.path);
                    if (entry.isDirectory())
                    {
                        std::filesystem::create_directories(local, ec);
                        if (ec)
                        {
                            return std::unexpected(ExplorerError{
                                .type = ExplorerErrorType::LocalIoError,
                                .extraInfo = fmt::format("Cannot create '{}': {}", local.string(), ec.message()),
                            });
                        }
                        pending.push_back(entry.path);
                    }
                    else if (entry.isFile())
                        files.emplace_back(local, entry.path);
                    else
                        Log::debug("TransferManager: Skipping '{}', it is neither a file nor a directory.", entry.path);
                }
            }
            return files;
        }

        std::expected<void, ExplorerError> ensureRemoteDirectory(
            SecureShell::ISftpClient& client,
            std::string const& path,
            std::chrono::milliseconds timeout)
        {
            auto existing = awaitResult(client.stat(path), timeout, fmt::format("Failed to stat '{}'", path));
            if (existing)
            {
                if (existing->isDirectory())
                    return {};
                return std::unexpected(ExplorerError{
                    .type = ExplorerErrorType::FileExists,
                    .extraInfo = fmt::format("'{}' exists and is not a directory", path),
                });
            }
            return awaitResult(
                client.createDirectory(path), timeout, fmt::format("Failed to create directory '{}'", path));
        }

        std::expected<FileList, ExplorerError> prepareLocalTree(
            SecureShell::ISftpClient& client,
            std::filesystem::path const& localRoot,
            std::string const& remoteRoot,
            std::chrono::milliseconds timeout)
        {
            std::vector<std::filesystem::path> directories{};
            FileList files{};

            std::error_code ec{};
            for (auto it = std::filesystem::recursive_directory_iterator{localRoot, ec};
                 !ec && it != std::filesystem::recursive_directory_iterator{};
                 it.increment(ec))
            {
                const auto relative = it->path().lexically_relative(localRoot);
                if (it->is_directory(ec))
                    directories.push_back(relative);
                else if (it->is_regular_file(ec))
                    files.emplace_back(it->path(), Utility::joinRemotePath(remoteRoot, relative.generic_string()));
            }
            if (ec)
            {
                return std::unexpected(ExplorerError{
                    .type = ExplorerErrorType::LocalIoError,
                    .extraInfo = fmt::format("Cannot read '{}': {}", localRoot.string(), ec.message()),
                });
            }

            std::stable_sort(directories.begin(), directories.end(), [](auto const& lhs, auto const& rhs) {
                return std::distance(lhs.begin(), lhs.end()) < std::distance(rhs.begin(), rhs.end());
            });

            if (auto created = ensureRemoteDirectory(client, remoteRoot, timeout); !created)
                return std::unexpected(std::move(created).error());
            for (auto const& directory : directories)
            {
                const auto remote = Utility::joinRemotePath(remoteRoot, directory.generic_string());
                if (auto created = ensureRemoteDirectory(client, remote, timeout); !created)
                    return std::unexpected(std::move(created).error());
            }
            return files;
        }
    }

    std::shared_ptr<TransferManager> TransferManager::create(
        Executors executors,
        std::shared_ptr<SecureShell::ISftpClient> primary,
        std::shared_ptr<SecureShell::ISftpChannelSource> channelSource,
        Options options,
        NotificationSink notify)
    {
        return std::shared_ptr<TransferManager>(new TransferManager(
            std::move(executors), std::move(primary), std::move(channelSource), std::move(options), std::move(notify)));
    }

    TransferManager::TransferManager(
        Executors executors,
        std::shared_ptr<SecureShell::ISftpClient> primary,
        std::shared_ptr<SecureShell::ISftpChannelSource> channelSource,
        Options options,
        NotificationSink notify)
        : executors_{std::move(executors)}
        , primary_{std::move(primary)}
        , channelSource_{std::move(channelSource)}
        , options_{std::move(options)}
        , notify_{std::move(notify)}
        , items_{}
        , waiting_{}
        , running_{}
        , itemsRevision_{0}
    {
        options_.parallelTransfers = std::max(options_.parallelTransfers, 1);
    }

    TransferManager::~TransferManager()
    {
        for (auto& item : items_)
            item.control()->cancel();
        for (auto& [id, thread] : running_)
        {
            if (thread.joinable())
                thread.join();
        }
    }

    Ids::TransferId TransferManager::startDownload(std::string const& remotePath, std::filesystem::path const& localPath)
    {
        return enqueue(TransferDirection::Download, localPath, Utility::normalizeRemotePath(remotePath));
    }

    Ids::TransferId TransferManager::startUpload(std::filesystem::path const& localPath, std::string const& remotePath)
    {
        return enqueue(TransferDirection::Upload, localPath, Utility::normalizeRemotePath(remotePath));
    }

    Ids::TransferId TransferManager::enqueue(
        TransferDirection direction,
        std::filesystem::path const& localPath,
        std::string const& remotePath)
    {
        auto id = Ids::generateTransferId();
        items_.emplace_back(id, direction, localPath, remotePath);
        waiting_.push_back(id);
        ++itemsRevision_;
        Log::info("TransferManager: Queued transfer {} for '{}'.", id.value(), remotePath);
        scheduleNext();
        return id;
    }

    std::vector<Ids::TransferId>
    TransferManager::queueAll(TransferDirection direction, FileList const& files)
    {
        std::vector<Ids::TransferId> ids{};
        ids.reserve(files.size());
        for (auto const& [local, remote] : files)
            ids.push_back(enqueue(direction, local, remote));
        return ids;
    }

    void TransferManager::downloadDirectory(
        std::string const& remoteDirectory,
        std::filesystem::path const& localDirectory,
        QueuedCallback onQueued)
    {
        const auto root = Utility::normalizeRemotePath(remoteDirectory);
        dispatch(
            executors_,
            [client = primary_, root, localDirectory, timeout = options_.job.operationTimeout]() {
                return collectRemoteTree(*client, root, localDirectory, timeout);
            },
            [weak = weak_from_this(), onQueued = std::move(onQueued)](std::expected<FileList, ExplorerError> result) {
                auto self = weak.lock();
                if (!self)
                    return;
                if (!result)
                {
                    Log::error("TransferManager: {}", result.error().toString());
                    if (self->notify_)
                        self->notify_(NotificationType::Error, result.error().message());
                    if (onQueued)
                        onQueued(std::unexpected(result.error().message()));
                    return;
                }
                auto ids = self->queueAll(TransferDirection::Download, *result);
                if (onQueued)
                    onQueued(std::move(ids));
            });
    }

    void TransferManager::uploadDirectory(
        std::filesystem::path const& localDirectory,
        std::string const& remoteDirectory,
        QueuedCallback onQueued)
    {
        const auto root = Utility::normalizeRemotePath(remoteDirectory);
        dispatch(
            executors_,
            [client = primary_, root, localDirectory, timeout = options_.job.operationTimeout]() {
                return prepareLocalTree(*client, localDirectory, root, timeout);
            },
            [weak = weak_from_this(), onQueued = std::move(onQueued)](std::expected<FileList, ExplorerError> result) {
                auto self = weak.lock();
                if (!self)
                    return;
                if (!result)
                {
                    Log::error("TransferManager: {}", result.error().toString());
                    if (self->notify_)
                        self->notify_(NotificationType::Error, result.error().message());
                    if (onQueued)
                        onQueued(std::unexpected(result.error().message()));
                    return;
                }
                auto ids = self->queueAll(TransferDirection::Upload, *result);
                if (onQueued)
                    onQueued(std::move(ids));
            });
    }

    bool TransferManager::pause(Ids::TransferId const& id)
    {
        auto* item = findMutable(id);
        if (item == nullptr || !item->pause())
            return false;
        ++itemsRevision_;
        Log::info("TransferManager: Paused transfer {}.", id.value());
        return true;
    }

    bool TransferManager::resume(Ids::TransferId const& id)
    {
        auto* item = findMutable(id);
        if (item == nullptr || !item->resume())
            return false;
        ++itemsRevision_;
        Log::info("TransferManager: Resumed transfer {}.", id.value());
        return true;
    }

    bool TransferManager::cancel(Ids::TransferId const& id)
    {
        auto* item = findMutable(id);
        if (item == nullptr || !item->cancel())
            return false;
        std::erase(waiting_, id);
        ++itemsRevision_;
        Log::info("TransferManager: Cancelled transfer {}.", id.value());
        return true;
    }

    void TransferManager::cancelAll()
    {
        for (auto const& item : items_)
        {
            if (!SharedData::isTerminal(item.status()))
                cancel(item.id());
        }
    }

    TransferItem const* TransferManager::find(Ids::TransferId const& id) const
    {
        auto it = std::find_if(items_.begin(), items_.end(), [&id](auto const& item) {
            return item.id() == id;
        });
        return it == items_.end() ? nullptr : &*it;
    }

    TransferItem* TransferManager::findMutable(Ids::TransferId const& id)
    {
        return const_cast<TransferItem*>(std::as_const(*this).find(id));
    }

    std::size_t TransferManager::clearFinished()
    {
        const auto removed = std::erase_if(items_, [](auto const& item) {
            return SharedData::isTerminal(item.status());
        });
        if (removed > 0)
            ++itemsRevision_;
        return removed;
    }

    void TransferManager::scheduleNext()
    {
        while (running_.size() < static_cast<std::size_t>(options_.parallelTransfers) && !waiting_.empty())
        {
            auto id = std::move(waiting_.front());
            waiting_.pop_front();
            if (auto* item = findMutable(id); item != nullptr && item->status() == TransferStatus::Pending)
                launch(*item);
        }
    }

    void TransferManager::launch(TransferItem& item)
    {
        const auto id = item.id();
        const auto post = [weak = weak_from_this(), ui = executors_.ui](auto handler) {
            boost::asio::post(ui, [weak, handler = std::move(handler)]() {
                if (auto self = weak.lock())
                    handler(*self);
            });
        };

        TransferJobEvents events{
            .onStarted =
                [post, id](std::uint64_t totalBytes) {
                    post([id, totalBytes](TransferManager& self) {
                        self.onStarted(id, totalBytes);
                    });
                },
            .onProgress =
                [post, id](TransferProgress const& progress) {
                    post([id, progress](TransferManager& self) {
                        self.onProgress(id, progress);
                    });
                },
            .onFinished =
                [post, id](std::expected<void, ExplorerError> const& result) {
                    post([id, result](TransferManager& self) {
                        self.onFinished(id, result);
                    });
                },
        };

        auto job = std::make_shared<TransferJob>(
            TransferRequest{
                .id = id,
                .direction = item.direction(),
                .localPath = item.localPath(),
                .remotePath = item.remotePath(),
            },
            primary_,
            channelSource_,
            item.control(),
            options_.job,
            std::move(events));

        running_.emplace(id, std::thread{[job]() {
                             job->run();
                         }});
    }

    void TransferManager::onStarted(Ids::TransferId const& id, std::uint64_t totalBytes)
    {
        if (auto* item = findMutable(id); item != nullptr && item->start(totalBytes))
            ++itemsRevision_;
    }

    void TransferManager::onProgress(Ids::TransferId const& id, TransferProgress const& progress)
    {
        if (auto* item = findMutable(id); item != nullptr && !SharedData::isTerminal(item->status()))
        {
            item->updateProgress(progress);
            ++itemsRevision_;
        }
    }

    void TransferManager::onFinished(Ids::TransferId const& id, std::expected<void, ExplorerError> const& result)
    {
        if (auto it = running_.find(id); it != running_.end())
        {
            if (it->second.joinable())
                it->second.join();
            running_.erase(it);
        }

        if (auto* item = findMutable(id); item != nullptr)
        {
            if (result)
            {
                // Paused right after the last chunk.
                if (item->status() == TransferStatus::Paused)
                    item->resume();
                item->complete();
            }
            else if (result.error().type == ExplorerErrorType::Cancelled)
                item->cancel();
            else if (item->fail(result.error().message()) && notify_)
                notify_(NotificationType::Error, fmt::format("{}: {}", item->fileName(), result.error().message()));
            ++itemsRevision_;
        }

        scheduleNext();
    }
}
