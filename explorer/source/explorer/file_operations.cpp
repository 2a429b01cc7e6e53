#include <explorer/file_operations.hpp>
#include <explorer/async_result.hpp>
#include <log/log.hpp>
#include <utility/remote_path.hpp>

#include <fmt/format.h>

namespace Explorer
{
    namespace
    {
        std::optional<std::string> validateName(std::string const& name)
        {
            if (name.empty())
                return "Name must not be empty";
            if (name.find('/') != std::string::npos)
                return fmt::format("Name '{}' must not contain '/'", name);
            if (name == "." || name == "..")
                return fmt::format("'{}' is not a valid name", name);
            return std::nullopt;
        }
    }

    FileOperations::FileOperations(std::shared_ptr<NavigationEngine> engine, NotificationSink notify)
        : engine_{std::move(engine)}
        , notify_{std::move(notify)}
    {}

    void FileOperations::remove(std::string const& path)
    {
        const auto target = Utility::normalizeRemotePath(path);
        const auto directory = Utility::remoteParentPath(target);

        auto const* known = engine_->findEntry(target);
        if (known == nullptr)
        {
            reportFailure(*engine_, fmt::format("Cannot delete '{}': unknown entry", target));
            return;
        }
        const bool isDirectory = known->isDirectory();

        // known may dangle after this.
        auto removed = engine_->takeFromFileList(target);

        Log::info("FileOperations: Deleting '{}'.", target);
        dispatch(
            engine_->executors_,
            [client = engine_->client_, target, isDirectory, timeout = engine_->options_.operationTimeout]() {
                auto future = isDirectory ? client->removeDirectory(target) : client->removeFile(target);
                return awaitResult(std::move(future), timeout, fmt::format("Failed to delete '{}'", target));
            },
            [weak = std::weak_ptr<NavigationEngine>{engine_},
             notify = notify_,
             target,
             directory,
             isDirectory,
             removed = std::move(removed)](std::expected<void, SharedData::ExplorerError> result) mutable {
                auto engine = weak.lock();
                if (!engine)
                    return;

                if (result)
                {
                    engine->forgetRemoval(target);
                    engine->invalidate(directory);
                    if (isDirectory)
                        engine->invalidateSubtree(target);
                    return;
                }

                Log::error("FileOperations: {}", result.error().toString());
                if (removed)
                    engine->restoreToFileList(directory, std::move(*removed));
                if (result.error().isConnectionLost())
                    engine->state_.connectionLost = true;
                engine->setError(result.error().message());
                if (notify)
                    notify(NotificationType::Error, result.error().message());
            });
    }

    void FileOperations::rename(std::string const& path, std::string const& newName)
    {
        if (auto invalid = validateName(newName))
        {
            reportFailure(*engine_, fmt::format("Cannot rename: {}", *invalid));
            return;
        }

        const auto source = Utility::normalizeRemotePath(path);
        const auto directory = Utility::remoteParentPath(source);
        const auto destination = Utility::joinRemotePath(directory, newName);
        if (source == "/")
        {
            reportFailure(*engine_, "Cannot rename the root directory");
            return;
        }

        Log::info("FileOperations: Renaming '{}' to '{}'.", source, destination);
        dispatch(
            engine_->executors_,
            [client = engine_->client_, source, destination, timeout = engine_->options_.operationTimeout]() {
                return awaitResult(
                    client->rename(source, destination),
                    timeout,
                    fmt::format("Failed to rename '{}' to '{}'", source, destination));
            },
            [weak = std::weak_ptr<NavigationEngine>{engine_}, notify = notify_, source, directory](
                std::expected<void, SharedData::ExplorerError> result) {
                auto engine = weak.lock();
                if (!engine)
                    return;

                if (!result)
                {
                    Log::error("FileOperations: {}", result.error().toString());
                    engine->setError(result.error().message());
                    if (notify)
                        notify(NotificationType::Error, result.error().message());
                    return;
                }

                engine->invalidateSubtree(source);
                engine->invalidate(directory);
                const auto current = engine->state().currentPath;
                engine->invalidate(current);
                engine->reloadIfCurrent(current);
            });
    }

    void FileOperations::createDirectory(std::string const& name)
    {
        createEntry(name, true);
    }

    void FileOperations::createFile(std::string const& name)
    {
        createEntry(name, false);
    }

    void FileOperations::createEntry(std::string const& name, bool directory)
    {
        if (auto invalid = validateName(name))
        {
            reportFailure(*engine_, fmt::format("Cannot create '{}': {}", name, *invalid));
            return;
        }

        const auto parent = engine_->state().currentPath;
        const auto path = Utility::joinRemotePath(parent, name);

        Log::info("FileOperations: Creating {} '{}'.", directory ? "directory" : "file", path);
        dispatch(
            engine_->executors_,
            [client = engine_->client_, path, directory, timeout = engine_->options_.operationTimeout]() {
                auto future = directory ? client->createDirectory(path) : client->createFile(path);
                return awaitResult(std::move(future), timeout, fmt::format("Failed to create '{}'", path));
            },
            [weak = std::weak_ptr<NavigationEngine>{engine_}, notify = notify_, parent](
                std::expected<void, SharedData::ExplorerError> result) {
                auto engine = weak.lock();
                if (!engine)
                    return;

                if (!result)
                {
                    Log::error("FileOperations: {}", result.error().toString());
                    engine->setError(result.error().message());
                    if (notify)
                        notify(NotificationType::Error, result.error().message());
                    return;
                }

                engine->invalidate(parent);
                engine->reloadIfCurrent(parent);
            });
    }

    void FileOperations::stat(std::string const& path, StatCallback onResult)
    {
        const auto target = Utility::normalizeRemotePath(path);
        dispatch(
            engine_->executors_,
            [client = engine_->client_, target, timeout = engine_->options_.operationTimeout]() {
                return awaitResult(client->stat(target), timeout, fmt::format("Failed to stat '{}'", target));
            },
            [onResult = std::move(onResult)](std::expected<SharedData::FileEntry, SharedData::ExplorerError> result) {
                if (!result)
                {
                    Log::error("FileOperations: {}", result.error().toString());
                    onResult(std::unexpected(result.error().message()));
                    return;
                }
                onResult(std::move(*result));
            });
    }

    void FileOperations::reportFailure(NavigationEngine& engine, std::string message) const
    {
        Log::warn("FileOperations: {}", message);
        if (notify_)
            notify_(NotificationType::Error, message);
        engine.setError(std::move(message));
    }
}
