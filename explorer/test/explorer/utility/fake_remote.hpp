#pragma once

#include <ssh/channel_source_interface.hpp>
#include <ssh/sftp_client_interface.hpp>
#include <utility/remote_path.hpp>

#include <algorithm>
#include <atomic>
#include <cstring>
#include <expected>
#include <future>
#include <limits>
#include <span>
#include <string_view>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace Explorer::Test
{
    template <typename T>
    std::future<T> makeReadyFuture(T value)
    {
        std::promise<T> promise{};
        promise.set_value(std::move(value));
        return promise.get_future();
    }

    /**
     * @brief An in memory sftp server. Thread safe, shared by all clients and streams created from it.
     */
    class FakeFileSystem
    {
      public:
        using Error = SecureShell::SftpError;

        struct Node
        {
            SharedData::FileType type{SharedData::FileType::File};
            std::vector<std::byte> content{};
        };

        FakeFileSystem()
        {
            nodes_["/"] = Node{.type = SharedData::FileType::Directory};
        }

        void addDirectory(std::string const& path)
        {
            std::scoped_lock lock{mutex_};
            for (auto const& prefix : Utility::remotePathChain(path))
                nodes_.try_emplace(prefix, Node{.type = SharedData::FileType::Directory});
        }

        void addFile(std::string const& path, std::vector<std::byte> content)
        {
            addDirectory(Utility::remoteParentPath(Utility::normalizeRemotePath(path)));
            std::scoped_lock lock{mutex_};
            nodes_[Utility::normalizeRemotePath(path)] = Node{.type = SharedData::FileType::File, .content = std::move(content)};
        }

        void addTextFile(std::string const& path, std::string_view text)
        {
            std::vector<std::byte> content(text.size());
            std::memcpy(content.data(), text.data(), text.size());
            addFile(path, std::move(content));
        }

        std::optional<std::vector<std::byte>> content(std::string const& path) const
        {
            std::scoped_lock lock{mutex_};
            auto it = nodes_.find(Utility::normalizeRemotePath(path));
            if (it == nodes_.end() || it->second.type != SharedData::FileType::File)
                return std::nullopt;
            return it->second.content;
        }

        bool exists(std::string const& path) const
        {
            std::scoped_lock lock{mutex_};
            return nodes_.contains(Utility::normalizeRemotePath(path));
        }

        void setHome(std::string home)
        {
            std::scoped_lock lock{mutex_};
            home_ = std::move(home);
        }

        /**
         * @brief Reads and writes that touch offset fail from now on.
         */
        void failTransferAt(std::uint64_t offset)
        {
            failAt_ = offset;
        }

        /**
         * @brief Called before every read and write with the offset, outside of any lock. May block.
         */
        void setTransferHook(std::function<void(std::uint64_t offset)> hook)
        {
            std::scoped_lock lock{mutex_};
            transferHook_ = std::move(hook);
        }

        std::size_t readCalls() const noexcept
        {
            return readCalls_;
        }
        std::size_t listCalls() const noexcept
        {
            return listCalls_;
        }

        std::size_t streamLimit{64 * 1024};

        std::expected<std::vector<SharedData::FileEntry>, Error> list(std::string const& path)
        {
            ++listCalls_;
            const auto directory = Utility::normalizeRemotePath(path);
            std::scoped_lock lock{mutex_};
            auto it = nodes_.find(directory);
            if (it == nodes_.end() || it->second.type != SharedData::FileType::Directory)
                return std::unexpected(Error{.message = "No such directory"});

            std::vector<SharedData::FileEntry> entries{};
            for (auto const& [candidate, node] : nodes_)
            {
                if (candidate != "/" && Utility::remoteParentPath(candidate) == directory)
                    entries.push_back(entryFor(candidate, node));
            }
            return entries;
        }

        std::expected<SharedData::FileEntry, Error> stat(std::string const& path) const
        {
            std::scoped_lock lock{mutex_};
            auto it = nodes_.find(Utility::normalizeRemotePath(path));
            if (it == nodes_.end())
                return std::unexpected(Error{.message = "No such file"});
            return entryFor(it->first, it->second);
        }

        std::string canonicalize(std::string const& path) const
        {
            std::scoped_lock lock{mutex_};
            if (path == ".")
                return home_;
            return Utility::normalizeRemotePath(path);
        }

        std::expected<void, Error> create(std::string const& path, SharedData::FileType type, bool truncate)
        {
            const auto target = Utility::normalizeRemotePath(path);
            std::scoped_lock lock{mutex_};
            if (!nodes_.contains(Utility::remoteParentPath(target)))
                return std::unexpected(Error{.message = "No such directory"});
            auto [it, inserted] = nodes_.try_emplace(target, Node{.type = type});
            if (!inserted && !truncate)
                return std::unexpected(Error{.message = "File exists"});
            if (truncate)
                it->second.content.clear();
            return {};
        }

        std::expected<void, Error> remove(std::string const& path, bool directory)
        {
            const auto target = Utility::normalizeRemotePath(path);
            std::scoped_lock lock{mutex_};
            auto it = nodes_.find(target);
            if (it == nodes_.end())
                return std::unexpected(Error{.message = "No such file"});
            if ((it->second.type == SharedData::FileType::Directory) != directory)
                return std::unexpected(Error{.message = "Wrong file type"});
            nodes_.erase(it);
            return {};
        }

        std::expected<void, Error> rename(std::string const& source, std::string const& destination)
        {
            std::scoped_lock lock{mutex_};
            auto node = nodes_.extract(Utility::normalizeRemotePath(source));
            if (node.empty())
                return std::unexpected(Error{.message = "No such file"});
            node.key() = Utility::normalizeRemotePath(destination);
            nodes_.insert(std::move(node));
            return {};
        }

        std::expected<void, Error> resize(std::string const& path, std::uint64_t size)
        {
            std::scoped_lock lock{mutex_};
            auto it = nodes_.find(Utility::normalizeRemotePath(path));
            if (it == nodes_.end())
                return std::unexpected(Error{.message = "No such file"});
            it->second.content.resize(size);
            return {};
        }

        std::expected<std::size_t, Error>
        read(std::string const& path, std::uint64_t offset, std::byte* buffer, std::size_t size)
        {
            ++readCalls_;
            runHook(offset);
            if (offset <= failAt_ && failAt_ < offset + size)
                return std::unexpected(Error{.message = "Injected read failure"});

            std::scoped_lock lock{mutex_};
            auto it = nodes_.find(path);
            if (it == nodes_.end())
                return std::unexpected(Error{.message = "No such file"});
            auto const& content = it->second.content;
            if (offset >= content.size())
                return 0;
            const auto amount = std::min<std::size_t>(size, content.size() - offset);
            std::memcpy(buffer, content.data() + offset, amount);
            return amount;
        }

        std::expected<void, Error> write(std::string const& path, std::uint64_t offset, std::span<std::byte const> data)
        {
            runHook(offset);
            if (offset <= failAt_ && failAt_ < offset + data.size())
                return std::unexpected(Error{.message = "Injected write failure"});

            std::scoped_lock lock{mutex_};
            auto it = nodes_.find(path);
            if (it == nodes_.end())
                return std::unexpected(Error{.message = "No such file"});
            auto& content = it->second.content;
            if (content.size() < offset + data.size())
                content.resize(offset + data.size());
            std::memcpy(content.data() + offset, data.data(), data.size());
            return {};
        }

      private:
        static SharedData::FileEntry entryFor(std::string const& path, Node const& node)
        {
            return SharedData::FileEntry{
                .name = Utility::remoteFileName(path),
                .path = path,
                .type = node.type,
                .size = node.content.size(),
                .permissions = std::filesystem::perms::owner_read | std::filesystem::perms::owner_write,
                .uid = 1000,
                .gid = 1000,
            };
        }

        void runHook(std::uint64_t offset)
        {
            std::function<void(std::uint64_t)> hook{};
            {
                std::scoped_lock lock{mutex_};
                hook = transferHook_;
            }
            if (hook)
                hook(offset);
        }

      private:
        mutable std::mutex mutex_{};
        std::map<std::string, Node> nodes_{};
        std::string home_{"/"};
        std::function<void(std::uint64_t)> transferHook_{};
        std::atomic<std::uint64_t> failAt_{std::numeric_limits<std::uint64_t>::max()};
        std::atomic<std::size_t> readCalls_{0};
        std::atomic<std::size_t> listCalls_{0};
    };

    class FakeFileStream : public SecureShell::IFileStream
    {
      public:
        FakeFileStream(std::shared_ptr<FakeFileSystem> fileSystem, std::string path)
            : fileSystem_{std::move(fileSystem)}
            , path_{std::move(path)}
        {}

        std::future<std::expected<std::size_t, SecureShell::SftpError>>
        read(std::uint64_t offset, std::byte* buffer, std::size_t bufferSize) override
        {
            if (closed_)
                return makeReadyFuture<std::expected<std::size_t, SecureShell::SftpError>>(
                    std::unexpected(SecureShell::SftpError{.message = "Stream closed"}));
            return makeReadyFuture(fileSystem_->read(path_, offset, buffer, bufferSize));
        }

        std::future<std::expected<void, SecureShell::SftpError>>
        write(std::uint64_t offset, std::span<std::byte const> data) override
        {
            if (closed_)
                return makeReadyFuture<std::expected<void, SecureShell::SftpError>>(
                    std::unexpected(SecureShell::SftpError{.message = "Stream closed"}));
            return makeReadyFuture(fileSystem_->write(path_, offset, data));
        }

        std::future<std::expected<SharedData::FileEntry, SecureShell::SftpError>> stat() override
        {
            return makeReadyFuture(fileSystem_->stat(path_));
        }

        std::size_t writeLengthLimit() const override
        {
            return fileSystem_->streamLimit;
        }

        std::size_t readLengthLimit() const override
        {
            return fileSystem_->streamLimit;
        }

        std::future<std::expected<void, SecureShell::SftpError>> close() override
        {
            closed_ = true;
            return makeReadyFuture(std::expected<void, SecureShell::SftpError>{});
        }

      private:
        std::shared_ptr<FakeFileSystem> fileSystem_;
        std::string path_;
        std::atomic_bool closed_{false};
    };

    class FakeSftpClient : public SecureShell::ISftpClient
    {
      public:
        explicit FakeSftpClient(std::shared_ptr<FakeFileSystem> fileSystem)
            : fileSystem_{std::move(fileSystem)}
        {}

        std::future<std::expected<std::vector<SharedData::FileEntry>, Error>>
        listDirectory(std::string const& path) override
        {
            return makeReadyFuture(fileSystem_->list(path));
        }

        std::future<std::expected<std::string, Error>> canonicalize(std::string const& path) override
        {
            return makeReadyFuture(std::expected<std::string, Error>{fileSystem_->canonicalize(path)});
        }

        std::future<std::expected<SharedData::FileEntry, Error>> stat(std::string const& path) override
        {
            return makeReadyFuture(fileSystem_->stat(path));
        }

        std::future<std::expected<void, Error>>
        createDirectory(std::string const& path, std::filesystem::perms) override
        {
            return makeReadyFuture(fileSystem_->create(path, SharedData::FileType::Directory, false));
        }

        std::future<std::expected<void, Error>> createFile(std::string const& path, std::filesystem::perms) override
        {
            return makeReadyFuture(fileSystem_->create(path, SharedData::FileType::File, false));
        }

        std::future<std::expected<void, Error>> removeFile(std::string const& path) override
        {
            return makeReadyFuture(fileSystem_->remove(path, false));
        }

        std::future<std::expected<void, Error>> removeDirectory(std::string const& path) override
        {
            return makeReadyFuture(fileSystem_->remove(path, true));
        }

        std::future<std::expected<void, Error>>
        rename(std::string const& source, std::string const& destination) override
        {
            return makeReadyFuture(fileSystem_->rename(source, destination));
        }

        std::future<std::expected<void, Error>> resize(std::string const& path, std::uint64_t size) override
        {
            return makeReadyFuture(fileSystem_->resize(path, size));
        }

        std::future<std::expected<std::shared_ptr<SecureShell::IFileStream>, Error>>
        openFile(std::string const& path, SecureShell::OpenType openType, std::filesystem::perms) override
        {
            using Result = std::expected<std::shared_ptr<SecureShell::IFileStream>, Error>;
            const auto target = Utility::normalizeRemotePath(path);
            const auto flags = static_cast<int>(openType);
            if (flags & static_cast<int>(SecureShell::OpenType::Create))
            {
                const bool truncate = flags & static_cast<int>(SecureShell::OpenType::Truncate);
                if (auto created = fileSystem_->create(target, SharedData::FileType::File, truncate); !created)
                    return makeReadyFuture<Result>(std::unexpected(created.error()));
            }
            else if (!fileSystem_->exists(target))
                return makeReadyFuture<Result>(std::unexpected(Error{.message = "No such file"}));

            return makeReadyFuture<Result>(std::make_shared<FakeFileStream>(fileSystem_, target));
        }

      private:
        std::shared_ptr<FakeFileSystem> fileSystem_;
    };

    /**
     * @brief Grants at most grantLimit channels, refuses the rest.
     */
    class FakeChannelSource : public SecureShell::ISftpChannelSource
    {
      public:
        FakeChannelSource(std::shared_ptr<FakeFileSystem> fileSystem, int grantLimit)
            : fileSystem_{std::move(fileSystem)}
            , grantLimit_{grantLimit}
        {}

        std::future<std::expected<std::shared_ptr<SecureShell::ISftpClient>, SecureShell::SftpError>>
        openSftpChannel() override
        {
            using Result = std::expected<std::shared_ptr<SecureShell::ISftpClient>, SecureShell::SftpError>;
            ++requested_;
            if (granted_.fetch_add(1) >= grantLimit_)
                return makeReadyFuture<Result>(std::unexpected(SecureShell::SftpError{.message = "Channel refused"}));
            return makeReadyFuture<Result>(std::make_shared<FakeSftpClient>(fileSystem_));
        }

        int requested() const noexcept
        {
            return requested_;
        }

      private:
        std::shared_ptr<FakeFileSystem> fileSystem_;
        int grantLimit_;
        std::atomic_int granted_{0};
        std::atomic_int requested_{0};
    };

    inline std::vector<std::byte> makePattern(std::size_t size)
    {
        std::vector<std::byte> data(size);
        for (std::size_t i = 0; i != size; ++i)
            data[i] = static_cast<std::byte>((i * 31 + i / 4096) & 0xFF);
        return data;
    }
}
