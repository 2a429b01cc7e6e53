#pragma once

#include <ssh/file_stream_interface.hpp>
#include <ssh/file_information.hpp>
#include <ssh/sftp_error.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <future>
#include <memory>
#include <string>
#include <vector>

#include <fcntl.h>

namespace SecureShell
{
    enum class OpenType : int
    {
        Read = O_RDONLY,
        Write = O_WRONLY,
        ReadWrite = O_RDWR,
        Create = O_CREAT,
        Truncate = O_TRUNC,
        Exclusive = O_EXCL,
    };

    constexpr OpenType operator|(OpenType lhs, OpenType rhs)
    {
        return static_cast<OpenType>(static_cast<int>(lhs) | static_cast<int>(rhs));
    }

    /**
     * @brief One sftp channel. Every operation runs asynchronously, the results are delivered through futures.
     */
    class ISftpClient
    {
      public:
        using Error = SftpError;

        ISftpClient() = default;
        virtual ~ISftpClient() = default;
        ISftpClient(ISftpClient const&) = delete;
        ISftpClient& operator=(ISftpClient const&) = delete;
        ISftpClient(ISftpClient&&) = delete;
        ISftpClient& operator=(ISftpClient&&) = delete;

        /**
         * @brief Lists the contents of a directory without the "." and ".." entries.
         * The paths of the returned entries are absolute.
         */
        virtual std::future<std::expected<std::vector<FileInformation>, Error>>
        listDirectory(std::string const& path) = 0;

        /**
         * @brief Resolves a path on the server, e.g. "." into the home directory.
         */
        virtual std::future<std::expected<std::string, Error>> canonicalize(std::string const& path) = 0;

        virtual std::future<std::expected<FileInformation, Error>> stat(std::string const& path) = 0;

        virtual std::future<std::expected<void, Error>> createDirectory(
            std::string const& path,
            std::filesystem::perms permissions = std::filesystem::perms::owner_all | std::filesystem::perms::group_read |
                std::filesystem::perms::group_exec | std::filesystem::perms::others_read |
                std::filesystem::perms::others_exec) = 0;

        /**
         * @brief Creates an empty file. Fails if it exists.
         */
        virtual std::future<std::expected<void, Error>> createFile(
            std::string const& path,
            std::filesystem::perms permissions = std::filesystem::perms::owner_read |
                std::filesystem::perms::owner_write | std::filesystem::perms::group_read |
                std::filesystem::perms::others_read) = 0;

        virtual std::future<std::expected<void, Error>> removeFile(std::string const& path) = 0;

        /**
         * @brief Removes an empty directory.
         */
        virtual std::future<std::expected<void, Error>> removeDirectory(std::string const& path) = 0;

        virtual std::future<std::expected<void, Error>> rename(std::string const& source, std::string const& destination) = 0;

        /**
         * @brief Truncates or extends the file to exactly size bytes.
         */
        virtual std::future<std::expected<void, Error>> resize(std::string const& path, std::uint64_t size) = 0;

        virtual std::future<std::expected<std::shared_ptr<IFileStream>, Error>> openFile(
            std::string const& path,
            OpenType openType = OpenType::Read,
            std::filesystem::perms permissions = std::filesystem::perms::owner_read |
                std::filesystem::perms::owner_write | std::filesystem::perms::group_read |
                std::filesystem::perms::others_read) = 0;
    };
}
