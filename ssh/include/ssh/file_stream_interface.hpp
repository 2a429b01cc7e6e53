#pragma once

#include <ssh/sftp_error.hpp>
#include <ssh/file_information.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <future>
#include <span>

namespace SecureShell
{
    /**
     * @brief An open remote file. All reads and writes are positioned, so several streams can work on disjoint
     * ranges of the same file without sharing a file pointer.
     */
    class IFileStream
    {
      public:
        IFileStream() = default;
        virtual ~IFileStream() = default;
        IFileStream(IFileStream const&) = default;
        IFileStream& operator=(IFileStream const&) = default;
        IFileStream(IFileStream&&) = default;
        IFileStream& operator=(IFileStream&&) = default;

        /**
         * @brief Reads up to bufferSize bytes starting at offset. bufferSize MUST be less than or equal to the read
         * limit.
         *
         * @return std::future<std::expected<std::size_t, SftpError>> The amount read, 0 at the end of the file.
         */
        virtual std::future<std::expected<std::size_t, SftpError>>
        read(std::uint64_t offset, std::byte* buffer, std::size_t bufferSize) = 0;

        /**
         * @brief Writes all of data starting at offset.
         * Data larger than the write limit is split into several writes.
         */
        virtual std::future<std::expected<void, SftpError>>
        write(std::uint64_t offset, std::span<std::byte const> data) = 0;

        /**
         * @brief Retrieves information about the open file.
         */
        virtual std::future<std::expected<FileInformation, SftpError>> stat() = 0;

        /**
         * @brief Returns the maximum number of bytes that can be written in a single pure write operation.
         */
        virtual std::size_t writeLengthLimit() const = 0;

        /**
         * @brief Returns the maximum number of bytes that can be read in a single read operation.
         */
        virtual std::size_t readLengthLimit() const = 0;

        /**
         * @brief Closes the file. Further reads and writes fail.
         */
        virtual std::future<std::expected<void, SftpError>> close() = 0;
    };
}
