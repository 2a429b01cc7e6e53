#pragma once

#include <ssh/file_stream_interface.hpp>

#include <libssh/sftp.h>

#include <memory>

namespace SecureShell
{
    class SftpSession;

    class FileStream
        : public IFileStream
        , public std::enable_shared_from_this<FileStream>
    {
      public:
        FileStream(std::shared_ptr<SftpSession> sftp, sftp_file file, sftp_limits_struct limits);
        ~FileStream() override;
        FileStream(FileStream const&) = delete;
        FileStream& operator=(FileStream const&) = delete;
        FileStream(FileStream&&) = delete;
        FileStream& operator=(FileStream&&) = delete;

        std::future<std::expected<std::size_t, SftpError>>
        read(std::uint64_t offset, std::byte* buffer, std::size_t bufferSize) override;
        std::future<std::expected<void, SftpError>>
        write(std::uint64_t offset, std::span<std::byte const> data) override;
        std::future<std::expected<FileInformation, SftpError>> stat() override;
        std::size_t writeLengthLimit() const override;
        std::size_t readLengthLimit() const override;
        std::future<std::expected<void, SftpError>> close() override;

      private:
        std::shared_ptr<SftpSession> sftp_;
        sftp_file file_;
        sftp_limits_struct limits_;
    };
}
