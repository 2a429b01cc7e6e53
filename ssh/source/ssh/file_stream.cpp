#include <ssh/file_stream.hpp>
#include <ssh/sftp_session.hpp>
#include <ssh/sftp_attributes.hpp>

#include <algorithm>

namespace SecureShell
{
#define VERIFY_FILE_STREAM() \
    if (!self->file_) \
    return std::unexpected(SftpError{.message = "File is null", .wrapperError = WrapperErrors::FileNull})

    FileStream::FileStream(std::shared_ptr<SftpSession> sftp, sftp_file file, sftp_limits_struct limits)
        : sftp_{std::move(sftp)}
        , file_{file}
        , limits_{limits}
    {}
    FileStream::~FileStream()
    {
        if (file_ == nullptr)
            return;
        // Runs after destruction, so it only captures the handle.
        sftp_->strand_->pushTask([file = file_]() {
            sftp_close(file);
        });
    }
    std::size_t FileStream::writeLengthLimit() const
    {
        return static_cast<std::size_t>(limits_.max_write_length);
    }
    std::size_t FileStream::readLengthLimit() const
    {
        return static_cast<std::size_t>(limits_.max_read_length);
    }
    std::future<std::expected<std::size_t, SftpError>>
    FileStream::read(std::uint64_t offset, std::byte* buffer, std::size_t bufferSize)
    {
        return sftp_->performPromise([self = shared_from_this(), offset, buffer, bufferSize]()
                                         -> std::expected<std::size_t, SftpError> {
            VERIFY_FILE_STREAM();
            if (sftp_seek64(self->file_, offset) != SSH_OK)
                return std::unexpected(self->sftp_->lastError());

            const auto result = sftp_read(self->file_, buffer, bufferSize);
            if (result < 0)
                return std::unexpected(self->sftp_->lastError());
            return static_cast<std::size_t>(result);
        });
    }
    std::future<std::expected<void, SftpError>>
    FileStream::write(std::uint64_t offset, std::span<std::byte const> data)
    {
        return sftp_->performPromise([self = shared_from_this(), offset, data]() -> std::expected<void, SftpError> {
            VERIFY_FILE_STREAM();
            if (sftp_seek64(self->file_, offset) != SSH_OK)
                return std::unexpected(self->sftp_->lastError());

            const auto limit = std::max<std::size_t>(1, self->writeLengthLimit());
            std::size_t written = 0;
            while (written < data.size())
            {
                const auto part = std::min(limit, data.size() - written);
                const auto result = sftp_write(self->file_, data.data() + written, part);
                if (result < 0)
                    return std::unexpected(self->sftp_->lastError());
                if (static_cast<std::size_t>(result) != part)
                {
                    return std::unexpected(SftpError{
                        .message = "Server accepted fewer bytes than sent",
                        .wrapperError = WrapperErrors::ShortWrite,
                    });
                }
                written += part;
            }
            return {};
        });
    }
    std::future<std::expected<FileInformation, SftpError>> FileStream::stat()
    {
        return sftp_->performPromise([self = shared_from_this()]() -> std::expected<FileInformation, SftpError> {
            VERIFY_FILE_STREAM();
            std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> attributes{
                sftp_fstat(self->file_), sftp_attributes_free};
            if (attributes == nullptr)
                return std::unexpected(self->sftp_->lastError());
            return fromSftpAttributes(attributes.get(), "/");
        });
    }
    std::future<std::expected<void, SftpError>> FileStream::close()
    {
        return sftp_->performPromise([self = shared_from_this()]() -> std::expected<void, SftpError> {
            VERIFY_FILE_STREAM();
            const auto result = sftp_close(self->file_);
            self->file_ = nullptr;
            if (result != SSH_OK)
                return std::unexpected(self->sftp_->lastError());
            return {};
        });
    }
#undef VERIFY_FILE_STREAM
}
