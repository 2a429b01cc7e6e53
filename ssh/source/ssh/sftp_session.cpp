#include <ssh/sftp_session.hpp>
#include <ssh/sftp_attributes.hpp>
#include <ssh/file_stream.hpp>
#include <log/log.hpp>
#include <utility/remote_path.hpp>

#include <fcntl.h>

#include <functional>

namespace SecureShell
{
    SftpSession::SftpSession(ssh_session owner, std::unique_ptr<ProcessingStrand> strand, sftp_session session)
        : owner_{owner}
        , strand_{std::move(strand)}
        , session_{session}
    {}
    SftpSession::~SftpSession()
    {
        close();
    }
    void SftpSession::close()
    {
        if (strand_->isFinalized())
            return;

        // Captures the handle, not this: the task may run after destruction.
        auto done = strand_->pushFinalPromiseTask([session = session_]() {
            sftp_free(session);
        });
        if (!strand_->withinProcessingThread())
            done.wait_for(std::chrono::seconds{5});
    }

    SftpError SftpSession::lastError() const
    {
        if (ssh_is_connected(owner_) == 0)
        {
            return SftpError{
                .message = "Connection lost",
                .sshError = ssh_get_error_code(owner_),
                .sftpError = sftp_get_error(session_),
                .wrapperError = WrapperErrors::ConnectionLost,
            };
        }
        return SftpError{
            .message = ssh_get_error(owner_),
            .sshError = ssh_get_error_code(owner_),
            .sftpError = sftp_get_error(session_),
        };
    }

    std::future<std::expected<std::vector<FileInformation>, SftpSession::Error>>
    SftpSession::listDirectory(std::string const& path)
    {
        return performPromise([this, path]() -> std::expected<std::vector<FileInformation>, Error> {
            int closeResult = SSH_OK;
            std::vector<FileInformation> entries{};

            {
                std::unique_ptr<sftp_dir_struct, std::function<void(sftp_dir_struct*)>> dir{
                    sftp_opendir(session_, path.c_str()), [&closeResult](sftp_dir_struct* dir) {
                        if (dir != nullptr)
                            closeResult = sftp_closedir(dir);
                    }};
                if (dir == nullptr)
                    return std::unexpected(lastError());

                std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> entry{
                    sftp_readdir(session_, dir.get()), sftp_attributes_free};
                for (; entry != nullptr; entry.reset(sftp_readdir(session_, dir.get())))
                {
                    const std::string_view name = entry->name ? entry->name : "";
                    if (name == "." || name == "..")
                        continue;
                    entries.push_back(fromSftpAttributes(entry.get(), path));
                }

                if (!sftp_dir_eof(dir.get()))
                    return std::unexpected(lastError());
            }
            if (closeResult != SSH_OK)
                return std::unexpected(lastError());

            return entries;
        });
    }

    std::future<std::expected<std::string, SftpSession::Error>> SftpSession::canonicalize(std::string const& path)
    {
        return performPromise([this, path]() -> std::expected<std::string, Error> {
            std::unique_ptr<char, decltype(&ssh_string_free_char)> resolved{
                sftp_canonicalize_path(session_, path.c_str()), ssh_string_free_char};
            if (!resolved)
                return std::unexpected(lastError());
            return std::string{resolved.get()};
        });
    }

    std::future<std::expected<FileInformation, SftpSession::Error>> SftpSession::stat(std::string const& path)
    {
        return performPromise([this, path]() -> std::expected<FileInformation, Error> {
            std::unique_ptr<sftp_attributes_struct, decltype(&sftp_attributes_free)> attributes{
                sftp_stat(session_, path.c_str()), sftp_attributes_free};
            if (attributes == nullptr)
                return std::unexpected(lastError());

            auto entry = fromSftpAttributes(attributes.get(), path);
            // stat does not report the name, the path is the one that was asked for.
            entry.path = path;
            entry.name = Utility::remoteFileName(path);
            return entry;
        });
    }

    std::future<std::expected<void, SftpSession::Error>>
    SftpSession::createDirectory(std::string const& path, std::filesystem::perms permissions)
    {
        return performPromise([this, path, permissions]() -> std::expected<void, Error> {
            if (sftp_mkdir(session_, path.c_str(), static_cast<mode_t>(permissions & std::filesystem::perms::mask)) !=
                SSH_OK)
                return std::unexpected(lastError());
            return {};
        });
    }

    std::future<std::expected<void, SftpSession::Error>>
    SftpSession::createFile(std::string const& path, std::filesystem::perms permissions)
    {
        return performPromise([this, path, permissions]() -> std::expected<void, Error> {
            sftp_file file = sftp_open(
                session_,
                path.c_str(),
                O_WRONLY | O_CREAT | O_EXCL,
                static_cast<mode_t>(permissions & std::filesystem::perms::mask));
            if (file == nullptr)
                return std::unexpected(lastError());
            if (sftp_close(file) != SSH_OK)
                return std::unexpected(lastError());
            return {};
        });
    }

    std::future<std::expected<void, SftpSession::Error>> SftpSession::removeFile(std::string const& path)
    {
        return performPromise([this, path]() -> std::expected<void, Error> {
            if (sftp_unlink(session_, path.c_str()) != SSH_OK)
                return std::unexpected(lastError());
            return {};
        });
    }

    std::future<std::expected<void, SftpSession::Error>> SftpSession::removeDirectory(std::string const& path)
    {
        return performPromise([this, path]() -> std::expected<void, Error> {
            if (sftp_rmdir(session_, path.c_str()) != SSH_OK)
                return std::unexpected(lastError());
            return {};
        });
    }

    std::future<std::expected<void, SftpSession::Error>>
    SftpSession::rename(std::string const& source, std::string const& destination)
    {
        return performPromise([this, source, destination]() -> std::expected<void, Error> {
            if (sftp_rename(session_, source.c_str(), destination.c_str()) != SSH_OK)
                return std::unexpected(lastError());
            return {};
        });
    }

    std::future<std::expected<void, SftpSession::Error>> SftpSession::resize(std::string const& path, std::uint64_t size)
    {
        return performPromise([this, path, size]() -> std::expected<void, Error> {
            sftp_attributes_struct attributes{};
            attributes.flags = SSH_FILEXFER_ATTR_SIZE;
            attributes.size = size;
            if (sftp_setstat(session_, path.c_str(), &attributes) != SSH_OK)
                return std::unexpected(lastError());
            return {};
        });
    }

    std::future<std::expected<std::shared_ptr<IFileStream>, SftpSession::Error>>
    SftpSession::openFile(std::string const& path, OpenType openType, std::filesystem::perms permissions)
    {
        return performPromise(
            [this, path, openType, permissions]() -> std::expected<std::shared_ptr<IFileStream>, Error> {
                sftp_file file = sftp_open(
                    session_,
                    path.c_str(),
                    static_cast<int>(openType),
                    static_cast<mode_t>(permissions & std::filesystem::perms::mask));
                if (file == nullptr)
                    return std::unexpected(lastError());

                sftp_limits_t limits = sftp_limits(session_);
                if (limits == nullptr)
                {
                    auto error = lastError();
                    sftp_close(file);
                    return std::unexpected(std::move(error));
                }
                const sftp_limits_struct copy = *limits;
                sftp_limits_free(limits);

                Log::trace("SftpSession: Opened '{}'.", path);
                return std::make_shared<FileStream>(shared_from_this(), file, copy);
            });
    }
}
