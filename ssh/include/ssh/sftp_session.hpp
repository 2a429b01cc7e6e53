#pragma once

#include <ssh/async/processing_strand.hpp>
#include <ssh/sftp_client_interface.hpp>
#include <ssh/sftp_error.hpp>

#include <libssh/libssh.h>
#include <libssh/sftp.h>

#include <memory>
#include <future>
#include <expected>
#include <type_traits>
#include <utility>

namespace SecureShell
{
    class Session;

    /**
     * @brief libssh backed sftp channel. All libssh calls run on the strand of the owning session.
     */
    class SftpSession
        : public ISftpClient
        , public std::enable_shared_from_this<SftpSession>
    {
      public:
        friend class FileStream;

        SftpSession(ssh_session owner, std::unique_ptr<ProcessingStrand> strand, sftp_session session);
        ~SftpSession() override;

        operator sftp_session()
        {
            return session_;
        }

        /**
         * @brief Frees the sftp channel. Calls that are queued afterwards fail.
         */
        void close();

        template <typename FunctionT>
        auto performPromise(FunctionT&& func) -> std::future<std::invoke_result_t<std::decay_t<FunctionT>>>
        {
            return strand_->pushPromiseTask(std::forward<FunctionT>(func));
        }

        /**
         * @brief Retrieves the last error that occurred. May contain success.
         */
        SftpError lastError() const;

        std::future<std::expected<std::vector<FileInformation>, Error>>
        listDirectory(std::string const& path) override;
        std::future<std::expected<std::string, Error>> canonicalize(std::string const& path) override;
        std::future<std::expected<FileInformation, Error>> stat(std::string const& path) override;
        std::future<std::expected<void, Error>>
        createDirectory(std::string const& path, std::filesystem::perms permissions) override;
        std::future<std::expected<void, Error>>
        createFile(std::string const& path, std::filesystem::perms permissions) override;
        std::future<std::expected<void, Error>> removeFile(std::string const& path) override;
        std::future<std::expected<void, Error>> removeDirectory(std::string const& path) override;
        std::future<std::expected<void, Error>>
        rename(std::string const& source, std::string const& destination) override;
        std::future<std::expected<void, Error>> resize(std::string const& path, std::uint64_t size) override;
        std::future<std::expected<std::shared_ptr<IFileStream>, Error>>
        openFile(std::string const& path, OpenType openType, std::filesystem::perms permissions) override;

      private:
        ssh_session owner_;
        std::unique_ptr<ProcessingStrand> strand_;
        sftp_session session_;
    };
}
