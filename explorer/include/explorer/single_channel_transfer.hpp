#pragma once

#include <explorer/transfer_control.hpp>
#include <explorer/transfer_options.hpp>
#include <explorer/transfer_progress.hpp>
#include <shared_data/explorer_error.hpp>
#include <ssh/sftp_client_interface.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>

namespace Explorer
{
    /**
     * @brief Moves a file chunk by chunk over one channel. Blocks the calling thread until done, paused chunks
     * wait inside.
     */
    class SingleChannelTransfer
    {
      public:
        SingleChannelTransfer(
            std::shared_ptr<SecureShell::ISftpClient> client,
            std::shared_ptr<TransferControl> control,
            TransferJobOptions options,
            ProgressCallback onProgress);

        /**
         * @brief Writes the remote file into localFile, which is created or truncated.
         *
         * @param totalBytes Expected size, only used for progress reports.
         */
        std::expected<void, SharedData::ExplorerError>
        download(std::string const& remotePath, std::filesystem::path const& localFile, std::uint64_t totalBytes);

        /**
         * @brief Writes localFile to remotePath, which is created or truncated.
         */
        std::expected<void, SharedData::ExplorerError>
        upload(std::filesystem::path const& localFile, std::string const& remotePath, std::uint64_t totalBytes);

        std::uint64_t transferred() const noexcept
        {
            return transferred_;
        }

      private:
        /// Blocks while paused. Returns false when the transfer should stop.
        bool checkpoint(ProgressMeter& meter);
        void report(ProgressMeter& meter, std::uint64_t totalBytes);

      private:
        std::shared_ptr<SecureShell::ISftpClient> client_;
        std::shared_ptr<TransferControl> control_;
        TransferJobOptions options_;
        ProgressCallback onProgress_;
        std::uint64_t transferred_;
    };
}
