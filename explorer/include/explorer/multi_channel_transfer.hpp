#pragma once

#include <explorer/byte_range.hpp>
#include <explorer/progress_accumulator.hpp>
#include <explorer/transfer_control.hpp>
#include <explorer/transfer_options.hpp>
#include <explorer/transfer_progress.hpp>
#include <shared_data/explorer_error.hpp>
#include <ssh/sftp_client_interface.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Explorer
{
    /**
     * @brief Moves one file over several channels at once. The file is split into one range per channel and every
     * range is moved by its own thread. The first failing range stops all others.
     */
    class MultiChannelTransfer
    {
      public:
        /**
         * @param channels At least one. The first one is also used to prepare the remote file of uploads.
         */
        MultiChannelTransfer(
            std::vector<std::shared_ptr<SecureShell::ISftpClient>> channels,
            std::shared_ptr<TransferControl> control,
            TransferJobOptions options,
            ProgressCallback onProgress);

        /**
         * @brief Sizes localFile to totalBytes and fills it range by range.
         */
        std::expected<void, SharedData::ExplorerError>
        download(std::string const& remotePath, std::filesystem::path const& localFile, std::uint64_t totalBytes);

        /**
         * @brief Creates remotePath with totalBytes and fills it range by range.
         */
        std::expected<void, SharedData::ExplorerError>
        upload(std::filesystem::path const& localFile, std::string const& remotePath, std::uint64_t totalBytes);

        /**
         * @brief Bytes moved per range by the last run.
         */
        std::vector<std::uint64_t> const& transferredPerRange() const noexcept
        {
            return transferredPerRange_;
        }

      private:
        using RangeWorker = std::function<std::expected<void, SharedData::ExplorerError>(
            std::size_t index,
            ByteRange const& range,
            ProgressAccumulator& accumulator)>;

        std::expected<void, SharedData::ExplorerError> runWorkers(std::uint64_t totalBytes, RangeWorker const& worker);

        /// Blocks while paused. Returns false when the range should stop.
        bool checkpoint(ProgressAccumulator& accumulator);

        std::expected<void, SharedData::ExplorerError>
        prepareRemoteFile(std::string const& remotePath, std::uint64_t totalBytes);

      private:
        std::vector<std::shared_ptr<SecureShell::ISftpClient>> channels_;
        std::shared_ptr<TransferControl> control_;
        TransferJobOptions options_;
        ProgressCallback onProgress_;
        std::vector<std::uint64_t> transferredPerRange_;
    };
}
