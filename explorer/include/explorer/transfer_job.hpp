#pragma once

#include <explorer/byte_range.hpp>
#include <explorer/transfer_control.hpp>
#include <explorer/transfer_options.hpp>
#include <explorer/transfer_progress.hpp>
#include <ids/ids.hpp>
#include <shared_data/explorer_error.hpp>
#include <shared_data/transfer_status.hpp>
#include <ssh/channel_source_interface.hpp>
#include <ssh/sftp_client_interface.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace Explorer
{
    struct TransferRequest
    {
        Ids::TransferId id;
        SharedData::TransferDirection direction;
        std::filesystem::path localPath;
        std::string remotePath;
    };

    /**
     * @brief Called on the job thread.
     */
    struct TransferJobEvents
    {
        std::function<void(std::uint64_t totalBytes)> onStarted{};
        ProgressCallback onProgress{};
        std::function<void(std::expected<void, SharedData::ExplorerError> const&)> onFinished{};
    };

    /**
     * @brief Everything that happens to one file transfer after it left the queue: sizing, choosing single or multi
     * channel, the transfer itself and the temp file handling of downloads. run blocks until it is done.
     */
    class TransferJob
    {
      public:
        TransferJob(
            TransferRequest request,
            std::shared_ptr<SecureShell::ISftpClient> primary,
            std::shared_ptr<SecureShell::ISftpChannelSource> channelSource,
            std::shared_ptr<TransferControl> control,
            TransferJobOptions options,
            TransferJobEvents events);

        /**
         * @brief Runs the transfer and calls onFinished exactly once.
         */
        void run();

        /**
         * @brief The strategy that moved the bytes, if it got that far.
         */
        std::optional<TransferStrategy> strategy() const noexcept
        {
            return strategy_;
        }

        /**
         * @brief Where a download is written before it is renamed to its final path.
         */
        std::filesystem::path temporaryPath() const;

      private:
        std::expected<void, SharedData::ExplorerError> download();
        std::expected<void, SharedData::ExplorerError> upload();

        /**
         * @brief Asks the channel source for the configured number of extra channels. Refusals are logged and skipped.
         */
        std::vector<std::shared_ptr<SecureShell::ISftpClient>> acquireChannels();

        /**
         * @brief Picks the strategy. Multi channel transfers with less than two granted channels fall back to the
         * primary channel.
         */
        std::vector<std::shared_ptr<SecureShell::ISftpClient>> planChannels(std::uint64_t totalBytes);

      private:
        TransferRequest request_;
        std::shared_ptr<SecureShell::ISftpClient> primary_;
        std::shared_ptr<SecureShell::ISftpChannelSource> channelSource_;
        std::shared_ptr<TransferControl> control_;
        TransferJobOptions options_;
        TransferJobEvents events_;
        std::optional<TransferStrategy> strategy_;
    };
}
