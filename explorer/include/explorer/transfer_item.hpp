#pragma once

#include <explorer/transfer_control.hpp>
#include <explorer/transfer_progress.hpp>
#include <ids/ids.hpp>
#include <shared_data/transfer_status.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

namespace Explorer
{
    /**
     * @brief The ui side view of one file transfer. Follows the transition table of SharedData::canTransitionTo,
     * every operation that would leave it returns false and changes nothing.
     */
    class TransferItem
    {
      public:
        TransferItem(
            Ids::TransferId id,
            SharedData::TransferDirection direction,
            std::filesystem::path localPath,
            std::string remotePath,
            std::uint64_t totalBytes = 0);

        Ids::TransferId id() const
        {
            return id_;
        }
        SharedData::TransferDirection direction() const noexcept
        {
            return direction_;
        }
        SharedData::TransferStatus status() const noexcept
        {
            return status_;
        }
        std::filesystem::path const& localPath() const noexcept
        {
            return localPath_;
        }
        std::string const& remotePath() const noexcept
        {
            return remotePath_;
        }
        std::uint64_t totalBytes() const noexcept
        {
            return totalBytes_;
        }
        std::uint64_t transferredBytes() const noexcept
        {
            return transferredBytes_;
        }
        std::uint64_t speed() const noexcept
        {
            return speed_;
        }
        std::optional<std::string> const& error() const noexcept
        {
            return error_;
        }
        std::shared_ptr<TransferControl> const& control() const noexcept
        {
            return control_;
        }

        /// The remote or local file name, depending on the direction.
        std::string fileName() const;

        /// 0 to 100. Empty files count as complete once they are.
        double percentage() const;

        /**
         * @brief Pending to the active state of the direction.
         */
        bool start(std::uint64_t totalBytes);

        bool pause();
        bool resume();

        /**
         * @brief Stops the workers and marks the item cancelled. No-op on terminal items.
         */
        bool cancel();

        bool complete();
        bool fail(std::string error);

        /**
         * @brief Applies a progress report. transferredBytes never goes backwards, paused items report no speed.
         * Ignored on terminal items.
         */
        void updateProgress(TransferProgress const& progress);

      private:
        bool transitionTo(SharedData::TransferStatus status);

      private:
        Ids::TransferId id_;
        SharedData::TransferDirection direction_;
        std::filesystem::path localPath_;
        std::string remotePath_;
        std::uint64_t totalBytes_;
        std::uint64_t transferredBytes_;
        std::uint64_t speed_;
        SharedData::TransferStatus status_;
        std::optional<std::string> error_;
        std::shared_ptr<TransferControl> control_;
    };
}
