#pragma once

#include <explorer/executors.hpp>
#include <explorer/notification.hpp>
#include <explorer/transfer_item.hpp>
#include <explorer/transfer_job.hpp>
#include <explorer/transfer_options.hpp>
#include <ids/ids.hpp>
#include <ssh/channel_source_interface.hpp>
#include <ssh/sftp_client_interface.hpp>

#include <cstddef>
#include <cstdint>
#include <deque>
#include <expected>
#include <filesystem>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace Explorer
{
    /**
     * @brief The transfer list of one session. Items are queued and started as long as fewer than the allowed number
     * run. Every job runs on its own thread and reports back through the ui executor. All public functions must be
     * called on the ui executor.
     */
    class TransferManager : public std::enable_shared_from_this<TransferManager>
    {
      public:
        using QueuedCallback = std::function<void(std::expected<std::vector<Ids::TransferId>, std::string>)>;

        struct Options
        {
            TransferJobOptions job{};
            int parallelTransfers{3};
        };

        static std::shared_ptr<TransferManager> create(
            Executors executors,
            std::shared_ptr<SecureShell::ISftpClient> primary,
            std::shared_ptr<SecureShell::ISftpChannelSource> channelSource,
            Options options,
            NotificationSink notify = {});

        TransferManager(TransferManager const&) = delete;
        TransferManager& operator=(TransferManager const&) = delete;
        TransferManager(TransferManager&&) = delete;
        TransferManager& operator=(TransferManager&&) = delete;

        /**
         * @brief Cancels everything still running and waits for the job threads.
         */
        ~TransferManager();

        Ids::TransferId startDownload(std::string const& remotePath, std::filesystem::path const& localPath);
        Ids::TransferId startUpload(std::filesystem::path const& localPath, std::string const& remotePath);

        /**
         * @brief Recreates the remote tree below localDirectory and queues one download per file.
         */
        void downloadDirectory(
            std::string const& remoteDirectory,
            std::filesystem::path const& localDirectory,
            QueuedCallback onQueued = {});

        /**
         * @brief Creates the remote directories, shallowest first, then queues one upload per file.
         */
        void uploadDirectory(
            std::filesystem::path const& localDirectory,
            std::string const& remoteDirectory,
            QueuedCallback onQueued = {});

        bool pause(Ids::TransferId const& id);
        bool resume(Ids::TransferId const& id);
        bool cancel(Ids::TransferId const& id);
        void cancelAll();

        TransferItem const* find(Ids::TransferId const& id) const;

        std::deque<TransferItem> const& items() const noexcept
        {
            return items_;
        }

        /**
         * @brief Removes completed, failed and cancelled items.
         *
         * @return The number of removed items.
         */
        std::size_t clearFinished();

        /// Jobs that currently occupy a thread.
        std::size_t activeCount() const noexcept
        {
            return running_.size();
        }

        std::uint64_t itemsRevision() const noexcept
        {
            return itemsRevision_;
        }

      private:
        TransferManager(
            Executors executors,
            std::shared_ptr<SecureShell::ISftpClient> primary,
            std::shared_ptr<SecureShell::ISftpChannelSource> channelSource,
            Options options,
            NotificationSink notify);

        Ids::TransferId enqueue(
            SharedData::TransferDirection direction,
            std::filesystem::path const& localPath,
            std::string const& remotePath);
        void scheduleNext();
        void launch(TransferItem& item);
        void onStarted(Ids::TransferId const& id, std::uint64_t totalBytes);
        void onProgress(Ids::TransferId const& id, TransferProgress const& progress);
        void onFinished(Ids::TransferId const& id, std::expected<void, SharedData::ExplorerError> const& result);
        TransferItem* findMutable(Ids::TransferId const& id);
        std::vector<Ids::TransferId> queueAll(
            SharedData::TransferDirection direction,
            std::vector<std::pair<std::filesystem::path, std::string>> const& files);

      private:
        Executors executors_;
        std::shared_ptr<SecureShell::ISftpClient> primary_;
        std::shared_ptr<SecureShell::ISftpChannelSource> channelSource_;
        Options options_;
        NotificationSink notify_;
        std::deque<TransferItem> items_;
        std::deque<Ids::TransferId> waiting_;
        std::unordered_map<Ids::TransferId, std::thread, Ids::IdHash> running_;
        std::uint64_t itemsRevision_;
    };
}
